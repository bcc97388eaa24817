#pragma once
#include <cstddef>
#include <string>

#include <core/alphabet.hpp>
#include <utils/enums.hpp>

class Cipher {
public:
	virtual ~Cipher() = default;

	virtual CipherType type() const = 0;

	// Encrypt the input text
	virtual std::string encrypt(const std::string& text, const Alphabet& alphabet) const = 0;

	// Decrypt the input text
	virtual std::string decrypt(const std::string& text, const Alphabet& alphabet) const = 0;

	std::string apply(const std::string& text, const Alphabet& alphabet, CipherMode mode) const {
		return mode == CipherMode::Encrypt ? encrypt(text, alphabet) : decrypt(text, alphabet);
	}

protected:
	// (index + shift) mod n, always in [0, n); shift may be any value
	static std::size_t shiftIndex(std::size_t index, long long shift, std::size_t n) {
		long long s = shift % static_cast<long long>(n);
		if (s < 0) s += static_cast<long long>(n);
		return (index + static_cast<std::size_t>(s)) % n;
	}
};
