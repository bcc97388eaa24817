#pragma once
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

enum class CipherType {
	Caesar,
	Vigenere,
	Atbash
};

enum class CipherMode {
	Encrypt,
	Decrypt
};

inline std::string toString(CipherType type) {
	switch (type) {
	case CipherType::Caesar:   return "caesar";
	case CipherType::Vigenere: return "vigenere";
	case CipherType::Atbash:   return "atbash";
	}
	return "unknown";
}

// Case-insensitive, ASCII names only
inline std::optional<CipherType> cipherTypeFromName(std::string name) {
	std::transform(name.begin(), name.end(), name.begin(),
		[](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (name == "caesar") return CipherType::Caesar;
	if (name == "vigenere") return CipherType::Vigenere;
	if (name == "atbash") return CipherType::Atbash;
	return std::nullopt;
}
