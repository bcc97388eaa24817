#pragma once
#include <string>

#include <cipher/cipher.hpp>

class Vigenere : public Cipher
{
public:
    // Throws CipherError(CipherUsage) for an empty key
    explicit Vigenere(std::string key);

    CipherType type() const override;

    std::string encrypt(const std::string& text, const Alphabet& alphabet) const override;
    std::string decrypt(const std::string& text, const Alphabet& alphabet) const override;

    const std::string& keyword() const noexcept { return key; }

private:
    std::string transform(const std::string& text, const Alphabet& alphabet, CipherMode mode) const;

    // Validated against the alphabet, spaces removed
    std::u32string keyStream(const Alphabet& alphabet) const;

    std::string key;
};
