#pragma once
#include <string>

#include <cipher/cipher.hpp>

// Mirror substitution: position i <-> position n-1-i. Self-inverse, so
// encrypt and decrypt are the same transformation.
class Atbash : public Cipher
{
public:
    CipherType type() const override;

    std::string encrypt(const std::string& text, const Alphabet& alphabet) const override;
    std::string decrypt(const std::string& text, const Alphabet& alphabet) const override;

private:
    std::string transform(const std::string& text, const Alphabet& alphabet) const;
};
