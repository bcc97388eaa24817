#pragma once
#include <optional>
#include <string>

#include <cipher/cipher.hpp>

class Caesar : public Cipher
{
public:
    explicit Caesar(long long shift);

    CipherType type() const override;

    std::string encrypt(const std::string& text, const Alphabet& alphabet) const override;
    std::string decrypt(const std::string& text, const Alphabet& alphabet) const override;

    long long shift() const noexcept { return key; }

    // Accepts surrounding whitespace and an optional sign; nullopt if the
    // text is not an integer or does not fit in long long
    static std::optional<long long> parseKey(const std::string& text);

private:
    std::string transform(const std::string& text, const Alphabet& alphabet, long long by) const;

    long long key;
};
