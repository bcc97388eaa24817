#include <algorithm>
#include <utility>

#include <cipher/Vigenere/vigenere.hpp>
#include <utils/Utf8.hpp>

Vigenere::Vigenere(std::string key) : key(std::move(key))
{
    if (this->key.empty())
        throw CipherError::usage("Key must not be empty");
}

CipherType Vigenere::type() const
{
    return CipherType::Vigenere;
}

std::string Vigenere::encrypt(const std::string& text, const Alphabet& alphabet) const
{
    return transform(text, alphabet, CipherMode::Encrypt);
}

std::string Vigenere::decrypt(const std::string& text, const Alphabet& alphabet) const
{
    return transform(text, alphabet, CipherMode::Decrypt);
}

std::u32string Vigenere::keyStream(const Alphabet& alphabet) const
{
    std::u32string stream = toSymbols(key);
    validateText(stream, alphabet);

    stream.erase(std::remove(stream.begin(), stream.end(), U' '), stream.end());
    if (stream.empty())
        throw CipherError::usage("Key must contain at least one alphabet character");
    return stream;
}

std::string Vigenere::transform(const std::string& text, const Alphabet& alphabet, CipherMode mode) const
{
    const std::u32string symbols = toSymbols(text);
    validateText(symbols, alphabet);
    const std::u32string stream = keyStream(alphabet);

    const std::size_t n = alphabet.size();
    std::u32string out;
    out.reserve(symbols.size());

    // i counts every text position, spaces included
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        const char32_t c = symbols[i];
        if (c == U' ') {
            out.push_back(U' ');
            continue;
        }

        const std::size_t textIdx = alphabet.indexOf(c);
        const long long keyIdx = static_cast<long long>(alphabet.indexOf(stream[i % stream.size()]));
        const long long shift = mode == CipherMode::Encrypt ? keyIdx : -keyIdx;

        out.push_back(alphabet.at(shiftIndex(textIdx, shift, n)));
    }
    return utils::Utf8::Encode(out);
}
