#include <cipher/Atbash/atbash.hpp>
#include <utils/Utf8.hpp>

CipherType Atbash::type() const
{
    return CipherType::Atbash;
}

std::string Atbash::encrypt(const std::string& text, const Alphabet& alphabet) const
{
    return transform(text, alphabet);
}

std::string Atbash::decrypt(const std::string& text, const Alphabet& alphabet) const
{
    return transform(text, alphabet);
}

std::string Atbash::transform(const std::string& text, const Alphabet& alphabet) const
{
    const std::u32string symbols = toSymbols(text);
    validateText(symbols, alphabet);

    const Alphabet mirror = alphabet.reversed();
    std::u32string out;
    out.reserve(symbols.size());

    for (char32_t c : symbols) {
        if (c == U' ') {
            out.push_back(U' ');
            continue;
        }
        out.push_back(mirror.at(alphabet.indexOf(c)));
    }
    return utils::Utf8::Encode(out);
}
