#include <charconv>
#include <system_error>

#include <cipher/Caesar/caesar.hpp>
#include <utils/Utf8.hpp>

Caesar::Caesar(long long shift) : key(shift) {}

CipherType Caesar::type() const
{
    return CipherType::Caesar;
}

std::string Caesar::encrypt(const std::string& text, const Alphabet& alphabet) const
{
    return transform(text, alphabet, key);
}

std::string Caesar::decrypt(const std::string& text, const Alphabet& alphabet) const
{
    // -LLONG_MIN overflows; the shift only matters modulo n anyway
    const long long reduced = key % static_cast<long long>(alphabet.size());
    return transform(text, alphabet, -reduced);
}

std::string Caesar::transform(const std::string& text, const Alphabet& alphabet, long long by) const
{
    const std::u32string symbols = toSymbols(text);
    validateText(symbols, alphabet);

    const std::size_t n = alphabet.size();
    std::u32string out;
    out.reserve(symbols.size());

    for (char32_t c : symbols) {
        if (c == U' ') {
            out.push_back(U' ');
            continue;
        }
        out.push_back(alphabet.at(shiftIndex(alphabet.indexOf(c), by, n)));
    }
    return utils::Utf8::Encode(out);
}

std::optional<long long> Caesar::parseKey(const std::string& text)
{
    std::string digits = utils::Utf8::Trim(text);
    if (digits.empty()) return std::nullopt;
    // from_chars nie akceptuje '+'
    if (digits.size() > 1 && digits[0] == '+' && digits[1] != '-')
        digits.erase(0, 1);

    long long value = 0;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last)
        return std::nullopt;
    return value;
}
