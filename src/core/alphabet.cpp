#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <core/alphabet.hpp>
#include <utils/Utf8.hpp>

Alphabet::Alphabet(std::u32string symbols)
    : symbols_(std::move(symbols))
{
    if (symbols_.empty())
        throw CipherError::alphabet("Alphabet is empty");

    index_.reserve(symbols_.size());
    for (std::size_t i = 0; i < symbols_.size(); ++i) {
        if (!index_.emplace(symbols_[i], i).second) {
            throw CipherError::alphabet(
                "Alphabet contains duplicate characters ('" + describeSymbol(symbols_[i]) + "')",
                symbols_[i]);
        }
    }
}

Alphabet Alphabet::fromFile(const std::string& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        throw CipherError::notFound("Alphabet file not found: " + path);
    if (std::filesystem::is_directory(path, ec))
        throw CipherError::notFound("Alphabet path is a directory: " + path);

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        throw CipherError::notFound("Cannot open alphabet file: " + path);

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad())
        throw CipherError::notFound("Cannot read alphabet file: " + path);

    return fromString(ss.str());
}

Alphabet Alphabet::fromString(const std::string& content)
{
    std::string raw = content;
    if (utils::Utf8::StartsWithBOM(raw))
        raw.erase(0, 3);

    return Alphabet(utils::Utf8::Trim(toSymbols(raw)));
}

std::string Alphabet::str() const
{
    return utils::Utf8::Encode(symbols_);
}

bool Alphabet::contains(char32_t symbol) const
{
    return index_.find(symbol) != index_.end();
}

std::size_t Alphabet::indexOf(char32_t symbol) const
{
    auto it = index_.find(symbol);
    if (it == index_.end()) {
        throw CipherError::alphabet(
            "Character '" + describeSymbol(symbol) + "' not found in alphabet", symbol);
    }
    return it->second;
}

Alphabet Alphabet::reversed() const
{
    const std::u32string& forward = symbols();
    return Alphabet(std::u32string(forward.rbegin(), forward.rend()));
}

std::u32string toSymbols(const std::string& text)
{
    try {
        return utils::Utf8::Decode(text);
    }
    catch (const std::invalid_argument& e) {
        throw CipherError::alphabet(std::string("Input is not valid UTF-8: ") + e.what());
    }
}

void validateText(const std::u32string& text, const Alphabet& alphabet)
{
    for (char32_t c : text) {
        if (c != U' ' && !alphabet.contains(c)) {
            throw CipherError::alphabet(
                "Character '" + describeSymbol(c) + "' not found in alphabet", c);
        }
    }
}

void validateText(const std::string& text, const Alphabet& alphabet)
{
    validateText(toSymbols(text), alphabet);
}

std::string describeSymbol(char32_t symbol)
{
    if (symbol < 0x20 || symbol == 0x7F) {
        std::ostringstream oss;
        oss << "U+" << std::uppercase << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<uint32_t>(symbol);
        return oss.str();
    }
    return utils::Utf8::Encode(symbol);
}
