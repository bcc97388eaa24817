#pragma once
#include <string>
#include <cstdint>
#include <stdexcept>

namespace utils {

class Utf8 {
public:
    // UTF-8 (bajty) -> code pointy
    static std::u32string Decode(const std::string& input) {
        std::u32string out;
        out.reserve(input.size());

        std::size_t i = 0;
        while (i < input.size()) {
            const uint8_t lead = static_cast<uint8_t>(input[i]);
            std::size_t length = 0;
            char32_t cp = 0;

            if (lead < 0x80) {
                out.push_back(lead);
                ++i;
                continue;
            }
            else if (lead >= 0xC2 && lead <= 0xDF) {
                length = 2;
                cp = lead & 0x1F;
            }
            else if (lead >= 0xE0 && lead <= 0xEF) {
                length = 3;
                cp = lead & 0x0F;
            }
            else if (lead >= 0xF0 && lead <= 0xF4) {
                length = 4;
                cp = lead & 0x07;
            }
            else {
                throw std::invalid_argument("Utf8::Decode: invalid lead byte at offset " + std::to_string(i));
            }

            if (i + length > input.size())
                throw std::invalid_argument("Utf8::Decode: truncated sequence at offset " + std::to_string(i));

            for (std::size_t j = 1; j < length; ++j) {
                const uint8_t cont = static_cast<uint8_t>(input[i + j]);
                if ((cont & 0xC0) != 0x80)
                    throw std::invalid_argument("Utf8::Decode: invalid continuation byte at offset " + std::to_string(i + j));
                cp = (cp << 6) | (cont & 0x3F);
            }

            if ((length == 3 && cp < 0x800) || (length == 4 && cp < 0x10000))
                throw std::invalid_argument("Utf8::Decode: overlong sequence at offset " + std::to_string(i));
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                throw std::invalid_argument("Utf8::Decode: invalid code point at offset " + std::to_string(i));

            out.push_back(cp);
            i += length;
        }
        return out;
    }

    // code point -> UTF-8
    static std::string Encode(char32_t cp) {
        std::string out;
        AppendEncoded(out, cp);
        return out;
    }

    static std::string Encode(const std::u32string& cps) {
        std::string out;
        out.reserve(cps.size() * 2);
        for (char32_t cp : cps) {
            AppendEncoded(out, cp);
        }
        return out;
    }

    static bool StartsWithBOM(const std::string& input) {
        return input.size() >= 3
            && static_cast<uint8_t>(input[0]) == 0xEF
            && static_cast<uint8_t>(input[1]) == 0xBB
            && static_cast<uint8_t>(input[2]) == 0xBF;
    }

    // Same set as Unicode White_Space
    static bool IsSpace(char32_t cp) {
        if (cp == 0x20 || (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F))
            return true;
        if (cp == 0x85 || cp == 0xA0 || cp == 0x1680)
            return true;
        if (cp >= 0x2000 && cp <= 0x200A)
            return true;
        return cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
    }

    static std::u32string Trim(const std::u32string& s) {
        std::size_t start = 0;
        std::size_t end = s.size();
        while (start < end && IsSpace(s[start])) ++start;
        while (end > start && IsSpace(s[end - 1])) --end;
        return s.substr(start, end - start);
    }

    // Trims Unicode whitespace from UTF-8 text. Malformed input is only
    // trimmed of ASCII whitespace and otherwise left as is.
    static std::string Trim(const std::string& s) {
        try {
            return Encode(Trim(Decode(s)));
        }
        catch (const std::invalid_argument&) {
            auto start = s.find_first_not_of(" \t\r\n\v\f");
            auto end = s.find_last_not_of(" \t\r\n\v\f");
            if (start == std::string::npos) return "";
            return s.substr(start, end - start + 1);
        }
    }

private:
    static void AppendEncoded(std::string& out, char32_t cp) {
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            throw std::invalid_argument("Utf8::Encode: invalid code point");

        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
};

} // namespace utils
