#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>

#include <core/cipherError.hpp>

/**
 * Ordered, duplicate-free set of symbols (Unicode code points).
 * Position of a symbol is its cipher index. Immutable after construction.
 */
class Alphabet {
public:
    // Reads a UTF-8 file, strips surrounding whitespace and validates it.
    // Throws CipherError(NotFound) or CipherError(Alphabet).
    static Alphabet fromFile(const std::string& path);

    // Same as fromFile, for content already in memory
    static Alphabet fromString(const std::string& content);

    // Validates only (non-empty, no duplicates); no trimming
    explicit Alphabet(std::u32string symbols);

    std::size_t size() const noexcept { return symbols_.size(); }
    const std::u32string& symbols() const noexcept { return symbols_; }
    std::string str() const;

    bool contains(char32_t symbol) const;

    // Throws CipherError(Alphabet) if the symbol is absent
    std::size_t indexOf(char32_t symbol) const;

    char32_t at(std::size_t index) const { return symbols_.at(index); }

    Alphabet reversed() const;

private:
    std::u32string symbols_;
    std::unordered_map<char32_t, std::size_t> index_;
};

// Decodes UTF-8 text; malformed input is reported as CipherError(Alphabet)
std::u32string toSymbols(const std::string& text);

// Fail-fast: throws CipherError(Alphabet) for the first symbol that is
// neither a space nor in the alphabet
void validateText(const std::u32string& text, const Alphabet& alphabet);
void validateText(const std::string& text, const Alphabet& alphabet);

// Human-readable form of a symbol for error messages
std::string describeSymbol(char32_t symbol);
