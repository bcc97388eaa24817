#pragma once
#include <optional>
#include <stdexcept>
#include <string>

enum class ErrorKind {
    NotFound,     // alphabet source missing or unreadable
    Alphabet,     // malformed alphabet, or a symbol outside the alphabet
    CipherUsage   // e.g. empty Vigenere key, non-numeric Caesar key
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:    return "not found";
    case ErrorKind::Alphabet:    return "alphabet";
    case ErrorKind::CipherUsage: return "cipher usage";
    }
    return "unknown";
}

class CipherError : public std::runtime_error {
public:
    CipherError(ErrorKind kind, const std::string& msg,
                std::optional<char32_t> symbol = std::nullopt)
        : std::runtime_error(msg), kind_(kind), symbol_(symbol) {}

    ErrorKind kind() const noexcept { return kind_; }
    bool is(ErrorKind kind) const noexcept { return kind_ == kind; }

    // Set only for "symbol not in alphabet" and duplicate-symbol errors
    std::optional<char32_t> symbol() const noexcept { return symbol_; }

    static CipherError notFound(const std::string& msg) {
        return CipherError(ErrorKind::NotFound, msg);
    }
    static CipherError alphabet(const std::string& msg,
                                std::optional<char32_t> symbol = std::nullopt) {
        return CipherError(ErrorKind::Alphabet, msg, symbol);
    }
    static CipherError usage(const std::string& msg) {
        return CipherError(ErrorKind::CipherUsage, msg);
    }

private:
    ErrorKind kind_;
    std::optional<char32_t> symbol_;
};
