#pragma once
#include <string>

#include <core/alphabet.hpp>
#include <utils/enums.hpp>

// One-call wrappers over Caesar, Vigenere and Atbash. All of them throw
// CipherError; nothing is returned on failure.

std::string caesarCipher(const std::string& text, long long key,
                         const Alphabet& alphabet, CipherMode mode = CipherMode::Encrypt);

std::string vigenereCipher(const std::string& text, const std::string& key,
                           const Alphabet& alphabet, CipherMode mode = CipherMode::Encrypt);

// mode is accepted for interface symmetry and has no effect
std::string atbashCipher(const std::string& text,
                         const Alphabet& alphabet, CipherMode mode = CipherMode::Encrypt);
