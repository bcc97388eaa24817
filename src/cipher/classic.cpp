#include <cipher/classic.hpp>
#include <cipher/Caesar/caesar.hpp>
#include <cipher/Vigenere/vigenere.hpp>
#include <cipher/Atbash/atbash.hpp>

std::string caesarCipher(const std::string& text, long long key,
                         const Alphabet& alphabet, CipherMode mode)
{
    return Caesar(key).apply(text, alphabet, mode);
}

std::string vigenereCipher(const std::string& text, const std::string& key,
                           const Alphabet& alphabet, CipherMode mode)
{
    return Vigenere(key).apply(text, alphabet, mode);
}

std::string atbashCipher(const std::string& text,
                         const Alphabet& alphabet, CipherMode mode)
{
    return Atbash().apply(text, alphabet, mode);
}
