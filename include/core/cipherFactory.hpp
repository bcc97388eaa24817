#pragma once
#include <memory>
#include <string>
#include <cipher/cipher.hpp>

class CipherFactory {
public:
    // key is the textual key as typed by the user; Atbash ignores it
    static std::unique_ptr<Cipher> create(CipherType type, const std::string& key);
    static std::unique_ptr<Cipher> create(const std::string& name, const std::string& key);
};
