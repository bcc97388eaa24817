#include <unordered_map>
#include <functional>
#include <memory>
#include <string>

#include <cipher/cipher.hpp>
#include <core/cipherFactory.hpp>
#include <cipher/Caesar/caesar.hpp>
#include <cipher/Vigenere/vigenere.hpp>
#include <cipher/Atbash/atbash.hpp>

using FactoryFn = std::function<std::unique_ptr<Cipher>(const std::string&)>;

static std::unique_ptr<Cipher> makeCaesar(const std::string& key) {
    auto shift = Caesar::parseKey(key);
    if (!shift) {
        throw CipherError::usage("Caesar key must be an integer. Got: '" + key + "'");
    }
    return std::make_unique<Caesar>(*shift);
}

static const std::unordered_map<CipherType, FactoryFn> getRegistry = {
    {CipherType::Caesar, makeCaesar},
    {CipherType::Vigenere, [](const std::string& key) -> std::unique_ptr<Cipher> { return std::make_unique<Vigenere>(key); }},
    {CipherType::Atbash, [](const std::string&) -> std::unique_ptr<Cipher> { return std::make_unique<Atbash>(); }}
};

std::unique_ptr<Cipher> CipherFactory::create(CipherType type, const std::string& key) {
    auto it = getRegistry.find(type);
    if (it == getRegistry.end()) {
        throw CipherError::usage("Unknown cipher: " + toString(type));
    }
    return it->second(key);
}

std::unique_ptr<Cipher> CipherFactory::create(const std::string& name, const std::string& key) {
    auto type = cipherTypeFromName(name);
    if (!type) {
        throw CipherError::usage("Unknown cipher: " + name);
    }
    return create(*type, key);
}
