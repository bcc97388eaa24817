#pragma once
#include <iostream>
#include <optional>
#include <string>

#include <core/alphabet.hpp>
#include <utils/enums.hpp>

/**
 * Interactive console session: asks for an alphabet file once, then loops
 * over cipher / operation / key / text prompts until the user exits.
 * Every prompt re-asks until the answer is valid. End of input at any
 * prompt ends the session.
 */
class MenuSession {
public:
    MenuSession(std::istream& in, std::ostream& out);

    // 0 on normal exit or end of input, 1 if the alphabet could not be loaded
    int run();

private:
    std::optional<std::string> ask(const std::string& prompt);

    std::optional<std::string> askAlphabetFile();
    std::optional<CipherType> askCipher();   // nullopt also means "Exit"
    std::optional<CipherMode> askOperation();
    std::optional<std::string> askKey(CipherType type, CipherMode mode);
    std::optional<std::string> askText();
    bool askContinue();

    void runOnce(const Alphabet& alphabet, CipherType type, CipherMode mode,
                 const std::string& key, const std::string& text);

    std::istream& in;
    std::ostream& out;
    bool inputClosed = false;
};
