#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

#include <cli/menu.hpp>
#include <cipher/Caesar/caesar.hpp>
#include <core/cipherError.hpp>
#include <core/cipherFactory.hpp>
#include <utils/Utf8.hpp>

namespace {

// ASCII and Cyrillic only, enough for the yes/no answers
std::string toLower(const std::string& s) {
    std::u32string cps;
    try {
        cps = utils::Utf8::Decode(s);
    }
    catch (const std::invalid_argument&) {
        return s;
    }
    for (char32_t& c : cps) {
        if (c >= U'A' && c <= U'Z') c += 0x20;
        else if (c >= 0x0410 && c <= 0x042F) c += 0x20;
        else if (c == 0x0401) c = 0x0451;
    }
    return utils::Utf8::Encode(cps);
}

const std::string kRule(30, '-');

} // namespace

MenuSession::MenuSession(std::istream& in, std::ostream& out)
    : in(in), out(out) {}

std::optional<std::string> MenuSession::ask(const std::string& prompt)
{
    out << prompt << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        inputClosed = true;
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

std::optional<std::string> MenuSession::askAlphabetFile()
{
    while (true) {
        auto answer = ask("Enter path to the alphabet file: ");
        if (!answer) return std::nullopt;

        std::string path = utils::Utf8::Trim(*answer);
        std::error_code ec;
        if (!path.empty() && std::filesystem::exists(path, ec))
            return path;
        out << "Error: file '" << path << "' not found. Try again." << std::endl;
    }
}

std::optional<CipherType> MenuSession::askCipher()
{
    out << "\nChoose a cipher:\n"
        << "1. Caesar cipher\n"
        << "2. Vigenere cipher\n"
        << "3. Atbash cipher\n"
        << "4. Exit\n";

    while (true) {
        auto answer = ask("Your choice (1-4): ");
        if (!answer) return std::nullopt;

        std::string choice = utils::Utf8::Trim(*answer);
        auto value = Caesar::parseKey(choice);
        if (!value) {
            out << "Error: enter a number" << std::endl;
            continue;
        }
        switch (*value) {
        case 1: return CipherType::Caesar;
        case 2: return CipherType::Vigenere;
        case 3: return CipherType::Atbash;
        case 4: return std::nullopt;
        default:
            out << "Error: enter a number from 1 to 4" << std::endl;
        }
    }
}

std::optional<CipherMode> MenuSession::askOperation()
{
    while (true) {
        auto answer = ask("Choose operation (1 - encrypt, 2 - decrypt): ");
        if (!answer) return std::nullopt;

        std::string op = utils::Utf8::Trim(*answer);
        if (op == "1") return CipherMode::Encrypt;
        if (op == "2") return CipherMode::Decrypt;
        out << "Error: enter 1 or 2" << std::endl;
    }
}

std::optional<std::string> MenuSession::askKey(CipherType type, CipherMode mode)
{
    if (type == CipherType::Atbash)
        return std::string();

    if (type == CipherType::Caesar) {
        while (true) {
            auto answer = ask("Enter key (integer): ");
            if (!answer) return std::nullopt;
            if (Caesar::parseKey(*answer))
                return utils::Utf8::Trim(*answer);
            out << "Error: key must be an integer" << std::endl;
        }
    }

    const std::string action = mode == CipherMode::Encrypt ? "encryption" : "decryption";
    while (true) {
        auto answer = ask("Enter key for " + action + ": ");
        if (!answer) return std::nullopt;
        std::string key = utils::Utf8::Trim(*answer);
        if (!key.empty())
            return key;
        out << "Error: key must not be empty" << std::endl;
    }
}

std::optional<std::string> MenuSession::askText()
{
    while (true) {
        auto answer = ask("Enter text: ");
        if (!answer) return std::nullopt;
        std::string text = utils::Utf8::Trim(*answer);
        if (!text.empty())
            return text;
        out << "Error: text must not be empty" << std::endl;
    }
}

bool MenuSession::askContinue()
{
    auto answer = ask("\nContinue? (yes/no): ");
    if (!answer) return false;

    const std::string reply = toLower(utils::Utf8::Trim(*answer));
    return reply == "yes" || reply == "y" || reply == "да" || reply == "д";
}

void MenuSession::runOnce(const Alphabet& alphabet, CipherType type, CipherMode mode,
                          const std::string& key, const std::string& text)
{
    try {
        auto cipher = CipherFactory::create(type, key);
        std::string result = cipher->apply(text, alphabet, mode);

        out << "\n" << (mode == CipherMode::Encrypt ? "Encrypted" : "Decrypted") << " text:\n"
            << kRule << "\n"
            << result << "\n"
            << kRule << std::endl;
    }
    catch (const CipherError& e) {
        switch (e.kind()) {
        case ErrorKind::Alphabet:
            out << "Text error: " << e.what() << std::endl;
            break;
        case ErrorKind::CipherUsage:
            out << "Cipher error: " << e.what() << std::endl;
            break;
        case ErrorKind::NotFound:
            out << "Error: " << e.what() << std::endl;
            break;
        }
    }
}

int MenuSession::run()
{
    const std::string banner(50, '=');
    out << banner << "\n"
        << "Text encryption and decryption\n"
        << banner << std::endl;

    auto path = askAlphabetFile();
    if (!path) {
        out << "\nInput closed, exiting." << std::endl;
        return 0;
    }

    std::optional<Alphabet> alphabet;
    try {
        alphabet.emplace(Alphabet::fromFile(*path));
    }
    catch (const CipherError& e) {
        if (e.is(ErrorKind::Alphabet))
            out << "Alphabet error: " << e.what() << std::endl;
        else
            out << "Error: " << e.what() << std::endl;
        return 1;
    }
    out << "Alphabet loaded (" << alphabet->size() << " symbols)" << std::endl;

    while (true) {
        auto type = askCipher();
        if (!type) break;

        auto mode = askOperation();
        if (!mode) break;

        auto key = askKey(*type, *mode);
        if (!key) break;

        auto text = askText();
        if (!text) break;

        runOnce(*alphabet, *type, *mode, *key, *text);

        if (!askContinue()) break;
    }

    if (inputClosed)
        out << "\nInput closed, exiting." << std::endl;
    else
        out << "Exiting." << std::endl;
    return 0;
}
