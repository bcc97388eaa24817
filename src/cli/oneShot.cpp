#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#include <cli/oneShot.hpp>
#include <core/alphabet.hpp>
#include <core/cipherError.hpp>
#include <core/cipherFactory.hpp>

static CipherMode parseOperation(std::string operation) {
    std::transform(operation.begin(), operation.end(), operation.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (operation == "encrypt") return CipherMode::Encrypt;
    if (operation == "decrypt") return CipherMode::Decrypt;
    throw CipherError::usage("Unknown operation: " + operation + ". Use 'encrypt' or 'decrypt'");
}

int runOneShot(const OneShotOptions& options, std::istream& in, std::ostream& out, std::ostream& err)
{
    try {
        if (options.alphabetPath.empty()) {
            throw CipherError::usage("--alphabet is required together with --cipher");
        }
        const CipherMode mode = parseOperation(options.operation);
        const Alphabet alphabet = Alphabet::fromFile(options.alphabetPath);

        std::string text;
        if (options.text) {
            text = *options.text;
        } else {
            if (!std::getline(in, text)) {
                throw CipherError::usage("No text given on stdin");
            }
            if (!text.empty() && text.back() == '\r')
                text.pop_back();
        }

        auto cipher = CipherFactory::create(options.cipherName, options.key);
        out << cipher->apply(text, alphabet, mode) << std::endl;

    } catch (const CipherError& e) {
        err << "Error (" << toString(e.kind()) << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
