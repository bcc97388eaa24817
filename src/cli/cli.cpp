#include <CLI/CLI.hpp>
#include <string>
#include <iostream>

#include <cli/menu.hpp>
#include <cli/oneShot.hpp>

int main(int argc, char** argv) {
    CLI::App app{"subcipher - Caesar/Vigenere/Atbash ciphers over a custom alphabet"};

    OneShotOptions options;
    std::string text;
    bool interactive = false;

    // Alphabet options
    app.add_option("--alphabet,-a", options.alphabetPath, "Alphabet file (UTF-8, one line)");

    // Cipher options
    app.add_option("--cipher,-c", options.cipherName, "Cipher (caesar, vigenere, atbash)")
        ->check(CLI::IsMember({"caesar", "vigenere", "atbash"}, CLI::ignore_case));
    app.add_option("--key,-k", options.key, "Cipher key (integer for caesar, word for vigenere)");
    app.add_option("--operation,-o", options.operation, "Operation (encrypt, decrypt)")
        ->check(CLI::IsMember({"encrypt", "decrypt"}, CLI::ignore_case));

    // Input options
    app.add_option("--text,-t", text, "Text to process (read one line from stdin if omitted)");
    app.add_flag("--interactive,-i", interactive, "Start the interactive menu");

    CLI11_PARSE(app, argc, argv);

    if (interactive || options.cipherName.empty()) {
        MenuSession session(std::cin, std::cout);
        return session.run();
    }

    if (app.count("--text") > 0)
        options.text = text;

    return runOneShot(options, std::cin, std::cout, std::cerr);
}
