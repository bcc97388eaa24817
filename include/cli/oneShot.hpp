#pragma once
#include <iostream>
#include <optional>
#include <string>

// Options of a single non-interactive run, as parsed by CLI11 in main
struct OneShotOptions {
    std::string alphabetPath;
    std::string cipherName;
    std::string key;
    std::optional<std::string> text;   // nullopt: read one line from in
    std::string operation = "encrypt"; // encrypt/decrypt, any case
};

// Loads the alphabet, runs one cipher and prints the result to out.
// Errors go to err as "Error (<kind>): ..."; returns 0 on success, 1 on error.
int runOneShot(const OneShotOptions& options, std::istream& in, std::ostream& out, std::ostream& err);
