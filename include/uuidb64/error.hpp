#pragma once

#include <string>

namespace uuidb64 {

struct UuidB64Error {
    enum Code {
        Parse,
        IO,
        Config,
        Database,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string input;  // original offending text, set for Parse errors

    UuidB64Error() = default;
    UuidB64Error(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    UuidB64Error(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    UuidB64Error(Code c, std::string msg, std::string h, std::string in)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          input(std::move(in)) {}

    // Shorthand for the one error the decode path produces.
    static UuidB64Error parse(std::string input, std::string reason) {
        return UuidB64Error(Parse, "invalid Base64 representation for UUID",
                            std::move(reason), std::move(input));
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace uuidb64
