#include <uuidb64/error.hpp>

namespace uuidb64 {

const char* UuidB64Error::code_name(Code c) {
    switch (c) {
        case Parse:      return "Parse";
        case IO:         return "IO";
        case Config:     return "Config";
        case Database:   return "Database";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string UuidB64Error::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!input.empty()) {
        result += "\n  input: '";
        result += input;
        result += "'";
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace uuidb64
