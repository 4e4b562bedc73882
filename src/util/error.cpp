#include <weft/error.hpp>

namespace weft {

const char* WeftError::code_name(Code c) {
    switch (c) {
        case Parse:      return "Parse";
        case Version:    return "Version";
        case Range:      return "Range";
        case Constraint: return "Constraint";
        case Config:     return "Config";
        case IO:         return "IO";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string WeftError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace weft
