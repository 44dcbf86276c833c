#include <rosid/error.hpp>

namespace rosid {

const char* RosidError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Manifest:   return "Manifest";
        case Condition:  return "Condition";
        case Config:     return "Config";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
        case Invariant:  return "Invariant";
        case Subprocess: return "Subprocess";
    }
    return "Unknown";
}

std::string RosidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace rosid
