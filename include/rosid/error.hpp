#pragma once

#include <string>

namespace rosid {

struct RosidError {
    enum Code {
        IO,
        Parse,
        Manifest,
        Condition,
        Config,
        NotFound,
        InvalidArg,
        Invariant,
        Subprocess
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    RosidError() = default;
    RosidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    RosidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    RosidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace rosid
