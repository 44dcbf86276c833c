#include <rosid/environment.hpp>

extern char** environ;

namespace rosid {

Environment current_environment() {
    Environment env;
    if (!environ) return env;

    for (char** entry = environ; *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        env.emplace(kv.substr(0, eq), kv.substr(eq + 1));
    }
    return env;
}

} // namespace rosid
