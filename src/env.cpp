#include "authkeys/env.hpp"
#include <cstdlib>
#include <string>

namespace authkeys {

ParseEnv detect_env(){
    ParseEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("AUTHKEYS_TRACE")) e.trace = (std::string(v) == "1");
    if (const char* v = get("AUTHKEYS_DIAG_JSON")) e.diagJson = (std::string(v) == "1");

    return e;
}

} // namespace authkeys
