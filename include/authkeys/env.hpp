#pragma once
#include <string>

namespace authkeys {

struct ParseEnv {
    bool trace = false;     // AUTHKEYS_TRACE=1: log grammar fallbacks and file progress to stderr
    bool diagJson = false;  // AUTHKEYS_DIAG_JSON=1: try_parse_file prints its result as JSON
};

// Reads process env vars and constructs a ParseEnv. Values are re-read on
// every call.
ParseEnv detect_env();

} // namespace authkeys
