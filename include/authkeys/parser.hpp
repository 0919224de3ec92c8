// parser.hpp - authorized_keys line grammar and file driver
#pragma once
#include "authkeys/cursor.hpp"
#include "authkeys/errors.hpp"
#include "authkeys/model.hpp"
#include <string>
#include <string_view>

namespace authkeys {

// Building blocks, exposed for the composite parser and for tests. Each one
// starts at the cursor, advances past what it consumed and throws parse_error
// when the text does not fit.
namespace detail {
    std::string parse_base64(cursor& c);
    PublicKey parse_public_key(cursor& c);
    // Empty list with the cursor untouched when no option name starts here.
    KeyOptions parse_options(cursor& c);
    // Expects leading whitespace already skipped.
    std::string parse_comment(cursor& c);
}

// One key line: [options WSP] key-type WSP base64 [WSP comment].
KeyAuthorization parse_line(std::string_view line);

// Whole file. Stops at the first bad line and throws file_parse_error.
KeysFile parse_file(std::string_view text);

struct ParseResult {
    bool success{false};
    KeysFile file;             // Empty unless success
    std::string error_message; // If !success, human-readable message
    std::string code;          // Diagnostic code of the innermost cause
    int line{-1};              // Zero-based failing line
    int column{-1};
};

// Non-throwing form of parse_file. Prints the result as JSON to stderr when
// AUTHKEYS_DIAG_JSON=1.
ParseResult try_parse_file(std::string_view text);

} // namespace authkeys
