// diagnostics_json.hpp - JSON serialization for parse failures and results
#pragma once
#include "authkeys/errors.hpp"
#include "authkeys/parser.hpp"
#include <string>

namespace authkeys {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"code":..,"kind":..,"message":..,"column":..,"cause":{..}|null}
std::string error_to_json(const parse_error& e);

// Summary of a try_parse_file call (counts on success, error fields otherwise).
std::string result_to_json(const ParseResult& r);

// If AUTHKEYS_DIAG_JSON=1 in the environment, print result JSON to stderr.
void maybe_print_json(const ParseResult& r);

} // namespace authkeys
