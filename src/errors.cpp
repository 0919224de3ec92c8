#include "authkeys/errors.hpp"
#include <utility>

namespace authkeys {

std::string_view error_code(error_kind k){
    switch(k){
        case error_kind::unknown_key_type: return "E0101";
        case error_kind::incomplete_input: return "E0102";
        case error_kind::unmatched_token: return "E0103";
        case error_kind::invalid_base64_length: return "E0104";
        case error_kind::trailing_character: return "E0105";
        case error_kind::key_not_found_after_options: return "E0201";
        case error_kind::no_key_or_options: return "E0202";
        case error_kind::line_parse_failure: return "E0301";
    }
    return "E0000";
}

std::string_view kind_name(error_kind k){
    switch(k){
        case error_kind::unknown_key_type: return "unknown_key_type";
        case error_kind::incomplete_input: return "incomplete_input";
        case error_kind::unmatched_token: return "unmatched_token";
        case error_kind::invalid_base64_length: return "invalid_base64_length";
        case error_kind::trailing_character: return "trailing_character";
        case error_kind::key_not_found_after_options: return "key_not_found_after_options";
        case error_kind::no_key_or_options: return "no_key_or_options";
        case error_kind::line_parse_failure: return "line_parse_failure";
    }
    return "unknown";
}

parse_error::parse_error(error_kind kind, const std::string& message, int column)
    : std::runtime_error(message), kind_(kind), column_(column) {}

parse_error::parse_error(error_kind kind, const std::string& message, int column, std::shared_ptr<const parse_error> cause)
    : std::runtime_error(message), kind_(kind), column_(column), cause_(std::move(cause)) {}

parse_error parse_error::unknown_key_type(std::string_view token, int column){
    parse_error e(error_kind::unknown_key_type, "unknown key type '" + std::string(token) + "'", column);
    e.token_ = std::string(token);
    return e;
}

parse_error parse_error::incomplete_input(std::string_view what, int column){
    return parse_error(error_kind::incomplete_input, "unexpected end of input, expected " + std::string(what), column);
}

parse_error parse_error::unmatched_token(std::string_view context, std::string_view detail, int column){
    return parse_error(error_kind::unmatched_token, std::string(context) + ": " + std::string(detail), column);
}

parse_error parse_error::invalid_base64_length(std::size_t length, int column){
    return parse_error(error_kind::invalid_base64_length,
                       "unexpected length " + std::to_string(length) + " of base64 value, expected a multiple of 4", column);
}

parse_error parse_error::trailing_character(char c, int column){
    parse_error e(error_kind::trailing_character, std::string("unexpected trailing character '") + c + "' on base64 value", column);
    e.character_ = c;
    return e;
}

parse_error parse_error::key_not_found_after_options(const parse_error& cause, int column){
    return parse_error(error_kind::key_not_found_after_options,
                       "could not find a valid public key after the options (" + std::string(cause.what()) + ")",
                       column, std::make_shared<parse_error>(cause));
}

parse_error parse_error::no_key_or_options(const parse_error& cause){
    return parse_error(error_kind::no_key_or_options,
                       "could not find a valid options string, or public key (" + std::string(cause.what()) + ")",
                       cause.column(), std::make_shared<parse_error>(cause));
}

file_parse_error::file_parse_error(std::size_t line_index, const parse_error& cause)
    : parse_error(error_kind::line_parse_failure,
                  "parsing failed on line " + std::to_string(line_index) + ": " + cause.what(),
                  cause.column(), std::make_shared<parse_error>(cause)),
      line_index_(line_index) {}

} // namespace authkeys
