// errors.hpp - Parse failures raised by the grammar and the file driver
#pragma once
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace authkeys {

enum class error_kind {
    unknown_key_type,
    incomplete_input,
    unmatched_token,
    invalid_base64_length,
    trailing_character,
    key_not_found_after_options,
    no_key_or_options,
    line_parse_failure,
};

// Stable diagnostic code, e.g. "E0104" for invalid_base64_length.
std::string_view error_code(error_kind k);
// snake_case name of the kind, used in JSON output.
std::string_view kind_name(error_kind k);

class parse_error : public std::runtime_error {
public:
    parse_error(error_kind kind, const std::string& message, int column = -1);

    error_kind kind() const { return kind_; }
    std::string_view code() const { return error_code(kind_); }
    // Zero-based offset into the line, -1 when unknown.
    int column() const { return column_; }
    // Offending identifier for unknown_key_type.
    const std::string& token() const { return token_; }
    // Offending character for trailing_character, '\0' otherwise.
    char character() const { return character_; }
    // Inner failure for key_not_found_after_options, no_key_or_options and
    // line_parse_failure; null for leaf errors.
    const std::shared_ptr<const parse_error>& cause() const { return cause_; }

    static parse_error unknown_key_type(std::string_view token, int column);
    static parse_error incomplete_input(std::string_view what, int column);
    static parse_error unmatched_token(std::string_view context, std::string_view detail, int column);
    static parse_error invalid_base64_length(std::size_t length, int column);
    static parse_error trailing_character(char c, int column);
    static parse_error key_not_found_after_options(const parse_error& cause, int column);
    static parse_error no_key_or_options(const parse_error& cause);

protected:
    parse_error(error_kind kind, const std::string& message, int column, std::shared_ptr<const parse_error> cause);

private:
    error_kind kind_;
    int column_;
    std::string token_;
    char character_ = '\0';
    std::shared_ptr<const parse_error> cause_;
};

// Raised by parse_file: the first failing line aborts the whole file.
class file_parse_error : public parse_error {
public:
    file_parse_error(std::size_t line_index, const parse_error& cause);

    // Zero-based index of the failing line.
    std::size_t line_index() const { return line_index_; }

private:
    std::size_t line_index_;
};

} // namespace authkeys
