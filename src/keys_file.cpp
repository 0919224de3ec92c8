// keys_file.cpp - whole-file driver
#include "authkeys/parser.hpp"
#include "authkeys/diagnostics_json.hpp"
#include "authkeys/env.hpp"
#include <cstdio>
#include <vector>

namespace authkeys {

// Split on LF; a CR directly before the LF belongs to the terminator. A final
// LF does not start another line.
static std::vector<std::string_view> split_lines(std::string_view text){
    std::vector<std::string_view> out;
    std::size_t b = 0;
    while(b < text.size()){
        std::size_t e = text.find('\n', b);
        if(e == std::string_view::npos){
            out.push_back(text.substr(b));
            break;
        }
        std::string_view l = text.substr(b, e - b);
        if(!l.empty() && l.back() == '\r') l.remove_suffix(1);
        out.push_back(l);
        b = e + 1;
    }
    return out;
}

static bool is_comment_line(std::string_view l){
    if(!l.empty() && l.front() == '#') return true;
    for(char c : l)
        if(!detail::is_ascii_ws(c)) return false;
    return true;
}

KeysFile parse_file(std::string_view text){
    const bool trace = detect_env().trace;
    KeysFile file;
    auto lines = split_lines(text);
    for(std::size_t i = 0; i < lines.size(); ++i){
        std::string_view l = lines[i];
        if(is_comment_line(l)){
            file.lines.emplace_back(CommentLine{std::string(l)});
            continue;
        }
        try {
            file.lines.emplace_back(parse_line(l));
        } catch (const parse_error& e) {
            if(trace) std::fprintf(stderr, "[trace][file] line %zu rejected: %s\n", i, e.what());
            throw file_parse_error(i, e);
        }
    }
    if(trace) std::fprintf(stderr, "[trace][file] parsed %zu lines (%zu keys)\n", file.lines.size(), key_count(file));
    return file;
}

ParseResult try_parse_file(std::string_view text){
    ParseResult r;
    try {
        r.file = parse_file(text);
        r.success = true;
    } catch (const file_parse_error& e) {
        const parse_error* inner = &e;
        while(inner->cause()) inner = inner->cause().get();
        r.success = false;
        r.error_message = e.what();
        r.code = std::string(inner->code());
        r.line = static_cast<int>(e.line_index());
        r.column = inner->column();
    }
    maybe_print_json(r);
    return r;
}

} // namespace authkeys
