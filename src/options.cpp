// options.cpp - comma separated name / name="value" list
#include "authkeys/parser.hpp"
#include "authkeys/grammar.hpp"

namespace authkeys::detail {

static std::string parse_option_value(cursor& c){
    if(!c.match<grammar::dquote>()){
        if(c.eof()) throw parse_error::incomplete_input("'\"' to open option value", c.column());
        throw parse_error::unmatched_token("option value", std::string("expected '\"', found '") + c.peek() + "'", c.column());
    }
    const int open = c.column() - 1;
    auto text = c.match<grammar::escaped_text>(); // star<>, always matches
    if(!c.match<grammar::dquote>())
        throw parse_error::incomplete_input("closing '\"' of option value opened at column " + std::to_string(open), c.column());
    return std::string(text ? *text : std::string_view{});
}

KeyOptions parse_options(cursor& c){
    KeyOptions options;
    while(!c.eof()){
        auto name = c.match<grammar::dashed_ident>();
        if(!name){
            if(options.empty()) break;
            throw parse_error::unmatched_token("options", "expected an option name after ','", c.column());
        }
        KeyOption opt{std::string(*name), std::nullopt};
        if(c.peek() == '='){
            c.skip_char();
            opt.value = parse_option_value(c);
        }
        options.push_back(std::move(opt));

        if(c.peek() != ',') break;
        c.skip_char();
        if(c.eof()) throw parse_error::incomplete_input("option name after ','", c.column());
    }
    return options;
}

} // namespace authkeys::detail
