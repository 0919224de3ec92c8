// key_authorization.cpp - line level grammar
//
// The first token of a key line is either the key type or an option name;
// both are dashed identifiers. The line is tried without options first (the
// common case) and only then as an options list followed by the key. There is
// no deeper backtracking: when the options parse but the key does not, the
// error points at the key position and wraps the key failure. If the first
// attempt had already recognised a key type and failed no earlier than the
// second one, its failure is the one wrapped instead ("ssh-rsa AAAAtHU" is a
// bad key, not an option list).
#include "authkeys/parser.hpp"
#include "authkeys/env.hpp"
#include "authkeys/grammar.hpp"
#include <cstdio>

namespace authkeys {

namespace detail {

std::string parse_comment(cursor& c){
    std::size_t end = c.find_if([](char ch){ return ch == '\n'; });
    std::string_view text = c.take(end);
    if(!text.empty() && text.back() == '\r')
        text.remove_suffix(1);
    return std::string(text);
}

} // namespace detail

// Innermost failure position of an error chain.
static int failure_column(const parse_error& e){
    const parse_error* inner = &e;
    while(inner->cause()) inner = inner->cause().get();
    return inner->column();
}

// The optionless attempt lexed a valid key type before failing.
static bool passed_key_type(const parse_error& e){
    return e.kind() != error_kind::unknown_key_type && e.column() > 0;
}

KeyAuthorization parse_line(std::string_view line){
    using detail::cursor;

    // TryOptionless
    cursor c(line);
    try {
        PublicKey key = detail::parse_public_key(c);
        c.skip_ws();
        return KeyAuthorization{{}, std::move(key), detail::parse_comment(c)};
    } catch (const parse_error& optionless) {
        if(detect_env().trace)
            std::fprintf(stderr, "[trace][grammar] optionless parse failed (%s), retrying with options\n", optionless.what());

        // TryOptioned
        cursor oc(line);
        KeyOptions options;
        try {
            options = detail::parse_options(oc);
        } catch (const parse_error& e) {
            throw parse_error::no_key_or_options(e);
        }
        if(options.empty())
            throw parse_error::no_key_or_options(optionless);

        const int key_column = oc.column();
        try {
            if(!oc.match<grammar::ws_run>()){
                if(oc.eof()) throw parse_error::incomplete_input("public key after options", oc.column());
                throw parse_error::unmatched_token("options", std::string("expected whitespace or ',' after option, found '") + oc.peek() + "'", oc.column());
            }
            PublicKey key = detail::parse_public_key(oc);
            oc.skip_ws();
            return KeyAuthorization{std::move(options), std::move(key), detail::parse_comment(oc)};
        } catch (const parse_error& e) {
            if(passed_key_type(optionless) && optionless.column() >= failure_column(e)){
                if(detect_env().trace)
                    std::fprintf(stderr, "[trace][grammar] keeping optionless failure over (%s)\n", e.what());
                throw parse_error::key_not_found_after_options(optionless, 0);
            }
            throw parse_error::key_not_found_after_options(e, key_column);
        }
    }
}

} // namespace authkeys
