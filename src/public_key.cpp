// public_key.cpp - key-type token and base64 payload
#include "authkeys/parser.hpp"
#include "authkeys/grammar.hpp"
#include "authkeys/key_type.hpp"

namespace authkeys::detail {

std::string parse_base64(cursor& c){
    const int start = c.column();
    auto tok = c.match<grammar::base64_token>();
    if(!tok){
        if(c.eof()) throw parse_error::incomplete_input("base64 key material", start);
        throw parse_error::unmatched_token("base64", std::string("expected key material, found '") + c.peek() + "'", start);
    }
    if(tok->size() % 4 != 0)
        throw parse_error::invalid_base64_length(tok->size(), start);
    // Reject "AAAA!" instead of silently stopping at the '!'
    if(!c.eof() && !is_ascii_ws(c.peek()))
        throw parse_error::trailing_character(c.peek(), c.column());
    return std::string(*tok);
}

PublicKey parse_public_key(cursor& c){
    const int start = c.column();
    auto ident = c.match<grammar::dashed_ident>();
    if(!ident){
        if(c.eof()) throw parse_error::incomplete_input("key type", start);
        throw parse_error::unmatched_token("key type", std::string("expected an identifier, found '") + c.peek() + "'", start);
    }
    const KeyType type = lex_key_type(*ident, start);

    if(c.eof()) throw parse_error::incomplete_input("whitespace before base64 key material", c.column());
    if(!c.match<grammar::ws_run>())
        throw parse_error::unmatched_token("public key", std::string("expected whitespace after key type, found '") + c.peek() + "'", c.column());

    return PublicKey{type, parse_base64(c)};
}

} // namespace authkeys::detail
