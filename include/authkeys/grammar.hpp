// grammar.hpp - Token shapes of an authorized_keys line as PEGTL rules.
// Sequencing and error classification live in the parser; these rules only
// decide how far a token extends from the cursor.
#pragma once
#include <tao/pegtl.hpp>

namespace authkeys::grammar {
using namespace tao::pegtl;

// ident = 1*(ALPHA / DIGIT / "-"); used for option names and key types
struct dashed_ident : plus< sor< alnum, one<'-'> > > {};

// base64 = 1*(ALPHA / DIGIT / "+" / "/") *2("=")
struct base64_body : plus< sor< alnum, one<'+', '/'> > > {};
struct base64_padding : rep_opt< 2, one<'='> > {}; // a third '=' is left for the trailing check
struct base64_token : seq< base64_body, base64_padding > {};

// Quoted option value. A backslash escapes exactly the next character, so \"
// and \\ never close the string. The closing quote is matched separately so
// an unterminated value can be told apart from a missing opening quote.
struct dquote : one<'"'> {};
struct escaped_char : seq< one<'\\'>, any > {};
struct plain_char : not_one<'"', '\\'> {};
struct escaped_text : star< sor< escaped_char, plain_char > > {};

// ASCII whitespace: SP, HT, LF, FF, CR
struct ascii_ws : one<' ', '\t', '\n', '\f', '\r'> {};
struct ws_run : plus< ascii_ws > {};

} // namespace authkeys::grammar
