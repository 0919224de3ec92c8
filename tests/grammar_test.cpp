#include <gtest/gtest.h>
#include "authkeys/parser.hpp"
#include <optional>

using namespace authkeys;
using authkeys::detail::cursor;

// Kind of the error fn throws on text; nullopt when it parses.
static std::optional<error_kind> kind_of(void (*fn)(cursor&), const char* text){
    cursor c(text);
    try { fn(c); } catch (const parse_error& e) { return e.kind(); }
    return std::nullopt;
}

static void base64(cursor& c){ (void)detail::parse_base64(c); }
static void public_key(cursor& c){ (void)detail::parse_public_key(c); }
static void options(cursor& c){ (void)detail::parse_options(c); }

TEST(Base64, AcceptsFullAlphabetAndPadding){
    const char* cases[] = {"foobar==", "FullerRangeOfCharacters+/1==", "lesspadding=", "AAAAtHUM"};
    for(auto text : cases){
        cursor c(text);
        EXPECT_EQ(detail::parse_base64(c), text);
        EXPECT_TRUE(c.eof());
    }
}

TEST(Base64, StopsAtWhitespace){
    cursor c("AAAAtHUM comment");
    EXPECT_EQ(detail::parse_base64(c), "AAAAtHUM");
    EXPECT_EQ(c.peek(), ' ');
}

TEST(Base64, RejectsLengthNotMultipleOfFour){
    EXPECT_EQ(kind_of(base64, "AAAAtHU"), error_kind::invalid_base64_length);
    EXPECT_EQ(kind_of(base64, "AAAAtHUMM= tail"), error_kind::invalid_base64_length);
}

TEST(Base64, RejectsTrailingCharacter){
    cursor c("AAAAtHUM!");
    try {
        (void)detail::parse_base64(c);
        FAIL();
    } catch (const parse_error& e) {
        EXPECT_EQ(e.kind(), error_kind::trailing_character);
        EXPECT_EQ(e.character(), '!');
        EXPECT_EQ(e.column(), 8);
    }
}

TEST(Base64, AbsorbsAtMostTwoPaddingCharacters){
    EXPECT_EQ(kind_of(base64, "AAAAAA==="), error_kind::trailing_character);
}

TEST(Base64, WellFormedTokenHasNoErrorKind){
    EXPECT_FALSE(kind_of(base64, "AAAAtHUM").has_value());
    EXPECT_FALSE(kind_of(public_key, "ssh-rsa AAAA").has_value());
}

TEST(Base64, MissingPayload){
    EXPECT_EQ(kind_of(base64, ""), error_kind::incomplete_input);
    EXPECT_EQ(kind_of(base64, "=AAA"), error_kind::unmatched_token);
}

TEST(PublicKey, ParsesTypeAndPayload){
    struct { const char* text; KeyType type; const char* key; } cases[] = {
        {"ssh-ed25519    foobar01 ", KeyType::SshEd25519, "foobar01"},
        {"ecdsa-sha2-nistp256 \t testval= ", KeyType::EcdsaSha2Nistp256, "testval="},
        {"ecdsa-sha2-nistp521 istestbase64", KeyType::EcdsaSha2Nistp521, "istestbase64"},
    };
    for(auto& tc : cases){
        cursor c(tc.text);
        PublicKey k = detail::parse_public_key(c);
        EXPECT_EQ(k.key_type, tc.type) << tc.text;
        EXPECT_EQ(k.encoded_key, tc.key) << tc.text;
    }
}

TEST(PublicKey, Failures){
    EXPECT_EQ(kind_of(public_key, "ssh-made-up AAAA"), error_kind::unknown_key_type);
    EXPECT_EQ(kind_of(public_key, "ssh-rsa"), error_kind::incomplete_input);
    EXPECT_EQ(kind_of(public_key, "ssh-rsa,AAAA"), error_kind::unmatched_token);
    EXPECT_EQ(kind_of(public_key, "ssh-rsa "), error_kind::incomplete_input);
    EXPECT_EQ(kind_of(public_key, "\"ssh-rsa\" AAAA"), error_kind::unmatched_token);
}

TEST(Options, ParsesNamesAndValues){
    cursor c(R"(restrict,fake-option="echo \"Hello, world!\"",and-finally ssh-rsa)");
    KeyOptions opts = detail::parse_options(c);
    KeyOptions expected{
        {"restrict", std::nullopt},
        {"fake-option", std::string(R"(echo \"Hello, world!\")")},
        {"and-finally", std::nullopt},
    };
    EXPECT_EQ(opts, expected);
    EXPECT_EQ(c.rest(), " ssh-rsa");
}

TEST(Options, EmptyValueAndEscapedBackslash){
    cursor c(R"(command="",from="a\\" x)");
    KeyOptions opts = detail::parse_options(c);
    ASSERT_EQ(opts.size(), 2u);
    EXPECT_EQ(opts[0].value, std::string(""));
    EXPECT_EQ(opts[1].value, std::string(R"(a\\)"));
    EXPECT_EQ(c.rest(), " x");
}

TEST(Options, DuplicatesKeptInOrder){
    cursor c(R"(permitopen="a:1",permitopen="b:2")");
    KeyOptions opts = detail::parse_options(c);
    ASSERT_EQ(opts.size(), 2u);
    EXPECT_EQ(*opts[0].value, "a:1");
    EXPECT_EQ(*opts[1].value, "b:2");
}

TEST(Options, NoNameLeavesCursorUntouched){
    cursor c("\"quoted\" ssh-rsa AAAA");
    EXPECT_TRUE(detail::parse_options(c).empty());
    EXPECT_EQ(c.column(), 0);
}

TEST(Options, Failures){
    EXPECT_EQ(kind_of(options, "command=\"never closed"), error_kind::incomplete_input);
    EXPECT_EQ(kind_of(options, "command=\"ends in escape\\\""), error_kind::incomplete_input);
    EXPECT_EQ(kind_of(options, "command=unquoted"), error_kind::unmatched_token);
    EXPECT_EQ(kind_of(options, "restrict,,pty"), error_kind::unmatched_token);
    EXPECT_EQ(kind_of(options, "restrict,"), error_kind::incomplete_input);
}

TEST(Comment, StopsAtLineFeedAndDropsCarriageReturn){
    cursor a("hello, world!\r\nnext");
    EXPECT_EQ(detail::parse_comment(a), "hello, world!");
    EXPECT_EQ(a.peek(), '\n');

    cursor b("Unix newline test\n");
    EXPECT_EQ(detail::parse_comment(b), "Unix newline test");

    cursor e("");
    EXPECT_EQ(detail::parse_comment(e), "");
}
