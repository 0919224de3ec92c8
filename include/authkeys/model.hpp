// model.hpp - Parsed representation of an authorized_keys file
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace authkeys {

// Closed set of supported key algorithms. Values only come out of lex_key_type().
enum class KeyType {
    EcdsaSha2Nistp256,
    EcdsaSha2Nistp384,
    EcdsaSha2Nistp521,
    SshEd25519,
    SshDss,
    SshRsa,
};

struct PublicKey {
    KeyType key_type;
    std::string encoded_key; // base64 alphabet + '=' padding, length % 4 == 0
};

// name="value" or bare name. The value is kept exactly as written between the
// quotes; \" and \\ are not decoded.
struct KeyOption {
    std::string name;
    std::optional<std::string> value;
};

using KeyOptions = std::vector<KeyOption>;

struct KeyAuthorization {
    KeyOptions options;
    PublicKey key;
    std::string comments;
};

// Comment or blank line, text preserved verbatim.
struct CommentLine {
    std::string text;
};

using KeysFileLine = std::variant<CommentLine, KeyAuthorization>;

struct KeysFile {
    std::vector<KeysFileLine> lines;
};

inline bool operator==(const PublicKey& a, const PublicKey& b) { return a.key_type == b.key_type && a.encoded_key == b.encoded_key; }
inline bool operator!=(const PublicKey& a, const PublicKey& b) { return !(a == b); }
inline bool operator==(const KeyOption& a, const KeyOption& b) { return a.name == b.name && a.value == b.value; }
inline bool operator!=(const KeyOption& a, const KeyOption& b) { return !(a == b); }
inline bool operator==(const KeyAuthorization& a, const KeyAuthorization& b) {
    return a.options == b.options && a.key == b.key && a.comments == b.comments;
}
inline bool operator!=(const KeyAuthorization& a, const KeyAuthorization& b) { return !(a == b); }
inline bool operator==(const CommentLine& a, const CommentLine& b) { return a.text == b.text; }
inline bool operator!=(const CommentLine& a, const CommentLine& b) { return !(a == b); }
inline bool operator==(const KeysFile& a, const KeysFile& b) { return a.lines == b.lines; }
inline bool operator!=(const KeysFile& a, const KeysFile& b) { return !(a == b); }

inline bool is_comment(const KeysFileLine& l) { return std::holds_alternative<CommentLine>(l); }

inline std::size_t key_count(const KeysFile& f) {
    std::size_t n = 0;
    for (auto& l : f.lines)
        if (!is_comment(l)) ++n;
    return n;
}

} // namespace authkeys
