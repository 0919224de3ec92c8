// key_type.hpp - Key algorithm names <-> KeyType
#pragma once
#include "authkeys/model.hpp"
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace authkeys {

inline constexpr std::array<std::pair<std::string_view, KeyType>, 6> kKeyTypeNames{{
    {"ecdsa-sha2-nistp256", KeyType::EcdsaSha2Nistp256},
    {"ecdsa-sha2-nistp384", KeyType::EcdsaSha2Nistp384},
    {"ecdsa-sha2-nistp521", KeyType::EcdsaSha2Nistp521},
    {"ssh-ed25519", KeyType::SshEd25519},
    {"ssh-dss", KeyType::SshDss},
    {"ssh-rsa", KeyType::SshRsa},
}};

// Case-insensitive whole-token match. std::nullopt for anything else.
std::optional<KeyType> find_key_type(std::string_view token);

// Same as find_key_type but throws parse_error (unknown_key_type) on a miss,
// reporting column as the token's position.
KeyType lex_key_type(std::string_view token, int column = -1);

// Canonical lower-case algorithm name, e.g. "ssh-ed25519".
std::string_view to_string(KeyType t);

} // namespace authkeys
