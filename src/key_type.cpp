#include "authkeys/key_type.hpp"
#include "authkeys/errors.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace authkeys {

std::optional<KeyType> find_key_type(std::string_view token){
    std::string lower(token);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    for(auto& [name, type] : kKeyTypeNames){
        if(name == lower) return type;
    }
    return std::nullopt;
}

KeyType lex_key_type(std::string_view token, int column){
    if(auto t = find_key_type(token)) return *t;
    throw parse_error::unknown_key_type(token, column);
}

std::string_view to_string(KeyType t){
    for(auto& [name, type] : kKeyTypeNames){
        if(type == t) return name;
    }
    return {};
}

} // namespace authkeys
