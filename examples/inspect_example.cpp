// Walk a parsed authorized_keys document and print one summary line per entry.
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>
#include "authkeys/authkeys.hpp"

using namespace authkeys;

int main(){
    const char* src = R"KEYS(# deploy keys
restrict,command="/usr/bin/rrsync -ro /srv/www" ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIGgqo1o+dOHqeIc7A5MG53s5iYwpMQm7f3hnn+uxtHUM deploy@ci

from="10.0.0.0/8",no-pty SSH-RSA AAAAtHUM ops
)KEYS";

    KeysFile f;
    try {
        f = parse_file(src);
    } catch (const file_parse_error& e) {
        std::cerr << "line " << e.line_index() << ": " << e.what() << "\n";
        return 1;
    }

    for(auto& l : f.lines){
        std::visit([](auto&& entry){
            using T = std::decay_t<decltype(entry)>;
            if constexpr(std::is_same_v<T, CommentLine>){
                std::cout << "comment: '" << entry.text << "'\n";
            } else {
                std::cout << "key: " << to_string(entry.key.key_type) << " (" << entry.key.encoded_key.size() << " chars)";
                for(auto& o : entry.options){
                    std::cout << " [" << o.name;
                    if(o.value) std::cout << "=" << *o.value;
                    std::cout << "]";
                }
                if(!entry.comments.empty()) std::cout << " # " << entry.comments;
                std::cout << "\n";
            }
        }, l);
    }
    return 0;
}
