#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "authkeys/authkeys.hpp"
#include "authkeys/diagnostics_json.hpp"

using namespace authkeys;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path, std::ios::binary); if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str(); return true;
}

int main(int argc, char** argv){
    bool json = false;
    std::vector<std::string> files;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a == "--json") json = true;
        else files.push_back(a);
    }
    if(files.empty()){ std::cerr << "usage: authkeys_check [--json] <authorized_keys>...\n"; return 1; }

    for(auto& path : files){
        std::string src;
        if(!read_file(path, src)){ std::cerr << path << ": failed to read file\n"; return 1; }
        try {
            KeysFile f = parse_file(src);
            std::size_t keys = key_count(f);
            if(json) std::cout << "{\"file\":" << json_escape(path) << ",\"keys\":" << keys << ",\"lines\":" << f.lines.size() << "}\n";
            else std::cout << path << ": ok (" << keys << " keys, " << (f.lines.size() - keys) << " comment lines)\n";
        } catch (const file_parse_error& e) {
            if(json) std::cout << "{\"file\":" << json_escape(path) << ",\"error\":" << error_to_json(e) << "}\n";
            else std::cerr << path << ": line " << e.line_index() << ": " << e.cause()->what() << "\n";
            return 2;
        }
    }
    return 0;
}
