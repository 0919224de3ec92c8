#include "authkeys/diagnostics_json.hpp"
#include "authkeys/env.hpp"
#include <sstream>
#include <cstdio>

namespace authkeys {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string error_to_json(const parse_error& e){
    std::ostringstream os;
    os<<"{\"code\":"<<json_escape(std::string(e.code()))
      <<",\"kind\":"<<json_escape(std::string(kind_name(e.kind())))
      <<",\"message\":"<<json_escape(e.what())
      <<",\"column\":"<<e.column();
    if(auto* fe = dynamic_cast<const file_parse_error*>(&e)) os<<",\"line\":"<<fe->line_index();
    os<<",\"cause\":";
    if(e.cause()) os<<error_to_json(*e.cause());
    else os<<"null";
    os<<"}";
    return os.str();
}

std::string result_to_json(const ParseResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false");
    if(r.success){
        os<<",\"lines\":"<<r.file.lines.size()
          <<",\"keys\":"<<key_count(r.file);
    } else {
        os<<",\"code\":"<<json_escape(r.code)
          <<",\"message\":"<<json_escape(r.error_message)
          <<",\"line\":"<<r.line
          <<",\"column\":"<<r.column;
    }
    os<<"}";
    return os.str();
}

void maybe_print_json(const ParseResult& r){
    if(detect_env().diagJson){
        auto js=result_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace authkeys
