#include "authkeys/authkeys.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_parse; size_t lines; size_t keys; };

static RunResult bench_case(const char* name, const std::string &text){
    auto t0 = Clock::now();
    authkeys::KeysFile f;
    try {
        f = authkeys::parse_file(text);
    } catch (const authkeys::parse_error& e) {
        std::cerr << "[bench] case '" << name << "' failed: " << e.what() << "\n";
        return {0.0, 0, 0};
    }
    auto t1 = Clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    return { ms, f.lines.size(), authkeys::key_count(f) };
}

static std::string repeat_lines(const std::string& line, int n){
    std::string out; out.reserve(line.size() * n + n);
    for(int i=0;i<n;++i){ out += line; out += '\n'; }
    return out;
}

int main(){
    const std::string key = "AAAAC3NzaC1lZDI1NTE5AAAAIGgqo1o+dOHqeIc7A5MG53s5iYwpMQm7f3hnn+uxtHUM";
    struct Case { const char* name; std::string text; };
    std::vector<Case> cases;

    // Case 1: plain keys, the optionless path succeeds on the first try
    cases.push_back({"plain", repeat_lines("ssh-ed25519 " + key + " user@host", 20000)});
    // Case 2: option lists force the fallback path on every line
    cases.push_back({"options", repeat_lines("no-agent-forwarding,command=\"echo \\\"hi\\\"\",from=\"10.0.0.0/8\" ssh-ed25519 " + key + " ci", 20000)});
    // Case 3: mostly comments
    cases.push_back({"comments", repeat_lines("# rotated 2024-01-01", 20000)});

    for(auto& c : cases){
        auto r = bench_case(c.name, c.text);
        std::cout << "[bench] " << c.name << ": " << r.ms_parse << " ms, " << r.lines << " lines, " << r.keys << " keys\n";
    }
    return 0;
}
