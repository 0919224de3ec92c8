#pragma once

// Test-only helper: set an environment variable for the lifetime of a scope
// and restore the previous value afterwards (so AUTHKEYS_* gating can be
// exercised without leaking into other tests).

#include <optional>
#include <string>

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> saved_;
};
