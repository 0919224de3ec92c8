// cursor.hpp - Zero-copy position over the text of one line
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tao/pegtl.hpp>

namespace authkeys::detail {

inline bool is_ascii_ws(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r'; }

struct cursor {
    std::string_view d;
    std::size_t p = 0;
    static constexpr std::size_t npos = std::string_view::npos;

    explicit cursor(std::string_view s) : d(s) {}

    bool eof() const { return p >= d.size(); }
    char peek() const { return eof() ? '\0' : d[p]; }
    std::string_view rest() const { return d.substr(p); }
    int column() const { return static_cast<int>(p); }

    void skip_ws() {
        while (!eof() && is_ascii_ws(d[p]))
            ++p;
    }
    void skip_char() {
        if (!eof())
            ++p;
    }

    // Offset (relative to the cursor) of the first char satisfying pred, or npos.
    template <typename Pred>
    std::size_t find_if(Pred pred) const {
        for (std::size_t i = p; i < d.size(); ++i)
            if (pred(d[i]))
                return i - p;
        return npos;
    }

    std::string_view take(std::size_t n) {
        auto out = d.substr(p, n);
        p += out.size();
        return out;
    }

    // Run Rule anchored at the cursor. On success the matched text is
    // returned and the cursor moves past it; on failure nothing moves.
    template <typename Rule>
    std::optional<std::string_view> match() {
        auto r = rest();
        tao::pegtl::memory_input<> in(r.data(), r.size(), "authorized_keys");
        if (!tao::pegtl::parse<Rule>(in))
            return std::nullopt;
        return take(static_cast<std::size_t>(in.current() - r.data()));
    }
};

} // namespace authkeys::detail
