#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <string>

#include <pagestream/config.hpp>
#include <pagestream/error.hpp>

namespace pagestream
{
std::string safe_getenv(const char *name)
{
    const char *ptr = std::getenv(name);
    if (ptr) { return std::string(ptr); }
    return "";
}

bool parse_bool_env(const char *name)
{
    std::string val = safe_getenv(name);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return val == "1" || val == "true" || val == "on";
}

int64_t parse_count(const std::string &text, const std::string &what)
{
    if (text.empty()) { throw InvalidConfiguration("empty " + what); }
    if (!std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        throw InvalidConfiguration(what + " must be a non-negative integer: " +
                                   text);
    }
    int64_t n = 0;
    for (const char c : text) {
        const int64_t d = c - '0';
        if (n > (std::numeric_limits<int64_t>::max() - d) / 10) {
            throw InvalidConfiguration(what + " out of range: " + text);
        }
        n = n * 10 + d;
    }
    return n;
}

int64_t parse_page_size(const std::string &text)
{
    const int64_t n = parse_count(text, "page size");
    if (n <= 0) {
        throw InvalidConfiguration("page size must be positive: " + text);
    }
    return n;
}

int64_t bulk_page_size_from_env(int64_t default_value)
{
    if (const char *p = std::getenv(bulk_page_size_env); p != nullptr) {
        return parse_page_size(p);
    }
    if (default_value <= 0) {
        throw InvalidConfiguration("default page size must be positive: " +
                                   std::to_string(default_value));
    }
    return default_value;
}
}  // namespace pagestream
