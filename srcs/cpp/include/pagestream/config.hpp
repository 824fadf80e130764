#pragma once
#include <cstdint>
#include <string>

namespace pagestream
{
constexpr int64_t default_bulk_page_size = 5000;

constexpr const char *bulk_page_size_env = "PAGESTREAM_BULK_PAGE_SIZE";

// returns "" if name is not set
std::string safe_getenv(const char *name);

bool parse_bool_env(const char *name);

// throws InvalidConfiguration unless text is a non-negative decimal integer,
// what names the value in the error message
int64_t parse_count(const std::string &text, const std::string &what);

// throws InvalidConfiguration unless text is a positive decimal integer
int64_t parse_page_size(const std::string &text);

int64_t bulk_page_size_from_env(int64_t default_value = default_bulk_page_size);
}  // namespace pagestream
