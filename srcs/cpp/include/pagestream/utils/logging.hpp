#pragma once
#include <cstdio>

namespace pagestream
{
constexpr const char *log_env = "PAGESTREAM_LOG";

// PAGESTREAM_LOG is read on first use only
bool log_enabled();

void write_log(const char *msg);

template <typename... Args>
void log_fmt(const char *format, const Args &... args)
{
    if (!log_enabled()) { return; }
    char line[1 << 10];
    std::snprintf(line, sizeof(line), format, args...);
    write_log(line);
}
}  // namespace pagestream
