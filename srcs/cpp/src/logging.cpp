#include <ctime>
#include <mutex>
#include <sstream>
#include <thread>

#include <pagestream/config.hpp>
#include <pagestream/utils/logging.hpp>
#include <pagestream/utils/trace.hpp>
#include <unistd.h>

DEFINE_TRACE_CONTEXTS;

namespace pagestream
{
bool log_enabled()
{
    static const bool enabled = parse_bool_env(log_env);
    return enabled;
}

void write_log(const char *msg)
{
    static std::mutex mu;

    thread_local std::thread::id tid = std::this_thread::get_id();
    std::stringstream ss;
    ss << "[pagestream] " << getpid() << ' ' << tid << ' '
       << std::time(nullptr) << ' ' << msg;
    {
        std::lock_guard<std::mutex> _lk(mu);
        std::fprintf(stderr, "%s\n", ss.str().c_str());
    }
}
}  // namespace pagestream
