#include "stdafx.h"
#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace sidcore
{
namespace
{
std::atomic<cb_log_t> cb_log{nullptr};
}

void SetLogCallback(cb_log_t cb)
{
    cb_log.store(cb);
}

void Log(log_level_t level, const char *fmt, ...)
{
    cb_log_t cb = cb_log.load();
    if (cb == nullptr)
    {
        return;
    }

    char buf[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    cb(buf, level);
}
} // namespace sidcore
