#pragma once

/*! \file log.h
    \brief sidcore log header file.

    The library never writes diagnostics to standard output. Messages are handed
    to a callback installed by the host application; without one they are
    dropped.
*/

namespace sidcore
{
typedef enum
{
    SIDCORE_LOG_TRACE = 7,
    SIDCORE_LOG_DEBUG = 10,
    SIDCORE_LOG_INFO = 20,
    SIDCORE_LOG_WARNING = 30,
    SIDCORE_LOG_ERROR = 40,
    SIDCORE_LOG_CRITICAL = 50
} log_level_t;

// (message, level)
typedef void (*cb_log_t)(char *, int);

/*! \fn void SetLogCallback(cb_log_t)
    \brief Sets the callback receiving the library's log messages.
    \param cb A function pointer to the callback function, or nullptr to
    silence the library.
*/
void SetLogCallback(cb_log_t cb);

/*! \fn void Log(log_level_t, const char *, ...)
    \brief Formats a message printf-style and forwards it to the log callback.
    \param level The log level to use to log the message.
    \param fmt The format string.
*/
void Log(log_level_t level, const char *fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;
} // namespace sidcore
