#include "torgen/log.hpp"

#include <fstream>
#include <mutex>
#ifdef TORGEN_ENABLE_STREAM_DEBUGGING
#include <iostream>
#endif // TORGEN_ENABLE_STREAM_DEBUGGING

namespace torgen {
namespace log {
namespace detail {

#define TORGEN_FLUSH(f)                                                                  \
    do                                                                                   \
        if(f.is_open())                                                                  \
            f.flush();                                                                   \
    while(0)

/**
 * A logger writes to its own file, which is opened lazily on the first entry. Hashing
 * may be driven from several threads so every logger is thread-safe.
 */
class file_logger
{
    const char* name_;
    std::ofstream file_;
    std::mutex file_mutex_;

public:
    explicit file_logger(const char* name) : name_(name) {}

    void log(const std::string& header, const std::string& log, const priority priority);

    void flush()
    {
        std::lock_guard<std::mutex> l(file_mutex_);
        TORGEN_FLUSH(file_);
    }
};

// global logger instances

file_logger metainfo_logger("metainfo");
file_logger disk_io_logger("diskIO");

#ifndef TORGEN_MIN_LOG_PRIORITY
#define TORGEN_MIN_LOG_PRIORITY priority::low
#endif

#ifdef TORGEN_ENABLE_LOGGING

constexpr auto g_open_mode = std::ios::app | std::ios::out;

#ifndef TORGEN_LOG_PATH
#define TORGEN_LOG_PATH "."
#endif

std::string make_log_path(const std::string& name)
{
    return std::string(TORGEN_LOG_PATH) + '/' + name + "-log.txt";
}

#define TORGEN_PRIORITY_CHAR(p)                                                          \
    char(p == priority::low ? 'l' : p == priority::normal ? 'n' : 'h')

#define TORGEN_LOG(priority, stream, header, log)                                        \
    stream << '[' << TORGEN_PRIORITY_CHAR(priority) << '|' << header << "] " << log      \
           << '\n';

#ifdef TORGEN_ENABLE_STREAM_DEBUGGING
#define TORGEN_STREAM std::clog
#define TORGEN_CLOG(priority, file, header, log)                                         \
    do {                                                                                 \
        if(file.is_open()) {                                                             \
            TORGEN_LOG(priority, file, header, log);                                     \
        }                                                                                \
        TORGEN_LOG(priority, TORGEN_STREAM, header, log);                                \
    } while(0)
#else // TORGEN_ENABLE_STREAM_DEBUGGING
#define TORGEN_CLOG(p, f, h, l) TORGEN_LOG(p, f, h, l)
#endif // TORGEN_ENABLE_STREAM_DEBUGGING

#endif // TORGEN_ENABLE_LOGGING

void file_logger::log(
        const std::string& header, const std::string& log, const priority priority)
{
#ifdef TORGEN_ENABLE_LOGGING
    if(priority < TORGEN_MIN_LOG_PRIORITY) {
        return;
    }
    std::lock_guard<std::mutex> l(file_mutex_);
    if(!file_.is_open()) {
        file_.open(make_log_path(name_), g_open_mode);
    }
    TORGEN_CLOG(priority, file_, header, log);
#else
    (void)header;
    (void)log;
    (void)priority;
#endif // TORGEN_ENABLE_LOGGING
}

} // detail

void log_metainfo(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::metainfo_logger.log(header, log, priority);
}

void log_disk_io(const std::string& header, const std::string& log,
        const priority priority)
{
    detail::disk_io_logger.log(header, log, priority);
}

void flush()
{
    detail::metainfo_logger.flush();
    detail::disk_io_logger.flush();
}

} // log
} // torgen
