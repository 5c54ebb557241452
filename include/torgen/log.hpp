#ifndef TORGEN_LOG_HEADER
#define TORGEN_LOG_HEADER

#include <string>

namespace torgen {
namespace log {

enum class priority
{
    low,
    normal,
    high
};

/** Logs the progress of assembling a metainfo (enumeration, hashing, encoding). */
void log_metainfo(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
/** Logs file reads. */
void log_disk_io(const std::string& header, const std::string& log,
        const priority priority = priority::normal);

/**
 * Call this in a SIGABRT handler so that even when an assertion fires, everything
 * buffered is written to disk.
 */
void flush();

} // log
} // torgen

#endif // TORGEN_LOG_HEADER
