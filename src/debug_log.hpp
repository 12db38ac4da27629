#pragma once

#include <sstream>
#include <string>

namespace searchtree {

// Debug log to file, off unless SEARCHTREE_DEBUG_LOG names a file that can
// be opened or openDebugLog() is called. Records are "[component] message" lines.
bool debugLogEnabled();

// Truncates and opens `path`; an empty path closes the log.
// Throws std::runtime_error if the file cannot be opened.
void openDebugLog(const std::string& path);
void closeDebugLog();

// Closes the log and rereads the configured path on next use
void resetDebugLog();

void writeDebugLog(const std::string& component, const std::string& message);

}  // namespace searchtree

// Formats the message only when the log is enabled
#define SEARCHTREE_DEBUG_LOG(component, message)                              \
    do {                                                                      \
        if (::searchtree::debugLogEnabled()) {                                \
            std::ostringstream searchtree_log_oss_;                           \
            searchtree_log_oss_ << message;                                   \
            ::searchtree::writeDebugLog(component, searchtree_log_oss_.str()); \
        }                                                                     \
    } while (0)
