// SPDX-License-Identifier: LGPL-2.1-or-later

#pragma once

#include <string>

#include "debug_types.h"

namespace aerowx {
/**
 * storage of a single log entry. Entries are handed to every registered
 * LogCallback, and copied by the buffering callback.
 */
class LogEntry final
{
public:
    LogEntry(awDebugClass c, awDebugPriority p,
             const char* file, int line, const char* function,
             const std::string& msg)
    :
    debugClass(c),
    debugPriority(p),
    file(file),
    line(line),
    function(function),
    message(msg)
    {
    }

    LogEntry(const LogEntry& c);
    LogEntry& operator=(const LogEntry& c) = delete;

    ~LogEntry() = default;    // non-virtual is intentional

    /// "file:line" of the originating AW_LOG, without the directory part
    std::string location() const;

    const awDebugClass debugClass;
    const awDebugPriority debugPriority;
    const char* file;
    const int line;
    const char* function;
    const std::string message;
};

} // namespace aerowx
