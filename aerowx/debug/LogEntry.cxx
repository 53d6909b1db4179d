// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include "LogEntry.hxx"

#include <cstring>

namespace aerowx {

LogEntry::LogEntry(const LogEntry& c) : debugClass(c.debugClass),
                                        debugPriority(c.debugPriority),
                                        file(c.file),
                                        line(c.line),
                                        function(c.function),
                                        message(c.message)
{
}

std::string LogEntry::location() const
{
    if (!file)
        return {};

    const char* base = strrchr(file, '/');
    base = base ? base + 1 : file;
    return std::string{base} + ":" + std::to_string(line);
}

} // namespace aerowx
