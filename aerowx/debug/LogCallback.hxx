// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Base class for log callbacks
 */

#pragma once

#include <string>

#include "LogEntry.hxx"
#include "debug_types.h"

namespace aerowx {

class LogCallback
{
public:
    virtual ~LogCallback() = default;

    // return true if you handled the entry, otherwise the message
    // operator below will be called
    virtual bool doProcessEntry(const LogEntry& e);

    virtual void operator()(awDebugClass c, awDebugPriority p,
                            const char* file, int line, const std::string& aMessage);

    void setLogLevels(awDebugClass c, awDebugPriority p);

    void processEntry(const LogEntry& e);

protected:
    LogCallback(awDebugClass c, awDebugPriority p);

    bool shouldLog(awDebugClass c, awDebugPriority p) const;
private:
    awDebugClass m_class;
    awDebugPriority m_priority;
};


} // namespace aerowx
