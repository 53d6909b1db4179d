// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Base class for log callbacks
 */

#include <aerowx_config.h>

#include "LogCallback.hxx"

using namespace aerowx;

LogCallback::LogCallback(awDebugClass c, awDebugPriority p) : m_class(c),
                                                              m_priority(p)
{
}

void LogCallback::operator()(awDebugClass c, awDebugPriority p,
                             const char* file, int line, const std::string& aMessage)
{
    // override me
}

bool LogCallback::doProcessEntry(const LogEntry& e)
{
    return false;
}

void LogCallback::processEntry(const LogEntry& e)
{
    if (doProcessEntry(e))
        return; // derived class handled the whole entry

    (*this)(e.debugClass, e.debugPriority, e.file, e.line, e.message);
}


bool LogCallback::shouldLog(awDebugClass c, awDebugPriority p) const
{
    return (c & m_class) != 0 && p >= m_priority;
}

void LogCallback::setLogLevels(awDebugClass c, awDebugPriority p)
{
    m_priority = p;
    m_class = c;
}
