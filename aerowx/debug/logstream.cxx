// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Stream based logging mechanism.
 */

#include <aerowx_config.h>

#include "logstream.hxx"

#include <algorithm>
#include <cstdlib>
#include <iostream>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>

#include <aerowx/debug/LogCallback.hxx>
#include <aerowx/debug/LogEntry.hxx>
#include <aerowx/structure/exception.hxx>

namespace
{

class StderrLogCallback : public aerowx::LogCallback
{
public:
    StderrLogCallback(awDebugClass c, awDebugPriority p) : aerowx::LogCallback(c, p)
    {
    }

    bool doProcessEntry(const aerowx::LogEntry& e) override
    {
        if (!shouldLog(e.debugClass, e.debugPriority))
            return true;

        std::cerr << logstream::className(e.debugClass) << ":"
                  << logstream::priorityName(e.debugPriority) << ":"
                  << e.location() << ": " << e.message << std::endl;
        return true;
    }
};

struct NamedClass {
    const char* name;
    awDebugClass value;
};

const NamedClass debugClassNames[] = {
    {"none",    AW_NONE},
    {"general", AW_GENERAL},
    {"metar",   AW_METAR},
    {"taf",     AW_TAF},
    {"remarks", AW_REMARKS},
    {"printer", AW_PRINTER},
    {"io",      AW_IO},
    {"all",     AW_ALL},
};

} // of anonymous namespace

logstream::logstream() : m_logClass(AW_ALL),
                         m_logPriority(AEROWX_DEFAULT_LOG_PRIORITY)
{
    const char* level = std::getenv("AW_LOG_LEVEL");
    if (level) {
        try {
            m_logPriority = priorityFromString(level);
        } catch (const aw_range_exception& e) {
            std::cerr << "ignoring AW_LOG_LEVEL: " << e.getMessage() << std::endl;
        }
    }

    m_stderrCallback.reset(new StderrLogCallback(m_logClass, m_logPriority));
}

logstream::~logstream() = default;

void logstream::setLogLevels(awDebugClass c, awDebugPriority p)
{
    std::lock_guard<std::mutex> g(m_mutex);
    m_logClass = c;
    m_logPriority = p;
    m_stderrCallback->setLogLevels(c, p);
}

bool logstream::would_log(awDebugClass c, awDebugPriority p) const
{
    std::lock_guard<std::mutex> g(m_mutex);
    return (c & m_logClass) != 0 && p >= m_logPriority;
}

awDebugClass logstream::get_log_classes() const
{
    std::lock_guard<std::mutex> g(m_mutex);
    return m_logClass;
}

awDebugPriority logstream::get_log_priority() const
{
    std::lock_guard<std::mutex> g(m_mutex);
    return m_logPriority;
}

void logstream::setStderrEnabled(bool enabled)
{
    std::lock_guard<std::mutex> g(m_mutex);
    m_stderrEnabled = enabled;
}

void logstream::log(awDebugClass c, awDebugPriority p,
                    const char* fileName, int line, const char* function,
                    const std::string& msg)
{
    aerowx::LogEntry entry(c, p, fileName, line, function, msg);

    // callbacks run unlocked, they may log themselves
    std::vector<aerowx::LogCallback*> callbacks;
    {
        std::lock_guard<std::mutex> g(m_mutex);
        if (m_stderrEnabled)
            callbacks.push_back(m_stderrCallback.get());
        callbacks.insert(callbacks.end(), m_callbacks.begin(), m_callbacks.end());
    }

    for (auto cb : callbacks)
        cb->processEntry(entry);
}

void logstream::addCallback(aerowx::LogCallback* cb)
{
    std::lock_guard<std::mutex> g(m_mutex);
    m_callbacks.push_back(cb);
}

void logstream::removeCallback(aerowx::LogCallback* cb)
{
    std::lock_guard<std::mutex> g(m_mutex);
    auto it = std::find(m_callbacks.begin(), m_callbacks.end(), cb);
    if (it != m_callbacks.end())
        m_callbacks.erase(it);
}

awDebugPriority logstream::priorityFromString(const std::string& s)
{
    std::string p = boost::to_lower_copy(boost::trim_copy(s));
    if (p == "bulk" || p == "1") return AW_BULK;
    if (p == "debug" || p == "2") return AW_DEBUG;
    if (p == "info" || p == "3") return AW_INFO;
    if (p == "warn" || p == "4") return AW_WARN;
    if (p == "alert" || p == "5") return AW_ALERT;

    throw aw_range_exception("unknown log priority '" + s + "'", AW_ORIGIN);
}

awDebugClass logstream::classFromString(const std::string& s)
{
    typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
    const boost::char_separator<char> del(", ");

    int mask = AW_NONE;
    tokenizer names(s, del);
    for (const auto& n : names) {
        const std::string name = boost::to_lower_copy(n);
        auto it = std::find_if(std::begin(debugClassNames), std::end(debugClassNames),
                               [&name](const NamedClass& c) { return name == c.name; });
        if (it == std::end(debugClassNames))
            throw aw_range_exception("unknown log class '" + n + "'", AW_ORIGIN);
        mask |= it->value;
    }
    return static_cast<awDebugClass>(mask);
}

const char* logstream::priorityName(awDebugPriority p)
{
    switch (p) {
    case AW_BULK:  return "bulk";
    case AW_DEBUG: return "debug";
    case AW_INFO:  return "info";
    case AW_WARN:  return "warn";
    case AW_ALERT: return "alert";
    }
    return "unknown";
}

const char* logstream::className(awDebugClass c)
{
    for (const auto& n : debugClassNames) {
        if (n.value == c)
            return n.name;
    }
    return "mixed";
}

logstream& awlog()
{
    // constructed on first use
    static logstream global_logstream;
    return global_logstream;
}
