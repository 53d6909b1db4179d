// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Stream based logging mechanism.
 */

#ifndef _AW_LOGSTREAM_HXX
#define _AW_LOGSTREAM_HXX

#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <aerowx/debug/debug_types.h>

namespace aerowx
{

class LogCallback;
class LogEntry;

} // namespace aerowx

/**
 * Class to manage the debug logging stream.
 */
class logstream
{
public:
    ~logstream();

    /**
     * Set the global log class and priority level.
     * @param c debug class
     * @param p priority
     */
    void setLogLevels(awDebugClass c, awDebugPriority p);

    bool would_log(awDebugClass c, awDebugPriority p) const;

    awDebugClass get_log_classes() const;

    awDebugPriority get_log_priority() const;

    /**
     * Enable or disable the built-in stderr sink. Callbacks added with
     * addCallback() are unaffected.
     */
    void setStderrEnabled(bool enabled);

    /**
     * the core logging method
     */
    void log(awDebugClass c, awDebugPriority p,
             const char* fileName, int line, const char* function,
             const std::string& msg);

    /**
     * register a callback. The stream does not take ownership, the caller
     * must call removeCallback() before destroying it.
     */
    void addCallback(aerowx::LogCallback* cb);

    void removeCallback(aerowx::LogCallback* cb);

    /**
     * Convert a priority name ("bulk", "debug", "info", "warn", "alert")
     * or number (1-5) to the priority value. Throws aw_range_exception
     * for anything else.
     */
    static awDebugPriority priorityFromString(const std::string& s);

    /**
     * Convert a comma separated list of class names ("metar,taf") to
     * the class mask. "all" and "none" are accepted. Throws
     * aw_range_exception for unknown names.
     */
    static awDebugClass classFromString(const std::string& s);

    static const char* priorityName(awDebugPriority p);

    static const char* className(awDebugClass c);

private:
    friend logstream& awlog();

    logstream();

    mutable std::mutex m_mutex;
    std::vector<aerowx::LogCallback*> m_callbacks;
    std::unique_ptr<aerowx::LogCallback> m_stderrCallback;
    bool m_stderrEnabled = true;
    awDebugClass m_logClass;
    awDebugPriority m_logPriority;
};

/**
 * \relates logstream
 * Return the one and only logstream instance.
 * We use a function instead of a global object so we are assured that
 * the stream is initialised before its first use.
 */
logstream& awlog();


/** \def AW_LOG(C,P,M)
 * Log a message.
 * @param C debug class
 * @param P priority
 * @param M message, anything that can be streamed to an ostream
 */
#define AW_LOGX(C,P,M) \
    do { if(awlog().would_log(C,P)) {                                  \
        std::ostringstream os; os << M;                                \
        awlog().log(C, P, __FILE__, __LINE__, __func__, os.str());     \
    } } while(0)

#define AW_LOG(C,P,M) AW_LOGX(C,P,M)

#define AW_ORIGIN __FILE__ ":" AW_STRINGIZE(__LINE__)
#define AW_STRINGIZE(X) AW_DO_STRINGIZE(X)
#define AW_DO_STRINGIZE(X) #X

#endif // _AW_LOGSTREAM_HXX
