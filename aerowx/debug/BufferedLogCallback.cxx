// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Buffer log messages for later retrieval and display
 */

#include <aerowx_config.h>
#include <aerowx/debug/BufferedLogCallback.hxx>

#include <mutex>

namespace aerowx
{

class BufferedLogCallback::BufferedLogCallbackPrivate
{
public:
    std::mutex m_mutex;
    string_list m_buffer;
    unsigned int m_stamp;
    unsigned int m_maxLength;
};

BufferedLogCallback::BufferedLogCallback(awDebugClass c, awDebugPriority p) :
    LogCallback(c, p),
    d(new BufferedLogCallbackPrivate)
{
    d->m_stamp = 0;
    d->m_maxLength = 0xffff;
}

BufferedLogCallback::~BufferedLogCallback() = default;

void BufferedLogCallback::operator()(awDebugClass c, awDebugPriority p,
        const char* file, int line, const std::string& aMessage)
{
    if (!shouldLog(c, p)) return;

    std::lock_guard<std::mutex> g(d->m_mutex);
    if (aMessage.size() >= d->m_maxLength) {
        d->m_buffer.push_back(aMessage.substr(0, d->m_maxLength - 1));
    } else {
        d->m_buffer.push_back(aMessage);
    }
    d->m_stamp++;
}

unsigned int BufferedLogCallback::stamp() const
{
    return d->m_stamp;
}

unsigned int BufferedLogCallback::threadsafeCopy(string_list& aOutput)
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    aOutput = d->m_buffer;
    return d->m_stamp;
}

void BufferedLogCallback::truncateAt(unsigned int t)
{
    d->m_maxLength = t;
}

void BufferedLogCallback::clear()
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    d->m_buffer.clear();
    d->m_stamp++;
}

} // of namespace aerowx
