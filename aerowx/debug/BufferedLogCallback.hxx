// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Buffer log messages for later retrieval and display
 */

#ifndef AW_DEBUG_BUFFEREDLOGCALLBACK_HXX
#define AW_DEBUG_BUFFEREDLOGCALLBACK_HXX

#include <memory> // for std::unique_ptr
#include <string>
#include <vector>

#include <aerowx/debug/LogCallback.hxx>

namespace aerowx
{

class BufferedLogCallback : public LogCallback
{
public:
    BufferedLogCallback(awDebugClass c, awDebugPriority p);
    virtual ~BufferedLogCallback();

    /// truncate messages longer than a certain length
    void truncateAt(unsigned int);

    void operator()(awDebugClass c, awDebugPriority p,
        const char* file, int line, const std::string& aMessage) override;

    /**
     * read the stamp value associated with the log buffer. This is
     * incremented whenever the log contents change, so can be used
     * to poll for changes.
     */
    unsigned int stamp() const;

    typedef std::vector<std::string> string_list;

    /**
     * copy the buffered log data into the provided output list
     * (which will be cleared first). This method is safe to call from
     * any thread.
     *
     * returns the stamp value of the copied data
     */
    unsigned int threadsafeCopy(string_list& aOutput);

    /// drop all buffered messages, the stamp keeps counting
    void clear();
private:
    class BufferedLogCallbackPrivate;
    std::unique_ptr<BufferedLogCallbackPrivate> d;
};


} // of namespace aerowx

#endif // of AW_DEBUG_BUFFEREDLOGCALLBACK_HXX
