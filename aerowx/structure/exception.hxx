// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Exception classes for aerowx.
 *
 * The decoders themselves never let these escape to the caller: a METAR
 * never fails, and a TAF with a malformed header is returned as a record
 * carrying the error text. They are used between the scanning layers and
 * by the tools built on top of the library.
 */

#ifndef __AEROWX_EXCEPTION_HXX
#define __AEROWX_EXCEPTION_HXX 1

#include <exception>
#include <string>

/**
 * Information encapsulating a single location in an external resource
 *
 * A position in the resource may optionally be provided, either by
 * line number or by line number and column number.
 */
class aw_location
{
public:
    aw_location();
    explicit aw_location(const std::string& path, int line = -1, int column = -1);
    virtual ~aw_location() = default;

    const std::string& getPath() const;
    int getLine() const;
    int getColumn() const;

    bool isValid() const;

    std::string asString() const;

private:
    std::string _path;
    int _line;
    int _column;
};


/**
 * Abstract base class for all throwables.
 */
class aw_throwable : public std::exception
{
public:
    aw_throwable();
    explicit aw_throwable(const std::string& message, const std::string& origin = {});
    virtual ~aw_throwable() = default;

    virtual const std::string& getMessage() const;
    virtual std::string getFormattedMessage() const;
    virtual const std::string& getOrigin() const;
    const char* what() const noexcept override;

private:
    std::string _message;
    std::string _origin;
    mutable std::string _what;
};


/**
 * Base class for all aerowx exceptions.
 *
 * An exception is a recoverable condition: callers are expected to
 * catch the specific subclass they can deal with.
 */
class aw_exception : public aw_throwable
{
public:
    aw_exception() = default;
    explicit aw_exception(const std::string& message, const std::string& origin = {});
};


/**
 * An I/O-related exception.
 */
class aw_io_exception : public aw_exception
{
public:
    aw_io_exception() = default;
    explicit aw_io_exception(const std::string& message, const std::string& origin = {});
    aw_io_exception(const std::string& message, const aw_location& location,
                    const std::string& origin = {});

    std::string getFormattedMessage() const override;
    const aw_location& getLocation() const;

private:
    aw_location _location;
};


/**
 * A format-related exception: the text does not have the shape the
 * scanner requires. The offending text is kept for reporting.
 */
class aw_format_exception : public aw_exception
{
public:
    aw_format_exception() = default;
    aw_format_exception(const std::string& message, const std::string& text,
                        const std::string& origin = {});

    const std::string& getText() const;

private:
    std::string _text;
};


/**
 * A range-related exception, e.g. an unknown option value.
 */
class aw_range_exception : public aw_exception
{
public:
    aw_range_exception() = default;
    explicit aw_range_exception(const std::string& message, const std::string& origin = {});
};

#endif // __AEROWX_EXCEPTION_HXX
