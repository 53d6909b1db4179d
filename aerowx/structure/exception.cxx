// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include "exception.hxx"

#include <new>
#include <sstream>

////////////////////////////////////////////////////////////////////////
// Implementation of aw_location class.
////////////////////////////////////////////////////////////////////////

aw_location::aw_location()
    : _line(-1),
      _column(-1)
{
}

aw_location::aw_location(const std::string& path, int line, int column)
    : _path(path),
      _line(line),
      _column(column)
{
}

const std::string&
aw_location::getPath() const
{
    return _path;
}

int aw_location::getLine() const
{
    return _line;
}

int aw_location::getColumn() const
{
    return _column;
}

bool aw_location::isValid() const
{
    return !_path.empty();
}

std::string
aw_location::asString() const
{
    std::ostringstream out;
    if (!_path.empty()) {
        out << _path;
        if (_line != -1 || _column != -1)
            out << ",\n";
    }
    if (_line != -1) {
        out << "line " << _line;
        if (_column != -1)
            out << ", ";
    }
    if (_column != -1) {
        out << "column " << _column;
    }
    return out.str();
}


////////////////////////////////////////////////////////////////////////
// Implementation of aw_throwable class.
////////////////////////////////////////////////////////////////////////

aw_throwable::aw_throwable() = default;

aw_throwable::aw_throwable(const std::string& message, const std::string& origin)
    : _message(message),
      _origin(origin)
{
}

const std::string&
aw_throwable::getMessage() const
{
    return _message;
}

std::string
aw_throwable::getFormattedMessage() const
{
    return getMessage();
}

const std::string&
aw_throwable::getOrigin() const
{
    return _origin;
}

const char*
aw_throwable::what() const noexcept
{
    try {
        _what = getFormattedMessage();
        return _what.c_str();
    } catch (const std::bad_alloc&) {
        return _message.c_str();
    }
}


////////////////////////////////////////////////////////////////////////
// Implementation of aw_exception.
////////////////////////////////////////////////////////////////////////

aw_exception::aw_exception(const std::string& message, const std::string& origin)
    : aw_throwable(message, origin)
{
}


////////////////////////////////////////////////////////////////////////
// Implementation of aw_io_exception.
////////////////////////////////////////////////////////////////////////

aw_io_exception::aw_io_exception(const std::string& message, const std::string& origin)
    : aw_exception(message, origin)
{
}

aw_io_exception::aw_io_exception(const std::string& message,
                                 const aw_location& location,
                                 const std::string& origin)
    : aw_exception(message, origin),
      _location(location)
{
}

std::string
aw_io_exception::getFormattedMessage() const
{
    std::string ret = getMessage();
    if (_location.isValid()) {
        ret += "\n at ";
        ret += _location.asString();
    }
    return ret;
}

const aw_location&
aw_io_exception::getLocation() const
{
    return _location;
}


////////////////////////////////////////////////////////////////////////
// Implementation of aw_format_exception and aw_range_exception.
////////////////////////////////////////////////////////////////////////

aw_format_exception::aw_format_exception(const std::string& message,
                                         const std::string& text,
                                         const std::string& origin)
    : aw_exception(message, origin),
      _text(text)
{
}

const std::string&
aw_format_exception::getText() const
{
    return _text;
}

aw_range_exception::aw_range_exception(const std::string& message,
                                       const std::string& origin)
    : aw_exception(message, origin)
{
}
