#include "jsenum/error.hh"

#include <algorithm>
#include <utility>

namespace jsenum {

void errorx::init(const char *msg, size_t len) {
    len = std::min(len, _bufsize - 1);
    memcpy(_buf, msg, len);
    _buf[len] = 0;
}

void errorx::initf(const char *fmt, ...) {
    _buf[0] = 0;
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(_buf, _bufsize, fmt, ap);
    va_end(ap);
}

codec_error::codec_error(const char *kind, std::string type, std::string value)
    : _type(std::move(type)), _value(std::move(value)), _kind(kind)
{
    refresh();
}

void codec_error::within(const std::string &key) {
    if (_field.empty())
        _field = key;
    else
        _field = key + "." + _field;
    refresh();
}

void codec_error::refresh() {
    std::ostringstream ss;
    if (!_field.empty())
        ss << _field << ": ";
    ss << _kind << " for " << _type << ": " << (_value.empty() ? "<missing>" : _value);
    _what = ss.str();
    // keep the printf buffer in step for code that reads errorx directly
    init(_what.data(), _what.size());
}

} // end namespace jsenum
