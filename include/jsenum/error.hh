#ifndef LIBJSENUM_ERROR_HH
#define LIBJSENUM_ERROR_HH

#include <exception>
#include <memory>
#include <sstream>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <typeinfo>
#include <utility>
#include <string.h>
#include <jsenum/logging.hh>

namespace jsenum {

//! construct a what() string in printf() format
class errorx : public std::exception {
protected:
    static constexpr size_t _bufsize = 256;
    char _buf[_bufsize];

    void init(const char *msg, size_t len);
    void initf(const char *fmt, ...) __attribute__((format (printf, 2, 3)));

    errorx() { _buf[0] = '\0'; }

public:
    errorx(const std::string &msg) { init(msg.data(), msg.size()); }
    errorx(const char *msg)        { init(msg, strlen(msg)); }

    //! \param fmt printf-style format string
    template <typename A, typename... Args>
    errorx(const char *fmt, A &&a, Args&&... args) { initf(fmt, std::forward<A>(a), std::forward<Args>(args)...); }

    //! \return a string describing the error
    const char *what() const noexcept override { return _buf; }
};

//! a value could not be converted by a codec
//
//! what() reads "<field>: <kind> for <type>: <value>"; the field part is
//! filled in by the loader as the error passes each named field
class codec_error : public errorx {
    std::string _type;
    std::string _value;
    std::string _field;
    std::string _what;
    const char *_kind;

    void refresh();

protected:
    codec_error(const char *kind, std::string type, std::string value);

public:
    const std::string &type_name() const { return _type; }
    //! offending value rendered as JSON
    const std::string &value() const     { return _value; }
    //! dotted path of the field being read, empty at the top level
    const std::string &field() const     { return _field; }

    //! prefix the field path with an enclosing key
    void within(const std::string &key);

    const char *what() const noexcept override { return _what.c_str(); }
};

//! the JSON token kind is not one the codec accepts
class malformed_value : public codec_error {
public:
    malformed_value(std::string type, std::string value)
        : codec_error("malformed value", std::move(type), std::move(value)) {}
};

//! a non-empty string that names no member of the enum
class unknown_enum_member : public codec_error {
public:
    unknown_enum_member(std::string type, std::string value)
        : codec_error("unknown enum member", std::move(type), std::move(value)) {}
};

//! conveniently create an errorx with stream output

enum endx_t { endx };

template <class Exception>
class error_stream {
    std::unique_ptr<std::ostringstream> _os;

public:
    error_stream()                     : _os(new std::ostringstream) {}
    error_stream(error_stream &&other) : _os(std::move(other._os))   {}
    ~error_stream()                    { if (_os) LOG(FATAL) << "error_stream<" << typeid(Exception).name() << "> missing endx"; }

    error_stream(const error_stream &) = delete;
    error_stream & operator = (const error_stream &) = delete;
    error_stream & operator = (error_stream &&) = delete;

    template <class T>
    error_stream & operator << (const T &t) {
        if (_os) *_os << t;
        return *this;
    }
    void operator << (endx_t) {
        if (_os) {
            auto os = std::move(_os);
            throw Exception(os->str());
        }
    }
};

template <class Exception = errorx>
inline error_stream<Exception> throw_stream() { return error_stream<Exception>(); }

} // end namespace jsenum

#endif // LIBJSENUM_ERROR_HH
