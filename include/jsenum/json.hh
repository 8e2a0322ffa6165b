#ifndef LIBJSENUM_JSON_HH
#define LIBJSENUM_JSON_HH

#include <jansson.h>
#include <string.h>
#include <string>
#include <ostream>
#include <type_traits>
#include <initializer_list>
#include <utility>

#include <limits.h>
#ifndef JSON_INTEGER_IS_LONG_LONG
# error Y2038
#endif

namespace jsenum {

//----------------------------------------------------------------
// streams meet json_t (just barely)
//

void dump(std::ostream &o, const json_t *j, unsigned flags = JSON_ENCODE_ANY);


//----------------------------------------------------------------
// json_ptr ... like shared_ptr but only for Jansson's json_t
// not generally for application use; prefer 'json' type
//

enum json_take_t { json_take };

namespace impl {

class json_ptr {
private:
    json_t *p;

public:
    json_ptr()                          : p() {}
    explicit json_ptr(json_t *j)        : p(json_incref(j)) {}
    json_ptr(json_t *j, json_take_t)    : p(j) {}
    ~json_ptr()                         { json_decref(p); }

    json_ptr(              const json_ptr  &jp) : p(json_incref(jp.get())) {}
    json_ptr(                    json_ptr &&jp) : p(jp.release())          {}
    json_ptr & operator = (const json_ptr  &jp) { reset(jp.get());    return *this; }
    json_ptr & operator = (      json_ptr &&jp) { take(jp.release()); return *this; }

    // boolean truth === has json_t of any type
    explicit operator bool () const { return get(); }

    void reset(json_t *j)  { take(json_incref(j)); }
    void take(json_t *j)   { json_decref(p); p = j; }

    json_t * operator -> () const { return p; }
    json_t *get() const           { return p; }
    json_t *release()             { auto j = p; p = nullptr; return j; }
};

} // impl


//----------------------------------------------------------------
// type-safe convenient json_t access
//

// json_type plus a value for "no json_t at all", which is how a missing
// object field shows up
enum jsenum_json_type {
    JSENUM_JSON_OBJECT  = ::JSON_OBJECT,
    JSENUM_JSON_ARRAY   = ::JSON_ARRAY,
    JSENUM_JSON_STRING  = ::JSON_STRING,
    JSENUM_JSON_INTEGER = ::JSON_INTEGER,
    JSENUM_JSON_REAL    = ::JSON_REAL,
    JSENUM_JSON_TRUE    = ::JSON_TRUE,
    JSENUM_JSON_FALSE   = ::JSON_FALSE,
    JSENUM_JSON_NULL    = ::JSON_NULL,
    JSENUM_JSON_INVALID = -1
};

//! represent JSON values
class json {
private:
    using json_ptr = impl::json_ptr;
    json_ptr _p;

    json_t *_o_get() {
        if (!_p)
            _p.take(json_object());
        return get();
    }

public:
    json()                                     : _p()                 {}
    json(const json  &js)                      : _p(js._p)            {}
    json(      json &&js)                      : _p(std::move(js._p)) {}
    explicit json(json_t *j)                   : _p(j)                {}
             json(json_t *j, json_take_t t)    : _p(j, t)             {}
    json & operator = (const json  &js)        { _p = js._p;            return *this; }
    json & operator = (      json &&js)        { _p = std::move(js._p); return *this; }

    json(const char *s)                        : _p(json_string(s),                 json_take) {}
    json(const std::string &s)                 : _p(json_stringn(s.data(), s.size()), json_take) {}
    json(int i)                                : _p(json_integer(i),                json_take) {}
    json(long i)                               : _p(json_integer(i),                json_take) {}
    json(long long i)                          : _p(json_integer(i),                json_take) {}
    json(unsigned u)                           : _p(json_integer(u),                json_take) {}
    json(double r)                             : _p(json_real(r),                   json_take) {}
    json(bool b)                               : _p(b ? json_true() : json_false(), json_take) {}

    static json object()                   { return json(json_object(),   json_take); }
    static json array()                    { return json(json_array(),    json_take); }
    static json str(const char *s)         { return json(s); }
    static json str(const std::string &s)  { return json(s); }
    static json null()                     { return json(json_null(),     json_take); }

    // default to building objects, they're more common
    json(std::initializer_list<std::pair<const char *, json>> init)
        : _p(json_object(), json_take)
    {
        for (const auto &kv : init)
            set(kv.first, kv.second);
    }

    json_t *get() const                        { return _p.get(); }

    // boolean truth === has json_t of any type
    explicit operator bool () const            { return get(); }

    friend bool operator == (const json &lhs, const json &rhs) {
        // jansson doesn't think null pointers are equal
        const auto jl = lhs.get();
        const auto jr = rhs.get();
        return (!jl && !jr) || json_equal(jl, jr);
    }
    friend bool operator != (const json &lhs, const json &rhs) {
        return !(lhs == rhs);
    }

    // parse and output

    static json load(const std::string &s, unsigned flags = JSON_DECODE_ANY)  { return load(s.data(), s.size(), flags); }
    static json load(const char *s, unsigned flags = JSON_DECODE_ANY)    { return load(s, strlen(s), flags); }
    static json load(const char *s, size_t len, unsigned flags);

    std::string dump(unsigned flags = JSON_ENCODE_ANY) const;

    friend std::ostream & operator << (std::ostream &o, const json &j) {
        jsenum::dump(o, j.get());
        return o;
    }

    // type access

    jsenum_json_type type() const { json_t *j = get(); return j ? (jsenum_json_type)json_typeof(j) : JSENUM_JSON_INVALID; }
    bool is_object()     const  { return json_is_object(get()); }
    bool is_array()      const  { return json_is_array(get()); }
    bool is_string()     const  { return json_is_string(get()); }
    bool is_integer()    const  { return json_is_integer(get()); }
    bool is_number()     const  { return json_is_number(get()); }
    bool is_boolean()    const  { return json_is_boolean(get()); }
    bool is_null()       const  { return json_is_null(get()); }

    // scalar access

    std::string str()    const  { return std::string(json_string_value(get()), json_string_length(get())); }
    json_int_t integer() const  { return json_integer_value(get()); }
    bool boolean()       const  { return json_is_true(get()); }

    // object access

    template <class Key>
    json operator [] (Key &&key) const      { return get(std::forward<Key>(key)); }

    size_t osize() const                               { return      json_object_size(   get());                       }
    json get(   const char *key)            const      { return json(json_object_get(    get(), key));                 }
    json get(   const std::string &key)     const      { return json(json_object_get(    get(), key.c_str()));         }
    bool set(   const char *key,        const json &j) { return     !json_object_set( _o_get(), key,         j.get()); }
    bool set(   const std::string &key, const json &j) { return     !json_object_set( _o_get(), key.c_str(), j.get()); }

    size_t asize() const                               { return      json_array_size(   get());              }
    json get(         size_t i)             const      { return json(json_array_get(    get(), i));          }
    bool push(                   const json &aj)       { return     !json_array_append( get(),    aj.get()); }
};


//----------------------------------------------------------------
// metaprogramming
//
// ends:
//   make_json(T)    -> json
//   json_cast<T>(j) -> T
//
// means:
//   json_traits<T>
//

// default = failure: conversions do not work for unspecified types,
// which includes every enum; those go through the codecs

template <class T> struct json_traits {
    typedef T type;
    static constexpr bool can_make = false;    // trait<T>::make() -> json works
    static constexpr bool can_cast = false;    // trait<T>::cast() -> T    works
};

namespace impl {
template <class T> struct json_traits_conv {
    typedef T type;
    static constexpr bool can_make = true;
    static constexpr bool can_cast = true;

    static json make(T t)  { return json(t); }
    static T cast(const json &j);               // see json.cc
};
} // impl

template <> struct json_traits<json> : impl::json_traits_conv<json> {
    static json make(const json  &j)  { return j; }
    static json cast(const json  &j)  { return j; }
};

template <> struct json_traits<std::string> : impl::json_traits_conv<std::string> {
    static json make(const std::string &s)  { return json(s); }
};

template <> struct json_traits<int           > : impl::json_traits_conv<int           > {};
template <> struct json_traits<long long     > : impl::json_traits_conv<long long     > {};
template <> struct json_traits<unsigned      > : impl::json_traits_conv<unsigned      > {};
template <> struct json_traits<double        > : impl::json_traits_conv<double        > {};
template <> struct json_traits<bool          > : impl::json_traits_conv<bool          > {};

template <class T>
inline typename std::enable_if<json_traits<T>::can_make, json>::type
make_json(const T &t) {
    return json_traits<T>::make(t);
}

// json_cast<> function, a la lexical_cast<>

template <class T>
inline typename std::enable_if<json_traits<T>::can_cast, T>::type
json_cast(const json &j) {
    return json_traits<T>::cast(j);
}

} // jsenum

#endif // LIBJSENUM_JSON_HH
