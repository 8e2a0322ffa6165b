#include "jsenum/json.hh"
#include "jsenum/error.hh"
#include <sstream>
#include <limits>
#include <typeinfo>

namespace jsenum {
using namespace std;


//----------------------------------------------------------------
// to/from JSON strings and streams
//

extern "C" {
static int ostream_json_dump_callback(const char *buffer, size_t size, void *osptr) {
    ostream *o = reinterpret_cast<ostream *>(osptr);
    o->write(buffer, size);
    return 0;
}
} // "C"

void dump(ostream &o, const json_t *j, unsigned flags) {
    if (j)
        json_dump_callback(j, ostream_json_dump_callback, &o, flags);
}

string json::dump(unsigned flags) const {
    ostringstream ss;
    if (_p)
        json_dump_callback(_p.get(), ostream_json_dump_callback, static_cast<ostream *>(&ss), flags);
    return ss.str();
}

json json::load(const char *s, size_t len, unsigned flags) {
    json_error_t err;
    json j(json_loadb(s, len, flags, &err), json_take);
    if (!j)
        throw errorx("%s at line %d column %d", err.text, err.line, err.column);
    return j;
}

//
// metaprogramming for conversions
//

namespace impl {

// json -> string

template <> string json_traits_conv<string>::cast(const json &j) {
    if (!j.is_string()) throw errorx("not string: %s", j.dump().c_str());
    return j.str();
}

// json -> integral types

template <class T> inline T integral_cast(const json &j) {
    if (!j.is_integer()) throw errorx("not integral: %s", j.dump().c_str());
    const auto i = j.integer();
    constexpr auto
        lowest    = std::numeric_limits<T>::min(),
        highest   = std::numeric_limits<T>::max();
    if (i < (long long)lowest || (highest <= (unsigned long long)LLONG_MAX && i > (long long)highest))
        throw errorx("%lld: out of range for %s", i, typeid(T).name());
    return static_cast<T>(i);
}
template <> int            json_traits_conv<int           >::cast(const json &j) { return integral_cast<int           >(j); }
template <> long long      json_traits_conv<long long     >::cast(const json &j) { return integral_cast<long long     >(j); }
template <> unsigned       json_traits_conv<unsigned      >::cast(const json &j) { return integral_cast<unsigned      >(j); }

// json real; integers are accepted since encoders drop a trailing .0

template <> double json_traits_conv<double>::cast(const json &j) {
    if (!j.is_number()) throw errorx("not real: %s", j.dump().c_str());
    return json_number_value(j.get());
}

// json boolean

template <> bool json_traits_conv<bool>::cast(const json &j) {
    if (!j.is_boolean()) throw errorx("not boolean: %s", j.dump().c_str());
    return j.boolean();
}

} // end impl

} // end namespace jsenum
