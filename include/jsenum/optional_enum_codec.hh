#ifndef LIBJSENUM_OPTIONAL_ENUM_CODEC_HH
#define LIBJSENUM_OPTIONAL_ENUM_CODEC_HH

#include "jsenum/enum_codec.hh"
#include <boost/optional.hpp>

namespace jsenum {

//! boost::optional<enum> <-> JSON string or null
//
//! absent is written as null. on read, null, a missing field and ""
//! all mean absent; some producers send "" instead of null.
template <class E>
class optional_enum_codec : public value_codec<boost::optional<E>> {
    enum_codec<E> _codec;

public:
    explicit optional_enum_codec(enum_codec<E> codec)
        : _codec(std::move(codec)) {}

    json write(const boost::optional<E> &v) const override {
        if (!v)
            return json::null();
        return _codec.write(*v);
    }

    boost::optional<E> read(const json &j) const override {
        if (!j || j.is_null())
            return boost::none;
        if (!j.is_string())
            throw malformed_value(_codec.table().type_name(), j.dump());
        if (j.str().empty())
            return boost::none;
        return _codec.read(j);
    }
};

} // jsenum

#endif // LIBJSENUM_OPTIONAL_ENUM_CODEC_HH
