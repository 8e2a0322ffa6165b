#ifndef LIBJSENUM_CODEC_HH
#define LIBJSENUM_CODEC_HH

#include "jsenum/json.hh"

namespace jsenum {

//! converts one declared field type to and from a single JSON token
//
//! the host archive owns the structure around the token (objects, keys);
//! a codec only ever sees the value
template <class T>
class value_codec {
public:
    using value_type = T;

    virtual ~value_codec() {}

    virtual json write(const T &v) const = 0;
    //! \param j the token, or an empty json when the field is missing
    virtual T read(const json &j) const = 0;
};

} // jsenum

#endif // LIBJSENUM_CODEC_HH
