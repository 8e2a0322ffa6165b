#ifndef LIBJSENUM_JSERIAL_OPTIONAL_HH
#define LIBJSENUM_JSERIAL_OPTIONAL_HH

#include "jsenum/jserial.hh"
#include <boost/optional.hpp>
#include <type_traits>

namespace jsenum {

// boost::optional<> of anything that is not a named enum; optional enums
// go through optional_enum_codec instead. absent is left out when saving,
// and missing or null reads as absent.

namespace detail {

template <class AR, class T>
inline void serialize(AR &ar, boost::optional<T> &m, std::true_type) {
    if (m)
        ar & *m;
}

template <class AR, class T>
inline void serialize(AR &ar, boost::optional<T> &m, std::false_type) {
    json j;
    ar & j;
    if (!j || j.is_null()) {
        m = boost::none;
        return;
    }
    T t;
    ar & t;
    m = std::move(t);
}
} // detail

template <class AR, class T, class IsSave = typename AR::is_save,
          class Enable = typename std::enable_if<!uses_codec<boost::optional<T>>::value>::type>
inline void serialize(AR &ar, boost::optional<T> &m) {
    detail::serialize(ar, m, IsSave());
}

} // jsenum

#endif // LIBJSENUM_JSERIAL_OPTIONAL_HH
