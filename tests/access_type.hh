#ifndef JSENUM_TESTS_ACCESS_TYPE_HH
#define JSENUM_TESTS_ACCESS_TYPE_HH

#include "jsenum/enum_traits.hh"
#include "jsenum/jserial.hh"
#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>
#include <ostream>

enum class access_type { Read, Write, Admin };

namespace jsenum {
template <> struct enum_traits<access_type> : named_enum<access_type> {
    static const char *type_name() { return "access_type"; }
    static members_type members() {
        return {{"Read",  access_type::Read},
                {"Write", access_type::Write},
                {"Admin", access_type::Admin}};
    }
};
} // jsenum

inline std::ostream & operator << (std::ostream &o, access_type a) {
    switch (a) {
    case access_type::Read:  return o << "Read";
    case access_type::Write: return o << "Write";
    case access_type::Admin: return o << "Admin";
    }
    return o << "access_type(" << static_cast<int>(a) << ")";
}

// all fields required

struct non_null_enum {
    access_type access1, access2, access3;

    non_null_enum() : access1(), access2(), access3() {}
    non_null_enum(access_type a1, access_type a2, access_type a3)
        : access1(a1), access2(a2), access3(a3) {}
};
template <class AR>
inline void serialize(AR &ar, non_null_enum &r) {
    ar & jsenum::kv("Access1", r.access1)
       & jsenum::kv("Access2", r.access2)
       & jsenum::kv("Access3", r.access3);
}
inline bool operator == (const non_null_enum &a, const non_null_enum &b) {
    return a.access1 == b.access1 && a.access2 == b.access2 && a.access3 == b.access3;
}
inline std::ostream & operator << (std::ostream &o, const non_null_enum &r) {
    return o << "{" << r.access1 << ", " << r.access2 << ", " << r.access3 << "}";
}

// all fields optional

struct nullable_enum {
    boost::optional<access_type> access1, access2, access3;

    nullable_enum() {}
    nullable_enum(boost::optional<access_type> a1,
                  boost::optional<access_type> a2,
                  boost::optional<access_type> a3)
        : access1(a1), access2(a2), access3(a3) {}
};
template <class AR>
inline void serialize(AR &ar, nullable_enum &r) {
    ar & jsenum::kv("Access1", r.access1)
       & jsenum::kv("Access2", r.access2)
       & jsenum::kv("Access3", r.access3);
}
inline bool operator == (const nullable_enum &a, const nullable_enum &b) {
    return a.access1 == b.access1 && a.access2 == b.access2 && a.access3 == b.access3;
}
inline std::ostream & operator << (std::ostream &o, const nullable_enum &r) {
    return o << "{" << r.access1 << ", " << r.access2 << ", " << r.access3 << "}";
}

#endif // JSENUM_TESTS_ACCESS_TYPE_HH
