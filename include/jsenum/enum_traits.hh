#ifndef LIBJSENUM_ENUM_TRAITS_HH
#define LIBJSENUM_ENUM_TRAITS_HH

#include <boost/optional.hpp>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

namespace jsenum {

// an enum becomes serializable by name once it has an enum_traits<>:
//
//   enum class access_type { Read, Write, Admin };
//
//   template <> struct enum_traits<access_type> : named_enum<access_type> {
//       static const char *type_name() { return "access_type"; }
//       static members_type members() {
//           return {{"Read",  access_type::Read},
//                   {"Write", access_type::Write},
//                   {"Admin", access_type::Admin}};
//       }
//   };
//
// names are matched exactly as listed, case and all

template <class E> using enum_members = std::vector<std::pair<const char *, E>>;

template <class E> struct enum_traits {
    static constexpr bool is_named = false;
};

template <class E> struct named_enum {
    static_assert(std::is_enum<E>::value, "named_enum<> needs an enum type");

    using enum_type    = E;
    using members_type = enum_members<E>;
    static constexpr bool is_named = true;
};

//! members numbered by their position in a list of names
//
//! for enums declared without initializers next to a names array:
//!   enum captain { kirk, picard, janeway, sisko };
//!   const array<string, 4> captain_names = {{ "kirk", "picard", "janeway", "sisko" }};
template <class E, class Coll>
inline enum_members<E> indexed_members(const Coll &names) {
    enum_members<E> m;
    std::size_t i = 0;
    for (const auto &n : names)
        m.emplace_back(n.c_str(), static_cast<E>(i++));
    return m;
}

//----------------------------------------------------------------
// codec shapes: what a declared field type looks like to the resolver
//

struct not_enum_shape {};
struct plain_enum_shape {};
struct optional_enum_shape {};

template <class T> struct codec_shape {
    using type = typename std::conditional<enum_traits<T>::is_named,
                                           plain_enum_shape, not_enum_shape>::type;
    using enum_type = T;
};

template <class E> struct codec_shape<boost::optional<E>> {
    using type = typename std::conditional<enum_traits<E>::is_named,
                                           optional_enum_shape, not_enum_shape>::type;
    using enum_type = E;
};

} // jsenum

#endif // LIBJSENUM_ENUM_TRAITS_HH
