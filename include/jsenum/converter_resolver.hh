#ifndef LIBJSENUM_CONVERTER_RESOLVER_HH
#define LIBJSENUM_CONVERTER_RESOLVER_HH

#include "jsenum/enum_codec.hh"
#include "jsenum/name_table_registry.hh"
#include "jsenum/optional_enum_codec.hh"
#include <memory>
#include <type_traits>

namespace jsenum {

//! picks the codec for a declared field type
//
//! E                    -> enum_codec<E>
//! boost::optional<E>   -> optional_enum_codec<E>
//! anything else        -> nullptr, the archive's own handling applies
//
//! E qualifies when it has an enum_traits<> (see enum_traits.hh)
class converter_resolver {
    name_table_registry &_tables;

    template <class T>
    std::shared_ptr<const value_codec<T>> resolve(not_enum_shape) const {
        return nullptr;
    }

    template <class T>
    std::shared_ptr<const value_codec<T>> resolve(plain_enum_shape) const {
        return std::make_shared<enum_codec<T>>(_tables.get<T>());
    }

    template <class T>
    std::shared_ptr<const value_codec<T>> resolve(optional_enum_shape) const {
        using E = typename codec_shape<T>::enum_type;
        return std::make_shared<optional_enum_codec<E>>(enum_codec<E>(_tables.get<E>()));
    }

public:
    explicit converter_resolver(name_table_registry &tables) : _tables(tables) {}

    template <class T>
    static constexpr bool can_handle() {
        return !std::is_same<typename codec_shape<T>::type, not_enum_shape>::value;
    }

    template <class T>
    std::shared_ptr<const value_codec<T>> resolve() const {
        return resolve<T>(typename codec_shape<T>::type());
    }
};

} // jsenum

#endif // LIBJSENUM_CONVERTER_RESOLVER_HH
