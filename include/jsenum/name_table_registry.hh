#ifndef LIBJSENUM_NAME_TABLE_REGISTRY_HH
#define LIBJSENUM_NAME_TABLE_REGISTRY_HH

#include "jsenum/name_table.hh"
#include "jsenum/synchronized.hh"
#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>

namespace jsenum {

//! build-once cache of name tables keyed by enum type
//
//! a table is built the first time its type is asked for and then shared
//! by every codec for that type until the registry goes away. the build
//! runs under the registry lock, so racing first uses build once.
class name_table_registry {
public:
    using table_ptr = std::shared_ptr<const name_table>;

    name_table_registry() {}
    name_table_registry(const name_table_registry &) = delete;
    name_table_registry & operator = (const name_table_registry &) = delete;

    template <class E>
    table_ptr get() {
        return fetch(std::type_index(typeid(E)), &name_table::build<E>);
    }

    //! number of distinct tables held
    size_t size() const;
    //! number of tables ever built, never more than size()
    size_t builds() const;

private:
    struct state {
        std::unordered_map<std::type_index, table_ptr> tables;
        size_t builds = 0;
    };
    synchronized<state> _state;

    table_ptr fetch(std::type_index type, const std::function<name_table ()> &build);
};

} // jsenum

#endif // LIBJSENUM_NAME_TABLE_REGISTRY_HH
