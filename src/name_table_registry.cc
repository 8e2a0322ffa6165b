#include "jsenum/name_table_registry.hh"
#include "jsenum/logging.hh"

namespace jsenum {

name_table_registry::table_ptr name_table_registry::fetch(std::type_index type,
        const std::function<name_table ()> &build)
{
    return _state([&](state &st) -> table_ptr {
        const auto it = st.tables.find(type);
        if (it != st.tables.end())
            return it->second;
        // a throwing build leaves nothing behind; the next use retries
        table_ptr t = std::make_shared<name_table>(build());
        st.tables.emplace(type, t);
        ++st.builds;
        VLOG(1) << "built name table for " << t->type_name()
            << " with " << t->size() << " members";
        return t;
    });
}

size_t name_table_registry::size() const {
    return _state([](state &st) { return st.tables.size(); });
}

size_t name_table_registry::builds() const {
    return _state([](state &st) { return st.builds; });
}

} // jsenum
