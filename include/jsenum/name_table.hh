#ifndef LIBJSENUM_NAME_TABLE_HH
#define LIBJSENUM_NAME_TABLE_HH

#include "jsenum/enum_traits.hh"
#include <boost/optional.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jsenum {

//! bidirectional member name <-> value lookup for one enum type
//
//! values are held as int64_t so one table type serves every enum;
//! the codecs cast back to the enum on the way out
class name_table {
public:
    using member = std::pair<std::string, int64_t>;

    //! throws errorx on an empty, duplicate name or a duplicate value
    name_table(std::string type_name, std::vector<member> members);

    template <class E>
    static name_table build() {
        using traits = enum_traits<E>;
        static_assert(traits::is_named, "enum has no enum_traits<> with members");
        std::vector<member> m;
        for (const auto &nv : traits::members())
            m.emplace_back(nv.first, static_cast<int64_t>(nv.second));
        return name_table(traits::type_name(), std::move(m));
    }

    const std::string &type_name() const         { return _type_name; }
    size_t size() const                          { return _members.size(); }
    //! members in declaration order
    const std::vector<member> &members() const   { return _members; }

    //! exact, case-sensitive match; none if no member has that name
    boost::optional<int64_t> value_of(const std::string &name) const;

    //! nullptr if no member has that value
    const std::string *find_name(int64_t value) const;

    //! throws errorx if no member has that value
    const std::string &name_of(int64_t value) const;

private:
    std::string _type_name;
    std::vector<member> _members;
    std::unordered_map<std::string, size_t> _by_name;
    std::unordered_map<int64_t, size_t> _by_value;
};

} // jsenum

#endif // LIBJSENUM_NAME_TABLE_HH
