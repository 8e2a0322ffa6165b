#include "jsenum/name_table.hh"
#include "jsenum/error.hh"

namespace jsenum {

name_table::name_table(std::string type_name, std::vector<member> members)
    : _type_name(std::move(type_name)), _members(std::move(members))
{
    _by_name.reserve(_members.size());
    _by_value.reserve(_members.size());
    for (size_t i = 0; i < _members.size(); ++i) {
        const auto &m = _members[i];
        // "" is how an optional field says "absent"
        if (m.first.empty())
            throw_stream() << _type_name << ": empty member name for value " << m.second << endx;
        if (!_by_name.emplace(m.first, i).second)
            throw_stream() << _type_name << ": duplicate member name '" << m.first << "'" << endx;
        if (!_by_value.emplace(m.second, i).second)
            throw_stream() << _type_name << ": duplicate member value " << m.second
                << " ('" << _members[_by_value[m.second]].first << "' and '" << m.first << "')" << endx;
    }
}

boost::optional<int64_t> name_table::value_of(const std::string &name) const {
    const auto it = _by_name.find(name);
    if (it == _by_name.end())
        return boost::none;
    return _members[it->second].second;
}

const std::string *name_table::find_name(int64_t value) const {
    const auto it = _by_value.find(value);
    if (it == _by_value.end())
        return nullptr;
    return &_members[it->second].first;
}

const std::string &name_table::name_of(int64_t value) const {
    const auto name = find_name(value);
    if (!name)
        throw errorx("%s: no member with value %lld", _type_name.c_str(), (long long)value);
    return *name;
}

} // jsenum
