#ifndef LIBJSENUM_ENUM_CODEC_HH
#define LIBJSENUM_ENUM_CODEC_HH

#include "jsenum/codec.hh"
#include "jsenum/error.hh"
#include "jsenum/name_table.hh"
#include <memory>

namespace jsenum {

//! enum member <-> JSON string holding its exact name
template <class E>
class enum_codec : public value_codec<E> {
    std::shared_ptr<const name_table> _table;

public:
    explicit enum_codec(std::shared_ptr<const name_table> table)
        : _table(std::move(table)) {}

    const name_table &table() const { return *_table; }

    json write(const E &e) const override {
        return json::str(_table->name_of(static_cast<int64_t>(e)));
    }

    //! throws malformed_value for anything but a string token,
    //! unknown_enum_member for a string that is not a member name ("" included)
    E read(const json &j) const override {
        if (!j.is_string())
            throw malformed_value(_table->type_name(), j.dump());
        const auto v = _table->value_of(j.str());
        if (!v)
            throw unknown_enum_member(_table->type_name(), j.dump());
        return static_cast<E>(*v);
    }
};

} // jsenum

#endif // LIBJSENUM_ENUM_CODEC_HH
