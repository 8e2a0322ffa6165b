#ifndef JSENUM_EXAMPLES_ACCESS_RECORDS_HH
#define JSENUM_EXAMPLES_ACCESS_RECORDS_HH

#include <string>
#include "jsenum/jserial.hh"

// records handled by jsenum-normalize, e.g.
//   [{"Access1":"Read","Access2":"","Access3":"Admin"}]

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

template <class Access>
struct access_record {
    Access access1, access2, access3;

    access_record() : access1(), access2(), access3() {}
};
template <class AR, class Access>
inline void serialize(AR &ar, access_record<Access> &r) {
    ar & jsenum::kv("Access1", r.access1)
       & jsenum::kv("Access2", r.access2)
       & jsenum::kv("Access3", r.access3);
}

//! decode every record of an array and encode it again
//
//! "" becomes null for optional Access; a failing record is named by its
//! index in the error's field path, e.g. "[2].Access1"
template <class Access>
jsenum::json normalize(jsenum::serial_context &ctx, const jsenum::json &in) {
    if (!in.is_array())
        throw jsenum::errorx("expected an array of records, got: %s", in.dump().c_str());
    jsenum::json out = jsenum::json::array();
    for (size_t i = 0; i < in.asize(); ++i) {
        access_record<Access> r;
        try {
            jsenum::jload(ctx, in.get(i), r);
        } catch (jsenum::codec_error &e) {
            e.within("[" + std::to_string(i) + "]");
            throw;
        }
        out.push(jsenum::jsave_all(ctx, r));
    }
    return out;
}

#endif // JSENUM_EXAMPLES_ACCESS_RECORDS_HH
