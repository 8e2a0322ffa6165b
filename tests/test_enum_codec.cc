#define BOOST_TEST_MODULE enum_codec test
#include <boost/test/unit_test.hpp>
#include "jsenum/enum_codec.hh"
#include "jsenum/optional_enum_codec.hh"
#include "jsenum/name_table_registry.hh"
#include "access_type.hh"

using namespace std;
using namespace jsenum;

namespace {

const access_type all_members[] = { access_type::Read, access_type::Write, access_type::Admin };

struct codecs {
    name_table_registry tables;
    enum_codec<access_type> plain;
    optional_enum_codec<access_type> opt;

    codecs()
        : plain(tables.get<access_type>()),
          opt(enum_codec<access_type>(tables.get<access_type>())) {}
};

} // anon

BOOST_FIXTURE_TEST_SUITE(enum_codec_suite, codecs)

BOOST_AUTO_TEST_CASE(enum_write_is_exact_name) {
    BOOST_CHECK_EQUAL(plain.write(access_type::Read),  json::str("Read"));
    BOOST_CHECK_EQUAL(plain.write(access_type::Write), json::str("Write"));
    BOOST_CHECK_EQUAL(plain.write(access_type::Admin), json::str("Admin"));
}

BOOST_AUTO_TEST_CASE(enum_round_trip) {
    for (auto m : all_members)
        BOOST_CHECK_EQUAL(plain.read(plain.write(m)), m);
}

BOOST_AUTO_TEST_CASE(enum_write_undeclared_value) {
    BOOST_CHECK_THROW(plain.write(static_cast<access_type>(42)), errorx);
}

BOOST_AUTO_TEST_CASE(enum_read_unknown_member) {
    BOOST_CHECK_THROW(plain.read(json::str("")), unknown_enum_member);
    BOOST_CHECK_THROW(plain.read(json::str("read")), unknown_enum_member);
    BOOST_CHECK_THROW(plain.read(json::str("ADMIN")), unknown_enum_member);
    BOOST_CHECK_THROW(plain.read(json::str("Execute")), unknown_enum_member);
    // no numeric fallback
    BOOST_CHECK_THROW(plain.read(json::str("1")), unknown_enum_member);
}

BOOST_AUTO_TEST_CASE(enum_read_malformed) {
    BOOST_CHECK_THROW(plain.read(json::null()), malformed_value);
    BOOST_CHECK_THROW(plain.read(json()), malformed_value);
    BOOST_CHECK_THROW(plain.read(json(1)), malformed_value);
    BOOST_CHECK_THROW(plain.read(json(true)), malformed_value);
    BOOST_CHECK_THROW(plain.read(json::array()), malformed_value);
    BOOST_CHECK_THROW(plain.read(json::object()), malformed_value);
}

BOOST_AUTO_TEST_CASE(enum_read_error_detail) {
    try {
        plain.read(json::str("read"));
        BOOST_FAIL("expected unknown_enum_member");
    } catch (unknown_enum_member &e) {
        BOOST_CHECK_EQUAL(e.type_name(), "access_type");
        BOOST_CHECK_EQUAL(e.value(), "\"read\"");
        BOOST_CHECK(e.field().empty());
        BOOST_CHECK_EQUAL(string(e.what()), "unknown enum member for access_type: \"read\"");
    }
    try {
        plain.read(json());
        BOOST_FAIL("expected malformed_value");
    } catch (malformed_value &e) {
        BOOST_CHECK_EQUAL(string(e.what()), "malformed value for access_type: <missing>");
    }
}

BOOST_AUTO_TEST_CASE(optional_write) {
    BOOST_CHECK_EQUAL(opt.write(boost::none), json::null());
    BOOST_CHECK_EQUAL(opt.write(access_type::Admin), json::str("Admin"));
}

BOOST_AUTO_TEST_CASE(optional_round_trip) {
    for (auto m : all_members) {
        boost::optional<access_type> present(m);
        BOOST_CHECK_EQUAL(opt.read(opt.write(present)), present);
    }
    boost::optional<access_type> absent;
    BOOST_CHECK_EQUAL(opt.read(opt.write(absent)), absent);
    // absent is never written as ""
    BOOST_CHECK(!opt.write(absent).is_string());
}

BOOST_AUTO_TEST_CASE(optional_absent_inputs) {
    BOOST_CHECK(!opt.read(json::null()));
    BOOST_CHECK(!opt.read(json::str("")));
    BOOST_CHECK(!opt.read(json()));
    BOOST_CHECK_EQUAL(opt.read(json::null()), opt.read(json::str("")));
}

BOOST_AUTO_TEST_CASE(optional_present) {
    auto v = opt.read(json::str("Write"));
    BOOST_REQUIRE(v);
    BOOST_CHECK_EQUAL(*v, access_type::Write);
}

BOOST_AUTO_TEST_CASE(optional_unknown_and_malformed) {
    BOOST_CHECK_THROW(opt.read(json::str("write")), unknown_enum_member);
    // only the empty string is absent
    BOOST_CHECK_THROW(opt.read(json::str(" ")), unknown_enum_member);
    BOOST_CHECK_THROW(opt.read(json(0)), malformed_value);
    BOOST_CHECK_THROW(opt.read(json(false)), malformed_value);
    BOOST_CHECK_THROW(opt.read(json::array()), malformed_value);
}

BOOST_AUTO_TEST_CASE(codecs_share_one_table) {
    BOOST_CHECK_EQUAL(tables.size(), 1u);
    BOOST_CHECK_EQUAL(tables.builds(), 1u);
    BOOST_CHECK_EQUAL(&plain.table(), tables.get<access_type>().get());
}

BOOST_AUTO_TEST_SUITE_END()
