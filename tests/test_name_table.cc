#define BOOST_TEST_MODULE name_table test
#include <boost/test/unit_test.hpp>
#include "jsenum/name_table.hh"
#include "jsenum/error.hh"
#include "access_type.hh"
#include <array>

using namespace std;
using namespace jsenum;

// non-contiguous values, declared out of order
enum class priority : short { low = -1, high = 10, normal = 0 };

namespace jsenum {
template <> struct enum_traits<priority> : named_enum<priority> {
    static const char *type_name() { return "priority"; }
    static members_type members() {
        return {{"low", priority::low}, {"high", priority::high}, {"normal", priority::normal}};
    }
};
} // jsenum

// the name-array style: values are positions
enum captain { kirk, picard, janeway, sisko };
const array<string, 4> captain_names = {{ "kirk", "picard", "janeway", "sisko" }};

BOOST_AUTO_TEST_CASE(name_table_build) {
    auto t = name_table::build<access_type>();
    BOOST_CHECK_EQUAL(t.type_name(), "access_type");
    BOOST_REQUIRE_EQUAL(t.size(), 3u);
    BOOST_CHECK_EQUAL(t.members()[0].first, "Read");
    BOOST_CHECK_EQUAL(t.members()[1].first, "Write");
    BOOST_CHECK_EQUAL(t.members()[2].first, "Admin");

    BOOST_CHECK_EQUAL(t.name_of(static_cast<int64_t>(access_type::Write)), "Write");
    auto v = t.value_of("Admin");
    BOOST_REQUIRE(v);
    BOOST_CHECK_EQUAL(*v, static_cast<int64_t>(access_type::Admin));
}

BOOST_AUTO_TEST_CASE(name_table_every_member_both_ways) {
    auto t = name_table::build<priority>();
    for (const auto &m : t.members()) {
        BOOST_CHECK_EQUAL(t.name_of(m.second), m.first);
        auto v = t.value_of(m.first);
        BOOST_REQUIRE(v);
        BOOST_CHECK_EQUAL(*v, m.second);
    }
    BOOST_CHECK_EQUAL(t.name_of(-1), "low");
    BOOST_CHECK_EQUAL(t.name_of(10), "high");
}

BOOST_AUTO_TEST_CASE(name_table_not_found) {
    auto t = name_table::build<access_type>();
    BOOST_CHECK(!t.value_of(""));
    BOOST_CHECK(!t.value_of("read"));
    BOOST_CHECK(!t.value_of("READ"));
    BOOST_CHECK(!t.value_of(" Read"));
    BOOST_CHECK(!t.value_of("Rea"));
    BOOST_CHECK(!t.value_of("0"));

    BOOST_CHECK(t.find_name(7) == nullptr);
    BOOST_CHECK_THROW(t.name_of(7), errorx);
}

BOOST_AUTO_TEST_CASE(name_table_indexed_members) {
    enum_members<captain> m = indexed_members<captain>(captain_names);
    BOOST_REQUIRE_EQUAL(m.size(), 4u);
    BOOST_CHECK_EQUAL(m[2].second, janeway);

    std::vector<name_table::member> mm;
    for (const auto &nv : m)
        mm.emplace_back(nv.first, nv.second);
    name_table t2("captain", mm);
    BOOST_CHECK_EQUAL(t2.size(), 4u);
    BOOST_CHECK_EQUAL(t2.name_of(janeway), "janeway");
    BOOST_CHECK_EQUAL(*t2.value_of("sisko"), sisko);
}

BOOST_AUTO_TEST_CASE(name_table_rejects_bad_members) {
    BOOST_CHECK_THROW(name_table("dup_name", {{"a", 0}, {"a", 1}}), errorx);
    BOOST_CHECK_THROW(name_table("dup_value", {{"a", 0}, {"b", 0}}), errorx);
    BOOST_CHECK_THROW(name_table("empty_name", {{"", 0}}), errorx);
    // names differing only in case are distinct members
    name_table t("cased", {{"a", 0}, {"A", 1}});
    BOOST_CHECK_EQUAL(*t.value_of("a"), 0);
    BOOST_CHECK_EQUAL(*t.value_of("A"), 1);
}

BOOST_AUTO_TEST_CASE(name_table_error_text) {
    try {
        name_table("dup_value", {{"a", 3}, {"b", 3}});
        BOOST_FAIL("expected errorx");
    } catch (errorx &e) {
        BOOST_CHECK_EQUAL(string(e.what()), "dup_value: duplicate member value 3 ('a' and 'b')");
    }
}
