#include <catch2/catch_all.hpp>

#include <memory_resource>
#include <sstream>

#include <spdlog/sinks/ostream_sink.h>

#include "test_helpers.hpp"

using StanzaTest::json;
using StanzaTest::shifted;

TEST_CASE("Shift - Nested Restructuring") {
    auto out = shifted(
        R"({"user":{"firstName":"Alice","lastName":"Smith","location":{"city":"Los Angeles","state":"CA"}}})",
        R"({"user":{"firstName":"person.first","lastName":"person.last",
                    "location":{"city":"person.address.city","state":"person.address.state"}}})");

    REQUIRE(out == R"({"person":{"first":"Alice","last":"Smith","address":{"city":"Los Angeles","state":"CA"}}})");
}

TEST_CASE("Shift - Unlisted Fields Are Dropped") {
    auto out = shifted(
        R"({"user":{"firstName":"Alice","location":{"city":"LA","zip":"90001"}}})",
        R"({"user":{"location":{"city":"person.address.city"}}})");
    REQUIRE(out == R"({"person":{"address":{"city":"LA"}}})");
}

TEST_CASE("Shift - Two Keys to One Path Collide Into an Array") {
    REQUIRE(shifted(R"({"a":1,"b":2})", R"({"a":"x","b":"x"})") == R"({"x":[1,2]})");
}

TEST_CASE("Shift - Collisions Follow Spec Order") {
    REQUIRE(shifted(R"({"a":1,"b":2})", R"({"b":"x","a":"x"})") == R"({"x":[2,1]})");
    REQUIRE(shifted(R"({"tag_b":1,"tag_a":2,"a_x":3})", R"({"a_*":"x","tag_*":"x"})") == R"({"x":[3,1,2]})");
}

TEST_CASE("Shift - Wildcard Matches Follow Source Order") {
    REQUIRE(shifted(R"({"b":2,"a":1,"c":3})", R"({"*":"x"})") == R"({"x":[2,1,3]})");
    REQUIRE(shifted(R"({"z":{"v":1},"y":{"v":2}})", R"({"*":{"v":"vs.&1"}})") == R"({"vs":{"z":1,"y":2}})");
}

TEST_CASE("Shift - Collision Order Follows Precedence Then Source Order") {
    REQUIRE(shifted(R"({"a":1,"b":2,"c":3})", R"({"*":"all","b":"all"})") == R"({"all":[2,1,3]})");
    REQUIRE(shifted(R"({"a":1,"b":2})", R"({"a":["x","x"],"b":"x"})") == R"({"x":[1,1,2]})");
}

TEST_CASE("Shift - Renaming Round-Trips Through the Inverse Spec") {
    auto source = R"({"a":1,"c":{"d":[true,null]}})";
    auto forward = shifted(source, R"({"a":"b","c":"e"})");
    REQUIRE(forward == R"({"b":1,"e":{"d":[true,null]}})");
    REQUIRE(shifted(forward, R"({"b":"a","e":"c"})") == source);
}

TEST_CASE("Shift - Output is Deterministic") {
    auto source = R"({"x":{"b":1,"a":2,"c":[1,2]},"y":{"a":3}})";
    auto spec = R"({"*":{"*":"by.&0","a":"as"}})";
    auto first = shifted(source, spec);
    for (int i = 0; i < 10; i++)
        REQUIRE(shifted(source, spec) == first);
}

TEST_CASE("Shift - Wildcard Visits Every Key Once") {
    auto source = R"({"k1":1,"k2":"two","k3":[3],"k4":{"x":4}})";
    REQUIRE(shifted(source, R"({"*":"&"})") == source);
    REQUIRE(shifted(source, R"({"*":"n[]"})") == R"({"n":[1,"two",[3],{"x":4}]})");
}

TEST_CASE("Shift - Absent Keys Are Not Errors") {
    REQUIRE(shifted(R"({"a":1})", R"({"missing":"x","a":"y"})") == R"({"y":1})");

    auto none = StanzaTest::shift(R"({"a":1})", R"({"missing":"x"})");
    REQUIRE(none);
    REQUIRE(none->is_null());

    auto scalar = StanzaTest::shift(R"({"a":5})", R"({"a":{"b":"x"}})");
    REQUIRE(scalar);
    REQUIRE(scalar->is_null());
}

TEST_CASE("Shift - Empty Path Writes the Root") {
    REQUIRE(shifted(R"({"a":{"x":1}})", R"({"a":""})") == R"({"x":1})");
}

TEST_CASE("Shift - Capture References") {
    auto out = shifted(
        R"({"rating":{"primary":{"value":3},"quality":{"value":4}}})",
        R"({"rating":{"*":{"value":"ratings.&1"}}})");
    REQUIRE(out == R"({"ratings":{"primary":3,"quality":4}})");

    REQUIRE(shifted(R"({"tag_color_v2":"red"})", R"({"tag_*_v*":"t.&(0,1).&(0,2)"})") == R"({"t":{"color":{"2":"red"}}})");
}

TEST_CASE("Shift - Capture Keys Match Computed Names") {
    REQUIRE(shifted(R"({"x":{"x_id":7,"y_id":8}})", R"({"*":{"&_id":"id"}})") == R"({"id":7})");
    REQUIRE(shifted(R"({"a":{"b":{"a_b":1,"b":2}}})", R"({"*":{"*":{"&1_&0":"hit"}}})") == R"({"hit":1})");
}

TEST_CASE("Shift - Value References") {
    auto out = shifted(
        R"({"data":{"k1":{"id":"x","v":1},"k2":{"id":"y","v":2}}})",
        R"({"data":{"*":{"v":"byId.@(1,id)"}}})");
    REQUIRE(out == R"({"byId":{"x":1,"y":2}})");

    REQUIRE(shifted(R"({"a":"key"})", R"({"a":"@"})") == R"({"key":"key"})");
    REQUIRE(shifted(R"({"k":3,"v":"x"})", R"({"v":"@(1,k)"})") == R"({"3":"x"})");
    REQUIRE(shifted(R"({"k":1.5,"v":"x"})", R"({"v":"@(1,k)"})") == R"({"1.5":"x"})");
    REQUIRE(shifted(R"({"k":true,"v":"x"})", R"({"v":"@(1,k)"})") == R"({"true":"x"})");
    REQUIRE(shifted(R"({"m":{"list":["p","q"]},"v":1})", R"({"v":"@(1,m.list.1)"})") == R"({"q":1})");
}

TEST_CASE("Shift - Unresolvable References Drop the Write") {
    auto missing = StanzaTest::shift(R"({"a":1})", R"({"a":"@(1,missing)"})");
    REQUIRE(missing);
    REQUIRE(missing->is_null());

    auto object = StanzaTest::shift(R"({"o":{},"a":1})", R"({"a":["@(1,o)","kept"]})");
    REQUIRE(object);
    REQUIRE(Stanza::dump(*object) == R"({"kept":1})");

    auto bad_index = StanzaTest::shift(R"({"i":"one","v":5})", R"({"v":"arr[@(1,i)]"})");
    REQUIRE(bad_index);
    REQUIRE(bad_index->is_null());

    REQUIRE(shifted(R"({"i":2,"v":5})", R"({"v":"arr[@(1,i)]"})") == R"({"arr":[null,null,5]})");
}

TEST_CASE("Shift - Large Numbers Resolve as Integers") {
    REQUIRE(shifted(R"({"k":1000000,"v":"x"})", R"({"v":"@(1,k)"})") == R"({"1000000":"x"})");
    REQUIRE(shifted(R"({"k":-42,"v":"x"})", R"({"v":"@(1,k)"})") == R"({"-42":"x"})");
}

TEST_CASE("Shift - Far Out-of-Range Indices Fail the Call") {
    auto referenced = StanzaTest::shift(R"({"i":1000000000000000,"a":1})", R"({"a":"x[@(1,i)]"})");
    REQUIRE_FALSE(referenced);
    REQUIRE(referenced.error().errc == Stanza::TransformError::code::index_out_of_range);
    REQUIRE(referenced.error().path == "x[1000000000000000]");

    auto literal = StanzaTest::shift(R"({"a":1})", R"({"a":"x[1000000000000000]"})");
    REQUIRE_FALSE(literal);
    REQUIRE(literal.error().errc == Stanza::TransformError::code::index_out_of_range);

    REQUIRE(shifted(R"({"a":1})", R"({"a":"x[3]"})") == R"({"x":[null,null,null,1]})");
}

TEST_CASE("Shift - Result Owns Its Storage") {
    std::string out;
    {
        std::pmr::monotonic_buffer_resource arena;
        auto source = Stanza::parse(R"({"name":"a value long enough to live on the heap","tags":["first tag long enough to allocate"]})");
        REQUIRE(source);
        Stanza::value in_arena{ *source, &arena };

        auto built = Stanza::Shift::build(json(R"({"name":"person.name","tags":"person.tags"})"));
        REQUIRE(built);
        auto r = built->apply(in_arena);
        REQUIRE(r);
        REQUIRE(r->at("person").at("name").resource() == std::pmr::get_default_resource());
        REQUIRE(r->at("person").at("tags").find(0)->as_string().get_allocator().resource() == std::pmr::get_default_resource());

        in_arena = Stanza::value{};
        arena.release();
        out = Stanza::dump(*r);
    }
    REQUIRE(out == R"({"person":{"name":"a value long enough to live on the heap","tags":["first tag long enough to allocate"]}})");
}

TEST_CASE("Shift - Arrays In and Out") {
    auto source = R"({"items":[{"n":"a"},{"n":"b"}]})";
    REQUIRE(shifted(source, R"({"items":{"*":{"n":"names[&1]"}}})") == R"({"names":["a","b"]})");
    REQUIRE(shifted(source, R"({"items":{"*":{"n":"list[]"}}})") == R"({"list":["a","b"]})");
    REQUIRE(shifted(source, R"({"items":{"1":{"n":"second"}}})") == R"({"second":"b"})");
    REQUIRE(shifted(source, R"({"items":{"*":{"n":"rows[&1].name"}}})") == R"({"rows":[{"name":"a"},{"name":"b"}]})");
}

TEST_CASE("Shift - Deep Wildcard Captures Relative Paths") {
    REQUIRE(shifted(R"({"a":{"b":1}})", R"({"**":"flat.&"})") == R"({"flat":{"a":{"b":1},"a.b":1}})");
    REQUIRE(shifted(R"({"a":1,"b":{"c":2}})", R"({"a":"first","**":"rest.&"})") == R"({"first":1,"rest":{"b":{"c":2},"b.c":2}})");
}

TEST_CASE("Shift - Affix Keys") {
    auto out = shifted(
        R"({"tag_color":"red","tag_size":"L","other":1})",
        R"({"tag_*":"tags.&(0,1)"})");
    REQUIRE(out == R"({"tags":{"color":"red","size":"L"}})");
}

TEST_CASE("Shift - Key and Constant Emitters") {
    REQUIRE(shifted(R"({"a":{},"b":{}})", R"({"*":{"$":"keys[]"}})") == R"({"keys":["a","b"]})");
    REQUIRE(shifted(R"({"a":1,"b":2})", R"({"*":{"$":"keys[]"}})") == R"({"keys":["a","b"]})");
    REQUIRE(shifted(R"({"a":1})", R"({"a":{"#yes":"flag"}})") == R"({"flag":"yes"})");
    REQUIRE(shifted(R"({"a":{"b":1}})", R"({"a":{"b":{"$1":"parent.&"}}})") == R"({"parent":{"a":"a"}})");
}

TEST_CASE("Shift - Alternation and Escaped Keys") {
    REQUIRE(shifted(R"({"a":1,"b":2,"c":3})", R"({"a|b":"x"})") == R"({"x":[1,2]})");
    REQUIRE(shifted(R"({"a.b":1,"*":2})", R"({"a\\.b":"x","\\*":"y"})") == R"({"x":1,"y":2})");
}

TEST_CASE("Shift - Fan-Out Writes Every Path") {
    REQUIRE(shifted(R"({"a":1})", R"({"a":["x","y.z"]})") == R"({"x":1,"y":{"z":1}})");
}

TEST_CASE("Shift - Shape Conflicts Fail the Call") {
    auto r = StanzaTest::shift(R"({"a":1,"b":2})", R"({"a":"x","b":"x.y"})");
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Stanza::TransformError::code::path_type_conflict);
    REQUIRE(r.error().path == "x.y");
}

TEST_CASE("Shift - Built Spec is Reusable") {
    auto built = Stanza::Shift::build(json(R"({"*":"&"})"));
    REQUIRE(built);
    REQUIRE(built->root().branch().rules.size() == 1);

    auto copy = *built;
    REQUIRE(Stanza::dump(*copy.apply(json(R"({"a":1})"))) == R"({"a":1})");
    REQUIRE(Stanza::dump(*built->apply(json(R"({"b":2})"))) == R"({"b":2})");
}

TEST_CASE("Shift - Logs Through the Configured Logger") {
    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    auto logger = std::make_shared<spdlog::logger>("shift-test", sink);
    logger->set_level(spdlog::level::trace);
    logger->set_pattern("%l %v");

    auto r = StanzaTest::shift(R"({"a":1})", R"({"a":"@(1,missing)","b":"y"})", { .logger = logger });
    REQUIRE(r);
    logger->flush();

    auto log = oss.str();
    REQUIRE(log.find("trace write to '@(1,missing)' at '/a' suppressed") != std::string::npos);
    REQUIRE(log.find("debug shift produced 0 write(s)") != std::string::npos);
}
