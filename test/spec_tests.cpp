#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"
#include "test_helpers.hpp"

using StanzaTest::json;
using Kind = Stanza::KeyPattern::kind;
using Seg = Stanza::PathSegment::kind;

namespace {

    void expect_syntax_error(std::string_view spec, std::string_view path) {
        auto r = Stanza::build_spec(json(spec));
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == Stanza::TransformError::code::spec_syntax);
        REQUIRE(r.error().path == path);
        REQUIRE_FALSE(r.error().msg.empty());
    }

    void expect_bad_key(std::string_view key) {
        INFO("key: " << key);
        auto r = Stanza::parse_key_pattern(key);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == Stanza::TransformError::code::spec_syntax);
    }

    void expect_bad_path(std::string_view path) {
        INFO("path: " << path);
        auto r = Stanza::parse_output_path(path);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == Stanza::TransformError::code::spec_syntax);
    }

} // namespace


TEST_CASE("Key Patterns - Classes") {
    auto literal = Stanza::parse_key_pattern("firstName");
    REQUIRE(literal);
    REQUIRE(literal->type == Kind::literal);
    REQUIRE(literal->literal == "firstName");
    REQUIRE(literal->capture_count() == 1);

    auto star = Stanza::parse_key_pattern("*");
    REQUIRE(star);
    REQUIRE(star->type == Kind::wildcard);
    REQUIRE(star->capture_count() == 2);

    auto deep = Stanza::parse_key_pattern("**");
    REQUIRE(deep);
    REQUIRE(deep->type == Kind::deep_wildcard);

    auto affix = Stanza::parse_key_pattern("tag_*_v*");
    REQUIRE(affix);
    REQUIRE(affix->type == Kind::affix);
    REQUIRE(affix->fragments == std::vector<std::string>{ "tag_", "_v", "" });
    REQUIRE(affix->capture_count() == 3);

    auto capture = Stanza::parse_key_pattern("&1_id");
    REQUIRE(capture);
    REQUIRE(capture->type == Kind::capture);
    REQUIRE(capture->key.refs.size() == 1);
    REQUIRE(capture->key.refs[0] == Stanza::CaptureRef{ 1, 0 });
    REQUIRE(capture->key.fragments == std::vector<std::string>{ "", "_id" });

    auto key_of = Stanza::parse_key_pattern("$(1,2)");
    REQUIRE(key_of);
    REQUIRE(key_of->type == Kind::key_of);
    REQUIRE(key_of->ref == Stanza::CaptureRef{ 1, 2 });
    REQUIRE(key_of->is_emitter());

    auto constant = Stanza::parse_key_pattern("#yes");
    REQUIRE(constant);
    REQUIRE(constant->type == Kind::constant);
    REQUIRE(constant->literal == "yes");
}

TEST_CASE("Key Patterns - Escapes Make Literals") {
    auto r = Stanza::parse_key_pattern(R"(a\*b\.c\\)");
    REQUIRE(r);
    REQUIRE(r->type == Kind::literal);
    REQUIRE(r->literal == R"(a*b.c\)");

    auto dollar = Stanza::parse_key_pattern(R"(\$price)");
    REQUIRE(dollar);
    REQUIRE(dollar->type == Kind::literal);
    REQUIRE(dollar->literal == "$price");
}

TEST_CASE("Key Patterns - Malformed") {
    expect_bad_key("@value");
    expect_bad_key("&*");
    expect_bad_key("&(1");
    expect_bad_key("&(x)");
    expect_bad_key("$(1,)");
    expect_bad_key("$1x");
    expect_bad_key(R"(a\q)");
    expect_bad_key("a\\");
}

TEST_CASE("Output Paths - Segments") {
    auto p = Stanza::parse_output_path("a.b[2][]");
    REQUIRE(p);
    REQUIRE(p->segments.size() == 4);
    REQUIRE(p->segments[0].type == Seg::field);
    REQUIRE(std::get<Stanza::Template>(p->segments[0].token).fragments.front() == "a");
    REQUIRE(p->segments[1].type == Seg::field);
    REQUIRE(p->segments[2].type == Seg::index);
    REQUIRE(std::get<Stanza::Template>(p->segments[2].token).fragments.front() == "2");
    REQUIRE(p->segments[3].type == Seg::append);

    auto root = Stanza::parse_output_path("");
    REQUIRE(root);
    REQUIRE(root->segments.empty());
}

TEST_CASE("Output Paths - References") {
    auto p = Stanza::parse_output_path("out.&(1,2)_x[&1].@(2,meta.&0)");
    REQUIRE(p);
    REQUIRE(p->segments.size() == 4);

    const auto& field = std::get<Stanza::Template>(p->segments[1].token);
    REQUIRE(field.refs == std::vector<Stanza::CaptureRef>{ { 1, 2 } });
    REQUIRE(field.fragments == std::vector<std::string>{ "", "_x" });

    REQUIRE(p->segments[2].type == Seg::index);
    REQUIRE(std::get<Stanza::Template>(p->segments[2].token).refs.size() == 1);

    REQUIRE(p->segments[3].type == Seg::field);
    const auto& value_ref = std::get<Stanza::ValueRef>(p->segments[3].token);
    REQUIRE(value_ref.levels_up == 2);
    REQUIRE(value_ref.path.size() == 2);
    REQUIRE(value_ref.path[1].refs.size() == 1);

    auto bare = Stanza::parse_output_path("@");
    REQUIRE(bare);
    REQUIRE(std::get<Stanza::ValueRef>(bare->segments[0].token).levels_up == 0);
}

TEST_CASE("Output Paths - Malformed") {
    expect_bad_path("a..b");
    expect_bad_path("a.");
    expect_bad_path(".a");
    expect_bad_path("a[1");
    expect_bad_path("a]");
    expect_bad_path("a[x]");
    expect_bad_path("a*");
    expect_bad_path("&(1");
    expect_bad_path("x@y");
    expect_bad_path("@(1,a");
    expect_bad_path("a(b)");
}

TEST_CASE("Spec Builder - Precedence Order") {
    auto r = Stanza::build_spec(json(R"({"*":"w","b":"l","a*":"x","**":"d","&":"c","#k":"k","$":"e"})"));
    REQUIRE(r);

    const auto& branch = r->branch();
    REQUIRE(branch.rules.size() == 5);
    REQUIRE(branch.rules[0].pattern.type == Kind::literal);
    REQUIRE(branch.rules[1].pattern.type == Kind::capture);
    REQUIRE(branch.rules[2].pattern.type == Kind::affix);
    REQUIRE(branch.rules[3].pattern.type == Kind::wildcard);
    REQUIRE(branch.rules[4].pattern.type == Kind::deep_wildcard);
    REQUIRE(branch.emitters.size() == 2);
}

TEST_CASE("Spec Builder - Spec Order Within a Class") {
    auto r = Stanza::build_spec(json(R"({"z*":"p","b":"l","*":"w","a":"l","m*":"p"})"));
    REQUIRE(r);

    const auto& rules = r->branch().rules;
    REQUIRE(rules.size() == 5);
    REQUIRE(rules[0].pattern.literal == "b");
    REQUIRE(rules[1].pattern.literal == "a");
    REQUIRE(rules[2].pattern.raw == "z*");
    REQUIRE(rules[3].pattern.raw == "m*");
    REQUIRE(rules[4].pattern.type == Kind::wildcard);
}

TEST_CASE("Spec Builder - Alternation Shares the Child") {
    auto r = Stanza::build_spec(json(R"({"a|b|c\\|d":"x"})"));
    REQUIRE(r);
    const auto& rules = r->branch().rules;
    REQUIRE(rules.size() == 3);
    REQUIRE(rules[0].pattern.literal == "a");
    REQUIRE(rules[2].pattern.literal == "c|d");
    REQUIRE(rules[2].child.is_leaf());

    expect_syntax_error(R"({"a||b":"x"})", "/a||b");
}

TEST_CASE("Spec Builder - Leaf Fan-Out") {
    auto r = Stanza::build_spec(json(R"({"a":["x","y.z"],"b":[]})"));
    REQUIRE(r);
    REQUIRE(r->branch().rules[0].child.leaf().paths.size() == 2);
    REQUIRE(r->branch().rules[1].child.leaf().paths.empty());
}

TEST_CASE("Spec Builder - Shape Errors Carry the Spec Path") {
    expect_syntax_error(R"([])", "");
    expect_syntax_error(R"({"user":{"age":5}})", "/user/age");
    expect_syntax_error(R"({"user":{"tags":["a",1]}})", "/user/tags");
    expect_syntax_error(R"({"a":null})", "/a");
    expect_syntax_error(R"({"a":{"$":{"x":"y"}}})", "/a/$");
    expect_syntax_error(R"({"a":{"b":"x..y"}})", "/a/b");
    expect_syntax_error(R"({"@a":"x"})", "/@a");
}

TEST_CASE("Spec Builder - Reference Ranges") {
    REQUIRE(Stanza::build_spec(json(R"({"a":"&1"})")));
    REQUIRE(Stanza::build_spec(json(R"({"*":"&(0,1)"})")));
    REQUIRE(Stanza::build_spec(json(R"({"a":{"*":"&(1,0).@(2,x)"}})")));

    expect_syntax_error(R"({"a":"&2"})", "/a");
    expect_syntax_error(R"({"*":"&(0,2)"})", "/*");
    expect_syntax_error(R"({"a":"&(0,1)"})", "/a");
    expect_syntax_error(R"({"a":"@(2,x)"})", "/a");
    expect_syntax_error(R"({"a":{"&2":"x"}})", "/a/&2");
    expect_syntax_error(R"({"a":{"$2":"x"}})", "/a/$2");
}

TEST_CASE("Error Rendering") {
    auto e = Stanza::TransformError::make(Stanza::TransformError::code::spec_syntax, "/a/b", "boom");
    REQUIRE(e.what() == "SpecSyntaxError at '/a/b': boom");

    auto root = Stanza::TransformError::make(Stanza::TransformError::code::path_type_conflict, "", "boom");
    REQUIRE(root.what() == "PathTypeConflictError: boom");

    auto range = Stanza::TransformError::make(Stanza::TransformError::code::index_out_of_range, "x[70000]", "too far");
    REQUIRE(range.what() == "IndexRangeError at 'x[70000]': too far");
}
