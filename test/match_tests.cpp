#include <catch2/catch_all.hpp>

#include "stanza/match.hpp"
#include "test_helpers.hpp"

using StanzaTest::json;

namespace {

    Stanza::KeyPattern pattern(std::string_view key) {
        auto p = Stanza::parse_key_pattern(key);
        REQUIRE(p);
        return std::move(*p);
    }

    std::vector<std::string> matched_keys(const std::vector<Stanza::Match>& matches) {
        std::vector<std::string> keys;
        for (const auto& m : matches) keys.push_back(m.key);
        return keys;
    }

} // namespace


TEST_CASE("Match Stack - Frames and Captures") {
    auto doc = json(R"({"a":{"b":1}})");
    Stanza::MatchStack stack{ doc };

    REQUIRE(stack.depth() == 0);
    REQUIRE(stack.frame(0)->node == &doc);
    REQUIRE(stack.frame(1) == nullptr);
    REQUIRE(stack.capture({ 0, 0 }).value_or("?") == "");

    stack.push({ "a", { "a" }, doc.find("a") });
    stack.push({ "b", { "b", "b" }, doc.at("a").find("b") });
    REQUIRE(stack.depth() == 2);
    REQUIRE(stack.path() == "/a/b");
    REQUIRE(stack.capture({ 1, 0 }).value_or("?") == "a");
    REQUIRE(stack.capture({ 0, 1 }).value_or("?") == "b");
    REQUIRE_FALSE(stack.capture({ 1, 1 }));
    REQUIRE_FALSE(stack.capture({ 3, 0 }));

    stack.pop();
    stack.pop();
    stack.pop();
    REQUIRE(stack.depth() == 0);
}

TEST_CASE("Keys of Containers") {
    REQUIRE(Stanza::keys_of(json(R"({"b":1,"a":2})")) == std::vector<std::string>{ "b", "a" });
    REQUIRE(Stanza::keys_of(json("[5,6,7]")) == std::vector<std::string>{ "0", "1", "2" });
    REQUIRE(Stanza::keys_of(json("3")).empty());
}

TEST_CASE("Affix Matching") {
    using Stanza::match_affix;

    auto r = match_affix({ "tag_", "_v", "" }, "tag_color_v2");
    REQUIRE(r);
    REQUIRE(*r == std::vector<std::string>{ "tag_color_v2", "color", "2" });

    REQUIRE(match_affix({ "foo", "bar" }, "foobar") == std::vector<std::string>{ "foobar", "" });
    REQUIRE_FALSE(match_affix({ "foo", "bar" }, "foobaz"));
    REQUIRE_FALSE(match_affix({ "ab", "ba" }, "aba"));
    REQUIRE_FALSE(match_affix({ "a", "x", "b" }, "ab"));
}

TEST_CASE("Match - Literal and Capture Keys") {
    auto doc = json(R"({"id":"k","k_name":"Kay","other":1})");
    Stanza::MatchStack stack{ doc };
    auto keys = Stanza::keys_of(doc);

    auto lit = Stanza::match(pattern("other"), doc, keys, stack);
    REQUIRE(lit.size() == 1);
    REQUIRE(lit[0].captures == std::vector<std::string>{ "other" });
    REQUIRE(lit[0].node->as_number() == 1.0);

    REQUIRE(Stanza::match(pattern("missing"), doc, keys, stack).empty());
    REQUIRE(Stanza::match(pattern("other"), doc, { "id" }, stack).empty());

    stack.push({ "k", { "k" }, &doc });
    auto cap = Stanza::match(pattern("&_name"), doc, keys, stack);
    REQUIRE(matched_keys(cap) == std::vector<std::string>{ "k_name" });
}

TEST_CASE("Match - Wildcards Respect Availability") {
    auto doc = json(R"({"a":1,"b":2,"c":3})");
    Stanza::MatchStack stack{ doc };

    auto star = Stanza::match(pattern("*"), doc, { "a", "c" }, stack);
    REQUIRE(matched_keys(star) == std::vector<std::string>{ "a", "c" });
    REQUIRE(star[1].captures == std::vector<std::string>{ "c", "c" });

    auto arr = json(R"(["x","y"])");
    auto indices = Stanza::match(pattern("*"), arr, Stanza::keys_of(arr), stack);
    REQUIRE(matched_keys(indices) == std::vector<std::string>{ "0", "1" });
    REQUIRE(indices[1].node->as_string() == "y");
}

TEST_CASE("Match - Deep Wildcard Yields Descendants in Pre-Order") {
    auto doc = json(R"({"a":{"b":[1,2]},"c":3})");
    Stanza::MatchStack stack{ doc };

    auto deep = Stanza::match(pattern("**"), doc, Stanza::keys_of(doc), stack);
    REQUIRE(matched_keys(deep) == std::vector<std::string>{ "a", "a.b", "a.b.0", "a.b.1", "c" });
    REQUIRE(deep[2].captures == std::vector<std::string>{ "a.b.0", "a.b.0" });
    REQUIRE(deep[3].node->as_number() == 2.0);
}
