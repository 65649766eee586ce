#pragma once


/*
    ------------------------------------------------
    Stanza spec model - the typed shift specification
    ------------------------------------------------
    A raw spec document (a JSON object) is turned into an immutable tree of
    `SpecNode`s by `build_spec(...)`:

    - `Branch`: one `Rule` per key of the raw object. Each rule pairs a parsed
      `KeyPattern` with the child node built from the member value
    - `Leaf`:   one or more `OutputPath`s, from a string or a list of strings

    ------------
    Key patterns
    ------------
        literal       "name"          exactly that key (or array index "0")
        capture       "&1_id"         ancestor captures substituted, then literal
        affix         "tag_*_v*"      keys with those fixed fragments
        wildcard      "*"             every key not matched by an earlier rule
        deep wildcard "**"            every remaining key and all of its descendants
        key of        "$", "$(1,0)"   writes a captured key as the value
        constant      "#text"         writes the string "text" as the value
        alternation   "a|b"           one rule per alternative, same child

    Rules inside a branch are kept in precedence order: literal, capture,
    affix, `*`, `**`; spec order (key order of the raw object) within a class.
    `$` and `#` rules do not match source keys and are stored apart.

    ------------
    Output paths
    ------------
        "a.b.c"          nested fields
        "a[2]", "a[]"    array index, array append
        "&", "&2", "&(1,2)"         capture: levels up, capture index
        "@", "@1", "@(1,meta.id)"   value found from an ancestor source node

    Special characters are escaped with a backslash: `\.`, `\*`, `\&`, ...

    Captures of a level: index 0 is the whole matched key, then one entry per
    `*` of the pattern (`*` alone yields `[key, key]`).
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaSpec Spec Model
/// @ingroup Stanza
/// @brief Parsed, immutable representation of shift specifications

namespace Stanza {

    /// @ingroup StanzaSpec
    /// @brief Reference to a capture bound at an ancestor level, `&(levels_up, capture)`.
    struct CaptureRef {
        size_t levels_up = 0;
        size_t capture = 0;

        bool operator==(const CaptureRef&) const = default;
    };

    /// @ingroup StanzaSpec
    /// @brief Literal text interleaved with capture references.
    ///
    /// @details `fragments.size() == refs.size() + 1`; the resolved text is
    /// `fragments[0] + capture(refs[0]) + fragments[1] + ...`
    struct Template {
        std::vector<std::string> fragments{ std::string{} };
        std::vector<CaptureRef> refs{};

        [[nodiscard]] bool is_literal() const noexcept { return refs.empty(); }
        [[nodiscard]] bool empty() const noexcept { return refs.empty() && fragments.front().empty(); }
    };

    /// @ingroup StanzaSpec
    /// @brief Reference to a source value, `@(levels_up, path)`.
    struct ValueRef {
        size_t levels_up = 0;
        std::vector<Template> path{};
    };

    /// @ingroup StanzaSpec
    /// @brief One segment of an output path.
    struct PathSegment {
        enum class kind : uint8_t {
            field,  ///< `.name`
            index,  ///< `[n]`
            append, ///< `[]`
        };

        kind type = kind::field;
        std::variant<Template, ValueRef> token{}; ///< Unused for `append`.
    };

    /// @ingroup StanzaSpec
    /// @brief A parsed output-path template; no segments addresses the output root.
    struct OutputPath {
        std::string raw{};
        std::vector<PathSegment> segments{};
    };

    /// @ingroup StanzaSpec
    /// @brief A parsed branch key.
    struct KeyPattern {
        /// @brief Pattern classes, declared in matching precedence order.
        enum class kind : uint8_t {
            literal,
            capture,
            affix,
            wildcard,
            deep_wildcard,
            key_of,
            constant,
        };

        kind type = kind::literal;
        std::string raw{};                    ///< The alternative as written in the spec.
        std::string literal{};                ///< `literal` key, `constant` text.
        Template key{};                       ///< `capture` key template.
        std::vector<std::string> fragments{}; ///< `affix` fragments around each `*`.
        CaptureRef ref{};                     ///< `key_of` reference.

        /// @brief Number of captures a frame matched by this pattern holds.
        [[nodiscard]] STANZA_API size_t capture_count() const noexcept;

        /// @brief True for `$` and `#` patterns, which write a value without matching.
        [[nodiscard]] bool is_emitter() const noexcept { return type == kind::key_of || type == kind::constant; }
    };

    struct Rule;

    /// @ingroup StanzaSpec
    /// @brief Spec node writing the matched value to every listed path.
    struct Leaf {
        std::vector<OutputPath> paths{};
    };

    /// @ingroup StanzaSpec
    /// @brief Spec node matching source keys against patterns.
    struct Branch {
        std::vector<Rule> rules;    ///< Matching rules, in precedence order.
        std::vector<Rule> emitters; ///< `$` and `#` rules, in spec order.
    };

    /// @ingroup StanzaSpec
    /// @brief A node of the spec tree.
    struct SpecNode {
        std::variant<Leaf, Branch> node{};

        [[nodiscard]] bool is_leaf() const noexcept { return std::holds_alternative<Leaf>(node); }
        [[nodiscard]] const Leaf& leaf() const { return std::get<Leaf>(node); }
        [[nodiscard]] const Branch& branch() const { return std::get<Branch>(node); }
    };

    /// @ingroup StanzaSpec
    /// @brief A key pattern and the node applied to whatever it matches.
    struct Rule {
        KeyPattern pattern{};
        SpecNode child{};
    };

    /// @ingroup StanzaSpec
    /// @brief Result type of the spec builder.
    using SpecResult = std::expected<SpecNode, TransformError>;

    /// @ingroup StanzaSpec
    /// @brief Builds the spec tree of a raw shift spec.
    ///
    /// @details
    /// Fails with `TransformError::code::spec_syntax` when:
    ///  - @p raw is not an object
    ///  - a member value is neither a string, a list of strings, nor an object
    ///  - a key or output path has malformed token syntax
    ///  - a `&`/`$` reference reaches above the root or names a capture the
    ///    referenced level does not have
    ///  - a `$` or `#` key maps to an object
    ///
    /// The error path is the `/`-joined list of keys leading to the offender.
    [[nodiscard]] STANZA_API SpecResult build_spec(const value& raw);

    /// @ingroup StanzaSpec
    /// @brief Parses one alternative of a branch key. References are not range-checked.
    [[nodiscard]] STANZA_API std::expected<KeyPattern, TransformError> parse_key_pattern(std::string_view text);

    /// @ingroup StanzaSpec
    /// @brief Parses an output-path template. References are not range-checked.
    [[nodiscard]] STANZA_API std::expected<OutputPath, TransformError> parse_output_path(std::string_view text);

} // namespace Stanza
