#pragma once


/*
    ------------------------------------------------------------
    Stanza - declarative JSON-to-JSON transformation for C++
    ------------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - The dynamic JSON DOM type:    `Stanza::value`
        - Error reporting types:        `Stanza::ParseError`,
                                        `Stanza::TransformError`
        - JSON text codec:              `Stanza::parse(...)`, `Stanza::dump(...)`
        - Shift specs:                  `Stanza::Shift` (build once, apply many)
        - Operation chains:             `Stanza::Chain`
        - One-call entry point:         `Stanza::transform(source, spec)`

    -------------------
    High-Level Overview
    -------------------
    A shift spec mirrors the shape of the input it reads. Every key of the
    spec is a pattern matched against the keys of the source at the same
    depth; every string (or list of strings) is an output path the matched
    value is written to:

        source: {"user":{"firstName":"Alice","location":{"city":"LA"}}}
        spec:   {"operation":"shift",
                 "spec":{"user":{"firstName":"person.first",
                                 "location":{"city":"person.address.city"}}}}
        result: {"person":{"address":{"city":"LA"},"first":"Alice"}}

    Patterns: literals, `*`, `**`, `prefix*suffix`, `&`-keys, `a|b`, `$`
    and `#constant`. Output paths: dotted fields, `[n]`, `[]` (append),
    `&(levels,capture)` and `@(levels,path)` tokens. Two writes to the same
    output path merge into an array in traversal order.

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        auto src  = Stanza::parse(source_text);
        auto spec = Stanza::parse(spec_text);
        if (!src || !spec) return 2;

        auto out = Stanza::transform(*src, *spec);
        if (!out) {
            std::println(stderr, "{}", out.error().what());
            return 1;
        }
        std::println("{}", Stanza::dump(*out, {.pretty = true}));
*/

/// @defgroup StanzaAPI Top-level API
/// @ingroup Stanza
/// @brief Convenient free functions for parsing, writing and transforming JSON

#include <expected>
#include <string>
#include <string_view>
#include <iosfwd>

#include "stanza/value.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/spec.hpp"
#include "stanza/shift.hpp"
#include "stanza/chain.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Result of the JSON parsing functions
    using ParseResult = std::expected<value, ParseError>;

    /// @ingroup StanzaAPI
    /// @brief Parses a UTF-8 JSON document from a string view
    ///
    /// @details
    /// Example:
    /// @code
    /// auto res = Stanza::parse(R"({"x":42})");
    /// if (!res) std::println(stderr, "{}:{}: {}", res.error().line, res.error().column, res.error().msg);
    /// @endcode
    [[nodiscard]] STANZA_API ParseResult parse(std::string_view input, const ParseOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Reads @p is to the end and parses it as a JSON document
    [[nodiscard]] STANZA_API ParseResult parse(std::istream& is, const ParseOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Serializes a JSON DOM value to a string
    [[nodiscard]] STANZA_API std::string dump(const value& v, const WriteOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Serializes a JSON DOM value to an output stream
    STANZA_API void dump(const value& v, std::ostream& os, const WriteOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Applies a spec document to @p source.
    ///
    /// @details
    /// @p spec_document is either a single operation envelope
    /// `{"operation":"shift","spec":{...}}` or an array of envelopes applied
    /// in order. Equivalent to `Chain::from_document(spec_document)` followed
    /// by `Chain::apply(source, opts)`; callers transforming many sources with
    /// one spec should build the `Chain` once instead.
    ///
    /// @return The transformed document, or the first fatal `TransformError`.
    [[nodiscard]] STANZA_API TransformResult transform(const value& source, const value& spec_document, const TransformOptions& opts = {});

} // namespace Stanza
