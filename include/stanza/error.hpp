#pragma once


/*
    ---------------------------------------------
    Stanza error reporting - parse and transform
    ---------------------------------------------
    Stanza never throws across its public API. Every fallible operation
    returns `std::expected<T, E>` where `E` is one of the plain aggregates
    declared here:

    - `Stanza::ParseError`
        * produced by `Stanza::parse(...)` when raw text is not valid JSON
        * carries a code, byte offset, 1-based line and column and a message
    - `Stanza::TransformError`
        * produced while building a shift spec or applying it to a source
        * `code::spec_syntax`: the spec document violates the shape or token
          rules (a branch value that is not a string, list of strings or
          object, malformed `&`/`@` syntax, a top level that is not an
          object, ...). `path` names the offending spec position, e.g.
          `/user/location/*`
        * `code::path_type_conflict`: a write met an existing output
          container of the wrong shape (a field write into an array, an
          index write into an object). `path` names the output path
        * `code::index_out_of_range`: an index segment would pad an output
          array with more than `OutputTree::max_padding` nulls
        * An ordinary collision (two writes to one path) is not an error,
          and neither is a spec key that matches nothing in the source

    Both error kinds abort the whole call; no partial result is returned
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Errors
/// @ingroup Stanza
/// @brief Error codes and structures produced by parsing and transformation
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced during JSON parsing.
    ///
    /// @details
    /// - **errc** - a classification of the error
    /// - **offset** - byte offset from the start of input where the error occurred
    /// - **line** - 1-based line number of the error position
    /// - **column** - 1-based column number (byte offset within the line)
    /// - **msg** - human-readable explanation of the error
    struct ParseError {
        /// @brief Enumeration of error categories detected by the parser.
        ///
        /// @details
        /// - `unexpected_character` - invalid character for the current state
        /// - `invalid_number` - leading zeros, malformed exponent or fraction
        /// - `invalid_string` - control character, bad UTF-8, missing quote
        /// - `invalid_escape` - unknown escape sequence such as `\k`
        /// - `invalid_unicode_escape` - bad `\uXXXX` or unpaired surrogate
        /// - `unexpected_end_of_input` - input ended mid-value
        /// - `trailing_characters` - extra non-whitespace after the value
        /// - `depth_limit_exceeded` - nesting deeper than `ParseOptions::max_depth`
        enum class code : uint8_t {
            unexpected_character,
            invalid_number,
            invalid_string,
            invalid_escape,
            invalid_unicode_escape,
            unexpected_end_of_input,
            trailing_characters,
            depth_limit_exceeded,
        };

        code errc{};            ///< The classification of the parsing error.
        std::size_t offset{};   ///< Byte offset from the beginning of the input.
        std::size_t line{};     ///< Line number where the error occurred (1-based).
        std::size_t column{};   ///< Column number where the error occurred (1-based).
        std::string msg{};      ///< Human-readable diagnostic message.

        /// @brief Constructs a fully-populated `ParseError` instance.
        STANZA_API static ParseError make(code c, size_t o, size_t l, size_t col, std::string_view m);
    };

    /// @ingroup StanzaError
    /// @brief Structured error produced while building or applying a shift spec.
    ///
    /// @details
    /// Example:
    /// @code
    /// auto res = Stanza::transform(source, spec_document);
    /// if (!res && res.error().errc == Stanza::TransformError::code::spec_syntax) {
    ///     std::println(stderr, "{}", res.error().what());
    /// }
    /// @endcode
    struct TransformError {
        /// @brief Fatal error categories of a transformation call.
        enum class code : uint8_t {
            spec_syntax,        ///< The spec document is malformed (SpecSyntaxError).
            path_type_conflict, ///< An output write met an incompatible container (PathTypeConflictError).
            index_out_of_range, ///< An output index lies too far past the end of its array (IndexRangeError).
        };

        code errc{};        ///< The classification of the failure.
        std::string path{}; ///< Spec path (`/a/*/b`) or output path (`a.b[2]`) of the failure.
        std::string msg{};  ///< Human-readable diagnostic message.

        /// @brief Constructs a fully-populated `TransformError` instance.
        STANZA_API static TransformError make(code c, std::string_view path, std::string_view m);

        /// @brief Renders the error as `<kind> at <path>: <msg>`.
        [[nodiscard]] STANZA_API std::string what() const;
    };

    /// @ingroup StanzaError
    /// @brief Name of a transform error category (`SpecSyntaxError`, `PathTypeConflictError`, `IndexRangeError`).
    [[nodiscard]] STANZA_API std::string_view code_name(TransformError::code c) noexcept;

} // namespace Stanza
