#pragma once


/*
    ------------------------------------------------------
    Stanza parsing, writing and transformation options
    ------------------------------------------------------
    Plain aggregates suitable for brace-initialization:

    - `ParseOptions`     controls `Stanza::parse(...)` (JSON text -> DOM)
    - `WriteOptions`     controls `Stanza::dump(...)`  (DOM -> JSON text)
    - `TransformOptions` controls `Shift::apply`, `Chain::apply` and
                         `Stanza::transform`

    -----
    Usage
    -----
        auto doc = Stanza::parse(text, { .allow_comments = true });
        auto out = Stanza::transform(*src, *doc, { .logger = my_logger });
        std::string json = Stanza::dump(*out, { .pretty = true, .indent = 4 });
*/


#include <cstddef>
#include <memory>
#include <memory_resource>

#include <spdlog/logger.h>

/// @defgroup StanzaOptions Options
/// @ingroup Stanza
/// @brief Configuration objects controlling parsing, serialization and transformation

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Configuration controlling JSON parsing behavior
    ///
    /// @details
    /// Strict RFC 8259 by default.
    /// - `allow_comments` accepts `//` and `/* */` comments
    /// - `allow_trailing_commas` accepts `[1,2,]` and `{"a":1,}`
    /// - `max_depth` limits array/object nesting; `0` means no limit
    struct ParseOptions {
        bool allow_comments = false;
        bool allow_trailing_commas = false;
        size_t max_depth = 0;
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration options controlling JSON serialization (dumping).
    ///
    /// @details
    /// Objects are written in member order. `sort_keys` writes them in
    /// lexicographic key order instead, so structurally equal values dump to
    /// the same text.
    struct WriteOptions {
        bool pretty = false;        ///< Enable pretty-printing (formatted output).
        std::size_t indent = 2;     ///< Number of spaces per indentation level.
        bool sort_keys = false;     ///< Sort object keys before writing if true.
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration for applying shift specs.
    ///
    /// @details
    /// `logger`
    ///   - Receives `debug` records per applied operation and `trace`
    ///     records per visited node, match and suppressed write.
    ///   - When null, `spdlog::default_logger()` is used.
    ///
    /// `resource`
    ///   - Memory resource backing the whole output tree. Values taken from
    ///     the source are deep-copied into it, so the result does not depend
    ///     on the source outliving the call.
    struct TransformOptions {
        std::shared_ptr<spdlog::logger> logger{};
        std::pmr::memory_resource* resource = std::pmr::get_default_resource();
    };

} // namespace Stanza
