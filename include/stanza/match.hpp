#pragma once


/*
    ---------------------------------------
    Stanza matcher - key patterns vs. source
    ---------------------------------------
    While the spec tree is walked alongside the source, every matched key
    pushes a `MatchFrame` holding the key, its captures and the source node
    it selected. `&(levels_up, capture)` and `@(levels_up, ...)` tokens read
    those frames; level 0 is the innermost frame.

    The stack always holds a root frame: key "", captures {""}, node = the
    source document.
*/

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/spec.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaMatch Matcher
/// @ingroup Stanza
/// @brief Pattern matching of source keys and the capture stack

namespace Stanza {

    /// @ingroup StanzaMatch
    /// @brief A source key matched at one level of the walk.
    struct MatchFrame {
        std::string key{};
        std::vector<std::string> captures{};
        const value* node = nullptr;
    };

    /// @ingroup StanzaMatch
    /// @brief The frames from the source root down to the current node.
    class MatchStack {
    public:
        STANZA_API explicit MatchStack(const value& root);

        STANZA_API void push(MatchFrame frame);
        STANZA_API void pop() noexcept;

        /// @brief Frame @p levels_up levels above the innermost, or null past the root.
        [[nodiscard]] STANZA_API const MatchFrame* frame(size_t levels_up) const noexcept;

        /// @brief Capture named by @p ref, or nothing when it is out of range.
        [[nodiscard]] STANZA_API std::optional<std::string_view> capture(const CaptureRef& ref) const noexcept;

        /// @brief Number of frames below the root frame.
        [[nodiscard]] size_t depth() const noexcept { return m_Frames.size() - 1; }

        /// @brief `/`-joined keys of the frames below the root, for diagnostics.
        [[nodiscard]] STANZA_API std::string path() const;

    private:
        std::vector<MatchFrame> m_Frames;
    };

    /// @ingroup StanzaMatch
    /// @brief Result of matching one pattern against one source key.
    using Match = MatchFrame;

    /// @ingroup StanzaMatch
    /// @brief Substitutes the captures named by @p t; nothing if a reference is out of range.
    [[nodiscard]] STANZA_API std::optional<std::string> resolve(const Template& t, const MatchStack& stack);

    /// @ingroup StanzaMatch
    /// @brief Keys of a container in enumeration order: object keys, or array indices as decimal strings.
    [[nodiscard]] STANZA_API std::vector<std::string> keys_of(const value& node);

    /// @ingroup StanzaMatch
    /// @brief Matches @p pattern against the children of @p node.
    ///
    /// @details
    /// Only keys listed in @p available are considered; `**` additionally
    /// yields every descendant of a matched child, in pre-order, with its
    /// `.`-joined path relative to @p node as the key. Capture patterns are
    /// resolved against @p stack before matching.
    [[nodiscard]] STANZA_API std::vector<Match> match(const KeyPattern& pattern, const value& node,
                                                      const std::vector<std::string>& available,
                                                      const MatchStack& stack);

    /// @ingroup StanzaMatch
    /// @brief Affix match of @p key against the `*`-separated @p fragments.
    ///
    /// @return The whole key followed by the text matched by each `*`, or nothing.
    [[nodiscard]] STANZA_API std::optional<std::vector<std::string>> match_affix(const std::vector<std::string>& fragments,
                                                                                 std::string_view key);

} // namespace Stanza
