#pragma once


/*
    ------------------------------------------
    Stanza output tree - collision-merging writer
    ------------------------------------------
    `OutputTree` collects the writes of one transformation call. Paths are
    already resolved: every segment is a concrete field name, array index or
    the append marker.

    Containers are created on demand: a field segment creates an object, an
    index or append segment an array (padded with nulls up to the index).

    At the terminal slot:
        - the first write stores the value as-is
        - every later write turns the slot into an array holding all written
          values in write order; a written array is flattened one level
        - `[]` appends the value as one element; a scalar already in the slot
          is first wrapped into a one-element array

    A segment meeting a container of the wrong shape fails with
    `TransformError::code::path_type_conflict`, and an index more than
    `max_padding` past the end of its array with
    `TransformError::code::index_out_of_range`. Writes are never undone.

    Written values are deep-copied into the tree's memory resource.
*/

#include <cstddef>
#include <expected>
#include <memory_resource>
#include <string>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/spec.hpp"
#include "stanza/value.hpp"

namespace Stanza {

    /// @ingroup StanzaSpec
    /// @brief A concrete output-path segment.
    struct ResolvedSegment {
        PathSegment::kind type = PathSegment::kind::field;
        std::string key{};  ///< `field` name.
        size_t index = 0;   ///< `index` position.
    };

    using ResolvedPath = std::vector<ResolvedSegment>;

    /// @brief Renders @p path as `a.b[2][]`, for diagnostics.
    [[nodiscard]] STANZA_API std::string to_string(const ResolvedPath& path);

    /// @brief The document built by one transformation call.
    class OutputTree {
    public:
        /// @brief Most nulls one index segment may add to an array.
        static constexpr size_t max_padding = 65536;

        STANZA_API explicit OutputTree(std::pmr::memory_resource* resource = std::pmr::get_default_resource());

        /// @brief Writes a copy of @p v at @p path, merging collisions.
        STANZA_API std::expected<void, TransformError> write(const ResolvedPath& path, const value& v);

        [[nodiscard]] const value& root() const noexcept { return m_Root; }

        /// @brief Releases the document; null when nothing was written.
        [[nodiscard]] STANZA_API value take() &&;

        [[nodiscard]] size_t writes() const noexcept { return m_Writes; }

    private:
        std::pmr::memory_resource* m_Resource;
        value m_Root;
        bool m_RootWritten = false;
        size_t m_Writes = 0;
    };

} // namespace Stanza
