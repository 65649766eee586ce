#pragma once


/*
    -----------------------------------
    Stanza shift - the transformation engine
    -----------------------------------
    `Shift::build` validates a raw spec object once; `Shift::apply` walks the
    spec tree and the source in lockstep:

        Leaf    every output path is resolved against the match stack and
                the current source value is written there
        Branch  `$`/`#` rules write first; then each rule, in precedence
                order, claims the still-unclaimed keys it matches and
                recurses into them

    A branch over a scalar source matches nothing. Unresolvable `@`
    references and non-integral indices drop that single write. Only
    `spec_syntax` (from `build`) and `path_type_conflict` (from `apply`)
    are errors.

    A built `Shift` is immutable; copies share the spec tree and may be
    applied from any number of threads at once.
*/

#include <expected>
#include <memory>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/spec.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaShift Shift Engine
/// @ingroup Stanza
/// @brief Building and applying shift specifications

namespace Stanza {

    /// @ingroup StanzaShift
    /// @brief Result of applying a transformation.
    using TransformResult = std::expected<value, TransformError>;

    /// @ingroup StanzaShift
    /// @brief A validated shift specification.
    class Shift {
    public:
        /// @brief Builds a shift from the object found under an envelope's `"spec"` member.
        [[nodiscard]] STANZA_API static std::expected<Shift, TransformError> build(const value& raw);

        /// @brief Applies the shift to @p source.
        ///
        /// @return The output document (null when nothing was written), or a
        ///         `path_type_conflict` error.
        [[nodiscard]] STANZA_API TransformResult apply(const value& source, const TransformOptions& opts = {}) const;

        [[nodiscard]] const SpecNode& root() const noexcept { return *m_Root; }

    private:
        explicit Shift(std::shared_ptr<const SpecNode> root) noexcept : m_Root{ std::move(root) } {}

        std::shared_ptr<const SpecNode> m_Root;
    };

} // namespace Stanza
