#pragma once


/*
    -----------------------------
    Stanza chain - operation lists
    -----------------------------
    A spec document is one operation envelope or an array of them:

        {"operation": "shift", "spec": { ... }}
        [ {"operation": "shift", "spec": {...}}, {"operation": "shift", "spec": {...}} ]

    Every step's output is the next step's source. An empty array returns
    the source unchanged. Only the `shift` operation is supported.
*/

#include <cstddef>
#include <expected>
#include <span>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/shift.hpp"
#include "stanza/value.hpp"

namespace Stanza {

    /// @ingroup StanzaShift
    /// @brief An ordered list of built shifts.
    class Chain {
    public:
        /// @brief Builds every envelope of @p document.
        ///
        /// @details Errors are `spec_syntax`; their path is prefixed with the
        /// envelope position, e.g. `/1/spec/user/*`.
        [[nodiscard]] STANZA_API static std::expected<Chain, TransformError> from_document(const value& document);

        /// @brief Applies every step in order.
        [[nodiscard]] STANZA_API TransformResult apply(const value& source, const TransformOptions& opts = {}) const;

        [[nodiscard]] size_t size() const noexcept { return m_Steps.size(); }
        [[nodiscard]] std::span<const Shift> steps() const noexcept { return m_Steps; }

    private:
        std::vector<Shift> m_Steps;
    };

} // namespace Stanza
