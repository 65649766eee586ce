#include "stanza/chain.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "stanza/stanza.hpp"


namespace Stanza {

    namespace {
        std::unexpected<TransformError> envelope_error(std::string_view path, std::string_view msg) {
            return std::unexpected(TransformError::make(TransformError::code::spec_syntax, path, msg));
        }

        std::expected<Shift, TransformError> build_step(const value& envelope, std::string_view prefix) {
            if (!envelope.is_object())
                return envelope_error(prefix, std::format("an operation must be an object, found {}", kind_name(envelope.type())));

            const value* op = envelope.find("operation");
            if (!op) return envelope_error(prefix, "missing \"operation\"");
            if (!op->is_string())
                return envelope_error(std::format("{}/operation", prefix), std::format("expected a string, found {}", kind_name(op->type())));
            if (op->as_string() != "shift")
                return envelope_error(std::format("{}/operation", prefix), std::format("unsupported operation '{}'", std::string_view{ op->as_string() }));

            const value* spec = envelope.find("spec");
            if (!spec) return envelope_error(prefix, "missing \"spec\"");

            auto shift = Shift::build(*spec);
            if (!shift) {
                auto e = std::move(shift.error());
                e.path = std::format("{}/spec{}", prefix, e.path);
                return std::unexpected(std::move(e));
            }
            return shift;
        }
    } // namespace

    std::expected<Chain, TransformError> Chain::from_document(const value& document) {
        Chain chain;
        if (!document.is_array()) {
            auto step = build_step(document, "");
            if (!step) return std::unexpected(std::move(step.error()));
            chain.m_Steps.push_back(std::move(*step));
            return chain;
        }

        const auto& envelopes = document.as_array();
        chain.m_Steps.reserve(envelopes.size());
        for (size_t i = 0; i < envelopes.size(); i++) {
            auto step = build_step(envelopes[i], std::format("/{}", i));
            if (!step) return std::unexpected(std::move(step.error()));
            chain.m_Steps.push_back(std::move(*step));
        }
        return chain;
    }

    TransformResult Chain::apply(const value& source, const TransformOptions& opts) const {
        auto logger = opts.logger ? opts.logger : spdlog::default_logger();

        value current = source;
        for (size_t i = 0; i < m_Steps.size(); i++) {
            logger->debug("chain step {}/{}", i + 1, m_Steps.size());
            auto next = m_Steps[i].apply(current, opts);
            if (!next) return std::unexpected(std::move(next.error()));
            current = std::move(*next);
        }
        return current;
    }

    TransformResult transform(const value& source, const value& spec_document, const TransformOptions& opts) {
        auto chain = Chain::from_document(spec_document);
        if (!chain) return std::unexpected(std::move(chain.error()));
        return chain->apply(source, opts);
    }

} // namespace Stanza
