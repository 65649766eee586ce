#include "stanza/shift.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <optional>

#include <spdlog/spdlog.h>

#include "stanza/match.hpp"
#include "stanza/output.hpp"


namespace Stanza {

    namespace {
        using expected_void = std::expected<void, TransformError>;

        std::optional<size_t> to_index(std::string_view text) {
            size_t idx = 0;
            if (text.empty()) return std::nullopt;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), idx);
            if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
            return idx;
        }

        // Strings verbatim; numbers in shortest round-trip form (integral ones
        // without a fraction); booleans as true/false. Nothing for the rest.
        std::optional<std::string> scalar_text(const value& v) {
            switch (v.type()) {
            case kind::string: return std::string{ std::string_view{ v.as_string() } };
            case kind::number: {
                double d = v.as_number();
                if (std::trunc(d) == d && std::fabs(d) < 0x1p53)
                    return std::format("{}", static_cast<long long>(d));
                return std::format("{}", d);
            }
            case kind::boolean: return std::string{ v.as_bool() ? "true" : "false" };
            default: return std::nullopt;
            }
        }

        struct FrameGuard {
            MatchStack& stack;

            FrameGuard(MatchStack& s, MatchFrame frame) : stack{ s } { stack.push(std::move(frame)); }
            ~FrameGuard() { stack.pop(); }

            FrameGuard(const FrameGuard&) = delete;
            FrameGuard& operator=(const FrameGuard&) = delete;
        };

        class Walker {
        public:
            Walker(OutputTree& tree, MatchStack& stack, spdlog::logger& log, std::pmr::memory_resource* res)
                : m_Tree{ tree }, m_Stack{ stack }, m_Log{ log }, m_Resource{ res } {}

            expected_void visit(const SpecNode& spec, const value& node) {
                if (m_Log.should_log(spdlog::level::trace))
                    m_Log.trace("visit '{}' ({})", m_Stack.path(), kind_name(node.type()));

                if (spec.is_leaf()) return emit(spec.leaf(), node);
                return visit_branch(spec.branch(), node);
            }

        private:
            expected_void visit_branch(const Branch& branch, const value& node) {
                for (const auto& rule : branch.emitters) {
                    std::string text;
                    if (rule.pattern.type == KeyPattern::kind::key_of) {
                        auto cap = m_Stack.capture(rule.pattern.ref);
                        if (!cap) {
                            m_Log.trace("'{}' at '{}' has no capture to write", rule.pattern.raw, m_Stack.path());
                            continue;
                        }
                        text.assign(*cap);
                    } else {
                        text = rule.pattern.literal;
                    }

                    FrameGuard guard{ m_Stack, MatchFrame{ text, { text }, nullptr } };
                    if (auto r = emit(rule.child.leaf(), value{ std::string_view{ text }, m_Resource }); !r) return r;
                }

                if (!node.is_container()) {
                    if (!branch.rules.empty())
                        m_Log.trace("'{}' is {}, no keys to match", m_Stack.path(), kind_name(node.type()));
                    return {};
                }

                auto available = keys_of(node);
                for (const auto& rule : branch.rules) {
                    if (available.empty()) break;

                    auto matches = match(rule.pattern, node, available, m_Stack);
                    for (const auto& m : matches) {
                        m_Log.trace("'{}' matched '{}' at '{}'", rule.pattern.raw, m.key, m_Stack.path());
                        FrameGuard guard{ m_Stack, m };
                        if (auto r = visit(rule.child, *m.node); !r) return r;
                    }

                    if (rule.pattern.type == KeyPattern::kind::deep_wildcard) {
                        available.clear();
                        continue;
                    }
                    for (const auto& m : matches)
                        std::erase(available, m.key);
                }
                return {};
            }

            expected_void emit(const Leaf& leaf, const value& v) {
                for (const auto& path : leaf.paths) {
                    auto resolved = resolve_path(path);
                    if (!resolved) {
                        m_Log.trace("write to '{}' at '{}' suppressed: unresolved reference", path.raw, m_Stack.path());
                        continue;
                    }
                    if (auto r = m_Tree.write(*resolved, v); !r) return r;
                }
                return {};
            }

            std::optional<std::string> resolve_value(const ValueRef& ref) const {
                const MatchFrame* frame = m_Stack.frame(ref.levels_up);
                if (!frame || !frame->node) return std::nullopt;

                const value* cur = frame->node;
                for (const auto& segment : ref.path) {
                    auto key = resolve(segment, m_Stack);
                    if (!key) return std::nullopt;
                    if (cur->is_object()) {
                        cur = cur->find(std::string_view{ *key });
                    } else if (auto idx = to_index(*key); idx && cur->is_array()) {
                        cur = cur->find(*idx);
                    } else {
                        cur = nullptr;
                    }
                    if (!cur) return std::nullopt;
                }
                return scalar_text(*cur);
            }

            std::optional<ResolvedPath> resolve_path(const OutputPath& path) const {
                ResolvedPath out;
                out.reserve(path.segments.size());
                for (const auto& seg : path.segments) {
                    ResolvedSegment r{ .type = seg.type };
                    if (seg.type == PathSegment::kind::append) {
                        out.push_back(std::move(r));
                        continue;
                    }

                    std::optional<std::string> text;
                    if (const auto* t = std::get_if<Template>(&seg.token)) {
                        text = resolve(*t, m_Stack);
                    } else {
                        text = resolve_value(std::get<ValueRef>(seg.token));
                    }
                    if (!text) return std::nullopt;

                    if (seg.type == PathSegment::kind::field) {
                        r.key = std::move(*text);
                    } else {
                        auto idx = to_index(*text);
                        if (!idx) return std::nullopt;
                        r.index = *idx;
                    }
                    out.push_back(std::move(r));
                }
                return out;
            }

            OutputTree& m_Tree;
            MatchStack& m_Stack;
            spdlog::logger& m_Log;
            std::pmr::memory_resource* m_Resource;
        };
    } // namespace

    std::expected<Shift, TransformError> Shift::build(const value& raw) {
        auto root = build_spec(raw);
        if (!root) {
            spdlog::debug("shift spec rejected: {}", root.error().what());
            return std::unexpected(std::move(root.error()));
        }
        spdlog::debug("built shift spec with {} rule(s) at the top level", root->branch().rules.size() + root->branch().emitters.size());
        return Shift{ std::make_shared<const SpecNode>(std::move(*root)) };
    }

    TransformResult Shift::apply(const value& source, const TransformOptions& opts) const {
        auto logger = opts.logger ? opts.logger : spdlog::default_logger();

        MatchStack stack{ source };
        OutputTree tree{ opts.resource };
        Walker walker{ tree, stack, *logger, opts.resource };

        if (auto r = walker.visit(*m_Root, source); !r) {
            logger->debug("shift failed: {}", r.error().what());
            return std::unexpected(std::move(r.error()));
        }
        logger->debug("shift produced {} write(s)", tree.writes());
        return std::move(tree).take();
    }

} // namespace Stanza
