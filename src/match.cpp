#include "stanza/match.hpp"

#include <algorithm>
#include <charconv>


namespace Stanza {

    namespace {
        const value* child_of(const value& node, std::string_view key) {
            if (node.is_object()) return node.find(key);
            if (!node.is_array()) return nullptr;

            size_t idx = 0;
            auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), idx);
            if (ec != std::errc{} || ptr != key.data() + key.size()) return nullptr;
            return node.find(idx);
        }

        void collect_descendants(const value& node, const std::string& prefix, std::vector<Match>& out) {
            for (const auto& key : keys_of(node)) {
                std::string path = prefix + '.' + key;
                const value* child = child_of(node, key);
                out.push_back(Match{ path, { path, path }, child });
                collect_descendants(*child, path, out);
            }
        }
    } // namespace

#pragma region MatchStack

    MatchStack::MatchStack(const value& root) {
        m_Frames.push_back(MatchFrame{ "", { "" }, &root });
    }

    void MatchStack::push(MatchFrame frame) {
        m_Frames.push_back(std::move(frame));
    }

    void MatchStack::pop() noexcept {
        if (m_Frames.size() > 1) m_Frames.pop_back();
    }

    const MatchFrame* MatchStack::frame(size_t levels_up) const noexcept {
        if (levels_up >= m_Frames.size()) return nullptr;
        return &m_Frames[m_Frames.size() - 1 - levels_up];
    }

    std::optional<std::string_view> MatchStack::capture(const CaptureRef& ref) const noexcept {
        const MatchFrame* f = frame(ref.levels_up);
        if (!f || ref.capture >= f->captures.size()) return std::nullopt;
        return std::string_view{ f->captures[ref.capture] };
    }

    std::string MatchStack::path() const {
        std::string out;
        for (size_t i = 1; i < m_Frames.size(); i++) {
            out += '/';
            out += m_Frames[i].key;
        }
        return out;
    }

#pragma endregion

    std::optional<std::string> resolve(const Template& t, const MatchStack& stack) {
        std::string out = t.fragments.front();
        for (size_t i = 0; i < t.refs.size(); i++) {
            auto cap = stack.capture(t.refs[i]);
            if (!cap) return std::nullopt;
            out += *cap;
            out += t.fragments[i + 1];
        }
        return out;
    }

    std::vector<std::string> keys_of(const value& node) {
        std::vector<std::string> keys;
        if (node.is_object()) {
            keys.reserve(node.size());
            for (const auto& [key, _] : node.as_object()) keys.emplace_back(std::string_view{ key });
        } else if (node.is_array()) {
            keys.reserve(node.size());
            for (size_t i = 0; i < node.size(); i++) keys.push_back(std::to_string(i));
        }
        return keys;
    }

    std::optional<std::vector<std::string>> match_affix(const std::vector<std::string>& fragments, std::string_view key) {
        const std::string& head = fragments.front();
        const std::string& tail = fragments.back();
        if (key.size() < head.size() + tail.size()) return std::nullopt;
        if (!key.starts_with(head) || !key.ends_with(tail)) return std::nullopt;

        std::vector<std::string> captures{ std::string{ key } };
        size_t pos = head.size();
        const size_t end = key.size() - tail.size();
        for (size_t i = 1; i + 1 < fragments.size(); i++) {
            size_t found = key.substr(0, end).find(fragments[i], pos);
            if (found == std::string_view::npos) return std::nullopt;
            captures.emplace_back(key.substr(pos, found - pos));
            pos = found + fragments[i].size();
        }
        captures.emplace_back(key.substr(pos, end - pos));
        return captures;
    }

    std::vector<Match> match(const KeyPattern& pattern, const value& node,
                             const std::vector<std::string>& available,
                             const MatchStack& stack) {
        std::vector<Match> out;
        auto is_available = [&](std::string_view key) {
            return std::ranges::find(available, key) != available.end();
        };

        switch (pattern.type) {
        case KeyPattern::kind::literal:
        case KeyPattern::kind::capture: {
            std::string key;
            if (pattern.type == KeyPattern::kind::literal) {
                key = pattern.literal;
            } else {
                auto resolved = resolve(pattern.key, stack);
                if (!resolved) break;
                key = std::move(*resolved);
            }
            if (!is_available(key)) break;
            if (const value* child = child_of(node, key))
                out.push_back(Match{ key, { key }, child });
            break;
        }
        case KeyPattern::kind::affix:
            for (const auto& key : available) {
                auto captures = match_affix(pattern.fragments, key);
                if (!captures) continue;
                out.push_back(Match{ key, std::move(*captures), child_of(node, key) });
            }
            break;
        case KeyPattern::kind::wildcard:
            for (const auto& key : available)
                out.push_back(Match{ key, { key, key }, child_of(node, key) });
            break;
        case KeyPattern::kind::deep_wildcard:
            for (const auto& key : available) {
                const value* child = child_of(node, key);
                out.push_back(Match{ key, { key, key }, child });
                collect_descendants(*child, key, out);
            }
            break;
        case KeyPattern::kind::key_of:
        case KeyPattern::kind::constant:
            break;
        }
        return out;
    }

} // namespace Stanza
