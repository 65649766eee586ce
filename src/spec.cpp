#include "stanza/spec.hpp"

#include <algorithm>
#include <charconv>
#include <format>


namespace Stanza {

    namespace {
        using expected_void = std::expected<void, TransformError>;
        template<typename T>
        using expected_t = std::expected<T, TransformError>;

        bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        bool is_special(char c) noexcept {
            switch (c) {
            case '.': case '[': case ']': case '(': case ')':
            case '*': case '&': case '@': case '$': case '#':
            case '|': case '\\':
                return true;
            default:
                return false;
            }
        }

        std::unexpected<TransformError> syntax_error(std::string_view path, std::string_view msg) {
            return std::unexpected(TransformError::make(TransformError::code::spec_syntax, path, msg));
        }

#pragma region Tokens
        // ================================
        // Key and output-path tokenizer
        // ================================

        struct Cursor {
            std::string_view text;
            size_t idx = 0;

            [[nodiscard]] bool eof() const noexcept { return idx >= text.size(); }
            [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : text[idx]; }
            char get() noexcept { return eof() ? '\0' : text[idx++]; }

            bool consume(char c) noexcept {
                if (eof() || text[idx] != c) return false;
                idx++;
                return true;
            }

            [[nodiscard]] std::unexpected<TransformError> fail(std::string_view msg) const {
                return syntax_error({}, std::format("'{}': {} at offset {}", text, msg, idx));
            }
        };

        expected_t<size_t> parse_index(Cursor& c) {
            size_t start = c.idx;
            while (is_digit(c.peek())) c.get();
            if (start == c.idx) return c.fail("expected a numeric index");

            size_t n = 0;
            auto digits = c.text.substr(start, c.idx - start);
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
            if (ec != std::errc{}) return c.fail("index out of range");
            return n;
        }

        // `&`, `&N`, `&(N)`, `&(N,M)` and the same forms with `$`.
        expected_t<CaptureRef> parse_reference(Cursor& c, char sigil) {
            c.get();
            CaptureRef ref;
            if (is_digit(c.peek())) {
                auto levels = parse_index(c);
                if (!levels) return std::unexpected(levels.error());
                ref.levels_up = *levels;
                return ref;
            }
            if (!c.consume('(')) return ref;

            auto levels = parse_index(c);
            if (!levels) return std::unexpected(levels.error());
            ref.levels_up = *levels;
            if (c.consume(',')) {
                auto capture = parse_index(c);
                if (!capture) return std::unexpected(capture.error());
                ref.capture = *capture;
            }
            if (!c.consume(')')) return c.fail(std::format("unbalanced parenthesis in '{}' reference", sigil));
            return ref;
        }

        // Reads literal text and `&` references up to one of `stops`. In strict
        // (output path) mode, brackets and parentheses must be balanced tokens.
        expected_t<Template> parse_template(Cursor& c, std::string_view stops, bool strict) {
            Template t;
            while (!c.eof() && stops.find(c.peek()) == std::string_view::npos) {
                char ch = c.peek();
                if (ch == '\\') {
                    c.get();
                    if (c.eof()) return c.fail("unterminated escape sequence");
                    char esc = c.get();
                    if (!is_special(esc)) return c.fail(std::format("unknown escape sequence '\\{}'", esc));
                    t.fragments.back() += esc;
                    continue;
                }
                if (ch == '&') {
                    auto ref = parse_reference(c, '&');
                    if (!ref) return std::unexpected(ref.error());
                    t.refs.push_back(*ref);
                    t.fragments.emplace_back();
                    continue;
                }
                if (strict) {
                    if (ch == '(' || ch == ')') return c.fail("unbalanced parenthesis");
                    if (ch == '[' || ch == ']') return c.fail("unbalanced bracket");
                    if (ch == '@') return c.fail("'@' reference must start a path segment");
                    if (ch == '*') return c.fail("'*' is not allowed in an output path");
                }
                t.fragments.back() += c.get();
            }
            return t;
        }

        // `@`, `@N`, `@(N)`, `@(N,a.b.c)`
        expected_t<ValueRef> parse_value_ref(Cursor& c) {
            c.get();
            ValueRef ref;
            if (is_digit(c.peek())) {
                auto levels = parse_index(c);
                if (!levels) return std::unexpected(levels.error());
                ref.levels_up = *levels;
                return ref;
            }
            if (!c.consume('(')) return ref;

            auto levels = parse_index(c);
            if (!levels) return std::unexpected(levels.error());
            ref.levels_up = *levels;
            if (c.consume(',')) {
                do {
                    auto segment = parse_template(c, ".)", true);
                    if (!segment) return std::unexpected(segment.error());
                    if (segment->empty()) return c.fail("empty segment in '@' path");
                    ref.path.push_back(std::move(*segment));
                } while (c.consume('.'));
            }
            if (!c.consume(')')) return c.fail("unbalanced parenthesis in '@' reference");
            return ref;
        }

        expected_t<std::string> unescape(std::string_view text) {
            Cursor c{ text };
            std::string out;
            while (!c.eof()) {
                char ch = c.get();
                if (ch != '\\') {
                    out += ch;
                    continue;
                }
                if (c.eof()) return c.fail("unterminated escape sequence");
                char esc = c.get();
                if (!is_special(esc)) return c.fail(std::format("unknown escape sequence '\\{}'", esc));
                out += esc;
            }
            return out;
        }

        bool contains_unescaped(std::string_view text, char needle) noexcept {
            for (size_t i = 0; i < text.size(); i++) {
                if (text[i] == '\\') i++;
                else if (text[i] == needle) return true;
            }
            return false;
        }

        // Splits on unescaped `sep`, keeping escapes for the later stages.
        std::vector<std::string> split_unescaped(std::string_view text, char sep) {
            std::vector<std::string> parts(1);
            for (size_t i = 0; i < text.size(); i++) {
                if (text[i] == '\\') {
                    parts.back() += text[i];
                    if (i + 1 < text.size()) parts.back() += text[++i];
                } else if (text[i] == sep) {
                    parts.emplace_back();
                } else {
                    parts.back() += text[i];
                }
            }
            return parts;
        }

        expected_t<std::vector<std::string>> split_alternatives(std::string_view key) {
            auto alternatives = split_unescaped(key, '|');
            if (alternatives.size() > 1) {
                for (const auto& alt : alternatives)
                    if (alt.empty()) return syntax_error({}, std::format("'{}': empty alternative", key));
            }
            return alternatives;
        }
#pragma endregion

    } // namespace

    size_t KeyPattern::capture_count() const noexcept {
        switch (type) {
        case kind::affix: return fragments.size();
        case kind::wildcard:
        case kind::deep_wildcard: return 2;
        default: return 1;
        }
    }

    std::expected<KeyPattern, TransformError> parse_key_pattern(std::string_view text) {
        KeyPattern p;
        p.raw.assign(text);

        if (text == "*") {
            p.type = KeyPattern::kind::wildcard;
            return p;
        }
        if (text == "**") {
            p.type = KeyPattern::kind::deep_wildcard;
            return p;
        }
        if (text.starts_with('$')) {
            Cursor c{ text };
            auto ref = parse_reference(c, '$');
            if (!ref) return std::unexpected(ref.error());
            if (!c.eof()) return c.fail("unexpected characters after '$' reference");
            p.type = KeyPattern::kind::key_of;
            p.ref = *ref;
            return p;
        }
        if (text.starts_with('#')) {
            auto lit = unescape(text.substr(1));
            if (!lit) return std::unexpected(lit.error());
            p.type = KeyPattern::kind::constant;
            p.literal = std::move(*lit);
            return p;
        }
        if (text.starts_with('@')) return syntax_error({}, std::format("'{}': '@' references are only supported in output paths", text));

        const bool has_capture = contains_unescaped(text, '&');
        const bool has_wildcard = contains_unescaped(text, '*');
        if (has_capture && has_wildcard) return syntax_error({}, std::format("'{}': a key cannot combine '&' and '*'", text));

        if (has_capture) {
            Cursor c{ text };
            auto key = parse_template(c, {}, false);
            if (!key) return std::unexpected(key.error());
            p.type = KeyPattern::kind::capture;
            p.key = std::move(*key);
            return p;
        }

        if (has_wildcard) {
            p.type = KeyPattern::kind::affix;
            for (const auto& part : split_unescaped(text, '*')) {
                auto fragment = unescape(part);
                if (!fragment) return std::unexpected(fragment.error());
                p.fragments.push_back(std::move(*fragment));
            }
            return p;
        }

        auto lit = unescape(text);
        if (!lit) return std::unexpected(lit.error());
        p.literal = std::move(*lit);
        return p;
    }

    std::expected<OutputPath, TransformError> parse_output_path(std::string_view text) {
        OutputPath path;
        path.raw.assign(text);
        if (text.empty()) return path;

        Cursor c{ text };
        while (true) {
            PathSegment seg;
            if (c.consume('[')) {
                if (c.consume(']')) {
                    seg.type = PathSegment::kind::append;
                } else {
                    seg.type = PathSegment::kind::index;
                    if (c.peek() == '@') {
                        auto ref = parse_value_ref(c);
                        if (!ref) return std::unexpected(ref.error());
                        seg.token = std::move(*ref);
                    } else {
                        auto idx = parse_template(c, ".[]", true);
                        if (!idx) return std::unexpected(idx.error());
                        if (idx->is_literal() && !std::ranges::all_of(idx->fragments.front(), is_digit))
                            return c.fail("non-numeric array index");
                        seg.token = std::move(*idx);
                    }
                    if (!c.consume(']')) return c.fail("unbalanced bracket, expected ']'");
                }
            } else if (c.peek() == '@') {
                auto ref = parse_value_ref(c);
                if (!ref) return std::unexpected(ref.error());
                seg.token = std::move(*ref);
            } else {
                auto field = parse_template(c, ".[]", true);
                if (!field) return std::unexpected(field.error());
                if (field->empty()) return c.fail("empty path segment");
                seg.token = std::move(*field);
            }
            path.segments.push_back(std::move(seg));

            if (c.eof()) break;
            if (c.consume('.')) {
                if (c.eof() || c.peek() == '.' || c.peek() == '[') return c.fail("empty path segment");
                continue;
            }
            if (c.peek() == '[') continue;
            return c.fail(std::format("unexpected '{}'", c.peek()));
        }
        return path;
    }

#pragma region Builder
    // ================================
    // Spec tree builder
    // ================================

    namespace {

        struct Builder {
            // Capture count of every frame the matcher will have pushed at the
            // current position; the root frame holds a single capture.
            std::vector<size_t> levels{ 1 };
            std::vector<std::string> keys{};

            [[nodiscard]] std::string path() const {
                std::string out;
                for (const auto& k : keys) {
                    out += '/';
                    out += k;
                }
                return out;
            }

            [[nodiscard]] std::unexpected<TransformError> fail(std::string_view msg) const {
                return syntax_error(path(), msg);
            }

            [[nodiscard]] std::unexpected<TransformError> relocate(TransformError e) const {
                e.path = path();
                return std::unexpected(std::move(e));
            }

            expected_void check(const CaptureRef& ref) const {
                if (ref.levels_up >= levels.size())
                    return fail(std::format("reference &({},{}) reaches above the root", ref.levels_up, ref.capture));
                size_t captures = levels[levels.size() - 1 - ref.levels_up];
                if (ref.capture >= captures)
                    return fail(std::format("reference &({},{}) names capture {} of a level with {} capture(s)", ref.levels_up, ref.capture, ref.capture, captures));
                return {};
            }

            expected_void check(const Template& t) const {
                for (const auto& ref : t.refs)
                    if (auto r = check(ref); !r) return r;
                return {};
            }

            expected_void check(const OutputPath& p) const {
                for (const auto& seg : p.segments) {
                    if (seg.type == PathSegment::kind::append) continue;
                    if (const auto* t = std::get_if<Template>(&seg.token)) {
                        if (auto r = check(*t); !r) return r;
                        continue;
                    }
                    const auto& ref = std::get<ValueRef>(seg.token);
                    if (ref.levels_up >= levels.size())
                        return fail(std::format("reference @({}) in '{}' reaches above the root", ref.levels_up, p.raw));
                    for (const auto& t : ref.path)
                        if (auto r = check(t); !r) return r;
                }
                return {};
            }

            expected_t<Leaf> leaf(const value& raw) {
                Leaf l;
                auto add = [&](std::string_view text) -> expected_void {
                    auto p = parse_output_path(text);
                    if (!p) return relocate(std::move(p.error()));
                    if (auto r = check(*p); !r) return r;
                    l.paths.push_back(std::move(*p));
                    return {};
                };

                if (raw.is_string()) {
                    if (auto r = add(raw.as_string()); !r) return std::unexpected(r.error());
                    return l;
                }
                const auto& items = raw.as_array();
                for (size_t i = 0; i < items.size(); i++) {
                    if (!items[i].is_string())
                        return fail(std::format("element {} of an output path list is {}, expected a string", i, kind_name(items[i].type())));
                    if (auto r = add(items[i].as_string()); !r) return std::unexpected(r.error());
                }
                return l;
            }

            expected_t<SpecNode> node(const value& raw) {
                switch (raw.type()) {
                case kind::object:
                    return branch(raw.as_object());
                case kind::string:
                case kind::array: {
                    auto l = leaf(raw);
                    if (!l) return std::unexpected(l.error());
                    return SpecNode{ std::move(*l) };
                }
                default:
                    return fail(std::format("expected a string, a list of strings or an object, found {}", kind_name(raw.type())));
                }
            }

            expected_t<SpecNode> branch(const object& members) {
                Branch b;
                for (const auto& [key, child] : members) {
                    keys.emplace_back(std::string_view{ key });

                    auto alternatives = split_alternatives(key);
                    if (!alternatives) return relocate(std::move(alternatives.error()));

                    for (const auto& alt : *alternatives) {
                        auto pattern = parse_key_pattern(alt);
                        if (!pattern) return relocate(std::move(pattern.error()));

                        // key-side references resolve before this level's frame is pushed
                        if (pattern->type == KeyPattern::kind::capture) {
                            if (auto r = check(pattern->key); !r) return std::unexpected(r.error());
                        } else if (pattern->type == KeyPattern::kind::key_of) {
                            if (auto r = check(pattern->ref); !r) return std::unexpected(r.error());
                        }
                        if (pattern->is_emitter() && child.is_object())
                            return fail("'$' and '#' keys take an output path, not an object");

                        levels.push_back(pattern->capture_count());
                        auto built = node(child);
                        levels.pop_back();
                        if (!built) return std::unexpected(built.error());

                        auto& target = pattern->is_emitter() ? b.emitters : b.rules;
                        target.push_back(Rule{ std::move(*pattern), std::move(*built) });
                    }
                    keys.pop_back();
                }

                std::ranges::stable_sort(b.rules, {}, [](const Rule& r) { return r.pattern.type; });
                return SpecNode{ std::move(b) };
            }
        };

    } // namespace
#pragma endregion

    SpecResult build_spec(const value& raw) {
        if (!raw.is_object())
            return syntax_error({}, std::format("a shift spec must be an object, found {}", kind_name(raw.type())));
        Builder builder;
        return builder.branch(raw.as_object());
    }

} // namespace Stanza
