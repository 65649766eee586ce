#include "stanza/stanza.hpp"

#include <sstream>
#include <charconv>
#include <cctype>
#include <cmath>
#include <algorithm>
#include <vector>


namespace Stanza {

    namespace detail {
        ParseResult parse_impl(std::string_view text, const ParseOptions& opts);
        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, size_t depth);
    } // namespace detail

    ParseResult parse(std::string_view input, const ParseOptions& opts) {
        return detail::parse_impl(input, opts);
    }

    ParseResult parse(std::istream& is, const ParseOptions& opts) {
        std::ostringstream oss;
        oss << is.rdbuf();
        return detail::parse_impl(oss.str(), opts);
    }

    std::string dump(const value& v, const WriteOptions& opts) {
        std::ostringstream oss;
        detail::dump_impl(v, oss, opts, 0);
        return oss.str();
    }

    void dump(const value& v, std::ostream& os, const WriteOptions& opts) {
        detail::dump_impl(v, os, opts, 0);
    }


#pragma region Parser
    // ================================
    // Internal parser implementation
    // ================================

    namespace detail {
        using expected_void = std::expected<void, ParseError>;
        template<typename T>
        using expected_t = std::expected<T, ParseError>;

        struct Scanner {
            std::string_view text;
            const ParseOptions& opts;
            size_t idx = 0;
            size_t line = 1;
            size_t column = 1;
            size_t depth = 0;
            std::pmr::memory_resource* mem_res;

            Scanner(std::string_view t, const ParseOptions& o, std::pmr::memory_resource* r)
                : text{ t }, opts{ o }, mem_res{ r } {}

            [[nodiscard]] bool eof() const noexcept { return idx >= text.size(); }
            [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : text[idx]; }
            [[nodiscard]] char peek_next() const noexcept { return (idx + 1 < text.size()) ? text[idx + 1] : '\0'; }

            char get() {
                if (eof()) return '\0';
                char c = text[idx++];
                if (c == '\n') {
                    line++;
                    column = 1;
                } else column++;
                return c;
            }

            bool consume(char c) {
                if (peek() != c) return false;
                get();
                return true;
            }

            [[nodiscard]] std::unexpected<ParseError> fail(ParseError::code code, std::string_view msg) const {
                return std::unexpected(ParseError::make(code, idx, line, column, msg));
            }
        };

        // Increments the nesting depth for the lifetime of one array/object.
        struct DepthGuard {
            Scanner& s;
            bool within_limit;

            explicit DepthGuard(Scanner& sc) : s(sc) {
                s.depth++;
                within_limit = s.opts.max_depth == 0 || s.depth <= s.opts.max_depth;
            }

            ~DepthGuard() { s.depth--; }

            DepthGuard(const DepthGuard&) = delete;
            DepthGuard& operator=(const DepthGuard&) = delete;
        };

        expected_t<value> parse_value(Scanner& s);

        bool is_ws(char c) noexcept { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
        bool is_digit(char c) noexcept { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

        // Returns the length of the UTF-8 sequence starting at data[i], 0 when malformed.
        size_t utf8_sequence_length(const unsigned char* data, size_t i, size_t n) {
            auto cont = [&](size_t k) { return i + k < n && (data[i + k] & 0xC0) == 0x80; };
            auto in = [&](size_t k, unsigned char lo, unsigned char hi) { return i + k < n && data[i + k] >= lo && data[i + k] <= hi; };

            unsigned char c = data[i];
            if (c <= 0x7F) return 1;
            if (c >= 0xC2 && c <= 0xDF) return cont(1) ? 2 : 0;
            if (c == 0xE0) return in(1, 0xA0, 0xBF) && cont(2) ? 3 : 0;
            if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) return cont(1) && cont(2) ? 3 : 0;
            if (c == 0xED) return in(1, 0x80, 0x9F) && cont(2) ? 3 : 0;
            if (c == 0xF0) return in(1, 0x90, 0xBF) && cont(2) && cont(3) ? 4 : 0;
            if (c >= 0xF1 && c <= 0xF3) return cont(1) && cont(2) && cont(3) ? 4 : 0;
            if (c == 0xF4) return in(1, 0x80, 0x8F) && cont(2) && cont(3) ? 4 : 0;
            return 0;
        }

        bool is_valid_utf8(std::string_view s) {
            const auto* data = reinterpret_cast<const unsigned char*>(s.data());
            for (size_t i = 0; i < s.size();) {
                size_t len = utf8_sequence_length(data, i, s.size());
                if (len == 0) return false;
                i += len;
            }
            return true;
        }

        void append_utf8(uint32_t cp, string& out) {
            if (cp > 0x10FFFF) cp = 0xFFFDu;
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        expected_void skip_ws_and_comments(Scanner& s) {
            while (!s.eof()) {
                char c = s.peek();
                if (is_ws(c)) {
                    s.get();
                    continue;
                }
                if (!s.opts.allow_comments || c != '/') break;

                char next = s.peek_next();
                if (next == '/') {
                    while (!s.eof() && s.peek() != '\n') s.get();
                    continue;
                }
                if (next != '*') break;

                s.get();
                s.get();
                bool closed = false;
                while (!s.eof()) {
                    if (s.get() == '*' && s.consume('/')) {
                        closed = true;
                        break;
                    }
                }
                if (!closed) return s.fail(ParseError::code::unexpected_end_of_input, "Nonterminated block comment");
            }
            return {};
        }

        expected_void parse_literal(Scanner& s, std::string_view literal) {
            for (char expected : literal) {
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Truncated literal");
                if (s.get() != expected) return s.fail(ParseError::code::unexpected_character, "Invalid literal");
            }
            return {};
        }

        expected_t<uint16_t> parse_hex4(Scanner& s) {
            uint16_t val = 0;
            for (int i = 0; i < 4; i++) {
                if (s.eof()) return s.fail(ParseError::code::invalid_unicode_escape, "Unexpected end in unicode escape");
                char h = s.get();
                unsigned digit = 0;
                if (h >= '0' && h <= '9') digit = h - '0';
                else if (h >= 'A' && h <= 'F') digit = 10 + (h - 'A');
                else if (h >= 'a' && h <= 'f') digit = 10 + (h - 'a');
                else return s.fail(ParseError::code::invalid_unicode_escape, "Invalid hex digit in unicode escape");
                val = static_cast<uint16_t>((val << 4) | digit);
            }
            return val;
        }

        expected_void parse_unicode_escape(Scanner& s, string& out) {
            auto first = parse_hex4(s);
            if (!first) return std::unexpected(first.error());

            if (*first >= 0xDC00 && *first <= 0xDFFF) return s.fail(ParseError::code::invalid_unicode_escape, "Unpaired low surrogate");
            if (*first < 0xD800 || *first > 0xDBFF) {
                append_utf8(*first, out);
                return {};
            }

            if (!(s.consume('\\') && s.consume('u'))) return s.fail(ParseError::code::invalid_unicode_escape, "Expected low surrogate after high surrogate");
            auto second = parse_hex4(s);
            if (!second) return std::unexpected(second.error());
            if (*second < 0xDC00 || *second > 0xDFFF) return s.fail(ParseError::code::invalid_unicode_escape, "Invalid low surrogate");

            append_utf8(0x10000u + ((static_cast<uint32_t>(*first - 0xD800) << 10) | static_cast<uint32_t>(*second - 0xDC00)), out);
            return {};
        }

        expected_t<string> parse_string(Scanner& s) {
            if (!s.consume('"')) return s.fail(ParseError::code::invalid_string, "Expected '\"' to start a string");

            string out{ allocator_type(s.mem_res) };
            while (!s.eof()) {
                char c = s.get();
                if (c == '"') {
                    if (!is_valid_utf8(std::string_view(out.data(), out.size())))
                        return s.fail(ParseError::code::invalid_string, "Invalid UTF-8 sequence in string");
                    return out;
                }
                if (static_cast<unsigned char>(c) < 0x20) return s.fail(ParseError::code::invalid_string, "Control character in string");
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }

                if (s.eof()) return s.fail(ParseError::code::invalid_escape, "Unfinished escape sequence");
                switch (char esc = s.get()) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u':
                    if (auto r = parse_unicode_escape(s, out); !r) return std::unexpected(r.error());
                    break;
                default:
                    (void)esc;
                    return s.fail(ParseError::code::invalid_escape, "Invalid escape sequence");
                }
            }
            return s.fail(ParseError::code::unexpected_end_of_input, "Nonterminated string");
        }

        expected_t<double> parse_number(Scanner& s) {
            size_t start = s.idx;

            s.consume('-');
            if (!is_digit(s.peek())) return s.fail(ParseError::code::invalid_number, "Expected digit");
            char first_digit = s.get();
            if (first_digit == '0' && is_digit(s.peek())) return s.fail(ParseError::code::invalid_number, "Leading zeros disallowed");
            while (is_digit(s.peek())) s.get();

            if (s.consume('.')) {
                if (!is_digit(s.peek())) return s.fail(ParseError::code::invalid_number, "Expected digit after '.'");
                while (is_digit(s.peek())) s.get();
            }

            if (s.peek() == 'e' || s.peek() == 'E') {
                s.get();
                if (s.peek() == '+' || s.peek() == '-') s.get();
                if (!is_digit(s.peek())) return s.fail(ParseError::code::invalid_number, "Expected digit in exponent");
                while (is_digit(s.peek())) s.get();
            }

            auto num_sv = s.text.substr(start, s.idx - start);
            double res = 0.0;
            auto fc_res = std::from_chars(num_sv.data(), num_sv.data() + num_sv.size(), res);
            if (fc_res.ec != std::errc{}) return s.fail(ParseError::code::invalid_number, "Number out of range");
            return res;
        }

        // Handles the separator after an element; returns true once `close` was consumed.
        expected_t<bool> parse_separator(Scanner& s, char close, std::string_view what) {
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.consume(close)) return true;
            if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, what);
            if (!s.consume(',')) return s.fail(ParseError::code::unexpected_character, what);
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.peek() == close) {
                if (!s.opts.allow_trailing_commas) return s.fail(ParseError::code::trailing_characters, "Trailing commas not allowed");
                s.get();
                return true;
            }
            return false;
        }

        expected_t<value> parse_array(Scanner& s) {
            DepthGuard guard{ s };
            if (!guard.within_limit) return s.fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
            s.consume('[');

            array arr{ allocator_type(s.mem_res) };
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.consume(']')) return value{ std::move(arr), s.mem_res };

            while (true) {
                auto elem = parse_value(s);
                if (!elem) return std::unexpected(std::move(elem.error()));
                arr.emplace_back(std::move(*elem));

                auto done = parse_separator(s, ']', "Expected ',' or ']' in array");
                if (!done) return std::unexpected(done.error());
                if (*done) break;
            }
            return value{ std::move(arr), s.mem_res };
        }

        expected_t<value> parse_object(Scanner& s) {
            DepthGuard guard{ s };
            if (!guard.within_limit) return s.fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
            s.consume('{');

            object obj{ allocator_type(s.mem_res) };
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.consume('}')) return value{ std::move(obj), s.mem_res };

            while (true) {
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected string key");
                if (s.peek() != '"') return s.fail(ParseError::code::unexpected_character, "Expected '\"' to start object key");
                auto key = parse_string(s);
                if (!key) return std::unexpected(key.error());

                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ':' after key");
                if (!s.consume(':')) return s.fail(ParseError::code::unexpected_character, "Expected ':' after object key");
                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());

                auto val = parse_value(s);
                if (!val) return std::unexpected(val.error());
                obj.insert_or_assign(std::move(*key), std::move(*val)); // last duplicate wins

                auto done = parse_separator(s, '}', "Expected ',' or '}' in object");
                if (!done) return std::unexpected(done.error());
                if (*done) break;
            }
            return value{ std::move(obj), s.mem_res };
        }

        expected_t<value> parse_value(Scanner& s) {
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Expected JSON value");

            char c = s.peek();
            switch (c) {
            case 'n':
                if (auto r = parse_literal(s, "null"); !r) return std::unexpected(r.error());
                return value{ nullptr, s.mem_res };
            case 't':
                if (auto r = parse_literal(s, "true"); !r) return std::unexpected(r.error());
                return value{ true, s.mem_res };
            case 'f':
                if (auto r = parse_literal(s, "false"); !r) return std::unexpected(r.error());
                return value{ false, s.mem_res };
            case '"': {
                auto str = parse_string(s);
                if (!str) return std::unexpected(str.error());
                return value{ std::move(*str), s.mem_res };
            }
            case '[': return parse_array(s);
            case '{': return parse_object(s);
            default:
                if (c == '-' || is_digit(c)) {
                    auto num = parse_number(s);
                    if (!num) return std::unexpected(num.error());
                    return value{ *num, s.mem_res };
                }
                if (c == '.') return s.fail(ParseError::code::invalid_number, "Fractional values must start with a 0");
                return s.fail(ParseError::code::unexpected_character, "Unexpected character while parsing value");
            }
        }

        ParseResult parse_impl(std::string_view text, const ParseOptions& opts) {
            Scanner s{ text, opts, std::pmr::get_default_resource() };

            auto v = parse_value(s);
            if (!v) return std::unexpected(v.error());
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (!s.eof()) return s.fail(ParseError::code::trailing_characters, "Trailing characters after top-level JSON value");
            return *std::move(v);
        }
#pragma endregion
#pragma region Serializer

        // ================================
        // Internal serializer implementation
        // ================================

        void dump_string(std::string_view s, std::ostream& os) {
            static constexpr char hex[] = "0123456789ABCDEF";
            os.put('"');
            for (unsigned char c : s) {
                switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b"; break;
                case '\f': os << "\\f"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (c < 0x20) os << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                    else os.put(static_cast<char>(c));
                    break;
                }
            }
            os.put('"');
        }

        void dump_number(double d, std::ostream& os) {
            if (!std::isfinite(d)) {
                os << "null";
                return;
            }
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) os << "0";
            else os.write(buf, ptr - buf);
        }

        void dump_newline_indent(std::ostream& os, size_t depth, const WriteOptions& opts) {
            if (!opts.pretty) return;
            os.put('\n');
            for (size_t i = 0; i < depth * opts.indent; i++) os.put(' ');
        }

        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, size_t depth) {
            switch (v.type()) {
            case kind::null: os << "null"; return;
            case kind::boolean: os << (v.as_bool() ? "true" : "false"); return;
            case kind::number: dump_number(v.as_number(), os); return;
            case kind::string: dump_string(v.as_string(), os); return;
            case kind::array: {
                const auto& arr = v.as_array();
                os.put('[');
                for (size_t i = 0; i < arr.size(); i++) {
                    if (i > 0) os.put(',');
                    dump_newline_indent(os, depth + 1, opts);
                    dump_impl(arr[i], os, opts, depth + 1);
                }
                if (!arr.empty()) dump_newline_indent(os, depth, opts);
                os.put(']');
                return;
            }
            case kind::object: {
                const auto& obj = v.as_object();
                std::vector<const object::member*> members;
                members.reserve(obj.size());
                for (const auto& m : obj) members.push_back(&m);
                if (opts.sort_keys)
                    std::ranges::sort(members, {}, [](const object::member* m) -> std::string_view { return m->first; });

                os.put('{');
                bool first = true;
                for (const auto* m : members) {
                    if (!first) os.put(',');
                    first = false;
                    dump_newline_indent(os, depth + 1, opts);
                    dump_string(m->first, os);
                    os << (opts.pretty ? ": " : ":");
                    dump_impl(m->second, os, opts, depth + 1);
                }
                if (!obj.empty()) dump_newline_indent(os, depth, opts);
                os.put('}');
                return;
            }
            }
            os << "null";
        }

#pragma endregion

    } // namespace detail

} // namespace Stanza
