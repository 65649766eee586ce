#include "stanza/error.hpp"

#include <format>

namespace Stanza {

    ParseError ParseError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    TransformError TransformError::make(code c, std::string_view path, std::string_view m) {
        TransformError e;
        e.errc = c;
        e.path.assign(path.begin(), path.end());
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string TransformError::what() const {
        if (path.empty()) return std::format("{}: {}", code_name(errc), msg);
        return std::format("{} at '{}': {}", code_name(errc), path, msg);
    }

    std::string_view code_name(TransformError::code c) noexcept {
        switch (c) {
        case TransformError::code::spec_syntax: return "SpecSyntaxError";
        case TransformError::code::path_type_conflict: return "PathTypeConflictError";
        case TransformError::code::index_out_of_range: return "IndexRangeError";
        }
        return "TransformError";
    }

} // namespace Stanza
