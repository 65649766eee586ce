#include "stanza/output.hpp"

#include <format>


namespace Stanza {

    namespace {
        std::unexpected<TransformError> fail(TransformError::code c, const ResolvedPath& path, size_t upto, std::string_view msg) {
            ResolvedPath prefix(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(upto + 1));
            return std::unexpected(TransformError::make(c, to_string(prefix), msg));
        }

        std::unexpected<TransformError> conflict(const ResolvedPath& path, size_t upto, std::string_view msg) {
            return fail(TransformError::code::path_type_conflict, path, upto, msg);
        }

        // Turns `slot` into an array holding its current value, unless it already is one.
        array& wrap(value& slot, std::pmr::memory_resource* res) {
            if (slot.is_array()) return slot.as_array();
            value first = std::move(slot);
            slot = value{ array{ allocator_type(res) }, res };
            auto& arr = slot.as_array();
            arr.push_back(std::move(first));
            return arr;
        }

        void merge(value& slot, const value& v, std::pmr::memory_resource* res) {
            auto& arr = wrap(slot, res);
            if (v.is_array()) {
                for (const auto& elem : v.as_array()) arr.emplace_back(elem, res);
            } else {
                arr.emplace_back(v, res);
            }
        }
    } // namespace

    std::string to_string(const ResolvedPath& path) {
        std::string out;
        for (const auto& seg : path) {
            switch (seg.type) {
            case PathSegment::kind::field:
                if (!out.empty()) out += '.';
                out += seg.key;
                break;
            case PathSegment::kind::index:
                out += std::format("[{}]", seg.index);
                break;
            case PathSegment::kind::append:
                out += "[]";
                break;
            }
        }
        return out;
    }

    OutputTree::OutputTree(std::pmr::memory_resource* resource)
        : m_Resource{ resource }, m_Root{ resource } {}

    std::expected<void, TransformError> OutputTree::write(const ResolvedPath& path, const value& v) {
        value* cur = &m_Root;
        bool occupied = m_RootWritten;

        for (size_t i = 0; i < path.size(); i++) {
            const auto& seg = path[i];
            const bool last = i + 1 == path.size();

            switch (seg.type) {
            case PathSegment::kind::field: {
                if (!cur->is_null() && !cur->is_object())
                    return conflict(path, i, std::format("field '{}' cannot be set on {}", seg.key, kind_name(cur->type())));
                occupied = cur->find(std::string_view{ seg.key }) != nullptr;
                cur = &(*cur)[std::string_view{ seg.key }];
                break;
            }
            case PathSegment::kind::index: {
                if (!cur->is_null() && !cur->is_array())
                    return conflict(path, i, std::format("index {} cannot be set on {}", seg.index, kind_name(cur->type())));
                if (seg.index >= cur->size() + max_padding)
                    return fail(TransformError::code::index_out_of_range, path, i,
                        std::format("index {} is more than {} past the end of an array of size {}", seg.index, max_padding, cur->size()));
                cur = &(*cur)[seg.index];
                occupied = !cur->is_null();
                break;
            }
            case PathSegment::kind::append: {
                if (cur->is_object())
                    return conflict(path, i, "cannot append to an object");
                auto& arr = cur->is_null() ? cur->as_array() : wrap(*cur, m_Resource);
                if (last) {
                    arr.emplace_back(v, m_Resource);
                    m_RootWritten = true;
                    m_Writes++;
                    return {};
                }
                arr.push_back(value{ m_Resource });
                cur = &arr.back();
                occupied = false;
                break;
            }
            }
        }

        if (occupied) {
            merge(*cur, v, m_Resource);
        } else {
            *cur = value{ v, m_Resource };
        }
        m_RootWritten = true;
        m_Writes++;
        return {};
    }

    value OutputTree::take() && {
        return std::move(m_Root);
    }

} // namespace Stanza
