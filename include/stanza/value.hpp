#pragma once


/*
    -------------------------------------
    Stanza::value - Dynamic JSON DOM node
    -------------------------------------
    The `Stanza::value` type represents any JSON value:
        - null
        - boolean
        - number (as double)
        - string
        - array
        - object
    It is both the source and the result representation of every
    transformation, and the representation of raw spec documents

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (strings, arrays, objects)
    - Copy construction/assignment:
        * The destination adopts the allocator of the source and performs a
          deep copy of the JSON tree into that allocator
    - Move construction/assignment:
        * The destination steals the allocator and storage of the source

    ------------------
    Object Key Order
    ------------------
    - Objects keep their members in insertion order, which for parsed
      documents is document order. Spec rules and source keys are visited in
      this order, and `dump` writes it back unless `sort_keys` is set
    - Member lookup is a linear scan, as in rapidjson

    -------------------
    Indexing Operations
    -------------------
    - `value& operator[](std::string_view)` converts non-objects to an empty
      object and inserts missing keys as `null`
    - `value& operator[](size_t)` converts non-arrays to an empty array and
      grows the array with `null`s as needed
    - `find(key)` / `find(index)` never modify the value and return nullptr
      on a kind mismatch or a missing member

    --------
    Equality
    --------
    - Structural: same kind and equal contents. The memory resource does not
      take part in the comparison

    -------------
    Thread-Safety
    -------------
    - Concurrent reads of one `value` are safe; any concurrent write must be
      externally synchronized
*/

/// @defgroup Stanza Stanza JSON Transformation Library
/// @brief Core types and functions for Stanza

/// @defgroup StanzaValue DOM Value
/// @ingroup Stanza

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <utility>
#include "stanza/config.hpp"

namespace Stanza {
    /// @brief Enumerates the possible JSON value kinds held by Stanza::value
    enum class kind : uint8_t {
        null, ///< JSON null value
        boolean, ///< JSON boolean value (`true` or `false`)
        number, ///< JSON number value (stored as `double`)
        string, ///< JSON string value
        array, ///< JSON array value
        object, ///< JSON object value
    };

    /// @ingroup StanzaValue
    /// @brief Returns a lowercase name for @p k, used in diagnostics
    [[nodiscard]] STANZA_API std::string_view kind_name(kind k) noexcept;

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    /// @ingroup StanzaValue
    /// @brief String type used by Stanza::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup StanzaValue
    /// @brief Array type used by Stanza::value (JSON arrays)
    using array = pmr_vector<value>;

    /// @ingroup StanzaValue
    /// @brief Object type used by Stanza::value (JSON objects)
    ///
    /// @details
    /// An insertion-ordered sequence of unique keys. Equality ignores the
    /// order of members.
    class object {
    public:
        using member = std::pair<string, value>;
        using container = pmr_vector<member>;
        using iterator = container::iterator;
        using const_iterator = container::const_iterator;
        using allocator_type = std::pmr::polymorphic_allocator<member>;

        STANZA_API explicit object(const allocator_type& alloc = {});

        // `value` is incomplete here, so every member is defined in value.cpp
        [[nodiscard]] STANZA_API iterator begin() noexcept;
        [[nodiscard]] STANZA_API iterator end() noexcept;
        [[nodiscard]] STANZA_API const_iterator begin() const noexcept;
        [[nodiscard]] STANZA_API const_iterator end() const noexcept;

        [[nodiscard]] STANZA_API size_t size() const noexcept;
        [[nodiscard]] STANZA_API bool empty() const noexcept;
        [[nodiscard]] STANZA_API allocator_type get_allocator() const noexcept;

        [[nodiscard]] STANZA_API iterator find(std::string_view key);
        [[nodiscard]] STANZA_API const_iterator find(std::string_view key) const;

        /// @brief Appends @p key unless it is present; never overwrites
        STANZA_API std::pair<iterator, bool> emplace(string key, value v);

        /// @brief Replaces the member in place, or appends it when absent
        STANZA_API iterator insert_or_assign(string key, value v);

        STANZA_API friend bool operator==(const object& lhs, const object& rhs);

    private:
        container m_Members;
    };

    /// @ingroup StanzaValue
    /// @brief Variant storage used internally by Stanza::value
    using storage_t = std::variant<
        std::monostate,
        bool,
        double,
        string,
        array,
        object
    >;


    /// @ingroup StanzaValue
    /// @brief Dynamic JSON DOM type.
    ///
    /// @details
    /// All nested allocations (strings, arrays, objects) are performed using
    /// the `std::pmr::memory_resource` associated with the instance.
    /// Container-like operations (`as_array`, `as_object`, `operator[]`)
    /// use this allocator
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @brief Constructs a null JSON value using the given memory resource
        STANZA_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a null JSON value; disambiguates `value{ nullptr }`
        STANZA_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a boolean JSON value
        STANZA_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a numeric JSON value from a double
        STANZA_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a numeric JSON value from an integral type
        ///
        /// @tparam I Integral type (e.g. int, long, int64_t)
        /// @param i Integer value to convert and store as a double
        /// @param res Memory resource used for nested allocations (if any)
        template<std::integral I>
        explicit value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<double>(i) } {}

        /// @brief Constructs a string JSON value from a C string
        STANZA_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a string JSON value from a string_view
        ///
        /// @param sv UTF-8 string view; characters are copied into an
        ///           allocator-backed `Stanza::string`
        STANZA_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a string JSON value from an existing Stanza::string
        STANZA_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs an array JSON value from an existing array
        STANZA_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs an object JSON value from an existing object
        STANZA_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Deep-copies @p other, adopting its allocator
        STANZA_API value(const value& other);

        /// @brief Deep-copies @p other into @p res
        STANZA_API value(const value& other, std::pmr::memory_resource* res);

        /// @brief Steals the allocator and storage of @p other, leaving it null
        STANZA_API value(value&& other) noexcept;

        STANZA_API value& operator=(const value& other);
        STANZA_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @brief Returns the kind of JSON value currently stored.
        [[nodiscard]] STANZA_API kind type() const noexcept;

        [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_number() const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string() const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object() const noexcept { return type() == kind::object;  }

        /// @brief True for arrays and objects, the kinds a branch spec can descend into
        [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        /// @pre `is_bool()` must be true. Throws `std::bad_variant_access` otherwise
        [[nodiscard]] STANZA_API bool&       as_bool();
        [[nodiscard]] STANZA_API const bool& as_bool() const;

        /// @pre `is_number()` must be true. Throws `std::bad_variant_access` otherwise
        [[nodiscard]] STANZA_API double&       as_number();
        [[nodiscard]] STANZA_API const double& as_number() const;

        /// @pre `is_string()` must be true. Throws `std::bad_variant_access` otherwise
        [[nodiscard]] STANZA_API string&       as_string();
        [[nodiscard]] STANZA_API const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        /// @brief Returns the stored array, replacing any other kind with an
        ///        empty array allocated from `resource()` first
        [[nodiscard]] STANZA_API array&       as_array();

        /// @pre `is_array()` must be true.
        [[nodiscard]] STANZA_API const array& as_array() const;

        /// @brief Returns the stored object, replacing any other kind with an
        ///        empty object allocated from `resource()` first
        [[nodiscard]] STANZA_API object&       as_object();

        /// @pre `is_object()` must be true.
        [[nodiscard]] STANZA_API const object& as_object() const;

        /// @brief Number of elements or members; 0 for non-container kinds
        [[nodiscard]] STANZA_API size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @brief Accesses or creates an array element by index, growing the array as needed
        /// @details
        /// If the current value is **not** an array, it is converted into an
        /// empty array first. Newly created elements are `null`
        STANZA_API value& operator[](size_t idx);

        /// @brief Accesses an array element by index (const overload)
        /// @details Returns a shared `null` sentinel when the value is not an
        ///          array or @p idx is out of range
        STANZA_API const value& operator[](size_t idx) const;

        /// @brief Accesses or creates an object member by key
        STANZA_API value& operator[](std::string_view key);

        /// @brief Finds an object member, nullptr when absent or not an object
        [[nodiscard]] STANZA_API const value* find(std::string_view key) const;

        /// @brief Finds an array element, nullptr when out of range or not an array
        [[nodiscard]] STANZA_API const value* find(size_t idx) const;

        /// @brief Returns the member mapped to @p key
        /// @throws std::out_of_range If the key does not exist or the value is not an object
        [[nodiscard]] STANZA_API const value& at(std::string_view key) const;

        /// @brief Structural equality; the memory resource is not compared
        STANZA_API friend bool operator==(const value& lhs, const value& rhs);

        /// @brief Returns the memory resource associated with this value
        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        /// @brief Direct access to the underlying variant storage
        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

        /// @brief Mutable access to the underlying variant storage.
        /// Bypasses every invariant of the `value` API; use with care
        [[nodiscard]] storage_t& storage() noexcept { return m_Storage; }


    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace Stanza
