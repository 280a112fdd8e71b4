#ifndef PARLEY_JSON_HPP
#define PARLEY_JSON_HPP

#include <algorithm>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace parley::json {

struct Value;
struct Member;

struct Null {
    [[nodiscard]]
    friend constexpr bool operator==(Null, Null)
        = default;
};
inline constexpr Null null;

using String = std::pmr::u8string;
using Number = double;

struct Array : std::pmr::vector<Value> {
    explicit Array(std::pmr::memory_resource* memory = std::pmr::get_default_resource()) noexcept;

    [[nodiscard]]
    friend bool operator==(const Array&, const Array&)
        = default;
};

/// @brief A JSON object, with members in source order.
/// Lookup returns the first member with a given key.
struct Object : std::pmr::vector<Member> {
    explicit Object(std::pmr::memory_resource* memory = std::pmr::get_default_resource()) noexcept;

    [[nodiscard]]
    friend bool operator==(const Object&, const Object&)
        = default;

    [[nodiscard]]
    const Member* find(std::u8string_view key) const noexcept;

    [[nodiscard]]
    const Value* find_value(std::u8string_view key) const noexcept;

    [[nodiscard]]
    const bool* find_bool(std::u8string_view key) const noexcept
    {
        return find_alternative<bool>(key);
    }

    [[nodiscard]]
    const Number* find_number(std::u8string_view key) const noexcept
    {
        return find_alternative<Number>(key);
    }

    [[nodiscard]]
    const String* find_string(std::u8string_view key) const noexcept
    {
        return find_alternative<String>(key);
    }

    [[nodiscard]]
    const Object* find_object(std::u8string_view key) const noexcept
    {
        return find_alternative<Object>(key);
    }

    [[nodiscard]]
    const Array* find_array(std::u8string_view key) const noexcept
    {
        return find_alternative<Array>(key);
    }

private:
    template <typename T>
    [[nodiscard]]
    const T* find_alternative(std::u8string_view key) const noexcept;
};

using Value_Variant = std::variant<Null, bool, Number, String, Array, Object>;

struct Value : Value_Variant {
    using Value_Variant::variant;

    [[nodiscard]]
    bool operator==(const Value&) const
        = default;

    [[nodiscard]]
    const bool* as_boolean() const noexcept
    {
        return std::get_if<bool>(this);
    }
    [[nodiscard]]
    const Number* as_number() const noexcept
    {
        return std::get_if<Number>(this);
    }
    [[nodiscard]]
    const String* as_string() const noexcept
    {
        return std::get_if<String>(this);
    }
    [[nodiscard]]
    const Object* as_object() const noexcept
    {
        return std::get_if<Object>(this);
    }
    [[nodiscard]]
    const Array* as_array() const noexcept
    {
        return std::get_if<Array>(this);
    }
};

struct Member {
    String key;
    Value value;

    [[nodiscard]]
    friend bool operator==(const Member&, const Member&)
        = default;
};

inline Array::Array(std::pmr::memory_resource* memory) noexcept
    : std::pmr::vector<Value> { memory }
{
}

inline Object::Object(std::pmr::memory_resource* memory) noexcept
    : std::pmr::vector<Member> { memory }
{
}

inline const Member* Object::find(std::u8string_view key) const noexcept
{
    const auto it = std::ranges::find(*this, key, &Member::key);
    return it == end() ? nullptr : &*it;
}

inline const Value* Object::find_value(std::u8string_view key) const noexcept
{
    const Member* const member = find(key);
    return member ? &member->value : nullptr;
}

template <typename T>
const T* Object::find_alternative(std::u8string_view key) const noexcept
{
    const Member* const member = find(key);
    return member ? std::get_if<T>(&member->value) : nullptr;
}

/// @brief Parses JSON text into a tree of values.
/// Comments are permitted.
/// @return The root value, or `std::nullopt` if `source` is not valid JSON.
[[nodiscard]]
std::optional<Value> load(std::u8string_view source, std::pmr::memory_resource* memory);

} // namespace parley::json

#endif
