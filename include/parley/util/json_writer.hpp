#ifndef PARLEY_JSON_WRITER_HPP
#define PARLEY_JSON_WRITER_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/strings.hpp"

#include "parley/fwd.hpp"

namespace parley {

/// @brief Appends `text` to `out` as the contents of a JSON string literal,
/// without the surrounding quotes.
inline void append_json_escaped(std::u8string& out, std::u8string_view text)
{
    constexpr char8_t hex_digits[] = u8"0123456789abcdef";
    for (const char8_t c : text) {
        switch (c) {
        case u8'"': out += u8"\\\""; break;
        case u8'\\': out += u8"\\\\"; break;
        case u8'\n': out += u8"\\n"; break;
        case u8'\r': out += u8"\\r"; break;
        case u8'\t': out += u8"\\t"; break;
        default:
            if (c < 0x20) {
                out += u8"\\u00";
                out += hex_digits[c >> 4];
                out += hex_digits[c & 0xf];
            }
            else {
                out += c;
            }
        }
    }
}

/// @brief Writes indented JSON to a string.
/// Commas and line breaks between values are inserted automatically.
///
/// Every `begin_object()` and `begin_array()` shall be matched by
/// `end_object()` and `end_array()` respectively,
/// and within an object, every value shall be preceded by `key`.
struct JSON_Writer {
private:
    struct Level {
        bool is_object;
        bool is_empty = true;
    };

    std::u8string& m_out;
    std::vector<Level> m_levels;
    std::size_t m_indent_width;
    bool m_after_key = false;

public:
    [[nodiscard]]
    explicit JSON_Writer(std::u8string& out, std::size_t indent_width = 2)
        : m_out { out }
        , m_indent_width { indent_width }
    {
    }

    JSON_Writer(const JSON_Writer&) = delete;
    JSON_Writer& operator=(const JSON_Writer&) = delete;

    /// @brief Returns `true` if all opened objects and arrays have been closed.
    [[nodiscard]]
    bool is_done() const
    {
        return m_levels.empty() && !m_after_key;
    }

    JSON_Writer& begin_object()
    {
        before_value();
        m_out += u8'{';
        m_levels.push_back({ .is_object = true });
        return *this;
    }

    JSON_Writer& end_object()
    {
        return end_level(true, u8'}');
    }

    JSON_Writer& begin_array()
    {
        before_value();
        m_out += u8'[';
        m_levels.push_back({ .is_object = false });
        return *this;
    }

    JSON_Writer& end_array()
    {
        return end_level(false, u8']');
    }

    /// @brief Writes a property name, which shall be followed by exactly one value.
    JSON_Writer& key(std::u8string_view name)
    {
        PARLEY_ASSERT(!m_levels.empty() && m_levels.back().is_object);
        PARLEY_ASSERT(!m_after_key);
        next_line();
        write_quoted(name);
        m_out += u8": ";
        m_after_key = true;
        return *this;
    }

    JSON_Writer& write_string(std::u8string_view value)
    {
        before_value();
        write_quoted(value);
        return *this;
    }

    JSON_Writer& write_bool(bool value)
    {
        before_value();
        m_out += value ? u8"true" : u8"false";
        return *this;
    }

    JSON_Writer& write_null()
    {
        before_value();
        m_out += u8"null";
        return *this;
    }

    template <typename T>
    JSON_Writer& write_integer(T value)
    {
        before_value();
        append_integer(m_out, value);
        return *this;
    }

    JSON_Writer& write_number(double value)
    {
        before_value();
        append_double(m_out, value);
        return *this;
    }

    /// @brief Writes the member `"name": "value"`.
    JSON_Writer& write_member(std::u8string_view name, std::u8string_view value)
    {
        return key(name).write_string(value);
    }

private:
    void write_quoted(std::u8string_view text)
    {
        m_out += u8'"';
        append_json_escaped(m_out, text);
        m_out += u8'"';
    }

    void next_line()
    {
        Level& level = m_levels.back();
        if (!level.is_empty) {
            m_out += u8',';
        }
        level.is_empty = false;
        m_out += u8'\n';
        m_out.append(m_levels.size() * m_indent_width, u8' ');
    }

    void before_value()
    {
        if (m_after_key) {
            m_after_key = false;
            return;
        }
        if (m_levels.empty()) {
            PARLEY_ASSERT(m_out.empty());
            return;
        }
        PARLEY_ASSERT(!m_levels.back().is_object);
        next_line();
    }

    JSON_Writer& end_level(bool is_object, char8_t closing)
    {
        PARLEY_ASSERT(!m_after_key);
        PARLEY_ASSERT(!m_levels.empty() && m_levels.back().is_object == is_object);
        const bool was_empty = m_levels.back().is_empty;
        m_levels.pop_back();
        if (!was_empty) {
            m_out += u8'\n';
            m_out.append(m_levels.size() * m_indent_width, u8' ');
        }
        m_out += closing;
        return *this;
    }
};

} // namespace parley

#endif
