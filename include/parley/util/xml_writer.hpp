#ifndef PARLEY_XML_WRITER_HPP
#define PARLEY_XML_WRITER_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "parley/util/assert.hpp"
#include "parley/util/chars.hpp"

#include "parley/fwd.hpp"

namespace parley {

/// @brief Returns `true` if `str` is a valid XML name,
/// considering only the restrictions on ASCII characters.
[[nodiscard]]
constexpr bool is_xml_name(std::u8string_view str)
{
    if (str.empty() || !is_xml_name_start(str.front())) {
        return false;
    }
    for (const char8_t c : str) {
        if (!is_xml_name_character(c)) {
            return false;
        }
    }
    return true;
}

/// @brief Appends `text` to `out`, replacing every character in `escaped` with a reference.
/// Only `&`, `<`, `>`, `"`, and `'` can be escaped.
inline void append_xml_escaped_of(std::u8string& out, std::u8string_view text, std::u8string_view escaped)
{
    for (const char8_t c : text) {
        if (escaped.find(c) == std::u8string_view::npos) {
            out += c;
            continue;
        }
        switch (c) {
        case u8'&': out += u8"&amp;"; break;
        case u8'<': out += u8"&lt;"; break;
        case u8'>': out += u8"&gt;"; break;
        case u8'"': out += u8"&quot;"; break;
        case u8'\'': out += u8"&apos;"; break;
        case u8'\t': out += u8"&#9;"; break;
        case u8'\n': out += u8"&#10;"; break;
        case u8'\r': out += u8"&#13;"; break;
        default: PARLEY_ASSERT_UNREACHABLE(u8"Character cannot be escaped.");
        }
    }
}

struct XML_Attribute_Writer;

/// @brief A class which provides member functions for writing XML markup to a string correctly.
/// This writer only performs checks that are possible without additional memory.
/// These include:
/// - verifying that given element and attribute names are XML names
/// - ensuring that the number of opened tags matches the number of closed tags
///
/// To correctly use this class, the opening tags must match the closing tags.
/// I.e. for every `open_tag(name)` or `open_tag_with_attributes(name)`,
/// there must be a matching `close_tag(name)`.
struct XML_Writer {
public:
    friend XML_Attribute_Writer;

private:
    std::u8string& m_out;
    std::size_t m_depth = 0;
    bool m_in_attributes = false;

public:
    [[nodiscard]]
    explicit XML_Writer(std::u8string& out)
        : m_out { out }
    {
    }

    XML_Writer(const XML_Writer&) = delete;
    XML_Writer& operator=(const XML_Writer&) = delete;

    [[nodiscard]]
    const std::u8string& get_output() const
    {
        return m_out;
    }

    [[nodiscard]]
    std::size_t get_depth() const
    {
        return m_depth;
    }

    /// @brief Returns `true` if all opened tags have been closed.
    [[nodiscard]]
    bool is_done() const
    {
        return m_depth == 0 && !m_in_attributes;
    }

    /// @brief Writes the `<?xml ...?>` declaration.
    /// If written, it shall be the first thing in the output.
    XML_Writer& write_declaration()
    {
        PARLEY_ASSERT(m_out.empty());
        m_out += u8"<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        return *this;
    }

    /// @brief Writes a line break followed by `indent_width` spaces for every currently open
    /// element.
    XML_Writer& write_line_break(std::size_t indent_width = 2)
    {
        PARLEY_ASSERT(!m_in_attributes);
        m_out += u8'\n';
        m_out.append(m_depth * indent_width, u8' ');
        return *this;
    }

    /// @brief Like `write_line_break`, but indents for one element less,
    /// so that a closing tag written next lines up with its opening tag.
    XML_Writer& write_closing_line_break(std::size_t indent_width = 2)
    {
        PARLEY_ASSERT(!m_in_attributes);
        PARLEY_ASSERT(m_depth != 0);
        m_out += u8'\n';
        m_out.append((m_depth - 1) * indent_width, u8' ');
        return *this;
    }

    /// @brief Writes an opening tag such as `<body>`.
    XML_Writer& open_tag(std::u8string_view name)
    {
        PARLEY_ASSERT(!m_in_attributes);
        PARLEY_ASSERT(is_xml_name(name));
        m_out += u8'<';
        m_out += name;
        m_out += u8'>';
        ++m_depth;
        return *this;
    }

    /// @brief Writes an incomplete opening tag such as `<said`.
    /// Returns an `XML_Attribute_Writer` which must be used to write attributes (if any)
    /// and complete the tag.
    [[nodiscard]]
    XML_Attribute_Writer open_tag_with_attributes(std::u8string_view name);

    /// @brief Writes a closing tag, such as `</body>`.
    /// The most recent unclosed call to `open_tag` or `open_tag_with_attributes`
    /// shall have been made with the same name.
    XML_Writer& close_tag(std::u8string_view name)
    {
        PARLEY_ASSERT(!m_in_attributes);
        PARLEY_ASSERT(is_xml_name(name));
        PARLEY_ASSERT(m_depth != 0);
        --m_depth;
        m_out += u8"</";
        m_out += name;
        m_out += u8'>';
        return *this;
    }

    /// @brief Writes an element containing only the given text, like `<title>Emma</title>`.
    XML_Writer& write_text_element(std::u8string_view name, std::u8string_view text)
    {
        open_tag(name);
        write_inner_text(text);
        return close_tag(name);
    }

    /// @brief Writes character data.
    /// Characters such as `<` or `&` which interfere with XML are converted to references,
    /// and so is carriage return, which a parser would otherwise fold into a line feed.
    XML_Writer& write_inner_text(std::u8string_view text)
    {
        PARLEY_ASSERT(!m_in_attributes);
        append_xml_escaped_of(m_out, text, u8"&<>\r");
        return *this;
    }

    /// @brief Writes an XML comment with the given contents.
    XML_Writer& write_comment(std::u8string_view comment)
    {
        PARLEY_ASSERT(!m_in_attributes);
        PARLEY_ASSERT(comment.find(u8"--") == std::u8string_view::npos);
        m_out += u8"<!--";
        m_out += comment;
        m_out += u8"-->";
        return *this;
    }
};

/// @brief Writes attributes of a start tag and then completes it,
/// either as an opening tag with `end()`, or as an empty element with `end_empty()`.
struct [[nodiscard]] XML_Attribute_Writer {
private:
    XML_Writer& m_writer;

public:
    explicit XML_Attribute_Writer(XML_Writer& writer)
        : m_writer { writer }
    {
        m_writer.m_in_attributes = true;
    }

    XML_Attribute_Writer(const XML_Attribute_Writer&) = delete;
    XML_Attribute_Writer& operator=(const XML_Attribute_Writer&) = delete;

    /// @brief Writes an attribute like ` who="#jane"`.
    /// Tabs and line breaks are written as character references so that
    /// attribute value normalization does not turn them into spaces.
    XML_Attribute_Writer& write_attribute(std::u8string_view name, std::u8string_view value)
    {
        PARLEY_ASSERT(m_writer.m_in_attributes);
        PARLEY_ASSERT(is_xml_name(name));
        m_writer.m_out += u8' ';
        m_writer.m_out += name;
        m_writer.m_out += u8"=\"";
        append_xml_escaped_of(m_writer.m_out, value, u8"&<\"\t\n\r");
        m_writer.m_out += u8'"';
        return *this;
    }

    /// @brief Writes the attribute only if `value` is not empty.
    XML_Attribute_Writer&
    write_attribute_if_present(std::u8string_view name, std::u8string_view value)
    {
        return value.empty() ? *this : write_attribute(name, value);
    }

    /// @brief Completes an opening tag with `>`.
    XML_Writer& end()
    {
        PARLEY_ASSERT(m_writer.m_in_attributes);
        m_writer.m_in_attributes = false;
        m_writer.m_out += u8'>';
        ++m_writer.m_depth;
        return m_writer;
    }

    /// @brief Completes the tag as an empty element with `/>`.
    XML_Writer& end_empty()
    {
        PARLEY_ASSERT(m_writer.m_in_attributes);
        m_writer.m_in_attributes = false;
        m_writer.m_out += u8"/>";
        return m_writer;
    }
};

inline XML_Attribute_Writer XML_Writer::open_tag_with_attributes(std::u8string_view name)
{
    PARLEY_ASSERT(!m_in_attributes);
    PARLEY_ASSERT(is_xml_name(name));
    m_out += u8'<';
    m_out += name;
    return XML_Attribute_Writer { *this };
}

} // namespace parley

#endif
