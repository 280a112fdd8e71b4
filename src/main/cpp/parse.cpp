#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/chars.hpp"
#include "parley/util/result.hpp"
#include "parley/util/source_position.hpp"
#include "parley/util/unicode.hpp"

#include "parley/parse.hpp"

namespace parley {

std::u8string_view parse_error_code_name(Parse_Error_Code code)
{
    switch (code) {
        using enum Parse_Error_Code;
        PARLEY_ENUM_STRING_CASE8(no_root_element);
        PARLEY_ENUM_STRING_CASE8(multiple_root_elements);
        PARLEY_ENUM_STRING_CASE8(text_outside_root);
        PARLEY_ENUM_STRING_CASE8(invalid_name);
        PARLEY_ENUM_STRING_CASE8(unterminated_tag);
        PARLEY_ENUM_STRING_CASE8(invalid_attribute);
        PARLEY_ENUM_STRING_CASE8(duplicate_attribute);
        PARLEY_ENUM_STRING_CASE8(unterminated_markup);
        PARLEY_ENUM_STRING_CASE8(mismatched_closing_tag);
        PARLEY_ENUM_STRING_CASE8(unclosed_element);
        PARLEY_ENUM_STRING_CASE8(invalid_reference);
        PARLEY_ENUM_STRING_CASE8(unexpected_character);
        PARLEY_ENUM_STRING_CASE8(corrupted);
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid parse error code.");
}

namespace {

/// @brief Returns the length of the entity or character reference at the start of `str`,
/// including the leading `&` and the trailing `;`,
/// or zero if there is no valid reference.
[[nodiscard]]
std::size_t match_reference(std::u8string_view str)
{
    PARLEY_DEBUG_ASSERT(str.starts_with(u8'&'));
    const std::size_t semicolon = str.find(u8';');
    if (semicolon == std::u8string_view::npos) {
        return 0;
    }
    const std::u8string_view body = str.substr(1, semicolon - 1);
    if (body == u8"lt" || body == u8"gt" || body == u8"amp" || body == u8"quot"
        || body == u8"apos") {
        return semicolon + 1;
    }
    if (!body.starts_with(u8'#')) {
        return 0;
    }
    const bool hex = body.starts_with(u8"#x");
    const std::u8string_view digits = body.substr(hex ? 2 : 1);
    if (digits.empty() || digits.size() > 8) {
        return 0;
    }
    char32_t value = 0;
    for (const char8_t c : digits) {
        if (hex ? !is_ascii_hex_digit(c) : !is_ascii_digit(c)) {
            return 0;
        }
        const char32_t digit = is_ascii_digit(c) ? char32_t(c - u8'0')
                                                 : char32_t(to_ascii_lower(c) - u8'a' + 10);
        value = value * (hex ? 16 : 10) + digit;
    }
    const bool is_scalar = value != 0 && value <= 0x10'FFFF && (value < 0xD800 || value > 0xDFFF);
    return is_scalar ? semicolon + 1 : 0;
}

struct [[nodiscard]] Parser {
private:
    std::vector<XML_Instruction>& m_out;
    const std::u8string_view m_source;

    Source_Position m_pos {};
    std::optional<Parse_Error> m_error;
    std::vector<std::u8string_view> m_open_elements;
    bool m_root_seen = false;

public:
    [[nodiscard]]
    Parser(std::vector<XML_Instruction>& out, std::u8string_view source)
        : m_out { out }
        , m_source { source }
    {
    }

    Result<void, Parse_Error> operator()()
    {
        if (!utf8::is_valid(m_source)) {
            return Parse_Error { Parse_Error_Code::corrupted,
                                 {},
                                 u8"The markup is not valid UTF-8 text." };
        }
        consume_document();
        if (m_error) {
            return std::move(*m_error);
        }
        return {};
    }

private:
    void error(Parse_Error_Code code, std::size_t length, std::u8string_view message)
    {
        if (!m_error) {
            m_error = Parse_Error { code, Source_Span { m_pos, length }, std::u8string { message } };
        }
    }

    void advance_by(std::size_t n)
    {
        PARLEY_DEBUG_ASSERT(m_pos.begin + n <= m_source.size());
        advance(m_pos, m_source.substr(m_pos.begin, n));
    }

    /// @brief Appends an instruction and advances past its characters.
    /// Consecutive `skip` instructions are merged.
    void emit(XML_Instruction_Type type, std::size_t n)
    {
        if (type == XML_Instruction_Type::skip && n == 0) {
            return;
        }
        if (type == XML_Instruction_Type::skip && !m_out.empty()
            && m_out.back().type == XML_Instruction_Type::skip) {
            m_out.back().n += n;
        }
        else {
            m_out.push_back({ type, n });
        }
        advance_by(n);
    }

    [[nodiscard]]
    std::u8string_view peek_all() const
    {
        PARLEY_DEBUG_ASSERT(m_pos.begin <= m_source.size());
        return m_source.substr(m_pos.begin);
    }

    [[nodiscard]]
    bool eof() const
    {
        return m_pos.begin == m_source.length();
    }

    [[nodiscard]]
    bool peek(std::u8string_view text) const
    {
        return peek_all().starts_with(text);
    }

    [[nodiscard]]
    bool peek(char8_t c) const
    {
        return !eof() && m_source[m_pos.begin] == c;
    }

    [[nodiscard]]
    bool peek(bool predicate(char8_t) noexcept) const
    {
        return !eof() && predicate(m_source[m_pos.begin]);
    }

    /// @brief Returns the length of the run of characters at the current position
    /// which satisfy `predicate`.
    [[nodiscard]]
    std::size_t match_run(bool predicate(char8_t) noexcept) const
    {
        const std::u8string_view rest = peek_all();
        const auto it = std::ranges::find_if_not(rest, predicate);
        return std::size_t(it - rest.begin());
    }

    [[nodiscard]]
    std::size_t match_name() const
    {
        if (!peek(is_xml_name_start)) {
            return 0;
        }
        return match_run(is_xml_name_character);
    }

    void skip_whitespace()
    {
        emit(XML_Instruction_Type::skip, match_run(is_xml_whitespace));
    }

    void consume_document()
    {
        if (peek(u8"\xEF\xBB\xBF")) {
            emit(XML_Instruction_Type::skip, 3);
        }
        while (!eof() && !m_error) {
            if (m_open_elements.empty()) {
                consume_prolog_or_epilog_piece();
            }
            else {
                consume_content_piece();
            }
        }
        if (m_error) {
            return;
        }
        if (!m_open_elements.empty()) {
            std::u8string message = u8"The element <";
            message += m_open_elements.back();
            message += u8"> is never closed.";
            error(Parse_Error_Code::unclosed_element, 0, message);
            return;
        }
        if (!m_root_seen) {
            error(Parse_Error_Code::no_root_element, 0, u8"The markup contains no element.");
        }
    }

    void consume_prolog_or_epilog_piece()
    {
        if (peek(is_xml_whitespace)) {
            skip_whitespace();
        }
        else if (peek(u8"<!--")) {
            consume_until_terminator(u8"-->", u8"Unterminated comment.");
        }
        else if (peek(u8"<?")) {
            consume_until_terminator(u8"?>", u8"Unterminated processing instruction.");
        }
        else if (peek(u8"<!DOCTYPE")) {
            consume_doctype();
        }
        else if (peek(u8"</")) {
            error(
                Parse_Error_Code::mismatched_closing_tag, 2,
                u8"Closing tag without a matching opening tag."
            );
        }
        else if (peek(u8'<')) {
            if (m_root_seen) {
                error(
                    Parse_Error_Code::multiple_root_elements, 1,
                    u8"Only one root element is allowed."
                );
                return;
            }
            m_root_seen = true;
            consume_start_tag();
        }
        else {
            error(
                Parse_Error_Code::text_outside_root, 1,
                u8"Text is not allowed outside the root element."
            );
        }
    }

    void consume_content_piece()
    {
        if (peek(u8"<!--")) {
            consume_until_terminator(u8"-->", u8"Unterminated comment.");
        }
        else if (peek(u8"<![CDATA[")) {
            consume_cdata();
        }
        else if (peek(u8"<?")) {
            consume_until_terminator(u8"?>", u8"Unterminated processing instruction.");
        }
        else if (peek(u8"</")) {
            consume_end_tag();
        }
        else if (peek(u8'<')) {
            consume_start_tag();
        }
        else {
            consume_text();
        }
    }

    void consume_until_terminator(std::u8string_view terminator, std::u8string_view message)
    {
        const std::size_t end = peek_all().find(terminator);
        if (end == std::u8string_view::npos) {
            error(Parse_Error_Code::unterminated_markup, 2, message);
            return;
        }
        emit(XML_Instruction_Type::skip, end + terminator.size());
    }

    void consume_doctype()
    {
        const std::u8string_view rest = peek_all();
        std::size_t bracket_depth = 0;
        for (std::size_t i = 0; i < rest.size(); ++i) {
            switch (rest[i]) {
            case u8'[': ++bracket_depth; break;
            case u8']':
                if (bracket_depth != 0) {
                    --bracket_depth;
                }
                break;
            case u8'>':
                if (bracket_depth == 0) {
                    emit(XML_Instruction_Type::skip, i + 1);
                    return;
                }
                break;
            default: break;
            }
        }
        error(Parse_Error_Code::unterminated_markup, 9, u8"Unterminated document type declaration.");
    }

    void consume_cdata()
    {
        constexpr std::u8string_view prefix = u8"<![CDATA[";
        constexpr std::u8string_view suffix = u8"]]>";
        const std::size_t end = peek_all().find(suffix, prefix.size());
        if (end == std::u8string_view::npos) {
            error(Parse_Error_Code::unterminated_markup, prefix.size(), u8"Unterminated CDATA section.");
            return;
        }
        emit(XML_Instruction_Type::skip, prefix.size());
        m_out.push_back({ XML_Instruction_Type::cdata, end - prefix.size() });
        advance_by(end - prefix.size());
        emit(XML_Instruction_Type::skip, suffix.size());
    }

    /// @brief Checks the references within the next `length` characters,
    /// which are either text or an attribute value.
    [[nodiscard]]
    bool check_references(std::size_t length)
    {
        const std::u8string_view chars = peek_all().substr(0, length);
        for (std::size_t i = chars.find(u8'&'); i != std::u8string_view::npos;
             i = chars.find(u8'&', i + 1)) {
            if (match_reference(chars.substr(i)) == 0) {
                advance_by(i);
                error(
                    Parse_Error_Code::invalid_reference, 1,
                    u8"Invalid entity or character reference. Use &amp; for a literal '&'."
                );
                return false;
            }
        }
        return true;
    }

    void consume_text()
    {
        const std::size_t length = std::min(peek_all().find(u8'<'), peek_all().size());
        PARLEY_ASSERT(length != 0);
        if (!check_references(length)) {
            return;
        }
        emit(XML_Instruction_Type::text, length);
    }

    void consume_start_tag()
    {
        const Source_Position tag_start = m_pos;
        emit(XML_Instruction_Type::skip, 1);

        const std::size_t name_length = match_name();
        if (name_length == 0) {
            error(Parse_Error_Code::invalid_name, 1, u8"Expected an element name after '<'.");
            return;
        }
        const std::u8string_view name = peek_all().substr(0, name_length);
        emit(XML_Instruction_Type::push_element, name_length);

        std::vector<std::u8string_view> attribute_names;
        while (true) {
            const std::size_t whitespace = match_run(is_xml_whitespace);
            skip_whitespace();
            if (eof()) {
                m_pos = tag_start;
                error(Parse_Error_Code::unterminated_tag, 1 + name_length, u8"Unterminated start tag.");
                return;
            }
            if (peek(u8"/>")) {
                emit(XML_Instruction_Type::pop_element, 2);
                return;
            }
            if (peek(u8'>')) {
                emit(XML_Instruction_Type::skip, 1);
                m_open_elements.push_back(name);
                return;
            }
            if (whitespace == 0) {
                error(
                    Parse_Error_Code::invalid_attribute, 1,
                    u8"Expected whitespace, '>', or '/>' in start tag."
                );
                return;
            }
            if (!consume_attribute(attribute_names)) {
                return;
            }
        }
    }

    [[nodiscard]]
    bool consume_attribute(std::vector<std::u8string_view>& names)
    {
        const std::size_t name_length = match_name();
        if (name_length == 0) {
            error(Parse_Error_Code::invalid_name, 1, u8"Expected an attribute name.");
            return false;
        }
        const std::u8string_view name = peek_all().substr(0, name_length);
        if (std::ranges::find(names, name) != names.end()) {
            std::u8string message = u8"Duplicate attribute \"";
            message += name;
            message += u8"\".";
            error(Parse_Error_Code::duplicate_attribute, name_length, message);
            return false;
        }
        names.push_back(name);
        emit(XML_Instruction_Type::attribute_name, name_length);

        skip_whitespace();
        if (!peek(u8'=')) {
            error(Parse_Error_Code::invalid_attribute, 1, u8"Expected '=' after attribute name.");
            return false;
        }
        emit(XML_Instruction_Type::skip, 1);
        skip_whitespace();

        if (!peek(u8'"') && !peek(u8'\'')) {
            error(Parse_Error_Code::invalid_attribute, 1, u8"Expected a quoted attribute value.");
            return false;
        }
        const char8_t quote = peek_all().front();
        emit(XML_Instruction_Type::skip, 1);

        const std::size_t value_length = peek_all().find(quote);
        if (value_length == std::u8string_view::npos) {
            error(Parse_Error_Code::invalid_attribute, 0, u8"Unterminated attribute value.");
            return false;
        }
        const std::size_t less_than = peek_all().substr(0, value_length).find(u8'<');
        if (less_than != std::u8string_view::npos) {
            advance_by(less_than);
            error(
                Parse_Error_Code::unexpected_character, 1,
                u8"'<' is not allowed in attribute values. Use &lt; instead."
            );
            return false;
        }
        if (!check_references(value_length)) {
            return false;
        }
        m_out.push_back({ XML_Instruction_Type::attribute_value, value_length });
        advance_by(value_length);
        emit(XML_Instruction_Type::skip, 1);
        return true;
    }

    void consume_end_tag()
    {
        const std::u8string_view after_slash = peek_all().substr(2);
        const std::size_t name_length = !after_slash.empty() && is_xml_name_start(after_slash[0])
            ? std::size_t(
                  std::ranges::find_if_not(after_slash, is_xml_name_character) - after_slash.begin()
              )
            : 0;
        if (name_length == 0) {
            error(Parse_Error_Code::invalid_name, 2, u8"Expected an element name after '</'.");
            return;
        }
        const std::u8string_view name = peek_all().substr(2, name_length);
        const std::u8string_view after_name = peek_all().substr(2 + name_length);
        const std::size_t whitespace = std::size_t(
            std::ranges::find_if_not(after_name, is_xml_whitespace) - after_name.begin()
        );
        if (whitespace == after_name.size() || after_name[whitespace] != u8'>') {
            error(Parse_Error_Code::unterminated_tag, 2 + name_length, u8"Unterminated closing tag.");
            return;
        }
        PARLEY_ASSERT(!m_open_elements.empty());
        if (name != m_open_elements.back()) {
            std::u8string message = u8"Closing tag </";
            message += name;
            message += u8"> does not match the open element <";
            message += m_open_elements.back();
            message += u8">.";
            error(Parse_Error_Code::mismatched_closing_tag, 2 + name_length, message);
            return;
        }
        m_open_elements.pop_back();
        emit(XML_Instruction_Type::pop_element, 2 + name_length + whitespace + 1);
    }
};

} // namespace

Result<void, Parse_Error>
parse_xml_instructions(std::vector<XML_Instruction>& out, std::u8string_view source)
{
    return Parser { out, source }();
}

Result<xml::Element, Parse_Error> parse_xml(std::u8string_view source)
{
    std::vector<XML_Instruction> instructions;
    if (auto r = parse_xml_instructions(instructions, source); !r) {
        return std::move(r).error();
    }
    return build_tree(source, instructions);
}

} // namespace parley
