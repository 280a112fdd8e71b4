#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/chars.hpp"
#include "parley/util/unicode.hpp"

#include "parley/parse.hpp"
#include "parley/xml.hpp"

namespace parley {
namespace {

[[nodiscard]]
char32_t decode_character_reference(std::u8string_view body)
{
    PARLEY_ASSERT(body.starts_with(u8'#'));
    const bool hex = body.starts_with(u8"#x");
    char32_t value = 0;
    for (const char8_t c : body.substr(hex ? 2 : 1)) {
        const char32_t digit = is_ascii_digit(c) ? char32_t(c - u8'0')
                                                 : char32_t(to_ascii_lower(c) - u8'a' + 10);
        value = value * (hex ? 16 : 10) + digit;
    }
    return value;
}

enum struct Whitespace_Handling : bool {
    /// @brief Line breaks are normalized to `\n`, as in character data.
    text,
    /// @brief Any whitespace character becomes a space, as in attribute values.
    attribute,
};

/// @brief Appends `raw` to `out`, decoding references if `decode_references` is `true`,
/// and normalizing whitespace according to `handling`.
/// `raw` shall contain only valid references, as verified by the parser.
void append_decoded(
    std::u8string& out,
    std::u8string_view raw,
    bool decode_references,
    Whitespace_Handling handling
)
{
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const char8_t c = raw[i];
        if (c == u8'\r') {
            // CR LF and lone CR both become a single line feed.
            if (i + 1 < raw.size() && raw[i + 1] == u8'\n') {
                ++i;
            }
            out += handling == Whitespace_Handling::attribute ? u8' ' : u8'\n';
            continue;
        }
        if (handling == Whitespace_Handling::attribute && (c == u8'\n' || c == u8'\t')) {
            out += u8' ';
            continue;
        }
        if (c != u8'&' || !decode_references) {
            out += c;
            continue;
        }
        const std::size_t semicolon = raw.find(u8';', i);
        PARLEY_ASSERT(semicolon != std::u8string_view::npos);
        const std::u8string_view body = raw.substr(i + 1, semicolon - i - 1);
        if (body == u8"lt") {
            out += u8'<';
        }
        else if (body == u8"gt") {
            out += u8'>';
        }
        else if (body == u8"amp") {
            out += u8'&';
        }
        else if (body == u8"quot") {
            out += u8'"';
        }
        else if (body == u8"apos") {
            out += u8'\'';
        }
        else {
            utf8::append_code_point(out, decode_character_reference(body));
        }
        i = semicolon;
    }
}

} // namespace

xml::Element build_tree(std::u8string_view source, std::span<const XML_Instruction> instructions)
{
    std::vector<xml::Element> stack;
    std::u8string_view pending_attribute_name;
    std::optional<xml::Element> root;
    std::size_t pos = 0;

    for (const XML_Instruction& instruction : instructions) {
        const std::u8string_view chars = source.substr(pos, instruction.n);
        pos += instruction.n;

        switch (instruction.type) {
            using enum XML_Instruction_Type;
        case skip: break;

        case push_element: {
            stack.push_back(xml::Element { .name = std::u8string { chars } });
            break;
        }
        case attribute_name: {
            pending_attribute_name = chars;
            break;
        }
        case attribute_value: {
            PARLEY_ASSERT(!stack.empty());
            std::u8string value;
            append_decoded(value, chars, true, Whitespace_Handling::attribute);
            stack.back().attributes.push_back(
                { std::u8string { pending_attribute_name }, std::move(value) }
            );
            break;
        }
        case text:
        case cdata: {
            PARLEY_ASSERT(!stack.empty());
            std::u8string decoded;
            append_decoded(decoded, chars, instruction.type == text, Whitespace_Handling::text);
            xml::append_text(stack.back().children, decoded);
            break;
        }
        case pop_element: {
            PARLEY_ASSERT(!stack.empty());
            xml::Element element = std::move(stack.back());
            stack.pop_back();
            if (stack.empty()) {
                root = std::move(element);
            }
            else {
                stack.back().children.push_back(xml::Node { std::move(element) });
            }
            break;
        }
        }
    }

    PARLEY_ASSERT(stack.empty());
    PARLEY_ASSERT(root);
    return std::move(*root);
}

} // namespace parley
