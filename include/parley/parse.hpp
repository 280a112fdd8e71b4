#ifndef PARLEY_PARSE_HPP
#define PARLEY_PARSE_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "parley/util/result.hpp"
#include "parley/util/source_position.hpp"

#include "parley/fwd.hpp"
#include "parley/xml.hpp"

namespace parley {

enum struct XML_Instruction_Type : Default_Underlying {
    /// @brief Ignore the next `n` characters.
    /// This covers markup that does not become part of the tree,
    /// such as comments, processing instructions, the document type declaration,
    /// delimiters like `<` or `="`, and whitespace outside the root element.
    skip,
    /// @brief The next `n` characters are the name of a new element, which is entered.
    push_element,
    /// @brief The next `n` characters are an attribute name of the current element.
    attribute_name,
    /// @brief The next `n` characters are an attribute value, with references not yet decoded.
    attribute_value,
    /// @brief The next `n` characters are character data, with references not yet decoded.
    text,
    /// @brief The next `n` characters are the contents of a CDATA section, taken literally.
    cdata,
    /// @brief The next `n` characters close the current element,
    /// either `/>` or a complete closing tag like `</p>`.
    pop_element,
};

struct XML_Instruction {
    XML_Instruction_Type type;
    std::size_t n;

    [[nodiscard]]
    friend constexpr bool operator==(const XML_Instruction&, const XML_Instruction&)
        = default;
};

enum struct Parse_Error_Code : Default_Underlying {
    /// @brief The text contains no element at all.
    no_root_element,
    /// @brief A second element was found after the root element was closed.
    multiple_root_elements,
    /// @brief Non-whitespace text was found outside the root element.
    text_outside_root,
    /// @brief A name was expected but not found, or is malformed.
    invalid_name,
    /// @brief A start tag is not terminated by `>` or `/>`.
    unterminated_tag,
    /// @brief An attribute has no `=` or no quoted value.
    invalid_attribute,
    /// @brief The same attribute appears twice on an element.
    duplicate_attribute,
    /// @brief A comment, CDATA section, processing instruction,
    /// or document type declaration is not terminated.
    unterminated_markup,
    /// @brief A closing tag does not match the currently open element.
    mismatched_closing_tag,
    /// @brief The text ended while elements were still open.
    unclosed_element,
    /// @brief An entity or character reference is malformed or unknown.
    invalid_reference,
    /// @brief A `<` or `&` appears where it is not allowed.
    unexpected_character,
    /// @brief The text is not valid UTF-8.
    corrupted,
};

[[nodiscard]]
std::u8string_view parse_error_code_name(Parse_Error_Code code);

struct Parse_Error {
    Parse_Error_Code code;
    Source_Span location;
    std::u8string message;
};

/// @brief Parses XML markup into a stream of instructions.
/// The instructions are appended to `out` and cover `source` exactly,
/// i.e. the sum of all `n` equals `source.size()` on success.
/// On failure, the contents of `out` are unspecified.
[[nodiscard]]
Result<void, Parse_Error>
parse_xml_instructions(std::vector<XML_Instruction>& out, std::u8string_view source);

/// @brief Builds an element tree from the instructions produced by `parse_xml_instructions`.
/// Entity and character references are decoded,
/// line breaks are normalized to `\n`,
/// and whitespace characters in attribute values become spaces.
/// @param source The source which was parsed.
/// @param instructions The instructions which were successfully produced from `source`.
[[nodiscard]]
xml::Element build_tree(std::u8string_view source, std::span<const XML_Instruction> instructions);

/// @brief Equivalent to `parse_xml_instructions` followed by `build_tree`.
[[nodiscard]]
Result<xml::Element, Parse_Error> parse_xml(std::u8string_view source);

} // namespace parley

#endif
