#ifndef PARLEY_CONSTRAINTS_HPP
#define PARLEY_CONSTRAINTS_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "parley/util/result.hpp"
#include "parley/util/source_position.hpp"

#include "parley/fwd.hpp"
#include "parley/services.hpp"

namespace parley {

enum struct Attribute_Type : Default_Underlying {
    /// @brief Any text.
    string,
    /// @brief An XML `ID`, i.e. an NCName that is unique within the document.
    id,
    /// @brief A reference to an `ID`, or in markup like TEI, a local pointer like `#jane`.
    idref,
    /// @brief An XML NCName.
    ncname,
    /// @brief A whitespace-normalized token.
    token,
    /// @brief One of a fixed list of values.
    enumerated,
};

[[nodiscard]]
std::u8string_view attribute_type_name(Attribute_Type type);

struct Attribute_Constraint {
    Attribute_Type type = Attribute_Type::string;
    /// @brief The allowed values if `type` is `enumerated`, otherwise empty.
    std::vector<std::u8string> allowed_values;

    [[nodiscard]]
    friend bool operator==(const Attribute_Constraint&, const Attribute_Constraint&)
        = default;
};

struct Content_Model {
    /// @brief Only character data is allowed, no child elements.
    bool text_only = false;
    /// @brief Character data is allowed between the `allowed_children`.
    bool mixed_content = false;
    /// @brief The names of elements which may appear as children, in order of first mention.
    std::vector<std::u8string> allowed_children;
    /// @brief `true` if this content model was not found in the grammar
    /// but assumed because the definition had neither content patterns nor attributes.
    /// Such a model is a heuristic and validation treats violations of it more leniently.
    bool inferred = false;

    [[nodiscard]]
    bool allows_text() const
    {
        return text_only || mixed_content;
    }

    [[nodiscard]]
    bool allows_child(std::u8string_view name) const;

    [[nodiscard]]
    friend bool operator==(const Content_Model&, const Content_Model&)
        = default;
};

struct Tag_Constraint {
    std::vector<std::u8string> required_attributes;
    std::vector<std::u8string> optional_attributes;
    /// @brief The constraints of every attribute in `required_attributes` and
    /// `optional_attributes`, keyed by attribute name.
    std::map<std::u8string, Attribute_Constraint, std::less<>> attributes;
    Content_Model content;

    [[nodiscard]]
    bool is_required(std::u8string_view attribute) const;

    [[nodiscard]]
    const Attribute_Constraint* find_attribute(std::u8string_view attribute) const;

    [[nodiscard]]
    friend bool operator==(const Tag_Constraint&, const Tag_Constraint&)
        = default;
};

struct String_Hash {
    using is_transparent = void;

    [[nodiscard]]
    std::size_t operator()(std::u8string_view str) const noexcept
    {
        return std::hash<std::u8string_view> {}(str);
    }
};

/// @brief A grammar construct that the constraint compiler did not understand and skipped.
struct Unrecognized_Pattern {
    /// @brief The name of the pattern element, like `externalRef`.
    std::u8string pattern;
    /// @brief The name of the element definition in which the pattern was found,
    /// or empty if it was found outside any element definition.
    std::u8string context;

    [[nodiscard]]
    friend bool operator==(const Unrecognized_Pattern&, const Unrecognized_Pattern&)
        = default;
};

/// @brief The compiled form of a grammar, keyed by element name.
struct Constraint_Table {
    std::unordered_map<std::u8string, Tag_Constraint, String_Hash, std::equal_to<>> tags;
    /// @brief Constructs the compiler skipped.
    /// A non-empty list means the table may be more permissive than the grammar.
    std::vector<Unrecognized_Pattern> unrecognized;

    [[nodiscard]]
    const Tag_Constraint* find_tag(std::u8string_view name) const;

    [[nodiscard]]
    const Attribute_Constraint* find_attribute(std::u8string_view tag, std::u8string_view attribute) const;

    [[nodiscard]]
    const Content_Model* find_content_model(std::u8string_view tag) const;

    /// @brief Returns the names of all tags, sorted.
    [[nodiscard]]
    std::vector<std::u8string_view> tag_names() const;
};

enum struct Schema_Parse_Error_Code : Default_Underlying {
    /// @brief The grammar text is not well-formed markup.
    malformed,
    /// @brief The root element is not `grammar`.
    no_grammar,
};

struct Schema_Parse_Error {
    Schema_Parse_Error_Code code;
    Source_Span location;
    std::u8string message;
};

/// @brief Compiles a RELAX NG grammar (XML syntax) into a constraint table.
/// Every `element` pattern with a literal `name` produces one `Tag_Constraint`,
/// whether it appears in a `define` or inline.
/// Unrecognized pattern combinators are logged, recorded in the result, and skipped.
/// @param grammar the grammar text
/// @param logger receives diagnostics about unrecognized or defaulted constructs
/// @param file the name under which diagnostics are reported
[[nodiscard]]
Result<Constraint_Table, Schema_Parse_Error> compile_constraints(
    std::u8string_view grammar,
    Logger& logger = ignorant_logger,
    std::u8string_view file = {}
);

} // namespace parley

#endif
