#include <algorithm>
#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/result.hpp"
#include "parley/util/strings.hpp"

#include "parley/constraints.hpp"
#include "parley/diagnostic.hpp"
#include "parley/parse.hpp"
#include "parley/services.hpp"
#include "parley/xml.hpp"

namespace parley {

std::u8string_view attribute_type_name(Attribute_Type type)
{
    switch (type) {
        using enum Attribute_Type;
        PARLEY_ENUM_STRING_CASE8(string);
        PARLEY_ENUM_STRING_CASE8(id);
        PARLEY_ENUM_STRING_CASE8(idref);
        PARLEY_ENUM_STRING_CASE8(ncname);
        PARLEY_ENUM_STRING_CASE8(token);
        PARLEY_ENUM_STRING_CASE8(enumerated);
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid attribute type.");
}

bool Content_Model::allows_child(std::u8string_view name) const
{
    return std::ranges::find(allowed_children, name) != allowed_children.end();
}

bool Tag_Constraint::is_required(std::u8string_view attribute) const
{
    return std::ranges::find(required_attributes, attribute) != required_attributes.end();
}

const Attribute_Constraint* Tag_Constraint::find_attribute(std::u8string_view attribute) const
{
    const auto it = attributes.find(attribute);
    return it == attributes.end() ? nullptr : &it->second;
}

const Tag_Constraint* Constraint_Table::find_tag(std::u8string_view name) const
{
    const auto it = tags.find(name);
    return it == tags.end() ? nullptr : &it->second;
}

const Attribute_Constraint*
Constraint_Table::find_attribute(std::u8string_view tag, std::u8string_view attribute) const
{
    const Tag_Constraint* const constraint = find_tag(tag);
    return constraint ? constraint->find_attribute(attribute) : nullptr;
}

const Content_Model* Constraint_Table::find_content_model(std::u8string_view tag) const
{
    const Tag_Constraint* const constraint = find_tag(tag);
    return constraint ? &constraint->content : nullptr;
}

std::vector<std::u8string_view> Constraint_Table::tag_names() const
{
    std::vector<std::u8string_view> result;
    result.reserve(tags.size());
    for (const auto& [name, _] : tags) {
        result.push_back(name);
    }
    std::ranges::sort(result);
    return result;
}

namespace {

[[nodiscard]]
std::u8string_view prefix_of(std::u8string_view name)
{
    const std::size_t colon = name.find(u8':');
    return colon == std::u8string_view::npos ? std::u8string_view {} : name.substr(0, colon);
}

[[nodiscard]]
std::u8string_view local_name_of(std::u8string_view name)
{
    const std::size_t colon = name.find(u8':');
    return colon == std::u8string_view::npos ? name : name.substr(colon + 1);
}

[[nodiscard]]
Attribute_Type data_type_to_attribute_type(std::u8string_view type)
{
    if (type == u8"ID") {
        return Attribute_Type::id;
    }
    if (type == u8"IDREF" || type == u8"IDREFS") {
        return Attribute_Type::idref;
    }
    if (type == u8"NCName") {
        return Attribute_Type::ncname;
    }
    if (type == u8"token" || type == u8"NMTOKEN" || type == u8"NMTOKENS") {
        return Attribute_Type::token;
    }
    return Attribute_Type::string;
}

/// @brief Gathers the constraints of one element definition
/// by walking its content patterns, following references.
struct Element_Collector {
    Tag_Constraint constraint;
    bool text_allowed = false;
    bool mixed = false;
    bool content_seen = false;
};

struct Constraint_Compiler {
private:
    Logger& m_logger;
    const std::u8string_view m_file;
    /// @brief The namespace prefix of RELAX NG elements, taken from the root element.
    std::u8string_view m_rng_prefix;

    std::map<std::u8string_view, std::vector<const xml::Element*>, std::less<>> m_defines;
    std::deque<const xml::Element*> m_pending_elements;
    /// @brief The names of `define`s currently being expanded, innermost last.
    std::vector<std::u8string_view> m_expansion_stack;
    Constraint_Table m_result;

public:
    [[nodiscard]]
    Constraint_Compiler(Logger& logger, std::u8string_view file)
        : m_logger { logger }
        , m_file { file }
    {
    }

    [[nodiscard]]
    Result<Constraint_Table, Schema_Parse_Error> operator()(const xml::Element& root)
    {
        if (local_name_of(root.name) != u8"grammar") {
            std::u8string message = u8"The root of a grammar must be <grammar>, but is <";
            message += root.name;
            message += u8">.";
            return Schema_Parse_Error { Schema_Parse_Error_Code::no_grammar, {}, std::move(message) };
        }
        m_rng_prefix = prefix_of(root.name);

        collect_definitions(root);
        discover_elements(root);
        while (!m_pending_elements.empty()) {
            const xml::Element* const element = m_pending_elements.front();
            m_pending_elements.pop_front();
            compile_element(*element);
        }
        return std::move(m_result);
    }

private:
    void log(Severity severity, std::u8string_view id, std::u8string_view message)
    {
        if (m_logger.can_log(severity)) {
            m_logger({ .severity = severity,
                       .id = id,
                       .file = m_file,
                       .location = {},
                       .message = message });
        }
    }

    /// @brief Returns the RELAX NG pattern name of `element`,
    /// or an empty string if `element` belongs to another vocabulary,
    /// such as documentation annotations.
    [[nodiscard]]
    std::u8string_view pattern_name(const xml::Element& element) const
    {
        if (prefix_of(element.name) != m_rng_prefix) {
            return {};
        }
        return local_name_of(element.name);
    }

    void unrecognized(std::u8string_view pattern, std::u8string_view context)
    {
        std::u8string message = u8"The pattern <";
        message += pattern;
        message += u8">";
        if (!context.empty()) {
            message += u8" in the definition of <";
            message += context;
            message += u8">";
        }
        message += u8" is not supported and was ignored.";
        log(Severity::warning, diagnostic::schema_pattern_unrecognized, message);
        m_result.unrecognized.push_back({ std::u8string { pattern }, std::u8string { context } });
    }

    /// @brief Returns the name of an `element` or `attribute` pattern,
    /// given either as a `name` attribute or as a `<name>` child.
    /// Returns an empty string for name classes like `anyName`.
    [[nodiscard]]
    std::u8string_view name_of_named_pattern(const xml::Element& pattern) const
    {
        if (const std::u8string* const name = pattern.find_attribute(u8"name")) {
            return trim_xml_whitespace(*name);
        }
        for (const xml::Node& child : pattern.children) {
            const xml::Element* const e = child.as_element();
            if (e && pattern_name(*e) == u8"name" && e->children.size() == 1) {
                if (const xml::Text* const t = e->children.front().as_text()) {
                    return trim_xml_whitespace(t->text);
                }
            }
        }
        return {};
    }

    void collect_definitions(const xml::Element& container)
    {
        for (const xml::Node& child : container.children) {
            const xml::Element* const e = child.as_element();
            if (!e) {
                continue;
            }
            const std::u8string_view name = pattern_name(*e);
            if (name == u8"define") {
                if (const std::u8string* const define_name = e->find_attribute(u8"name")) {
                    m_defines[*define_name].push_back(e);
                }
            }
            else if (name == u8"div") {
                collect_definitions(*e);
            }
            else if (name == u8"include" || name == u8"externalRef") {
                unrecognized(name, {});
            }
        }
    }

    /// @brief Queues every `element` pattern reachable from `pattern`
    /// without passing through another `element` pattern.
    void discover_elements(const xml::Element& pattern)
    {
        for (const xml::Node& child : pattern.children) {
            const xml::Element* const e = child.as_element();
            if (!e) {
                continue;
            }
            if (pattern_name(*e) == u8"element") {
                m_pending_elements.push_back(e);
            }
            else {
                discover_elements(*e);
            }
        }
    }

    [[nodiscard]]
    const std::vector<const xml::Element*>* find_define(std::u8string_view name) const
    {
        const auto it = m_defines.find(name);
        return it == m_defines.end() ? nullptr : &it->second;
    }

    /// @brief Expands the `define` named by the `ref` pattern `ref`,
    /// invoking `f` with each pattern in its content.
    /// Unresolved and circular references are logged and expand to nothing.
    template <typename F>
    void expand_ref(const xml::Element& ref, std::u8string_view context, F f)
    {
        const std::u8string* const target = ref.find_attribute(u8"name");
        if (!target) {
            unrecognized(u8"ref", context);
            return;
        }
        const std::vector<const xml::Element*>* const defines = find_define(*target);
        if (!defines) {
            std::u8string message = u8"The reference to \"";
            message += *target;
            message += u8"\" does not match any definition.";
            log(Severity::warning, diagnostic::schema_ref_unresolved, message);
            return;
        }
        if (std::ranges::find(m_expansion_stack, *target) != m_expansion_stack.end()) {
            std::u8string message = u8"The definition \"";
            message += *target;
            message += u8"\" refers to itself without an intermediate element.";
            log(Severity::warning, diagnostic::schema_ref_circular, message);
            return;
        }
        m_expansion_stack.push_back(*target);
        for (const xml::Element* const define : *defines) {
            for (const xml::Node& child : define->children) {
                if (const xml::Element* const e = child.as_element()) {
                    f(*e);
                }
            }
        }
        m_expansion_stack.pop_back();
    }

    void compile_element(const xml::Element& element)
    {
        const std::u8string_view name = name_of_named_pattern(element);
        if (name.empty()) {
            unrecognized(u8"element (name class)", {});
            return;
        }
        if (m_result.tags.contains(name)) {
            return;
        }

        Element_Collector collector;
        const std::vector<std::u8string_view> saved_stack = std::exchange(m_expansion_stack, {});
        for (const xml::Node& child : element.children) {
            if (const xml::Element* const e = child.as_element()) {
                collect_content(collector, *e, name, false);
            }
        }
        m_expansion_stack = saved_stack;

        Tag_Constraint& constraint = collector.constraint;
        Content_Model& content = constraint.content;
        if (!collector.content_seen && constraint.attributes.empty()) {
            content.text_only = true;
            content.inferred = true;
            std::u8string message = u8"The definition of <";
            message += name;
            message += u8"> has no recognized content pattern and no attributes, "
                       u8"so it is assumed to contain text only.";
            log(Severity::info, diagnostic::schema_content_defaulted, message);
        }
        else {
            content.mixed_content
                = collector.mixed || (collector.text_allowed && !content.allowed_children.empty());
            content.text_only = collector.text_allowed && !content.mixed_content;
        }

        m_result.tags.emplace(std::u8string { name }, std::move(constraint));
    }

    void collect_content(
        Element_Collector& collector,
        const xml::Element& pattern,
        std::u8string_view context,
        bool optional
    )
    {
        const std::u8string_view name = pattern_name(pattern);
        if (name.empty() || name == u8"name" || name == u8"anyName" || name == u8"nsName"
            || name == u8"except" || name == u8"documentation") {
            return;
        }

        const auto recurse = [&](bool nested_optional) {
            for (const xml::Node& child : pattern.children) {
                if (const xml::Element* const e = child.as_element()) {
                    collect_content(collector, *e, context, nested_optional);
                }
            }
        };

        if (name == u8"attribute") {
            collect_attribute(collector, pattern, context, optional);
        }
        else if (name == u8"optional" || name == u8"zeroOrMore" || name == u8"choice") {
            recurse(true);
        }
        else if (name == u8"oneOrMore" || name == u8"group" || name == u8"interleave") {
            recurse(optional);
        }
        else if (name == u8"mixed") {
            collector.mixed = true;
            collector.text_allowed = true;
            collector.content_seen = true;
            recurse(optional);
        }
        else if (name == u8"text" || name == u8"data" || name == u8"value" || name == u8"list") {
            collector.text_allowed = true;
            collector.content_seen = true;
        }
        else if (name == u8"empty" || name == u8"notAllowed") {
            collector.content_seen = true;
        }
        else if (name == u8"element") {
            collector.content_seen = true;
            const std::u8string_view child_name = name_of_named_pattern(pattern);
            if (child_name.empty()) {
                unrecognized(u8"element (name class)", context);
                return;
            }
            std::vector<std::u8string>& children = collector.constraint.content.allowed_children;
            if (std::ranges::find(children, child_name) == children.end()) {
                children.emplace_back(child_name);
            }
            m_pending_elements.push_back(&pattern);
        }
        else if (name == u8"ref") {
            expand_ref(pattern, context, [&](const xml::Element& e) {
                collect_content(collector, e, context, optional);
            });
        }
        else {
            unrecognized(name, context);
        }
    }

    void collect_attribute(
        Element_Collector& collector,
        const xml::Element& pattern,
        std::u8string_view context,
        bool optional
    )
    {
        const std::u8string_view name = name_of_named_pattern(pattern);
        if (name.empty()) {
            unrecognized(u8"attribute (name class)", context);
            return;
        }
        Tag_Constraint& constraint = collector.constraint;
        if (constraint.attributes.contains(name)) {
            // The first declaration determines the type,
            // but a required declaration anywhere makes the attribute required.
            if (!optional && !constraint.is_required(name)) {
                std::erase(constraint.optional_attributes, name);
                constraint.required_attributes.emplace_back(name);
            }
            return;
        }
        Attribute_Constraint attribute;
        for (const xml::Node& child : pattern.children) {
            if (const xml::Element* const e = child.as_element()) {
                resolve_attribute_type(attribute, *e, context);
            }
        }
        constraint.attributes.emplace(std::u8string { name }, std::move(attribute));
        (optional ? constraint.optional_attributes : constraint.required_attributes)
            .emplace_back(name);
    }

    /// @brief Refines `attribute` using the value pattern `pattern` found inside an attribute.
    void resolve_attribute_type(
        Attribute_Constraint& attribute,
        const xml::Element& pattern,
        std::u8string_view context
    )
    {
        const std::u8string_view name = pattern_name(pattern);
        if (name == u8"data") {
            if (const std::u8string* const type = pattern.find_attribute(u8"type")) {
                attribute.type = data_type_to_attribute_type(*type);
            }
        }
        else if (name == u8"value") {
            attribute.type = Attribute_Type::enumerated;
            attribute.allowed_values.emplace_back(trim_xml_whitespace(pattern.text_content()));
        }
        else if (name == u8"choice") {
            const bool all_values = std::ranges::all_of(pattern.children, [&](const xml::Node& n) {
                const xml::Element* const e = n.as_element();
                return !e || pattern_name(*e) != u8"data";
            });
            if (!all_values) {
                // A choice between free data and fixed values accepts any text.
                attribute.type = Attribute_Type::string;
                attribute.allowed_values.clear();
                return;
            }
            for (const xml::Node& child : pattern.children) {
                if (const xml::Element* const e = child.as_element()) {
                    resolve_attribute_type(attribute, *e, context);
                }
            }
        }
        else if (name == u8"ref") {
            expand_ref(pattern, context, [&](const xml::Element& e) {
                resolve_attribute_type(attribute, e, context);
            });
        }
        else if (name == u8"list") {
            attribute.type = Attribute_Type::token;
        }
        else if (name == u8"text" || name.empty() || name == u8"documentation") {
            return;
        }
        else {
            unrecognized(name, context);
        }
    }
};

} // namespace

Result<Constraint_Table, Schema_Parse_Error>
compile_constraints(std::u8string_view grammar, Logger& logger, std::u8string_view file)
{
    Result<xml::Element, Parse_Error> root = parse_xml(grammar);
    if (!root) {
        std::u8string message = u8"The grammar is not well-formed: ";
        message += root.error().message;
        return Schema_Parse_Error { Schema_Parse_Error_Code::malformed,
                                    root.error().location,
                                    std::move(message) };
    }
    return Constraint_Compiler { logger, file }(*root);
}

} // namespace parley
