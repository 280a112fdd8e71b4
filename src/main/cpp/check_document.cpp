#include <algorithm>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/strings.hpp"
#include "parley/util/typo.hpp"

#include "parley/constraints.hpp"
#include "parley/document.hpp"
#include "parley/entities.hpp"
#include "parley/report.hpp"
#include "parley/settings.hpp"
#include "parley/xml.hpp"

namespace parley {

std::u8string_view issue_severity_name(Issue_Severity severity)
{
    using enum Issue_Severity;
    switch (severity) {
        PARLEY_ENUM_STRING_CASE8(info);
        PARLEY_ENUM_STRING_CASE8(warning);
        PARLEY_ENUM_STRING_CASE8(critical);
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid issue severity.");
}

std::u8string_view issue_code_name(Issue_Code code)
{
    using enum Issue_Code;
    switch (code) {
    case unknown_element: return u8"UNKNOWN_ELEMENT";
    case missing_required_attr: return u8"MISSING_REQUIRED_ATTR";
    case unknown_attribute: return u8"UNKNOWN_ATTRIBUTE";
    case invalid_attribute_value: return u8"INVALID_ATTRIBUTE_VALUE";
    case invalid_entity_ref: return u8"INVALID_ENTITY_REF";
    case child_not_allowed: return u8"CHILD_NOT_ALLOWED";
    case text_not_allowed: return u8"TEXT_NOT_ALLOWED";
    case missing_recommended_attr: return u8"MISSING_RECOMMENDED_ATTR";
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid issue code.");
}

namespace {

struct Document_Checker {
    const Constraint_Table& constraints;
    const Entity_Set& entities;
    std::vector<std::u8string_view> tag_names = constraints.tag_names();
    std::vector<Validation_Issue> issues {};

    void check(const Passage& passage, const xml::Element& passage_element)
    {
        check_element(passage, nullptr, passage_element);
        for (const Tag& tag : passage.tags) {
            check_element(passage, &tag, xml::element_at(passage_element, tag.path));
        }
    }

private:
    void report(
        const Passage& passage,
        const Tag* tag,
        Issue_Severity severity,
        Issue_Code code,
        std::u8string_view detail,
        std::u8string message
    )
    {
        std::u8string id = tag ? tag->id : passage.id;
        id += u8'/';
        id += issue_code_name(code);
        if (!detail.empty()) {
            id += u8'/';
            id += detail;
        }
        issues.push_back({
            .id = std::move(id),
            .severity = severity,
            .code = code,
            .passage_id = passage.id,
            .tag_id = tag ? tag->id : std::u8string {},
            .message = std::move(message),
        });
    }

    void check_element(const Passage& passage, const Tag* tag, const xml::Element& element)
    {
        const Tag_Constraint* const constraint = constraints.find_tag(element.name);
        if (!constraint) {
            std::u8string message = u8"The element <";
            message += element.name;
            message += u8"> is not defined by the schema.";
            const std::u8string_view suggestion
                = closest_suggestion(tag_names, element.name, max_typo_distance);
            if (!suggestion.empty()) {
                message += u8" Did you mean <";
                message += suggestion;
                message += u8">?";
            }
            report(
                passage, tag, Issue_Severity::critical, Issue_Code::unknown_element, {},
                std::move(message)
            );
            return;
        }
        check_attributes(passage, tag, element, *constraint);
        check_content(passage, tag, element, constraint->content);
    }

    void check_attributes(
        const Passage& passage,
        const Tag* tag,
        const xml::Element& element,
        const Tag_Constraint& constraint
    )
    {
        for (const std::u8string& required : constraint.required_attributes) {
            if (element.find_attribute(required)) {
                continue;
            }
            std::u8string message = u8"The element <";
            message += element.name;
            message += u8"> is missing the required attribute \"";
            message += required;
            message += u8"\".";
            report(
                passage, tag, Issue_Severity::critical, Issue_Code::missing_required_attr, required,
                std::move(message)
            );
        }
        if (is_speech_element(element.name) && !constraint.is_required(u8"who")
            && !element.find_attribute(u8"who")) {
            std::u8string message = u8"The <";
            message += element.name;
            message += u8"> has no speaker.";
            report(
                passage, tag, Issue_Severity::info, Issue_Code::missing_recommended_attr, u8"who",
                std::move(message)
            );
        }

        for (const xml::Attribute& attribute : element.attributes) {
            if (attribute.name.starts_with(u8"xml:") || attribute.name.starts_with(u8"xmlns")) {
                continue;
            }
            const Attribute_Constraint* const attribute_constraint
                = constraint.find_attribute(attribute.name);
            if (!attribute_constraint) {
                std::u8string message = u8"The attribute \"";
                message += attribute.name;
                message += u8"\" is not declared for <";
                message += element.name;
                message += u8">.";
                report(
                    passage, tag, Issue_Severity::warning, Issue_Code::unknown_attribute,
                    attribute.name, std::move(message)
                );
                continue;
            }
            check_value(passage, tag, element, attribute, *attribute_constraint);
        }
    }

    void check_value(
        const Passage& passage,
        const Tag* tag,
        const xml::Element& element,
        const xml::Attribute& attribute,
        const Attribute_Constraint& constraint
    )
    {
        const auto invalid_value = [&](std::u8string_view expectation) {
            std::u8string message = u8"The value \"";
            message += attribute.value;
            message += u8"\" of attribute \"";
            message += attribute.name;
            message += u8"\" of <";
            message += element.name;
            message += u8"> is invalid: ";
            message += expectation;
            report(
                passage, tag, Issue_Severity::critical, Issue_Code::invalid_attribute_value,
                attribute.name, std::move(message)
            );
        };

        switch (constraint.type) {
        case Attribute_Type::string:
        case Attribute_Type::token: return;

        case Attribute_Type::id:
        case Attribute_Type::ncname: {
            if (!is_ncname(attribute.value)) {
                invalid_value(u8"expected a name without spaces or colons.");
            }
            return;
        }
        case Attribute_Type::enumerated: {
            if (std::ranges::find(constraint.allowed_values, attribute.value)
                == constraint.allowed_values.end()) {
                std::u8string expectation = u8"expected one of ";
                expectation += join(constraint.allowed_values, u8", ");
                expectation += u8'.';
                invalid_value(expectation);
            }
            return;
        }
        case Attribute_Type::idref: {
            std::u8string unresolved;
            for_each_token(attribute.value, [&](std::u8string_view token) {
                const std::u8string_view xml_id = strip_pointer_hash(token);
                if (unresolved.empty() && !entities.find_by_xml_id(xml_id)) {
                    unresolved = xml_id;
                }
            });
            if (!unresolved.empty()) {
                std::u8string message = u8"The attribute \"";
                message += attribute.name;
                message += u8"\" of <";
                message += element.name;
                message += u8"> refers to \"";
                message += unresolved;
                message += u8"\", which is not a known entity.";
                report(
                    passage, tag, Issue_Severity::warning, Issue_Code::invalid_entity_ref,
                    attribute.name, std::move(message)
                );
            }
            return;
        }
        }
        PARLEY_ASSERT_UNREACHABLE(u8"Invalid attribute type.");
    }

    void check_content(
        const Passage& passage,
        const Tag* tag,
        const xml::Element& element,
        const Content_Model& model
    )
    {
        // A content model assumed by the compiler is only a guess, so violations are not fatal.
        const Issue_Severity severity = model.inferred ? Issue_Severity::warning : Issue_Severity::critical;
        bool text_reported = false;
        for (const xml::Node& child : element.children) {
            if (const xml::Text* const text = child.as_text()) {
                if (text_reported || model.allows_text() || is_xml_blank(text->text)) {
                    continue;
                }
                text_reported = true;
                std::u8string message = u8"The element <";
                message += element.name;
                message += u8"> does not allow text inside.";
                report(passage, tag, severity, Issue_Code::text_not_allowed, {}, std::move(message));
                continue;
            }
            const xml::Element& child_element = *child.as_element();
            if (model.allows_child(child_element.name)) {
                continue;
            }
            std::u8string message = u8"The element <";
            message += element.name;
            message += u8"> does not allow <";
            message += child_element.name;
            message += u8"> inside.";
            report(
                passage, tag, severity, Issue_Code::child_not_allowed, child_element.name,
                std::move(message)
            );
        }
    }
};

} // namespace

std::vector<Validation_Issue> check_document(const Document& document, const Constraint_Table& constraints)
{
    Document_Checker checker { .constraints = constraints, .entities = document.get_entities() };
    for (const Passage& passage : document.get_passages()) {
        checker.check(passage, xml::element_at(document.get_root(), passage.path));
    }
    return std::move(checker.issues);
}

} // namespace parley
