#ifndef PARLEY_REPORT_HPP
#define PARLEY_REPORT_HPP

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "parley/util/result.hpp"

#include "parley/constraints.hpp"
#include "parley/document.hpp"
#include "parley/fwd.hpp"
#include "parley/schema.hpp"

namespace parley {

enum struct Issue_Severity : Default_Underlying {
    info,
    warning,
    critical,
};

[[nodiscard]]
std::u8string_view issue_severity_name(Issue_Severity severity);

enum struct Issue_Code : Default_Underlying {
    /// @brief An element is not defined by the schema.
    unknown_element,
    missing_required_attr,
    /// @brief An attribute is not declared for its element.
    unknown_attribute,
    invalid_attribute_value,
    /// @brief A reference attribute points to no known entity.
    invalid_entity_ref,
    child_not_allowed,
    text_not_allowed,
    /// @brief A speech tag has no speaker, which is allowed but unhelpful.
    missing_recommended_attr,
};

/// @brief Returns the upper-case name of the code, like `INVALID_ENTITY_REF`.
[[nodiscard]]
std::u8string_view issue_code_name(Issue_Code code);

/// @brief A non-blocking finding about a document, reported for display.
struct Validation_Issue {
    /// @brief Identifies the issue within one report,
    /// derived from the location, the code, and the attribute if any.
    std::u8string id;
    Issue_Severity severity;
    Issue_Code code;
    std::u8string passage_id;
    /// @brief The id of the offending tag, or empty if the passage element itself is affected.
    std::u8string tag_id;
    std::u8string message;

    [[nodiscard]]
    friend bool operator==(const Validation_Issue&, const Validation_Issue&)
        = default;
};

/// @brief Checks every passage of `document`, and the tags within,
/// against `constraints`.
/// Elements outside passages, such as the header, are not checked.
[[nodiscard]]
std::vector<Validation_Issue> check_document(const Document& document, const Constraint_Table& constraints);

/// @brief Identifies the result of checking one document state against one schema.
struct Validation_Cache_Key {
    std::u8string schema_id;
    std::uint64_t lineage;
    std::uint64_t revision;

    [[nodiscard]]
    friend auto operator<=>(const Validation_Cache_Key&, const Validation_Cache_Key&)
        = default;
    [[nodiscard]]
    friend bool operator==(const Validation_Cache_Key&, const Validation_Cache_Key&)
        = default;
};

using Issue_List = std::vector<Validation_Issue>;

/// @brief Stores the issues found for a document state and a schema.
struct Validation_Cache {
    [[nodiscard]]
    virtual std::shared_ptr<const Issue_List> get(const Validation_Cache_Key& key)
        = 0;

    virtual void set(const Validation_Cache_Key& key, std::shared_ptr<const Issue_List> issues) = 0;

    virtual void clear() = 0;
};

struct Memory_Validation_Cache final : Validation_Cache {
private:
    std::map<Validation_Cache_Key, std::shared_ptr<const Issue_List>> m_results;

public:
    [[nodiscard]]
    std::size_t size() const
    {
        return m_results.size();
    }

    [[nodiscard]]
    std::shared_ptr<const Issue_List> get(const Validation_Cache_Key& key) final;

    void set(const Validation_Cache_Key& key, std::shared_ptr<const Issue_List> issues) final;

    void clear() final
    {
        m_results.clear();
    }
};

/// @brief A schema candidate that progressive fallback could not use.
struct Skipped_Schema {
    std::u8string schema_id;
    Schema_Error_Code code;
    std::u8string message;

    [[nodiscard]]
    friend bool operator==(const Skipped_Schema&, const Skipped_Schema&)
        = default;
};

struct Validation_Summary {
    std::size_t critical = 0;
    std::size_t warnings = 0;
    std::size_t infos = 0;
    /// @brief `max(0, 100 - 10 * critical - 2 * warnings)`.
    int health_score = 100;

    [[nodiscard]]
    friend bool operator==(const Validation_Summary&, const Validation_Summary&)
        = default;
};

[[nodiscard]]
Validation_Summary summarize_issues(std::span<const Validation_Issue> issues);

struct Validation_Report {
    /// @brief The first schema in catalog order that the document passes without critical issues,
    /// if any.
    std::optional<std::u8string> passed_schema_id;
    /// @brief The schema whose issues are reported:
    /// the passed schema, or if none was passed, the strictest schema that could be compiled.
    std::u8string reported_schema_id;
    /// @brief The critical issues.
    std::vector<Validation_Issue> errors;
    std::vector<Validation_Issue> warnings;
    std::vector<Validation_Issue> infos;
    std::vector<Skipped_Schema> skipped;

    [[nodiscard]]
    bool passed() const
    {
        return passed_schema_id.has_value();
    }

    [[nodiscard]]
    Validation_Summary summary() const;
};

enum struct Fallback_Error_Code : Default_Underlying {
    /// @brief No schema candidate could be fetched and compiled.
    no_schema_available,
    /// @brief A stop was requested while a schema was being fetched or compiled.
    cancelled,
};

[[nodiscard]]
std::u8string_view fallback_error_code_name(Fallback_Error_Code code);

/// @brief The document could not be validated at all.
struct Fallback_Error {
    Fallback_Error_Code code;
    std::u8string message;
    std::vector<Skipped_Schema> skipped;
};

/// @brief Validates `document` by progressive fallback:
/// the schemas of the resolver's catalog are tried from strictest to loosest,
/// stopping at the first one that reports no critical issues.
/// Schemas that cannot be fetched or compiled are logged and skipped.
/// Cancellation ends the fallback with `Fallback_Error_Code::cancelled`;
/// no looser schema is consulted afterwards.
[[nodiscard]]
Result<Validation_Report, Fallback_Error> validate_document(
    const Document& document,
    Schema_Resolver& resolver,
    Validation_Cache& cache,
    std::stop_token stop = {}
);

} // namespace parley

#endif
