#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/result.hpp"
#include "parley/util/strings.hpp"

#include "parley/constraints.hpp"
#include "parley/diagnostic.hpp"
#include "parley/document.hpp"
#include "parley/report.hpp"
#include "parley/schema.hpp"
#include "parley/services.hpp"

namespace parley {

std::u8string_view fallback_error_code_name(Fallback_Error_Code code)
{
    using enum Fallback_Error_Code;
    switch (code) {
        PARLEY_ENUM_STRING_CASE8(no_schema_available);
        PARLEY_ENUM_STRING_CASE8(cancelled);
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid Fallback_Error_Code.");
}

std::shared_ptr<const Issue_List> Memory_Validation_Cache::get(const Validation_Cache_Key& key)
{
    const auto it = m_results.find(key);
    return it == m_results.end() ? nullptr : it->second;
}

void Memory_Validation_Cache::set(const Validation_Cache_Key& key, std::shared_ptr<const Issue_List> issues)
{
    m_results.insert_or_assign(key, std::move(issues));
}

namespace {

[[nodiscard]]
int health_score(std::size_t critical, std::size_t warnings)
{
    const std::size_t penalty = 10 * critical + 2 * warnings;
    return penalty >= 100 ? 0 : int(100 - penalty);
}

} // namespace

Validation_Summary summarize_issues(std::span<const Validation_Issue> issues)
{
    Validation_Summary result;
    for (const Validation_Issue& issue : issues) {
        switch (issue.severity) {
        case Issue_Severity::critical: ++result.critical; break;
        case Issue_Severity::warning: ++result.warnings; break;
        case Issue_Severity::info: ++result.infos; break;
        }
    }
    result.health_score = health_score(result.critical, result.warnings);
    return result;
}

Validation_Summary Validation_Report::summary() const
{
    Validation_Summary result;
    result.critical = errors.size();
    result.warnings = warnings.size();
    result.infos = infos.size();
    result.health_score = health_score(result.critical, result.warnings);
    return result;
}

namespace {

[[nodiscard]]
std::shared_ptr<const Issue_List> issues_for(
    const Document& document,
    std::u8string_view schema_id,
    const Constraint_Table& constraints,
    Validation_Cache& cache,
    Logger& logger
)
{
    const Validation_Cache_Key key { .schema_id = std::u8string { schema_id },
                                     .lineage = document.get_lineage(),
                                     .revision = document.get_revision() };
    if (std::shared_ptr<const Issue_List> cached = cache.get(key)) {
        if (logger.can_log(Severity::debug)) {
            std::u8string message = u8"Using cached validation result of schema \"";
            message += schema_id;
            message += u8"\" at revision ";
            append_integer(message, key.revision);
            message += u8'.';
            logger.log(Severity::debug, diagnostic::cache_hit, message);
        }
        return cached;
    }
    auto result = std::make_shared<const Issue_List>(check_document(document, constraints));
    cache.set(key, result);
    return result;
}

[[nodiscard]]
bool has_critical(const Issue_List& issues)
{
    return std::ranges::any_of(issues, [](const Validation_Issue& issue) {
        return issue.severity == Issue_Severity::critical;
    });
}

void distribute_issues(Validation_Report& report, const Issue_List& issues)
{
    for (const Validation_Issue& issue : issues) {
        switch (issue.severity) {
        case Issue_Severity::critical: report.errors.push_back(issue); break;
        case Issue_Severity::warning: report.warnings.push_back(issue); break;
        case Issue_Severity::info: report.infos.push_back(issue); break;
        }
    }
}

} // namespace

Result<Validation_Report, Fallback_Error> validate_document(
    const Document& document,
    Schema_Resolver& resolver,
    Validation_Cache& cache,
    std::stop_token stop
)
{
    Logger& logger = resolver.get_logger();
    Validation_Report report;

    std::u8string strictest_id;
    std::shared_ptr<const Issue_List> strictest_issues;

    for (const Schema_Info& schema : resolver.get_catalog().schemas) {
        Result<std::shared_ptr<const Constraint_Table>, Schema_Error> constraints
            = resolver.resolve(schema.id, stop);
        if (!constraints) {
            Schema_Error& error = constraints.error();
            if (error.code == Schema_Error_Code::cancelled) {
                logger.log(Severity::info, diagnostic::fallback_result, error.message);
                return Fallback_Error { Fallback_Error_Code::cancelled, std::move(error.message),
                                        std::move(report.skipped) };
            }
            if (logger.can_log(Severity::warning)) {
                std::u8string message = u8"Skipping schema \"";
                message += schema.id;
                message += u8"\": ";
                message += error.message;
                logger.log(Severity::warning, diagnostic::fallback_skip, message);
            }
            report.skipped.push_back({ .schema_id = schema.id,
                                       .code = error.code,
                                       .message = std::move(error.message) });
            continue;
        }

        std::shared_ptr<const Issue_List> issues
            = issues_for(document, schema.id, **constraints, cache, logger);
        if (!strictest_issues) {
            strictest_id = schema.id;
            strictest_issues = issues;
        }
        if (!has_critical(*issues)) {
            report.passed_schema_id = schema.id;
            report.reported_schema_id = schema.id;
            distribute_issues(report, *issues);
            break;
        }
        if (logger.can_log(Severity::debug)) {
            std::u8string message = u8"The document does not pass the schema \"";
            message += schema.id;
            message += u8"\".";
            logger.log(Severity::debug, diagnostic::fallback_skip, message);
        }
    }

    if (!strictest_issues) {
        std::u8string message = u8"None of the ";
        append_integer(message, resolver.get_catalog().schemas.size());
        message += u8" candidate schemas could be loaded and compiled.";
        logger.log(Severity::error, diagnostic::fallback_result, message);
        return Fallback_Error { Fallback_Error_Code::no_schema_available, std::move(message),
                                std::move(report.skipped) };
    }

    if (!report.passed()) {
        report.reported_schema_id = strictest_id;
        distribute_issues(report, *strictest_issues);
    }

    if (logger.can_log(Severity::info)) {
        std::u8string message;
        if (report.passed_schema_id) {
            message = u8"The document conforms to the schema \"";
            message += *report.passed_schema_id;
            message += u8"\".";
        }
        else {
            message = u8"The document conforms to no schema; reporting issues of \"";
            message += report.reported_schema_id;
            message += u8"\".";
        }
        logger.log(Severity::info, diagnostic::fallback_result, message);
    }
    return report;
}

} // namespace parley
