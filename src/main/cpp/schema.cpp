#include <algorithm>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parley/util/io.hpp"
#include "parley/util/result.hpp"
#include "parley/util/typo.hpp"

#include "parley/constraints.hpp"
#include "parley/diagnostic.hpp"
#include "parley/schema.hpp"
#include "parley/services.hpp"

namespace parley {

const Schema_Info* Schema_Catalog::find(std::u8string_view id) const
{
    const auto it = std::ranges::find(schemas, id, &Schema_Info::id);
    return it == schemas.end() ? nullptr : &*it;
}

std::vector<std::u8string_view> Schema_Catalog::ids() const
{
    std::vector<std::u8string_view> result;
    result.reserve(schemas.size());
    for (const Schema_Info& info : schemas) {
        result.push_back(info.id);
    }
    return result;
}

Schema_Catalog Schema_Catalog::subset(std::span<const std::u8string> ids) const
{
    Schema_Catalog result;
    for (const Schema_Info& info : schemas) {
        if (std::ranges::find(ids, info.id) != ids.end()) {
            result.schemas.push_back(info);
        }
    }
    return result;
}

Schema_Catalog default_schema_catalog(std::u8string_view directory)
{
    const auto location = [&](std::u8string_view id) {
        std::u8string result { directory };
        if (!result.empty() && !result.ends_with(u8'/')) {
            result += u8'/';
        }
        result += id;
        result += u8".rng";
        return result;
    };

    Schema_Catalog result;
    result.schemas.push_back({
        .id = u8"tei-all",
        .name = u8"TEI All",
        .description = u8"The complete vocabulary, with typed speaker references "
                       u8"and speech attributes.",
        .location = location(u8"tei-all"),
    });
    result.schemas.push_back({
        .id = u8"tei-novel",
        .name = u8"TEI Novel",
        .description = u8"A subset for prose fiction in which every speech act names its speaker.",
        .location = location(u8"tei-novel"),
    });
    result.schemas.push_back({
        .id = u8"tei-minimal",
        .name = u8"TEI Minimal",
        .description = u8"A permissive subset which only checks the basic document structure.",
        .location = location(u8"tei-minimal"),
    });
    return result;
}

Result<std::u8string, IO_Error_Code> File_Schema_Source::fetch(const Schema_Info& schema)
{
    return load_utf8_file(schema.location);
}

Result<std::u8string, IO_Error_Code> Memory_Schema_Source::fetch(const Schema_Info& schema)
{
    ++m_fetch_count;
    const auto it = m_grammars.find(schema.location);
    if (it == m_grammars.end()) {
        return IO_Error_Code::cannot_open;
    }
    return it->second;
}

std::shared_ptr<const Constraint_Table> Memory_Constraint_Cache::get(std::u8string_view schema_id)
{
    const auto it = m_tables.find(schema_id);
    return it == m_tables.end() ? nullptr : it->second;
}

void Memory_Constraint_Cache::set(
    std::u8string_view schema_id,
    std::shared_ptr<const Constraint_Table> table
)
{
    m_tables.insert_or_assign(std::u8string { schema_id }, std::move(table));
}

std::shared_ptr<const Constraint_Table> Lru_Constraint_Cache::get(std::u8string_view schema_id)
{
    const auto it = std::ranges::find(m_entries, schema_id, &Entry::first);
    if (it == m_entries.end()) {
        return nullptr;
    }
    m_entries.splice(m_entries.begin(), m_entries, it);
    return m_entries.front().second;
}

void Lru_Constraint_Cache::set(
    std::u8string_view schema_id,
    std::shared_ptr<const Constraint_Table> table
)
{
    const auto it = std::ranges::find(m_entries, schema_id, &Entry::first);
    if (it != m_entries.end()) {
        it->second = std::move(table);
        m_entries.splice(m_entries.begin(), m_entries, it);
        return;
    }
    if (m_entries.size() == m_capacity) {
        m_entries.pop_back();
    }
    m_entries.emplace_front(std::u8string { schema_id }, std::move(table));
}

std::u8string_view schema_error_code_name(Schema_Error_Code code)
{
    switch (code) {
        using enum Schema_Error_Code;
        PARLEY_ENUM_STRING_CASE8(unknown_schema);
        PARLEY_ENUM_STRING_CASE8(load_failed);
        PARLEY_ENUM_STRING_CASE8(parse_failed);
        PARLEY_ENUM_STRING_CASE8(cancelled);
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid schema error code.");
}

namespace {

[[nodiscard]]
Schema_Error cancelled_error(std::u8string_view schema_id)
{
    std::u8string message = u8"Resolution of the schema \"";
    message += schema_id;
    message += u8"\" was cancelled.";
    return { Schema_Error_Code::cancelled, std::u8string { schema_id }, std::move(message), {} };
}

} // namespace

Result<std::shared_ptr<const Constraint_Table>, Schema_Error>
Schema_Resolver::resolve(std::u8string_view schema_id, std::stop_token stop)
{
    const Schema_Info* const info = m_catalog.find(schema_id);
    if (!info) {
        std::u8string message = u8"The schema \"";
        message += schema_id;
        message += u8"\" is not in the catalog.";

        const std::vector<std::u8string_view> ids = m_catalog.ids();
        std::u8string suggestion { closest_suggestion(ids, schema_id, max_typo_distance) };
        if (!suggestion.empty()) {
            message += u8" Did you mean \"";
            message += suggestion;
            message += u8"\"?";
        }
        m_logger.log(Severity::error, diagnostic::schema_unknown, message);
        return Schema_Error { Schema_Error_Code::unknown_schema,
                              std::u8string { schema_id },
                              std::move(message),
                              std::move(suggestion) };
    }

    if (std::shared_ptr<const Constraint_Table> cached = m_cache.get(schema_id)) {
        if (m_logger.can_log(Severity::debug)) {
            std::u8string message = u8"Using cached constraints of schema \"";
            message += schema_id;
            message += u8"\".";
            m_logger.log(Severity::debug, diagnostic::cache_hit, message);
        }
        return cached;
    }

    if (stop.stop_requested()) {
        return cancelled_error(schema_id);
    }
    Result<std::u8string, IO_Error_Code> grammar = m_source.fetch(*info);
    if (!grammar) {
        std::u8string message = u8"Failed to load the grammar of schema \"";
        message += schema_id;
        message += u8"\" from \"";
        message += info->location;
        message += u8"\": ";
        message += io_error_code_message(grammar.error());
        m_logger.log(Severity::error, diagnostic::schema_fetch, message);
        return Schema_Error { Schema_Error_Code::load_failed,
                              std::u8string { schema_id },
                              std::move(message),
                              {} };
    }

    if (stop.stop_requested()) {
        return cancelled_error(schema_id);
    }
    Result<Constraint_Table, Schema_Parse_Error> table
        = compile_constraints(*grammar, m_logger, info->location);
    if (!table) {
        std::u8string message = u8"Failed to compile the grammar of schema \"";
        message += schema_id;
        message += u8"\": ";
        message += table.error().message;
        m_logger.log(Severity::error, diagnostic::schema_compile, message);
        return Schema_Error { Schema_Error_Code::parse_failed,
                              std::u8string { schema_id },
                              std::move(message),
                              {} };
    }

    auto result = std::make_shared<const Constraint_Table>(std::move(*table));
    m_cache.set(schema_id, result);
    return std::shared_ptr<const Constraint_Table> { std::move(result) };
}

} // namespace parley
