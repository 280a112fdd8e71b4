#include <array>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "parley/util/io.hpp"
#include "parley/util/result.hpp"

#include "parley/collecting_logger.hpp"
#include "parley/constraints.hpp"
#include "parley/diagnostic.hpp"
#include "parley/schema.hpp"

#include "test_data.hpp"

namespace parley {
namespace {

constexpr std::u8string_view said_grammar = u8R"(
<grammar xmlns="http://relaxng.org/ns/structure/1.0">
  <start>
    <element name="said">
      <attribute name="who"/>
      <text/>
    </element>
  </start>
</grammar>)";

[[nodiscard]]
Schema_Catalog memory_catalog()
{
    Schema_Catalog result;
    result.schemas.push_back({ u8"strict", u8"Strict", u8"", u8"mem:strict" });
    result.schemas.push_back({ u8"loose", u8"Loose", u8"", u8"mem:loose" });
    return result;
}

/// @brief A source that requests a stop while fetching.
struct Stopping_Schema_Source final : Schema_Source {
    std::stop_source& stop;

    [[nodiscard]]
    explicit Stopping_Schema_Source(std::stop_source& stop)
        : stop { stop }
    {
    }

    [[nodiscard]]
    Result<std::u8string, IO_Error_Code> fetch(const Schema_Info&) final
    {
        stop.request_stop();
        return std::u8string { said_grammar };
    }
};

TEST(Schema_Catalog, default_registry)
{
    const Schema_Catalog catalog = default_schema_catalog(schema_directory);
    const std::vector<std::u8string_view> expected { u8"tei-all", u8"tei-novel", u8"tei-minimal" };
    EXPECT_EQ(catalog.ids(), expected);

    const Schema_Info* const novel = catalog.find(u8"tei-novel");
    ASSERT_TRUE(novel);
    EXPECT_EQ(novel->location, u8"schemas/tei-novel.rng");
    EXPECT_FALSE(catalog.contains(u8"tei-lite"));

    EXPECT_EQ(default_schema_catalog(u8"schemas/").find(u8"tei-all")->location, u8"schemas/tei-all.rng");
}

TEST(Schema_Catalog, subset_keeps_catalog_order)
{
    const Schema_Catalog catalog = default_schema_catalog(schema_directory);
    const std::array<std::u8string, 3> ids { u8"tei-minimal", u8"unknown", u8"tei-all" };
    const Schema_Catalog subset = catalog.subset(ids);

    const std::vector<std::u8string_view> expected { u8"tei-all", u8"tei-minimal" };
    EXPECT_EQ(subset.ids(), expected);
}

TEST(Schema_Resolver, file_source)
{
    const Schema_Catalog catalog = default_schema_catalog(schema_directory);
    File_Schema_Source source;
    Memory_Constraint_Cache cache;
    Schema_Resolver resolver { catalog, source, cache };

    for (const std::u8string_view id : catalog.ids()) {
        const auto table = resolver.resolve(id);
        ASSERT_TRUE(table) << as_string_view(id);
        EXPECT_TRUE((*table)->find_tag(u8"p"));
    }
    EXPECT_EQ(cache.size(), 3u);
}

TEST(Schema_Resolver, unknown_schema_suggestion)
{
    const Schema_Catalog catalog = default_schema_catalog(schema_directory);
    Memory_Schema_Source source;
    Memory_Constraint_Cache cache;
    Collecting_Logger logger;
    Schema_Resolver resolver { catalog, source, cache, logger };

    const auto close = resolver.resolve(u8"tei-novle");
    ASSERT_FALSE(close);
    EXPECT_EQ(close.error().code, Schema_Error_Code::unknown_schema);
    EXPECT_EQ(close.error().schema_id, u8"tei-novle");
    EXPECT_EQ(close.error().suggestion, u8"tei-novel");
    EXPECT_TRUE(logger.was_logged(diagnostic::schema_unknown));

    const auto far = resolver.resolve(u8"docbook");
    ASSERT_FALSE(far);
    EXPECT_EQ(far.error().code, Schema_Error_Code::unknown_schema);
    EXPECT_TRUE(far.error().suggestion.empty());

    EXPECT_EQ(source.get_fetch_count(), 0u);
}

TEST(Schema_Resolver, compiled_once)
{
    const Schema_Catalog catalog = memory_catalog();
    Memory_Schema_Source source;
    source.insert(u8"mem:strict", said_grammar);
    Memory_Constraint_Cache cache;
    Collecting_Logger logger { Severity::debug };
    Schema_Resolver resolver { catalog, source, cache, logger };

    const auto first = resolver.resolve(u8"strict");
    ASSERT_TRUE(first);
    EXPECT_FALSE(logger.was_logged(diagnostic::cache_hit));

    const auto second = resolver.resolve(u8"strict");
    ASSERT_TRUE(second);
    EXPECT_EQ(first->get(), second->get());
    EXPECT_EQ(source.get_fetch_count(), 1u);
    EXPECT_TRUE(logger.was_logged(diagnostic::cache_hit));

    cache.clear();
    const auto third = resolver.resolve(u8"strict");
    ASSERT_TRUE(third);
    EXPECT_EQ(source.get_fetch_count(), 2u);
    EXPECT_NE(first->get(), third->get());
    EXPECT_EQ((*first)->tags.size(), (*third)->tags.size());
}

TEST(Schema_Resolver, load_failed)
{
    const Schema_Catalog catalog = memory_catalog();
    Memory_Schema_Source source;
    Memory_Constraint_Cache cache;
    Collecting_Logger logger;
    Schema_Resolver resolver { catalog, source, cache, logger };

    const auto result = resolver.resolve(u8"loose");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Schema_Error_Code::load_failed);
    EXPECT_EQ(result.error().schema_id, u8"loose");
    EXPECT_TRUE(logger.was_logged(diagnostic::schema_fetch));
    EXPECT_EQ(cache.size(), 0u);
}

TEST(Schema_Resolver, parse_failed)
{
    const Schema_Catalog catalog = memory_catalog();
    Memory_Schema_Source source;
    source.insert(u8"mem:loose", u8"<grammar>");
    Memory_Constraint_Cache cache;
    Collecting_Logger logger;
    Schema_Resolver resolver { catalog, source, cache, logger };

    const auto result = resolver.resolve(u8"loose");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Schema_Error_Code::parse_failed);
    EXPECT_TRUE(logger.was_logged(diagnostic::schema_compile));
    EXPECT_EQ(cache.size(), 0u);
}

TEST(Schema_Resolver, cancelled_before_fetch)
{
    const Schema_Catalog catalog = memory_catalog();
    Memory_Schema_Source source;
    source.insert(u8"mem:strict", said_grammar);
    Memory_Constraint_Cache cache;
    Schema_Resolver resolver { catalog, source, cache };

    std::stop_source stop;
    stop.request_stop();
    const auto result = resolver.resolve(u8"strict", stop.get_token());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Schema_Error_Code::cancelled);
    EXPECT_EQ(source.get_fetch_count(), 0u);
}

TEST(Schema_Resolver, cancelled_before_compile)
{
    const Schema_Catalog catalog = memory_catalog();
    std::stop_source stop;
    Stopping_Schema_Source source { stop };
    Memory_Constraint_Cache cache;
    Schema_Resolver resolver { catalog, source, cache };

    const auto result = resolver.resolve(u8"strict", stop.get_token());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Schema_Error_Code::cancelled);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(Schema_Resolver, cached_despite_cancellation)
{
    const Schema_Catalog catalog = memory_catalog();
    Memory_Schema_Source source;
    source.insert(u8"mem:strict", said_grammar);
    Memory_Constraint_Cache cache;
    Schema_Resolver resolver { catalog, source, cache };
    ASSERT_TRUE(resolver.resolve(u8"strict"));

    std::stop_source stop;
    stop.request_stop();
    const auto result = resolver.resolve(u8"strict", stop.get_token());
    ASSERT_TRUE(result);
    EXPECT_TRUE((*result)->find_tag(u8"said"));
}

TEST(Lru_Constraint_Cache, evicts_least_recently_used)
{
    Lru_Constraint_Cache cache { 2 };
    EXPECT_EQ(cache.get_capacity(), 2u);

    const auto a = std::make_shared<const Constraint_Table>();
    const auto b = std::make_shared<const Constraint_Table>();
    const auto c = std::make_shared<const Constraint_Table>();
    cache.set(u8"a", a);
    cache.set(u8"b", b);
    EXPECT_EQ(cache.get(u8"a"), a);

    // "b" is now the least recently used.
    cache.set(u8"c", c);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.get(u8"b"), nullptr);
    EXPECT_EQ(cache.get(u8"a"), a);
    EXPECT_EQ(cache.get(u8"c"), c);

    cache.set(u8"a", b);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.get(u8"a"), b);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.get(u8"a"), nullptr);
}

TEST(Schema_Error, code_names)
{
    EXPECT_EQ(schema_error_code_name(Schema_Error_Code::unknown_schema), u8"unknown_schema");
    EXPECT_EQ(schema_error_code_name(Schema_Error_Code::cancelled), u8"cancelled");
}

} // namespace
} // namespace parley
