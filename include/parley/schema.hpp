#ifndef PARLEY_SCHEMA_HPP
#define PARLEY_SCHEMA_HPP

#include <cstddef>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parley/util/io.hpp"
#include "parley/util/result.hpp"

#include "parley/constraints.hpp"
#include "parley/fwd.hpp"
#include "parley/services.hpp"

namespace parley {

/// @brief Human-readable information about a schema, and where its grammar is found.
struct Schema_Info {
    /// @brief The id by which the schema is selected, like `tei-novel`.
    std::u8string id;
    std::u8string name;
    std::u8string description;
    /// @brief The location of the grammar, interpreted by a `Schema_Source`.
    /// For a `File_Schema_Source`, this is a file path.
    std::u8string location;

    [[nodiscard]]
    friend bool operator==(const Schema_Info&, const Schema_Info&)
        = default;
};

/// @brief An ordered list of schemas, from the strictest to the most permissive.
struct Schema_Catalog {
    std::vector<Schema_Info> schemas;

    [[nodiscard]]
    const Schema_Info* find(std::u8string_view id) const;

    [[nodiscard]]
    bool contains(std::u8string_view id) const
    {
        return find(id) != nullptr;
    }

    /// @brief Returns the ids of all schemas in catalog order.
    [[nodiscard]]
    std::vector<std::u8string_view> ids() const;

    /// @brief Returns a catalog containing only the schemas with the given ids,
    /// in the order in which they appear in this catalog.
    /// Unknown ids are ignored.
    [[nodiscard]]
    Schema_Catalog subset(std::span<const std::u8string> ids) const;
};

/// @brief Returns the built-in TEI schema registry:
/// `tei-all`, `tei-novel`, and `tei-minimal`, in that order,
/// with grammar files `<directory>/<id>.rng`.
[[nodiscard]]
Schema_Catalog default_schema_catalog(std::u8string_view directory);

/// @brief Obtains the grammar text of a schema.
struct Schema_Source {
    [[nodiscard]]
    virtual Result<std::u8string, IO_Error_Code> fetch(const Schema_Info& schema)
        = 0;
};

/// @brief Reads grammars from the file system, using `Schema_Info::location` as the path.
struct File_Schema_Source final : Schema_Source {
    [[nodiscard]]
    Result<std::u8string, IO_Error_Code> fetch(const Schema_Info& schema) final;
};

/// @brief Serves grammars from memory, keyed by `Schema_Info::location`.
/// Locations that were never inserted fail with `IO_Error_Code::cannot_open`.
struct Memory_Schema_Source final : Schema_Source {
private:
    std::map<std::u8string, std::u8string, std::less<>> m_grammars;
    std::size_t m_fetch_count = 0;

public:
    void insert(std::u8string_view location, std::u8string_view grammar)
    {
        m_grammars.insert_or_assign(std::u8string { location }, std::u8string { grammar });
    }

    /// @brief Returns how often `fetch` was called, successfully or not.
    [[nodiscard]]
    std::size_t get_fetch_count() const
    {
        return m_fetch_count;
    }

    [[nodiscard]]
    Result<std::u8string, IO_Error_Code> fetch(const Schema_Info& schema) final;
};

/// @brief Stores compiled constraint tables by schema id.
struct Constraint_Cache {
    /// @brief Returns the cached table for `schema_id`, or a null pointer.
    [[nodiscard]]
    virtual std::shared_ptr<const Constraint_Table> get(std::u8string_view schema_id)
        = 0;

    virtual void set(std::u8string_view schema_id, std::shared_ptr<const Constraint_Table> table)
        = 0;

    virtual void clear() = 0;
};

/// @brief A `Constraint_Cache` which never evicts anything.
struct Memory_Constraint_Cache final : Constraint_Cache {
private:
    std::map<std::u8string, std::shared_ptr<const Constraint_Table>, std::less<>> m_tables;

public:
    [[nodiscard]]
    std::size_t size() const
    {
        return m_tables.size();
    }

    [[nodiscard]]
    std::shared_ptr<const Constraint_Table> get(std::u8string_view schema_id) final;

    void set(std::u8string_view schema_id, std::shared_ptr<const Constraint_Table> table) final;

    void clear() final
    {
        m_tables.clear();
    }
};

/// @brief A `Constraint_Cache` holding at most a fixed number of tables,
/// evicting the least recently used one when full.
struct Lru_Constraint_Cache final : Constraint_Cache {
private:
    using Entry = std::pair<std::u8string, std::shared_ptr<const Constraint_Table>>;

    std::size_t m_capacity;
    /// @brief Entries ordered from most to least recently used.
    std::list<Entry> m_entries;

public:
    [[nodiscard]]
    explicit Lru_Constraint_Cache(std::size_t capacity = default_constraint_cache_capacity)
        : m_capacity { capacity }
    {
        PARLEY_ASSERT(capacity != 0);
    }

    [[nodiscard]]
    std::size_t size() const
    {
        return m_entries.size();
    }

    [[nodiscard]]
    std::size_t get_capacity() const
    {
        return m_capacity;
    }

    [[nodiscard]]
    std::shared_ptr<const Constraint_Table> get(std::u8string_view schema_id) final;

    void set(std::u8string_view schema_id, std::shared_ptr<const Constraint_Table> table) final;

    void clear() final
    {
        m_entries.clear();
    }
};

enum struct Schema_Error_Code : Default_Underlying {
    /// @brief The schema id is not in the catalog.
    unknown_schema,
    /// @brief The grammar could not be fetched from its source.
    load_failed,
    /// @brief The grammar was fetched, but could not be compiled.
    parse_failed,
    /// @brief Resolution was cancelled before it completed.
    cancelled,
};

[[nodiscard]]
std::u8string_view schema_error_code_name(Schema_Error_Code code);

struct Schema_Error {
    Schema_Error_Code code;
    std::u8string schema_id;
    std::u8string message;
    /// @brief For `unknown_schema`, the most similar known id, if any is similar enough.
    std::u8string suggestion;
};

/// @brief Resolves schema ids to compiled constraint tables,
/// fetching and compiling grammars on demand and memoizing the results in a cache.
struct Schema_Resolver {
private:
    const Schema_Catalog& m_catalog;
    Schema_Source& m_source;
    Constraint_Cache& m_cache;
    Logger& m_logger;

public:
    [[nodiscard]]
    Schema_Resolver(
        const Schema_Catalog& catalog,
        Schema_Source& source,
        Constraint_Cache& cache,
        Logger& logger = ignorant_logger
    )
        : m_catalog { catalog }
        , m_source { source }
        , m_cache { cache }
        , m_logger { logger }
    {
    }

    [[nodiscard]]
    const Schema_Catalog& get_catalog() const
    {
        return m_catalog;
    }

    [[nodiscard]]
    Logger& get_logger() const
    {
        return m_logger;
    }

    /// @brief Returns the compiled constraint table of the schema with the given id.
    /// Cancellation through `stop` is only observed before fetching and before compiling.
    /// A table that was already compiled is returned even if stop was requested.
    [[nodiscard]]
    Result<std::shared_ptr<const Constraint_Table>, Schema_Error>
    resolve(std::u8string_view schema_id, std::stop_token stop = {});
};

} // namespace parley

#endif
