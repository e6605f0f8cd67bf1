#pragma once

/**
 * @file database.hpp
 * @brief Database class - main entry point for mdfkit
 */

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "catalog/catalog_builder.hpp"
#include "catalog/table.hpp"
#include "common/config.hpp"
#include "mdfkit/status.hpp"
#include "storage/page_source.hpp"

namespace mdfkit {

/**
 * @brief Configuration options for opening a database
 */
struct DatabaseOptions {
    /// Pages kept by the caching layer when opening by path (default: 256 = 2MB)
    size_t page_cache_pages = config::kDefaultPageCacheSize;

    /// Hops a forwarding stub may take before the row is reported as a loop
    size_t max_forward_hops = config::kDefaultMaxForwardHops;

    /// Also expose system tables ('S ' objects) in tables()
    bool include_system_tables = false;

    /// Default policy for LOB readers opened through Table::open_lob()
    LobReadPolicy lob_policy = LobReadPolicy::kAbort;
};

/**
 * @brief An opened, read-only database
 *
 * Example usage:
 * @code
 * std::unique_ptr<mdfkit::Database> db;
 * mdfkit::Status status = mdfkit::Database::open("sample.mdf", {}, &db);
 * if (db == nullptr) { ... }  // fatal
 * for (const auto& table : db->tables()) {
 *     for (const mdfkit::RowResult& r : table->rows()) { ... }
 * }
 * @endcode
 */
class Database {
public:
    /**
     * @brief Open a database over any page source
     * @param source Pages of the database files
     * @param options Configuration options
     * @param out Receives the database
     * @return OK; CatalogCorrupt with `*out` set when some tables could not be
     *         resolved (see catalog_errors()); any other error with `*out`
     *         left empty when the catalog could not be bootstrapped
     */
    [[nodiscard]] static Status open(std::shared_ptr<PageSource> source,
                                     const DatabaseOptions& options,
                                     std::unique_ptr<Database>* out);

    /**
     * @brief Open a .mdf file, reading it through a page cache
     */
    [[nodiscard]] static Status open(const std::string& path, const DatabaseOptions& options,
                                     std::unique_ptr<Database>* out);

    ~Database() = default;

    // Non-copyable, non-movable: tables share the page source
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] const BootPage& boot_page() const noexcept { return boot_; }
    [[nodiscard]] const std::string& name() const noexcept { return boot_.database_name; }

    /// Resolved tables ordered by object id
    [[nodiscard]] const std::vector<std::shared_ptr<const Table>>& tables() const noexcept {
        return tables_;
    }

    /// Table by name, nullptr if absent
    [[nodiscard]] const Table* table(std::string_view name) const;

    /// Table by object id, nullptr if absent
    [[nodiscard]] const Table* table(object_id_t object_id) const;

    /// Objects that could not be resolved into tables
    [[nodiscard]] const std::vector<CatalogError>& catalog_errors() const noexcept {
        return errors_;
    }

    [[nodiscard]] const std::shared_ptr<PageSource>& source() const noexcept { return source_; }
    [[nodiscard]] const DatabaseOptions& options() const noexcept { return options_; }

private:
    Database(std::shared_ptr<PageSource> source, const DatabaseOptions& options,
             CatalogContents contents);

    std::shared_ptr<PageSource> source_;
    DatabaseOptions options_;
    BootPage boot_;
    std::vector<std::shared_ptr<const Table>> tables_;
    std::vector<CatalogError> errors_;
    std::unordered_map<std::string, size_t> by_name_;
};

}  // namespace mdfkit
