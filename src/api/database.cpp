/**
 * @file database.cpp
 * @brief Database class implementation
 */

#include "mdfkit/database.hpp"

#include <utility>

#include "common/logger.hpp"
#include "storage/file_page_source.hpp"
#include "storage/page_cache.hpp"

namespace mdfkit {

Database::Database(std::shared_ptr<PageSource> source, const DatabaseOptions& options,
                   CatalogContents contents)
    : source_(std::move(source)),
      options_(options),
      boot_(std::move(contents.boot)),
      tables_(std::move(contents.tables)),
      errors_(std::move(contents.errors)) {
    for (size_t i = 0; i < tables_.size(); ++i) {
        // Names are unique per schema, not per database; keep the first
        by_name_.emplace(tables_[i]->name(), i);
    }
}

Status Database::open(std::shared_ptr<PageSource> source, const DatabaseOptions& options,
                      std::unique_ptr<Database>* out) {
    Logger::init();
    out->reset();

    if (source == nullptr) {
        return Status::InvalidArgument("no page source");
    }

    CatalogOptions catalog_options;
    catalog_options.max_forward_hops = options.max_forward_hops;
    catalog_options.include_system_tables = options.include_system_tables;
    catalog_options.lob_policy = options.lob_policy;

    CatalogBuilder builder(source, catalog_options);
    CatalogContents contents;
    Status status = builder.build(&contents);
    if (!status.ok()) {
        LOG_ERROR("Cannot open database: {}", status.to_string());
        return status;
    }

    const size_t failed = contents.errors.size();
    out->reset(new Database(std::move(source), options, std::move(contents)));
    LOG_INFO("Opened database '{}': {} tables, {} unresolved", (*out)->name(),
             (*out)->tables().size(), failed);

    if (failed > 0) {
        return Status::CatalogCorrupt(std::to_string(failed) +
                                      " table(s) could not be resolved");
    }
    return Status::Ok();
}

Status Database::open(const std::string& path, const DatabaseOptions& options,
                      std::unique_ptr<Database>* out) {
    Logger::init();
    LOG_INFO("Opening database file: {}", path);

    std::unique_ptr<FilePageSource> file;
    Status status = FilePageSource::open(path, &file);
    if (!status.ok()) {
        out->reset();
        return status;
    }
    auto cached = std::make_shared<CachingPageSource>(std::move(file), options.page_cache_pages);
    return open(std::move(cached), options, out);
}

const Table* Database::table(std::string_view name) const {
    auto it = by_name_.find(std::string(name));
    if (it == by_name_.end()) {
        return nullptr;
    }
    return tables_[it->second].get();
}

const Table* Database::table(object_id_t object_id) const {
    for (const auto& t : tables_) {
        if (t->object_id() == object_id) {
            return t.get();
        }
    }
    return nullptr;
}

}  // namespace mdfkit
