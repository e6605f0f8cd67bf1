/**
 * @file mdf_dump.cpp
 * @brief List the tables of a .mdf file and dump their rows
 *
 * Usage: mdf_dump <file.mdf> [table] [--limit N] [--recover] [--log-level L]
 *
 * Without a table name every table is listed with its schema. With one, its
 * rows are printed; --recover finds the rows by scanning every page instead
 * of following the catalog's page chain.
 */

#include <cstdlib>
#include <iostream>
#include <string>

#include <mdfkit/mdfkit.hpp>

#include "common/logger.hpp"

namespace {

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " <file.mdf> [table] [--limit N] [--recover] [--log-level LEVEL]\n";
}

void list_tables(const mdfkit::Database& db) {
    std::cout << "database " << db.name() << ", " << db.tables().size() << " tables\n";
    for (const auto& table : db.tables()) {
        std::cout << "  " << table->to_string() << "\n";
    }
    for (const mdfkit::CatalogError& error : db.catalog_errors()) {
        std::cout << "  [unreadable] " << error.to_string() << "\n";
    }
}

int dump_rows(mdfkit::RowRange rows, long limit) {
    long printed = 0;
    long failed = 0;
    for (const mdfkit::RowResult& result : rows) {
        if (limit >= 0 && printed >= limit) {
            break;
        }
        if (!result.ok()) {
            std::cout << result.rid.to_string() << "  <" << result.status.to_string() << ">\n";
            ++failed;
            continue;
        }
        std::cout << result.rid.to_string() << "  " << result.row.to_string() << "\n";
        ++printed;
    }
    std::cout << printed << " rows";
    if (failed > 0) {
        std::cout << ", " << failed << " unreadable";
    }
    std::cout << "\n";
    return failed > 0 ? 2 : 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string path;
    std::string table_name;
    long limit = -1;
    bool recover = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::strtol(argv[++i], nullptr, 10);
        } else if (arg == "--recover") {
            recover = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            spdlog::level::level_enum level;
            if (!mdfkit::Logger::parse_level(argv[++i], &level)) {
                std::cerr << "unknown log level: " << argv[i] << "\n";
                return 1;
            }
            mdfkit::Logger::set_level(level);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (path.empty()) {
            path = arg;
        } else if (table_name.empty()) {
            table_name = arg;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }
    if (path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::unique_ptr<mdfkit::Database> db;
    mdfkit::Status status = mdfkit::Database::open(path, mdfkit::DatabaseOptions(), &db);
    if (db == nullptr) {
        std::cerr << "cannot open " << path << ": " << status.to_string() << "\n";
        return 1;
    }
    if (!status.ok()) {
        std::cerr << "warning: " << status.to_string() << "\n";
    }

    if (table_name.empty()) {
        list_tables(*db);
        return 0;
    }

    const mdfkit::Table* table = db->table(table_name);
    if (table == nullptr) {
        std::cerr << "no table named " << table_name << "\n";
        return 1;
    }
    std::cout << table->to_string() << "\n";

    if (recover) {
        mdfkit::RecoveryScanner scanner(db->source(),
                                        mdfkit::RecoveryScanner::signatures_for(*db));
        return dump_rows(scanner.recover_rows(*table), limit);
    }
    return dump_rows(table->rows(), limit);
}
