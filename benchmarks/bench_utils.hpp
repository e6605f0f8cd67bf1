#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <mdfkit/mdfkit.hpp>

#include "catalog_fixture.hpp"

namespace mdfkit::bench {

inline std::string make_temp_path(std::string_view prefix) {
    const auto base = std::filesystem::temp_directory_path();
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::mt19937_64 rng(static_cast<uint64_t>(now));
    std::uniform_int_distribution<uint64_t> dist;

    std::ostringstream name;
    name << prefix << "_" << std::hex << static_cast<uint64_t>(now) << dist(rng) << ".mdf";
    return (base / name.str()).string();
}

class TempMdfFile {
public:
    explicit TempMdfFile(std::string_view prefix) : path_(make_temp_path(prefix)) {}

    ~TempMdfFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::string &path() const noexcept { return path_; }

private:
    std::string path_;
};

inline constexpr object_id_t kBenchTableId = 400;

/**
 * @brief Synthetic database with one "bench" table of `rows` rows
 *
 * Columns: id int, name nvarchar(40), created datetime, note varchar(100).
 */
inline std::shared_ptr<MemoryPageSource> make_bench_database(int64_t rows) {
    test::SyntheticDatabaseBuilder builder;
    builder.database_name("bench");
    auto schema = builder.add_table(test::TableDef{kBenchTableId,
                                                   "bench",
                                                   {test::ColumnDef{"id", 56, 4, false},
                                                    test::ColumnDef{"name", 231, 80},
                                                    test::ColumnDef{"created", 61, 8},
                                                    test::ColumnDef{"note", 167, 100}}});

    std::vector<test::ByteVec> records;
    records.reserve(static_cast<size_t>(rows));
    for (int64_t i = 0; i < rows; ++i) {
        const auto id = static_cast<int32_t>(i);
        records.push_back(test::encode_row(
            *schema, {test::f_int(id), test::f_nvarchar("row " + std::to_string(i)),
                      test::f_datetime(40000 + id % 365, id % 300),
                      i % 4 == 0 ? test::f_null() : test::f_varchar("note for row")}));
    }
    builder.add_rows(kBenchTableId, records, 60);
    return builder.build();
}

/// Write every page of file 1 to `path`, zero-filling holes
inline Status write_image(MemoryPageSource &source, const std::string &path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Status::IOError("cannot create " + path);
    }
    std::vector<uint8_t> page(config::kPageSize);
    for (page_id_t id = 0; id < source.page_count(1); ++id) {
        Status status = source.read_page(PagePointer(1, id), std::span<uint8_t>(page));
        if (status.is_not_found()) {
            std::fill(page.begin(), page.end(), 0);
        } else if (!status.ok()) {
            return status;
        }
        out.write(reinterpret_cast<const char *>(page.data()),
                  static_cast<std::streamsize>(page.size()));
    }
    return out ? Status::Ok() : Status::IOError("short write to " + path);
}

}  // namespace mdfkit::bench
