/**
 * @file decode_benchmark.cpp
 * @brief Benchmarks for record decoding and table scans
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

#include <mdfkit/mdfkit.hpp>

#include "bench_utils.hpp"
#include "catalog/row_decoder.hpp"
#include "storage/record.hpp"
#include "types/type_decoder.hpp"

namespace {

void SkipWithStatus(benchmark::State &state, const mdfkit::Status &status) {
    const std::string message = status.to_string();
    state.SkipWithError(message.c_str());
}

static void BM_Mdfkit_DecodeRecord(benchmark::State &state) {
    auto schema = mdfkit::test::schema_of(mdfkit::test::TableDef{
        1,
        "bench",
        {mdfkit::test::ColumnDef{"id", 56, 4, false}, mdfkit::test::ColumnDef{"name", 231, 80},
         mdfkit::test::ColumnDef{"created", 61, 8}, mdfkit::test::ColumnDef{"note", 167, 100}}});
    const mdfkit::test::ByteVec bytes = mdfkit::test::encode_row(
        *schema, {mdfkit::test::f_int(42), mdfkit::test::f_nvarchar("benchmark row"),
                  mdfkit::test::f_datetime(40000, 150), mdfkit::test::f_varchar("note")});
    mdfkit::RowDecoder decoder(schema);

    for (auto _ : state) {
        mdfkit::Record record;
        mdfkit::Status status = mdfkit::Record::parse(bytes, &record);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        mdfkit::Row row;
        status = decoder.decode(record, &row);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(row);
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Mdfkit_DecodeRecord);

static void BM_Mdfkit_DecodeDateTime(benchmark::State &state) {
    const mdfkit::test::ByteVec bytes = mdfkit::test::datetime_bytes(40000, 12345);
    const mdfkit::TypeInfo type(mdfkit::SqlType::kDateTime, 61, 8);
    mdfkit::ColumnSlice slice;
    slice.bytes = bytes;

    for (auto _ : state) {
        mdfkit::SqlValue value;
        mdfkit::Status status = mdfkit::decode_value(type, slice, &value);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(value);
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Mdfkit_DecodeDateTime);

static void BM_Mdfkit_TableScan(benchmark::State &state) {
    const int64_t rows = state.range(0);

    std::unique_ptr<mdfkit::Database> db;
    mdfkit::Status status = mdfkit::Database::open(mdfkit::bench::make_bench_database(rows),
                                                   mdfkit::DatabaseOptions(), &db);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }
    const mdfkit::Table *table = db->table("bench");

    for (auto _ : state) {
        int64_t count = 0;
        for (const mdfkit::RowResult &result : table->rows()) {
            if (!result.ok()) {
                SkipWithStatus(state, result.status);
                return;
            }
            ++count;
        }
        benchmark::DoNotOptimize(count);
    }

    state.SetItemsProcessed(state.iterations() * rows);
}

BENCHMARK(BM_Mdfkit_TableScan)->Arg(1000)->Arg(10000);

static void BM_Mdfkit_FileScan(benchmark::State &state) {
    const int64_t rows = state.range(0);
    const auto cache_pages = static_cast<size_t>(state.range(1));

    mdfkit::bench::TempMdfFile file("mdfkit_scan");
    auto memory = mdfkit::bench::make_bench_database(rows);
    mdfkit::Status status = mdfkit::bench::write_image(*memory, file.path());
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }

    mdfkit::DatabaseOptions options;
    options.page_cache_pages = cache_pages;
    std::unique_ptr<mdfkit::Database> db;
    status = mdfkit::Database::open(file.path(), options, &db);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }
    const mdfkit::Table *table = db->table("bench");

    for (auto _ : state) {
        int64_t count = 0;
        for (const mdfkit::RowResult &result : table->rows()) {
            count += result.ok() ? 1 : 0;
        }
        benchmark::DoNotOptimize(count);
    }

    state.SetItemsProcessed(state.iterations() * rows);
}

BENCHMARK(BM_Mdfkit_FileScan)->Args({10000, 8})->Args({10000, 256});

static void BM_Mdfkit_RecoveryScan(benchmark::State &state) {
    const int64_t rows = state.range(0);

    std::unique_ptr<mdfkit::Database> db;
    mdfkit::Status status = mdfkit::Database::open(mdfkit::bench::make_bench_database(rows),
                                                   mdfkit::DatabaseOptions(), &db);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }
    mdfkit::RecoveryScanner scanner(db->source(), mdfkit::RecoveryScanner::signatures_for(*db));

    for (auto _ : state) {
        int64_t pages = 0;
        for (const mdfkit::ScanEntry &entry : scanner.scan()) {
            pages += entry.candidates.size() == 1 ? 1 : 0;
        }
        benchmark::DoNotOptimize(pages);
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Mdfkit_RecoveryScan)->Arg(10000);

}  // namespace
