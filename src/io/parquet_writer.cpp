#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace loadsim {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

size_t ParquetWriter::write_detailed_records(const LoadModel& model, size_t trials,
                                             uint64_t run_seed, const std::string& filepath) {
    auto schema = arrow::schema({
        arrow::field("trial", arrow::uint32()),
        arrow::field("device", arrow::utf8()),
        arrow::field("month", arrow::uint8()),
        arrow::field("hour", arrow::uint8()),
        arrow::field("load_kwh", arrow::float64()),
        arrow::field("type", arrow::utf8())
    });

    arrow::UInt32Builder trial_builder;
    arrow::StringBuilder device_builder;
    arrow::UInt8Builder month_builder;
    arrow::UInt8Builder hour_builder;
    arrow::DoubleBuilder load_builder;
    arrow::StringBuilder type_builder;

    const size_t rows = detailed_record_count(model, trials);
    check(trial_builder.Reserve(rows), "reserve memory for trial column");
    check(device_builder.Reserve(rows), "reserve memory for device column");
    check(month_builder.Reserve(rows), "reserve memory for month column");
    check(hour_builder.Reserve(rows), "reserve memory for hour column");
    check(load_builder.Reserve(rows), "reserve memory for load_kwh column");
    check(type_builder.Reserve(rows), "reserve memory for type column");

    for_each_detailed_record(model, trials, run_seed, [&](const DetailedRecord& r) {
        check(trial_builder.Append(r.trial), "append trial");
        check(device_builder.Append(r.device), "append device");
        check(month_builder.Append(r.month), "append month");
        check(hour_builder.Append(r.hour), "append hour");
        check(load_builder.Append(r.load_kwh), "append load_kwh");
        check(type_builder.Append(r.type), "append type");
    });

    std::shared_ptr<arrow::Array> trial_array;
    std::shared_ptr<arrow::Array> device_array;
    std::shared_ptr<arrow::Array> month_array;
    std::shared_ptr<arrow::Array> hour_array;
    std::shared_ptr<arrow::Array> load_array;
    std::shared_ptr<arrow::Array> type_array;
    check(trial_builder.Finish(&trial_array), "finish trial array");
    check(device_builder.Finish(&device_array), "finish device array");
    check(month_builder.Finish(&month_array), "finish month array");
    check(hour_builder.Finish(&hour_array), "finish hour array");
    check(load_builder.Finish(&load_array), "finish load_kwh array");
    check(type_builder.Finish(&type_array), "finish type array");

    auto table = arrow::Table::Make(schema, {trial_array, device_array, month_array,
                                             hour_array, load_array, type_array});

    auto maybe_outfile = arrow::io::FileOutputStream::Open(filepath);
    if (!maybe_outfile.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 maybe_outfile.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *maybe_outfile;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                     1024 * 1024),  // 1M-row row groups
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");

    return rows;
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

size_t ParquetWriter::write_detailed_records(const LoadModel& /* model */, size_t /* trials */,
                                             uint64_t /* run_seed */,
                                             const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace loadsim
