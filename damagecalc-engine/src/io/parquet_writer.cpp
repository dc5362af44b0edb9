#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace damagecalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

} // anonymous namespace

void ParquetWriter::write_schedules(const std::vector<ScenarioSchedule>& schedules,
                                    const std::string& filepath) {
    size_t row_count = 0;
    for (const auto& schedule : schedules) {
        row_count += schedule.rows.size();
    }
    if (row_count == 0) {
        throw std::runtime_error("No schedule rows to write to " + filepath);
    }

    auto schema = arrow::schema({
        arrow::field("scenario_id", arrow::utf8()),
        arrow::field("year_num", arrow::int32()),
        arrow::field("calendar_year", arrow::int32()),
        arrow::field("gross_earnings", arrow::float64()),
        arrow::field("net_loss", arrow::float64()),
        arrow::field("present_value", arrow::float64()),
        arrow::field("cum_pv", arrow::float64())
    });

    arrow::StringBuilder scenario_builder;
    arrow::Int32Builder year_builder;
    arrow::Int32Builder calendar_builder;
    arrow::DoubleBuilder gross_builder;
    arrow::DoubleBuilder loss_builder;
    arrow::DoubleBuilder pv_builder;
    arrow::DoubleBuilder cum_builder;

    const auto n = static_cast<int64_t>(row_count);
    check(scenario_builder.Reserve(n), "reserve scenario_id column");
    check(year_builder.Reserve(n), "reserve year_num column");
    check(calendar_builder.Reserve(n), "reserve calendar_year column");
    check(gross_builder.Reserve(n), "reserve gross_earnings column");
    check(loss_builder.Reserve(n), "reserve net_loss column");
    check(pv_builder.Reserve(n), "reserve present_value column");
    check(cum_builder.Reserve(n), "reserve cum_pv column");

    for (const auto& schedule : schedules) {
        for (const auto& row : schedule.rows) {
            check(scenario_builder.Append(schedule.scenario_id), "append scenario_id");
            check(year_builder.Append(row.year_num), "append year_num");
            check(calendar_builder.Append(row.calendar_year), "append calendar_year");
            check(gross_builder.Append(row.gross_earnings), "append gross_earnings");
            check(loss_builder.Append(row.net_loss), "append net_loss");
            check(pv_builder.Append(row.present_value), "append present_value");
            check(cum_builder.Append(row.cum_pv), "append cum_pv");
        }
    }

    auto table = arrow::Table::Make(schema, {
        finish(scenario_builder, "scenario_id"),
        finish(year_builder, "year_num"),
        finish(calendar_builder, "calendar_year"),
        finish(gross_builder, "gross_earnings"),
        finish(loss_builder, "net_loss"),
        finish(pv_builder, "present_value"),
        finish(cum_builder, "cum_pv")
    });

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_schedules(const std::vector<ScenarioSchedule>& /* schedules */,
                                    const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace damagecalc
