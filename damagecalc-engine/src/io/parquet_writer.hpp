#ifndef DAMAGECALC_IO_PARQUET_WRITER_HPP
#define DAMAGECALC_IO_PARQUET_WRITER_HPP

#include "../schedule.hpp"
#include <string>
#include <vector>

namespace damagecalc {

// Detailed earnings schedule for one scenario, tagged for export
struct ScenarioSchedule {
    std::string scenario_id;
    std::vector<DetailedScheduleRow> rows;
};

class ParquetWriter {
public:
    /**
     * Write detailed earnings schedules to a Parquet file, one row per
     * scenario year.
     *
     * Output schema:
     *   - scenario_id: utf8
     *   - year_num: int32
     *   - calendar_year: int32
     *   - gross_earnings: float64
     *   - net_loss: float64
     *   - present_value: float64
     *   - cum_pv: float64
     *
     * @param schedules Schedules to write, in order
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if there are no rows or the file cannot be written
     */
    static void write_schedules(const std::vector<ScenarioSchedule>& schedules,
                                const std::string& filepath);
};

} // namespace damagecalc

#endif // DAMAGECALC_IO_PARQUET_WRITER_HPP
