#ifndef LOADSIM_PARQUET_WRITER_HPP
#define LOADSIM_PARQUET_WRITER_HPP

#include "../detailed_output.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace loadsim {

class ParquetWriter {
public:
    /**
     * Write the detailed record table of a run to a Parquet file.
     *
     * Output schema:
     *   - trial: uint32 (0-indexed)
     *   - device: string
     *   - month: uint8 (0-11)
     *   - hour: uint8 (0-23)
     *   - load_kwh: float64
     *   - type: string
     *
     * @param model Loaded devices and profiles
     * @param trials Trials per month
     * @param run_seed Seed shared with the summary path
     * @param filepath Path to output Parquet file
     * @return Number of rows written
     * @throws std::runtime_error if file cannot be written or Arrow is unavailable
     */
    static size_t write_detailed_records(const LoadModel& model, size_t trials,
                                         uint64_t run_seed, const std::string& filepath);

    // True when built with Apache Arrow
    static bool available();
};

} // namespace loadsim

#endif // LOADSIM_PARQUET_WRITER_HPP
