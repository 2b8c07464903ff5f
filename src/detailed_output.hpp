#ifndef LOADSIM_DETAILED_OUTPUT_HPP
#define LOADSIM_DETAILED_OUTPUT_HPP

#include "load_model.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace loadsim {

// One sampled (trial, device, month, hour) event
struct DetailedRecord {
    uint32_t trial;
    std::string device;
    uint8_t month;       // 0-11
    uint8_t hour;        // 0-23
    double load_kwh;     // Active units * power_w / 1000 over a one-hour slot
    std::string type;    // Device type, kept for caller-side grouping

    bool operator==(const DetailedRecord& other) const;
};

// Number of records a run produces: trials * devices * 12 * 24
size_t detailed_record_count(const LoadModel& model, size_t trials);

// Enumerate every (trial, device, month, hour) sample in that nesting order,
// passing each record to the visitor as it is drawn. Nothing is aggregated.
//
// Each (month, trial, device) draws from the same stream the summary path
// uses, so with the same seed the records sum to the summary's trial loads.
// Throws std::invalid_argument if trials is 0.
void for_each_detailed_record(const LoadModel& model, size_t trials, uint64_t run_seed,
                              const std::function<void(const DetailedRecord&)>& visitor);

// Materialize the full record table
std::vector<DetailedRecord> generate_detailed_output(const LoadModel& model, size_t trials,
                                                     uint64_t run_seed);

} // namespace loadsim

#endif // LOADSIM_DETAILED_OUTPUT_HPP
