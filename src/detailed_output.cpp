#include "detailed_output.hpp"
#include "sampler.hpp"
#include <stdexcept>

namespace loadsim {

bool DetailedRecord::operator==(const DetailedRecord& other) const {
    return trial == other.trial &&
           device == other.device &&
           month == other.month &&
           hour == other.hour &&
           load_kwh == other.load_kwh &&
           type == other.type;
}

size_t detailed_record_count(const LoadModel& model, size_t trials) {
    return trials * model.device_count() * MONTHS_PER_YEAR * HOURS_PER_DAY;
}

void for_each_detailed_record(const LoadModel& model, size_t trials, uint64_t run_seed,
                              const std::function<void(const DetailedRecord&)>& visitor) {
    if (trials == 0) {
        throw std::invalid_argument("Number of trials must be greater than 0");
    }

    DetailedRecord record;
    for (size_t trial = 0; trial < trials; ++trial) {
        record.trial = static_cast<uint32_t>(trial);
        for (size_t d = 0; d < model.device_count(); ++d) {
            const Device& device = model.device(d);
            record.device = device.id;
            record.type = device.type;
            for (size_t month = 0; month < MONTHS_PER_YEAR; ++month) {
                record.month = static_cast<uint8_t>(month);
                DeviceDayLoad day = sample_device_day(model, d, month, trial, run_seed);
                for (size_t hour = 0; hour < HOURS_PER_DAY; ++hour) {
                    record.hour = static_cast<uint8_t>(hour);
                    record.load_kwh = day[hour];
                    visitor(record);
                }
            }
        }
    }
}

std::vector<DetailedRecord> generate_detailed_output(const LoadModel& model, size_t trials,
                                                     uint64_t run_seed) {
    std::vector<DetailedRecord> records;
    records.reserve(detailed_record_count(model, trials));
    for_each_detailed_record(model, trials, run_seed, [&records](const DetailedRecord& r) {
        records.push_back(r);
    });
    return records;
}

} // namespace loadsim
