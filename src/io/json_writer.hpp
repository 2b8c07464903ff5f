#ifndef LOADSIM_IO_JSON_WRITER_HPP
#define LOADSIM_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../simulation.hpp"

namespace loadsim {
namespace io {

// Write a SimulationResult summary to JSON.
// The output holds the run metadata, the four hour-by-month tables keyed by
// month name (24 values each), and the number of undefined CV cells, which
// are written as null.
void write_summary_json(std::ostream& os, const SimulationResult& result, int decimals,
                        bool pretty_print = true);

// Write the summary to a JSON file
void write_summary_json(const std::string& filepath, const SimulationResult& result,
                        int decimals, bool pretty_print = true);

} // namespace io
} // namespace loadsim

#endif // LOADSIM_IO_JSON_WRITER_HPP
