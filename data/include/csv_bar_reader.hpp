#pragma once

#include <istream>
#include <string>
#include "datatypes.hpp"

namespace data {

    // Reads `timestamp,open,high,low,close,volume` rows. A header line is skipped.
    // The timestamp is ISO 8601, or a bare YYYY-MM-DD taken as that local day at `utc_offset_minutes`.
    // Throws core::DataException naming the offending line.
    core::TimeSeries<core::Bar> parseBarsCsv(std::istream& input, int utc_offset_minutes);

    core::TimeSeries<core::Bar> readBarsCsv(const std::string& path, int utc_offset_minutes);

} // namespace data
