#pragma once

#include "TripRecord.h"

#include <string>
#include <vector>

namespace ParquetExport {

// True when the build linked Apache Arrow/Parquet.
bool isAvailable() noexcept;

/**
 * @brief Writes records as a parquet table with the given column order.
 * @details A column whose non-empty cells all parse as numbers is stored as
 *          nullable float64, anything else as nullable utf8. Empty cells are null.
 * @post Returns false with errorOut set on failure; never throws.
 */
bool writeTable(const std::vector<std::string>& columns,
                const std::vector<TripRecord>& records,
                const std::string& parquetPath,
                std::string& errorOut);

}
