#pragma once

#include "AutoConfig.h"
#include "TripRecord.h"

#include <string>
#include <vector>

/**
 * Drives the configured modes end to end: load, clean, enrich, write tables and reports.
 */
class AutomationPipeline final {
public:
    /**
     * @brief Runs `clean`, `features`, or both (`all`) as selected by config.mode.
     * @details In `features` mode config.datasetPath names a cleaned table. In `all`
     *          mode the enrichment stage re-reads the cleaned table just written.
     * @return 0 on success.
     * @throws Hackney::IOException / Hackney::DatasetException on fatal I/O.
     */
    int run(const AutoConfig& config);

private:
    void runCleaning(const AutoConfig& config);
    void runFeatures(const AutoConfig& config, const std::string& inputPath);
    void exportParquetIfRequested(const AutoConfig& config,
                                  const std::string& csvPath,
                                  const std::vector<std::string>& columns,
                                  const std::vector<TripRecord>& records) const;
};
