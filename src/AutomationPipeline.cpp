#include "AutomationPipeline.h"

#include "CleaningPipeline.h"
#include "CommonUtils.h"
#include "FeatureEngineer.h"
#include "HackneyExceptions.h"
#include "ParquetExport.h"
#include "PipelineReports.h"
#include "TerminalUI.h"
#include "TripDataset.h"
#include "TripInsights.h"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace {
std::string parquetPathFor(const std::string& csvPath) {
    std::filesystem::path p(csvPath);
    p.replace_extension(".parquet");
    return p.string();
}

TripDataset loadDataset(const AutoConfig& config, const std::string& path) {
    TripDataset data(path, config.delimiter);
    if (config.verbose) data.setProgressInterval(config.cleaning.progressInterval);
    data.load();
    if (data.malformedRowCount() > 0) {
        std::cout << "[Hackney][Warning] Skipped " << data.malformedRowCount()
                  << " malformed rows in " << path << "\n";
    }
    if (config.verbose) {
        std::cout << "[Hackney] Loaded " << CommonUtils::withThousands(data.rowCount()) << " records from " << path << "\n";
    }
    return data;
}
}

int AutomationPipeline::run(const AutoConfig& config) {
    if (config.mode == "clean" || config.mode == "all") {
        runCleaning(config);
    }
    if (config.mode == "features") {
        runFeatures(config, config.datasetPath);
    } else if (config.mode == "all") {
        runFeatures(config, config.cleanedOutput);
    }

    if (config.verbose) std::cout << "[Hackney] Pipeline complete (mode: " << config.mode << ").\n";
    return 0;
}

void AutomationPipeline::runCleaning(const AutoConfig& config) {
    TripDataset data = loadDataset(config, config.datasetPath);
    const size_t malformed = data.malformedRowCount();

    CleaningPipeline cleaner(config.cleaning);
    const std::vector<TripRecord> cleaned = cleaner.run(data.takeRecords(), malformed);

    if (config.verbose) std::cout << "[Hackney][Cleaning] Writing cleaned data to " << config.cleanedOutput << "...\n";
    TripDataset::writeCSV(config.cleanedOutput, TripFields::cleanedColumns(), cleaned, config.delimiter);
    exportParquetIfRequested(config, config.cleanedOutput, TripFields::cleanedColumns(), cleaned);

    const std::string reportPath = PipelineReports::reportPathFor(config.cleanedOutput, config.reportDir, "_cleaning_report");
    PipelineReports::buildCleaningReport(cleaner, config.datasetPath, config.cleanedOutput, PipelineReports::currentTimestamp())
        .save(reportPath);
    if (config.verbose) std::cout << "[Hackney][Cleaning] Cleaning report saved to " << reportPath << "\n";

    if (config.verbose) TerminalUI::printCounterTable("CLEANING STATISTICS", cleaner.statistics());
    TerminalUI::printCleaningSummary(cleaner.statistics(), cleaner.dataQualityPercent(), config.cleanedOutput);
}

void AutomationPipeline::runFeatures(const AutoConfig& config, const std::string& inputPath) {
    TripDataset data = loadDataset(config, inputPath);

    std::vector<std::string> columns = data.header();
    std::vector<TripRecord> records = data.takeRecords();

    FeatureEngineer engineer(config.features);
    const std::vector<TripFeatures> features = engineer.run(records);

    for (const auto& derived : FeatureEngineer::derivedColumns()) {
        if (std::find(columns.begin(), columns.end(), derived) == columns.end()) columns.push_back(derived);
    }

    if (config.verbose) std::cout << "[Hackney][Features] Saving enhanced data to " << config.enrichedOutput << "...\n";
    TripDataset::writeCSV(config.enrichedOutput, columns, records, config.delimiter);
    if (config.verbose) std::cout << "[Hackney][Features] Enhanced data saved with " << columns.size() << " columns\n";
    exportParquetIfRequested(config, config.enrichedOutput, columns, records);

    Algorithms::OperationCounters insightOps;
    const InsightSummary insights = TripInsights::summarize(features, config.features.topK, &insightOps);

    const std::string reportPath = PipelineReports::reportPathFor(config.enrichedOutput, config.reportDir, "_features_report");
    PipelineReports::buildFeaturesReport(engineer, records, insights, insightOps, inputPath, config.enrichedOutput, PipelineReports::currentTimestamp())
        .save(reportPath);
    if (config.verbose) std::cout << "[Hackney][Features] Feature engineering report saved to " << reportPath << "\n";

    if (config.verbose) {
        TerminalUI::printCounterTable("FEATURE STATISTICS", engineer.statistics());
        TerminalUI::printGroupTable("TRIPS BY TIME OF DAY", insights.byTimeOfDay);
        TerminalUI::printGroupTable("TRIPS BY PICKUP BOROUGH", insights.byPickupBorough);
        TerminalUI::printFastestTrips(insights.fastestTrips);
    }
    TerminalUI::printFeatureSummary(engineer.statistics(), config.enrichedOutput);
}

void AutomationPipeline::exportParquetIfRequested(const AutoConfig& config,
                                                  const std::string& csvPath,
                                                  const std::vector<std::string>& columns,
                                                  const std::vector<TripRecord>& records) const {
    if (config.exportFormat != "parquet") return;

    if (!ParquetExport::isAvailable()) {
        std::cout << "[Hackney][Warning] Parquet export requested, but this build was compiled without native parquet support. "
                  << "Rebuild with Arrow/Parquet libraries enabled. CSV export is available at " << csvPath << "\n";
        return;
    }

    const std::string parquetPath = parquetPathFor(csvPath);
    std::string parquetError;
    if (!ParquetExport::writeTable(columns, records, parquetPath, parquetError)) {
        std::cout << "[Hackney][Warning] Native parquet export failed: " << parquetError
                  << ". CSV export is available at " << csvPath << "\n";
        return;
    }
    if (config.verbose) std::cout << "[Hackney] Parquet export written to " << parquetPath << "\n";
}
