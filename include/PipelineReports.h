#pragma once

#include "CleaningPipeline.h"
#include "FeatureEngineer.h"
#include "ReportEngine.h"
#include "TripInsights.h"

#include <string>
#include <vector>

namespace PipelineReports {

/**
 * @brief `<stem><suffix>.md` placed in reportDir, or beside outputPath when reportDir is empty.
 */
std::string reportPathFor(const std::string& outputPath, const std::string& reportDir, const std::string& suffix);

std::string currentTimestamp();

ReportEngine buildCleaningReport(const CleaningPipeline& cleaner,
                                 const std::string& inputPath,
                                 const std::string& outputPath,
                                 const std::string& timestamp);

ReportEngine buildFeaturesReport(const FeatureEngineer& engineer,
                                 const std::vector<TripRecord>& enriched,
                                 const InsightSummary& insights,
                                 const Algorithms::OperationCounters& insightOps,
                                 const std::string& inputPath,
                                 const std::string& outputPath,
                                 const std::string& timestamp);

}
