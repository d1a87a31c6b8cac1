#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

struct GeoBounds {
    double minLat = 40.4774;
    double maxLat = 40.9176;
    double minLon = -74.2591;
    double maxLon = -73.7004;

    bool contains(double lat, double lon) const noexcept {
        return lat >= minLat && lat <= maxLat && lon >= minLon && lon <= maxLon;
    }
};

struct CleaningConfig {
    GeoBounds bounds;
    int64_t minDurationSeconds = 60;
    int64_t maxDurationSeconds = 3600;
    int64_t minPassengers = 1;
    int64_t maxPassengers = 8;

    // Tukey fence multiplier for duration outliers.
    double outlierIqrMultiplier = 2.0;
    // Above this many survivors, outlier bounds come from a random sample.
    size_t largeDatasetThreshold = 100000;
    size_t outlierSampleSize = 50000;
    uint32_t samplingSeed = 1337;
    size_t progressInterval = 50000;

    bool verbose = true;
};

struct FeatureConfig {
    double efficiencyReferenceSpeedKmh = 40.0;
    double expectedCitySpeedKmh = 20.0;

    double lowPercentile = 10.0;
    double highPercentile = 90.0;
    double trafficSpeedKmh = 5.0;
    double localDistanceKm = 0.5;
    double journeyDurationSeconds = 1800.0;
    // When true, P10/P90 pattern thresholds ignore DURATION_OUTLIER records.
    bool patternThresholdsExcludeOutliers = false;

    size_t topK = 5;
    bool verbose = true;
};

struct AutoConfig {
    std::string datasetPath;
    std::string mode = "all";             // clean|features|all
    std::string cleanedOutput = "cleaned_taxi_data.csv";
    std::string enrichedOutput = "enhanced_taxi_data.csv";
    std::string reportDir;                // empty => next to each output file
    std::string exportFormat = "csv";     // csv|parquet
    char delimiter = ',';
    bool verbose = true;

    CleaningConfig cleaning;
    FeatureConfig features;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argc/argv contain at least dataset path in argv[1].
     * @post Returns a validated config object.
     * @throws Hackney::ConfigurationException on invalid arguments or values.
     */
    static AutoConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Hackney::ConfigurationException on parse/validation failures.
     */
    static AutoConfig fromFile(const std::string& configPath, const AutoConfig& base);

    /**
     * @brief Validates merged configuration invariants and enum-like fields.
     * @throws Hackney::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage();
};
