#include "AutoConfig.h"
#include "CommonUtils.h"
#include "HackneyExceptions.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <unordered_map>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Hackney::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Hackney::HackneyException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Hackney::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int64_t parseIntStrict(const std::string& value, const std::string& key, int64_t minValue) {
    const int64_t parsed = parseNumericStrict<int64_t>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return static_cast<int64_t>(std::stoll(v, pos)); });
    if (parsed < minValue) {
        throw Hackney::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw Hackney::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    const unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw Hackney::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    const double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw Hackney::ConfigurationException("Value for " + key + " must be finite");
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Hackney::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

// Returns false when the key is not a known setting.
bool assignKeyValue(AutoConfig& config, const std::string& key, const std::string& value) {
    if (key == "delimiter") {
        if (value.size() != 1) throw Hackney::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
        return true;
    }
    if (key == "seed") {
        config.cleaning.samplingSeed = parseUIntStrict(value, key);
        return true;
    }

    struct Int64Rule {
        int64_t CleaningConfig::*member;
        int64_t minValue;
    };
    struct SizeRule {
        size_t CleaningConfig::*member;
        int64_t minValue;
    };

    static const std::unordered_map<std::string, std::string AutoConfig::*> rawStringFields = {
        {"dataset", &AutoConfig::datasetPath},
        {"cleaned_output", &AutoConfig::cleanedOutput},
        {"enriched_output", &AutoConfig::enrichedOutput},
        {"report_dir", &AutoConfig::reportDir}
    };
    static const std::unordered_map<std::string, std::string AutoConfig::*> lowerStringFields = {
        {"mode", &AutoConfig::mode},
        {"export_format", &AutoConfig::exportFormat},
        {"export", &AutoConfig::exportFormat}
    };
    static const std::unordered_map<std::string, double GeoBounds::*> boundsFields = {
        {"min_lat", &GeoBounds::minLat},
        {"max_lat", &GeoBounds::maxLat},
        {"min_lon", &GeoBounds::minLon},
        {"max_lon", &GeoBounds::maxLon}
    };
    static const std::unordered_map<std::string, Int64Rule> cleaningIntFields = {
        {"min_duration", {&CleaningConfig::minDurationSeconds, 0}},
        {"max_duration", {&CleaningConfig::maxDurationSeconds, 1}},
        {"min_passengers", {&CleaningConfig::minPassengers, 0}},
        {"max_passengers", {&CleaningConfig::maxPassengers, 1}}
    };
    static const std::unordered_map<std::string, SizeRule> cleaningSizeFields = {
        {"large_dataset_threshold", {&CleaningConfig::largeDatasetThreshold, 4}},
        {"outlier_sample_size", {&CleaningConfig::outlierSampleSize, 4}},
        {"progress_interval", {&CleaningConfig::progressInterval, 1}}
    };
    static const std::unordered_map<std::string, double FeatureConfig::*> featureDoubleFields = {
        {"efficiency_reference_speed", &FeatureConfig::efficiencyReferenceSpeedKmh},
        {"expected_city_speed", &FeatureConfig::expectedCitySpeedKmh},
        {"pattern_low_percentile", &FeatureConfig::lowPercentile},
        {"pattern_high_percentile", &FeatureConfig::highPercentile},
        {"traffic_speed", &FeatureConfig::trafficSpeedKmh},
        {"local_distance", &FeatureConfig::localDistanceKm},
        {"journey_duration", &FeatureConfig::journeyDurationSeconds}
    };

    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return true;
    }
    if (const auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(CommonUtils::trim(value));
        return true;
    }
    if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
        return true;
    }
    if (key == "pattern_thresholds_exclude_outliers") {
        config.features.patternThresholdsExcludeOutliers = parseBoolStrict(value, key);
        return true;
    }
    if (key == "outlier_iqr_multiplier") {
        config.cleaning.outlierIqrMultiplier = parseDoubleStrict(value, key);
        return true;
    }
    if (key == "top_k") {
        config.features.topK = static_cast<size_t>(parseIntStrict(value, key, 0));
        return true;
    }
    if (const auto it = boundsFields.find(key); it != boundsFields.end()) {
        config.cleaning.bounds.*(it->second) = parseDoubleStrict(value, key);
        return true;
    }
    if (const auto it = cleaningIntFields.find(key); it != cleaningIntFields.end()) {
        config.cleaning.*(it->second.member) = parseIntStrict(value, key, it->second.minValue);
        return true;
    }
    if (const auto it = cleaningSizeFields.find(key); it != cleaningSizeFields.end()) {
        config.cleaning.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return true;
    }
    if (const auto it = featureDoubleFields.find(key); it != featureDoubleFields.end()) {
        config.features.*(it->second) = parseDoubleStrict(value, key);
        return true;
    }
    return false;
}

void propagateShared(AutoConfig& config) {
    config.cleaning.verbose = config.verbose;
    config.features.verbose = config.verbose;
}
}

std::string AutoConfig::usage() {
    return "Usage: hackney <dataset.csv> [options]\n"
           "Options:\n"
           "  --mode <clean|features|all>        Pipeline stages to run (default: all)\n"
           "  --config <path>                    key: value file merged over the defaults\n"
           "  --cleaned-output <file>            Cleaned table (default: cleaned_taxi_data.csv)\n"
           "  --enriched-output <file>           Enriched table (default: enhanced_taxi_data.csv)\n"
           "  --report-dir <dir>                 Directory for markdown reports\n"
           "  --export <csv|parquet>             Also write enriched table as parquet\n"
           "  --delimiter <char>                 Input/output delimiter (default: ,)\n"
           "  --seed <N>                         Seed for large-dataset outlier sampling (default: 1337)\n"
           "  --outlier-iqr-multiplier <x>       Duration outlier fence multiplier (default: 2.0)\n"
           "  --large-dataset-threshold <N>      Survivor count that switches to sampling (default: 100000)\n"
           "  --outlier-sample-size <N>          Sample size for outlier bounds (default: 50000)\n"
           "  --min-duration/--max-duration <s>  Trip duration bounds in seconds (default: 60/3600)\n"
           "  --min-passengers/--max-passengers  Passenger bounds (default: 1/8)\n"
           "  --min-lat/--max-lat/--min-lon/--max-lon <deg>  Geographic bounding box\n"
           "  --pattern-thresholds-exclude-outliers <true|false>\n"
           "  --progress-interval <N>            Rows between load progress lines (default: 50000)\n"
           "  --top-k <N>                        Fastest trips listed in the feature report (default: 5)\n"
           "  --verbose <true|false>             Stage progress output (default: true)\n"
           "  --help                             Show this help message\n";
}

AutoConfig AutoConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Hackney::ConfigurationException("dataset path is required\n" + usage());
    }

    AutoConfig config;
    config.datasetPath = argv[1];

    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw Hackney::ConfigurationException("Unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw Hackney::ConfigurationException("Missing value for " + arg);
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            configPath = value;
            continue;
        }
        if (!assignKeyValue(config, normalizeConfigKey(arg.substr(2)), value)) {
            throw Hackney::ConfigurationException("Unknown option: " + arg);
        }
    }

    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        if (config.datasetPath.empty()) config.datasetPath = argv[1];
    }

    propagateShared(config);
    config.validate();
    return config;
}

AutoConfig AutoConfig::fromFile(const std::string& configPath, const AutoConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Hackney::ConfigurationException("Could not open config file: " + configPath);

    AutoConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        bool known = false;
        try {
            known = assignKeyValue(config, key, value);
        } catch (const Hackney::HackneyException& ex) {
            throw Hackney::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
        if (!known) {
            std::cout << "[Hackney][Warning] Ignoring unknown config key '" << key
                      << "' at line " << lineNo << " of " << configPath << "\n";
        }
    }

    propagateShared(config);
    config.validate();
    return config;
}

void AutoConfig::validate() const {
    if (datasetPath.empty()) {
        throw Hackney::ConfigurationException("dataset path is required");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(mode, {"clean", "features", "all"})) {
        throw Hackney::ConfigurationException("mode must be one of: clean, features, all");
    }
    if (!isIn(exportFormat, {"csv", "parquet"})) {
        throw Hackney::ConfigurationException("export_format must be one of: csv, parquet");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Hackney::ConfigurationException("delimiter cannot be a quote or newline character");
    }
    if (mode != "features" && cleanedOutput.empty()) {
        throw Hackney::ConfigurationException("cleaned_output is required for mode " + mode);
    }
    if (mode != "clean" && enrichedOutput.empty()) {
        throw Hackney::ConfigurationException("enriched_output is required for mode " + mode);
    }

    const GeoBounds& b = cleaning.bounds;
    if (b.minLat >= b.maxLat || b.minLon >= b.maxLon) {
        throw Hackney::ConfigurationException("geographic bounds must satisfy min_lat < max_lat and min_lon < max_lon");
    }
    if (b.minLat < -90.0 || b.maxLat > 90.0 || b.minLon < -180.0 || b.maxLon > 180.0) {
        throw Hackney::ConfigurationException("geographic bounds must lie within [-90,90] x [-180,180]");
    }
    if (cleaning.minDurationSeconds > cleaning.maxDurationSeconds) {
        throw Hackney::ConfigurationException("min_duration must be <= max_duration");
    }
    if (cleaning.minPassengers > cleaning.maxPassengers) {
        throw Hackney::ConfigurationException("min_passengers must be <= max_passengers");
    }
    if (cleaning.outlierIqrMultiplier < 0.0) {
        throw Hackney::ConfigurationException("outlier_iqr_multiplier must be >= 0");
    }

    const FeatureConfig& f = features;
    if (f.lowPercentile < 0.0 || f.highPercentile > 100.0 || f.lowPercentile >= f.highPercentile) {
        throw Hackney::ConfigurationException("pattern percentiles must satisfy 0 <= low < high <= 100");
    }
    if (f.efficiencyReferenceSpeedKmh <= 0.0 || f.expectedCitySpeedKmh <= 0.0) {
        throw Hackney::ConfigurationException("reference speeds must be > 0");
    }
    if (f.trafficSpeedKmh < 0.0 || f.localDistanceKm < 0.0 || f.journeyDurationSeconds < 0.0) {
        throw Hackney::ConfigurationException("pattern thresholds must be >= 0");
    }
}
