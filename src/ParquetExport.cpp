#include "ParquetExport.h"

#include "CommonUtils.h"

#include <algorithm>
#include <memory>

#ifdef HACKNEY_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace ParquetExport {

#ifdef HACKNEY_USE_NATIVE_PARQUET
namespace {
bool isNumericColumn(const std::string& column, const std::vector<TripRecord>& records) {
    bool sawValue = false;
    for (const auto& record : records) {
        const std::string& raw = record.get(column);
        if (CommonUtils::trim(raw).empty()) continue;
        double parsed = 0.0;
        if (!CommonUtils::parseDouble(raw, parsed)) return false;
        sawValue = true;
    }
    return sawValue;
}

bool buildNumericArray(const std::string& column,
                       const std::vector<TripRecord>& records,
                       std::shared_ptr<arrow::Array>& arr,
                       std::string& errorOut) {
    arrow::DoubleBuilder builder;
    for (const auto& record : records) {
        double v = 0.0;
        if (!CommonUtils::parseDouble(record.get(column), v)) {
            if (!builder.AppendNull().ok()) {
                errorOut = "Failed to append null for numeric column '" + column + "'";
                return false;
            }
        } else if (!builder.Append(v).ok()) {
            errorOut = "Failed to append numeric value for column '" + column + "'";
            return false;
        }
    }
    auto status = builder.Finish(&arr);
    if (!status.ok()) {
        errorOut = "Failed to finalize numeric Arrow array for column '" + column + "': " + status.ToString();
        return false;
    }
    return true;
}

bool buildStringArray(const std::string& column,
                      const std::vector<TripRecord>& records,
                      std::shared_ptr<arrow::Array>& arr,
                      std::string& errorOut) {
    arrow::StringBuilder builder;
    for (const auto& record : records) {
        const std::string& v = record.get(column);
        if (v.empty()) {
            if (!builder.AppendNull().ok()) {
                errorOut = "Failed to append null for text column '" + column + "'";
                return false;
            }
        } else if (!builder.Append(v).ok()) {
            errorOut = "Failed to append text value for column '" + column + "'";
            return false;
        }
    }
    auto status = builder.Finish(&arr);
    if (!status.ok()) {
        errorOut = "Failed to finalize text Arrow array for column '" + column + "': " + status.ToString();
        return false;
    }
    return true;
}
} // namespace

bool isAvailable() noexcept {
    return true;
}

bool writeTable(const std::vector<std::string>& columns,
                const std::vector<TripRecord>& records,
                const std::string& parquetPath,
                std::string& errorOut) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(columns.size());
    arrays.reserve(columns.size());

    for (const auto& column : columns) {
        std::shared_ptr<arrow::Array> arr;
        if (isNumericColumn(column, records)) {
            if (!buildNumericArray(column, records, arr, errorOut)) return false;
            fields.push_back(arrow::field(column, arrow::float64(), true));
        } else {
            if (!buildStringArray(column, records, arr, errorOut)) return false;
            fields.push_back(arrow::field(column, arrow::utf8(), true));
        }
        arrays.push_back(arr);
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto table = arrow::Table::Make(schema, arrays, static_cast<int64_t>(records.size()));

    auto outRes = arrow::io::FileOutputStream::Open(parquetPath);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(records.size())));
    auto writeStatus = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}
#else
bool isAvailable() noexcept {
    return false;
}

bool writeTable(const std::vector<std::string>&,
                const std::vector<TripRecord>&,
                const std::string&,
                std::string& errorOut) {
    errorOut = "this build was compiled without native parquet support";
    return false;
}
#endif

}
