#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class ValidityFlag {
    NORMAL,
    DUPLICATE,
    INVALID_COORDINATES,
    INVALID_DATETIME,
    INVALID_DURATION_OR_PASSENGERS
};

enum class OutlierFlag { NORMAL, DURATION_OUTLIER };

const char* toString(ValidityFlag flag) noexcept;
const char* toString(OutlierFlag flag) noexcept;
std::optional<OutlierFlag> parseOutlierFlag(const std::string& text);

namespace TripFields {
inline constexpr const char* kId = "id";
inline constexpr const char* kVendorId = "vendor_id";
inline constexpr const char* kPickupDatetime = "pickup_datetime";
inline constexpr const char* kDropoffDatetime = "dropoff_datetime";
inline constexpr const char* kPassengerCount = "passenger_count";
inline constexpr const char* kPickupLongitude = "pickup_longitude";
inline constexpr const char* kPickupLatitude = "pickup_latitude";
inline constexpr const char* kDropoffLongitude = "dropoff_longitude";
inline constexpr const char* kDropoffLatitude = "dropoff_latitude";
inline constexpr const char* kStoreAndFwdFlag = "store_and_fwd_flag";
inline constexpr const char* kTripDuration = "trip_duration";
inline constexpr const char* kCalculatedDuration = "calculated_duration";
inline constexpr const char* kOutlierFlag = "outlier_flag";
inline constexpr const char* kValidityFlag = "validity_flag";

// Column layout of the cleaned output table.
const std::vector<std::string>& cleanedColumns();
}

/**
 * One source row: ordered field name -> raw string value plus its source line.
 * Fields can be added or overwritten by pipeline stages but never removed.
 */
class TripRecord {
public:
    using Field = std::pair<std::string, std::string>;

    TripRecord() = default;
    explicit TripRecord(size_t rowNumber) : rowNumber_(rowNumber) {}

    size_t rowNumber() const noexcept { return rowNumber_; }

    bool has(const std::string& name) const;
    // Absent and empty-valued fields are both "missing" for defaulting purposes.
    bool isMissing(const std::string& name) const;

    /**
     * @brief Returns the raw value or an empty string when the field is absent.
     */
    const std::string& get(const std::string& name) const;
    void set(const std::string& name, std::string value);

    const std::vector<Field>& fields() const noexcept { return fields_; }

    ValidityFlag validity() const noexcept { return validity_; }
    OutlierFlag outlier() const noexcept { return outlier_; }

    // Flag setters also mirror the flag into a same-named field for output.
    void markInvalid(ValidityFlag flag);
    void setOutlier(OutlierFlag flag);

private:
    std::vector<Field> fields_;
    size_t rowNumber_ = 0;
    ValidityFlag validity_ = ValidityFlag::NORMAL;
    OutlierFlag outlier_ = OutlierFlag::NORMAL;

    const Field* find(const std::string& name) const;
};
