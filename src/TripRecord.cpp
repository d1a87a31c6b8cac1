#include "TripRecord.h"

#include "CommonUtils.h"

#include <algorithm>

const char* toString(ValidityFlag flag) noexcept {
    switch (flag) {
        case ValidityFlag::NORMAL: return "NORMAL";
        case ValidityFlag::DUPLICATE: return "DUPLICATE";
        case ValidityFlag::INVALID_COORDINATES: return "INVALID_COORDINATES";
        case ValidityFlag::INVALID_DATETIME: return "INVALID_DATETIME";
        case ValidityFlag::INVALID_DURATION_OR_PASSENGERS: return "INVALID_DURATION_OR_PASSENGERS";
    }
    return "NORMAL";
}

const char* toString(OutlierFlag flag) noexcept {
    return flag == OutlierFlag::DURATION_OUTLIER ? "DURATION_OUTLIER" : "NORMAL";
}

std::optional<OutlierFlag> parseOutlierFlag(const std::string& text) {
    const std::string t = CommonUtils::trim(text);
    if (t == "NORMAL") return OutlierFlag::NORMAL;
    if (t == "DURATION_OUTLIER") return OutlierFlag::DURATION_OUTLIER;
    return std::nullopt;
}

namespace TripFields {
const std::vector<std::string>& cleanedColumns() {
    static const std::vector<std::string> columns = {
        kId, kVendorId, kPickupDatetime, kDropoffDatetime,
        kPassengerCount, kPickupLongitude, kPickupLatitude,
        kDropoffLongitude, kDropoffLatitude, kStoreAndFwdFlag,
        kTripDuration, kCalculatedDuration, kOutlierFlag
    };
    return columns;
}
}

const TripRecord::Field* TripRecord::find(const std::string& name) const {
    auto it = std::find_if(fields_.begin(), fields_.end(), [&](const Field& f) { return f.first == name; });
    return it == fields_.end() ? nullptr : &(*it);
}

bool TripRecord::has(const std::string& name) const {
    return find(name) != nullptr;
}

bool TripRecord::isMissing(const std::string& name) const {
    const Field* f = find(name);
    return f == nullptr || CommonUtils::trim(f->second).empty();
}

const std::string& TripRecord::get(const std::string& name) const {
    static const std::string kEmpty;
    const Field* f = find(name);
    return f ? f->second : kEmpty;
}

void TripRecord::set(const std::string& name, std::string value) {
    auto it = std::find_if(fields_.begin(), fields_.end(), [&](const Field& f) { return f.first == name; });
    if (it != fields_.end()) {
        it->second = std::move(value);
        return;
    }
    fields_.emplace_back(name, std::move(value));
}

void TripRecord::markInvalid(ValidityFlag flag) {
    validity_ = flag;
    set(TripFields::kValidityFlag, toString(flag));
}

void TripRecord::setOutlier(OutlierFlag flag) {
    outlier_ = flag;
    set(TripFields::kOutlierFlag, toString(flag));
}
