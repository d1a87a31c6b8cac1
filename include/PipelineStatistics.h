#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * Named counter bundle owned by a single pipeline instance.
 * Counters keep declaration order so reports enumerate them stably.
 */
class PipelineStatistics {
public:
    PipelineStatistics() = default;
    PipelineStatistics(std::initializer_list<const char*> counters) {
        for (const char* name : counters) declare(name);
    }

    void declare(const std::string& name) {
        if (index_.count(name)) return;
        index_.emplace(name, entries_.size());
        entries_.emplace_back(name, 0);
    }

    void increment(const std::string& name, size_t by = 1) {
        declare(name);
        entries_[index_.at(name)].second += by;
    }

    void set(const std::string& name, size_t value) {
        declare(name);
        entries_[index_.at(name)].second = value;
    }

    size_t get(const std::string& name) const {
        const auto it = index_.find(name);
        return it == index_.end() ? 0 : entries_[it->second].second;
    }

    // Zeroes every counter, keeping the declared order.
    void reset() noexcept {
        for (auto& entry : entries_) entry.second = 0;
    }

    const std::vector<std::pair<std::string, size_t>>& entries() const noexcept { return entries_; }

private:
    std::vector<std::pair<std::string, size_t>> entries_;
    std::unordered_map<std::string, size_t> index_;
};
