#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace deepscan {

// Accounts for the resident memory of loaded backbones against a ceiling.
// One instance is owned by each ModelRegistry.
class MemoryManager {
public:
    explicit MemoryManager(size_t limit_bytes = static_cast<size_t>(8) * 1024 * 1024 * 1024);

    // Memory tracking
    void track_allocation(const std::string& tag, size_t bytes);
    void release_tag(const std::string& tag);

    // Memory statistics
    size_t get_total_allocated() const;
    size_t get_peak_usage() const;
    size_t get_allocated(const std::string& tag) const;
    std::unordered_map<std::string, size_t> get_allocation_stats() const;

    // Memory management
    bool is_memory_available(size_t required_bytes) const;
    void garbage_collect();
    size_t get_memory_limit() const;

private:
    mutable std::mutex mutex_;
    std::atomic<size_t> total_allocated_{0};
    std::atomic<size_t> peak_usage_{0};
    const size_t memory_limit_;
    std::unordered_map<std::string, size_t> allocations_;
};

constexpr size_t megabytes(size_t mb) { return mb * 1024 * 1024; }

} // namespace deepscan
