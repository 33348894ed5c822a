#include "memory_manager.hpp"
#include <iostream>

#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace deepscan {

MemoryManager::MemoryManager(size_t limit_bytes) : memory_limit_(limit_bytes) {}

void MemoryManager::track_allocation(const std::string& tag, size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    allocations_[tag] += bytes;
    total_allocated_ += bytes;

    size_t current_total = total_allocated_.load();
    size_t current_peak = peak_usage_.load();

    while (current_total > current_peak &&
           !peak_usage_.compare_exchange_weak(current_peak, current_total)) {
        current_peak = peak_usage_.load();
    }
}

void MemoryManager::release_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = allocations_.find(tag);
    if (it != allocations_.end()) {
        total_allocated_ -= it->second;
        allocations_.erase(it);
    }
}

size_t MemoryManager::get_total_allocated() const {
    return total_allocated_.load();
}

size_t MemoryManager::get_peak_usage() const {
    return peak_usage_.load();
}

size_t MemoryManager::get_allocated(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allocations_.find(tag);
    return it == allocations_.end() ? 0 : it->second;
}

std::unordered_map<std::string, size_t> MemoryManager::get_allocation_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocations_;
}

bool MemoryManager::is_memory_available(size_t required_bytes) const {
    size_t current_usage = total_allocated_.load();
    size_t limit = memory_limit_;

    return required_bytes <= limit && current_usage <= limit - required_bytes;
}

void MemoryManager::garbage_collect() {
    // Hand freed deserialization buffers back to the OS before the next load
#if defined(__GLIBC__)
    malloc_trim(0);
#endif

    std::cout << "Memory garbage collection triggered. Current usage: "
              << (get_total_allocated() / (1024 * 1024)) << " MB" << std::endl;

    auto stats = get_allocation_stats();
    for (const auto& [tag, bytes] : stats) {
        std::cout << "  " << tag << ": " << (bytes / (1024 * 1024)) << " MB" << std::endl;
    }
}

size_t MemoryManager::get_memory_limit() const {
    return memory_limit_;
}

} // namespace deepscan
