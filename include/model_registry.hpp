#pragma once

#include "backbone.hpp"
#include "config.hpp"
#include "detection_types.hpp"
#include "memory_manager.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace deepscan {

class ModelRegistry;

struct LoadOutcome {
    std::string name;
    LoadState state = LoadState::Failed;
    std::chrono::milliseconds duration{0};
    int attempts = 0;
    std::optional<std::string> error;

    bool ready() const { return state == LoadState::Ready; }
};

// Scoped, reference-counted access to a ready backbone. While any lease is
// alive the registry will not unload the backbone. Must not outlive the
// registry that issued it.
class BackboneLease {
public:
    BackboneLease() = default;
    ~BackboneLease();

    BackboneLease(BackboneLease&& other) noexcept;
    BackboneLease& operator=(BackboneLease&& other) noexcept;

    BackboneLease(const BackboneLease&) = delete;
    BackboneLease& operator=(const BackboneLease&) = delete;

    const Backbone& operator*() const { return *backbone_; }
    const Backbone* operator->() const { return backbone_.get(); }
    explicit operator bool() const { return backbone_ != nullptr; }

    void reset();

private:
    friend class ModelRegistry;
    BackboneLease(ModelRegistry* registry, std::shared_ptr<Backbone> backbone);

    ModelRegistry* registry_ = nullptr;
    std::shared_ptr<Backbone> backbone_;
};

// Owns every known backbone and its lifecycle. Shared by all jobs of a
// process through std::shared_ptr; loads are strictly one at a time.
class ModelRegistry {
public:
    explicit ModelRegistry(RegistryConfig config, BackboneFactory factory = {});
    ~ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    // Replaces an unloaded descriptor of the same name; throws ConfigError
    // when the backbone is currently resident.
    void register_backbone(const BackboneDescriptor& descriptor);
    bool has_backbone(const std::string& name) const;
    std::vector<BackboneDescriptor> descriptors() const;
    LoadState state(const std::string& name) const;
    std::optional<std::string> last_error(const std::string& name) const;

    // Blocks while another load is in progress. Never throws for load
    // failures; they are reported in the outcome.
    LoadOutcome load(const std::string& name);

    // Returns false if the backbone was not resident or is still leased, in
    // which case it is unloaded when the last lease is released.
    bool unload(const std::string& name);
    void unload_all();

    std::vector<std::string> list_ready() const;

    // Throws DetectionError when the backbone is not ready
    BackboneLease acquire(const std::string& name);
    size_t active_leases(const std::string& name) const;

    // Takes a backbone out of service after it misbehaved at inference time
    void mark_failed(const std::string& name, const std::string& reason);

    MemoryManager& memory() { return memory_; }
    const MemoryManager& memory() const { return memory_; }

private:
    friend class BackboneLease;

    struct Entry {
        BackboneDescriptor descriptor;
        LoadState state = LoadState::Unloaded;
        std::shared_ptr<Backbone> instance;
        size_t leases = 0;
        bool unload_pending = false;
        std::chrono::steady_clock::time_point last_used;
        std::optional<std::string> last_error;
    };

    Entry& entry_locked(const std::string& name);
    const Entry& entry_locked(const std::string& name) const;

    void release_lease(const std::string& name);
    void unload_locked(const std::string& name, Entry& entry, LoadState final_state);
    bool make_room_locked(size_t required_bytes, const std::string& requester);

    std::unique_ptr<Backbone> load_with_retries(const BackboneDescriptor& descriptor,
                                                int& attempts, std::string& error);

    RegistryConfig config_;
    BackboneFactory factory_;
    MemoryManager memory_;

    mutable std::mutex mutex_;
    std::mutex load_mutex_;
    std::map<std::string, Entry> entries_;
};

} // namespace deepscan
