#include "model_registry.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace deepscan {

// BackboneLease

BackboneLease::BackboneLease(ModelRegistry* registry, std::shared_ptr<Backbone> backbone)
    : registry_(registry), backbone_(std::move(backbone)) {}

BackboneLease::~BackboneLease() {
    reset();
}

BackboneLease::BackboneLease(BackboneLease&& other) noexcept
    : registry_(other.registry_), backbone_(std::move(other.backbone_)) {
    other.registry_ = nullptr;
}

BackboneLease& BackboneLease::operator=(BackboneLease&& other) noexcept {
    if (this != &other) {
        reset();
        registry_ = other.registry_;
        backbone_ = std::move(other.backbone_);
        other.registry_ = nullptr;
    }
    return *this;
}

void BackboneLease::reset() {
    if (registry_ && backbone_) {
        const std::string name = backbone_->name();
        backbone_.reset();
        registry_->release_lease(name);
    }
    registry_ = nullptr;
    backbone_.reset();
}

// ModelRegistry

ModelRegistry::ModelRegistry(RegistryConfig config, BackboneFactory factory)
    : config_(std::move(config))
    , factory_(factory ? std::move(factory) : default_backbone_factory(config_.inference))
    , memory_(megabytes(config_.max_memory_mb)) {
    std::cout << "ModelRegistry initialized with:" << std::endl;
    std::cout << "  Memory limit: " << config_.max_memory_mb << "MB" << std::endl;
    std::cout << "  Load retries: " << config_.max_load_retries << std::endl;
    std::cout << "  Use GPU: " << (config_.inference.use_gpu ? "yes" : "no") << std::endl;
}

ModelRegistry::~ModelRegistry() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, entry] : entries_) {
        if (entry.instance) {
            entry.instance->release();
            entry.instance.reset();
        }
    }
}

ModelRegistry::Entry& ModelRegistry::entry_locked(const std::string& name) {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw ConfigError("Unknown backbone: " + name);
    }
    return it->second;
}

const ModelRegistry::Entry& ModelRegistry::entry_locked(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw ConfigError("Unknown backbone: " + name);
    }
    return it->second;
}

void ModelRegistry::register_backbone(const BackboneDescriptor& descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(descriptor.name);
    if (it != entries_.end()) {
        if (it->second.state == LoadState::Ready || it->second.state == LoadState::Loading) {
            throw ConfigError("Cannot re-register resident backbone: " + descriptor.name);
        }
        it->second.descriptor = descriptor;
        it->second.state = LoadState::Unloaded;
        it->second.last_error.reset();
        return;
    }

    Entry entry;
    entry.descriptor = descriptor;
    entries_.emplace(descriptor.name, std::move(entry));
}

bool ModelRegistry::has_backbone(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(name) > 0;
}

std::vector<BackboneDescriptor> ModelRegistry::descriptors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BackboneDescriptor> result;
    result.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        result.push_back(entry.descriptor);
    }
    return result;
}

LoadState ModelRegistry::state(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entry_locked(name).state;
}

std::optional<std::string> ModelRegistry::last_error(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entry_locked(name).last_error;
}

LoadOutcome ModelRegistry::load(const std::string& name) {
    // One backbone at a time, process wide
    std::lock_guard<std::mutex> load_lock(load_mutex_);
    auto start_time = std::chrono::steady_clock::now();

    LoadOutcome outcome;
    outcome.name = name;

    BackboneDescriptor descriptor;
    size_t required_bytes = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry& entry = entry_locked(name);

        if (entry.state == LoadState::Ready) {
            entry.last_used = std::chrono::steady_clock::now();
            entry.unload_pending = false;
            outcome.state = LoadState::Ready;
            return outcome;
        }

        if (entry.leases > 0) {
            // A failed instance is still being used by another job
            outcome.state = entry.state;
            outcome.error = "previous instance of " + name + " is still leased";
            return outcome;
        }

        descriptor = entry.descriptor;
        required_bytes = megabytes(descriptor.estimated_memory_mb);

        if (!memory_.is_memory_available(required_bytes) &&
            !make_room_locked(required_bytes, name)) {
            std::string error = "insufficient memory: needs " +
                std::to_string(descriptor.estimated_memory_mb) + "MB, " +
                std::to_string(memory_.get_total_allocated() / (1024 * 1024)) + "MB of " +
                std::to_string(memory_.get_memory_limit() / (1024 * 1024)) + "MB in use";
            std::cout << "❌ " << name << ": " << error << std::endl;

            entry.state = LoadState::Failed;
            entry.last_error = error;
            outcome.error = error;
            return outcome;
        }

        entry.state = LoadState::Loading;
    }

    std::string error;
    auto backbone = load_with_retries(descriptor, outcome.attempts, error);

    // Drop deserialization scratch before the next load starts
    memory_.garbage_collect();

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = entry_locked(name);

    if (backbone) {
        entry.instance = std::shared_ptr<Backbone>(std::move(backbone));
        entry.state = LoadState::Ready;
        entry.last_used = std::chrono::steady_clock::now();
        entry.last_error.reset();
        memory_.track_allocation(name, required_bytes);

        outcome.state = LoadState::Ready;
        std::cout << "✅ Loaded " << name << " in " << outcome.duration.count() << "ms ("
                  << outcome.attempts << " attempt" << (outcome.attempts == 1 ? "" : "s") << ")"
                  << std::endl;
    } else {
        entry.state = LoadState::Failed;
        entry.last_error = error;

        outcome.state = LoadState::Failed;
        outcome.error = error;
        std::cout << "❌ " << error << std::endl;
    }

    return outcome;
}

std::unique_ptr<Backbone> ModelRegistry::load_with_retries(const BackboneDescriptor& descriptor,
                                                           int& attempts, std::string& error) {
    auto backoff = config_.retry_backoff;
    attempts = 0;

    while (true) {
        ++attempts;
        try {
            auto backbone = factory_(descriptor);
            backbone->load();
            return backbone;
        } catch (const BackboneLoadError& e) {
            error = e.what();
            if (!e.transient() || attempts > config_.max_load_retries) {
                return nullptr;
            }
            std::cout << "Retry " << attempts << "/" << config_.max_load_retries
                      << " for " << descriptor.name << " in " << backoff.count()
                      << "ms: " << e.what() << std::endl;
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        } catch (const std::exception& e) {
            // Anything else (unsupported runtime, allocation failure) is permanent
            error = "Failed to load backbone '" + descriptor.name + "': " + e.what();
            return nullptr;
        }
    }
}

bool ModelRegistry::make_room_locked(size_t required_bytes, const std::string& requester) {
    std::vector<std::pair<std::chrono::steady_clock::time_point, std::string>> idle;
    for (const auto& [name, entry] : entries_) {
        if (name != requester && entry.state == LoadState::Ready && entry.leases == 0) {
            idle.emplace_back(entry.last_used, name);
        }
    }
    std::sort(idle.begin(), idle.end());

    for (const auto& [last_used, name] : idle) {
        if (memory_.is_memory_available(required_bytes)) {
            break;
        }
        std::cout << "Evicting idle backbone " << name << " to make room for " << requester << std::endl;
        unload_locked(name, entries_.at(name), LoadState::Unloaded);
    }

    return memory_.is_memory_available(required_bytes);
}

void ModelRegistry::unload_locked(const std::string& name, Entry& entry, LoadState final_state) {
    if (entry.instance) {
        entry.instance->release();
        entry.instance.reset();
    }
    memory_.release_tag(name);
    entry.state = final_state;
    entry.unload_pending = false;
}

bool ModelRegistry::unload(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = entry_locked(name);

    if (entry.state != LoadState::Ready) {
        return false;
    }

    if (entry.leases > 0) {
        std::cout << "Deferring unload of " << name << " until " << entry.leases
                  << " lease(s) are released" << std::endl;
        entry.unload_pending = true;
        return false;
    }

    unload_locked(name, entry, LoadState::Unloaded);
    std::cout << "Unloaded " << name << std::endl;
    return true;
}

void ModelRegistry::unload_all() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, entry] : entries_) {
            names.push_back(name);
        }
    }
    for (const auto& name : names) {
        unload(name);
    }
}

std::vector<std::string> ModelRegistry::list_ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ready;
    for (const auto& [name, entry] : entries_) {
        if (entry.state == LoadState::Ready) {
            ready.push_back(name);
        }
    }
    return ready;
}

BackboneLease ModelRegistry::acquire(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = entry_locked(name);

    if (entry.state != LoadState::Ready || !entry.instance) {
        throw DetectionError("Backbone '" + name + "' is not ready (" + to_string(entry.state) + ")");
    }

    ++entry.leases;
    entry.last_used = std::chrono::steady_clock::now();
    return BackboneLease(this, entry.instance);
}

size_t ModelRegistry::active_leases(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entry_locked(name).leases;
}

void ModelRegistry::release_lease(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end() || it->second.leases == 0) {
        return;
    }

    Entry& entry = it->second;
    --entry.leases;
    if (entry.leases == 0 && entry.unload_pending) {
        const LoadState final_state =
            entry.state == LoadState::Failed ? LoadState::Failed : LoadState::Unloaded;
        unload_locked(name, entry, final_state);
        std::cout << "Unloaded " << name << " after its last lease" << std::endl;
    }
}

void ModelRegistry::mark_failed(const std::string& name, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = entry_locked(name);

    std::cout << "Marking backbone " << name << " as failed: " << reason << std::endl;
    entry.last_error = reason;

    if (entry.leases > 0) {
        entry.state = LoadState::Failed;
        entry.unload_pending = true;
        return;
    }
    unload_locked(name, entry, LoadState::Failed);
}

} // namespace deepscan
