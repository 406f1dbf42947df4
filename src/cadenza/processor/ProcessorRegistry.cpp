#include <format>
#include <map>
#include <mutex>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    class ProcessorRegistryImpl : public ProcessorRegistry {
        struct Entry {
            ProcessorFactory factory;
            ProcessorMetadata metadata;
            // Kept for stateless processors only.
            std::shared_ptr<AudioProcessor> shared{};
        };

        mutable std::mutex mutex_;
        std::map<std::string, Entry, std::less<>> entries_;

        const Entry* find(std::string_view id) const {
            auto it = entries_.find(id);
            return it == entries_.end() ? nullptr : &it->second;
        }

        ConfigurationResult configureSlot(const ProcessorSlot& slot, ProcessorCategory expected, ConfiguredProcessor& out);

    public:
        ConfigurationResult registerProcessor(ProcessorFactory factory) override;
        bool unregisterProcessor(std::string_view id) override;
        bool contains(std::string_view id) const override;
        const ProcessorMetadata* metadata(std::string_view id) const override;
        std::vector<std::string> processorIds() const override;
        std::vector<std::string> processorIds(ProcessorCategory category) const override;
        std::shared_ptr<AudioProcessor> resolve(std::string_view id) override;
        ConfigurationResult validateParameters(std::string_view id, const ParameterValues& values) const override;
        ParameterValues resolveParameters(std::string_view id, const ParameterValues& values) const override;
        ConfigurationResult configureTrack(const TrackData& track, ConfiguredTrack& configured) override;
    };

    std::unique_ptr<ProcessorRegistry> ProcessorRegistry::create() {
        return std::make_unique<ProcessorRegistryImpl>();
    }

    std::unique_ptr<ProcessorRegistry> ProcessorRegistry::createWithBuiltins() {
        auto registry = create();
        for (auto& factory : builtinProcessorFactories()) {
            auto result = registry->registerProcessor(factory);
            if (!result.success)
                Logger::global()->logError("Failed to register a built-in processor: %s", result.error.c_str());
        }
        return registry;
    }

    ConfigurationResult ProcessorRegistryImpl::registerProcessor(ProcessorFactory factory) {
        if (!factory)
            return {false, StatusCode::INVALID_METADATA, "processor factory is empty"};

        std::unique_ptr<AudioProcessor> instance;
        try {
            instance = factory();
        } catch (const std::exception& e) {
            return {false, StatusCode::INVALID_METADATA, std::format("processor factory failed: {}", e.what())};
        } catch (...) {
            return {false, StatusCode::INVALID_METADATA, "processor factory failed with a non-standard exception"};
        }
        if (!instance)
            return {false, StatusCode::INVALID_METADATA, "processor factory returned no instance"};

        auto metadata = instance->metadata();
        auto error = validateMetadata(metadata);
        if (!error.empty())
            return {false, StatusCode::INVALID_METADATA, error};

        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.contains(metadata.id))
            return {false, StatusCode::INVALID_METADATA, std::format("processor '{}' is already registered", metadata.id)};

        Entry entry{std::move(factory), metadata, nullptr};
        if (!metadata.stateful)
            entry.shared = std::shared_ptr<AudioProcessor>(std::move(instance));
        entries_.emplace(metadata.id, std::move(entry));
        return {true, StatusCode::OK, ""};
    }

    bool ProcessorRegistryImpl::unregisterProcessor(std::string_view id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end())
            return false;
        entries_.erase(it);
        return true;
    }

    bool ProcessorRegistryImpl::contains(std::string_view id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return find(id) != nullptr;
    }

    const ProcessorMetadata* ProcessorRegistryImpl::metadata(std::string_view id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entry = find(id);
        return entry ? &entry->metadata : nullptr;
    }

    std::vector<std::string> ProcessorRegistryImpl::processorIds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        for (auto& [id, _] : entries_)
            ids.emplace_back(id);
        return ids;
    }

    std::vector<std::string> ProcessorRegistryImpl::processorIds(ProcessorCategory category) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        for (auto& [id, entry] : entries_)
            if (entry.metadata.category == category)
                ids.emplace_back(id);
        return ids;
    }

    std::shared_ptr<AudioProcessor> ProcessorRegistryImpl::resolve(std::string_view id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end())
            return nullptr;
        auto& entry = it->second;
        if (entry.shared)
            return entry.shared;
        try {
            return std::shared_ptr<AudioProcessor>(entry.factory());
        } catch (const std::exception& e) {
            Logger::global()->logError("Failed to instantiate processor %s: %s", entry.metadata.id.c_str(), e.what());
            return nullptr;
        } catch (...) {
            Logger::global()->logError("Failed to instantiate processor %s: non-standard exception", entry.metadata.id.c_str());
            return nullptr;
        }
    }

    ConfigurationResult ProcessorRegistryImpl::validateParameters(std::string_view id, const ParameterValues& values) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entry = find(id);
        if (!entry)
            return {false, StatusCode::UNKNOWN_PROCESSOR, std::format("unknown processor '{}'", id)};
        for (auto& [name, value] : values) {
            auto spec = entry->metadata.findParameter(name);
            if (!spec)
                return {false, StatusCode::INVALID_PARAMETER, std::format("processor '{}' has no parameter '{}'", id, name)};
            auto error = validateParameterValue(*spec, value);
            if (!error.empty())
                return {false, StatusCode::INVALID_PARAMETER, error};
        }
        return {true, StatusCode::OK, ""};
    }

    ParameterValues ProcessorRegistryImpl::resolveParameters(std::string_view id, const ParameterValues& values) const {
        std::lock_guard<std::mutex> lock(mutex_);
        ParameterValues resolved;
        auto entry = find(id);
        if (!entry)
            return resolved;
        for (auto& spec : entry->metadata.parameters) {
            auto it = values.find(spec.name);
            if (it != values.end() && validateParameterValue(spec, it->second).empty())
                resolved[spec.name] = it->second;
            else
                resolved[spec.name] = spec.defaultValue;
        }
        return resolved;
    }

    ConfigurationResult ProcessorRegistryImpl::configureSlot(const ProcessorSlot& slot, ProcessorCategory expected, ConfiguredProcessor& out) {
        auto validation = validateParameters(slot.processorId, slot.parameters);
        if (!validation.success)
            return validation;

        auto meta = metadata(slot.processorId);
        if (meta->category != expected)
            return {false, StatusCode::INVALID_PARAMETER,
                    std::format("processor '{}' is a {} but was placed in a {} slot", slot.processorId,
                                processorCategoryName(meta->category), processorCategoryName(expected))};

        out.processor = resolve(slot.processorId);
        if (!out.processor)
            return {false, StatusCode::UNKNOWN_PROCESSOR, std::format("processor '{}' could not be instantiated", slot.processorId)};
        out.parameters = resolveParameters(slot.processorId, slot.parameters);
        return {true, StatusCode::OK, ""};
    }

    ConfigurationResult ProcessorRegistryImpl::configureTrack(const TrackData& track, ConfiguredTrack& configured) {
        configured = {};
        // A disabled source leaves the track silent but still routable.
        if (!track.source.active)
            return {true, StatusCode::OK, ""};
        if (track.source.processorId.empty())
            return {false, StatusCode::UNKNOWN_PROCESSOR, std::format("track '{}' has no source processor", track.name)};

        auto result = configureSlot(track.source, ProcessorCategory::Source, configured.source);
        if (!result.success) {
            result.error = std::format("track '{}' source: {}", track.name, result.error);
            return result;
        }
        for (size_t i = 0; i < track.effects.size(); i++) {
            auto& slot = track.effects[i];
            if (!slot.active)
                continue;
            ConfiguredProcessor effect;
            result = configureSlot(slot, ProcessorCategory::Effect, effect);
            if (!result.success) {
                result.error = std::format("track '{}' effect #{}: {}", track.name, i, result.error);
                configured = {};
                return result;
            }
            configured.effects.emplace_back(std::move(effect));
        }
        return {true, StatusCode::OK, ""};
    }

}
