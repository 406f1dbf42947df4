#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "AudioProcessor.hpp"
#include "../model/Arrangement.hpp"

namespace cadenza {

    struct ConfigurationResult {
        bool success{false};
        StatusCode status{StatusCode::OK};
        std::string error{};
    };

    // A processor resolved for one slot of a track, with every declared parameter present
    // (missing ones filled from their defaults).
    struct ConfiguredProcessor {
        std::shared_ptr<AudioProcessor> processor{};
        ParameterValues parameters{};
    };

    struct ConfiguredTrack {
        ConfiguredProcessor source{};
        // Inactive effect slots are left out.
        std::vector<ConfiguredProcessor> effects{};
    };

    // Keeps one factory per processor id, validated at registration. Resolution happens at
    // track-configuration time only; the render thread never touches the registry.
    //
    // Stateless processors are instantiated once and shared. Stateful ones get a fresh
    // instance per resolution, always from the same factory, so an id never maps to two
    // different classes.
    class ProcessorRegistry {
    protected:
        ProcessorRegistry() = default;

    public:
        static std::unique_ptr<ProcessorRegistry> create();
        // DUAL_OSC, NOISE_DRUM, DELAY, EQ and REVERB.
        static std::unique_ptr<ProcessorRegistry> createWithBuiltins();

        virtual ~ProcessorRegistry() = default;

        virtual ConfigurationResult registerProcessor(ProcessorFactory factory) = 0;
        // Pointers previously returned by metadata() for this id become invalid.
        virtual bool unregisterProcessor(std::string_view id) = 0;

        virtual bool contains(std::string_view id) const = 0;
        virtual const ProcessorMetadata* metadata(std::string_view id) const = 0;
        virtual std::vector<std::string> processorIds() const = 0;
        virtual std::vector<std::string> processorIds(ProcessorCategory category) const = 0;

        // nullptr for unknown ids.
        virtual std::shared_ptr<AudioProcessor> resolve(std::string_view id) = 0;

        virtual ConfigurationResult validateParameters(std::string_view id, const ParameterValues& values) const = 0;
        // Validated values plus defaults for everything not given.
        virtual ParameterValues resolveParameters(std::string_view id, const ParameterValues& values) const = 0;

        // Resolves the source and effect chain of a track. On failure the track must not be activated.
        virtual ConfigurationResult configureTrack(const TrackData& track, ConfiguredTrack& configured) = 0;
    };

}
