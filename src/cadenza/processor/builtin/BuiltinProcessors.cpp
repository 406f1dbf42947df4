#include "cadenza/cadenza.hpp"

namespace cadenza {

    std::vector<ProcessorFactory> builtinProcessorFactories() {
        return {
            [] { return std::make_unique<DualOscillator>(); },
            [] { return std::make_unique<NoiseDrum>(); },
            [] { return std::make_unique<DelayEffect>(); },
            [] { return std::make_unique<EqualizerEffect>(); },
            [] { return std::make_unique<ReverbEffect>(); },
        };
    }

}
