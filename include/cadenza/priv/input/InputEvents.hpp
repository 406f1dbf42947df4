#pragma once

#include <cstdint>

#include "../common.hpp"
#include "../model/Arrangement.hpp"

namespace cadenza {

    struct LiveNoteEvent {
        uint8_t channel{0};
        uint8_t pitch{0};
        uint8_t velocity{0};
        bool isNoteOn{false};
        cadenza_timestamp_t timestamp{0};
    };

    // Everything the input context may ask of the render context. Trivially copyable,
    // so it moves through the bounded queue without allocation.
    struct EngineCommand {
        enum class Type : uint8_t {
            LiveNote,
            Play,
            Stop,
            Seek,
            SetLoopRegion,
            SetLoopEnabled,
            SetMixerState
        };

        Type type{Type::LiveNote};
        LiveNoteEvent note{};
        cadenza_tick_t tick{0};
        cadenza_tick_t loopEnd{0};
        bool hasLoopEnd{false};
        bool enabled{false};
        cadenza_track_index_t trackIndex{-1};
        MixerState mixer{};
    };

}
