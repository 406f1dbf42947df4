#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "../common.hpp"
#include "../processor/AudioProcessor.hpp"

namespace cadenza {

    enum class VoiceLifecycle {
        Idle,         // slot in the pool, not sounding
        PreRendering, // note-on received, initial window being rendered
        Sustaining,
        Releasing,
        Finished      // tail consumed or cut; returned to Idle within the same block
    };

    const char* voiceLifecycleName(VoiceLifecycle state);

    // One sounding note. Cursors are absolute sample indices counted from the note-on;
    // `buffer` holds the samples [bufferBase, writeCursor) and never reallocates, since its
    // size is fixed when the pool is built. Consumed samples are dropped by compact().
    struct LiveVoice {
        uint64_t id{0};
        VoiceLifecycle state{VoiceLifecycle::Idle};
        cadenza_track_index_t trackIndex{-1};
        // -1 for voices started from live input.
        int32_t noteIndex{-1};
        int32_t pitch{0};
        int32_t velocity{0};
        double durationSeconds{0.0};

        std::vector<float> buffer{};
        int64_t bufferBase{0};
        int64_t writeCursor{0};
        int64_t readCursor{0};
        std::optional<int64_t> releaseStartSample{};
        // Frames of the current block to skip before the voice starts.
        int32_t startDelayFrames{0};

        VoiceState processorState{};
        uint32_t renderCalls{0};

        bool active() const { return state != VoiceLifecycle::Idle && state != VoiceLifecycle::Finished; }
        int64_t unread() const { return writeCursor - readCursor; }
        float* at(int64_t sample) { return buffer.data() + (sample - bufferBase); }
        const float* at(int64_t sample) const { return buffer.data() + (sample - bufferBase); }
        int64_t freeSpace() const { return static_cast<int64_t>(buffer.size()) - (writeCursor - bufferBase); }

        // Moves the unread samples to the front of the buffer.
        void compact();
        void recycle();
    };

}
