#include <algorithm>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    const char* voiceLifecycleName(VoiceLifecycle state) {
        switch (state) {
            case VoiceLifecycle::Idle: return "idle";
            case VoiceLifecycle::PreRendering: return "pre-rendering";
            case VoiceLifecycle::Sustaining: return "sustaining";
            case VoiceLifecycle::Releasing: return "releasing";
            case VoiceLifecycle::Finished: return "finished";
        }
        return "unknown";
    }

    void LiveVoice::compact() {
        if (readCursor <= bufferBase)
            return;
        auto first = buffer.begin() + (readCursor - bufferBase);
        auto last = buffer.begin() + (writeCursor - bufferBase);
        std::copy(first, last, buffer.begin());
        bufferBase = readCursor;
    }

    void LiveVoice::recycle() {
        state = VoiceLifecycle::Idle;
        trackIndex = -1;
        noteIndex = -1;
        bufferBase = 0;
        writeCursor = 0;
        readCursor = 0;
        releaseStartSample.reset();
        startDelayFrames = 0;
        renderCalls = 0;
        processorState.clear();
    }

}
