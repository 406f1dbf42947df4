#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "InputEvents.hpp"

namespace cadenza {

    // Turns Universal MIDI Packets from an input device into LiveNoteEvents.
    // MIDI 1.0 and MIDI 2.0 channel-voice note-on/note-off are understood; everything else is skipped.
    // A MIDI 1.0 note-on with velocity 0 is a note-off. MIDI 2.0 16-bit velocities are scaled to 0-127,
    // and a MIDI 2.0 note-on never scales below 1.
    class UmpInputDecoder {
    public:
        // Returns the number of note events produced.
        static size_t decode(const uint32_t* ump, size_t sizeInBytes, cadenza_timestamp_t timestamp,
                             const std::function<void(const LiveNoteEvent&)>& onNote);
    };

}
