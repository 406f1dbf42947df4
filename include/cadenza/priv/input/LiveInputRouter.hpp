#pragma once

#include <cstddef>

#include "InputEvents.hpp"

namespace cadenza {

    // Decides which tracks a live event sounds on. A track takes an event when it receives
    // live input, listens on the event's channel, and the pitch falls within its note range.
    // Several tracks may share a channel with different ranges (keyboard splits); an event
    // no track accepts is dropped.
    class LiveInputRouter {
    public:
        static bool accepts(const MixerState& mixer, const LiveNoteEvent& event) {
            return mixer.receiveLiveInput
                && mixer.midiChannel == event.channel
                && mixer.noteRangeMin <= event.pitch
                && event.pitch <= mixer.noteRangeMax;
        }

        // Calls onMatch(trackIndex) for every accepting track whose `active[trackIndex]` is true,
        // and returns how many there were.
        template <typename ActiveFlags, typename F>
        static size_t route(const LiveNoteEvent& event, const MixerState* mixers, const ActiveFlags& active,
                            size_t trackCount, F&& onMatch) {
            size_t matched = 0;
            for (size_t t = 0; t < trackCount; t++) {
                if (!active[t] || !accepts(mixers[t], event))
                    continue;
                onMatch(static_cast<cadenza_track_index_t>(t));
                matched++;
            }
            return matched;
        }
    };

}
