#include <cmidi2.h>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    size_t UmpInputDecoder::decode(const uint32_t* ump, size_t sizeInBytes, cadenza_timestamp_t timestamp,
                                   const std::function<void(const LiveNoteEvent&)>& onNote) {
        if (!ump || sizeInBytes < sizeof(uint32_t))
            return 0;

        size_t count = 0;
        auto emit = [&](uint8_t channel, uint8_t pitch, uint8_t velocity, bool isNoteOn) {
            onNote(LiveNoteEvent{channel, pitch, velocity, isNoteOn, timestamp});
            count++;
        };

        auto ptr = const_cast<uint32_t*>(ump);
        CMIDI2_UMP_SEQUENCE_FOREACH(ptr, sizeInBytes, iter) {
            auto message = (cmidi2_ump*) iter;
            switch (cmidi2_ump_get_message_type(message)) {
                case CMIDI2_MESSAGE_TYPE_MIDI_1_CHANNEL: {
                    auto channel = cmidi2_ump_get_channel(message);
                    auto note = cmidi2_ump_get_midi1_note_note(message);
                    auto velocity = cmidi2_ump_get_midi1_note_velocity(message);
                    switch (cmidi2_ump_get_status_code(message)) {
                        case CMIDI2_STATUS_NOTE_ON:
                            emit(channel, note, velocity, velocity > 0);
                            break;
                        case CMIDI2_STATUS_NOTE_OFF:
                            emit(channel, note, velocity, false);
                            break;
                    }
                    break;
                }
                case CMIDI2_MESSAGE_TYPE_MIDI_2_CHANNEL: {
                    auto channel = cmidi2_ump_get_channel(message);
                    auto note = cmidi2_ump_get_midi2_note_note(message);
                    auto velocity = static_cast<uint8_t>(cmidi2_ump_get_midi2_note_velocity(message) >> 9);
                    switch (cmidi2_ump_get_status_code(message)) {
                        case CMIDI2_STATUS_NOTE_ON:
                            emit(channel, note, velocity > 0 ? velocity : 1, true);
                            break;
                        case CMIDI2_STATUS_NOTE_OFF:
                            emit(channel, note, velocity, false);
                            break;
                    }
                    break;
                }
                default:
                    break;
            }
        }
        return count;
    }

}
