#include <algorithm>
#include <choc/containers/choc_Value.h>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    namespace {
        struct ByteSink {
            std::vector<uint8_t>& bytes;

            void write(const void* data, size_t size) {
                auto p = static_cast<const uint8_t*>(data);
                bytes.insert(bytes.end(), p, p + size);
            }
        };

        choc::value::Value serializeParameterValue(const ParameterValue& value) {
            if (auto d = std::get_if<double>(&value))
                return choc::value::createFloat64(*d);
            if (auto i = std::get_if<int64_t>(&value))
                return choc::value::createInt64(*i);
            if (auto b = std::get_if<bool>(&value))
                return choc::value::createBool(*b);
            return choc::value::createString(std::get<std::string>(value));
        }

        choc::value::Value serializeSlot(const ProcessorSlot& slot) {
            auto obj = choc::value::createObject("ProcessorSlot");
            obj.addMember("processor_id", slot.processorId);
            obj.addMember("active", slot.active);
            auto parameters = choc::value::createEmptyArray();
            for (auto& [name, value] : slot.parameters) {
                auto p = choc::value::createObject("Parameter");
                p.addMember("name", name);
                p.addMember("value", serializeParameterValue(value));
                parameters.addArrayElement(p);
            }
            obj.addMember("parameters", parameters);
            return obj;
        }

        choc::value::Value serializeTrack(const TrackData& track) {
            auto obj = choc::value::createObject("Track");
            obj.addMember("name", track.name);

            auto notes = choc::value::createEmptyArray();
            for (auto& n : track.notes) {
                auto note = choc::value::createObject("Note");
                note.addMember("pitch", n.pitch);
                note.addMember("start_tick", static_cast<int64_t>(n.startTick));
                note.addMember("duration_ticks", static_cast<int64_t>(n.durationTicks));
                note.addMember("on_velocity", n.onVelocity);
                note.addMember("off_velocity", n.offVelocity);
                notes.addArrayElement(note);
            }
            obj.addMember("notes", notes);

            obj.addMember("source", serializeSlot(track.source));
            auto effects = choc::value::createEmptyArray();
            for (auto& e : track.effects)
                effects.addArrayElement(serializeSlot(e));
            obj.addMember("effects", effects);

            auto& m = track.mixer;
            auto mixer = choc::value::createObject("Mixer");
            mixer.addMember("volume_db", m.volumeDb);
            mixer.addMember("pan", m.pan);
            mixer.addMember("muted", m.muted);
            mixer.addMember("soloed", m.soloed);
            mixer.addMember("midi_channel", m.midiChannel);
            mixer.addMember("note_range_min", m.noteRangeMin);
            mixer.addMember("note_range_max", m.noteRangeMax);
            mixer.addMember("receive_live_input", m.receiveLiveInput);
            obj.addMember("mixer", mixer);
            return obj;
        }

        bool parseParameterValue(const choc::value::ValueView& v, ParameterValue& out) {
            if (v.isBool())
                out = v.getBool();
            else if (v.isInt())
                out = v.getInt64();
            else if (v.isFloat())
                out = v.getFloat64();
            else if (v.isString())
                out = std::string{v.getString()};
            else
                return false;
            return true;
        }

        ProcessorSlot parseSlot(const choc::value::ValueView& obj) {
            ProcessorSlot slot;
            if (obj.hasObjectMember("processor_id"))
                slot.processorId = std::string{obj["processor_id"].getString()};
            slot.active = obj["active"].getWithDefault<bool>(true);
            if (obj.hasObjectMember("parameters") && obj["parameters"].isArray()) {
                for (const auto& p : obj["parameters"]) {
                    if (!p.hasObjectMember("name"))
                        continue;
                    ParameterValue value;
                    if (parseParameterValue(p["value"], value))
                        slot.parameters[std::string{p["name"].getString()}] = std::move(value);
                }
            }
            return slot;
        }

        TrackData parseTrack(const choc::value::ValueView& obj, uint16_t major) {
            TrackData track;
            if (obj.hasObjectMember("name"))
                track.name = std::string{obj["name"].getString()};

            if (obj.hasObjectMember("notes") && obj["notes"].isArray()) {
                for (const auto& n : obj["notes"]) {
                    ScoredNote note;
                    note.pitch = std::clamp(n["pitch"].getWithDefault<int32_t>(note.pitch), 0, 127);
                    note.startTick = std::max<int64_t>(0, n["start_tick"].getWithDefault<int64_t>(note.startTick));
                    note.durationTicks = std::max<int64_t>(0, n["duration_ticks"].getWithDefault<int64_t>(note.durationTicks));
                    note.onVelocity = std::clamp(n["on_velocity"].getWithDefault<int32_t>(note.onVelocity), 1, 127);
                    note.offVelocity = std::clamp(n["off_velocity"].getWithDefault<int32_t>(note.offVelocity), 0, 127);
                    track.notes.push_back(note);
                }
            }

            if (obj.hasObjectMember("source"))
                track.source = parseSlot(obj["source"]);
            if (obj.hasObjectMember("effects") && obj["effects"].isArray())
                for (const auto& e : obj["effects"])
                    track.effects.push_back(parseSlot(e));

            if (obj.hasObjectMember("mixer")) {
                auto m = obj["mixer"];
                auto& mixer = track.mixer;
                mixer.volumeDb = m["volume_db"].getWithDefault<double>(mixer.volumeDb);
                if (major == 0)
                    mixer.pan = m["pan"].getWithDefault<double>(0.5) * 2.0 - 1.0;
                else
                    mixer.pan = m["pan"].getWithDefault<double>(mixer.pan);
                mixer.pan = std::clamp(mixer.pan, -1.0, 1.0);
                mixer.muted = m["muted"].getWithDefault<bool>(mixer.muted);
                mixer.soloed = m["soloed"].getWithDefault<bool>(mixer.soloed);
                mixer.midiChannel = std::clamp(m["midi_channel"].getWithDefault<int32_t>(mixer.midiChannel), 0, 15);
                mixer.noteRangeMin = std::clamp(m["note_range_min"].getWithDefault<int32_t>(mixer.noteRangeMin), 0, 127);
                mixer.noteRangeMax = std::clamp(m["note_range_max"].getWithDefault<int32_t>(mixer.noteRangeMax), 0, 127);
                mixer.receiveLiveInput = m["receive_live_input"].getWithDefault<bool>(mixer.receiveLiveInput);
            }
            return track;
        }

        uint16_t readUint16(const uint8_t* p) {
            return static_cast<uint16_t>(p[0] | (p[1] << 8));
        }
    }

    void ProjectWireFormat::writeHeader(std::vector<uint8_t>& out, uint16_t major, uint16_t minor) {
        out.insert(out.end(), std::begin(kMagic), std::end(kMagic));
        out.push_back(static_cast<uint8_t>(major & 0xFF));
        out.push_back(static_cast<uint8_t>(major >> 8));
        out.push_back(static_cast<uint8_t>(minor & 0xFF));
        out.push_back(static_cast<uint8_t>(minor >> 8));
    }

    std::vector<uint8_t> ProjectWireFormat::write(const ArrangementData& arrangement) {
        auto root = choc::value::createObject("Arrangement");
        root.addMember("name", arrangement.name);
        root.addMember("ticks_per_quarter_note", arrangement.ticksPerQuarterNote);
        root.addMember("default_bpm", arrangement.defaultBpm);
        root.addMember("default_numerator", arrangement.defaultNumerator);
        root.addMember("default_denominator", arrangement.defaultDenominator);
        root.addMember("length_ticks", static_cast<int64_t>(arrangement.lengthTicks));

        auto segments = choc::value::createEmptyArray();
        for (auto& s : arrangement.tempoSegments) {
            auto segment = choc::value::createObject("TempoSegment");
            segment.addMember("start_tick", static_cast<int64_t>(s.startTick));
            segment.addMember("bpm", s.bpm);
            segment.addMember("numerator", s.numerator);
            segment.addMember("denominator", s.denominator);
            segments.addArrayElement(segment);
        }
        root.addMember("tempo_segments", segments);

        auto tracks = choc::value::createEmptyArray();
        for (auto& t : arrangement.tracks)
            tracks.addArrayElement(serializeTrack(t));
        root.addMember("tracks", tracks);

        std::vector<uint8_t> bytes;
        writeHeader(bytes, kCurrentMajorVersion, kCurrentMinorVersion);
        ByteSink sink{bytes};
        root.serialise(sink);
        return bytes;
    }

    bool ProjectWireFormat::writeFile(const ArrangementData& arrangement, const std::filesystem::path& file) {
        auto bytes = write(arrangement);
        std::ofstream ofs(file, std::ios::binary);
        if (!ofs)
            return false;
        ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return ofs.good();
    }

    ProjectReadResult ProjectWireFormat::read(const uint8_t* data, size_t size) {
        ProjectReadResult result;
        if (!data || size < kHeaderSize || std::memcmp(data, kMagic, sizeof(kMagic)) != 0) {
            result.status = StatusCode::MALFORMED_DATA;
            result.error = "not a cadenza project (bad header)";
            return result;
        }
        result.majorVersion = readUint16(data + 4);
        result.minorVersion = readUint16(data + 6);
        if (result.majorVersion > kCurrentMajorVersion) {
            result.status = StatusCode::UNSUPPORTED_VERSION;
            result.error = std::format("project version {}.{} is newer than the supported {}.{}",
                                       result.majorVersion, result.minorVersion, kCurrentMajorVersion, kCurrentMinorVersion);
            return result;
        }

        auto arrangement = std::make_shared<ArrangementData>();
        try {
            choc::value::InputData input{data + kHeaderSize, data + size};
            auto root = choc::value::Value::deserialise(input);
            if (!root.isObject()) {
                result.status = StatusCode::MALFORMED_DATA;
                result.error = "project payload is not an object";
                return result;
            }

            auto& a = *arrangement;
            if (root.hasObjectMember("name"))
                a.name = std::string{root["name"].getString()};
            a.ticksPerQuarterNote = root["ticks_per_quarter_note"].getWithDefault<int32_t>(a.ticksPerQuarterNote);
            if (a.ticksPerQuarterNote <= 0)
                a.ticksPerQuarterNote = kDefaultTicksPerQuarterNote;
            a.defaultBpm = root["default_bpm"].getWithDefault<double>(a.defaultBpm);
            a.defaultNumerator = root["default_numerator"].getWithDefault<int32_t>(a.defaultNumerator);
            a.defaultDenominator = root["default_denominator"].getWithDefault<int32_t>(a.defaultDenominator);
            a.lengthTicks = std::max<int64_t>(0, root["length_ticks"].getWithDefault<int64_t>(a.lengthTicks));

            if (root.hasObjectMember("tempo_segments") && root["tempo_segments"].isArray()) {
                for (const auto& s : root["tempo_segments"]) {
                    TempoSegment segment;
                    segment.startTick = s["start_tick"].getWithDefault<int64_t>(segment.startTick);
                    segment.bpm = s["bpm"].getWithDefault<double>(a.defaultBpm);
                    segment.numerator = s["numerator"].getWithDefault<int32_t>(a.defaultNumerator);
                    segment.denominator = s["denominator"].getWithDefault<int32_t>(a.defaultDenominator);
                    a.tempoSegments.push_back(segment);
                }
            }

            if (root.hasObjectMember("tracks") && root["tracks"].isArray()) {
                auto tracks = root["tracks"];
                if (tracks.size() > static_cast<uint32_t>(kMaxTracks)) {
                    result.status = StatusCode::MALFORMED_DATA;
                    result.error = std::format("project has {} tracks, at most {} are supported", tracks.size(), kMaxTracks);
                    return result;
                }
                for (const auto& t : tracks)
                    a.tracks.push_back(parseTrack(t, result.majorVersion));
            }
        } catch (const choc::value::Error& e) {
            result.status = StatusCode::MALFORMED_DATA;
            result.error = std::format("project payload is corrupt: {}", e.description);
            return result;
        }

        result.success = true;
        result.migrated = result.majorVersion < kCurrentMajorVersion;
        result.arrangement = std::move(arrangement);
        return result;
    }

    ProjectReadResult ProjectWireFormat::readFile(const std::filesystem::path& file) {
        std::ifstream ifs(file, std::ios::binary);
        if (!ifs) {
            ProjectReadResult result;
            result.status = StatusCode::MALFORMED_DATA;
            result.error = std::format("cannot open {}", file.string());
            return result;
        }
        std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
        return read(bytes);
    }

}
