#include <choc/text/choc_JSON.h>
#include <format>
#include <fstream>
#include <sstream>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    std::string EngineConfiguration::validate() const {
        if (!(sampleRate >= 8000.0 && sampleRate <= 384000.0))
            return std::format("sample_rate {} is outside 8000..384000", sampleRate);
        if (maxBlockFrames <= 0 || maxBlockFrames > 16384)
            return std::format("max_block_frames {} is outside 1..16384", maxBlockFrames);
        if (outputChannels == 0 || outputChannels > 64)
            return std::format("output_channels {} is outside 1..64", outputChannels);
        if (maxVoices <= 0 || maxVoices > 4096)
            return std::format("max_voices {} is outside 1..4096", maxVoices);
        if (!(preRenderSeconds > 0.0))
            return "pre_render_seconds must be positive";
        if (!(extensionChunkSeconds > 0.0))
            return "extension_chunk_seconds must be positive";
        if (extensionLeadSeconds < 0.0 || extensionLeadSeconds >= preRenderSeconds)
            return "extension_lead_seconds must be at least 0 and shorter than pre_render_seconds";
        if (static_cast<double>(maxBlockFrames) / sampleRate >= preRenderSeconds)
            return "pre_render_seconds must be longer than one block";
        if (extensionBudgetPerBlock < 0)
            return "extension_budget_per_block must not be negative";
        if (!(releaseSeconds > 0.0) || !(retriggerReleaseSeconds > 0.0))
            return "release times must be positive";
        if (inputQueueCapacity == 0)
            return "input_queue_capacity must be positive";
        if (masterVolumeDb > 24.0)
            return "master_volume_db must not exceed 24";
        return "";
    }

    VoiceEngineSettings EngineConfiguration::voiceSettings() const {
        return VoiceEngineSettings{
            .sampleRate = sampleRate,
            .maxBlockFrames = maxBlockFrames,
            .maxVoices = maxVoices,
            .preRenderSeconds = preRenderSeconds,
            .extensionChunkSeconds = extensionChunkSeconds,
            .extensionLeadSeconds = extensionLeadSeconds,
            .extensionBudgetPerBlock = extensionBudgetPerBlock,
            .extensionPolicy = extensionPolicy,
            .releaseSeconds = releaseSeconds,
            .retriggerReleaseSeconds = retriggerReleaseSeconds,
        };
    }

    std::string EngineConfiguration::toJson() const {
        auto root = choc::value::createObject("EngineConfiguration");
        root.addMember("sample_rate", sampleRate);
        root.addMember("max_block_frames", maxBlockFrames);
        root.addMember("output_channels", static_cast<int32_t>(outputChannels));
        root.addMember("max_voices", maxVoices);
        root.addMember("pre_render_seconds", preRenderSeconds);
        root.addMember("extension_chunk_seconds", extensionChunkSeconds);
        root.addMember("extension_lead_seconds", extensionLeadSeconds);
        root.addMember("extension_budget_per_block", extensionBudgetPerBlock);
        root.addMember("extension_policy", std::string{extensionPolicyName(extensionPolicy)});
        root.addMember("release_seconds", releaseSeconds);
        root.addMember("retrigger_release_seconds", retriggerReleaseSeconds);
        root.addMember("input_queue_capacity", static_cast<int32_t>(inputQueueCapacity));
        root.addMember("clip_mode", std::string{clipModeName(clipMode)});
        root.addMember("master_volume_db", masterVolumeDb);
        return choc::json::toString(root, true);
    }

    EngineConfigurationResult EngineConfigurationReader::parse(std::string_view json) {
        EngineConfigurationResult result;
        auto& c = result.configuration;
        try {
            auto root = choc::json::parse(json);
            if (!root.isObject())
                return {false, StatusCode::MALFORMED_DATA, "configuration root must be an object", {}};

            c.sampleRate = root["sample_rate"].getWithDefault<double>(c.sampleRate);
            c.maxBlockFrames = root["max_block_frames"].getWithDefault<int32_t>(c.maxBlockFrames);
            c.outputChannels = static_cast<uint32_t>(root["output_channels"].getWithDefault<int32_t>(static_cast<int32_t>(c.outputChannels)));
            c.maxVoices = root["max_voices"].getWithDefault<int32_t>(c.maxVoices);
            c.preRenderSeconds = root["pre_render_seconds"].getWithDefault<double>(c.preRenderSeconds);
            c.extensionChunkSeconds = root["extension_chunk_seconds"].getWithDefault<double>(c.extensionChunkSeconds);
            c.extensionLeadSeconds = root["extension_lead_seconds"].getWithDefault<double>(c.extensionLeadSeconds);
            c.extensionBudgetPerBlock = root["extension_budget_per_block"].getWithDefault<int32_t>(c.extensionBudgetPerBlock);
            c.releaseSeconds = root["release_seconds"].getWithDefault<double>(c.releaseSeconds);
            c.retriggerReleaseSeconds = root["retrigger_release_seconds"].getWithDefault<double>(c.retriggerReleaseSeconds);
            c.inputQueueCapacity = static_cast<uint32_t>(root["input_queue_capacity"].getWithDefault<int32_t>(static_cast<int32_t>(c.inputQueueCapacity)));
            c.masterVolumeDb = root["master_volume_db"].getWithDefault<double>(c.masterVolumeDb);

            if (root.hasObjectMember("extension_policy")) {
                auto policy = root["extension_policy"].getString();
                if (policy == "round-robin")
                    c.extensionPolicy = ExtensionPolicy::RoundRobin;
                else if (policy == "most-urgent")
                    c.extensionPolicy = ExtensionPolicy::MostUrgentFirst;
                else
                    return {false, StatusCode::INVALID_PARAMETER, std::format("unknown extension_policy '{}'", policy), {}};
            }
            if (root.hasObjectMember("clip_mode")) {
                auto mode = root["clip_mode"].getString();
                if (mode == "soft")
                    c.clipMode = ClipMode::Soft;
                else if (mode == "hard")
                    c.clipMode = ClipMode::Hard;
                else
                    return {false, StatusCode::INVALID_PARAMETER, std::format("unknown clip_mode '{}'", mode), {}};
            }
        } catch (const choc::json::ParseError& e) {
            return {false, StatusCode::MALFORMED_DATA, std::format("configuration is not valid JSON: {}", e.what()), {}};
        } catch (const choc::value::Error& e) {
            return {false, StatusCode::MALFORMED_DATA, std::format("configuration has an unexpected value type: {}", e.description), {}};
        }

        auto error = c.validate();
        if (!error.empty())
            return {false, StatusCode::INVALID_PARAMETER, error, {}};
        result.success = true;
        return result;
    }

    EngineConfigurationResult EngineConfigurationReader::read(const std::filesystem::path& file) {
        std::ifstream ifs(file);
        if (!ifs)
            return {false, StatusCode::MALFORMED_DATA, std::format("cannot open {}", file.string()), {}};
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return parse(buffer.str());
    }

    bool EngineConfigurationWriter::write(const EngineConfiguration& configuration, const std::filesystem::path& file) {
        std::ofstream ofs(file);
        if (!ofs)
            return false;
        ofs << configuration.toJson();
        return ofs.good();
    }

}
