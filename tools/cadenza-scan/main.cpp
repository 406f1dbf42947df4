#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <ostream>
#include <vector>

#include <cpptrace/from_current.hpp>
#include <cxxopts.hpp>
#include <cadenza/cadenza.hpp>

class CadenzaScan {

void listProcessors(cadenza::ProcessorRegistry& registry) {
    for (auto category : {cadenza::ProcessorCategory::Source, cadenza::ProcessorCategory::Effect}) {
        auto ids = registry.processorIds(category);
        std::sort(ids.begin(), ids.end());
        std::cout << cadenza::processorCategoryName(category) << "s:" << std::endl;
        for (auto& id : ids) {
            auto meta = registry.metadata(id);
            if (!meta)
                continue;
            std::cout << "  " << meta->id << " : " << meta->displayName << (meta->stateful ? " (stateful)" : "") << std::endl;
            for (auto& p : meta->parameters) {
                std::cout << "    " << p.name << " [" << cadenza::parameterTypeName(p.type) << "] default "
                          << cadenza::parameterValueToString(p.defaultValue);
                if (p.type == cadenza::ParameterType::Enum) {
                    std::cout << " {";
                    for (size_t i = 0; i < p.enumValues.size(); i++)
                        std::cout << (i > 0 ? ", " : "") << p.enumValues[i];
                    std::cout << "}";
                } else if (p.type != cadenza::ParameterType::Bool)
                    std::cout << " (" << p.minValue << " .. " << p.maxValue << (p.unit.empty() ? "" : " ") << p.unit << ")";
                std::cout << std::endl;
            }
        }
    }
}

void printSummary(const cadenza::ProjectReadResult& project) {
    auto& a = *project.arrangement;
    std::cout << "Project: " << a.name << " (format " << project.majorVersion << "." << project.minorVersion
              << (project.migrated ? ", migrated" : "") << ")" << std::endl;
    std::cout << "  ticks per quarter note: " << a.ticksPerQuarterNote << ", default tempo " << a.defaultBpm << " BPM "
              << a.defaultNumerator << "/" << a.defaultDenominator << std::endl;
    std::cout << "  tempo segments: " << a.tempoSegments.size() << std::endl;

    auto tempoMap = cadenza::TempoMap::fromArrangement(a);
    auto end = a.contentEndTick();
    std::cout << "  length: " << end << " ticks, " << tempoMap.secondsAtTick(end) << " seconds" << std::endl;

    for (size_t t = 0; t < a.tracks.size(); t++) {
        auto& track = a.tracks[t];
        std::cout << "  [" << t << "] " << track.name << " : " << track.notes.size() << " notes, source "
                  << (track.source.processorId.empty() ? "(none)" : track.source.processorId);
        for (auto& e : track.effects)
            std::cout << " -> " << e.processorId << (e.active ? "" : " (inactive)");
        std::cout << std::endl;
    }
}

int render(cadenza::RenderEngine& engine, double seconds) {
    auto& config = engine.configuration();
    auto channels = config.outputChannels;
    std::vector<std::vector<float>> buffers(channels, std::vector<float>(static_cast<size_t>(config.maxBlockFrames)));
    std::vector<float*> outputs;
    for (auto& b : buffers)
        outputs.push_back(b.data());

    auto totalFrames = static_cast<int64_t>(seconds * config.sampleRate);
    float peak = 0;
    engine.play(0);
    for (int64_t done = 0; done < totalFrames; done += config.maxBlockFrames) {
        auto frames = static_cast<int32_t>(std::min<int64_t>(config.maxBlockFrames, totalFrames - done));
        auto status = engine.processAudio(outputs.data(), channels, frames);
        if (status != cadenza::StatusCode::OK) {
            std::cerr << "Rendering failed: " << cadenza::statusCodeName(status) << std::endl;
            return EXIT_FAILURE;
        }
        for (auto& b : buffers)
            for (int32_t i = 0; i < frames; i++)
                peak = std::max(peak, std::abs(b[i]));
        engine.collectGarbage();
    }
    engine.stop();

    auto stats = engine.statistics();
    std::cout << "Rendered " << seconds << " seconds, peak " << peak << ", playhead at tick " << engine.playheadTick() << std::endl;
    std::cout << "  blocks: " << stats.blocksRendered << ", source render calls: " << stats.sourceRenderCalls << std::endl;
    std::cout << "  render failures: " << stats.renderFailures << ", timing violations: " << stats.timingViolations
              << ", evictions: " << stats.voiceEvictions << ", underruns: " << stats.underruns << std::endl;
    return EXIT_SUCCESS;
}

public:
int run(int argc, const char* argv[]) {
    cxxopts::Options options("cadenza-scan", "inspect processors and cadenza projects, and render them offline.");
    options.add_options()
        ("h,help", "print this help message")
        ("l,list", "List the available processors and their parameters")
        ("p,project", "Project file to inspect", cxxopts::value<std::string>())
        ("r,render-seconds", "Render the project offline for this many seconds", cxxopts::value<double>())
        ("c,config", "Engine configuration JSON file", cxxopts::value<std::string>())
    ;
    auto parsedOpts = options.parse(argc, argv);

    if (parsedOpts.contains("h") || (!parsedOpts.contains("l") && !parsedOpts.contains("p"))) {
        std::cerr << options.help();
        return parsedOpts.contains("h") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    std::shared_ptr<cadenza::ProcessorRegistry> registry = cadenza::ProcessorRegistry::createWithBuiltins();
    if (parsedOpts.contains("l"))
        listProcessors(*registry);

    if (!parsedOpts.contains("p"))
        return EXIT_SUCCESS;

    auto projectFile = parsedOpts["p"].as<std::string>();
    auto project = cadenza::ProjectWireFormat::readFile(projectFile);
    if (!project.success) {
        std::cerr << "Could not read " << projectFile << ": " << project.error
                  << " (" << cadenza::statusCodeName(project.status) << ")" << std::endl;
        return EXIT_FAILURE;
    }
    printSummary(project);

    cadenza::EngineConfiguration config{};
    if (parsedOpts.contains("c")) {
        auto configFile = parsedOpts["c"].as<std::string>();
        auto loaded = cadenza::EngineConfigurationReader::read(configFile);
        if (!loaded.success) {
            std::cerr << "Could not read " << configFile << ": " << loaded.error << std::endl;
            return EXIT_FAILURE;
        }
        config = loaded.configuration;
    }

    auto engine = cadenza::RenderEngine::create(config, registry);
    if (!engine) {
        std::cerr << "Invalid engine configuration: " << config.validate() << std::endl;
        return EXIT_FAILURE;
    }
    auto load = engine->loadArrangement(project.arrangement);
    if (!load.success) {
        std::cerr << "Could not load the arrangement: " << load.error << std::endl;
        return EXIT_FAILURE;
    }
    for (auto& e : load.trackErrors)
        std::cout << "  track " << e.trackIndex << " is silent: " << e.error << std::endl;
    std::cout << "  " << load.activeTrackCount << " of " << project.arrangement->tracks.size() << " tracks active" << std::endl;

    if (!parsedOpts.contains("r"))
        return EXIT_SUCCESS;
    return render(*engine, parsedOpts["r"].as<double>());
}

};

int main(int argc, const char* argv[]) {
    CPPTRACE_TRY {
        CadenzaScan scan{};
        return scan.run(argc, argv);
    } CPPTRACE_CATCH(const std::exception& e) {
        std::cerr << "Exception in main: " << e.what() << std::endl;
        cpptrace::from_current_exception().print();
        return EXIT_FAILURE;
    }
}
