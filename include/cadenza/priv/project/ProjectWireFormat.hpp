#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "../common.hpp"
#include "../model/Arrangement.hpp"

namespace cadenza {

    struct ProjectReadResult {
        bool success{false};
        StatusCode status{StatusCode::OK};
        std::string error{};
        std::shared_ptr<ArrangementData> arrangement{};
        uint16_t majorVersion{0};
        uint16_t minorVersion{0};
        // True when the data was converted from an older major version.
        bool migrated{false};
    };

    // Binary project layout:
    //
    //   "CDZP"  uint16 major  uint16 minor   (little endian)
    //   choc::value binary serialisation of the arrangement object
    //
    // Every field in the payload is optional and falls back to the model defaults, so minor
    // versions can add fields in either direction. Major version 0 stored pan as 0..1 with
    // 0.5 at center; it is migrated on read. Newer major versions are refused.
    class ProjectWireFormat {
    public:
        static constexpr char kMagic[4] = {'C', 'D', 'Z', 'P'};
        static constexpr size_t kHeaderSize = 8;
        static constexpr uint16_t kCurrentMajorVersion = 1;
        static constexpr uint16_t kCurrentMinorVersion = 0;

        static std::vector<uint8_t> write(const ArrangementData& arrangement);
        static bool writeFile(const ArrangementData& arrangement, const std::filesystem::path& file);

        static ProjectReadResult read(const uint8_t* data, size_t size);
        static ProjectReadResult read(const std::vector<uint8_t>& bytes) { return read(bytes.data(), bytes.size()); }
        static ProjectReadResult readFile(const std::filesystem::path& file);

        // Writes just the header; the payload follows.
        static void writeHeader(std::vector<uint8_t>& out, uint16_t major, uint16_t minor);
    };

}
