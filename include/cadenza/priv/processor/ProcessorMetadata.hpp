#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cadenza {

    // Parameters are addressed by name. Lookups accept std::string_view so that
    // processors can query them on the render thread without building strings.
    using ParameterValue = std::variant<double, int64_t, bool, std::string>;
    using ParameterValues = std::map<std::string, ParameterValue, std::less<>>;

    enum class ParameterType {
        Float,
        Int,
        Bool,
        Enum
    };

    enum class ProcessorCategory {
        Source,
        Effect
    };

    struct ParameterSpec {
        std::string name;
        ParameterType type{ParameterType::Float};
        ParameterValue defaultValue{0.0};
        double minValue{0.0};
        double maxValue{1.0};
        std::vector<std::string> enumValues{};
        std::string unit{};
        std::string description{};
    };

    struct ProcessorMetadata {
        std::string id;
        std::string displayName;
        ProcessorCategory category{ProcessorCategory::Source};
        std::vector<ParameterSpec> parameters{};
        // Stateful processors keep internal buffers (delay lines, filter memory) and get one instance per track.
        bool stateful{false};

        const ParameterSpec* findParameter(std::string_view name) const;
    };

    const char* parameterTypeName(ParameterType type);
    const char* processorCategoryName(ProcessorCategory category);

    // Returns an empty string when the metadata is well-formed, otherwise the first problem found.
    std::string validateMetadata(const ProcessorMetadata& metadata);
    // Checks one value against its spec (type, range, enum membership). Empty string means valid.
    std::string validateParameterValue(const ParameterSpec& spec, const ParameterValue& value);

    std::string parameterValueToString(const ParameterValue& value);

    // Typed accessors with fallbacks. Numeric values convert between double and int64.
    double parameterAsDouble(const ParameterValues& values, std::string_view name, double fallback);
    int64_t parameterAsInt(const ParameterValues& values, std::string_view name, int64_t fallback);
    bool parameterAsBool(const ParameterValues& values, std::string_view name, bool fallback);
    std::string_view parameterAsString(const ParameterValues& values, std::string_view name, std::string_view fallback);

}
