#include <algorithm>
#include <cmath>
#include <format>
#include <set>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    const ParameterSpec* ProcessorMetadata::findParameter(std::string_view name) const {
        for (auto& p : parameters)
            if (p.name == name)
                return &p;
        return nullptr;
    }

    const char* parameterTypeName(ParameterType type) {
        switch (type) {
            case ParameterType::Float: return "float";
            case ParameterType::Int: return "int";
            case ParameterType::Bool: return "bool";
            case ParameterType::Enum: return "enum";
        }
        return "unknown";
    }

    const char* processorCategoryName(ProcessorCategory category) {
        return category == ProcessorCategory::Source ? "source" : "effect";
    }

    std::string parameterValueToString(const ParameterValue& value) {
        if (auto d = std::get_if<double>(&value))
            return std::format("{}", *d);
        if (auto i = std::get_if<int64_t>(&value))
            return std::to_string(*i);
        if (auto b = std::get_if<bool>(&value))
            return *b ? "true" : "false";
        return std::get<std::string>(value);
    }

    static bool isNumeric(const ParameterValue& value, double& out) {
        if (auto d = std::get_if<double>(&value)) {
            out = *d;
            return true;
        }
        if (auto i = std::get_if<int64_t>(&value)) {
            out = static_cast<double>(*i);
            return true;
        }
        return false;
    }

    std::string validateParameterValue(const ParameterSpec& spec, const ParameterValue& value) {
        switch (spec.type) {
            case ParameterType::Float:
            case ParameterType::Int: {
                double v;
                if (!isNumeric(value, v))
                    return std::format("parameter '{}' expects a number", spec.name);
                if (!std::isfinite(v))
                    return std::format("parameter '{}' is not finite", spec.name);
                if (spec.type == ParameterType::Int && std::holds_alternative<double>(value) && v != std::floor(v))
                    return std::format("parameter '{}' expects an integer but got {}", spec.name, v);
                if (v < spec.minValue || v > spec.maxValue)
                    return std::format("parameter '{}' value {} is out of range [{}, {}]", spec.name, v, spec.minValue, spec.maxValue);
                return "";
            }
            case ParameterType::Bool:
                if (!std::holds_alternative<bool>(value))
                    return std::format("parameter '{}' expects a boolean", spec.name);
                return "";
            case ParameterType::Enum: {
                auto s = std::get_if<std::string>(&value);
                if (!s)
                    return std::format("parameter '{}' expects one of its enumeration values", spec.name);
                if (std::find(spec.enumValues.begin(), spec.enumValues.end(), *s) == spec.enumValues.end())
                    return std::format("parameter '{}' has no value '{}'", spec.name, *s);
                return "";
            }
        }
        return "unknown parameter type";
    }

    std::string validateMetadata(const ProcessorMetadata& metadata) {
        if (metadata.id.empty())
            return "processor id is empty";
        for (auto c : metadata.id)
            if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_'))
                return std::format("processor id '{}' must consist of uppercase letters, digits and underscores", metadata.id);
        if (metadata.displayName.empty())
            return std::format("processor '{}' has no display name", metadata.id);

        std::set<std::string_view> names;
        for (auto& p : metadata.parameters) {
            if (p.name.empty())
                return std::format("processor '{}' has an unnamed parameter", metadata.id);
            if (!names.insert(p.name).second)
                return std::format("processor '{}' declares parameter '{}' twice", metadata.id, p.name);
            switch (p.type) {
                case ParameterType::Float:
                case ParameterType::Int:
                    if (!(p.minValue < p.maxValue))
                        return std::format("parameter '{}' of '{}' needs min < max", p.name, metadata.id);
                    break;
                case ParameterType::Enum:
                    if (p.enumValues.empty())
                        return std::format("enum parameter '{}' of '{}' has no values", p.name, metadata.id);
                    break;
                case ParameterType::Bool:
                    break;
            }
            auto error = validateParameterValue(p, p.defaultValue);
            if (!error.empty())
                return std::format("default of {}: {}", metadata.id, error);
        }
        return "";
    }

    static const ParameterValue* findValue(const ParameterValues& values, std::string_view name) {
        auto it = values.find(name);
        return it == values.end() ? nullptr : &it->second;
    }

    double parameterAsDouble(const ParameterValues& values, std::string_view name, double fallback) {
        auto v = findValue(values, name);
        double result;
        return v && isNumeric(*v, result) ? result : fallback;
    }

    int64_t parameterAsInt(const ParameterValues& values, std::string_view name, int64_t fallback) {
        auto v = findValue(values, name);
        if (!v)
            return fallback;
        if (auto i = std::get_if<int64_t>(v))
            return *i;
        if (auto d = std::get_if<double>(v))
            return static_cast<int64_t>(std::llround(*d));
        return fallback;
    }

    bool parameterAsBool(const ParameterValues& values, std::string_view name, bool fallback) {
        auto v = findValue(values, name);
        if (!v)
            return fallback;
        if (auto b = std::get_if<bool>(v))
            return *b;
        double d;
        return isNumeric(*v, d) ? d >= 0.5 : fallback;
    }

    std::string_view parameterAsString(const ParameterValues& values, std::string_view name, std::string_view fallback) {
        auto v = findValue(values, name);
        if (!v)
            return fallback;
        auto s = std::get_if<std::string>(v);
        return s ? std::string_view{*s} : fallback;
    }

}
