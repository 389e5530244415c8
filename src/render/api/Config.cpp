#include "Config.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace render::config
{

std::expected<globalcontext::PipelineConfig, ConfigError> LoadPipelineConfig(const nlohmann::json& json)
{
    if (!json.is_object()) return std::unexpected(ConfigError::NotAnObject);

    globalcontext::PipelineConfig config;
    if (json.contains("maxLayoutIterations"))
    {
        const auto& value = json.at("maxLayoutIterations");
        if (!value.is_number_integer()) return std::unexpected(ConfigError::InvalidType);
        const auto iterations = value.get<std::int64_t>();
        if (iterations <= 0 || iterations > std::numeric_limits<uint32_t>::max())
        {
            return std::unexpected(ConfigError::InvalidValue);
        }
        config.maxLayoutIterations = static_cast<uint32_t>(iterations);
    }
    if (json.contains("logLevel"))
    {
        const auto& value = json.at("logLevel");
        if (!value.is_string()) return std::unexpected(ConfigError::InvalidType);
        const auto name = value.get<std::string>();
        const auto level = spdlog::level::from_str(name);
        // from_str 对未知名称返回 off
        if (level == spdlog::level::off && name != "off") return std::unexpected(ConfigError::UnknownLogLevel);
        config.logLevel = level;
    }
    if (json.contains("checkGeometry"))
    {
        const auto& value = json.at("checkGeometry");
        if (!value.is_boolean()) return std::unexpected(ConfigError::InvalidType);
        config.checkGeometry = value.get<bool>();
    }
    return config;
}

nlohmann::json ToJson(const globalcontext::PipelineConfig& config)
{
    const auto levelName = spdlog::level::to_string_view(config.logLevel);
    return {{"maxLayoutIterations", config.maxLayoutIterations},
            {"logLevel", std::string(levelName.data(), levelName.size())},
            {"checkGeometry", config.checkGeometry}};
}

} // namespace render::config
