/**
 * ************************************************************************
 *
 * @file Config.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 管线配置加载
 *
 * JSON 对象的键与 PipelineConfig 字段同名，未知键忽略，缺省键保持默认值：
 * {"maxLayoutIterations": 16, "logLevel": "info", "checkGeometry": true}
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include "../common/GlobalContext.hpp"

namespace render::config
{

enum class ConfigError : std::uint8_t
{
    NotAnObject,
    InvalidType,
    InvalidValue,
    UnknownLogLevel
};

std::expected<globalcontext::PipelineConfig, ConfigError> LoadPipelineConfig(const nlohmann::json& json);

[[nodiscard]] nlohmann::json ToJson(const globalcontext::PipelineConfig& config);

} // namespace render::config
