/**
 * ************************************************************************
 *
 * @file Logger.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.2
 * @brief 渲染树日志封装
  - 基于 spdlog，控制台彩色输出 + 轮转文件输出
  - 调用点自动记录源码位置
  - 日志级别可由 PipelineConfig 调整
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <concepts>
#include <memory>
#include <source_location>
#include <vector>

namespace render
{
/**
 * @brief 在调用点捕获源码位置与格式串
 */
struct LogLocation
{
    spdlog::string_view_t fmt;
    std::source_location loc;

    template <typename T>
        requires std::convertible_to<T, spdlog::string_view_t>
    constexpr LogLocation(const T& s, std::source_location l = std::source_location::current()) : fmt(s), loc(l)
    {
    }
};

/**
 * @brief 进程级日志单例，所有 PipelineOwner 共用
 */
class Logger
{
    static constexpr size_t MAX_LOG_FILE_SIZE = 1024 * 1024 * 5; // 5MB
    static constexpr size_t MAX_LOG_FILE_COUNT = 1;

public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    template <typename... Args>
    static void warn(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::warn, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::info, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::err, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::debug, msg, std::forward<Args>(args)...);
    }

    /**
     * @brief 调整输出级别
     */
    static void setLevel(spdlog::level::level_enum level) { getInstance().m_logger->set_level(level); }

    [[nodiscard]] static spdlog::level::level_enum level() { return getInstance().m_logger->level(); }

private:
    Logger()
    {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%l] %n: %v%$");

        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "logs/render_tree.log", MAX_LOG_FILE_SIZE, MAX_LOG_FILE_COUNT);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%# %!] %v");

        std::vector<spdlog::sink_ptr> sinks{consoleSink, fileSink};
        m_logger = std::make_shared<spdlog::logger>("RenderTree", sinks.begin(), sinks.end());

        m_logger->set_level(spdlog::level::info);
        m_logger->flush_on(spdlog::level::warn);
    }

    template <typename... Args>
    void log_impl(spdlog::level::level_enum lvl, const LogLocation& msg, Args&&... args)
    {
        m_logger->log(
            spdlog::source_loc{msg.loc.file_name(), static_cast<int>(msg.loc.line()), msg.loc.function_name()},
            lvl,
            fmt::runtime(msg.fmt),
            std::forward<Args>(args)...);
    }

    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace render
