// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "gcode/UnsupportedCommandLog.h"

#include <utility>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace travel
{

std::shared_ptr<UnsupportedCommandLog> UnsupportedCommandLog::toFile(const std::filesystem::path& path)
{
    constexpr bool truncate = true;
    return std::make_shared<UnsupportedCommandLog>(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), truncate));
}

UnsupportedCommandLog::UnsupportedCommandLog(std::shared_ptr<spdlog::sinks::sink> sink)
    : logger_(std::make_shared<spdlog::logger>("unsupported", std::move(sink)))
{
    logger_->set_pattern("%v");
    logger_->set_level(spdlog::level::info);
}

void UnsupportedCommandLog::record(size_t line_nr, std::string_view code, std::string_view line, std::string_view reason)
{
    const std::string key = code.empty() ? std::string("<none>") : std::string(code);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        count_++;
        per_code_[key]++;
    }
    logger_->info("line {}: {} ({})", line_nr, line, reason);
    spdlog::debug("Unsupported command {} at line {}", key, line_nr);
}

size_t UnsupportedCommandLog::count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

std::map<std::string, size_t> UnsupportedCommandLog::countPerCode() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return per_code_;
}

void UnsupportedCommandLog::flush()
{
    logger_->flush();
}

} // namespace travel
