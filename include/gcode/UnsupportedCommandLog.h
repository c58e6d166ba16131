// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GCODE_UNSUPPORTED_COMMAND_LOG_H
#define GCODE_UNSUPPORTED_COMMAND_LOG_H

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>

namespace travel
{

/*!
 * \brief Append-only record of the input lines the parser didn't recognise, for the operator to review.
 *
 * Can be written to from several threads at once.
 */
class UnsupportedCommandLog
{
public:
    /*!
     * Log to a file, truncating it if it exists.
     */
    static std::shared_ptr<UnsupportedCommandLog> toFile(const std::filesystem::path& path);

    /*!
     * \param sink Where the lines go. Should be one of the thread-safe (_mt) spdlog sinks.
     */
    explicit UnsupportedCommandLog(std::shared_ptr<spdlog::sinks::sink> sink);

    UnsupportedCommandLog(const UnsupportedCommandLog&) = delete;
    UnsupportedCommandLog& operator=(const UnsupportedCommandLog&) = delete;

    /*!
     * Record an unrecognised line.
     * \param line_nr The 1-based line number in the input.
     * \param code The code at the start of the line, if one could be read.
     * \param line The raw line.
     * \param reason Why it wasn't recognised.
     */
    void record(size_t line_nr, std::string_view code, std::string_view line, std::string_view reason);

    //! Number of lines recorded so far.
    [[nodiscard]] size_t count() const;

    //! How many times each code was recorded.
    [[nodiscard]] std::map<std::string, size_t> countPerCode() const;

    void flush();

private:
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    size_t count_ = 0;
    std::map<std::string, size_t> per_code_;
};

} // namespace travel

#endif // GCODE_UNSUPPORTED_COMMAND_LOG_H
