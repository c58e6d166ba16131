// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GETTIME_H
#define GETTIME_H

#include <chrono>
#include <string>
#include <vector>

#include <spdlog/stopwatch.h>

#include "settings/types/Duration.h"

namespace travel
{

/*!
 * Measures how long the stages of a run take.
 */
class TimeKeeper
{
public:
    struct RegisteredTime
    {
        std::string stage;
        Duration duration;
    };

    using RegisteredTimes = std::vector<RegisteredTime>;

private:
    spdlog::stopwatch watch;
    spdlog::stopwatch total_watch;
    RegisteredTimes registered_times;

public:
    //! Time since the last restart, after which the clock restarts.
    Duration restart();

    //! Record the time since the last restart as the duration of a stage.
    void registerTime(const std::string& stage, double threshold = 0.01);

    //! Time since the TimeKeeper was created.
    Duration total() const;

    const RegisteredTimes& getRegisteredTimes() const
    {
        return registered_times;
    }
};

} // namespace travel
#endif // GETTIME_H
