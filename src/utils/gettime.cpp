// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "utils/gettime.h"

namespace travel
{

Duration TimeKeeper::restart()
{
    const double ret = watch.elapsed().count();
    watch.reset();
    return Duration(ret);
}

void TimeKeeper::registerTime(const std::string& stage, double threshold)
{
    const Duration duration = restart();
    if (duration >= threshold)
    {
        registered_times.emplace_back(RegisteredTime{ stage, duration });
    }
}

Duration TimeKeeper::total() const
{
    return Duration(total_watch.elapsed().count());
}

} // namespace travel
