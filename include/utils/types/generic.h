// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef TRAVEL_OPTIMIZER_GENERIC_H
#define TRAVEL_OPTIMIZER_GENERIC_H

#include <concepts>

namespace travel::utils
{
// clang-format off
template<typename Tp>
concept integral = std::integral<Tp>;

template<typename Tp>
concept floating_point = std::floating_point<Tp>;
// clang-format on

} // namespace travel::utils

#endif // TRAVEL_OPTIMIZER_GENERIC_H
