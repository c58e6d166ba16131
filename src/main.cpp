// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include <iostream> //To change the formatting of std::cerr.
#include <signal.h> //For floating point exceptions.
#if defined(__linux__) || (defined(__APPLE__) && defined(__MACH__))
#include <sys/resource.h> //For setpriority.
#endif

#include <cstdlib>

#include <spdlog/spdlog.h>

#include "Application.h"

namespace travel
{

// Signal handler for a "floating point exception", which can also be integer division by zero errors.
void signal_FPE(int n)
{
    (void)n;
    spdlog::error("Arithmetic exception.");
    exit(1);
}

} // namespace travel

int main(int argc, char** argv)
{
#if defined(__linux__) || (defined(__APPLE__) && defined(__MACH__))
    // Lower the process priority on linux and mac. The solvers inherit it.
    setpriority(PRIO_PROCESS, 0, 10);
#endif

#ifndef DEBUG
    signal(SIGFPE, travel::signal_FPE);
#endif
    std::cerr << std::boolalpha;

    return travel::Application::getInstance().run(argc, argv);
}
