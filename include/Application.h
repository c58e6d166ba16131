// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef APPLICATION_H
#define APPLICATION_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace travel
{
class ThreadPool;

/*!
 * A singleton class that serves as the starting point for all optimisation.
 *
 * This class is not responsible for the actual optimisation. It reads the
 * command line, sets up logging, owns the thread pool and maps fatal errors
 * to the exit status of the process.
 */
class Application
{
public:
    /*!
     * Thread pool for the solver invocations.
     */
    std::unique_ptr<ThreadPool> thread_pool;

    /*!
     * Gets the instance of this application class.
     */
    static Application& getInstance();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /*!
     * \brief Print to the log which call was given, with the command line arguments.
     */
    void printCall() const;

    /*!
     * \brief Print the usage of the command line to stdout.
     */
    void printHelp() const;

    /*!
     * \brief Start the program, checking the arguments and running the optimisation.
     * \param argc The number of arguments provided to the application.
     * \param argv The arguments provided to the application.
     * \return The exit status: 0 on success (even with layers that fell back), 1 for input or resource errors, 2 for configuration errors.
     */
    int run(const size_t argc, char** argv);

    /*!
     * \brief Start the global thread pool.
     *
     * \param nworkers The number of concurrent workers, including the main thread.
     */
    void startThreadPool(size_t nworkers);

    std::string instance_uuid;

protected:
    void printLicense() const;

    /*!
     * \brief Optimise one file with the given configuration.
     * \return The exit status.
     */
    int optimize(const std::filesystem::path& config_file, const std::filesystem::path& input);

    /*!
     * \brief Also write everything that's logged to a file.
     */
    void addLogFile(const std::filesystem::path& log_file);

private:
    size_t argc = 0;
    char** argv = nullptr;

    Application();

    ~Application();
};

} // namespace travel

#endif // APPLICATION_H
