// Repeatedly reads the status of one drive until interrupted, as a soak test of the bus and adapter

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <tuple>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <xcbm/builder/builder.hpp>
#include <xcbm/core/cbm.hpp>
#include <xcbm/core/config.hpp>
#include <xcbm/core/error.hpp>

namespace
{
    std::atomic<bool> g_stop{ false };

    void on_signal(int /*signal*/)
    {
        g_stop = true;
    }

} // namespace

int main(int argc, char* argv[])
{
    std::unique_ptr<xcbm::Cbm> p_cbm;
    xcbm::Config config;
    try
    {
        std::tie(p_cbm, config) = xcbm::build_cbm(argc, argv);
    }
    catch (const std::exception& e)
    {
        spdlog::error("Exception: {}", e.what());
    }

    if (!p_cbm)
    {
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, on_signal);

    std::uint64_t successes = 0;
    std::uint64_t failures = 0;
    while (!g_stop)
    {
        try
        {
            const auto status = p_cbm->get_status(config.device);
            spdlog::debug("Status: {}", status.as_str());
            ++successes;
        }
        catch (const xcbm::Error& e)
        {
            spdlog::warn("Status failed: {}", e.what());
            ++failures;
        }

        std::cout << fmt::format("\rSuccesses: {:<20} Failures: {:<20}", successes, failures) << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::cout << std::endl;
    spdlog::info("Finished with {} successes and {} failures", successes, failures);

    return (failures == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
