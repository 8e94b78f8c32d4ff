#include "builder.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <xcbm/bus/remotebus.hpp>
#include <xcbm/core/error.hpp>
#include <xcbm/core/validate.hpp>

namespace xcbm
{

std::istream& operator>>(std::istream& in, CbmErrorNumber& number)
{
    std::string token;
    in >> token;
    boost::trim(token);

    unsigned int value = 0;
    try
    {
        value = std::stoul(token);
    }
    catch (const std::exception&)
    {
        throw boost::program_options::validation_error(boost::program_options::validation_error::invalid_option_value,
                                                       "ignore",
                                                       token);
    }

    number = (value <= 0xFF) ? to_error_number(static_cast<std::uint8_t>(value)) : CbmErrorNumber::UNKNOWN;
    if (number == CbmErrorNumber::UNKNOWN)
    {
        throw boost::program_options::validation_error(boost::program_options::validation_error::invalid_option_value,
                                                       "ignore",
                                                       token);
    }

    return in;
}

std::tuple<std::unique_ptr<Cbm>, Config> build_cbm(int argc, char** argv)
{
    // Command line parameters and their defaults
    std::string logfile = "xcbm.log";
    std::string core_logfile = "xcbm-core.log"; // Boost.Log output from the library
    bool tracing = false;
    Config config;

    try
    {
        namespace po = boost::program_options;
        po::options_description desc("Supported options");
        desc.add_options()("help", "Displays this information")("host", po::value<std::string>(), "Bus bridge host name")(
            "port", po::value<std::uint16_t>(), "Bus bridge TCP port")(
            "device", po::value<unsigned int>(), "Device number to address (8-30)")(
            "ignore", po::value<std::vector<CbmErrorNumber>>()->multitoken(), "Drive error numbers to accept after init")(
            "history", po::value<std::string>(), "Name of command history file")(
            "logfile", po::value<std::string>(), "Name of logfile")(
            "corelog", po::value<std::string>(), "Name of logfile for bus level activity")(
            "trace", po::value<bool>(), "Detailed (very verbose) logging?");
        po::positional_options_description p;
        p.add("device", 1); // A 'free' argument is the device number

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            std::cout << "xcbm v0.1" << std::endl << std::endl;
            std::cout << desc << std::endl;
            return { nullptr, config };
        }
        if (vm.count("host"))
        {
            config.host = vm["host"].as<std::string>();
        }
        if (vm.count("port"))
        {
            config.port = vm["port"].as<std::uint16_t>();
        }
        if (vm.count("device"))
        {
            const auto device = vm["device"].as<unsigned int>();
            if (device > 0xFF)
            {
                throw ValidationError(fmt::format("Device num must be between {} and {}", MIN_DEVICE_NUM, MAX_DEVICE_NUM));
            }
            config.device = *validate_device(static_cast<std::uint8_t>(device), DeviceValidation::DEFAULT);
        }
        if (vm.count("ignore"))
        {
            config.ignore_init_errors = vm["ignore"].as<std::vector<CbmErrorNumber>>();
        }
        if (vm.count("history"))
        {
            config.history_file = vm["history"].as<std::string>();
        }
        if (vm.count("logfile"))
        {
            logfile = vm["logfile"].as<std::string>();
        }
        if (vm.count("corelog"))
        {
            core_logfile = vm["corelog"].as<std::string>();
        }
        if (vm.count("trace"))
        {
            tracing = vm["trace"].as<bool>();
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
        return { nullptr, config };
    }

    // File sink for general logging (optionally with 'trace' messages included)
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logfile, true);
    file_sink->set_level(tracing ? spdlog::level::trace : spdlog::level::info);
    file_sink->set_pattern("[%H:%M:%S.%e %l] %v");
    // stderr sink for warnings and above
    auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    err_sink->set_level(spdlog::level::warn);
    err_sink->set_pattern("[%^%l%$] %v");
    // Combine sinks
    auto logger = std::make_shared<spdlog::logger>("xcbm", spdlog::sinks_init_list{ file_sink, err_sink });
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    // The library logs via Boost.Log; keep that out of the terminal
    namespace logging = boost::log;
    logging::add_common_attributes();
    logging::register_simple_formatter_factory<logging::trivial::severity_level, char>("Severity");
    logging::add_file_log(logging::keywords::file_name = core_logfile,
                          logging::keywords::auto_flush = true,
                          logging::keywords::format = "[%TimeStamp% %Severity%] %Message%");
    logging::core::get()->set_filter(logging::trivial::severity >=
                                     (tracing ? logging::trivial::trace : logging::trivial::info));

    spdlog::info("Connecting to bus bridge at {}:{}", config.host, config.port);

    // Every reset of the adapter reconnects with the same endpoint
    const auto host = config.host;
    const auto port = config.port;
    auto p_cbm = std::make_unique<Cbm>([host, port]() -> std::unique_ptr<IBus>
                                       { return std::make_unique<bus::RemoteBus>(host, port); });

    return { std::move(p_cbm), config };
}

} // namespace xcbm
