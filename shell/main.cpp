// Interactive shell for poking at the drives on an IEC bus

#include "commands.hpp"
#include "writer.hpp"

#include <xcbm/builder/builder.hpp>
#include <xcbm/core/cbm.hpp>
#include <xcbm/core/config.hpp>
#include <xcbm/core/driveunit.hpp>
#include <xcbm/core/error.hpp>
#include <xcbm/core/validate.hpp>

#include <boost/algorithm/string/join.hpp>

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <tuple>

#include <replxx.hxx>
#include <spdlog/spdlog.h>

namespace
{
    // Generous upper bound for commands which take free text or lists of bytes
    const size_t MAX_ARGS = 32;

    template <typename T> T parse_number(const std::string& s, unsigned long limit, int base, const char* what)
    {
        char* p_end = nullptr;
        errno = 0;
        const auto value = std::strtoul(s.c_str(), &p_end, base);
        if (s.empty() || (*p_end != '\0') || (errno != 0) || (value > limit))
        {
            throw xcbm::ValidationError(std::string("Invalid ") + what + " '" + s + "'");
        }
        return static_cast<T>(value);
    }

    std::uint16_t parse_address(const std::string& s)
    {
        return parse_number<std::uint16_t>(s, 0xFFFF, 16, "address");
    }

    // What the session is connected to, and the command handlers which act on it
    class Session final
    {
    public:
        Session(xcbm::Cbm& cbm, xcbm::Config& config) : m_cbm(cbm), m_config(config), m_writer(std::cout)
        {
        }

        [[nodiscard]] std::uint8_t device() const
        {
            return m_config.device;
        }

        Outcome identify(const Words& /*args*/)
        {
            std::cout << m_cbm.identify(device()) << std::endl;
            return Outcome::CONTINUE;
        }

        Outcome status(const Words& /*args*/)
        {
            m_writer.status(m_cbm.get_status(device()));
            return Outcome::CONTINUE;
        }

        Outcome dir(const Words& args)
        {
            std::optional<std::uint8_t> drive_num;
            if (!args.empty())
            {
                drive_num = parse_number<std::uint8_t>(args[0], 0xFF, 10, "drive number");
            }
            m_writer.listing(m_cbm.dir(device(), drive_num));
            return Outcome::CONTINUE;
        }

        Outcome reset_bus(const Words& /*args*/)
        {
            m_cbm.reset_bus();
            return Outcome::CONTINUE;
        }

        Outcome reset_adapter(const Words& /*args*/)
        {
            m_cbm.usb_device_reset();
            return Outcome::CONTINUE;
        }

        Outcome command(const Words& args)
        {
            const xcbm::AsciiString text(boost::algorithm::join(args, " "));
            m_writer.status(m_cbm.send_command_status(device(), text));
            return Outcome::CONTINUE;
        }

        Outcome format(const Words& args)
        {
            m_writer.status(m_cbm.format_disk(device(), xcbm::AsciiString(args[0]), xcbm::AsciiString(args[1])));
            return Outcome::CONTINUE;
        }

        Outcome scratch(const Words& args)
        {
            m_writer.status(m_cbm.delete_file(device(), xcbm::AsciiString(args[0])));
            return Outcome::CONTINUE;
        }

        Outcome validate(const Words& /*args*/)
        {
            m_writer.status(m_cbm.validate_disk(device()));
            return Outcome::CONTINUE;
        }

        Outcome load(const Words& args)
        {
            const auto bytes = m_cbm.load_file_ascii(device(), xcbm::AsciiString(args[0]));
            std::cout << bytes.size() << " bytes" << std::endl;
            m_writer.dump(0, bytes);
            return Outcome::CONTINUE;
        }

        Outcome peek(const Words& args)
        {
            const auto base = parse_address(args[0]);
            const auto count = (args.size() > 1) ? parse_number<size_t>(args[1], 0x10000, 16, "count") : 16;
            m_writer.dump(base, m_cbm.read_drive_memory(device(), base, count));
            return Outcome::CONTINUE;
        }

        Outcome poke(const Words& args)
        {
            const auto base = parse_address(args[0]);
            xcbm::Bytes data;
            for (auto it = args.begin() + 1; it != args.end(); ++it)
            {
                data.push_back(parse_number<std::uint8_t>(*it, 0xFF, 16, "byte value"));
            }
            m_cbm.write_drive_memory(device(), base, data);
            return Outcome::CONTINUE;
        }

        Outcome scan(const Words& /*args*/)
        {
            m_writer.scan(m_cbm.scan_bus());
            return Outcome::CONTINUE;
        }

        Outcome init(const Words& /*args*/)
        {
            auto unit = xcbm::DriveUnit::try_from_bus(m_cbm, device());
            m_writer.init(unit.send_init(m_cbm, m_config.ignore_init_errors));
            return Outcome::CONTINUE;
        }

        Outcome unit(const Words& /*args*/)
        {
            auto unit = xcbm::DriveUnit::try_from_bus(m_cbm, device());
            const auto result = unit.dir(m_cbm);
            m_writer.unit(unit, result);
            return Outcome::CONTINUE;
        }

        Outcome select(const Words& args)
        {
            const auto value = parse_number<std::uint8_t>(args[0], 0xFF, 10, "device number");
            m_config.device = *xcbm::validate_device(value, xcbm::DeviceValidation::REQUIRED);
            return Outcome::CONTINUE;
        }

        Outcome print(const Words& /*args*/)
        {
            std::cout << "Device: " << static_cast<int>(device()) << std::endl;
            std::cout << "Bridge: " << m_config.host << ':' << m_config.port << std::endl;
            std::cout << "Ignored init errors:";
            for (const auto e : m_config.ignore_init_errors)
            {
                std::cout << ' ' << e;
            }
            std::cout << std::endl;
            return Outcome::CONTINUE;
        }

    private:
        xcbm::Cbm& m_cbm;
        xcbm::Config& m_config;
        Writer m_writer;
    };

    void register_commands(CommandTable& table, Session& session)
    {
        using Colour = replxx::Replxx::Color;
        const auto bind = [&session](Outcome (Session::*p_handler)(const Words&))
        { return [&session, p_handler](const Words& args) { return (session.*p_handler)(args); }; };

        // clang-format off
        table.add({ { "identify", "id" }, {}, 0, 0, "", "Identify the current device", Colour::DEFAULT, bind(&Session::identify) });
        table.add({ { "status", "s" }, {}, 0, 0, "", "Read the drive status", Colour::DEFAULT, bind(&Session::status) });
        table.add({ { "dir", "d" }, { "0", "1" }, 0, 1, "[0|1]", "List the directory, optionally of one drive", Colour::GREEN, bind(&Session::dir) });
        table.add({ { "reset", "r" }, {}, 0, 0, "", "Reset the IEC bus", Colour::RED, bind(&Session::reset_bus) });
        table.add({ { "usbreset", "u" }, {}, 0, 0, "", "Reconnect to the bus adapter", Colour::RED, bind(&Session::reset_adapter) });
        table.add({ { "command", "c" }, {}, 1, MAX_ARGS, "<text>", "Send a DOS command and show the status", Colour::DEFAULT, bind(&Session::command) });
        table.add({ { "format", "f" }, {}, 2, 2, "<name> <id>", "Format the disk", Colour::RED, bind(&Session::format) });
        table.add({ { "delete" }, {}, 1, 1, "<file>", "Scratch a file", Colour::RED, bind(&Session::scratch) });
        table.add({ { "validate" }, {}, 0, 0, "", "Validate the disk", Colour::DEFAULT, bind(&Session::validate) });
        table.add({ { "load" }, {}, 1, 1, "<file>", "Load a file and dump it", Colour::DEFAULT, bind(&Session::load) });
        table.add({ { "peek" }, {}, 1, 2, "<hexaddr> [<hexcount>]", "Dump drive memory", Colour::DEFAULT, bind(&Session::peek) });
        table.add({ { "poke" }, {}, 2, MAX_ARGS, "<hexaddr> <hexbyte>...", "Write drive memory", Colour::RED, bind(&Session::poke) });
        table.add({ { "scan" }, {}, 0, 0, "", "Find and identify every device on the bus", Colour::DEFAULT, bind(&Session::scan) });
        table.add({ { "init" }, {}, 0, 0, "", "Initialise each drive of the current unit", Colour::DEFAULT, bind(&Session::init) });
        table.add({ { "unit" }, {}, 0, 0, "", "List every drive of the current unit", Colour::GREEN, bind(&Session::unit) });
        table.add({ { "num" }, {}, 1, 1, "<8-30>", "Select the device to talk to", Colour::DEFAULT, bind(&Session::select) });
        table.add({ { "print", "p" }, {}, 0, 0, "", "Show the current settings", Colour::DEFAULT, bind(&Session::print) });
        table.add({ { "help", "h", "?" }, {}, 0, 0, "", "Show this information", Colour::DEFAULT,
                    [&table](const Words& /*args*/) { table.print_help(std::cout); return Outcome::CONTINUE; } });
        table.add({ { "quit", "q", "x", "exit" }, {}, 0, 0, "", "Leave the shell", Colour::RED,
                    [](const Words& /*args*/) { return Outcome::QUIT; } });
        // clang-format on
    }

    void run(xcbm::Cbm& cbm, xcbm::Config& config)
    {
        Session session(cbm, config);
        CommandTable table;
        register_commands(table, session);

        replxx::Replxx rx;
        rx.install_window_change_handler();
        rx.history_load(config.history_file);
        rx.set_max_history_size(256);
        rx.set_word_break_characters(" \t");
        rx.set_complete_on_empty(true);
        rx.set_completion_callback([&table](const std::string& input, int context_len)
                                   { return table.complete(input, context_len); });

        auto outcome = Outcome::CONTINUE;
        while (outcome == Outcome::CONTINUE)
        {
            const auto prompt = "xcbm " + std::to_string(session.device()) + "> ";
            const char* p_line = nullptr;
            do
            {
                p_line = rx.input(prompt);
            } while (!p_line && (errno == EAGAIN));

            if (!p_line)
            {
                break; // End of input
            }

            const std::string line(p_line);
            if (split_words(line).empty())
            {
                continue;
            }
            rx.history_add(line);
            outcome = table.dispatch(line);
        }

        rx.history_save(config.history_file);
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
        spdlog::error("Can't start: {}", e.what());
    }

    if (!p_cbm)
    {
        return EXIT_FAILURE;
    }

    run(*p_cbm, config);

    return EXIT_SUCCESS;
}
