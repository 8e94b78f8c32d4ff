#include "cbm.hpp"

#include "error.hpp"

#include <algorithm>
#include <functional>
#include <mutex>
#include <string>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <fmt/core.h>

namespace
{
    // Reverses a bus verb (untalk, unlisten, close) if the transaction it belongs to is abandoned.  On the
    // success path the guard is dismissed and the verb is issued explicitly so that its failure propagates.
    class Undo final
    {
    public:
        Undo(std::string_view what, std::function<void()> action) : m_what(what), m_action(std::move(action))
        {
        }

        Undo(const Undo&) = delete;
        Undo& operator=(const Undo&) = delete;
        Undo(Undo&&) = delete;
        Undo& operator=(Undo&&) = delete;

        ~Undo()
        {
            if (!m_armed)
            {
                return;
            }
            BOOST_LOG_TRIVIAL(trace) << "Cleanup: " << m_what;
            try
            {
                m_action();
            }
            catch (const std::exception& e)
            {
                // The error which caused the unwinding is the one that matters
                BOOST_LOG_TRIVIAL(debug) << "Cleanup (" << m_what << ") failed: " << e.what();
            }
        }

        void dismiss()
        {
            m_armed = false;
        }

    private:
        std::string_view m_what;
        std::function<void()> m_action;
        bool m_armed = true;
    };

    std::string hex(const xcbm::Bytes& bytes)
    {
        std::string result;
        for (const auto b : bytes)
        {
            result += (boost::format(" %02X") % static_cast<unsigned int>(b)).str();
        }
        return result;
    }

    // The sequences below all assume that the caller holds the transport lock

    void send_command_locked(xcbm::IBus& bus, std::uint8_t device, const xcbm::Bytes& command)
    {
        const xcbm::DeviceChannel ctrl(device, xcbm::CHANNEL_CTRL);
        BOOST_LOG_TRIVIAL(trace) << "Command to " << ctrl << ':' << hex(command);

        bus.listen(ctrl);
        Undo unlisten("unlisten", [&bus]() { bus.unlisten(); });
        const auto written = bus.write(command);
        unlisten.dismiss();
        bus.unlisten();

        if (written != command.size())
        {
            throw xcbm::DeviceError::write_error(ctrl, fmt::format("Wrote {} of {} command bytes", written, command.size()));
        }
    }

    xcbm::CbmStatus get_status_locked(xcbm::IBus& bus, std::uint8_t device)
    {
        const xcbm::DeviceChannel ctrl(device, xcbm::CHANNEL_CTRL);

        bus.talk(ctrl);
        Undo untalk("untalk", [&bus]() { bus.untalk(); });
        const auto bytes = bus.read_until(xcbm::STATUS_BUFFER_SIZE, '\r');
        untalk.dismiss();
        bus.untalk();

        // A device which is present always has something to say on the command channel
        if (bytes.empty())
        {
            throw xcbm::DeviceError::no_device(device);
        }

        return xcbm::CbmStatus::parse(std::string(bytes.begin(), bytes.end()), device);
    }

    // After M-R the drive's command channel is left holding data which isn't a status message, and the next
    // status read is expected to fail to parse.  Absorb that here.
    void drain_status_locked(xcbm::IBus& bus, std::uint8_t device)
    {
        try
        {
            const auto status = get_status_locked(bus, device);
            BOOST_LOG_TRIVIAL(warning) << "Unexpectedly read a valid status after memory read from device "
                                       << static_cast<int>(device) << ": " << status;
        }
        catch (const xcbm::ParseError& e)
        {
            BOOST_LOG_TRIVIAL(trace) << "Status drain after memory read: " << e.what();
        }
        catch (const xcbm::Error& e)
        {
            throw xcbm::DeviceError::get_status_failure(device, e.what());
        }
    }

    xcbm::Bytes read_memory_locked(xcbm::IBus& bus, std::uint8_t device, std::uint16_t address, size_t size)
    {
        const xcbm::DeviceChannel ctrl(device, xcbm::CHANNEL_CTRL);
        if (size == 0)
        {
            return {};
        }

        // Once an M-R has gone out the drain must happen, even if a later step fails
        bool sent = false;
        Undo drain("status drain",
                   [&bus, device, &sent]()
                   {
                       if (sent)
                       {
                           drain_status_locked(bus, device);
                       }
                   });

        xcbm::Bytes result;
        result.reserve(size);
        for (size_t i = 0; i < size; ++i)
        {
            const auto a = static_cast<std::uint16_t>(address + i);
            send_command_locked(bus,
                                device,
                                { 'M', '-', 'R', static_cast<std::uint8_t>(a & 0xFF), static_cast<std::uint8_t>(a >> 8) });
            sent = true;

            bus.talk(ctrl);
            Undo untalk("untalk", [&bus]() { bus.untalk(); });
            const auto b = bus.read(1);
            untalk.dismiss();
            bus.untalk();

            if (b.size() != 1)
            {
                throw xcbm::DeviceError::read_error(ctrl, (boost::format("No data for memory read at %04X") % a).str());
            }
            result.push_back(b.front());
        }

        drain.dismiss();
        drain_status_locked(bus, device);

        BOOST_LOG_TRIVIAL(trace) << (boost::format("Memory %04X:") % address) << hex(result);
        return result;
    }

    xcbm::CbmStatus command_status_locked(xcbm::IBus& bus, std::uint8_t device, const xcbm::AsciiString& command)
    {
        send_command_locked(bus, device, command.to_petscii().bytes());
        return get_status_locked(bus, device);
    }

    void open_file_locked(xcbm::IBus& bus, const xcbm::DeviceChannel& dc, const xcbm::PetsciiString& filename)
    {
        BOOST_LOG_TRIVIAL(trace) << "Open " << dc << " \"" << filename << '"';

        bus.open(dc);
        Undo close("close", [&bus, &dc]() { bus.close(dc); });
        {
            Undo unlisten("unlisten", [&bus]() { bus.unlisten(); });
            const auto written = bus.write(filename.bytes());
            if (written != filename.size())
            {
                throw xcbm::DeviceError::write_error(dc, fmt::format("Wrote {} of {} filename bytes", written, filename.size()));
            }
            unlisten.dismiss();
            bus.unlisten();
        }

        get_status_locked(bus, dc.device()).check();
        close.dismiss();
    }

    // Talk, then read until the device has nothing more to send
    xcbm::Bytes read_all_locked(xcbm::IBus& bus, const xcbm::DeviceChannel& dc)
    {
        xcbm::Bytes data;

        bus.talk(dc);
        Undo untalk("untalk", [&bus]() { bus.untalk(); });
        while (true)
        {
            const auto chunk = bus.read(xcbm::BYTES_PER_BLOCK);
            if (chunk.empty())
            {
                break;
            }
            data.insert(data.end(), chunk.begin(), chunk.end());
        }
        untalk.dismiss();
        bus.untalk();

        BOOST_LOG_TRIVIAL(debug) << "Read " << data.size() << " bytes from " << dc;
        return data;
    }

    xcbm::Bytes open_read_close_locked(xcbm::IBus& bus, const xcbm::DeviceChannel& dc, const xcbm::PetsciiString& filename)
    {
        open_file_locked(bus, dc, filename);
        Undo close("close", [&bus, &dc]() { bus.close(dc); });
        auto data = read_all_locked(bus, dc);
        close.dismiss();
        bus.close(dc);
        return data;
    }

} // namespace

namespace xcbm
{

class Cbm::Private
{
public:
    explicit Private(BusFactory factory) : m_factory(std::move(factory)), m_p_bus(m_factory())
    {
    }

    // Caller must hold m_mutex
    IBus& bus()
    {
        if (!m_p_bus)
        {
            throw TransportError(TransportError::Kind::NO_HANDLE, "The bus transport is not open");
        }
        return *m_p_bus;
    }

    std::mutex m_mutex;
    BusFactory m_factory;
    std::unique_ptr<IBus> m_p_bus;
};

Cbm::Cbm(BusFactory factory) : m_private(std::make_shared<Private>(std::move(factory)))
{
}

Cbm::~Cbm() = default;

void Cbm::reset_bus()
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    BOOST_LOG_TRIVIAL(debug) << "Resetting the IEC bus";
    m_private->bus().reset();
}

void Cbm::usb_device_reset()
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    BOOST_LOG_TRIVIAL(debug) << "Reopening the bus transport";
    m_private->m_p_bus.reset();
    m_private->m_p_bus = m_private->m_factory();
}

CbmDeviceInfo Cbm::identify(std::uint8_t device)
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    auto& bus = m_private->bus();

    const auto read_magic = [&bus, device](std::uint16_t address)
    {
        const auto buf = read_memory_locked(bus, device, address, 2);
        return static_cast<std::uint16_t>(buf[0] | (buf[1] << 8));
    };

    const auto magic = read_magic(MAGIC_ADDRESS);
    std::optional<std::uint16_t> magic2;
    if (magic == MAGIC_154X_FAMILY)
    {
        // The 1540 and 1541 share an IRQ vector; if that's what we find, a further signature separates them
        const auto vector = read_magic(MAGIC_1541_ADDRESS);
        magic2 = (vector == MAGIC_154X_IRQ_VECTOR) ? read_magic(MAGIC_1540_ADDRESS) : vector;
    }
    else if (magic == MAGIC_1581_FAMILY)
    {
        magic2 = read_magic(MAGIC_FD_ADDRESS);
    }

    auto info = CbmDeviceInfo::from_magic(magic, magic2);
    BOOST_LOG_TRIVIAL(debug) << "Device " << static_cast<int>(device) << " identified as " << info;
    return info;
}

CbmStatus Cbm::get_status(std::uint8_t device)
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    return get_status_locked(m_private->bus(), device);
}

void Cbm::send_command(std::uint8_t device, const PetsciiString& command)
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    send_command_locked(m_private->bus(), device, command.bytes());
}

void Cbm::send_command_ascii(std::uint8_t device, const AsciiString& command)
{
    send_command(device, command.to_petscii());
}

void Cbm::send_string_command_ascii(std::uint8_t device, std::string_view command)
{
    send_command_ascii(device, AsciiString(command));
}

void Cbm::send_string_command_petscii(std::uint8_t device, std::string_view command)
{
    send_command(device, PetsciiString::from_raw(command));
}

CbmStatus Cbm::send_command_status(std::uint8_t device, const AsciiString& command)
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    return command_status_locked(m_private->bus(), device, command);
}

CbmStatus Cbm::format_disk(std::uint8_t device, const AsciiString& name, const AsciiString& id)
{
    if (id.size() != CbmDiskHeader::ID_LENGTH)
    {
        throw ValidationError(fmt::format("Disk ID must be {} characters", CbmDiskHeader::ID_LENGTH));
    }
    const AsciiString command(fmt::format("n0:{},{}", name.str(), id.str()));

    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    const auto status = command_status_locked(m_private->bus(), device, command);
    status.check();
    return status;
}

CbmStatus Cbm::delete_file(std::uint8_t device, const AsciiString& filename)
{
    const AsciiString command("s0:" + filename.str());

    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    const auto status = command_status_locked(m_private->bus(), device, command);
    status.check();
    return status;
}

CbmStatus Cbm::validate_disk(std::uint8_t device)
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    const auto status = command_status_locked(m_private->bus(), device, AsciiString("v"));
    status.check();
    return status;
}

void Cbm::open_file(const DeviceChannel& dc, const AsciiString& filename)
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    open_file_locked(m_private->bus(), dc, filename.to_petscii());
}

void Cbm::close_file(const DeviceChannel& dc)
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    m_private->bus().close(dc);
}

Bytes Cbm::load_file_petscii(std::uint8_t device, const PetsciiString& filename)
{
    const DeviceChannel dc(device, CHANNEL_LOAD);

    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    return open_read_close_locked(m_private->bus(), dc, filename);
}

Bytes Cbm::load_file_ascii(std::uint8_t device, const AsciiString& filename)
{
    return load_file_petscii(device, filename.to_petscii());
}

Bytes Cbm::read_file(const DeviceChannel& dc, const AsciiString& filename)
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    return open_read_close_locked(m_private->bus(), dc, filename.to_petscii());
}

void Cbm::write_file(const DeviceChannel& dc, const AsciiString& filename, const Bytes& data)
{
    // "@:" replaces any existing file of the same name
    const AsciiString open_name(fmt::format("@:{}{}{}", filename.str(), suffix(CbmFileType::PRG), suffix(CbmFileMode::WRITE)));

    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    auto& bus = m_private->bus();

    open_file_locked(bus, dc, open_name.to_petscii());
    Undo close("close", [&bus, &dc]() { bus.close(dc); });
    {
        bus.listen(dc);
        Undo unlisten("unlisten", [&bus]() { bus.unlisten(); });
        for (size_t offset = 0; offset < data.size(); offset += BYTES_PER_BLOCK)
        {
            const auto end = std::min<size_t>(offset + BYTES_PER_BLOCK, data.size());
            const Bytes chunk(data.begin() + static_cast<std::ptrdiff_t>(offset), data.begin() + static_cast<std::ptrdiff_t>(end));
            const auto written = bus.write(chunk);
            if (written != chunk.size())
            {
                throw DeviceError::write_error(dc, fmt::format("Wrote {} of {} bytes at offset {}", written, chunk.size(), offset));
            }
        }
        unlisten.dismiss();
        bus.unlisten();
    }
    close.dismiss();
    bus.close(dc);

    get_status_locked(bus, dc.device()).check();
    BOOST_LOG_TRIVIAL(debug) << "Wrote " << data.size() << " bytes to " << filename;
}

CbmDirListing Cbm::dir(std::uint8_t device, std::optional<std::uint8_t> drive_num)
{
    if (drive_num && (*drive_num > 1))
    {
        throw DeviceError::invalid_drive(device, *drive_num);
    }
    const auto filename = PetsciiString::from_ascii(drive_num ? fmt::format("${}", *drive_num) : std::string("$"));
    const DeviceChannel dc(device, CHANNEL_LOAD);

    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    auto& bus = m_private->bus();

    const auto bytes = open_read_close_locked(bus, dc, filename);
    get_status_locked(bus, device).check();

    return CbmDirListing::from_records(decode_directory(bytes));
}

Bytes Cbm::read_drive_memory(std::uint8_t device, std::uint16_t address, size_t size)
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    return read_memory_locked(m_private->bus(), device, address, size);
}

void Cbm::write_drive_memory(std::uint8_t device, std::uint16_t address, const Bytes& data)
{
    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    auto& bus = m_private->bus();
    for (size_t i = 0; i < data.size(); ++i)
    {
        const auto a = static_cast<std::uint16_t>(address + i);
        send_command_locked(bus,
                            device,
                            { 'M', '-', 'W', static_cast<std::uint8_t>(a & 0xFF), static_cast<std::uint8_t>(a >> 8), data[i] });
    }
}

bool Cbm::drive_exists(std::uint8_t device)
{
    const DeviceChannel ctrl(device, CHANNEL_CTRL);

    std::lock_guard<std::mutex> lock(m_private->m_mutex);
    auto& bus = m_private->bus();
    try
    {
        bus.listen(ctrl);
    }
    catch (const TransportError& e)
    {
        // This is how the adapter reports that nobody acknowledged the LISTEN
        if (e.kind() == TransportError::Kind::STATUS_VALUE)
        {
            BOOST_LOG_TRIVIAL(trace) << "No device " << static_cast<int>(device) << ": " << e.what();
            return false;
        }
        throw;
    }
    bus.unlisten();
    return true;
}

std::vector<std::pair<std::uint8_t, CbmDeviceInfo>> Cbm::scan_bus_range(std::uint8_t first, std::uint8_t last)
{
    std::vector<std::pair<std::uint8_t, CbmDeviceInfo>> result;
    for (unsigned int device = first; device <= last; ++device)
    {
        const auto d = static_cast<std::uint8_t>(device);
        if (!drive_exists(d))
        {
            continue;
        }
        try
        {
            auto info = identify(d);
            BOOST_LOG_TRIVIAL(info) << "Found device " << device << ": " << info;
            result.emplace_back(d, std::move(info));
        }
        catch (const DeviceError& e)
        {
            BOOST_LOG_TRIVIAL(warning) << "Skipping device " << device << ": " << e.what();
        }
    }
    return result;
}

std::vector<std::pair<std::uint8_t, CbmDeviceInfo>> Cbm::scan_bus()
{
    return scan_bus_range(MIN_DEVICE_NUM, MAX_DEVICE_NUM);
}

} // namespace xcbm
