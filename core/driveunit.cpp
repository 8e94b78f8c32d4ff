#include "driveunit.hpp"

#include "error.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include <boost/log/trivial.hpp>
#include <fmt/core.h>

namespace
{
    // Marks a unit as busy for the lifetime of one operation
    class Busy final
    {
    public:
        explicit Busy(bool& flag) : m_flag(flag)
        {
            m_flag = true;
        }

        Busy(const Busy&) = delete;
        Busy& operator=(const Busy&) = delete;
        Busy(Busy&&) = delete;
        Busy& operator=(Busy&&) = delete;

        ~Busy()
        {
            m_flag = false;
        }

    private:
        bool& m_flag;
    };

} // namespace

namespace xcbm
{

// Holds a channel for the duration of one operation
class DriveUnit::Lease final
{
public:
    // Channels below lowest are passed over; the drive treats 0 and 1 as LOAD and SAVE whatever the filename says
    Lease(ChannelManager& channels, ChannelPurpose purpose, std::uint8_t device, std::uint8_t lowest = 0)
        : m_channels(channels)
    {
        std::vector<std::uint8_t> passed_over;
        auto channel = m_channels.allocate(purpose);
        while (channel && (*channel < lowest))
        {
            passed_over.push_back(*channel);
            channel = m_channels.allocate(purpose);
        }
        for (const auto c : passed_over)
        {
            m_channels.free(c);
        }
        if (!channel)
        {
            std::ostringstream ss;
            ss << "Device " << static_cast<int>(device) << ": no free channel for " << purpose;
            throw Error(ss.str());
        }
        m_channel = *channel;
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&&) = delete;
    Lease& operator=(Lease&&) = delete;

    ~Lease()
    {
        m_channels.free(m_channel);
    }

    [[nodiscard]] std::uint8_t channel() const
    {
        return m_channel;
    }

private:
    ChannelManager& m_channels;
    std::uint8_t m_channel = 0;
};

bool DriveResult::ok() const
{
    return m_status.has_value() && !m_error;
}

void DriveResult::rethrow() const
{
    if (m_error)
    {
        std::rethrow_exception(m_error);
    }
}

DriveUnit::DriveUnit(std::uint8_t device, CbmDeviceInfo info) : m_device(device), m_info(std::move(info))
{
}

DriveUnit DriveUnit::try_from_bus(Cbm& cbm, std::uint8_t device)
{
    if (!cbm.drive_exists(device))
    {
        throw DeviceError::no_device(device);
    }
    return DriveUnit(device, cbm.identify(device));
}

std::uint8_t DriveUnit::device() const
{
    return m_device;
}

const CbmDeviceInfo& DriveUnit::info() const
{
    return m_info;
}

std::uint8_t DriveUnit::num_disk_drives() const
{
    return xcbm::num_disk_drives(m_info.m_device_type);
}

bool DriveUnit::is_busy() const
{
    return m_busy;
}

const ChannelManager& DriveUnit::channels() const
{
    return m_channels;
}

CbmStatus DriveUnit::get_status(Cbm& cbm)
{
    Busy busy(m_busy);
    return cbm.get_status(m_device);
}

std::vector<DriveResult> DriveUnit::send_init(Cbm& cbm, const std::vector<CbmErrorNumber>& ignore)
{
    Busy busy(m_busy);

    std::vector<DriveResult> results;
    for (std::uint8_t drive = 0; drive < num_disk_drives(); ++drive)
    {
        DriveResult result{ .m_drive_num = drive, .m_status = {}, .m_error = {} };
        try
        {
            const auto status = cbm.send_command_status(m_device, AsciiString(fmt::format("i{}", drive)));
            if ((status.is_ok() == StatusClass::OK) ||
                (std::find(ignore.begin(), ignore.end(), status.error_number()) != ignore.end()))
            {
                if (status.is_ok() != StatusClass::OK)
                {
                    BOOST_LOG_TRIVIAL(debug) << "Ignoring init status for drive " << static_cast<int>(drive) << ": "
                                             << status;
                }
                result.m_status = status;
            }
            else
            {
                result.m_error = std::make_exception_ptr(StatusError(status));
            }
        }
        catch (const Error& e)
        {
            BOOST_LOG_TRIVIAL(debug) << "Init of drive " << static_cast<int>(drive) << " failed: " << e.what();
            result.m_error = std::current_exception();
        }
        results.push_back(std::move(result));
    }
    return results;
}

DirResult DriveUnit::dir(Cbm& cbm)
{
    Busy busy(m_busy);

    std::vector<CbmDirListing> listings;
    std::optional<CbmStatus> first_status_error;

    const auto drives = num_disk_drives();
    for (std::uint8_t drive = 0; drive < drives; ++drive)
    {
        // Single drive units don't necessarily understand "$0"
        const auto drive_num = (drives > 1) ? std::optional<std::uint8_t>(drive) : std::nullopt;
        try
        {
            listings.push_back(cbm.dir(m_device, drive_num));
        }
        catch (const DeviceError& e)
        {
            BOOST_LOG_TRIVIAL(warning) << "Skipping drive " << static_cast<int>(drive) << " of device "
                                       << static_cast<int>(m_device) << ": " << e.what();
        }
        catch (const StatusError& e)
        {
            BOOST_LOG_TRIVIAL(debug) << "Directory of drive " << static_cast<int>(drive) << " failed: " << e.what();
            if (!first_status_error)
            {
                first_status_error = e.status();
            }
        }
    }

    if (first_status_error)
    {
        return DirResult{ .m_listings = std::move(listings), .m_status = *first_status_error };
    }
    return DirResult{ .m_listings = std::move(listings), .m_status = cbm.get_status(m_device) };
}

Bytes DriveUnit::read_file(Cbm& cbm, const AsciiString& filename)
{
    Busy busy(m_busy);
    Lease lease(m_channels, ChannelPurpose::FILE_READ, m_device, CHANNEL_FILE);
    return cbm.read_file(DeviceChannel(m_device, lease.channel()), filename);
}

void DriveUnit::write_file(Cbm& cbm, const AsciiString& filename, const Bytes& data)
{
    Busy busy(m_busy);
    Lease lease(m_channels, ChannelPurpose::FILE_WRITE, m_device, CHANNEL_FILE);
    cbm.write_file(DeviceChannel(m_device, lease.channel()), filename, data);
}

void DriveUnit::reset()
{
    m_channels.reset();
}

std::ostream& operator<<(std::ostream& os, const DriveUnit& unit)
{
    return os << "Drive " << static_cast<int>(unit.device()) << " (" << unit.info().m_device_type << ')';
}

} // namespace xcbm
