#include <cstdint>
#include <ostream>
#include <string>

#include <boost/format.hpp>

#include <xcbm/core/error.hpp>

#include "writer.hpp"

Writer::Writer(std::ostream& os) : m_os(os)
{
}

void Writer::dump(std::uint16_t base, const xcbm::Bytes& bytes) const
{
    std::string hex_bytes, text_bytes;
    for (size_t offset = 0; offset < bytes.size(); ++offset)
    {
        if ((offset % 16) == 0)
        {
            m_os << boost::format("%04X:") % ((base + offset) & 0xFFFF);
        }
        const auto b = bytes[offset];
        hex_bytes += (boost::format(" %02X") % static_cast<unsigned short>(b)).str();
        const auto c = xcbm::petscii_to_ascii(b);
        text_bytes += (c == '\n') ? '.' : c;
        if (((offset + 1) % 16) == 0)
        {
            m_os << hex_bytes << ' ' << text_bytes << std::endl;
            hex_bytes.clear();
            text_bytes.clear();
        }
    }
    if (!hex_bytes.empty() || !text_bytes.empty())
    {
        const auto nbytes = text_bytes.length();
        const auto padding = std::string((16 - nbytes) * 3, ' ');
        m_os << hex_bytes << padding << ' ' << text_bytes << std::endl;
    }
}

void Writer::status(const xcbm::CbmStatus& status) const
{
    m_os << status;
    if (status.is_ok() != xcbm::StatusClass::OK)
    {
        m_os << "  (" << status.error_number() << ')';
    }
    m_os << std::endl;
}

void Writer::listing(const xcbm::CbmDirListing& listing) const
{
    m_os << listing << std::endl;
}

void Writer::scan(const std::vector<std::pair<std::uint8_t, xcbm::CbmDeviceInfo>>& devices) const
{
    if (devices.empty())
    {
        m_os << "No devices found" << std::endl;
        return;
    }
    for (const auto& [device, info] : devices)
    {
        m_os << boost::format("%2u: ") % static_cast<unsigned int>(device) << info << std::endl;
    }
}

void Writer::init(const std::vector<xcbm::DriveResult>& results) const
{
    for (const auto& result : results)
    {
        m_os << "Drive " << static_cast<int>(result.m_drive_num) << ": ";
        if (result.ok())
        {
            m_os << *result.m_status << std::endl;
            continue;
        }
        try
        {
            result.rethrow();
        }
        catch (const xcbm::Error& e)
        {
            m_os << e.what() << std::endl;
        }
    }
}

void Writer::unit(const xcbm::DriveUnit& unit, const xcbm::DirResult& result) const
{
    m_os << unit << ", " << result.m_listings.size() << " of " << static_cast<int>(unit.num_disk_drives())
         << " drive(s) listed" << std::endl;
    for (const auto& listing : result.m_listings)
    {
        this->listing(listing);
    }
    status(result.m_status);
}
