#include "devicetype.hpp"

#include <boost/format.hpp>

namespace xcbm
{

std::string_view as_str(CbmDeviceType type)
{
    switch (type)
    {
    case CbmDeviceType::UNKNOWN: return "Unknown Device";
    case CbmDeviceType::CBM1540: return "1540";
    case CbmDeviceType::CBM1541: return "1541";
    case CbmDeviceType::CBM1570: return "1570";
    case CbmDeviceType::CBM1571: return "1571";
    case CbmDeviceType::CBM1581: return "1581";
    case CbmDeviceType::CBM2040: return "2040";
    case CbmDeviceType::CBM2031: return "2031";
    case CbmDeviceType::CBM3040: return "3040";
    case CbmDeviceType::CBM4040: return "4040";
    case CbmDeviceType::CBM4031: return "4031";
    case CbmDeviceType::CBM8050: return "8050";
    case CbmDeviceType::CBM8250: return "8250";
    case CbmDeviceType::SFD1001: return "SFD-1001";
    case CbmDeviceType::FDX000: return "FDX000";
    }
    return "Unknown Device";
}

std::string to_fs_name(CbmDeviceType type)
{
    switch (type)
    {
    case CbmDeviceType::UNKNOWN: return "Unknown";
    case CbmDeviceType::FDX000: return std::string(as_str(type));
    default: return "CBM_" + std::string(as_str(type));
    }
}

std::uint8_t num_disk_drives(CbmDeviceType type)
{
    switch (type)
    {
    case CbmDeviceType::UNKNOWN: return 0;
    case CbmDeviceType::CBM2040:
    case CbmDeviceType::CBM3040:
    case CbmDeviceType::CBM4040:
    case CbmDeviceType::CBM8050:
    case CbmDeviceType::CBM8250: return 2;
    default: return 1;
    }
}

DosVersion dos_version(CbmDeviceType type)
{
    switch (type)
    {
    case CbmDeviceType::UNKNOWN:
    case CbmDeviceType::CBM2040:
    case CbmDeviceType::CBM3040: return DosVersion::DOS1;
    case CbmDeviceType::CBM1571:
    case CbmDeviceType::CBM1581:
    case CbmDeviceType::FDX000: return DosVersion::DOS3;
    default: return DosVersion::DOS2;
    }
}

std::ostream& operator<<(std::ostream& os, CbmDeviceType type)
{
    switch (type)
    {
    case CbmDeviceType::UNKNOWN: return os << "Unknown";
    case CbmDeviceType::SFD1001: return os << "SFD 1001";
    case CbmDeviceType::FDX000: return os << "FD X000";
    default: return os << "CBM " << as_str(type);
    }
}

std::ostream& operator<<(std::ostream& os, DosVersion version)
{
    switch (version)
    {
    case DosVersion::DOS1: return os << "DOS1";
    case DosVersion::DOS2: return os << "DOS2";
    case DosVersion::DOS3: return os << "DOS3";
    }
    return os;
}

CbmDeviceInfo CbmDeviceInfo::from_magic(std::uint16_t magic, std::optional<std::uint16_t> magic2)
{
    switch (magic)
    {
    case 0xFEB6: return { CbmDeviceType::CBM2031, "2031" };
    case MAGIC_154X_FAMILY:
        if (magic2 == 0x3156)
        {
            return { CbmDeviceType::CBM1540, "1540" };
        }
        if (magic2 == 0xFEB6)
        {
            return { CbmDeviceType::CBM2031, "2031" };
        }
        return { CbmDeviceType::CBM1541, "1541" };
    case 0xF00F: return { CbmDeviceType::CBM1541, "1541-II" };
    case 0xCD18: return { CbmDeviceType::CBM1541, "1541C" };
    case 0x10CA: return { CbmDeviceType::CBM1541, "DolphinDOS 1541" };
    case 0x6F10: return { CbmDeviceType::CBM1541, "SpeedDOS 1541" };
    case 0x2710: return { CbmDeviceType::CBM1541, "ProfessionalDOS 1541" };
    case 0x8085: return { CbmDeviceType::CBM1541, "JiffyDOS 1541" };
    case 0xAEEA: return { CbmDeviceType::CBM1541, "64'er DOS 1541" };
    case 0x180D: return { CbmDeviceType::CBM1541, "Turbo Access / Turbo Trans" };
    case 0x094C: return { CbmDeviceType::CBM1541, "Prologic DOS" };
    case 0xFED7: return { CbmDeviceType::CBM1570, "1570" };
    case 0x02AC: return { CbmDeviceType::CBM1571, "1571" };
    case MAGIC_1581_FAMILY:
        if (magic2 == 0x4446) // "FD"
        {
            return { CbmDeviceType::FDX000, "FD2000/FD4000" };
        }
        return { CbmDeviceType::CBM1581, "1581" };
    case 0x32F0: return { CbmDeviceType::CBM3040, "3040" };
    case 0xC320:
    case 0x20F8: return { CbmDeviceType::CBM4040, "4040" };
    case 0xF2E9: return { CbmDeviceType::CBM8050, "8050 dos2.5" };
    case 0xC866:
    case 0xC611: return { CbmDeviceType::CBM8250, "8250 dos2.7" };
    default: break;
    }

    auto description = (boost::format("Unknown device: %04x") % magic).str();
    if (magic2)
    {
        description += (boost::format(" %04x") % *magic2).str();
    }
    return { CbmDeviceType::UNKNOWN, description };
}

std::ostream& operator<<(std::ostream& os, const CbmDeviceInfo& info)
{
    return os << info.m_device_type << ": " << info.m_description;
}

} // namespace xcbm
