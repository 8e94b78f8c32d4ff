#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace xcbm
{

enum class CbmDeviceType
{
    UNKNOWN,
    CBM1540,
    CBM1541,
    CBM1570,
    CBM1571,
    CBM1581,
    CBM2040,
    CBM2031,
    CBM3040,
    CBM4040,
    CBM4031,
    CBM8050,
    CBM8250,
    SFD1001,
    FDX000
};

enum class DosVersion
{
    DOS1,
    DOS2,
    DOS3
};

// Model number, e.g. "1541"
std::string_view as_str(CbmDeviceType type);

// Name suitable for use as a directory or mount point, e.g. "CBM_1541"
std::string to_fs_name(CbmDeviceType type);

// Dual drive units (4040, 8050 etc.) have two; unknown devices have none
std::uint8_t num_disk_drives(CbmDeviceType type);

DosVersion dos_version(CbmDeviceType type);

// "CBM 1541"
std::ostream& operator<<(std::ostream& os, CbmDeviceType type);
std::ostream& operator<<(std::ostream& os, DosVersion version);

// Where identification reads its signatures from in drive memory
inline constexpr std::uint16_t MAGIC_ADDRESS = 0xFF40;
inline constexpr std::uint16_t MAGIC_1541_ADDRESS = 0xFFFE;
inline constexpr std::uint16_t MAGIC_1540_ADDRESS = 0xE5C4;
inline constexpr std::uint16_t MAGIC_FD_ADDRESS = 0x8008;

// Signature values which need a further read to disambiguate
inline constexpr std::uint16_t MAGIC_154X_FAMILY = 0xAAAA;
inline constexpr std::uint16_t MAGIC_1581_FAMILY = 0x01BA;
// The IRQ vector found at 0xFFFE in the 1540/1541 ROMs
inline constexpr std::uint16_t MAGIC_154X_IRQ_VECTOR = 0xFE67;

struct CbmDeviceInfo
{
    CbmDeviceType m_device_type = CbmDeviceType::UNKNOWN;
    std::string m_description = "unknown";

    // Look up the ROM signature(s) read from a drive.  Never fails; unrecognised signatures give an UNKNOWN
    // device whose description carries the raw values.
    static CbmDeviceInfo from_magic(std::uint16_t magic, std::optional<std::uint16_t> magic2 = {});
};

// "CBM 1541: 1541-II"
std::ostream& operator<<(std::ostream& os, const CbmDeviceInfo& info);

} // namespace xcbm
