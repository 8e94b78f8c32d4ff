#pragma once

#include <cstdint>
#include <ostream>
#include <utility>
#include <vector>

#include <xcbm/core/devicetype.hpp>
#include <xcbm/core/directory.hpp>
#include <xcbm/core/driveunit.hpp>
#include <xcbm/core/petscii.hpp>
#include <xcbm/core/status.hpp>

// Knows how to present the results of drive operations to the user, so that the shell's command handlers only
// deal with talking to the drive.
class Writer final
{
public:
    explicit Writer(std::ostream& os);

    // Hex and PETSCII dump of bytes read from drive memory starting at base
    void dump(std::uint16_t base, const xcbm::Bytes& bytes) const;

    void status(const xcbm::CbmStatus& status) const;

    void listing(const xcbm::CbmDirListing& listing) const;

    void scan(const std::vector<std::pair<std::uint8_t, xcbm::CbmDeviceInfo>>& devices) const;

    void init(const std::vector<xcbm::DriveResult>& results) const;

    void unit(const xcbm::DriveUnit& unit, const xcbm::DirResult& result) const;

private:
    std::ostream& m_os;
};
