#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "cbm.hpp"
#include "channel.hpp"
#include "devicetype.hpp"
#include "directory.hpp"
#include "status.hpp"

namespace xcbm
{

// The outcome for one drive of a unit; exactly one of m_status and m_error is set
struct DriveResult
{
    std::uint8_t m_drive_num;
    std::optional<CbmStatus> m_status;
    std::exception_ptr m_error;

    [[nodiscard]] bool ok() const;

    // Throws the stored error, if there is one
    void rethrow() const;
};

struct DirResult
{
    std::vector<CbmDirListing> m_listings; // One per drive which could be listed
    CbmStatus m_status;                    // The first status error seen, otherwise the final status
};

// A physical drive unit on the bus, which may house one or two disk drives.  It keeps track of the channels in
// use on the unit.
class DriveUnit final
{
public:
    DriveUnit(std::uint8_t device, CbmDeviceInfo info);

    // Checks that something answers at the device number and identifies it.  Throws DeviceError(NO_DEVICE) if
    // nothing is there.
    static DriveUnit try_from_bus(Cbm& cbm, std::uint8_t device);

    [[nodiscard]] std::uint8_t device() const;
    [[nodiscard]] const CbmDeviceInfo& info() const;
    [[nodiscard]] std::uint8_t num_disk_drives() const;
    [[nodiscard]] bool is_busy() const;
    [[nodiscard]] const ChannelManager& channels() const;

    [[nodiscard]] CbmStatus get_status(Cbm& cbm);

    // Sends "i" to each drive in turn.  A drive succeeds if its status is OK or its error number is one of
    // those to be ignored; a failure on one drive doesn't stop the others being initialised.
    [[nodiscard]] std::vector<DriveResult> send_init(Cbm& cbm, const std::vector<CbmErrorNumber>& ignore);

    // Lists each drive of the unit.  Drives which misbehave are skipped; anything other than a device or status
    // error is thrown immediately.
    [[nodiscard]] DirResult dir(Cbm& cbm);

    [[nodiscard]] Bytes read_file(Cbm& cbm, const AsciiString& filename);
    void write_file(Cbm& cbm, const AsciiString& filename, const Bytes& data);

    // Forget all channel allocations
    void reset();

private:
    class Lease;

    std::uint8_t m_device;
    CbmDeviceInfo m_info;
    ChannelManager m_channels;
    bool m_busy = false;
};

std::ostream& operator<<(std::ostream& os, const DriveUnit& unit);

} // namespace xcbm
