#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "channel.hpp"
#include "devicetype.hpp"
#include "directory.hpp"
#include "ibus.hpp"
#include "petscii.hpp"
#include "status.hpp"

namespace xcbm
{

// The most that's read from the command channel for one status message
inline constexpr size_t STATUS_BUFFER_SIZE = 64;

// Secondary address used for reading and writing ordinary files
inline constexpr std::uint8_t CHANNEL_FILE = 2;

// High level access to the drives on one IEC bus.  Copies of a Cbm share the same transport; every operation
// takes an exclusive lock on it for the duration of one complete bus transaction, so Cbm objects can be used
// from several threads.
class Cbm final
{
public:
    // Uses the factory to open the transport; it is used again by usb_device_reset()
    explicit Cbm(BusFactory factory);

    Cbm(const Cbm&) = default;
    Cbm& operator=(const Cbm&) = default;
    Cbm(Cbm&&) = default;
    Cbm& operator=(Cbm&&) = default;

    ~Cbm();

    // Pulse the IEC reset line
    void reset_bus();

    // Drop the transport and open a new one.  If reopening fails there is no transport, and every subsequent
    // operation fails with TransportError(NO_HANDLE) until a later reset succeeds.
    void usb_device_reset();

    // Fingerprint the drive's ROM
    [[nodiscard]] CbmDeviceInfo identify(std::uint8_t device);

    [[nodiscard]] CbmStatus get_status(std::uint8_t device);

    // Send a command on the command channel; no status is read
    void send_command(std::uint8_t device, const PetsciiString& command);
    void send_command_ascii(std::uint8_t device, const AsciiString& command);
    void send_string_command_ascii(std::uint8_t device, std::string_view command);
    // The string's bytes are sent as they are, without any translation
    void send_string_command_petscii(std::uint8_t device, std::string_view command);

    // Sends the command and reads the status it leaves, as one transaction.  The status isn't checked.
    CbmStatus send_command_status(std::uint8_t device, const AsciiString& command);

    // Each of these sends the command, reads the resulting status and throws StatusError if it isn't OK
    CbmStatus format_disk(std::uint8_t device, const AsciiString& name, const AsciiString& id);
    CbmStatus delete_file(std::uint8_t device, const AsciiString& filename);
    CbmStatus validate_disk(std::uint8_t device);

    // OPEN a channel with the given filename, and check that the drive was happy with it
    void open_file(const DeviceChannel& dc, const AsciiString& filename);
    void close_file(const DeviceChannel& dc);

    // LOAD a file (including the "$" directory pseudo-file) via channel 0
    [[nodiscard]] Bytes load_file_petscii(std::uint8_t device, const PetsciiString& filename);
    [[nodiscard]] Bytes load_file_ascii(std::uint8_t device, const AsciiString& filename);

    [[nodiscard]] Bytes read_file(const DeviceChannel& dc, const AsciiString& filename);

    // Creates or overwrites a PRG file
    void write_file(const DeviceChannel& dc, const AsciiString& filename, const Bytes& data);

    // drive_num selects drive 0 or 1 of a dual unit; with no drive_num the drive picks
    [[nodiscard]] CbmDirListing dir(std::uint8_t device, std::optional<std::uint8_t> drive_num = {});

    // Peek and poke the drive's memory, one byte at a time so that DOS 1 drives can cope
    [[nodiscard]] Bytes read_drive_memory(std::uint8_t device, std::uint16_t address, size_t size);
    void write_drive_memory(std::uint8_t device, std::uint16_t address, const Bytes& data);

    // Probe the bus for a device; false means nothing answered
    [[nodiscard]] bool drive_exists(std::uint8_t device);

    // Identify every device which is present in the range.  Devices which misbehave are skipped.
    [[nodiscard]] std::vector<std::pair<std::uint8_t, CbmDeviceInfo>> scan_bus_range(std::uint8_t first,
                                                                                     std::uint8_t last);
    [[nodiscard]] std::vector<std::pair<std::uint8_t, CbmDeviceInfo>> scan_bus();

private:
    class Private;
    std::shared_ptr<Private> m_private;
};

} // namespace xcbm
