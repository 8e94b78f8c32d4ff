#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>

#include "validate.hpp"

namespace xcbm
{

// Secondary address used to LOAD (and to read the "$" directory pseudo-file)
inline constexpr std::uint8_t CHANNEL_LOAD = 0;
// The command/status channel
inline constexpr std::uint8_t CHANNEL_CTRL = 15;

inline constexpr std::uint8_t NUM_CHANNELS = 16;

// A (device, channel) pair which is known to be addressable on the IEC bus
class DeviceChannel final
{
public:
    // Throws ValidationError unless device is 8..30 and channel is 0..15
    DeviceChannel(std::uint8_t device, std::uint8_t channel);

    [[nodiscard]] std::uint8_t device() const;
    [[nodiscard]] std::uint8_t channel() const;

    bool operator==(const DeviceChannel& other) const = default;

private:
    std::uint8_t m_device;
    std::uint8_t m_channel;
};

std::ostream& operator<<(std::ostream& os, const DeviceChannel& dc);

enum class ChannelPurpose
{
    RESET,     // Channel 15 only
    DIRECTORY, // Reading the directory
    FILE_READ,
    FILE_WRITE,
    COMMAND // Other command channel traffic
};

std::ostream& operator<<(std::ostream& os, ChannelPurpose purpose);

// Book-keeping for the logical channels of one drive unit.  It never talks to the hardware; it just makes sure
// that no channel is handed out twice.
class ChannelManager final
{
public:
    ChannelManager();

    // RESET gets channel 15 if it is free; everything else gets the lowest free channel from 0..14
    [[nodiscard]] std::optional<std::uint8_t> allocate(ChannelPurpose purpose);

    // Releases a channel.  Freeing a channel which isn't allocated is harmless.
    void free(std::uint8_t channel);

    // Releases everything (and restarts the sequence numbering)
    void reset();

    [[nodiscard]] bool is_allocated(std::uint8_t channel) const;
    [[nodiscard]] std::optional<ChannelPurpose> purpose_of(std::uint8_t channel) const;

    // Allocation order; the first allocation after construction or reset() is 1
    [[nodiscard]] std::optional<std::uint64_t> sequence_of(std::uint8_t channel) const;

    [[nodiscard]] size_t allocated_count() const;

private:
    struct Allocation
    {
        ChannelPurpose m_purpose;
        std::uint64_t m_sequence;
    };

    std::optional<std::uint8_t> claim(std::uint8_t channel, ChannelPurpose purpose);

    std::array<std::optional<Allocation>, NUM_CHANNELS> m_channels;
    std::uint64_t m_next_sequence = 1;
};

} // namespace xcbm
