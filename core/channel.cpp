#include "channel.hpp"

#include "error.hpp"

#include <algorithm>

#include <boost/log/trivial.hpp>
#include <fmt/core.h>

namespace xcbm
{

DeviceChannel::DeviceChannel(std::uint8_t device, std::uint8_t channel) : m_device(device), m_channel(channel)
{
    if ((device < MIN_DEVICE_NUM) || (device > MAX_DEVICE_NUM))
    {
        throw ValidationError(fmt::format("Device number {} must be between {} and {}", device, MIN_DEVICE_NUM, MAX_DEVICE_NUM));
    }
    if (channel >= NUM_CHANNELS)
    {
        throw ValidationError(fmt::format("Channel number {} must be between 0 and {}", channel, NUM_CHANNELS - 1));
    }
}

std::uint8_t DeviceChannel::device() const
{
    return m_device;
}

std::uint8_t DeviceChannel::channel() const
{
    return m_channel;
}

std::ostream& operator<<(std::ostream& os, const DeviceChannel& dc)
{
    return os << static_cast<int>(dc.device()) << '/' << static_cast<int>(dc.channel());
}

std::ostream& operator<<(std::ostream& os, ChannelPurpose purpose)
{
    switch (purpose)
    {
    case ChannelPurpose::RESET: os << "reset"; break;
    case ChannelPurpose::DIRECTORY: os << "directory"; break;
    case ChannelPurpose::FILE_READ: os << "file read"; break;
    case ChannelPurpose::FILE_WRITE: os << "file write"; break;
    case ChannelPurpose::COMMAND: os << "command"; break;
    }
    return os;
}

ChannelManager::ChannelManager() = default;

std::optional<std::uint8_t> ChannelManager::allocate(ChannelPurpose purpose)
{
    if (purpose == ChannelPurpose::RESET)
    {
        return claim(CHANNEL_CTRL, purpose);
    }

    for (std::uint8_t channel = 0; channel < CHANNEL_CTRL; ++channel)
    {
        if (!m_channels[channel])
        {
            return claim(channel, purpose);
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "No free channel for " << purpose;
    return {};
}

std::optional<std::uint8_t> ChannelManager::claim(std::uint8_t channel, ChannelPurpose purpose)
{
    if (m_channels[channel])
    {
        return {};
    }
    m_channels[channel] = Allocation{ purpose, m_next_sequence++ };
    BOOST_LOG_TRIVIAL(trace) << "Allocated channel " << static_cast<int>(channel) << " for " << purpose;
    return channel;
}

void ChannelManager::free(std::uint8_t channel)
{
    if (channel < NUM_CHANNELS)
    {
        m_channels[channel].reset();
    }
}

void ChannelManager::reset()
{
    std::fill(m_channels.begin(), m_channels.end(), std::nullopt);
    m_next_sequence = 1;
}

bool ChannelManager::is_allocated(std::uint8_t channel) const
{
    return (channel < NUM_CHANNELS) && m_channels[channel].has_value();
}

std::optional<ChannelPurpose> ChannelManager::purpose_of(std::uint8_t channel) const
{
    if (!is_allocated(channel))
    {
        return {};
    }
    return m_channels[channel]->m_purpose;
}

std::optional<std::uint64_t> ChannelManager::sequence_of(std::uint8_t channel) const
{
    if (!is_allocated(channel))
    {
        return {};
    }
    return m_channels[channel]->m_sequence;
}

size_t ChannelManager::allocated_count() const
{
    return std::count_if(m_channels.begin(), m_channels.end(), [](const auto& a) { return a.has_value(); });
}

} // namespace xcbm
