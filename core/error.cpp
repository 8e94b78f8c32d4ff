#include "error.hpp"

#include "channel.hpp"

#include <cerrno>

#include <fmt/core.h>

namespace
{
    std::string kind_text(xcbm::TransportError::Kind kind)
    {
        switch (kind)
        {
        case xcbm::TransportError::Kind::USB: return "USB error";
        case xcbm::TransportError::Kind::DEVICE_ACCESS: return "Device access error";
        case xcbm::TransportError::Kind::COMMUNICATION: return "Communication error";
        case xcbm::TransportError::Kind::STATUS_VALUE: return "Unexpected status value";
        case xcbm::TransportError::Kind::TIMEOUT: return "Timeout";
        case xcbm::TransportError::Kind::NO_HANDLE: return "No bus handle";
        }
        return "Transport error";
    }

} // namespace

namespace xcbm
{

Error::Error(const std::string& what) : std::runtime_error(what)
{
}

int Error::to_errno() const
{
    return EIO;
}

TransportError::TransportError(Kind kind, const std::string& message, std::optional<int> value)
    : Error(value ? fmt::format("{} ({}): {}", kind_text(kind), *value, message) : fmt::format("{}: {}", kind_text(kind), message)),
      m_kind(kind),
      m_value(value)
{
}

TransportError::Kind TransportError::kind() const
{
    return m_kind;
}

std::optional<int> TransportError::value() const
{
    return m_value;
}

int TransportError::to_errno() const
{
    switch (m_kind)
    {
    case Kind::TIMEOUT: return ETIMEDOUT;
    case Kind::DEVICE_ACCESS:
    case Kind::NO_HANDLE: return ENODEV;
    default: return EIO;
    }
}

DeviceError::DeviceError(Kind kind,
                         std::uint8_t device,
                         const std::string& detail,
                         std::optional<std::uint8_t> channel,
                         std::optional<std::uint8_t> drive_num)
    : Error(fmt::format("Device {} error: {}", device, detail)),
      m_kind(kind),
      m_device(device),
      m_channel(channel),
      m_drive_num(drive_num)
{
}

DeviceError DeviceError::no_device(std::uint8_t device)
{
    return { Kind::NO_DEVICE, device, "Device does not exist (or at least isn't talking on channel 15)" };
}

DeviceError DeviceError::invalid_drive(std::uint8_t device, std::uint8_t drive_num)
{
    return { Kind::INVALID_DRIVE, device, fmt::format("Invalid drive number: {}", drive_num), {}, drive_num };
}

DeviceError DeviceError::get_status_failure(std::uint8_t device, const std::string& message)
{
    return { Kind::GET_STATUS_FAILURE, device, "Failed to get status: " + message };
}

DeviceError DeviceError::read_error(const DeviceChannel& dc, const std::string& message)
{
    return { Kind::READ,
             dc.device(),
             fmt::format("Read error: Channel: {}, Error: {}", dc.channel(), message),
             dc.channel() };
}

DeviceError DeviceError::write_error(const DeviceChannel& dc, const std::string& message)
{
    return { Kind::WRITE,
             dc.device(),
             fmt::format("Write error: Channel: {}, Error: {}", dc.channel(), message),
             dc.channel() };
}

DeviceError::Kind DeviceError::kind() const
{
    return m_kind;
}

std::uint8_t DeviceError::device() const
{
    return m_device;
}

std::optional<std::uint8_t> DeviceError::channel() const
{
    return m_channel;
}

std::optional<std::uint8_t> DeviceError::drive_num() const
{
    return m_drive_num;
}

int DeviceError::to_errno() const
{
    switch (m_kind)
    {
    case Kind::NO_DEVICE: return ENODEV;
    case Kind::INVALID_DRIVE: return EINVAL;
    default: return EIO;
    }
}

StatusError::StatusError(const CbmStatus& status)
    : Error(fmt::format("Device {}: Status error: {}", status.device(), status.as_str())),
      m_status(status)
{
}

const CbmStatus& StatusError::status() const
{
    return m_status;
}

ParseError::ParseError(const std::string& message) : Error("Parse error: " + message)
{
}

int ParseError::to_errno() const
{
    return EINVAL;
}

ValidationError::ValidationError(const std::string& message) : Error("Validation error: " + message)
{
}

int ValidationError::to_errno() const
{
    return EINVAL;
}

} // namespace xcbm
