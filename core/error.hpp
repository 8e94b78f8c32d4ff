#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "status.hpp"

namespace xcbm
{

class DeviceChannel;

// Base class for every error raised by the library.  Each error can be mapped onto an errno value so that
// filesystem-style front ends can report it without knowing the details.
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& what);

    [[nodiscard]] virtual int to_errno() const;
};

// Failures reported by the bus transport itself
class TransportError : public Error
{
public:
    enum class Kind
    {
        USB,           // Adapter level failure
        DEVICE_ACCESS, // Couldn't open or claim the adapter
        COMMUNICATION, // Bus protocol failure
        STATUS_VALUE,  // The adapter reported an unexpected status word for a bus verb
        TIMEOUT,       // The adapter gave up waiting
        NO_HANDLE      // There is no open transport
    };

    TransportError(Kind kind, const std::string& message, std::optional<int> value = {});

    [[nodiscard]] Kind kind() const;

    // Only meaningful for STATUS_VALUE errors
    [[nodiscard]] std::optional<int> value() const;

    [[nodiscard]] int to_errno() const override;

private:
    Kind m_kind;
    std::optional<int> m_value;
};

// A device on the bus misbehaved or isn't there
class DeviceError : public Error
{
public:
    enum class Kind
    {
        NO_DEVICE,
        INVALID_DRIVE,
        GET_STATUS_FAILURE,
        READ,
        WRITE
    };

    static DeviceError no_device(std::uint8_t device);
    static DeviceError invalid_drive(std::uint8_t device, std::uint8_t drive_num);
    static DeviceError get_status_failure(std::uint8_t device, const std::string& message);
    static DeviceError read_error(const DeviceChannel& dc, const std::string& message);
    static DeviceError write_error(const DeviceChannel& dc, const std::string& message);

    [[nodiscard]] Kind kind() const;
    [[nodiscard]] std::uint8_t device() const;
    [[nodiscard]] std::optional<std::uint8_t> channel() const;
    [[nodiscard]] std::optional<std::uint8_t> drive_num() const;

    [[nodiscard]] int to_errno() const override;

private:
    DeviceError(Kind kind,
                std::uint8_t device,
                const std::string& detail,
                std::optional<std::uint8_t> channel = {},
                std::optional<std::uint8_t> drive_num = {});

    Kind m_kind;
    std::uint8_t m_device;
    std::optional<std::uint8_t> m_channel;
    std::optional<std::uint8_t> m_drive_num;
};

// The drive reported an error status
class StatusError : public Error
{
public:
    explicit StatusError(const CbmStatus& status);

    [[nodiscard]] const CbmStatus& status() const;

private:
    CbmStatus m_status;
};

class ParseError : public Error
{
public:
    explicit ParseError(const std::string& message);

    [[nodiscard]] int to_errno() const override;
};

// A caller-supplied value was out of range
class ValidationError : public Error
{
public:
    explicit ValidationError(const std::string& message);

    [[nodiscard]] int to_errno() const override;
};

} // namespace xcbm
