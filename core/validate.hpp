#pragma once

#include <cstdint>
#include <optional>

namespace xcbm
{

inline constexpr std::uint8_t MIN_DEVICE_NUM = 8;
inline constexpr std::uint8_t MAX_DEVICE_NUM = 30;
inline constexpr std::uint8_t DEFAULT_DEVICE_NUM = 8;

enum class DeviceValidation
{
    REQUIRED, // A device number must be supplied
    OPTIONAL, // No device number is fine, and stays that way
    DEFAULT   // No device number means DEFAULT_DEVICE_NUM
};

// Checks a user supplied device number.  Throws ValidationError if it is out of range, or missing when required.
std::optional<std::uint8_t> validate_device(std::optional<std::uint8_t> device, DeviceValidation validation);

} // namespace xcbm
