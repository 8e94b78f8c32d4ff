#include "validate.hpp"

#include "error.hpp"

#include <boost/log/trivial.hpp>
#include <fmt/core.h>

namespace xcbm
{

std::optional<std::uint8_t> validate_device(std::optional<std::uint8_t> device, DeviceValidation validation)
{
    if (device)
    {
        if ((*device < MIN_DEVICE_NUM) || (*device > MAX_DEVICE_NUM))
        {
            BOOST_LOG_TRIVIAL(debug) << "Device number out of range: " << static_cast<int>(*device);
            throw ValidationError(fmt::format("Device num must be between {} and {}", MIN_DEVICE_NUM, MAX_DEVICE_NUM));
        }
        return device;
    }

    switch (validation)
    {
    case DeviceValidation::REQUIRED: throw ValidationError("No device num supplied");
    case DeviceValidation::OPTIONAL: return {};
    case DeviceValidation::DEFAULT: return DEFAULT_DEVICE_NUM;
    }
    return {};
}

} // namespace xcbm
