#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "channel.hpp"
#include "petscii.hpp"

namespace xcbm
{

// The primitive IEC bus verbs offered by a USB-to-IEC adapter.  Implementations throw TransportError on failure.
class IBus
{
public:
    virtual ~IBus() = default;

    // Pulse the bus RESET line
    virtual void reset() = 0;

    virtual void listen(const DeviceChannel& dc) = 0;
    virtual void talk(const DeviceChannel& dc) = 0;
    virtual void unlisten() = 0;
    virtual void untalk() = 0;

    // Secondary address OPEN.  The device is left listening so that the filename can be written; the caller
    // finishes with unlisten().
    virtual void open(const DeviceChannel& dc) = 0;
    virtual void close(const DeviceChannel& dc) = 0;

    // Returns the number of bytes the device accepted
    virtual size_t write(const Bytes& data) = 0;

    // Reads up to max bytes; fewer (possibly none) means the talker has nothing more to send
    [[nodiscard]] virtual Bytes read(size_t max) = 0;

    // Reads up to max bytes, stopping after the terminator byte (which is included) if it turns up first
    [[nodiscard]] virtual Bytes read_until(size_t max, std::uint8_t terminator) = 0;
};

// Creates (and opens) a transport; used both initially and whenever the adapter is reset
using BusFactory = std::function<std::unique_ptr<IBus>()>;

} // namespace xcbm
