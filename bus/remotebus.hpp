#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <xcbm/core/ibus.hpp>

namespace xcbm::bus
{

// An IBus which forwards each bus verb over TCP to a bridge daemon that owns the USB adapter.  The protocol is
// line oriented ASCII with one reply line per request line:
//
//   R            reset             L dd cc   listen      T dd cc   talk
//   UL           unlisten          UT        untalk
//   O dd cc      open              C dd cc   close
//   W hh...      write bytes       RD nnnn   read up to n bytes
//   RU nnnn tt   read up to n bytes, stopping after terminator t
//
// All numbers are hex.  Replies are either "OK" optionally followed by a payload (hex bytes for reads, a hex
// count for writes) or "ERR <kind> [<value>] <message>", kind being one of USB, ACCESS, COMM, STATUS (which
// carries a hex status value) or TIMEOUT.
class RemoteBus final : public IBus
{
public:
    // Connects immediately; throws TransportError(DEVICE_ACCESS) on failure
    RemoteBus(const std::string& host, std::uint16_t port);

    RemoteBus(const RemoteBus&) = delete;
    RemoteBus& operator=(const RemoteBus&) = delete;
    RemoteBus(RemoteBus&&) = delete;
    RemoteBus& operator=(RemoteBus&&) = delete;

    ~RemoteBus() override;

    // Implements IBus

    void reset() override;

    void listen(const DeviceChannel& dc) override;
    void talk(const DeviceChannel& dc) override;
    void unlisten() override;
    void untalk() override;

    void open(const DeviceChannel& dc) override;
    void close(const DeviceChannel& dc) override;

    size_t write(const Bytes& data) override;
    [[nodiscard]] Bytes read(size_t max) override;
    [[nodiscard]] Bytes read_until(size_t max, std::uint8_t terminator) override;

private:
    // Sends one request and returns the payload of its reply
    std::string transact(const std::string& request);

    void sendall(const std::string& s);
    std::string receive_line();

    int m_fd = -1;
    std::string m_pending; // Received but not yet consumed
};

// Protocol helpers, exposed for testing

std::string encode_hex(const Bytes& bytes);

// Throws TransportError(COMMUNICATION) if the text isn't an even number of hex digits
Bytes decode_hex(std::string_view s);

// Returns the payload of an "OK" reply (possibly empty), or throws the TransportError that an "ERR" reply
// describes
std::string parse_reply(std::string_view line);

} // namespace xcbm::bus
