#include <boost/test/unit_test.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include <xcbm/bus/remotebus.hpp>
#include <xcbm/core/channel.hpp>
#include <xcbm/core/error.hpp>

namespace
{

void check_reply_fails(const std::string& line, xcbm::TransportError::Kind expected)
{
    try
    {
        (void)xcbm::bus::parse_reply(line);
        BOOST_ERROR("Expected a transport error for " + line);
    }
    catch (const xcbm::TransportError& e)
    {
        BOOST_CHECK(e.kind() == expected);
    }
}

// A one-connection bridge on the loopback interface which answers each request line from a script
class FakeBridge final
{
public:
    explicit FakeBridge(std::map<std::string, std::string> script) : m_script(std::move(script))
    {
        m_listen_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        BOOST_REQUIRE(m_listen_fd >= 0);

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        BOOST_REQUIRE(::bind(m_listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        BOOST_REQUIRE(::listen(m_listen_fd, 1) == 0);

        socklen_t len = sizeof(addr);
        BOOST_REQUIRE(::getsockname(m_listen_fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        m_port = ntohs(addr.sin_port);

        m_thread = std::thread([this]() { serve(); });
    }

    FakeBridge(const FakeBridge&) = delete;
    FakeBridge& operator=(const FakeBridge&) = delete;
    FakeBridge(FakeBridge&&) = delete;
    FakeBridge& operator=(FakeBridge&&) = delete;

    ~FakeBridge()
    {
        if (m_thread.joinable())
        {
            m_thread.join();
        }
        ::close(m_listen_fd);
    }

    [[nodiscard]] std::uint16_t port() const
    {
        return m_port;
    }

    // Waits for the client to disconnect, then returns everything it sent
    [[nodiscard]] const std::vector<std::string>& finish()
    {
        m_thread.join();
        return m_requests;
    }

private:
    void serve()
    {
        const auto fd = ::accept(m_listen_fd, nullptr, nullptr);
        if (fd < 0)
        {
            return;
        }

        std::string pending;
        char buffer[256];
        ssize_t n;
        while ((n = ::recv(fd, buffer, sizeof(buffer), 0)) > 0)
        {
            pending.append(buffer, n);
            std::string::size_type newline;
            while ((newline = pending.find('\n')) != std::string::npos)
            {
                const auto request = pending.substr(0, newline);
                pending.erase(0, newline + 1);
                m_requests.push_back(request);

                const auto it = m_script.find(request);
                const auto reply = ((it == m_script.end()) ? std::string("OK") : it->second) + "\r\n";
                (void)::send(fd, reply.data(), reply.size(), MSG_NOSIGNAL);
            }
        }
        ::close(fd);
    }

    std::map<std::string, std::string> m_script;
    std::vector<std::string> m_requests;
    int m_listen_fd = -1;
    std::uint16_t m_port = 0;
    std::thread m_thread;
};

} // namespace

BOOST_AUTO_TEST_CASE(test_hex_payloads)
{
    BOOST_CHECK_EQUAL(xcbm::bus::encode_hex({}), "");
    BOOST_CHECK_EQUAL(xcbm::bus::encode_hex({ 0x00, 0x4D, 0xAB, 0xFF }), "004DABFF");

    BOOST_CHECK(xcbm::bus::decode_hex("").empty());
    BOOST_CHECK(xcbm::bus::decode_hex("004dABff") == xcbm::Bytes({ 0x00, 0x4D, 0xAB, 0xFF }));

    BOOST_CHECK_THROW((void)xcbm::bus::decode_hex("ABC"), xcbm::TransportError);
    BOOST_CHECK_THROW((void)xcbm::bus::decode_hex("0G"), xcbm::TransportError);
}

BOOST_AUTO_TEST_CASE(test_ok_replies)
{
    BOOST_CHECK_EQUAL(xcbm::bus::parse_reply("OK"), "");
    BOOST_CHECK_EQUAL(xcbm::bus::parse_reply("OK\r\n"), "");
    BOOST_CHECK_EQUAL(xcbm::bus::parse_reply("OK 3030"), "3030");
}

BOOST_AUTO_TEST_CASE(test_error_replies)
{
    check_reply_fails("ERR USB transfer failed", xcbm::TransportError::Kind::USB);
    check_reply_fails("ERR ACCESS adapter busy", xcbm::TransportError::Kind::DEVICE_ACCESS);
    check_reply_fails("ERR COMM bad handshake", xcbm::TransportError::Kind::COMMUNICATION);
    check_reply_fails("ERR TIMEOUT no response", xcbm::TransportError::Kind::TIMEOUT);

    try
    {
        (void)xcbm::bus::parse_reply("ERR STATUS 2 device not present");
        BOOST_ERROR("Expected a transport error");
    }
    catch (const xcbm::TransportError& e)
    {
        BOOST_CHECK(e.kind() == xcbm::TransportError::Kind::STATUS_VALUE);
        BOOST_CHECK_EQUAL(*e.value(), 2);
    }

    // Anything which doesn't follow the protocol is a communication failure
    check_reply_fails("", xcbm::TransportError::Kind::COMMUNICATION);
    check_reply_fails("OKAY", xcbm::TransportError::Kind::COMMUNICATION);
    check_reply_fails("ERR STATUS zz oops", xcbm::TransportError::Kind::COMMUNICATION);
    check_reply_fails("ERR WHATEVER oops", xcbm::TransportError::Kind::COMMUNICATION);
}

BOOST_AUTO_TEST_CASE(test_remote_bus_requests)
{
    FakeBridge bridge({ { "W 4D2D5240FF", "OK 5" }, { "RD 0001", "OK AA" }, { "RU 0040 0D", "OK 30302C204F4B0D" } });
    {
        xcbm::bus::RemoteBus bus("127.0.0.1", bridge.port());
        const xcbm::DeviceChannel ctrl(8, xcbm::CHANNEL_CTRL);

        bus.reset();
        bus.listen(ctrl);
        BOOST_CHECK_EQUAL(bus.write({ 0x4D, 0x2D, 0x52, 0x40, 0xFF }), 5);
        bus.unlisten();
        bus.talk(ctrl);
        BOOST_CHECK(bus.read(1) == xcbm::Bytes({ 0xAA }));
        BOOST_CHECK_EQUAL(bus.read_until(64, '\r').size(), 7);
        bus.untalk();
        bus.open(xcbm::DeviceChannel(9, 2));
        bus.close(xcbm::DeviceChannel(9, 2));
    }

    const std::vector<std::string> expected{ "R",       "L 08 0F", "W 4D2D5240FF", "UL",      "T 08 0F",
                                             "RD 0001", "RU 0040 0D", "UT",        "O 09 02", "C 09 02" };
    BOOST_CHECK(bridge.finish() == expected);
}

BOOST_AUTO_TEST_CASE(test_remote_bus_errors)
{
    FakeBridge bridge({ { "L 09 0F", "ERR STATUS 2 device not present" }, { "RD 00FE", "OK 123" } });
    {
        xcbm::bus::RemoteBus bus("127.0.0.1", bridge.port());
        try
        {
            bus.listen(xcbm::DeviceChannel(9, xcbm::CHANNEL_CTRL));
            BOOST_ERROR("Expected a transport error");
        }
        catch (const xcbm::TransportError& e)
        {
            BOOST_CHECK(e.kind() == xcbm::TransportError::Kind::STATUS_VALUE);
        }

        // A reply which isn't whole bytes
        BOOST_CHECK_THROW((void)bus.read(254), xcbm::TransportError);

        // The connection is still usable
        BOOST_CHECK_NO_THROW(bus.unlisten());
    }
}
