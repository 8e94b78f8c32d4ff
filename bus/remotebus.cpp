#include "remotebus.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <optional>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <boost/algorithm/string.hpp>
#include <boost/log/trivial.hpp>
#include <fmt/core.h>

#include <xcbm/core/error.hpp>

namespace
{
    const std::string OK_REPLY = "OK";
    const std::string ERR_PREFIX = "ERR ";

    bool a2hex(char c, std::uint8_t& out)
    {
        if (c >= '0' && c <= '9')
        {
            out = c - '0';
            return true;
        }
        if (c >= 'a' && c <= 'f')
        {
            out = c - 'a' + 10;
            return true;
        }
        if (c >= 'A' && c <= 'F')
        {
            out = c - 'A' + 10;
            return true;
        }
        return false;
    }

    std::optional<unsigned int> parse_hex_number(std::string_view s)
    {
        unsigned int value = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, 16);
        if ((ec != std::errc()) || (ptr != s.data() + s.size()) || s.empty())
        {
            return {};
        }
        return value;
    }

    std::string address(const char* verb, const xcbm::DeviceChannel& dc)
    {
        return fmt::format("{} {:02X} {:02X}", verb, dc.device(), dc.channel());
    }

} // namespace

namespace xcbm::bus
{

std::string encode_hex(const Bytes& bytes)
{
    std::string result;
    result.reserve(bytes.size() * 2);
    for (const auto b : bytes)
    {
        result += fmt::format("{:02X}", b);
    }
    return result;
}

Bytes decode_hex(std::string_view s)
{
    if (s.size() % 2 != 0)
    {
        throw TransportError(TransportError::Kind::COMMUNICATION, fmt::format("Odd length hex payload '{}'", s));
    }

    Bytes result;
    result.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2)
    {
        std::uint8_t hi, lo;
        if (!a2hex(s[i], hi) || !a2hex(s[i + 1], lo))
        {
            throw TransportError(TransportError::Kind::COMMUNICATION, fmt::format("Invalid hex payload '{}'", s));
        }
        result.push_back((hi << 4) | lo);
    }
    return result;
}

std::string parse_reply(std::string_view line)
{
    const auto reply = boost::trim_right_copy_if(std::string(line), boost::is_any_of("\r\n"));

    if (reply == OK_REPLY)
    {
        return {};
    }
    if (boost::starts_with(reply, OK_REPLY + " "))
    {
        return reply.substr(OK_REPLY.size() + 1);
    }
    if (!boost::starts_with(reply, ERR_PREFIX))
    {
        throw TransportError(TransportError::Kind::COMMUNICATION, fmt::format("Malformed reply '{}'", reply));
    }

    // "ERR <kind> [<value>] <message>"
    std::string rest = reply.substr(ERR_PREFIX.size());
    const auto take_word = [&rest]()
    {
        const auto space = rest.find(' ');
        std::string word = rest.substr(0, space);
        rest = (space == std::string::npos) ? std::string() : rest.substr(space + 1);
        return word;
    };

    const auto kind = take_word();
    if (kind == "USB")
    {
        throw TransportError(TransportError::Kind::USB, rest);
    }
    if (kind == "ACCESS")
    {
        throw TransportError(TransportError::Kind::DEVICE_ACCESS, rest);
    }
    if (kind == "COMM")
    {
        throw TransportError(TransportError::Kind::COMMUNICATION, rest);
    }
    if (kind == "TIMEOUT")
    {
        throw TransportError(TransportError::Kind::TIMEOUT, rest);
    }
    if (kind == "STATUS")
    {
        const auto value_text = take_word();
        const auto value = parse_hex_number(value_text);
        if (!value)
        {
            throw TransportError(TransportError::Kind::COMMUNICATION, fmt::format("Malformed status value in '{}'", reply));
        }
        throw TransportError(TransportError::Kind::STATUS_VALUE, rest, static_cast<int>(*value));
    }

    throw TransportError(TransportError::Kind::COMMUNICATION, fmt::format("Unrecognised error reply '{}'", reply));
}

RemoteBus::RemoteBus(const std::string& host, std::uint16_t port)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* p_result = nullptr;
    const auto service = std::to_string(port);
    if (const auto rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &p_result); rc != 0)
    {
        throw TransportError(TransportError::Kind::DEVICE_ACCESS,
                             fmt::format("Can't resolve {}:{}: {}", host, port, ::gai_strerror(rc)));
    }

    int last_errno = 0;
    for (auto p = p_result; p != nullptr; p = p->ai_next)
    {
        const auto fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0)
        {
            last_errno = errno;
            continue;
        }
        if (::connect(fd, p->ai_addr, p->ai_addrlen) == 0)
        {
            m_fd = fd;
            break;
        }
        last_errno = errno;
        ::close(fd);
    }
    ::freeaddrinfo(p_result);

    if (m_fd < 0)
    {
        throw TransportError(TransportError::Kind::DEVICE_ACCESS,
                             fmt::format("Can't connect to bus bridge at {}:{}: {}", host, port, std::strerror(last_errno)));
    }

    BOOST_LOG_TRIVIAL(debug) << "Connected to bus bridge at " << host << ':' << port;
}

RemoteBus::~RemoteBus()
{
    if (m_fd >= 0)
    {
        ::close(m_fd);
    }
}

void RemoteBus::reset()
{
    transact("R");
}

void RemoteBus::listen(const DeviceChannel& dc)
{
    transact(address("L", dc));
}

void RemoteBus::talk(const DeviceChannel& dc)
{
    transact(address("T", dc));
}

void RemoteBus::unlisten()
{
    transact("UL");
}

void RemoteBus::untalk()
{
    transact("UT");
}

void RemoteBus::open(const DeviceChannel& dc)
{
    transact(address("O", dc));
}

void RemoteBus::close(const DeviceChannel& dc)
{
    transact(address("C", dc));
}

size_t RemoteBus::write(const Bytes& data)
{
    const auto payload = transact(data.empty() ? std::string("W") : "W " + encode_hex(data));
    const auto count = parse_hex_number(payload);
    if (!count)
    {
        throw TransportError(TransportError::Kind::COMMUNICATION, fmt::format("Malformed write count '{}'", payload));
    }
    return *count;
}

Bytes RemoteBus::read(size_t max)
{
    return decode_hex(transact(fmt::format("RD {:04X}", max)));
}

Bytes RemoteBus::read_until(size_t max, std::uint8_t terminator)
{
    return decode_hex(transact(fmt::format("RU {:04X} {:02X}", max, terminator)));
}

std::string RemoteBus::transact(const std::string& request)
{
    BOOST_LOG_TRIVIAL(trace) << "Bus > " << request;
    sendall(request + "\n");
    const auto line = receive_line();
    BOOST_LOG_TRIVIAL(trace) << "Bus < " << line;
    return parse_reply(line);
}

void RemoteBus::sendall(const std::string& s)
{
    auto to_send = s.size();
    const char* buffer = s.c_str();

    while (to_send > 0)
    {
        ssize_t res;
        while ((res = ::send(m_fd, buffer, to_send, MSG_NOSIGNAL)) < 0)
        {
            if (errno != EINTR)
            {
                throw TransportError(TransportError::Kind::COMMUNICATION,
                                     fmt::format("Send to bus bridge failed: {}", std::strerror(errno)));
            }
        }
        to_send -= res;
        buffer += res;
    }
}

std::string RemoteBus::receive_line()
{
    while (true)
    {
        if (const auto newline = m_pending.find('\n'); newline != std::string::npos)
        {
            auto line = m_pending.substr(0, newline);
            m_pending.erase(0, newline + 1);
            return line;
        }

        std::array<char, 256> buffer;
        ssize_t res;
        while ((res = ::recv(m_fd, buffer.data(), buffer.size(), 0)) <= 0)
        {
            if (res == 0)
            {
                throw TransportError(TransportError::Kind::COMMUNICATION, "Bus bridge closed the connection");
            }
            if (errno != EINTR)
            {
                throw TransportError(TransportError::Kind::COMMUNICATION,
                                     fmt::format("Receive from bus bridge failed: {}", std::strerror(errno)));
            }
        }
        m_pending.append(buffer.data(), res);
    }
}

} // namespace xcbm::bus
