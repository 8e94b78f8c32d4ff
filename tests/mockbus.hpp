#pragma once

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/format.hpp>

#include <xcbm/core/error.hpp>
#include <xcbm/core/ibus.hpp>

// A scripted stand-in for the bus adapter.  Every verb is recorded as a line of text, reads are answered from a
// queue of canned replies (an empty reply once the queue runs dry), and chosen verbs can be made to fail.

namespace xcbm::test
{

struct MockBusState
{
    std::vector<std::string> m_calls;
    std::deque<Bytes> m_replies;

    // Recorded call text (e.g. "listen 9/15") mapped to the failure it should raise
    std::map<std::string, TransportError::Kind> m_failures;

    // If set, write() accepts no more than this many bytes
    std::optional<size_t> m_write_limit;

    size_t m_buses_created = 0;
    bool m_factory_fails = false;

    void reply(const std::string& s)
    {
        m_replies.emplace_back(s.begin(), s.end());
    }

    void reply(const Bytes& b)
    {
        m_replies.push_back(b);
    }

    // The replies for one byte-at-a-time memory read, including the status read which follows it
    void reply_memory(const Bytes& bytes)
    {
        for (const auto b : bytes)
        {
            m_replies.push_back({ b });
        }
        reply("99,DRIVE MEMORY,00\r");
    }

    [[nodiscard]] size_t count(const std::string& call) const
    {
        size_t n = 0;
        for (const auto& c : m_calls)
        {
            if (c == call)
            {
                ++n;
            }
        }
        return n;
    }
};

class MockBus final : public IBus
{
public:
    explicit MockBus(std::shared_ptr<MockBusState> p_state) : m_p_state(std::move(p_state))
    {
    }

    void reset() override
    {
        record("reset");
    }

    void listen(const DeviceChannel& dc) override
    {
        record("listen " + str(dc));
    }

    void talk(const DeviceChannel& dc) override
    {
        record("talk " + str(dc));
    }

    void unlisten() override
    {
        record("unlisten");
    }

    void untalk() override
    {
        record("untalk");
    }

    void open(const DeviceChannel& dc) override
    {
        record("open " + str(dc));
    }

    void close(const DeviceChannel& dc) override
    {
        record("close " + str(dc));
    }

    size_t write(const Bytes& data) override
    {
        std::string text = "write";
        for (const auto b : data)
        {
            text += (boost::format(" %02X") % static_cast<unsigned int>(b)).str();
        }
        record(text);
        if (m_p_state->m_write_limit && (*m_p_state->m_write_limit < data.size()))
        {
            return *m_p_state->m_write_limit;
        }
        return data.size();
    }

    Bytes read(size_t max) override
    {
        record("read " + std::to_string(max));
        return next_reply();
    }

    Bytes read_until(size_t max, std::uint8_t /*terminator*/) override
    {
        record("read_until " + std::to_string(max));
        return next_reply();
    }

private:
    static std::string str(const DeviceChannel& dc)
    {
        std::ostringstream ss;
        ss << dc;
        return ss.str();
    }

    void record(const std::string& call)
    {
        m_p_state->m_calls.push_back(call);
        const auto it = m_p_state->m_failures.find(call);
        if (it != m_p_state->m_failures.end())
        {
            throw TransportError(it->second, "Scripted failure of " + call, 0);
        }
    }

    Bytes next_reply()
    {
        if (m_p_state->m_replies.empty())
        {
            return {};
        }
        auto reply = m_p_state->m_replies.front();
        m_p_state->m_replies.pop_front();
        return reply;
    }

    std::shared_ptr<MockBusState> m_p_state;
};

// A factory for Cbm which hands out MockBus instances sharing the given state
inline BusFactory mock_factory(const std::shared_ptr<MockBusState>& p_state)
{
    return [p_state]() -> std::unique_ptr<IBus>
    {
        if (p_state->m_factory_fails)
        {
            throw TransportError(TransportError::Kind::DEVICE_ACCESS, "Scripted failure to open the adapter");
        }
        ++p_state->m_buses_created;
        return std::make_unique<MockBus>(p_state);
    };
}

// Bytes from text, without any character set translation
inline Bytes bytes_of(const std::string& s)
{
    return Bytes(s.begin(), s.end());
}

} // namespace xcbm::test
