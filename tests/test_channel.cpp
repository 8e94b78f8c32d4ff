#include <boost/test/unit_test.hpp>

#include <set>
#include <sstream>

#include <xcbm/core/channel.hpp>
#include <xcbm/core/error.hpp>
#include <xcbm/core/validate.hpp>

BOOST_AUTO_TEST_CASE(test_device_channel_validation)
{
    BOOST_CHECK_NO_THROW(xcbm::DeviceChannel(8, 0));
    BOOST_CHECK_NO_THROW(xcbm::DeviceChannel(30, 15));
    BOOST_CHECK_THROW(xcbm::DeviceChannel(7, 0), xcbm::ValidationError);
    BOOST_CHECK_THROW(xcbm::DeviceChannel(31, 0), xcbm::ValidationError);
    BOOST_CHECK_THROW(xcbm::DeviceChannel(8, 16), xcbm::ValidationError);

    std::ostringstream ss;
    ss << xcbm::DeviceChannel(9, 15);
    BOOST_CHECK_EQUAL(ss.str(), "9/15");

    BOOST_CHECK(xcbm::DeviceChannel(8, 2) == xcbm::DeviceChannel(8, 2));
    BOOST_CHECK(!(xcbm::DeviceChannel(8, 2) == xcbm::DeviceChannel(9, 2)));
}

BOOST_AUTO_TEST_CASE(test_reset_purpose_uses_command_channel)
{
    xcbm::ChannelManager channels;
    const auto channel = channels.allocate(xcbm::ChannelPurpose::RESET);
    BOOST_REQUIRE(channel.has_value());
    BOOST_CHECK_EQUAL(*channel, xcbm::CHANNEL_CTRL);
    BOOST_CHECK(channels.purpose_of(xcbm::CHANNEL_CTRL) == xcbm::ChannelPurpose::RESET);

    // Only one holder of channel 15 at a time
    BOOST_CHECK(!channels.allocate(xcbm::ChannelPurpose::RESET).has_value());
    channels.free(xcbm::CHANNEL_CTRL);
    BOOST_CHECK(channels.allocate(xcbm::ChannelPurpose::RESET).has_value());
}

BOOST_AUTO_TEST_CASE(test_allocation_never_duplicates)
{
    xcbm::ChannelManager channels;
    std::set<std::uint8_t> seen;
    for (int i = 0; i < 15; ++i)
    {
        const auto channel = channels.allocate(xcbm::ChannelPurpose::FILE_READ);
        BOOST_REQUIRE(channel.has_value());
        BOOST_CHECK(*channel < xcbm::CHANNEL_CTRL);
        BOOST_CHECK(seen.insert(*channel).second);
    }
    BOOST_CHECK_EQUAL(channels.allocated_count(), 15);

    // 0..14 are all taken and 15 is never handed out for ordinary use
    BOOST_CHECK(!channels.allocate(xcbm::ChannelPurpose::DIRECTORY).has_value());
    BOOST_CHECK(!channels.is_allocated(xcbm::CHANNEL_CTRL));

    // A freed channel is the next one handed out
    channels.free(6);
    BOOST_CHECK(!channels.is_allocated(6));
    const auto again = channels.allocate(xcbm::ChannelPurpose::FILE_WRITE);
    BOOST_REQUIRE(again.has_value());
    BOOST_CHECK_EQUAL(*again, 6);
    BOOST_CHECK(channels.purpose_of(6) == xcbm::ChannelPurpose::FILE_WRITE);
}

BOOST_AUTO_TEST_CASE(test_lowest_free_channel_first)
{
    xcbm::ChannelManager channels;
    BOOST_CHECK_EQUAL(*channels.allocate(xcbm::ChannelPurpose::DIRECTORY), 0);
    BOOST_CHECK_EQUAL(*channels.allocate(xcbm::ChannelPurpose::FILE_READ), 1);
    BOOST_CHECK_EQUAL(*channels.allocate(xcbm::ChannelPurpose::COMMAND), 2);
}

BOOST_AUTO_TEST_CASE(test_sequence_numbers)
{
    xcbm::ChannelManager channels;
    const auto first = channels.allocate(xcbm::ChannelPurpose::FILE_READ);
    const auto second = channels.allocate(xcbm::ChannelPurpose::FILE_READ);
    BOOST_CHECK_EQUAL(*channels.sequence_of(*first), 1);
    BOOST_CHECK_EQUAL(*channels.sequence_of(*second), 2);
    BOOST_CHECK(!channels.sequence_of(9).has_value());

    channels.free(*first);
    const auto third = channels.allocate(xcbm::ChannelPurpose::FILE_READ);
    BOOST_CHECK_EQUAL(*third, *first);
    BOOST_CHECK_EQUAL(*channels.sequence_of(*third), 3);
}

BOOST_AUTO_TEST_CASE(test_reset_is_idempotent)
{
    xcbm::ChannelManager channels;
    (void)channels.allocate(xcbm::ChannelPurpose::RESET);
    (void)channels.allocate(xcbm::ChannelPurpose::FILE_READ);

    channels.reset();
    BOOST_CHECK_EQUAL(channels.allocated_count(), 0);
    channels.reset();
    BOOST_CHECK_EQUAL(channels.allocated_count(), 0);

    const auto channel = channels.allocate(xcbm::ChannelPurpose::FILE_READ);
    BOOST_CHECK_EQUAL(*channel, 0);
    BOOST_CHECK_EQUAL(*channels.sequence_of(*channel), 1);

    // Freeing something that isn't allocated, or doesn't exist, is harmless
    channels.free(12);
    channels.free(200);
    BOOST_CHECK_EQUAL(channels.allocated_count(), 1);
}
