#include <boost/test/unit_test.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <xcbm/core/driveunit.hpp>
#include <xcbm/core/error.hpp>

#include "mockbus.hpp"

namespace
{

using xcbm::test::MockBusState;

const std::string OK_STATUS = "00, OK,00,00\r";
const std::string NOT_READY_STATUS = "74,DRIVE NOT READY,00,00\r";

xcbm::DriveUnit make_unit(xcbm::CbmDeviceType type, std::uint8_t device = 8)
{
    return xcbm::DriveUnit(device, xcbm::CbmDeviceInfo{ type, "test" });
}

// A "$" load image with just a header and a blocks free line
xcbm::Bytes empty_directory()
{
    return { 0x01, 0x04, 0x01, 0x01, 0x00, 0x00, 0x12, '"', 'E', 'M', 'P', 'T', 'Y', '"', ' ', 'E', '1', ' ',
             '2', 'A', 0x00, 0x01, 0x01, 0x98, 0x02, 'B', 'L', 'O', 'C', 'K', 'S', ' ', 'F', 'R', 'E', 'E', '.',
             0x00, 0x00, 0x00 };
}

// The replies for one successful "$" load
void reply_directory(MockBusState& state)
{
    state.reply(OK_STATUS);
    state.reply(empty_directory());
    state.reply(xcbm::Bytes{});
    state.reply(OK_STATUS);
}

} // namespace

BOOST_AUTO_TEST_CASE(test_unit_properties)
{
    auto unit = make_unit(xcbm::CbmDeviceType::CBM1541);
    BOOST_CHECK_EQUAL(unit.device(), 8);
    BOOST_CHECK_EQUAL(unit.num_disk_drives(), 1);
    BOOST_CHECK(!unit.is_busy());
    BOOST_CHECK_EQUAL(unit.channels().allocated_count(), 0);

    std::ostringstream ss;
    ss << unit;
    BOOST_CHECK_EQUAL(ss.str(), "Drive 8 (CBM 1541)");

    BOOST_CHECK_EQUAL(make_unit(xcbm::CbmDeviceType::CBM4040).num_disk_drives(), 2);
    BOOST_CHECK_EQUAL(make_unit(xcbm::CbmDeviceType::UNKNOWN).num_disk_drives(), 0);
}

BOOST_AUTO_TEST_CASE(test_try_from_bus)
{
    auto p_state = std::make_shared<MockBusState>();
    xcbm::Cbm cbm(xcbm::test::mock_factory(p_state));

    p_state->m_failures["listen 9/15"] = xcbm::TransportError::Kind::STATUS_VALUE;
    try
    {
        (void)xcbm::DriveUnit::try_from_bus(cbm, 9);
        BOOST_ERROR("Expected a device error");
    }
    catch (const xcbm::DeviceError& e)
    {
        BOOST_CHECK(e.kind() == xcbm::DeviceError::Kind::NO_DEVICE);
    }

    p_state->reply_memory({ 0xAC, 0x02 });
    const auto unit = xcbm::DriveUnit::try_from_bus(cbm, 8);
    BOOST_CHECK(unit.info().m_device_type == xcbm::CbmDeviceType::CBM1571);
}

BOOST_AUTO_TEST_CASE(test_send_init_single_drive)
{
    auto p_state = std::make_shared<MockBusState>();
    xcbm::Cbm cbm(xcbm::test::mock_factory(p_state));
    auto unit = make_unit(xcbm::CbmDeviceType::CBM1541);

    p_state->reply(OK_STATUS);
    const auto results = unit.send_init(cbm, {});
    BOOST_REQUIRE_EQUAL(results.size(), 1);
    BOOST_CHECK(results[0].ok());
    BOOST_CHECK_EQUAL(results[0].m_drive_num, 0);
    BOOST_CHECK_NO_THROW(results[0].rethrow());
    BOOST_CHECK(p_state->m_calls == std::vector<std::string>({ "listen 8/15",
                                                               "write 49 30",
                                                               "unlisten",
                                                               "talk 8/15",
                                                               "read_until 64",
                                                               "untalk" }));

    // Initialising only uses the command channel, so nothing is leased
    BOOST_CHECK_EQUAL(unit.channels().allocated_count(), 0);
    BOOST_CHECK(!unit.is_busy());
}

BOOST_AUTO_TEST_CASE(test_send_init_dual_drive)
{
    auto p_state = std::make_shared<MockBusState>();
    xcbm::Cbm cbm(xcbm::test::mock_factory(p_state));
    auto unit = make_unit(xcbm::CbmDeviceType::CBM4040);

    // Drive 0 has no disk; drive 1 is fine
    p_state->reply(NOT_READY_STATUS);
    p_state->reply(OK_STATUS);
    const auto results = unit.send_init(cbm, {});
    BOOST_REQUIRE_EQUAL(results.size(), 2);
    BOOST_CHECK(!results[0].ok());
    BOOST_CHECK(results[1].ok());
    BOOST_CHECK_EQUAL(results[1].m_drive_num, 1);
    BOOST_CHECK_EQUAL(p_state->count("write 49 31"), 1);
    try
    {
        results[0].rethrow();
        BOOST_ERROR("Expected a status error");
    }
    catch (const xcbm::StatusError& e)
    {
        BOOST_CHECK(e.status().error_number() == xcbm::CbmErrorNumber::DRIVE_NOT_READY);
    }

    // The same statuses, but with "drive not ready" accepted
    p_state->reply(NOT_READY_STATUS);
    p_state->reply(OK_STATUS);
    const auto tolerant = unit.send_init(cbm, { xcbm::CbmErrorNumber::DRIVE_NOT_READY });
    BOOST_REQUIRE_EQUAL(tolerant.size(), 2);
    BOOST_CHECK(tolerant[0].ok());
    BOOST_CHECK(tolerant[0].m_status->error_number() == xcbm::CbmErrorNumber::DRIVE_NOT_READY);
    BOOST_CHECK(tolerant[1].ok());
}

BOOST_AUTO_TEST_CASE(test_send_init_carries_on_after_failure)
{
    auto p_state = std::make_shared<MockBusState>();
    xcbm::Cbm cbm(xcbm::test::mock_factory(p_state));
    auto unit = make_unit(xcbm::CbmDeviceType::CBM8050);

    // Drive 0 says nothing at all
    p_state->reply(xcbm::Bytes{});
    p_state->reply(OK_STATUS);
    const auto results = unit.send_init(cbm, {});
    BOOST_REQUIRE_EQUAL(results.size(), 2);
    BOOST_CHECK(!results[0].ok());
    BOOST_CHECK_THROW(results[0].rethrow(), xcbm::DeviceError);
    BOOST_CHECK(results[1].ok());
}

BOOST_AUTO_TEST_CASE(test_dir_single_drive)
{
    auto p_state = std::make_shared<MockBusState>();
    xcbm::Cbm cbm(xcbm::test::mock_factory(p_state));
    auto unit = make_unit(xcbm::CbmDeviceType::CBM1541);

    reply_directory(*p_state);
    p_state->reply(OK_STATUS);
    const auto result = unit.dir(cbm);
    BOOST_REQUIRE_EQUAL(result.m_listings.size(), 1);
    BOOST_CHECK_EQUAL(result.m_listings[0].header().m_name, "empty");
    BOOST_CHECK_EQUAL(result.m_listings[0].blocks_free(), 664);
    BOOST_CHECK(result.m_status.is_ok() == xcbm::StatusClass::OK);

    // A single drive unit is asked for plain "$"
    BOOST_CHECK_EQUAL(p_state->count("write 24"), 1);
    BOOST_CHECK(p_state->m_replies.empty());
}

BOOST_AUTO_TEST_CASE(test_dir_dual_drive_keeps_first_status_error)
{
    auto p_state = std::make_shared<MockBusState>();
    xcbm::Cbm cbm(xcbm::test::mock_factory(p_state));
    auto unit = make_unit(xcbm::CbmDeviceType::CBM4040);

    p_state->reply(NOT_READY_STATUS);
    reply_directory(*p_state);
    const auto result = unit.dir(cbm);
    BOOST_REQUIRE_EQUAL(result.m_listings.size(), 1);
    BOOST_CHECK(result.m_status.error_number() == xcbm::CbmErrorNumber::DRIVE_NOT_READY);
    BOOST_CHECK_EQUAL(p_state->count("write 24 30"), 1);
    BOOST_CHECK_EQUAL(p_state->count("write 24 31"), 1);
    BOOST_CHECK(p_state->m_replies.empty());
}

BOOST_AUTO_TEST_CASE(test_dir_skips_silent_drive)
{
    auto p_state = std::make_shared<MockBusState>();
    xcbm::Cbm cbm(xcbm::test::mock_factory(p_state));
    auto unit = make_unit(xcbm::CbmDeviceType::CBM4040);

    p_state->reply(xcbm::Bytes{});
    reply_directory(*p_state);
    p_state->reply(OK_STATUS);
    const auto result = unit.dir(cbm);
    BOOST_CHECK_EQUAL(result.m_listings.size(), 1);
    BOOST_CHECK(result.m_status.is_ok() == xcbm::StatusClass::OK);
}

BOOST_AUTO_TEST_CASE(test_dir_propagates_transport_errors)
{
    auto p_state = std::make_shared<MockBusState>();
    xcbm::Cbm cbm(xcbm::test::mock_factory(p_state));
    auto unit = make_unit(xcbm::CbmDeviceType::CBM1541);

    p_state->m_failures["open 8/0"] = xcbm::TransportError::Kind::TIMEOUT;
    BOOST_CHECK_THROW((void)unit.dir(cbm), xcbm::TransportError);
    BOOST_CHECK(!unit.is_busy());
    BOOST_CHECK_EQUAL(unit.channels().allocated_count(), 0);
}

BOOST_AUTO_TEST_CASE(test_file_transfer_uses_data_channel)
{
    auto p_state = std::make_shared<MockBusState>();
    xcbm::Cbm cbm(xcbm::test::mock_factory(p_state));
    auto unit = make_unit(xcbm::CbmDeviceType::CBM1541);

    p_state->reply(OK_STATUS);
    p_state->reply(xcbm::Bytes{ 0x01, 0x08 });
    p_state->reply(xcbm::Bytes{});
    const auto bytes = unit.read_file(cbm, xcbm::AsciiString("prog"));
    BOOST_CHECK(bytes == xcbm::Bytes({ 0x01, 0x08 }));
    BOOST_CHECK_EQUAL(p_state->count("open 8/2"), 1);
    BOOST_CHECK_EQUAL(p_state->count("close 8/2"), 1);

    p_state->reply(OK_STATUS);
    p_state->reply(OK_STATUS);
    unit.write_file(cbm, xcbm::AsciiString("copy"), bytes);
    BOOST_CHECK_EQUAL(p_state->count("listen 8/2"), 1);
    BOOST_CHECK_EQUAL(unit.channels().allocated_count(), 0);
}

BOOST_AUTO_TEST_CASE(test_failed_read_releases_channel)
{
    auto p_state = std::make_shared<MockBusState>();
    xcbm::Cbm cbm(xcbm::test::mock_factory(p_state));
    auto unit = make_unit(xcbm::CbmDeviceType::CBM1541);

    p_state->reply("62,FILE NOT FOUND,00,00\r");
    BOOST_CHECK_THROW((void)unit.read_file(cbm, xcbm::AsciiString("missing")), xcbm::StatusError);
    BOOST_CHECK_EQUAL(unit.channels().allocated_count(), 0);
    BOOST_CHECK(!unit.is_busy());

    unit.reset();
    BOOST_CHECK_EQUAL(unit.channels().allocated_count(), 0);
}
