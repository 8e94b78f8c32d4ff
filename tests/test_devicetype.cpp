#include <boost/test/unit_test.hpp>

#include <sstream>

#include <xcbm/core/devicetype.hpp>

BOOST_AUTO_TEST_CASE(test_154x_family)
{
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0xAAAA).m_device_type == xcbm::CbmDeviceType::CBM1541);
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0xAAAA, 0x1234).m_device_type == xcbm::CbmDeviceType::CBM1541);
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0xAAAA, 0x3156).m_device_type == xcbm::CbmDeviceType::CBM1540);
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0xAAAA, 0xFEB6).m_device_type == xcbm::CbmDeviceType::CBM2031);
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0xFEB6).m_device_type == xcbm::CbmDeviceType::CBM2031);
}

BOOST_AUTO_TEST_CASE(test_1541_variants)
{
    const auto jiffy = xcbm::CbmDeviceInfo::from_magic(0x8085);
    BOOST_CHECK(jiffy.m_device_type == xcbm::CbmDeviceType::CBM1541);
    BOOST_CHECK_EQUAL(jiffy.m_description, "JiffyDOS 1541");

    BOOST_CHECK_EQUAL(xcbm::CbmDeviceInfo::from_magic(0xF00F).m_description, "1541-II");
    BOOST_CHECK_EQUAL(xcbm::CbmDeviceInfo::from_magic(0x10CA).m_description, "DolphinDOS 1541");
}

BOOST_AUTO_TEST_CASE(test_other_drives)
{
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0x02AC).m_device_type == xcbm::CbmDeviceType::CBM1571);
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0xFED7).m_device_type == xcbm::CbmDeviceType::CBM1570);
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0x01BA).m_device_type == xcbm::CbmDeviceType::CBM1581);
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0x01BA, 0x4446).m_device_type == xcbm::CbmDeviceType::FDX000);
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0xC320).m_device_type == xcbm::CbmDeviceType::CBM4040);
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0x20F8).m_device_type == xcbm::CbmDeviceType::CBM4040);
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0xF2E9).m_device_type == xcbm::CbmDeviceType::CBM8050);
    BOOST_CHECK(xcbm::CbmDeviceInfo::from_magic(0xC611).m_device_type == xcbm::CbmDeviceType::CBM8250);
}

BOOST_AUTO_TEST_CASE(test_unknown_magic)
{
    const auto info = xcbm::CbmDeviceInfo::from_magic(0x1234);
    BOOST_CHECK(info.m_device_type == xcbm::CbmDeviceType::UNKNOWN);
    BOOST_CHECK_EQUAL(info.m_description, "Unknown device: 1234");

    BOOST_CHECK_EQUAL(xcbm::CbmDeviceInfo::from_magic(0xBEEF, 0x00AB).m_description, "Unknown device: beef 00ab");

    // Identification is a pure function of the signatures
    BOOST_CHECK_EQUAL(xcbm::CbmDeviceInfo::from_magic(0x8050).m_description,
                      xcbm::CbmDeviceInfo::from_magic(0x8050).m_description);
}

BOOST_AUTO_TEST_CASE(test_device_type_properties)
{
    BOOST_CHECK_EQUAL(xcbm::num_disk_drives(xcbm::CbmDeviceType::CBM1541), 1);
    BOOST_CHECK_EQUAL(xcbm::num_disk_drives(xcbm::CbmDeviceType::CBM4040), 2);
    BOOST_CHECK_EQUAL(xcbm::num_disk_drives(xcbm::CbmDeviceType::CBM8250), 2);
    BOOST_CHECK_EQUAL(xcbm::num_disk_drives(xcbm::CbmDeviceType::UNKNOWN), 0);

    BOOST_CHECK(xcbm::dos_version(xcbm::CbmDeviceType::CBM2040) == xcbm::DosVersion::DOS1);
    BOOST_CHECK(xcbm::dos_version(xcbm::CbmDeviceType::CBM1541) == xcbm::DosVersion::DOS2);
    BOOST_CHECK(xcbm::dos_version(xcbm::CbmDeviceType::CBM1581) == xcbm::DosVersion::DOS3);

    BOOST_CHECK_EQUAL(xcbm::to_fs_name(xcbm::CbmDeviceType::CBM1571), "CBM_1571");

    std::ostringstream ss;
    ss << xcbm::CbmDeviceType::CBM1541 << ", " << xcbm::CbmDeviceType::SFD1001;
    BOOST_CHECK_EQUAL(ss.str(), "CBM 1541, SFD 1001");
}
