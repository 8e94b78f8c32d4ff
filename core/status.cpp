#include "status.hpp"

#include "error.hpp"

#include <charconv>
#include <string>
#include <tuple>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <fmt/core.h>

namespace
{
    // Returns (success,value) for a numeric status field, which may be padded with spaces
    std::tuple<bool, std::uint8_t> parse_field(const std::string& field)
    {
        const auto trimmed = boost::algorithm::trim_copy(field);
        unsigned int value = 0;
        const auto* const end = trimmed.data() + trimmed.size();
        const auto [ptr, ec] = std::from_chars(trimmed.data(), end, value);
        if (trimmed.empty() || (ec != std::errc()) || (ptr != end) || (value > 0xFF))
        {
            return { false, 0 };
        }
        return { true, static_cast<std::uint8_t>(value) };
    }

} // namespace

namespace xcbm
{

CbmErrorNumber to_error_number(std::uint8_t number)
{
    switch (number)
    {
    case 0:
    case 1:
    case 2:
    case 20:
    case 21:
    case 22:
    case 23:
    case 24:
    case 25:
    case 26:
    case 27:
    case 28:
    case 29:
    case 30:
    case 31:
    case 32:
    case 33:
    case 34:
    case 39:
    case 50:
    case 51:
    case 52:
    case 60:
    case 61:
    case 62:
    case 63:
    case 64:
    case 65:
    case 66:
    case 67:
    case 70:
    case 71:
    case 72:
    case 73:
    case 74:
    case 75:
    case 76:
    case 77: return static_cast<CbmErrorNumber>(number);
    default: return CbmErrorNumber::UNKNOWN;
    }
}

std::string_view describe(CbmErrorNumber en)
{
    switch (en)
    {
    case CbmErrorNumber::OK: return "OK";
    case CbmErrorNumber::FILES_SCRATCHED: return "FILES SCRATCHED";
    case CbmErrorNumber::PARTITION_SELECTED: return "PARTITION SELECTED";
    case CbmErrorNumber::READ_ERROR_BLOCK_HEADER_NOT_FOUND: return "READ ERROR (block header not found)";
    case CbmErrorNumber::READ_ERROR_NO_SYNC_CHARACTER: return "READ ERROR (no sync character)";
    case CbmErrorNumber::READ_ERROR_DATA_BLOCK_NOT_PRESENT: return "READ ERROR (data block not present)";
    case CbmErrorNumber::READ_ERROR_CHECKSUM_ERROR_IN_DATA_BLOCK: return "READ ERROR (checksum error in data block)";
    case CbmErrorNumber::READ_ERROR_BYTE_DECODING_ERROR: return "READ ERROR (byte decoding error)";
    case CbmErrorNumber::WRITE_ERROR_WRITE_VERIFY_ERROR: return "WRITE ERROR (write verify error)";
    case CbmErrorNumber::WRITE_PROTECT_ON: return "WRITE PROTECT ON";
    case CbmErrorNumber::READ_ERROR_CHECKSUM_ERROR_IN_HEADER: return "READ ERROR (checksum error in header)";
    case CbmErrorNumber::WRITE_ERROR_LONG_DATA_BLOCK: return "WRITE ERROR (long data block)";
    case CbmErrorNumber::DISK_ID_MISMATCH: return "DISK ID MISMATCH";
    case CbmErrorNumber::SYNTAX_ERROR_GENERAL_SYNTAX: return "SYNTAX ERROR (general syntax)";
    case CbmErrorNumber::SYNTAX_ERROR_INVALID_COMMAND: return "SYNTAX ERROR (invalid command)";
    case CbmErrorNumber::SYNTAX_ERROR_LONG_LINE: return "SYNTAX ERROR (long line)";
    case CbmErrorNumber::SYNTAX_ERROR_INVALID_FILE_NAME: return "SYNTAX ERROR (invalid file name)";
    case CbmErrorNumber::SYNTAX_ERROR_NO_FILE_GIVEN: return "SYNTAX ERROR (no file given)";
    case CbmErrorNumber::SYNTAX_ERROR_INVALID_COMMAND_CHANNEL_15: return "SYNTAX ERROR (invalid command on channel 15)";
    case CbmErrorNumber::RECORD_NOT_PRESENT: return "RECORD NOT PRESENT";
    case CbmErrorNumber::OVERFLOW_IN_RECORD: return "OVERFLOW IN RECORD";
    case CbmErrorNumber::FILE_TOO_LARGE: return "FILE TOO LARGE";
    case CbmErrorNumber::WRITE_FILE_OPEN: return "WRITE FILE OPEN";
    case CbmErrorNumber::FILE_NOT_OPEN: return "FILE NOT OPEN";
    case CbmErrorNumber::FILE_NOT_FOUND: return "FILE NOT FOUND";
    case CbmErrorNumber::FILE_EXISTS: return "FILE EXISTS";
    case CbmErrorNumber::FILE_TYPE_MISMATCH: return "FILE TYPE MISMATCH";
    case CbmErrorNumber::NO_BLOCK: return "NO BLOCK";
    case CbmErrorNumber::ILLEGAL_TRACK_AND_SECTOR: return "ILLEGAL TRACK AND SECTOR";
    case CbmErrorNumber::ILLEGAL_SYSTEM_T_OR_S: return "ILLEGAL SYSTEM T OR S";
    case CbmErrorNumber::NO_CHANNEL: return "NO CHANNEL";
    case CbmErrorNumber::DIRECTORY_ERROR: return "DIRECTORY ERROR";
    case CbmErrorNumber::DISK_FULL: return "DISK FULL";
    case CbmErrorNumber::DOS_MISMATCH: return "DOS MISMATCH";
    case CbmErrorNumber::DRIVE_NOT_READY: return "DRIVE NOT READY";
    case CbmErrorNumber::FORMAT_ERROR: return "FORMAT ERROR";
    case CbmErrorNumber::CONTROLLER_ERROR: return "CONTROLLER ERROR";
    case CbmErrorNumber::SELECTED_PARTITION_ILLEGAL: return "SELECTED PARTITION ILLEGAL";
    case CbmErrorNumber::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, CbmErrorNumber en)
{
    return os << describe(en);
}

CbmStatus::CbmStatus(std::uint8_t number, std::string message, std::uint8_t track, std::uint8_t sector, std::uint8_t device)
    : m_number(number),
      m_error_number(to_error_number(number)),
      m_message(std::move(message)),
      m_track(track),
      m_sector(sector),
      m_device(device)
{
}

CbmStatus CbmStatus::parse(std::string_view text, std::uint8_t device)
{
    BOOST_LOG_TRIVIAL(trace) << "Received device status from device " << static_cast<int>(device) << ": " << text;

    const auto clean = std::string(text.substr(0, text.find('\r')));
    BOOST_LOG_TRIVIAL(debug) << "Cleaned device status: " << clean << ", length " << clean.size();

    if (clean.empty())
    {
        throw ParseError(fmt::format("Device {} provided zero length status string", device));
    }

    std::vector<std::string> parts;
    boost::split(parts, clean, boost::is_any_of(","));
    if (parts.size() != 4)
    {
        throw ParseError(fmt::format("Device {} supplied status format: {}", device, clean));
    }

    const auto [number_ok, number] = parse_field(parts[0]);
    if (!number_ok)
    {
        throw ParseError(fmt::format("Device {}: Invalid error number: {} within status: {}", device, parts[0], clean));
    }
    const auto [track_ok, track] = parse_field(parts[2]);
    if (!track_ok)
    {
        throw ParseError(fmt::format("Device {}: Invalid track: {} within status: {}", device, parts[2], clean));
    }
    const auto [sector_ok, sector] = parse_field(parts[3]);
    if (!sector_ok)
    {
        throw ParseError(fmt::format("Device {}: Invalid sector: {} within status: {}", device, parts[3], clean));
    }

    CbmStatus result(number, boost::algorithm::trim_copy(parts[1]), track, sector, device);
    if (!result.is_valid_cbm())
    {
        BOOST_LOG_TRIVIAL(warning) << "Unknown error number returned by drive " << static_cast<int>(device) << ": "
                                   << static_cast<int>(number);
    }
    return result;
}

std::uint8_t CbmStatus::number() const
{
    return m_number;
}

CbmErrorNumber CbmStatus::error_number() const
{
    return m_error_number;
}

const std::string& CbmStatus::message() const
{
    return m_message;
}

std::uint8_t CbmStatus::raw_track() const
{
    return m_track;
}

std::uint8_t CbmStatus::raw_sector() const
{
    return m_sector;
}

std::uint8_t CbmStatus::device() const
{
    return m_device;
}

StatusClass CbmStatus::is_ok() const
{
    if (m_number < 20)
    {
        return StatusClass::OK;
    }
    if (m_number == 73)
    {
        return StatusClass::NUMBER_73;
    }
    return StatusClass::ERR;
}

bool CbmStatus::is_valid_cbm() const
{
    return m_error_number != CbmErrorNumber::UNKNOWN;
}

std::optional<std::uint8_t> CbmStatus::track() const
{
    if ((m_number >= 20) && (m_number <= 29))
    {
        return m_track;
    }
    return {};
}

std::optional<std::uint8_t> CbmStatus::sector() const
{
    if ((m_number >= 20) && (m_number <= 29))
    {
        return m_sector;
    }
    return {};
}

std::optional<std::uint8_t> CbmStatus::files_scratched() const
{
    if (m_error_number == CbmErrorNumber::FILES_SCRATCHED)
    {
        return m_track;
    }
    return {};
}

std::string CbmStatus::as_short_str() const
{
    return (boost::format("%02u,%s") % static_cast<unsigned int>(m_number) % m_message).str();
}

std::string CbmStatus::as_str() const
{
    return (boost::format("%02u,%s,%02u,%02u") % static_cast<unsigned int>(m_number) % m_message %
            static_cast<unsigned int>(m_track) % static_cast<unsigned int>(m_sector))
        .str();
}

void CbmStatus::check() const
{
    if (is_ok() != StatusClass::OK)
    {
        throw StatusError(*this);
    }
}

void CbmStatus::check_73_ok() const
{
    if (is_ok() != StatusClass::NUMBER_73)
    {
        throw StatusError(*this);
    }
}

bool CbmStatus::operator==(const CbmStatus& other) const
{
    return (m_number == other.m_number) && (m_message == other.m_message) && (m_track == other.m_track) &&
           (m_sector == other.m_sector) && (m_device == other.m_device);
}

std::ostream& operator<<(std::ostream& os, const CbmStatus& status)
{
    return os << status.as_str();
}

} // namespace xcbm
