#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace xcbm
{

// Error numbers (the "EN" field) that CBM DOS reports on the command channel
enum class CbmErrorNumber
{
    OK = 0,
    FILES_SCRATCHED = 1,
    PARTITION_SELECTED = 2,
    READ_ERROR_BLOCK_HEADER_NOT_FOUND = 20,
    READ_ERROR_NO_SYNC_CHARACTER = 21,
    READ_ERROR_DATA_BLOCK_NOT_PRESENT = 22,
    READ_ERROR_CHECKSUM_ERROR_IN_DATA_BLOCK = 23,
    READ_ERROR_BYTE_DECODING_ERROR = 24,
    WRITE_ERROR_WRITE_VERIFY_ERROR = 25,
    WRITE_PROTECT_ON = 26,
    READ_ERROR_CHECKSUM_ERROR_IN_HEADER = 27,
    WRITE_ERROR_LONG_DATA_BLOCK = 28,
    DISK_ID_MISMATCH = 29,
    SYNTAX_ERROR_GENERAL_SYNTAX = 30,
    SYNTAX_ERROR_INVALID_COMMAND = 31,
    SYNTAX_ERROR_LONG_LINE = 32,
    SYNTAX_ERROR_INVALID_FILE_NAME = 33,
    SYNTAX_ERROR_NO_FILE_GIVEN = 34,
    SYNTAX_ERROR_INVALID_COMMAND_CHANNEL_15 = 39,
    RECORD_NOT_PRESENT = 50,
    OVERFLOW_IN_RECORD = 51,
    FILE_TOO_LARGE = 52,
    WRITE_FILE_OPEN = 60,
    FILE_NOT_OPEN = 61,
    FILE_NOT_FOUND = 62,
    FILE_EXISTS = 63,
    FILE_TYPE_MISMATCH = 64,
    NO_BLOCK = 65,
    ILLEGAL_TRACK_AND_SECTOR = 66,
    ILLEGAL_SYSTEM_T_OR_S = 67,
    NO_CHANNEL = 70,
    DIRECTORY_ERROR = 71,
    DISK_FULL = 72,
    DOS_MISMATCH = 73,
    DRIVE_NOT_READY = 74,
    FORMAT_ERROR = 75,
    CONTROLLER_ERROR = 76,
    SELECTED_PARTITION_ILLEGAL = 77,
    UNKNOWN = 255
};

// Maps a raw number onto the enumeration; anything not recognised becomes UNKNOWN
CbmErrorNumber to_error_number(std::uint8_t number);

// Human readable description, e.g. "READ ERROR (no sync character)"
std::string_view describe(CbmErrorNumber en);

std::ostream& operator<<(std::ostream& os, CbmErrorNumber en);

// Coarse classification of a status.  73 is what drives report after power on or reset, and for most
// purposes it is informational rather than an error.
enum class StatusClass
{
    OK,
    NUMBER_73,
    ERR
};

class CbmStatus final
{
public:
    // Parse the raw text read from the command channel.  Anything from the first carriage return onwards is
    // discarded.  Throws ParseError if the text isn't "EN,message,track,sector".
    static CbmStatus parse(std::string_view text, std::uint8_t device);

    [[nodiscard]] std::uint8_t number() const;
    [[nodiscard]] CbmErrorNumber error_number() const;
    [[nodiscard]] const std::string& message() const;
    [[nodiscard]] std::uint8_t raw_track() const;
    [[nodiscard]] std::uint8_t raw_sector() const;
    [[nodiscard]] std::uint8_t device() const;

    [[nodiscard]] StatusClass is_ok() const;

    // False if the drive supplied an error number we don't know about
    [[nodiscard]] bool is_valid_cbm() const;

    // Track and sector are only meaningful for the read/write errors (20..29)
    [[nodiscard]] std::optional<std::uint8_t> track() const;
    [[nodiscard]] std::optional<std::uint8_t> sector() const;

    // For "01,FILES SCRATCHED,nn,00" the track field holds the number of files scratched
    [[nodiscard]] std::optional<std::uint8_t> files_scratched() const;

    // "21,READ ERROR"
    [[nodiscard]] std::string as_short_str() const;

    // "21,READ ERROR,18,04"
    [[nodiscard]] std::string as_str() const;

    // Throws StatusError unless the status classifies as OK
    void check() const;

    // Throws StatusError unless the status is the 73 power-on message
    void check_73_ok() const;

    bool operator==(const CbmStatus& other) const;

private:
    CbmStatus(std::uint8_t number, std::string message, std::uint8_t track, std::uint8_t sector, std::uint8_t device);

    std::uint8_t m_number;
    CbmErrorNumber m_error_number;
    std::string m_message;
    std::uint8_t m_track;
    std::uint8_t m_sector;
    std::uint8_t m_device;
};

std::ostream& operator<<(std::ostream& os, const CbmStatus& status);

} // namespace xcbm
