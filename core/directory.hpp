#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "petscii.hpp"

namespace xcbm
{

inline constexpr std::uint64_t BYTES_PER_BLOCK = 254;

enum class CbmFileType
{
    PRG,
    SEQ,
    USR,
    REL,
    UNKNOWN
};

enum class CbmFileMode
{
    READ,
    WRITE,
    APPEND
};

// Case insensitive; anything unrecognised is UNKNOWN
CbmFileType to_file_type(std::string_view s);

// The suffix to append to a filename when opening it, e.g. ",P" or ",W"
std::string_view suffix(CbmFileType type);
std::string_view suffix(CbmFileMode mode);

// "prg", "seq" etc.
std::ostream& operator<<(std::ostream& os, CbmFileType type);

// One record from the binary directory stream.  The size field holds the block count for a file, the drive
// number for the header and the free block count for the final line.
struct DirectoryRecord
{
    std::uint16_t m_size;
    PetsciiString m_text;

    // As the drive would print it, e.g. `  10 "program"          prg`
    [[nodiscard]] std::string render() const;
};

// Decodes the bytes obtained by loading "$": a two byte load address then [link:2][size:2][text...][0x00]
// repeated.  Decoding stops at a zero link (the end of the BASIC program) or when the bytes run out; a
// partial trailing record is dropped.
std::vector<DirectoryRecord> decode_directory(const Bytes& stream);

struct ValidFile
{
    std::uint16_t m_blocks;
    std::string m_filename;
    CbmFileType m_file_type;
};

// A directory line which couldn't be understood, together with whatever could be salvaged from it
struct InvalidFile
{
    std::string m_raw_line;
    std::string m_error;
    std::optional<std::uint16_t> m_partial_blocks;
    std::optional<std::string> m_partial_filename;
};

using CbmFileEntry = std::variant<ValidFile, InvalidFile>;

// Upper bound on the file size in bytes, if the block count is known
std::optional<std::uint64_t> max_size(const CbmFileEntry& entry);

std::ostream& operator<<(std::ostream& os, const CbmFileEntry& entry);

struct CbmDiskHeader
{
    static constexpr size_t MAX_NAME_LENGTH = 16;
    static constexpr size_t ID_LENGTH = 2;

    std::uint8_t m_drive_number;
    std::string m_name;
    std::string m_id;
};

std::ostream& operator<<(std::ostream& os, const CbmDiskHeader& header);

class CbmDirListing final
{
public:
    // Builds a listing from decoded records.  Throws ParseError if there's no recognisable header or no
    // "blocks free" line; individual malformed file lines become InvalidFile entries.
    static CbmDirListing from_records(const std::vector<DirectoryRecord>& records);

    // As above, but starting from a listing which has already been rendered to text, one line per record
    static CbmDirListing parse(std::string_view text);

    [[nodiscard]] const CbmDiskHeader& header() const;
    [[nodiscard]] const std::vector<CbmFileEntry>& files() const;
    [[nodiscard]] std::uint16_t blocks_free() const;

    [[nodiscard]] size_t num_files() const;
    [[nodiscard]] std::uint32_t num_blocks_used_valid() const;
    [[nodiscard]] std::uint32_t total_blocks() const;

private:
    struct Line
    {
        std::optional<std::uint16_t> m_size;
        std::string m_text; // ASCII, after the size field
        std::string m_raw;
    };

    CbmDirListing(CbmDiskHeader header, std::vector<CbmFileEntry> files, std::uint16_t blocks_free);

    static CbmDirListing from_lines(const std::vector<Line>& lines);
    static CbmDiskHeader parse_header(const Line& line);
    static CbmFileEntry parse_file_entry(const Line& line);

    CbmDiskHeader m_header;
    std::vector<CbmFileEntry> m_files;
    std::uint16_t m_blocks_free;
};

std::ostream& operator<<(std::ostream& os, const CbmDirListing& listing);

} // namespace xcbm
