#include "directory.hpp"

#include "error.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>

#include <boost/algorithm/string.hpp>
#include <boost/log/trivial.hpp>
#include <fmt/core.h>

namespace
{
    const std::string ParseFailure{ "Could not parse line format" };

    std::uint16_t le_word(const xcbm::Bytes& bytes, size_t offset)
    {
        return static_cast<std::uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
    }

    bool is_word_char(char c)
    {
        return (std::isalnum(static_cast<unsigned char>(c)) != 0) || (c == '_');
    }

} // namespace

namespace xcbm
{

CbmFileType to_file_type(std::string_view s)
{
    const auto upper = boost::to_upper_copy(std::string(s));
    if (upper == "PRG")
    {
        return CbmFileType::PRG;
    }
    if (upper == "SEQ")
    {
        return CbmFileType::SEQ;
    }
    if (upper == "USR")
    {
        return CbmFileType::USR;
    }
    if (upper == "REL")
    {
        return CbmFileType::REL;
    }
    return CbmFileType::UNKNOWN;
}

std::string_view suffix(CbmFileType type)
{
    switch (type)
    {
    case CbmFileType::PRG: return ",P";
    case CbmFileType::SEQ: return ",S";
    case CbmFileType::USR: return ",U";
    case CbmFileType::REL: return ",R";
    case CbmFileType::UNKNOWN: return "";
    }
    return "";
}

std::string_view suffix(CbmFileMode mode)
{
    switch (mode)
    {
    case CbmFileMode::READ: return "";
    case CbmFileMode::WRITE: return ",W";
    case CbmFileMode::APPEND: return ",A";
    }
    return "";
}

std::ostream& operator<<(std::ostream& os, CbmFileType type)
{
    switch (type)
    {
    case CbmFileType::PRG: return os << "prg";
    case CbmFileType::SEQ: return os << "seq";
    case CbmFileType::USR: return os << "usr";
    case CbmFileType::REL: return os << "rel";
    case CbmFileType::UNKNOWN: break;
    }
    return os;
}

std::string DirectoryRecord::render() const
{
    return fmt::format("{:4} {}", m_size, m_text.to_ascii().str());
}

std::vector<DirectoryRecord> decode_directory(const Bytes& stream)
{
    std::vector<DirectoryRecord> result;

    // Skip the load address
    size_t offset = 2;
    while (offset + 2 <= stream.size())
    {
        const auto link = le_word(stream, offset);
        offset += 2;
        if (link == 0)
        {
            break;
        }
        if (offset + 2 > stream.size())
        {
            break;
        }
        const auto size = le_word(stream, offset);
        offset += 2;

        const auto start = stream.begin() + static_cast<std::ptrdiff_t>(offset);
        const auto terminator = std::find(start, stream.end(), 0x00);
        if (terminator == stream.end())
        {
            BOOST_LOG_TRIVIAL(debug) << "Dropping unterminated directory record of size " << size;
            break;
        }
        result.push_back({ size, PetsciiString(Bytes(start, terminator)) });
        offset = static_cast<size_t>(terminator - stream.begin()) + 1;
    }

    BOOST_LOG_TRIVIAL(trace) << "Decoded " << result.size() << " directory records from " << stream.size()
                             << " bytes";
    return result;
}

std::optional<std::uint64_t> max_size(const CbmFileEntry& entry)
{
    if (const auto* p_valid = std::get_if<ValidFile>(&entry))
    {
        return p_valid->m_blocks * BYTES_PER_BLOCK;
    }
    const auto& invalid = std::get<InvalidFile>(entry);
    if (invalid.m_partial_blocks)
    {
        return *invalid.m_partial_blocks * BYTES_PER_BLOCK;
    }
    return {};
}

std::ostream& operator<<(std::ostream& os, const CbmFileEntry& entry)
{
    if (const auto* p_valid = std::get_if<ValidFile>(&entry))
    {
        // Pad so that the block counts line up for typical filename lengths
        const auto used = p_valid->m_filename.size() + 4;
        const auto padding = (used < 25) ? (25 - used) : 0;
        os << "Filename: \"" << p_valid->m_filename << '.' << p_valid->m_file_type << '"' << std::string(padding, ' ')
           << fmt::format("Blocks: {:>3}", p_valid->m_blocks);
        return os;
    }

    const auto& invalid = std::get<InvalidFile>(entry);
    os << "Invalid entry: " << invalid.m_raw_line << " (" << invalid.m_error << ')';
    if (invalid.m_partial_filename)
    {
        os << " [Filename: \"" << *invalid.m_partial_filename << "\"]";
    }
    if (invalid.m_partial_blocks)
    {
        os << " [Blocks: " << *invalid.m_partial_blocks << ']';
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const CbmDiskHeader& header)
{
    return os << "Drive " << static_cast<int>(header.m_drive_number) << " Header: \"" << header.m_name
              << "\" ID: " << header.m_id;
}

CbmDirListing::CbmDirListing(CbmDiskHeader header, std::vector<CbmFileEntry> files, std::uint16_t blocks_free)
    : m_header(std::move(header)),
      m_files(std::move(files)),
      m_blocks_free(blocks_free)
{
}

CbmDirListing CbmDirListing::from_records(const std::vector<DirectoryRecord>& records)
{
    std::vector<Line> lines;
    lines.reserve(records.size());
    for (const auto& record : records)
    {
        lines.push_back({ record.m_size, record.m_text.to_ascii().str(), record.render() });
    }
    return from_lines(lines);
}

CbmDirListing CbmDirListing::parse(std::string_view text)
{
    std::vector<std::string> raw_lines;
    boost::split(raw_lines, text, boost::is_any_of("\n"));

    std::vector<Line> lines;
    for (const auto& raw : raw_lines)
    {
        if (boost::algorithm::trim_copy(raw).empty())
        {
            continue;
        }

        // Leading block count (or drive number, or free count), then a single space, then the rest
        Line line{ {}, raw, raw };
        const auto digits_start = raw.find_first_not_of(' ');
        auto digits_end = raw.find_first_not_of("0123456789", digits_start);
        if (digits_end == std::string::npos)
        {
            digits_end = raw.size();
        }
        if ((digits_end != digits_start) && (digits_end - digits_start <= 5))
        {
            const auto value = std::stoul(raw.substr(digits_start, digits_end - digits_start));
            if (value <= 0xFFFF)
            {
                line.m_size = static_cast<std::uint16_t>(value);
                line.m_text = raw.substr(digits_end);
                if (!line.m_text.empty() && (line.m_text.front() == ' '))
                {
                    line.m_text.erase(0, 1);
                }
            }
        }
        lines.push_back(line);
    }

    return from_lines(lines);
}

CbmDirListing CbmDirListing::from_lines(const std::vector<Line>& lines)
{
    if (lines.empty())
    {
        BOOST_LOG_TRIVIAL(debug) << "Directory listing has no header line";
        throw ParseError("Missing header line");
    }

    auto header = parse_header(lines.front());

    std::vector<CbmFileEntry> files;
    std::optional<std::uint16_t> blocks_free;
    for (auto it = lines.begin() + 1; it != lines.end(); ++it)
    {
        if (boost::algorithm::icontains(it->m_text, "blocks free"))
        {
            if (!it->m_size)
            {
                throw ParseError("Invalid blocks free format: " + it->m_raw);
            }
            blocks_free = it->m_size;
            break;
        }
        files.push_back(parse_file_entry(*it));
    }

    if (!blocks_free)
    {
        BOOST_LOG_TRIVIAL(debug) << "Directory listing has no blocks free line";
        throw ParseError("Missing blocks free line");
    }

    return { std::move(header), std::move(files), *blocks_free };
}

CbmDiskHeader CbmDirListing::parse_header(const Line& line)
{
    // e.g. `   0 ."test disk       " 8a 2a`; the leading '.' is the reverse-on control code
    const auto invalid = [&line]() { return ParseError("Invalid header format: " + line.m_raw); };

    if (!line.m_size || (*line.m_size > 0xFF))
    {
        throw invalid();
    }

    const auto& text = line.m_text;
    const auto open = text.find_first_not_of(' ');
    if ((open == std::string::npos) || (text.compare(open, 2, ".\"") != 0))
    {
        throw invalid();
    }
    const auto close = text.find('"', open + 2);
    if ((close == std::string::npos) || (close + 3 >= text.size()) || (text[close + 1] != ' ') ||
        !std::isalnum(static_cast<unsigned char>(text[close + 2])) ||
        !std::isalnum(static_cast<unsigned char>(text[close + 3])))
    {
        throw invalid();
    }

    return { static_cast<std::uint8_t>(*line.m_size),
             boost::algorithm::trim_right_copy(text.substr(open + 2, close - open - 2)),
             text.substr(close + 2, CbmDiskHeader::ID_LENGTH) };
}

CbmFileEntry CbmDirListing::parse_file_entry(const Line& line)
{
    // e.g. `  10 "program"          prg`
    if (!line.m_size)
    {
        return InvalidFile{ line.m_raw, ParseFailure, {}, {} };
    }
    const auto blocks = *line.m_size;

    const auto& text = line.m_text;
    const auto open = text.find_first_not_of(' ');
    if ((open == std::string::npos) || (text[open] != '"'))
    {
        return InvalidFile{ line.m_raw, ParseFailure, blocks, {} };
    }
    const auto close = text.find('"', open + 1);
    if ((close == std::string::npos) || (close == open + 1))
    {
        return InvalidFile{ line.m_raw, ParseFailure, blocks, {} };
    }
    auto filename = text.substr(open + 1, close - open - 1);

    const auto type_start = text.find_first_not_of(' ', close + 1);
    if ((type_start == std::string::npos) || (type_start == close + 1))
    {
        return InvalidFile{ line.m_raw, "Missing file type", blocks, filename };
    }
    auto type_end = type_start;
    while ((type_end < text.size()) && is_word_char(text[type_end]))
    {
        ++type_end;
    }
    if ((type_end == type_start) || (text.find_first_not_of(' ', type_end) != std::string::npos))
    {
        return InvalidFile{ line.m_raw, "Unexpected characters around file type", blocks, filename };
    }

    return ValidFile{ blocks, std::move(filename), to_file_type(text.substr(type_start, type_end - type_start)) };
}

const CbmDiskHeader& CbmDirListing::header() const
{
    return m_header;
}

const std::vector<CbmFileEntry>& CbmDirListing::files() const
{
    return m_files;
}

std::uint16_t CbmDirListing::blocks_free() const
{
    return m_blocks_free;
}

size_t CbmDirListing::num_files() const
{
    return m_files.size();
}

std::uint32_t CbmDirListing::num_blocks_used_valid() const
{
    return std::accumulate(m_files.begin(),
                           m_files.end(),
                           std::uint32_t{ 0 },
                           [](std::uint32_t total, const CbmFileEntry& entry)
                           {
                               const auto* p_valid = std::get_if<ValidFile>(&entry);
                               return total + (p_valid ? p_valid->m_blocks : 0);
                           });
}

std::uint32_t CbmDirListing::total_blocks() const
{
    return num_blocks_used_valid() + m_blocks_free;
}

std::ostream& operator<<(std::ostream& os, const CbmDirListing& listing)
{
    os << listing.header() << std::endl;
    for (const auto& entry : listing.files())
    {
        os << entry << std::endl;
    }
    os << "Free blocks: " << listing.blocks_free() << std::endl;
    return os;
}

} // namespace xcbm
