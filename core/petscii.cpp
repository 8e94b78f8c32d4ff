#include "petscii.hpp"

#include "error.hpp"

#include <algorithm>
#include <iterator>

#include <boost/format.hpp>

namespace xcbm
{

char petscii_to_ascii(std::uint8_t c)
{
    switch (c)
    {
    case 0x0A:
    case 0x0D: return '\n';
    case 0x40:
    case 0x60: return static_cast<char>(c);
    case 0xA0: // Shifted spaces
    case 0xE0: return ' ';
    default: break;
    }

    auto result = static_cast<char>(c);
    switch (c & 0xE0)
    {
    case 0x40:
    case 0x60: result = static_cast<char>(c ^ 0x20); break;
    case 0xC0: result = static_cast<char>(c ^ 0x80); break;
    default: break;
    }

    // 0x5F lands on DEL
    return AsciiString::is_printable(result) ? result : '.';
}

std::uint8_t ascii_to_petscii(char c)
{
    const auto u = static_cast<std::uint8_t>(c);
    if ((u >= 0x5B) && (u <= 0x7E))
    {
        return u ^ 0x20;
    }
    if ((c >= 'A') && (c <= 'Z'))
    {
        return u | 0x80;
    }
    return u;
}

AsciiString::AsciiString(std::string_view s) : m_text(s)
{
    const auto it = std::find_if(m_text.begin(), m_text.end(), [](char c) { return !is_printable(c); });
    if (it != m_text.end())
    {
        throw ValidationError((boost::format("Non-printable character 0x%02X in ASCII string") %
                               static_cast<unsigned int>(static_cast<std::uint8_t>(*it)))
                                  .str());
    }
}

AsciiString::AsciiString(Unchecked, std::string s) : m_text(std::move(s))
{
}

std::optional<AsciiString> AsciiString::from_bytes(const Bytes& bytes)
{
    if (!std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return is_printable(static_cast<char>(b)); }))
    {
        return {};
    }
    return AsciiString(Unchecked{}, std::string(bytes.begin(), bytes.end()));
}

PetsciiString AsciiString::to_petscii() const
{
    Bytes result;
    result.reserve(m_text.size());
    std::transform(m_text.begin(), m_text.end(), std::back_inserter(result), ascii_to_petscii);
    return PetsciiString(std::move(result));
}

const std::string& AsciiString::str() const
{
    return m_text;
}

Bytes AsciiString::bytes() const
{
    return { m_text.begin(), m_text.end() };
}

size_t AsciiString::size() const
{
    return m_text.size();
}

bool AsciiString::empty() const
{
    return m_text.empty();
}

bool AsciiString::operator==(const AsciiString& other) const
{
    return m_text == other.m_text;
}

bool AsciiString::operator==(const PetsciiString& other) const
{
    return m_text == other.to_ascii().m_text;
}

bool AsciiString::is_printable(char c)
{
    return (c >= 0x20) && (c <= 0x7E);
}

PetsciiString::PetsciiString(Bytes bytes) : m_bytes(std::move(bytes))
{
}

PetsciiString PetsciiString::from_raw(std::string_view s)
{
    return PetsciiString(Bytes(s.begin(), s.end()));
}

PetsciiString PetsciiString::from_ascii(std::string_view s)
{
    return AsciiString(s).to_petscii();
}

AsciiString PetsciiString::to_ascii() const
{
    std::string result;
    result.reserve(m_bytes.size());
    std::transform(m_bytes.begin(), m_bytes.end(), std::back_inserter(result), petscii_to_ascii);
    // Newlines are the one non-printable character decoding can produce; show them as '.' too
    std::replace(result.begin(), result.end(), '\n', '.');
    return AsciiString(AsciiString::Unchecked{}, std::move(result));
}

const Bytes& PetsciiString::bytes() const
{
    return m_bytes;
}

size_t PetsciiString::size() const
{
    return m_bytes.size();
}

bool PetsciiString::empty() const
{
    return m_bytes.empty();
}

bool PetsciiString::operator==(const PetsciiString& other) const
{
    return to_ascii() == other.to_ascii();
}

std::ostream& operator<<(std::ostream& os, const AsciiString& s)
{
    return os << s.str();
}

std::ostream& operator<<(std::ostream& os, const PetsciiString& s)
{
    return os << s.to_ascii();
}

} // namespace xcbm
