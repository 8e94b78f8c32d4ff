#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace xcbm
{

using Bytes = std::vector<std::uint8_t>;

// Single character conversions between ASCII and the drive's PETSCII character set.  Decoding is total:
// anything which has no printable ASCII equivalent comes back as '.'.
char petscii_to_ascii(std::uint8_t c);
std::uint8_t ascii_to_petscii(char c);

class PetsciiString;

// Text known to consist of printable 7-bit ASCII (space to tilde)
class AsciiString final
{
public:
    // Throws ValidationError if the text contains anything other than printable ASCII
    explicit AsciiString(std::string_view s);

    // Non-throwing alternative
    static std::optional<AsciiString> from_bytes(const Bytes& bytes);

    [[nodiscard]] PetsciiString to_petscii() const;
    [[nodiscard]] const std::string& str() const;
    [[nodiscard]] Bytes bytes() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    bool operator==(const AsciiString& other) const;
    bool operator==(const PetsciiString& other) const;

    [[nodiscard]] static bool is_printable(char c);

private:
    struct Unchecked
    {
    };
    AsciiString(Unchecked, std::string s);

    friend class PetsciiString;

    std::string m_text;
};

// Bytes in the drive's native character set; any 8-bit value is allowed
class PetsciiString final
{
public:
    explicit PetsciiString(Bytes bytes);

    // Raw bytes taken from a host string without any translation, e.g. for "M-R" commands
    static PetsciiString from_raw(std::string_view s);

    // Translates each character of the ASCII text
    static PetsciiString from_ascii(std::string_view s);

    // Every byte decoded for display; untranslatable bytes become '.'
    [[nodiscard]] AsciiString to_ascii() const;
    [[nodiscard]] const Bytes& bytes() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    bool operator==(const PetsciiString& other) const;

private:
    Bytes m_bytes;
};

std::ostream& operator<<(std::ostream& os, const AsciiString& s);
std::ostream& operator<<(std::ostream& os, const PetsciiString& s);

} // namespace xcbm
