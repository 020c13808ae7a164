#ifndef UUIDLIB_UUID_CODEC_HPP
#define UUIDLIB_UUID_CODEC_HPP
#include "../uuid/uuid.hpp"
#include "../uuid/uuid-errors.hpp"
#include <array>
#include <string_view>

namespace UUID{
    constexpr std::size_t TEXT_LENGTH = 36; // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    constexpr std::size_t SIMPLE_TEXT_LENGTH = 32; // hex digits only.

    enum class Case
    {
        LOWER,
        UPPER
    };

    std::array<char, TEXT_LENGTH> encode(const Uuid& uuid, Case c = Case::LOWER);
    std::array<char, SIMPLE_TEXT_LENGTH> encode_simple(const Uuid& uuid, Case c = Case::LOWER);

    // Decodes the 36 character hyphenated form or the 32 character simple form.
    // Hex digits are accepted in either case. On failure ec is one of
    // errc::invalid_length, errc::invalid_group or errc::invalid_character, the
    // returned value is nil and must not be used, and pos holds the offending
    // index (the input length for errc::invalid_length).
    Uuid decode(std::string_view text, boost::system::error_code& ec, std::size_t& pos);
    Uuid decode(std::string_view text, boost::system::error_code& ec);
    // Throws boost::system::system_error.
    Uuid decode(std::string_view text);

    // Writes the canonical form, in upper case if std::uppercase is set on the stream.
    std::ostream& operator<<(std::ostream& os, const Uuid& uuid);
    // Reads exactly 36 characters, sets failbit if they do not decode.
    std::istream& operator>>(std::istream& is, Uuid& uuid);
}
#endif
