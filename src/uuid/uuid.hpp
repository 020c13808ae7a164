#ifndef UUIDLIB_UUID_HPP
#define UUIDLIB_UUID_HPP
#include <array>
#include <cstdint>
#include <cstddef>
#include <iostream>
#include <string>
#include <functional>

namespace UUID{
    struct Node {
        const static std::size_t length = 6;
        unsigned char bytes[length];
    };
    bool operator==(const Node& lhs, const Node& rhs);
    bool operator!=(const Node& lhs, const Node& rhs);
    std::ostream& operator<<(std::ostream& os, const Node& node);

    // The 4 bit version stored in the high nibble of time_hi_and_version.
    enum class Version: unsigned char
    {
        NIL = 0,
        MAC = 1,
        DCE = 2,
        MD5 = 3,
        RANDOM = 4,
        SHA1 = 5
    };

    // Layout family encoded in the high bits of clock_seq_hi_and_reserved.
    enum class Variant
    {
        NCS,
        RFC4122,
        MICROSOFT,
        FUTURE
    };

    // UUID binary fields as defined in IETF RFC 4122:
    // https://datatracker.ietf.org/doc/html/rfc4122#section-4.1.2
    // This is 16 octets of data, every field is stored in network byte order:
    //   octets 0-3   time_low
    //   octets 4-5   time_mid
    //   octets 6-7   time_hi_and_version
    //   octet  8     clock_seq_hi_and_reserved
    //   octet  9     clock_seq_low
    //   octets 10-15 node
    // Default construction is the nil uuid (all zeros). A Uuid is never modified
    // after it has been constructed, with_version() and with_variant() return copies.
    class Uuid
    {
    public:
        constexpr static std::size_t size = 16; // UUID is always a 16 byte array.
        using bytes_type = std::array<unsigned char, size>;

        constexpr Uuid(): bytes_{} {} // 0 initializing default constructor.
        explicit constexpr Uuid(const bytes_type& bytes): bytes_(bytes) {} // trusted, no validation.

        constexpr static Uuid nil() { return Uuid(); }

        // Copies exactly 16 bytes from data. Any other length is a caller bug
        // and throws std::length_error.
        static Uuid from_slice(const unsigned char* data, std::size_t len);

        // Builds a uuid from the field split used by Microsoft GUIDs.
        static Uuid from_fields(std::uint32_t d1, std::uint16_t d2, std::uint16_t d3, const unsigned char (&d4)[8]);

        constexpr const bytes_type& bytes() const { return bytes_; }
        const unsigned char* data() const { return bytes_.data(); }
        bytes_type::const_iterator begin() const { return bytes_.cbegin(); }
        bytes_type::const_iterator end() const { return bytes_.cend(); }

        std::uint32_t time_low() const;
        std::uint16_t time_mid() const;
        std::uint16_t time_hi_and_version() const;
        unsigned char clock_seq_hi_and_reserved() const;
        unsigned char clock_seq_low() const;
        Node node() const;

        // 14 bit clock sequence, with the variant bits masked out.
        std::uint16_t clock_seq() const;
        // 60 bit count of 100ns intervals since 1582-10-15. Only meaningful for version 1.
        std::uint64_t timestamp() const;

        bool is_nil() const;
        Version version() const;
        bool is_version(Version v) const;
        Variant variant() const;
        bool is_variant() const; // true iff the variant is RFC 4122.

        Uuid with_version(Version v) const;
        Uuid with_variant() const;

        // Canonical lower case hyphenated form.
        std::string str() const;

    private:
        bytes_type bytes_;
    };

    bool operator==(const Uuid& lhs, const Uuid& rhs);
    bool operator!=(const Uuid& lhs, const Uuid& rhs);
    bool operator<(const Uuid& lhs, const Uuid& rhs);
    bool operator<=(const Uuid& lhs, const Uuid& rhs);
    bool operator>(const Uuid& lhs, const Uuid& rhs);
    bool operator>=(const Uuid& lhs, const Uuid& rhs);

    // Name space ids from RFC 4122 Appendix C.
    inline constexpr Uuid NAMESPACE_DNS{Uuid::bytes_type{
        0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
    }};
    inline constexpr Uuid NAMESPACE_URL{Uuid::bytes_type{
        0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
    }};
    inline constexpr Uuid NAMESPACE_OID{Uuid::bytes_type{
        0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
    }};
    inline constexpr Uuid NAMESPACE_X500{Uuid::bytes_type{
        0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
    }};
}// UUID namespace

namespace std{
    template<>
    struct hash<UUID::Uuid>
    {
        std::size_t operator()(const UUID::Uuid& uuid) const noexcept;
    };
}
#endif
