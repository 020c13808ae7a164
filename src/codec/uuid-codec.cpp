#include "uuid-codec.hpp"
#include <boost/system/system_error.hpp>
#include <charconv>

namespace UUID{
    namespace {
        constexpr char LOWER_DIGITS[] = "0123456789abcdef";
        constexpr char UPPER_DIGITS[] = "0123456789ABCDEF";
        constexpr char SEPARATOR = '-';

        // Index of the first text character of each byte in the hyphenated form.
        constexpr std::array<std::size_t, Uuid::size> HYPHENATED_OFFSETS = {
            0, 2, 4, 6,
            9, 11,
            14, 16,
            19, 21,
            24, 26, 28, 30, 32, 34
        };
        constexpr std::array<std::size_t, 4> SEPARATOR_OFFSETS = {8, 13, 18, 23};

        template<std::size_t N>
        void write_hex(const Uuid& uuid, Case c, const std::array<std::size_t, Uuid::size>& offsets, std::array<char, N>& out){
            const char* digits = (c == Case::UPPER) ? UPPER_DIGITS : LOWER_DIGITS;
            for(std::size_t i=0; i < Uuid::size; ++i){
                unsigned char byte = uuid.bytes()[i];
                out[offsets[i]] = digits[byte >> 4];
                out[offsets[i] + 1] = digits[byte & 0x0F];
            }
        }

        // Parses the two hex digits starting at text[offset].
        bool read_byte(std::string_view text, std::size_t offset, unsigned char& byte, boost::system::error_code& ec, std::size_t& pos){
            const char* first = text.data() + offset;
            const char* last = first + 2;
            for(const char* p = first; p != last; ++p){
                if(*p == SEPARATOR){
                    ec = make_error_code(errc::invalid_group);
                    pos = static_cast<std::size_t>(p - text.data());
                    return false;
                }
            }
            std::from_chars_result res = std::from_chars(first, last, byte, 16);
            if(res.ec != std::errc{} || res.ptr != last){
                ec = make_error_code(errc::invalid_character);
                pos = static_cast<std::size_t>(res.ptr - text.data());
                return false;
            }
            return true;
        }
    }

    std::array<char, TEXT_LENGTH> encode(const Uuid& uuid, Case c){
        std::array<char, TEXT_LENGTH> out{};
        write_hex(uuid, c, HYPHENATED_OFFSETS, out);
        for(std::size_t offset: SEPARATOR_OFFSETS){
            out[offset] = SEPARATOR;
        }
        return out;
    }

    std::array<char, SIMPLE_TEXT_LENGTH> encode_simple(const Uuid& uuid, Case c){
        std::array<std::size_t, Uuid::size> offsets{};
        for(std::size_t i=0; i < Uuid::size; ++i){
            offsets[i] = i*2;
        }
        std::array<char, SIMPLE_TEXT_LENGTH> out{};
        write_hex(uuid, c, offsets, out);
        return out;
    }

    Uuid decode(std::string_view text, boost::system::error_code& ec, std::size_t& pos){
        ec.clear();
        pos = 0;
        Uuid::bytes_type bytes{};
        if(text.size() == TEXT_LENGTH){
            // Check the group separators before looking at any digit.
            for(std::size_t offset: SEPARATOR_OFFSETS){
                if(text[offset] != SEPARATOR){
                    ec = make_error_code(errc::invalid_group);
                    pos = offset;
                    return Uuid();
                }
            }
            for(std::size_t i=0; i < Uuid::size; ++i){
                if(!read_byte(text, HYPHENATED_OFFSETS[i], bytes[i], ec, pos)){
                    return Uuid();
                }
            }
        } else if(text.size() == SIMPLE_TEXT_LENGTH){
            for(std::size_t i=0; i < Uuid::size; ++i){
                if(!read_byte(text, i*2, bytes[i], ec, pos)){
                    return Uuid();
                }
            }
        } else {
            ec = make_error_code(errc::invalid_length);
            pos = text.size();
            return Uuid();
        }
        return Uuid(bytes);
    }

    Uuid decode(std::string_view text, boost::system::error_code& ec){
        std::size_t pos = 0;
        return decode(text, ec, pos);
    }

    Uuid decode(std::string_view text){
        boost::system::error_code ec;
        std::size_t pos = 0;
        Uuid uuid = decode(text, ec, pos);
        if(ec){
            throw boost::system::system_error(ec, "uuid-codec.cpp:decode:at position " + std::to_string(pos));
        }
        return uuid;
    }

    std::ostream& operator<<(std::ostream& os, const Uuid& uuid){
        Case c = (os.flags() & std::ios::uppercase) ? Case::UPPER : Case::LOWER;
        std::array<char, TEXT_LENGTH> text = encode(uuid, c);
        os.write(text.data(), text.size());
        return os;
    }

    std::istream& operator>>(std::istream& is, Uuid& uuid){
        std::array<char, TEXT_LENGTH> text{};
        is >> std::ws;
        if(!is.read(text.data(), text.size())){
            return is;
        }
        boost::system::error_code ec;
        Uuid tmp = decode(std::string_view(text.data(), text.size()), ec);
        if(ec){
            is.setstate(std::ios::failbit);
            return is;
        }
        uuid = tmp;
        return is;
    }
}
