#include "uuid-tagging.hpp"

/*offsets and masks of the tagged octets.*/
#define UUIDLIB_VERSION_OCTET 6
#define UUIDLIB_VARIANT_OCTET 8
#define UUIDLIB_VERSION_MASK 0x0F
#define UUIDLIB_VARIANT_MASK 0x3F
#define UUIDLIB_VARIANT_RFC4122 0x80

namespace UUID{
    void tag_version(Uuid::bytes_type& bytes, Version v){
        // time_hi_and_version is octets 6 and 7, the version lives in the high nibble of octet 6.
        unsigned char& time_hi = bytes[UUIDLIB_VERSION_OCTET];
        time_hi &= UUIDLIB_VERSION_MASK;
        time_hi |= static_cast<unsigned char>(static_cast<unsigned char>(v) << 4);
    }

    void tag_variant(Uuid::bytes_type& bytes){
        unsigned char& clock_seq_hi_and_reserved = bytes[UUIDLIB_VARIANT_OCTET];
        // Mask out the two high bits, then set them to 10.
        clock_seq_hi_and_reserved &= UUIDLIB_VARIANT_MASK;
        clock_seq_hi_and_reserved |= UUIDLIB_VARIANT_RFC4122;
    }

    void tag(Uuid::bytes_type& bytes, Version v){
        tag_variant(bytes);
        tag_version(bytes, v);
    }
}
