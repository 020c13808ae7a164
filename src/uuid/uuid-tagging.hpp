#ifndef UUIDLIB_UUID_TAGGING_HPP
#define UUIDLIB_UUID_TAGGING_HPP
#include "uuid.hpp"

namespace UUID{
    // Overwrites the version nibble of time_hi_and_version and forces the two most
    // significant bits of clock_seq_hi_and_reserved to 10 (RFC 4122 variant).
    // All other bits are preserved, so tagging the same buffer twice is a no-op.
    void tag(Uuid::bytes_type& bytes, Version v);
    void tag_version(Uuid::bytes_type& bytes, Version v);
    void tag_variant(Uuid::bytes_type& bytes);
}
#endif
