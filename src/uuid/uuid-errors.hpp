#ifndef UUIDLIB_UUID_ERRORS_HPP
#define UUIDLIB_UUID_ERRORS_HPP
#include <boost/system/error_code.hpp>
#include <type_traits>

namespace UUID{
    // Recoverable error conditions reported by the codec, the generators and the providers.
    // The first three are the reasons a textual decode fails.
    enum class errc
    {
        invalid_length = 1,
        invalid_character,
        invalid_group,
        invalid_type,
        provider_unavailable,
        entropy_unavailable
    };

    const boost::system::error_category& uuid_category() noexcept;
    boost::system::error_code make_error_code(errc e) noexcept;
}// UUID namespace

namespace boost{
namespace system{
    template<>
    struct is_error_code_enum<UUID::errc>: std::true_type {};
}
}
#endif
