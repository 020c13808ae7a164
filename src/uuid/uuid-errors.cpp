#include "uuid-errors.hpp"
#include <string>

namespace UUID{
    namespace {
        class UuidCategory: public boost::system::error_category
        {
        public:
            const char* name() const noexcept override { return "uuid"; }

            std::string message(int ev) const override {
                switch(static_cast<errc>(ev))
                {
                    case errc::invalid_length:
                        return "uuid text has an invalid length";
                    case errc::invalid_character:
                        return "uuid text contains a non hexadecimal character";
                    case errc::invalid_group:
                        return "uuid text has a misplaced group separator";
                    case errc::invalid_type:
                        return "value is neither a uuid string nor a uuid byte array";
                    case errc::provider_unavailable:
                        return "clock or node provider is unavailable";
                    case errc::entropy_unavailable:
                        return "entropy source is unavailable";
                    default:
                        return "unknown uuid error";
                }
            }
        };
    }

    const boost::system::error_category& uuid_category() noexcept {
        static const UuidCategory category;
        return category;
    }

    boost::system::error_code make_error_code(errc e) noexcept {
        return boost::system::error_code(static_cast<int>(e), uuid_category());
    }
}
