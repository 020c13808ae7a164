#ifndef UUIDLIB_UUID_JSON_HPP
#define UUIDLIB_UUID_JSON_HPP
#include "../uuid/uuid.hpp"
#include <boost/json.hpp>
#include <boost/system/error_code.hpp>

namespace UUID{
    enum class JsonForm
    {
        STRING, // "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
        BYTES   // [b0, b1, ..., b15]
    };

    boost::json::value to_json(const Uuid& uuid, JsonForm form = JsonForm::STRING);

    // Accepts either form. Strings are decoded by the text codec, arrays must
    // hold exactly 16 integers in 0..255, anything else is errc::invalid_type.
    Uuid from_json(const boost::json::value& jv, boost::system::error_code& ec);

    // boost::json::value_from / value_to customization, string form.
    void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Uuid& uuid);
    Uuid tag_invoke(const boost::json::value_to_tag<Uuid>&, const boost::json::value& jv);
}
#endif
