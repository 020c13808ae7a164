#include "uuid-json.hpp"
#include "../codec/uuid-codec.hpp"
#include "../uuid/uuid-errors.hpp"
#include <boost/system/system_error.hpp>
#include <string_view>

namespace UUID{
    namespace {
        Uuid from_json_array(const boost::json::array& ja, boost::system::error_code& ec){
            if(ja.size() != Uuid::size){
                ec = make_error_code(errc::invalid_length);
                return Uuid();
            }
            Uuid::bytes_type bytes{};
            for(std::size_t i=0; i < Uuid::size; ++i){
                const boost::json::value& element = ja[i];
                std::int64_t byte = -1;
                if(element.is_int64()){
                    byte = element.get_int64();
                } else if(element.is_uint64() && element.get_uint64() <= 0xFF){
                    byte = static_cast<std::int64_t>(element.get_uint64());
                }
                if(byte < 0 || byte > 0xFF){
                    ec = make_error_code(errc::invalid_character);
                    return Uuid();
                }
                bytes[i] = static_cast<unsigned char>(byte);
            }
            return Uuid(bytes);
        }
    }

    boost::json::value to_json(const Uuid& uuid, JsonForm form){
        if(form == JsonForm::BYTES){
            boost::json::array ja;
            ja.reserve(Uuid::size);
            for(unsigned char byte: uuid){
                ja.emplace_back(static_cast<std::uint64_t>(byte));
            }
            return boost::json::value(std::move(ja));
        }
        std::array<char, TEXT_LENGTH> text = encode(uuid);
        return boost::json::value(boost::json::string(text.data(), text.size()));
    }

    Uuid from_json(const boost::json::value& jv, boost::system::error_code& ec){
        ec.clear();
        if(jv.is_string()){
            const boost::json::string& js = jv.get_string();
            return decode(std::string_view(js.data(), js.size()), ec);
        } else if(jv.is_array()){
            return from_json_array(jv.get_array(), ec);
        }
        ec = make_error_code(errc::invalid_type);
        return Uuid();
    }

    void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Uuid& uuid){
        jv = to_json(uuid, JsonForm::STRING);
    }

    Uuid tag_invoke(const boost::json::value_to_tag<Uuid>&, const boost::json::value& jv){
        boost::system::error_code ec;
        Uuid uuid = from_json(jv, ec);
        if(ec){
            throw boost::system::system_error(ec, "uuid-json.cpp:value_to");
        }
        return uuid;
    }
}
