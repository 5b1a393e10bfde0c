#include "encoding.hpp"
#include <boost/beast/core/detail/base64.hpp>
#include <iomanip>
#include <sstream>

namespace obscure {

std::string encoding_name(Encoding encoding) {
    switch (encoding) {
        case Encoding::Binary: return "bin";
        case Encoding::Hexadecimal: return "hex";
        case Encoding::Base64: return "b64";
    }
    return "unknown";
}

std::optional<Encoding> parse_encoding(std::string_view name) {
    if (name == "bin" || name == "binary") return Encoding::Binary;
    if (name == "hex" || name == "hexadecimal") return Encoding::Hexadecimal;
    if (name == "b64" || name == "base64") return Encoding::Base64;
    return std::nullopt;
}

std::string to_hex(const std::string& bytes) {
    std::stringstream ss;
    for (unsigned char c : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    }
    return ss.str();
}

std::string to_base64(const std::string& bytes, bool pad) {
    namespace base64 = boost::beast::detail::base64;

    std::string out;
    out.resize(base64::encoded_size(bytes.size()));
    auto written = base64::encode(out.data(), bytes.data(), bytes.size());
    out.resize(written);

    if (!pad) {
        auto last = out.find_last_not_of('=');
        out.erase(last == std::string::npos ? 0 : last + 1);
    }
    return out;
}

std::string encode(Encoding encoding, const std::string& raw) {
    switch (encoding) {
        case Encoding::Binary: return raw;
        case Encoding::Hexadecimal: return to_hex(raw);
        case Encoding::Base64: return to_base64(raw);
    }
    return raw;
}

std::size_t encoded_size(Encoding encoding, std::size_t raw_size) {
    switch (encoding) {
        case Encoding::Binary: return raw_size;
        case Encoding::Hexadecimal: return raw_size * 2;
        case Encoding::Base64: return (raw_size * 4 + 2) / 3; // unpadded
    }
    return raw_size;
}

}
