#include "obscure.hpp"

namespace obscure {

TokenGenerator& default_generator() {
    static TokenGenerator generator;
    return generator;
}

std::string create() {
    return create_hex();
}

std::string create(long long length) {
    return create_hex(length);
}

std::string create(const boost::json::object& options) {
    return create_hex(options);
}

std::string create(OptionList options) {
    return create_hex(options);
}

std::string create_hex() {
    return default_generator().hex();
}

std::string create_hex(long long length) {
    return default_generator().hex(length);
}

std::string create_hex(OptionList options) {
    return create_hex(boost::json::object(options));
}

std::string create_hex(const boost::json::object& options) {
    return default_generator().generate_from_options(Encoding::Hexadecimal, options);
}

std::string create_bin() {
    return default_generator().binary();
}

std::string create_bin(long long length) {
    return default_generator().binary(length);
}

std::string create_bin(OptionList options) {
    return create_bin(boost::json::object(options));
}

std::string create_bin(const boost::json::object& options) {
    return default_generator().generate_from_options(Encoding::Binary, options);
}

std::string create_b64() {
    return default_generator().base64();
}

std::string create_b64(long long length) {
    return default_generator().base64(length);
}

std::string create_b64(OptionList options) {
    return create_b64(boost::json::object(options));
}

std::string create_b64(const boost::json::object& options) {
    return default_generator().generate_from_options(Encoding::Base64, options);
}

}
