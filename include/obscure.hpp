#pragma once

#include <initializer_list>
#include <string>
#include <utility>
#include <boost/json.hpp>

#include "token_generator.hpp"

namespace obscure {

/**
 * Process-wide generator with the default configuration, built on first use.
 * @throws DigestUnavailableError if no digest can be selected; the next call
 *         tries again.
 */
TokenGenerator& default_generator();

// Braced options such as `create_hex({})` or `create_hex({{"length", 40}})`.
// A braced list always binds here rather than to the `long long` overload.
using OptionList = std::initializer_list<std::pair<boost::json::string_view, boost::json::value_ref>>;

// Hexadecimal, natural digest size.
std::string create();
std::string create(long long length);
std::string create(const boost::json::object& options);
std::string create(OptionList options);

// Hexadecimal. With a length, odd lengths give a technically invalid hex value.
std::string create_hex();
std::string create_hex(long long length);
std::string create_hex(const boost::json::object& options);
std::string create_hex(OptionList options);

// Raw digest bytes; with a length, exactly that many bytes.
std::string create_bin();
std::string create_bin(long long length);
std::string create_bin(const boost::json::object& options);
std::string create_bin(OptionList options);

// Unpadded base64. With a length the value is not guaranteed to be legal base64.
std::string create_b64();
std::string create_b64(long long length);
std::string create_b64(const boost::json::object& options);
std::string create_b64(OptionList options);

}
