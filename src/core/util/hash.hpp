#pragma once

#include <string>
#include <string_view>

namespace craftiax::util {

std::string to_hex(std::string_view bytes);
// Returns an empty string when `hex` is not valid even-length hex.
std::string from_hex(std::string_view hex);

std::string sha256_hex(std::string_view payload);

}  // namespace craftiax::util
