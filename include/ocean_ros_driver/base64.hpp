#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ocean {

// Standard alphabet with '=' padding.
std::string base64Encode(const std::vector<uint8_t>& data);

// Returns false on a character outside the alphabet or a bad length.
bool base64Decode(const std::string& encoded, std::vector<uint8_t>& out);

}  // namespace ocean
