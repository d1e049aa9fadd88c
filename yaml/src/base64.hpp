#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace keyset_yaml {

std::string          base64_encode(const std::vector<uint8_t>& data);
// Ignores embedded whitespace (YAML literal blocks); throws on any other
// character outside the alphabet or on a truncated final group.
std::vector<uint8_t> base64_decode(const std::string& encoded);

} // namespace keyset_yaml
