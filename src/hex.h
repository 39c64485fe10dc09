#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace hid {

// Strict hex codec. Decoding throws HashIdError(InvalidFormat) on odd length
// or any character outside [0-9a-fA-F]; it accepts any even length.
std::vector<uint8_t> decode_hex(const std::string& hex);

std::string encode_hex(const uint8_t* p, size_t n, bool lowercase = true);
std::string encode_hex(const std::vector<uint8_t>& v, bool lowercase = true);

// Single digit helpers: 0..15 <-> '0'..'f'
int  parse_hex_digit(char c);
char render_hex_digit(int v, bool lowercase = true);

// Non-throwing check: even length, hex digits only
bool is_hex_string(const std::string& hex);

}
