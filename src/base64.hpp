#pragma once
#include <cstdint>
#include <string>
#include <vector>

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& data);

// Throws std::invalid_argument on characters outside the alphabet.
// ASCII whitespace is skipped, decoding stops at the first '='.
std::vector<uint8_t> base64_decode(const std::string& s);
std::string base64_decode_to_string(const std::string& s);
