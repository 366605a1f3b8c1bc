#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Standard alphabet, '=' padded.
std::string base64_encode(const uint8_t *data, size_t len);
std::string base64_encode(const std::string &in);

// Throws DecodeError on bad length, bad characters or misplaced padding.
std::vector<uint8_t> base64_decode(const std::string &in);
