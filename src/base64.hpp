#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Standard alphabet, '=' padded. Used for WASM modules in remote request bodies.
std::string base64_encode(const std::vector<uint8_t>& data);

// Stops at the first padding or non-alphabet character.
std::vector<uint8_t> base64_decode(const std::string& s);
