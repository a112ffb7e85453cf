#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

std::string hex_from_bytes(const unsigned char* data, std::size_t size);
std::string sha256_hex(const std::vector<std::uint8_t>& data);
std::string format_bytes(std::uint64_t bytes);
