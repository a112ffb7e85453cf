#include "utils.hpp"
#include <openssl/sha.h>
#include <array>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
    std::ostringstream oss;
    for(std::size_t i = 0; i < size; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    return oss.str();
}

std::string sha256_hex(const std::vector<std::uint8_t>& data){
    std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
    SHA256(data.data(), data.size(), digest.data());
    return hex_from_bytes(digest.data(), digest.size());
}

std::string format_bytes(std::uint64_t bytes){
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if(unit == 0) oss << bytes << ' ' << units[unit];
    else oss << std::fixed << std::setprecision(1) << value << ' ' << units[unit];
    return oss.str();
}
