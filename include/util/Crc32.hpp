#ifndef UTIL_CRC32_HPP
#define UTIL_CRC32_HPP
#include <string>
#include <cstdint>
#include <cstddef>

namespace util {

// CRC-32 (IEEE 802.3, reflected, polynomial 0xEDB88320).
uint32_t computeCRC32(const std::string &data);
uint32_t computeCRC32(const void* data, size_t size);

} // namespace util

#endif
