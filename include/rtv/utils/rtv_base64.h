/**
 * @file rtv_base64.h
 * @brief rtv - Standard base64 (RFC 4648, padded) encode/decode
 */

#ifndef RTV_BASE64_H
#define RTV_BASE64_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rtv {

std::string base64_encode(const uint8_t* data, size_t len);

/**
 * @brief Decode base64 text
 *
 * Whitespace is skipped. Padding is optional.
 *
 * @return false on characters outside the alphabet or a dangling 6-bit group
 */
bool base64_decode(const std::string& text, std::vector<uint8_t>& out);

}  // namespace rtv

#endif  // RTV_BASE64_H
