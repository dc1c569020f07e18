#pragma once

#include <optional>
#include <string_view>
#include <dg_defs.h>

namespace dg {

/**
 * Decode data from Base64-encoded string
 * @param data Base64-encoded string, padding is optional
 * @param url_safe is string url safe or not
 * @return decoded bytes or nullopt if string is not valid Base64-encoded
 */
std::optional<uint8_vector> decode_base64(std::string_view data, bool url_safe);

} // namespace dg
