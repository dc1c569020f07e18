#pragma once

#include <cstddef>
#include <dg_defs.h>

namespace dg::dnscrypt {

/**
 * Pad packet with the ISO/IEC 7816-4 scheme up to `size` bytes
 * @return false if packet is already too long
 */
bool pad(uint8_vector &packet, size_t size);

/**
 * Strip the padding added by `pad()`
 * @return false if the padding is malformed
 */
bool unpad(uint8_vector &packet);

} // namespace dg::dnscrypt
