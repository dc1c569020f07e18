#include <sodium.h>
#include "dns_crypt_padding.h"

bool dg::dnscrypt::pad(uint8_vector &packet, size_t size) {
    size_t unpadded_len = packet.size();
    if (unpadded_len >= size) {
        return false;
    }
    packet.resize(size);
    size_t padded_len = 0;
    return 0 == sodium_pad(&padded_len, packet.data(), unpadded_len, size, packet.size());
}

bool dg::dnscrypt::unpad(uint8_vector &packet) {
    size_t unpadded_len = 0;
    if (packet.empty() || 0 != sodium_unpad(&unpadded_len, packet.data(), packet.size(), packet.size())) {
        return false;
    }
    packet.resize(unpadded_len);
    return true;
}
