#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <dg_defs.h>

namespace dg::dnscrypt {

/** Port a DNSCrypt resolver listens on when its stamp does not specify one */
constexpr uint16_t DEFAULT_DNSCRYPT_PORT = 443;

/** Largest query that is still safe to send over UDP without fragmentation */
constexpr size_t MAX_DNS_UDP_SAFE_PACKET_SIZE = 1252;
constexpr size_t MAX_DNS_PACKET_SIZE = 4096;
constexpr size_t CLIENT_MAGIC_LEN = 8;
constexpr size_t KEY_SIZE = 32;
constexpr size_t NONCE_SIZE = 24;
constexpr size_t HALF_NONCE_SIZE = NONCE_SIZE / 2;
constexpr size_t TAG_SIZE = 16;
/** client magic + client public key + client half nonce + MAC */
constexpr size_t QUERY_OVERHEAD = CLIENT_MAGIC_LEN + KEY_SIZE + HALF_NONCE_SIZE + TAG_SIZE;

using key_array = uint8_array<KEY_SIZE>;
using nonce_array = uint8_array<NONCE_SIZE>;
using client_magic_array = uint8_array<CLIENT_MAGIC_LEN>;

/**
 * Encryption algorithm, the values are the `es-version` field of the certificate
 */
enum class crypto_construction : uint16_t {
    UNDEFINED,
    X_SALSA_20_POLY_1305 = 0x0001,
    X_CHACHA_20_POLY_1305 = 0x0002,
};

} // namespace dg::dnscrypt
