#include <sodium.h>
#include <magic_enum.hpp>
#include "dns_crypt_cipher.h"

namespace dg::dnscrypt {

static constexpr uint8_t HSALSA20_INPUT[16]{};
static constexpr uint8_t HCHACHA20_INPUT[16]{};

static bool is_all_zeros(const key_array &key) {
    uint8_t acc = 0;
    for (uint8_t b : key) {
        acc |= b;
    }
    return acc == 0;
}

class xsalsa20_poly1305 : public cipher {
public:
    shared_key_result shared_key(const key_array &secret_key, const key_array &public_key) const override {
        static constexpr utils::make_error<shared_key_result> make_error;
        key_array key{};
        if (0 != crypto_scalarmult(key.data(), secret_key.data(), public_key.data())) {
            return make_error("Failed to compute the Curve25519 point");
        }
        if (0 != crypto_core_hsalsa20(key.data(), HSALSA20_INPUT, key.data(), nullptr)) {
            return make_error("Failed to derive the key with HSalsa20");
        }
        return {key, std::nullopt};
    }

    seal_result seal(uint8_view message, const nonce_array &nonce, const key_array &key) const override {
        uint8_vector out(message.size() + crypto_secretbox_MACBYTES);
        if (0 != crypto_secretbox_easy(out.data(), message.data(), message.size(), nonce.data(), key.data())) {
            return {{}, "XSalsa20-Poly1305 seal failed"};
        }
        return {std::move(out), std::nullopt};
    }

    open_result open(uint8_view ciphertext, const nonce_array &nonce, const key_array &key) const override {
        if (ciphertext.size() < crypto_secretbox_MACBYTES) {
            return {{}, "Ciphertext is shorter than the MAC"};
        }
        uint8_vector out(ciphertext.size() - crypto_secretbox_MACBYTES);
        if (0 != crypto_secretbox_open_easy(out.data(), ciphertext.data(), ciphertext.size(),
                nonce.data(), key.data())) {
            return {{}, "XSalsa20-Poly1305 open failed"};
        }
        return {std::move(out), std::nullopt};
    }
};

class xchacha20_poly1305 : public cipher {
public:
    shared_key_result shared_key(const key_array &secret_key, const key_array &public_key) const override {
        static constexpr utils::make_error<shared_key_result> make_error;
        key_array key{};
        if (0 != crypto_scalarmult(key.data(), secret_key.data(), public_key.data())) {
            return make_error("Failed to compute the Curve25519 point");
        }
        if (is_all_zeros(key)) {
            return make_error("Weak public key");
        }
        if (0 != crypto_core_hchacha20(key.data(), HCHACHA20_INPUT, key.data(), nullptr)) {
            return make_error("Failed to derive the key with HChaCha20");
        }
        return {key, std::nullopt};
    }

    seal_result seal(uint8_view message, const nonce_array &nonce, const key_array &key) const override {
        uint8_vector out(message.size() + crypto_secretbox_xchacha20poly1305_MACBYTES);
        if (0 != crypto_secretbox_xchacha20poly1305_easy(out.data(), message.data(), message.size(),
                nonce.data(), key.data())) {
            return {{}, "XChaCha20-Poly1305 seal failed"};
        }
        return {std::move(out), std::nullopt};
    }

    open_result open(uint8_view ciphertext, const nonce_array &nonce, const key_array &key) const override {
        if (ciphertext.size() < crypto_secretbox_xchacha20poly1305_MACBYTES) {
            return {{}, "Ciphertext is shorter than the MAC"};
        }
        uint8_vector out(ciphertext.size() - crypto_secretbox_xchacha20poly1305_MACBYTES);
        if (0 != crypto_secretbox_xchacha20poly1305_open_easy(out.data(), ciphertext.data(), ciphertext.size(),
                nonce.data(), key.data())) {
            return {{}, "XChaCha20-Poly1305 open failed"};
        }
        return {std::move(out), std::nullopt};
    }
};

create_cipher_result create_cipher(crypto_construction construction) {
    static const int sodium_status = sodium_init();
    if (sodium_status < 0) {
        return {nullptr, "Failed to initialize libsodium"};
    }

    switch (construction) {
    case crypto_construction::X_SALSA_20_POLY_1305: {
        static const xsalsa20_poly1305 instance;
        return {&instance, std::nullopt};
    }
    case crypto_construction::X_CHACHA_20_POLY_1305: {
        static const xchacha20_poly1305 instance;
        return {&instance, std::nullopt};
    }
    case crypto_construction::UNDEFINED:
        break;
    }
    return {nullptr, DG_FMT("Unknown crypto construction: {}", magic_enum::enum_name(construction))};
}

} // namespace dg::dnscrypt
