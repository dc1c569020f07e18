#pragma once

#include <functional>
#include <type_traits>
#include <utility>
#include <dg_defs.h>
#include <dg_utils.h>
#include <dns_crypt_utils.h>

namespace dg::dnscrypt {

/**
 * Box construction used to derive keys and to seal and open DNSCrypt messages
 */
class cipher {
public:
    struct shared_key_result {
        key_array shared_key;
        err_string error;
    };

    struct seal_result {
        uint8_vector ciphertext;
        err_string error;
    };

    struct open_result {
        uint8_vector decrypted;
        err_string error;
    };

    cipher() = default;
    cipher(const cipher &) = delete;
    cipher &operator=(const cipher &) = delete;
    virtual ~cipher() = default;

    /**
     * Compute the key shared between client and resolver
     */
    virtual shared_key_result shared_key(const key_array &secret_key, const key_array &public_key) const = 0;

    /**
     * Encrypt and authenticate a message
     */
    virtual seal_result seal(uint8_view message, const nonce_array &nonce, const key_array &key) const = 0;

    /**
     * Verify and decrypt a ciphertext
     */
    virtual open_result open(uint8_view ciphertext, const nonce_array &nonce, const key_array &key) const = 0;
};

struct create_cipher_result {
    const cipher *cipher_ptr;
    err_string error;
};

/**
 * Get the cipher implementing the construction
 * @return cipher singleton, or an error if the construction is unknown or libsodium failed to initialize
 */
create_cipher_result create_cipher(crypto_construction construction);

/**
 * Call a cipher member function on the cipher of the given construction
 */
template<typename F, typename... Ts>
auto apply_cipher_function(crypto_construction construction, F &&f, Ts &&...xs) {
    using result_type = std::invoke_result_t<F &&, const cipher *, Ts &&...>;
    auto [cipher_ptr, cipher_err] = create_cipher(construction);
    if (cipher_err) {
        static constexpr utils::make_error<result_type> make_error;
        return make_error(std::move(cipher_err));
    }
    return std::invoke(std::forward<F>(f), cipher_ptr, std::forward<Ts>(xs)...);
}

template<typename... Ts>
auto cipher_shared_key(crypto_construction construction, Ts &&...xs) {
    return apply_cipher_function(construction, &cipher::shared_key, std::forward<Ts>(xs)...);
}

template<typename... Ts>
auto cipher_seal(crypto_construction construction, Ts &&...xs) {
    return apply_cipher_function(construction, &cipher::seal, std::forward<Ts>(xs)...);
}

template<typename... Ts>
auto cipher_open(crypto_construction construction, Ts &&...xs) {
    return apply_cipher_function(construction, &cipher::open, std::forward<Ts>(xs)...);
}

} // namespace dg::dnscrypt
