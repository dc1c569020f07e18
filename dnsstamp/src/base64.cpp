#include <array>
#include <base64.h>

static constexpr uint8_t INVALID = 0xff;
static constexpr char PADDING = '=';

static constexpr std::array<uint8_t, 256> make_basis(bool url_safe) {
    std::array<uint8_t, 256> basis{};
    for (auto &b : basis) {
        b = INVALID;
    }
    constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    for (size_t i = 0; i < alphabet.size(); ++i) {
        basis[(uint8_t) alphabet[i]] = i;
    }
    basis[url_safe ? '-' : '+'] = 62;
    basis[url_safe ? '_' : '/'] = 63;
    return basis;
}

static constexpr auto BASIS_DEFAULT = make_basis(false);
static constexpr auto BASIS_URL_SAFE = make_basis(true);

std::optional<dg::uint8_vector> dg::decode_base64(std::string_view data, bool url_safe) {
    const auto &basis = url_safe ? BASIS_URL_SAFE : BASIS_DEFAULT;

    while (!data.empty() && data.back() == PADDING) {
        data.remove_suffix(1);
    }
    if (data.size() % 4 == 1) {
        return std::nullopt;
    }

    uint8_vector result;
    result.reserve(data.size() * 3 / 4);
    uint32_t acc = 0;
    int bits = 0;
    for (char c : data) {
        uint8_t v = basis[(uint8_t) c];
        if (v == INVALID) {
            return std::nullopt;
        }
        acc = (acc << 6) | v;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(uint8_t(acc >> bits));
        }
    }
    return result;
}
