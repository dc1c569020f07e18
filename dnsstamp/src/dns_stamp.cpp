#include <cstring>
#include <functional>
#include <initializer_list>
#include <dg_utils.h>
#include <dg_net_utils.h>
#include <dg_socket_address.h>
#include <base64.h>
#include <dns_stamp.h>

namespace dg {

using read_stamp_part_function_t = std::function<err_string(server_stamp &, size_t &, const uint8_vector &)>;

static constexpr size_t PLAIN_STAMP_MIN_SIZE = 17;
static constexpr size_t DNSCRYPT_STAMP_MIN_SIZE = 66;
static constexpr size_t DOH_STAMP_MIN_SIZE = 19;
static constexpr size_t DOT_STAMP_MIN_SIZE = 19;

static bool read_size_with_check(size_t &size, size_t &pos, const uint8_vector &value) {
    if (pos >= value.size()) {
        return false;
    }
    size = value[pos++];
    return size + pos <= value.size();
}

template<typename T>
static void read_bytes_using_size(T &result, size_t &pos, size_t size, const uint8_vector &value) {
    result.insert(result.end(), value.begin() + pos, value.begin() + pos + size);
    pos += size;
}

template<typename T>
static bool read_bytes_with_size(T &result, size_t &pos, const uint8_vector &value) {
    size_t size = 0;
    if (!read_size_with_check(size, pos, value)) {
        return false;
    }
    read_bytes_using_size(result, pos, size, value);
    return true;
}

static err_string validate_server_addr_str(std::string_view addr_str) {
    auto [host, port, err] = utils::split_host_port_with_err(addr_str, true, true);
    if (err) {
        return err_string(err);
    }
    if (!host.empty() && !socket_address(host, 0).valid()) {
        return "Invalid server address";
    }
    if (!port.empty()) {
        std::string port_str{port};
        char *end = nullptr;
        long port_number = std::strtol(port_str.c_str(), &end, 10);
        if (end != port_str.c_str() + port_str.size() || port_number <= 0 || port_number > 65535) {
            return "Invalid server port";
        }
    }
    return std::nullopt;
}

static err_string read_props_and_server_addr(server_stamp &stamp, size_t &pos, const uint8_vector &value) {
    pos = 1;
    uint64_t props;
    std::memcpy(&props, value.data() + pos, sizeof(props));
    stamp.props = server_informal_properties(props);
    pos += sizeof(props);
    if (!read_bytes_with_size(stamp.server_addr_str, pos, value)) {
        return "Invalid stamp";
    }
    return validate_server_addr_str(stamp.server_addr_str);
}

static err_string read_stamp_server_pk(server_stamp &stamp, size_t &pos, const uint8_vector &value) {
    if (!read_bytes_with_size(stamp.server_pk, pos, value)) {
        return "Invalid stamp";
    }
    return std::nullopt;
}

static err_string read_stamp_hashes(server_stamp &stamp, size_t &pos, const uint8_vector &value) {
    while (true) {
        if (pos >= value.size()) {
            return "Invalid stamp";
        }
        uint8_t hash_size_raw = value[pos++];
        size_t hash_size = hash_size_raw & ~0x80u;
        if (hash_size + pos > value.size()) {
            return "Invalid stamp";
        }
        if (hash_size > 0) {
            read_bytes_using_size(stamp.hashes.emplace_back(), pos, hash_size, value);
        }
        if (!(hash_size_raw & 0x80u)) {
            return std::nullopt;
        }
    }
}

static err_string read_stamp_provider_name(server_stamp &stamp, size_t &pos, const uint8_vector &value) {
    if (!read_bytes_with_size(stamp.provider_name, pos, value)) {
        return "Invalid stamp";
    }
    return std::nullopt;
}

static err_string read_stamp_path(server_stamp &stamp, size_t &pos, const uint8_vector &value) {
    if (!read_bytes_with_size(stamp.path, pos, value)) {
        return "Invalid stamp";
    }
    return std::nullopt;
}

static server_stamp::from_str_result new_server_stamp(const uint8_vector &bin, stamp_proto_type proto,
        size_t min_size, std::initializer_list<read_stamp_part_function_t> fs) {
    server_stamp result{};
    result.proto = proto;
    if (bin.size() < min_size) {
        return {std::move(result), "Stamp is too short"};
    }

    size_t pos = 0;
    if (auto error = read_props_and_server_addr(result, pos, bin)) {
        return {std::move(result), std::move(error)};
    }
    for (const auto &f : fs) {
        if (auto error = f(result, pos, bin)) {
            return {std::move(result), std::move(error)};
        }
    }
    if (pos != bin.size()) {
        return {std::move(result), "Invalid stamp (garbage after end)"};
    }
    return {std::move(result), std::nullopt};
}

server_stamp::from_str_result server_stamp::from_string(std::string_view url) {
    if (!utils::starts_with(url, STAMP_URL_PREFIX_WITH_SCHEME)) {
        return {{}, DG_FMT("Stamps are expected to start with {}", STAMP_URL_PREFIX_WITH_SCHEME)};
    }
    url.remove_prefix(STAMP_URL_PREFIX_WITH_SCHEME.size());
    auto decoded = decode_base64(url, true);
    if (!decoded) {
        return {{}, "Invalid stamp"};
    }
    if (decoded->empty()) {
        return {{}, "Stamp is too short"};
    }

    switch (stamp_proto_type{decoded->front()}) {
    case stamp_proto_type::PLAIN:
        return new_server_stamp(*decoded, stamp_proto_type::PLAIN, PLAIN_STAMP_MIN_SIZE, {});
    case stamp_proto_type::DNSCRYPT:
        return new_server_stamp(*decoded, stamp_proto_type::DNSCRYPT, DNSCRYPT_STAMP_MIN_SIZE,
                {read_stamp_server_pk, read_stamp_provider_name});
    case stamp_proto_type::DOH:
        return new_server_stamp(*decoded, stamp_proto_type::DOH, DOH_STAMP_MIN_SIZE,
                {read_stamp_hashes, read_stamp_provider_name, read_stamp_path});
    case stamp_proto_type::TLS:
        return new_server_stamp(*decoded, stamp_proto_type::TLS, DOT_STAMP_MIN_SIZE,
                {read_stamp_hashes, read_stamp_provider_name});
    }
    return {{}, "Unsupported stamp version or protocol"};
}

std::string server_stamp::pretty_url() const {
    std::string_view scheme;
    switch (proto) {
    case stamp_proto_type::DNSCRYPT:
        return DG_FMT("dnscrypt://{}", provider_name);
    case stamp_proto_type::PLAIN: {
        auto [host, port] = utils::split_host_port(server_addr_str);
        return port.empty() ? std::string{host} : server_addr_str;
    }
    case stamp_proto_type::DOH:
        scheme = "https://";
        break;
    case stamp_proto_type::TLS:
        scheme = "tls://";
        break;
    }

    std::string port;
    if (!server_addr_str.empty()) {
        if (server_addr_str.front() == ':') {
            port = server_addr_str;
        } else if (auto [_, port_view] = utils::split_host_port(server_addr_str); !port_view.empty()) {
            port = DG_FMT(":{}", port_view);
        }
    }
    return DG_FMT("{}{}{}{}", scheme, provider_name, port, path);
}

} // namespace dg
