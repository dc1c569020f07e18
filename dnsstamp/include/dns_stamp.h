#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <dg_defs.h>

namespace dg {

using stamp_port = uint16_t;

constexpr stamp_port DEFAULT_DOH_PORT = 443;
constexpr stamp_port DEFAULT_DOT_PORT = 853;
constexpr stamp_port DEFAULT_PLAIN_PORT = 53;
constexpr std::string_view STAMP_URL_PREFIX_WITH_SCHEME = "sdns://";

/**
 * Informal properties of the resolver
 */
enum server_informal_properties : uint64_t {
    /** resolver does DNSSEC validation */
    DNSSEC = 1 << 0,
    /** resolver does not record logs */
    NO_LOG = 1 << 1,
    /** resolver doesn't intentionally block domains */
    NO_FILTER = 1 << 2,
};

enum class stamp_proto_type : uint8_t {
    PLAIN,
    DNSCRYPT,
    DOH,
    TLS,
};

/**
 * Parsed DNS stamp (https://dnscrypt.info/stamps-specifications)
 */
struct server_stamp {
    using from_str_result = std::pair<server_stamp, err_string>;

    /**
     * Create a URL representing this stamp that can be used as an upstream URL.
     * DNSCrypt stamps have no such representation and are returned as `dnscrypt://<provider name>`.
     */
    std::string pretty_url() const;

    /**
     * Creates stamp struct from `sdns://` URL
     */
    static from_str_result from_string(std::string_view url);

    /** Server address with port */
    std::string server_addr_str;
    /** The DNSCrypt provider's Ed25519 public key, as 32 raw bytes. Empty for other types. */
    uint8_vector server_pk;
    /** SHA256 digests of the TBS certificates found in the validation chain */
    std::vector<uint8_vector> hashes;
    /**
     * DNSCrypt: the DNSCrypt provider name
     * DOH and DOT: server's hostname
     * Plain DNS: not specified
     */
    std::string provider_name;
    /** HTTP path, for DoH stamps only */
    std::string path;
    server_informal_properties props;
    stamp_proto_type proto;
};

} // namespace dg
