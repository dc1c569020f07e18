#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <cerrno>
#include <dg_defs.h>
#include <dg_socket_address.h>

namespace dg::utils {

static constexpr auto DG_ETIMEDOUT = ETIMEDOUT;

/** Error text reported by exchanges that ran out of time */
static constexpr std::string_view TIMEOUT_STR = "Request timed out";

enum transport_protocol {
    TP_UDP,
    TP_TCP,
};

/**
 * Split address string to host and port with error
 * @param address_string Address string
 * @param require_ipv6_addr_in_square_brackets Require IPv6 address in square brackets
 * @param require_non_empty_port Require non-empty port after colon
 * @return Host, port, error
 */
std::tuple<std::string_view, std::string_view, err_string_view> split_host_port_with_err(
        std::string_view address_string, bool require_ipv6_addr_in_square_brackets = false,
        bool require_non_empty_port = false);

/**
 * Split address string to host and port
 */
std::pair<std::string_view, std::string_view> split_host_port(std::string_view address_string);

/**
 * Join host and port into address string, IPv6 hosts are put in square brackets
 */
std::string join_host_port(std::string_view host, std::string_view port);

/**
 * Converts duration (microsecond resolution) to timeval structure
 */
timeval duration_to_timeval(std::chrono::microseconds usecs);

/**
 * @return a string representation of an IP address, or
 *         an empty string if an error occured or addr is empty
 */
std::string addr_to_str(uint8_view addr);

/**
 * @param address a numeric IP address, with an optional port number
 * @return a socket_address parsed from the address string, invalid one on error
 */
socket_address str_to_socket_address(std::string_view address);

} // namespace dg::utils
