#include <algorithm>
#include <dg_utils.h>
#include <dg_socket_address.h>

std::vector<std::string_view> dg::utils::split_by(std::string_view str, int delim) {
    std::vector<std::string_view> out;
    out.reserve(1 + std::count(str.begin(), str.end(), (char) delim));
    size_t seek = 0;
    while (seek <= str.length()) {
        size_t end = str.find((char) delim, seek);
        if (end == str.npos) {
            end = str.length();
        }
        std::string_view s = str.substr(seek, end - seek);
        trim(s);
        if (!s.empty()) {
            out.push_back(s);
        }
        seek = end + 1;
    }
    return out;
}

std::vector<std::string_view> dg::utils::split_by_any_of(std::string_view str, std::string_view delim) {
    std::vector<std::string_view> out;
    size_t seek = 0;
    while (seek < str.length()) {
        size_t end = str.find_first_of(delim, seek);
        if (end == str.npos) {
            end = str.length();
        }
        std::string_view s = str.substr(seek, end - seek);
        trim(s);
        if (!s.empty()) {
            out.push_back(s);
        }
        seek = end + 1;
    }
    return out;
}

static std::array<std::string_view, 2> split2(std::string_view str, int delim, bool reverse) {
    size_t seek = !reverse ? str.find(delim) : str.rfind(delim);
    if (seek == str.npos) {
        return {str, {}};
    }
    return {str.substr(0, seek), str.substr(seek + 1)};
}

std::array<std::string_view, 2> dg::utils::split2_by(std::string_view str, int delim) {
    return split2(str, delim, false);
}

std::array<std::string_view, 2> dg::utils::rsplit2_by(std::string_view str, int delim) {
    return split2(str, delim, true);
}

bool dg::utils::is_valid_ip4(std::string_view str) {
    dg::socket_address addr(str, 0);
    return addr.valid() && addr.c_sockaddr()->sa_family == AF_INET;
}

bool dg::utils::is_valid_ip6(std::string_view str) {
    dg::socket_address addr(str, 0);
    return addr.valid() && addr.c_sockaddr()->sa_family == AF_INET6;
}
