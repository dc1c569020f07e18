#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <cctype>
#include <fmt/format.h>
#include <dg_defs.h>

/**
 * Macros for fmt::format with compile-time checked FMT_STRING
 */
#define DG_FMT(FORMAT, ...) fmt::format(FMT_STRING(FORMAT), __VA_ARGS__)

namespace dg::utils {

/**
 * Transform string in lowercase
 */
static inline std::string to_lower(std::string_view str) {
    std::string lwr;
    lwr.reserve(str.length());
    std::transform(str.cbegin(), str.cend(), std::back_inserter(lwr), (int (*)(int))std::tolower);
    return lwr;
}

/**
 * Trim whitespaces-only prefix and suffix
 */
static inline void trim(std::string_view &str) {
    auto pos1 = std::find_if(str.begin(), str.end(), std::not_fn((int(*)(int))std::isspace));
    str.remove_prefix(std::distance(str.begin(), pos1));
    auto pos2 = std::find_if(str.rbegin(), str.rend(), std::not_fn((int(*)(int))std::isspace));
    str.remove_suffix(std::distance(str.rbegin(), pos2));
}

/**
 * Check if string starts with prefix
 */
static inline constexpr bool starts_with(std::string_view str, std::string_view prefix) {
    return str.length() >= prefix.length()
            && 0 == str.compare(0, prefix.length(), prefix);
}

/**
 * Check if string ends with suffix
 */
static inline constexpr bool ends_with(std::string_view str, std::string_view suffix) {
    return str.length() >= suffix.length()
            && 0 == str.compare(str.length() - suffix.length(), suffix.length(), suffix);
}

/**
 * Splits string by delimiter, empty and whitespace-only parts are skipped
 */
std::vector<std::string_view> split_by(std::string_view str, int delim);

/**
 * Splits string by any of the delimiters, empty parts are skipped
 */
std::vector<std::string_view> split_by_any_of(std::string_view str, std::string_view delim);

/**
 * Split string by first found delimiter for 2 parts
 */
std::array<std::string_view, 2> split2_by(std::string_view str, int delim);

/**
 * Split string by last found delimiter for 2 parts
 */
std::array<std::string_view, 2> rsplit2_by(std::string_view str, int delim);

/**
 * Join parts into a single container with result type R
 * @tparam R Result container type (required)
 */
template<typename R, typename T>
static inline R join(const T &parts) {
    R result;
    for (const auto &p : parts) {
        result.insert(std::cend(result), std::cbegin(p), std::cend(p));
    }
    return result;
}

/**
 * Join parts into a single container from comma-separated parts with possibly different types
 * @tparam R Result container type (required)
 */
template<typename R, typename... Ts>
static inline std::enable_if_t<sizeof...(Ts) >= 2, R> join(const Ts&... parts) {
    R result;
    result.reserve((... + std::size(parts)));
    (... , static_cast<void>(result.insert(std::cend(result), std::cbegin(parts), std::cend(parts))));
    return result;
}

/**
 * Check if string is a valid IPv4 address
 */
bool is_valid_ip4(std::string_view str);

/**
 * Check if string is a valid IPv6 address
 */
bool is_valid_ip6(std::string_view str);

/**
 * Create std::array from array with size S and type T
 */
template<size_t S, typename T>
static inline auto to_array(const T *value) {
    std::array<std::remove_cv_t<T>, S> result;
    std::copy(value, value + S, result.begin());
    return result;
}

/**
 * Conditionally returns optional or nullopt
 */
template<typename T>
static inline constexpr auto make_optional_if(bool condition, T&& value) {
    return condition ? std::make_optional(std::forward<T>(value)) : std::nullopt;
}

/**
 * Timer measures time since creating object or the last reset
 */
class timer {
public:
    /**
     * Returns elapsed time duration since creating object
     * @tparam T Duration type
     */
    template<typename T>
    T elapsed() const {
        return std::chrono::duration_cast<T>(std::chrono::steady_clock::now() - start);
    }

    void reset() {
        start = std::chrono::steady_clock::now();
    }
private:
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};

/**
 * Creates result struct with error. Result is default initialized or initialized with xs parameters.
 * @warning Assumed that error is last member in struct
 */
template<typename R, typename E, typename... Us>
R forward_error(E&& err, Us&&... xs) {
    R result{std::forward<Us>(xs)...};
    result.error = std::forward<E>(err);
    return result;
}

/**
 * Error maker functional object for reducing boilerplate code.
 * @example f_result f() {
 *              static constexpr dg::utils::make_error<f_result> make_error;
 *              ...
 *              if (err) {
 *                  return make_error(std::move(err));
 *              }
 *          }
 */
template<typename T>
class make_error {
public:
    template<typename... Ts>
    decltype(auto) operator()(Ts&&... xs) const {
        return (forward_error<T>)(std::forward<Ts>(xs)...);
    }
};

/**
 * Calls the supplied function in destructor.
 * Useful to ensure cleanup if the control flow can exit the scope in multiple different ways.
 */
class scope_exit {
private:
    std::function<void()> m_f;

public:
    explicit scope_exit(std::function<void()> &&f) : m_f{std::move(f)} {}

    scope_exit(const scope_exit &) = delete;
    scope_exit &operator=(const scope_exit &) = delete;

    ~scope_exit() {
        if (m_f) {
            m_f();
        }
    }
};

namespace detail {
// From boost 1.72
template <typename SizeT>
void hash_combine_impl(SizeT& seed, SizeT value) {
    seed ^= value + 0x9e3779b9 + (seed<<6) + (seed>>2);
}
} // namespace detail

/**
 * Compute and return the combined hash of objs
 * @param objs std::hash must be specialized for each of these objects
 */
template <typename... Ts>
size_t hash_combine(const Ts&... objs) {
    size_t seed = 0;
    (detail::hash_combine_impl(seed, std::hash<std::decay_t<Ts>>{}(objs)), ...);
    return seed;
}

} // namespace dg::utils
