#pragma once

#include <string_view>
#include <vector>

namespace dg::blocked_services {

/**
 * A well-known web service and the rules which block its domains
 */
struct service {
    std::string_view id;
    std::vector<std::string_view> rules;
};

/**
 * @return all the known services
 */
const std::vector<service> &all();

/**
 * @return the service with the given id, or null if it is unknown
 */
const service *find(std::string_view id);

} // namespace dg::blocked_services
