#pragma once

#include <memory>
#include <vector>
#include <upstream.h>

namespace dg {

using upstream_list = std::vector<std::shared_ptr<upstream>>;

/**
 * Picks the upstream a query is sent to
 */
class upstream_selector {
public:
    /**
     * Choose an upstream from the list.
     * A single upstream is always returned as is, otherwise the choice is uniformly random.
     * @return the chosen upstream, or nullptr if the list is empty
     */
    static std::shared_ptr<upstream> choose(const upstream_list &upstreams);

    /**
     * Choose from the client's own upstreams if it has any, from the global ones otherwise.
     * The lists are never merged.
     * @param custom the client's upstreams, nullptr if the client has none
     */
    static std::shared_ptr<upstream> choose(const upstream_list &global, const upstream_list *custom);
};

} // namespace dg
