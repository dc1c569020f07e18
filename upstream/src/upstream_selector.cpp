#include <random>
#include <upstream_selector.h>

std::shared_ptr<dg::upstream> dg::upstream_selector::choose(const upstream_list &upstreams) {
    switch (upstreams.size()) {
    case 0:
        return nullptr;
    case 1:
        return upstreams.front();
    default: {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<size_t> dist(0, upstreams.size() - 1);
        return upstreams[dist(rng)];
    }
    }
}

std::shared_ptr<dg::upstream> dg::upstream_selector::choose(const upstream_list &global,
        const upstream_list *custom) {
    if (custom != nullptr && !custom->empty()) {
        return choose(*custom);
    }
    return choose(global);
}
