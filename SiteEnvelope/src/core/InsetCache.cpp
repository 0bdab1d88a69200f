#include "core/InsetCache.hpp"
#include <limits>

namespace site::core {

const Polygon& InsetCache::inset(const std::string& polygonId, std::span<const LocalPoint> polygon, double distance) {
    // 非正距离（含 NaN）结果都是原多边形，归一到 0 保证键可比较
    if (!(distance > 0.0)) {
        distance = 0.0;
    }
    Key key{polygonId, distance};

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        ++hits_;
        return it->second;
    }

    ++misses_;
    auto [inserted, _] = entries_.emplace(std::move(key), polygonInset(polygon, distance));
    return inserted->second;
}

bool InsetCache::contains(const std::string& polygonId, double distance) const {
    if (!(distance > 0.0)) {
        distance = 0.0;
    }
    return entries_.find(Key{polygonId, distance}) != entries_.end();
}

void InsetCache::invalidate(const std::string& polygonId) {
    auto it = entries_.lower_bound(Key{polygonId, -std::numeric_limits<double>::infinity()});
    while (it != entries_.end() && it->first.first == polygonId) {
        it = entries_.erase(it);
    }
}

void InsetCache::clear() noexcept {
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

} // namespace site::core
