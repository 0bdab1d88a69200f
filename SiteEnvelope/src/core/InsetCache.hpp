#pragma once

#include "Geometry.hpp"
#include <map>
#include <string>
#include <utility>

namespace site::core {

// 退让多边形缓存，由调用方持有并传入
// 键为 (多边形标识, 距离)；同一标识必须对应同一多边形
// 非线程安全
class InsetCache {
public:
    InsetCache() = default;

    // 命中则返回缓存结果，否则计算 polygonInset 并保存
    const Polygon& inset(const std::string& polygonId, std::span<const LocalPoint> polygon, double distance);

    // 查询方法
    size_t size() const noexcept { return entries_.size(); }
    size_t hits() const noexcept { return hits_; }
    size_t misses() const noexcept { return misses_; }
    bool contains(const std::string& polygonId, double distance) const;

    // 多边形变化后丢弃其全部条目
    void invalidate(const std::string& polygonId);
    void clear() noexcept;

private:
    using Key = std::pair<std::string, double>;

    std::map<Key, Polygon> entries_;
    size_t hits_{0};
    size_t misses_{0};
};

} // namespace site::core
