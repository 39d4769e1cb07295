#pragma once

#include <cstdint>
#include <functional>

namespace draw2d {

// Process-wide unique id for a layer.
class LayerHandle {
public:
    static LayerHandle next();

    int64_t id() const { return id_; }

    bool operator==(const LayerHandle& other) const { return id_ == other.id_; }
    bool operator!=(const LayerHandle& other) const { return id_ != other.id_; }

private:
    explicit LayerHandle(int64_t id) : id_(id) {}

    int64_t id_;
};

} // namespace draw2d

namespace std {
template <>
struct hash<draw2d::LayerHandle> {
    size_t operator()(const draw2d::LayerHandle& handle) const noexcept {
        return std::hash<int64_t>()(handle.id());
    }
};
} // namespace std
