#pragma once

#include <cstdint>

namespace draw2d {
namespace alloc {

enum class MemUnit {
    B,
    KiB,
    MiB,
    GiB
};

constexpr uint64_t toBytes(MemUnit unit, uint64_t count) {
    switch (unit) {
        case MemUnit::B:   return count;
        case MemUnit::KiB: return count * 1024ull;
        case MemUnit::MiB: return count * 1024ull * 1024ull;
        case MemUnit::GiB: return count * 1024ull * 1024ull * 1024ull;
    }
    return count;
}

} // namespace alloc
} // namespace draw2d
