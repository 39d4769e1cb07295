#include <doctest/doctest.h>
#include <memory>

#include "FakeDeviceAllocator.h"
#include "draw2d/alloc/ForcedOffsetAllocator.h"
#include "draw2d/alloc/MemUnit.h"
#include "draw2d/alloc/PageAllocator.h"
#include "draw2d/alloc/PoolAllocator.h"
#include "draw2d/alloc/SharedRefAllocator.h"
#include "draw2d/alloc/SizeSelector.h"
#include "draw2d/alloc/TypeIndexAllocator.h"

using namespace draw2d::alloc;

static AllocationRequest request(VkDeviceSize size, VkDeviceSize alignment = 1, uint32_t type = 0) {
    AllocationRequest r;
    r.size = size;
    r.alignment = alignment;
    r.memoryTypeIndex = type;
    return r;
}

// Keeps a pointer to the fake so tests can inspect it after handing over ownership.
static std::unique_ptr<FakeDeviceAllocator> makeFake(FakeDeviceAllocator*& out) {
    auto fake = std::make_unique<FakeDeviceAllocator>();
    out = fake.get();
    return fake;
}

TEST_SUITE("PageAllocator") {
    TEST_CASE("rounds requests up to whole pages") {
        FakeDeviceAllocator* fake = nullptr;
        PageAllocator pages(makeFake(fake), 256);

        CHECK(pages.roundUpToPage(1) == 256);
        CHECK(pages.roundUpToPage(256) == 256);
        CHECK(pages.roundUpToPage(257) == 512);

        auto allocation = pages.allocate(request(300));
        REQUIRE(allocation);
        CHECK(fake->lastRequest.size == 512);
        CHECK(allocation->byteSize == 300);
    }

    TEST_CASE("frees the paged size") {
        FakeDeviceAllocator* fake = nullptr;
        PageAllocator pages(makeFake(fake), 256);

        auto allocation = pages.allocate(request(10));
        REQUIRE(allocation);
        CHECK(pages.free(*allocation));
        CHECK(fake->live.empty());
    }

    TEST_CASE("freeing null succeeds") {
        FakeDeviceAllocator* fake = nullptr;
        PageAllocator pages(makeFake(fake), 256);
        CHECK(pages.free(Allocation::null()));
        CHECK(fake->freeCalls == 0);
    }
}

TEST_SUITE("PoolAllocator") {
    TEST_CASE("small allocations share one block") {
        FakeDeviceAllocator* fake = nullptr;
        PoolAllocator pool(makeFake(fake), 1024);

        auto a = pool.allocate(request(256));
        auto b = pool.allocate(request(256));
        REQUIRE((a && b));
        CHECK(fake->allocateCalls == 1);
        CHECK(pool.blockCount() == 1);
        CHECK(a->memory == b->memory);
        CHECK(a->offset == 0);
        CHECK(b->offset == 256);
        CHECK(pool.managedByMe(*a));
    }

    TEST_CASE("a new block is taken when the current one is full") {
        FakeDeviceAllocator* fake = nullptr;
        PoolAllocator pool(makeFake(fake), 1024);

        auto a = pool.allocate(request(1024));
        auto b = pool.allocate(request(16));
        REQUIRE((a && b));
        CHECK(pool.blockCount() == 2);
        CHECK(a->memory != b->memory);
        CHECK(fake->lastRequest.size == 1024);
    }

    TEST_CASE("a block is released when it empties") {
        FakeDeviceAllocator* fake = nullptr;
        PoolAllocator pool(makeFake(fake), 1024);

        auto a = pool.allocate(request(100));
        auto b = pool.allocate(request(100));
        REQUIRE((a && b));

        CHECK(pool.free(*a));
        CHECK(pool.blockCount() == 1);
        CHECK(pool.free(*b));
        CHECK(pool.blockCount() == 0);
        CHECK(fake->live.empty());
    }

    TEST_CASE("requests bigger than a block are refused") {
        FakeDeviceAllocator* fake = nullptr;
        PoolAllocator pool(makeFake(fake), 1024);
        CHECK_FALSE(pool.allocate(request(2048)));
        CHECK(fake->allocateCalls == 0);
    }

    TEST_CASE("unknown memory is an error") {
        FakeDeviceAllocator* fake = nullptr;
        PoolAllocator pool(makeFake(fake), 1024);

        Allocation stranger;
        stranger.memory = reinterpret_cast<VkDeviceMemory>(static_cast<uintptr_t>(999));
        stranger.byteSize = 16;
        CHECK_FALSE(pool.free(stranger));
        CHECK_FALSE(pool.managedByMe(stranger));
    }

    TEST_CASE("double free is an error") {
        FakeDeviceAllocator* fake = nullptr;
        PoolAllocator pool(makeFake(fake), 1024);

        auto a = pool.allocate(request(100));
        auto b = pool.allocate(request(100));
        REQUIRE((a && b));
        CHECK(pool.free(*a));
        CHECK_FALSE(pool.free(*a));
    }

    TEST_CASE("aligned requests land on aligned offsets") {
        FakeDeviceAllocator* fake = nullptr;
        PoolAllocator pool(makeFake(fake), 4096);

        auto a = pool.allocate(request(100));
        auto b = pool.allocate(request(100, 256));
        REQUIRE((a && b));
        CHECK(b->offset % 256 == 0);
        CHECK(b->offset >= a->offset + a->byteSize);
    }

    TEST_CASE("blocks still live at destruction go back to the child") {
        auto fake = std::make_shared<FakeDeviceAllocator>();
        {
            PoolAllocator pool(std::make_unique<SharedRefAllocator>(fake), 1024);
            REQUIRE(pool.allocate(request(64)));
            CHECK(fake->live.size() == 1);
        }
        CHECK(fake->live.empty());
    }
}

TEST_SUITE("SizeSelector") {
    TEST_CASE("routes by size") {
        FakeDeviceAllocator* small = nullptr;
        FakeDeviceAllocator* large = nullptr;
        SizeSelector selector(makeFake(small), 1000, makeFake(large));

        auto a = selector.allocate(request(999));
        auto b = selector.allocate(request(1000));
        REQUIRE((a && b));
        CHECK(small->live.size() == 1);
        CHECK(large->live.size() == 1);

        CHECK(selector.managedByMe(*a));
        CHECK(selector.managedByMe(*b));

        CHECK(selector.free(*a));
        CHECK(selector.free(*b));
        CHECK(small->live.empty());
        CHECK(large->live.empty());
    }
}

TEST_SUITE("TypeIndexAllocator") {
    static VkPhysicalDeviceMemoryProperties threeTypes() {
        VkPhysicalDeviceMemoryProperties properties{};
        properties.memoryTypeCount = 3;
        return properties;
    }

    TEST_CASE("one allocator per memory type") {
        std::vector<FakeDeviceAllocator*> fakes;
        TypeIndexAllocator allocator(threeTypes(),
            [&](uint32_t, const VkMemoryType&) -> std::unique_ptr<DeviceAllocator> {
                FakeDeviceAllocator* fake = nullptr;
                auto owned = makeFake(fake);
                fakes.push_back(fake);
                return owned;
            });

        REQUIRE(allocator.typeCount() == 3);
        REQUIRE(fakes.size() == 3);

        auto allocation = allocator.allocate(request(64, 1, 2));
        REQUIRE(allocation);
        CHECK(fakes[0]->live.empty());
        CHECK(fakes[2]->live.size() == 1);

        CHECK(allocator.managedByMe(*allocation));
        CHECK(allocator.free(*allocation));
        CHECK(fakes[2]->live.empty());
    }

    TEST_CASE("unknown memory types are refused") {
        TypeIndexAllocator allocator(threeTypes(),
            [](uint32_t, const VkMemoryType&) -> std::unique_ptr<DeviceAllocator> {
                return std::make_unique<FakeDeviceAllocator>();
            });

        CHECK_FALSE(allocator.allocate(request(64, 1, 7)));

        Allocation stranger;
        stranger.memory = reinterpret_cast<VkDeviceMemory>(static_cast<uintptr_t>(5));
        stranger.memoryTypeIndex = 7;
        CHECK_FALSE(allocator.free(stranger));
        CHECK_FALSE(allocator.managedByMe(stranger));
    }
}

TEST_SUITE("ForcedOffsetAllocator") {
    TEST_CASE("offsets are pushed past a hundred alignments") {
        FakeDeviceAllocator* fake = nullptr;
        ForcedOffsetAllocator forced(makeFake(fake), 4);

        auto allocation = forced.allocate(request(64));
        REQUIRE(allocation);
        CHECK(fake->lastRequest.size == 64 + 400);
        CHECK(allocation->offset == 400);
        CHECK(allocation->byteSize == 64);

        CHECK(forced.free(*allocation));
        CHECK(fake->live.empty());
    }
}

TEST_SUITE("SharedRefAllocator") {
    TEST_CASE("several owners share one child") {
        auto fake = std::make_shared<FakeDeviceAllocator>();
        SharedRefAllocator first(fake);
        SharedRefAllocator second(fake);

        auto allocation = first.allocate(request(32));
        REQUIRE(allocation);
        CHECK(second.managedByMe(*allocation));
        CHECK(second.free(*allocation));
        CHECK(fake->live.empty());
    }
}

TEST_SUITE("Composed stack") {
    TEST_CASE("page over pool hands sizes back consistently") {
        FakeDeviceAllocator* fake = nullptr;
        PageAllocator stack(std::make_unique<PoolAllocator>(makeFake(fake), 4096), 256);

        auto a = stack.allocate(request(10));
        auto b = stack.allocate(request(300));
        REQUIRE((a && b));
        CHECK(a->byteSize == 10);
        CHECK(b->offset == 256);

        CHECK(stack.free(*a));
        CHECK(stack.free(*b));
        CHECK(fake->live.empty());
    }

    TEST_CASE("a threshold equal to the block size serves every size") {
        // Same shape as buildStandardAllocator, with 8 MiB blocks
        const VkDeviceSize block = toBytes(MemUnit::MiB, 8);
        auto shared = std::make_shared<FakeDeviceAllocator>();
        SizeSelector stack(
            std::make_unique<PageAllocator>(
                std::make_unique<PoolAllocator>(std::make_unique<SharedRefAllocator>(shared), block), 256),
            block,
            std::make_unique<PageAllocator>(std::make_unique<SharedRefAllocator>(shared), 256));

        auto justBelow = stack.allocate(request(block - 1));
        auto twelve = stack.allocate(request(toBytes(MemUnit::MiB, 12)));
        REQUIRE(justBelow);
        REQUIRE(twelve);
        CHECK(shared->live.size() == 2);

        CHECK(stack.free(*justBelow));
        CHECK(stack.free(*twelve));
        CHECK(shared->live.empty());
    }

    TEST_CASE("a pool refuses requests larger than its block") {
        FakeDeviceAllocator* fake = nullptr;
        PoolAllocator pool(makeFake(fake), toBytes(MemUnit::MiB, 8));
        CHECK_FALSE(pool.allocate(request(toBytes(MemUnit::MiB, 12))));
        CHECK(fake->allocateCalls == 0);
    }
}
