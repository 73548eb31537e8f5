#include <string.h>
#include <set>

#include <vidar-internal/physical.hpp>

#include "fixture.hpp"
#include "testsuite.hpp"

using namespace vidar;

DEFINE_TEST(physical_accounting, ([] {
	auto &allocator = *physicalAllocator;
	auto total = allocator.numTotalPages();
	auto free = allocator.numFreePages();
	assert(allocator.numUsedPages() + free == total);

	auto physical = allocator.allocate();
	assert(physical != PhysicalAddr(-1));
	assert(!(physical & (kPageSize - 1)));
	assert(allocator.isAllocated(physical));
	assert(allocator.numFreePages() == free - 1);

	allocator.free(physical);
	assert(!allocator.isAllocated(physical));
	assert(allocator.numFreePages() == free);
}))

DEFINE_TEST(physical_exhaustion, ([] {
	// 64 pages; the first one holds the bitmap.
	PhysicalFrameAllocator allocator;
	allocator.bootstrapRegion(fixture::unmanagedBase, 64);
	assert(allocator.numTotalPages() == 63);
	assert(allocator.isAllocated(fixture::unmanagedBase));

	std::set<PhysicalAddr> seen;
	for(int i = 0; i < 63; i++) {
		auto physical = allocator.allocate();
		assert(physical != PhysicalAddr(-1));
		assert(physical > fixture::unmanagedBase);
		assert(physical < fixture::unmanagedBase + 64 * kPageSize);
		assert(seen.insert(physical).second);
	}
	assert(allocator.allocate() == PhysicalAddr(-1));
	assert(!allocator.numFreePages());

	// A released frame is handed out again.
	auto victim = *seen.begin();
	allocator.free(victim);
	assert(allocator.numFreePages() == 1);
	assert(allocator.allocate() == victim);
	assert(allocator.allocate() == PhysicalAddr(-1));

	for(auto physical : seen)
		allocator.free(physical);
	assert(allocator.numFreePages() == 63);
}))

DEFINE_TEST(physical_region_too_small, ([] {
	PhysicalFrameAllocator allocator;
	allocator.bootstrapRegion(fixture::unmanagedBase, 1);
	assert(!allocator.numTotalPages());
	assert(allocator.allocate() == PhysicalAddr(-1));
}))

DEFINE_TEST(physical_frame_is_zeroed, ([] {
	auto free = fixture::freeFrames();

	PhysicalAddr address;
	{
		auto physical = physicalAllocator->allocate();
		memset(mapDirectPhysical(physical), 0xAB, kPageSize);
		physicalAllocator->free(physical);

		auto frame = PhysicalFrame::allocateZeroed();
		assert(frame);
		address = frame.value().address();
		assert(address == physical);
		assert(fixture::freeFrames() == free - 1);

		auto bytes = static_cast<const unsigned char *>(frame.value().data());
		for(size_t i = 0; i < kPageSize; i++)
			assert(!bytes[i]);
	}

	// Dropping the frame returns it.
	assert(fixture::freeFrames() == free);
	assert(!physicalAllocator->isAllocated(address));
}))

DEFINE_TEST(physical_frame_moves_ownership, ([] {
	auto free = fixture::freeFrames();

	auto frame = PhysicalFrame::allocateZeroed();
	assert(frame);
	PhysicalFrame owner{std::move(frame.value())};
	assert(!frame.value());
	assert(owner);

	PhysicalFrame other;
	other = std::move(owner);
	assert(!owner);
	assert(other);
	assert(fixture::freeFrames() == free - 1);

	other = PhysicalFrame{};
	assert(fixture::freeFrames() == free);
}))

DEFINE_TEST(physical_frame_out_of_memory, ([] {
	fixture::ExhaustPhysical exhaust;
	auto frame = PhysicalFrame::allocateZeroed();
	assert(!frame);
	assert(frame.error() == Error::noMemory);
}))
