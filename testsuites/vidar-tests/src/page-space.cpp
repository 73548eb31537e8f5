#include <vidar-internal/arch/paging.hpp>

#include "fixture.hpp"
#include "testsuite.hpp"

using namespace vidar;

DEFINE_TEST(page_space_map_translate_unmap, ([] {
	auto free = fixture::freeFrames();
	{
		auto created = ClientPageSpace::create();
		assert(created);
		auto pageSpace = std::move(created.value());
		assert(fixture::freeFrames() == free - 1);

		VirtualAddr address = 0x12'3456'7000;
		PhysicalAddr physical = fixture::unmanagedBase + 5 * kPageSize;
		assert(!pageSpace->translate(pageFloor(address)));

		auto outcome = pageSpace->mapSingle4k(address, physical, permissions::rwu);
		assert(outcome);
		// Two intermediate tables were needed.
		assert(fixture::freeFrames() == free - 3);

		auto pte = pageSpace->translate(pageFloor(address));
		assert(pte);
		assert(pte->physicalAddress() == physical);
		assert(pte->permission() == permissions::rwu);
		assert(!pageSpace->translate(pageFloor(address) + 1));

		// A neighbor in the same leaf table needs no new tables.
		assert(pageSpace->mapSingle4k(address + kPageSize, physical, permissions::rx));
		assert(fixture::freeFrames() == free - 3);

		auto unmapped = pageSpace->unmapSingle4k(address);
		assert(unmapped);
		assert(*unmapped == physical);
		assert(!pageSpace->translate(pageFloor(address)));
		assert(!pageSpace->unmapSingle4k(address));
		// Nothing is mapped in this part of the tree.
		assert(!pageSpace->unmapSingle4k(0x1000));
	}
	// The destructor releases all tables.
	assert(fixture::freeFrames() == free);
}))

DEFINE_TEST(page_space_token, ([] {
	auto created = ClientPageSpace::create();
	assert(created);
	auto pageSpace = std::move(created.value());
	auto token = pageSpace->token();
	assert((token >> 60) == satpModeSv39);
	assert((token & ((UINT64_C(1) << 44) - 1)) == physicalPageOf(pageSpace->rootTable()));
}))

DEFINE_TEST(page_space_out_of_memory, ([] {
	fixture::ExhaustPhysical exhaust;
	auto created = ClientPageSpace::create();
	assert(!created);
	assert(created.error() == Error::noMemory);

	// The root fits but the intermediate tables do not.
	exhaust.release(2);
	auto retry = ClientPageSpace::create();
	assert(retry);
	auto pageSpace = std::move(retry.value());
	auto outcome = pageSpace->mapSingle4k(0x1000, fixture::unmanagedBase, permissions::rw);
	assert(!outcome);
	assert(outcome.error() == Error::noMemory);
	assert(!pageSpace->translate(1));
}))
