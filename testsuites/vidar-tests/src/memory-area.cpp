#include <string.h>
#include <vector>

#include <vidar-internal/memory-area.hpp>

#include "fixture.hpp"
#include "testsuite.hpp"

using namespace vidar;

namespace {

std::unique_ptr<ClientPageSpace> makePageSpace() {
	auto created = ClientPageSpace::create();
	assert(created);
	return std::move(created.value());
}

} // anonymous namespace

DEFINE_TEST(area_rounds_to_pages, ([] {
	MemoryArea area{0x1234, 0x5678, AreaPolicy::framed, permissions::rw};
	assert(area.startPage() == 1);
	assert(area.endPage() == 6);
	assert(area.numPages() == 5);

	MemoryArea aligned{0x1000, 0x3000, AreaPolicy::framed, permissions::rw};
	assert(aligned.startPage() == 1);
	assert(aligned.endPage() == 3);

	MemoryArea empty{0x7000, 0x7000, AreaPolicy::framed, permissions::rwu};
	assert(!empty.numPages());

	auto shape = MemoryArea::cloneShape(area);
	assert(shape.startPage() == 1);
	assert(shape.endPage() == 6);
	assert(shape.policy() == AreaPolicy::framed);
	assert(shape.permission() == permissions::rw);
	assert(!shape.numOwnedFrames());
}))

DEFINE_TEST(area_framed_map_unmap, ([] {
	auto pageSpace = makePageSpace();
	auto free = fixture::freeFrames();

	MemoryArea area{0x10000, 0x13000, AreaPolicy::framed, permissions::rwu};
	assert(area.map(pageSpace.get()));
	assert(area.numOwnedFrames() == 3);

	for(VirtualPageNumber page = 0x10; page < 0x13; page++) {
		auto pte = pageSpace->translate(page);
		assert(pte);
		assert(pte->permission() == permissions::rwu);
		auto frame = area.frameOf(page);
		assert(frame);
		assert(*frame == pte->physicalAddress());
		assert(physicalAllocator->isAllocated(*frame));
	}
	assert(!pageSpace->translate(0x13));
	assert(!area.frameOf(0x13));

	area.unmap(pageSpace.get());
	assert(!area.numOwnedFrames());
	for(VirtualPageNumber page = 0x10; page < 0x13; page++)
		assert(!pageSpace->translate(page));
	// Only the page tables remain.
	assert(fixture::freeFrames() == free - 2);
}))

DEFINE_TEST(area_identical_map, ([] {
	auto pageSpace = makePageSpace();
	auto free = fixture::freeFrames();

	MemoryArea area{0x8000'0000, 0x8000'2000, AreaPolicy::identical, permissions::rx};
	assert(area.map(pageSpace.get()));
	assert(!area.numOwnedFrames());

	auto pte = pageSpace->translate(0x8'0001);
	assert(pte);
	assert(pte->physicalAddress() == 0x8000'1000);
	assert(pte->permission() == permissions::rx);

	area.unmap(pageSpace.get());
	assert(!pageSpace->translate(0x8'0001));
	assert(fixture::freeFrames() == free - 2);
}))

DEFINE_TEST(area_extend_shrink, ([] {
	auto pageSpace = makePageSpace();

	MemoryArea area{0x20000, 0x20000, AreaPolicy::framed, permissions::rwu};
	assert(area.map(pageSpace.get()));
	assert(!area.numPages());

	auto free = fixture::freeFrames();
	assert(area.extendTo(pageSpace.get(), 0x24));
	assert(area.endPage() == 0x24);
	assert(area.numOwnedFrames() == 4);
	assert(pageSpace->translate(0x23));

	area.shrinkTo(pageSpace.get(), 0x22);
	assert(area.endPage() == 0x22);
	assert(area.numOwnedFrames() == 2);
	assert(pageSpace->translate(0x21));
	assert(!pageSpace->translate(0x22));
	assert(!pageSpace->translate(0x23));

	area.shrinkTo(pageSpace.get(), 0x20);
	assert(!area.numPages());
	assert(!pageSpace->translate(0x20));

	// The page tables that extendTo() created stay around.
	assert(fixture::freeFrames() == free - 2);
}))

DEFINE_TEST(area_extend_out_of_memory, ([] {
	auto pageSpace = makePageSpace();
	MemoryArea area{0x30000, 0x31000, AreaPolicy::framed, permissions::rw};
	assert(area.map(pageSpace.get()));

	fixture::ExhaustPhysical exhaust;
	exhaust.release(2);
	auto outcome = area.extendTo(pageSpace.get(), 0x35);
	assert(!outcome);
	assert(outcome.error() == Error::noMemory);
	// The range covers exactly the pages that got frames.
	assert(area.endPage() == 0x33);
	assert(area.numOwnedFrames() == 3);
	assert(pageSpace->translate(0x32));
	assert(!pageSpace->translate(0x33));

	area.unmap(pageSpace.get());
}))

DEFINE_TEST(area_copy_partial_last_page, ([] {
	auto pageSpace = makePageSpace();

	MemoryArea area{0x40000, 0x42000, AreaPolicy::framed, permissions::rw};
	assert(area.map(pageSpace.get()));

	std::vector<unsigned char> data(kPageSize + 1);
	for(size_t i = 0; i < data.size(); i++)
		data[i] = static_cast<unsigned char>(i % 251 + 1);
	area.copyInitialData(pageSpace.get(), data.data(), data.size());

	auto first = static_cast<const unsigned char *>(mapDirectPhysical(*area.frameOf(0x40)));
	auto second = static_cast<const unsigned char *>(mapDirectPhysical(*area.frameOf(0x41)));
	assert(!memcmp(first, data.data(), kPageSize));
	assert(second[0] == data[kPageSize]);
	for(size_t i = 1; i < kPageSize; i++)
		assert(!second[i]);

	area.unmap(pageSpace.get());
}))

DEFINE_TEST(area_copy_with_offset, ([] {
	auto pageSpace = makePageSpace();

	MemoryArea area{0x50800, 0x51800, AreaPolicy::framed, permissions::rw};
	assert(area.numPages() == 2);
	assert(area.map(pageSpace.get()));

	const char message[] = "mapped across a page boundary";
	size_t offset = kPageSize - 8;
	area.copyInitialData(pageSpace.get(), message, sizeof(message), offset);

	auto first = static_cast<const char *>(mapDirectPhysical(*area.frameOf(0x50)));
	auto second = static_cast<const char *>(mapDirectPhysical(*area.frameOf(0x51)));
	assert(!first[0]);
	assert(!memcmp(first + offset, message, 8));
	assert(!strcmp(second, message + 8));

	area.unmap(pageSpace.get());
}))
