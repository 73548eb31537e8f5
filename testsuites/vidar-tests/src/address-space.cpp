#include <string.h>

#include <vidar-internal/address-space.hpp>
#include <vidar-internal/arch-generic/cpu.hpp>

#include "fixture.hpp"
#include "testsuite.hpp"

using namespace vidar;

namespace {

AddressSpace makeSpace() {
	auto created = AddressSpace::create();
	assert(created);
	return std::move(created.value());
}

unsigned char *pageData(AddressSpace &space, VirtualPageNumber page) {
	auto pte = space.translate(page);
	assert(pte);
	return static_cast<unsigned char *>(mapDirectPhysical(pte->physicalAddress()));
}

} // anonymous namespace

DEFINE_TEST(space_install_and_remove, ([] {
	auto free = fixture::freeFrames();
	{
		auto space = makeSpace();
		assert(!space.numAreas());

		assert(space.addFramed(0x1000, 0x3000, permissions::rwu));
		assert(space.addFramed(0x10000, 0x11000, permissions::rw));
		assert(space.numAreas() == 2);
		assert(space.numOwnedFrames() == 3);
		assert(space.findArea(1));
		assert(space.findArea(0x10));
		assert(!space.findArea(2));

		assert(space.removeByStart(1));
		assert(space.numAreas() == 1);
		assert(!space.translate(1));
		assert(!space.translate(2));
		assert(space.translate(0x10));
		assert(space.numOwnedFrames() == 1);
	}
	assert(fixture::freeFrames() == free);
}))

DEFINE_TEST(space_remove_missing_area, ([] {
	auto space = makeSpace();
	assert(space.addFramed(0x1000, 0x3000, permissions::rwu));
	auto owned = space.numOwnedFrames();
	auto free = fixture::freeFrames();

	// Page 2 lies inside an area but no area starts there.
	auto outcome = space.removeByStart(2);
	assert(!outcome);
	assert(outcome.error() == Error::noSuchArea);
	assert(space.numAreas() == 1);
	assert(space.numOwnedFrames() == owned);
	assert(fixture::freeFrames() == free);
	assert(space.translate(1));
	assert(space.translate(2));

	assert(space.removeByStart(0x99).error() == Error::noSuchArea);
	assert(space.numAreas() == 1);
	assert(space.numOwnedFrames() == owned);
	assert(fixture::freeFrames() == free);
}))

DEFINE_TEST(space_rejects_overlap, ([] {
	auto space = makeSpace();
	assert(space.addFramed(0x4000, 0x6000, permissions::rw));
	auto free = fixture::freeFrames();

	auto same = space.addFramed(0x4000, 0x4000, permissions::rw);
	assert(!same);
	assert(same.error() == Error::alreadyExists);

	auto inside = space.addFramed(0x5000, 0x7000, permissions::rw);
	assert(!inside);
	assert(inside.error() == Error::alreadyExists);

	assert(space.numAreas() == 1);
	assert(fixture::freeFrames() == free);

	// Adjacent is fine.
	assert(space.addFramed(0x6000, 0x7000, permissions::rw));
}))

DEFINE_TEST(space_shrink_grow, ([] {
	auto space = makeSpace();
	assert(space.addFramed(0x5000, 0x5000, permissions::rwu));
	assert(space.addFramed(0x9000, 0xA000, permissions::rw));

	assert(space.growArea(0x5000, 0x8000));
	assert(space.findArea(5)->numPages() == 3);
	assert(space.translate(7));

	auto collide = space.growArea(0x5000, 0x9800);
	assert(!collide);
	assert(collide.error() == Error::alreadyExists);
	assert(space.findArea(5)->numPages() == 3);

	assert(space.shrinkArea(0x5000, 0x6000));
	assert(space.findArea(5)->numPages() == 1);
	assert(space.translate(5));
	assert(!space.translate(6));

	assert(space.shrinkArea(0x6000, 0x7000).error() == Error::noSuchArea);
	assert(space.growArea(0x6000, 0x7000).error() == Error::noSuchArea);
	assert(space.findArea(5)->numPages() == 1);
}))

DEFINE_TEST(space_install_with_data, ([] {
	auto space = makeSpace();
	const char text[] = "hello, address space";
	MemoryArea area{0x2000, 0x3000, AreaPolicy::framed, permissions::rx | Permission::user};
	assert(space.install(std::move(area), text, sizeof(text), 0x10));

	auto data = pageData(space, 2);
	assert(!data[0]);
	assert(!strcmp(reinterpret_cast<const char *>(data + 0x10), text));
}))

DEFINE_TEST(space_install_out_of_memory, ([] {
	auto space = makeSpace();
	assert(space.addFramed(0x1000, 0x2000, permissions::rw));

	fixture::ExhaustPhysical exhaust;
	// Page tables for the first page exist; the second area gets one frame.
	exhaust.release(1);
	auto outcome = space.addFramed(0x2000, 0x4000, permissions::rw);
	assert(!outcome);
	assert(outcome.error() == Error::noMemory);
	assert(space.numAreas() == 1);
	assert(!space.translate(2));
	// The frame of the failed area is available again.
	assert(fixture::freeFrames() == 1);
}))

DEFINE_TEST(space_clone_is_independent, ([] {
	auto source = makeSpace();
	assert(source.mapTrampoline(fixture::trampolineAddress, fixture::trampolinePhysical));
	assert(source.addFramed(0x1000, 0x3000, permissions::rwu));
	MemoryArea mmio{0x8000'0000, 0x8000'1000, AreaPolicy::identical, permissions::rw};
	assert(source.install(std::move(mmio)));

	memset(pageData(source, 1), 0x11, kPageSize);
	memset(pageData(source, 2), 0x22, kPageSize);

	auto free = fixture::freeFrames();
	auto cloned = AddressSpace::cloneFrom(source);
	assert(cloned);
	auto copy = std::move(cloned.value());

	assert(copy.numAreas() == 2);
	assert(copy.hasTrampoline());
	assert(copy.numOwnedFrames() == 2);
	assert(fixture::freeFrames() < free);

	auto trampoline = copy.translate(pageFloor(fixture::trampolineAddress));
	assert(trampoline);
	assert(trampoline->physicalAddress() == fixture::trampolinePhysical);
	assert(trampoline->permission() == permissions::rx);

	auto identical = copy.translate(0x8'0000);
	assert(identical);
	assert(identical->physicalAddress() == 0x8000'0000);

	// Same contents, different frames.
	assert(copy.translate(1)->physicalAddress() != source.translate(1)->physicalAddress());
	assert(copy.translate(2)->permission() == permissions::rwu);
	assert(pageData(copy, 1)[0] == 0x11);
	assert(pageData(copy, 2)[kPageSize - 1] == 0x22);

	pageData(copy, 1)[0] = 0x33;
	assert(pageData(source, 1)[0] == 0x11);
	pageData(source, 2)[0] = 0x44;
	assert(pageData(copy, 2)[0] == 0x22);

	assert(copy.rootToken() != source.rootToken());
}))

DEFINE_TEST(space_drop_keeps_trampoline, ([] {
	auto space = makeSpace();
	assert(space.mapTrampoline(fixture::trampolineAddress, fixture::trampolinePhysical));
	assert(space.addFramed(0x1000, 0x4000, permissions::rwu));

	auto free = fixture::freeFrames();
	space.dropAllAreas();
	assert(!space.numAreas());
	assert(!space.numOwnedFrames());
	assert(fixture::freeFrames() == free + 3);
	assert(!space.translate(1));
	assert(space.translate(pageFloor(fixture::trampolineAddress)));
}))

DEFINE_TEST(space_activate, ([] {
	auto space = makeSpace();
	auto flushes = getCpuData()->numTlbFlushes;

	space.activate();
	assert(getCpuData()->activeToken == space.rootToken());
	assert(getCpuData()->numTlbFlushes == flushes + 1);

	auto other = makeSpace();
	other.activate();
	assert(getCpuData()->activeToken == other.rootToken());
}))

DEFINE_TEST(builder_assembles_space, ([] {
	auto built = AddressSpaceBuilder{}
			.mapTrampoline(fixture::trampolineAddress, fixture::trampolinePhysical)
			.pushIdentical(0x8000'0000, 0x8000'2000, permissions::rw)
			.pushFramed(0x1000, 0x2000, permissions::rwu)
			.pushFramedWithData(0x2000, 0x3000, permissions::rx, "abc", 4)
			.build();
	assert(built);
	auto space = std::move(built.value());

	assert(space.hasTrampoline());
	assert(space.numAreas() == 3);
	assert(space.numOwnedFrames() == 2);
	assert(!strcmp(reinterpret_cast<const char *>(pageData(space, 2)), "abc"));
}))

DEFINE_TEST(builder_reports_first_error, ([] {
	auto free = fixture::freeFrames();
	{
		auto built = AddressSpaceBuilder{}
				.pushFramed(0x1000, 0x3000, permissions::rw)
				.pushFramed(0x2000, 0x4000, permissions::rw)
				.pushFramed(0x9000, 0xA000, permissions::rw)
				.build();
		assert(!built);
		assert(built.error() == Error::alreadyExists);
	}
	assert(fixture::freeFrames() == free);

	{
		fixture::ExhaustPhysical exhaust;
		auto built = AddressSpaceBuilder{}
				.pushFramed(0x1000, 0x2000, permissions::rw)
				.build();
		assert(!built);
		assert(built.error() == Error::noMemory);
	}
	assert(fixture::freeFrames() == free);
}))

DEFINE_TEST(space_rejects_bad_arguments, ([] {
	auto space = makeSpace();
	auto free = fixture::freeFrames();

	assert(space.mapTrampoline(0x1234, fixture::trampolinePhysical).error() == Error::illegalArgs);
	assert(!space.hasTrampoline());
	assert(space.mapTrampoline(fixture::trampolineAddress, fixture::trampolinePhysical));
	assert(space.mapTrampoline(fixture::trampolineAddress - kPageSize,
			fixture::trampolinePhysical).error() == Error::alreadyExists);

	char buffer[0x20] = {};
	MemoryArea small{0x1000, 0x2000, AreaPolicy::framed, permissions::rw};
	assert(space.install(std::move(small), buffer, sizeof(buffer), kPageSize - 0x10).error()
			== Error::outOfBounds);

	MemoryArea identical{0x8000'0000, 0x8000'1000, AreaPolicy::identical, permissions::rw};
	assert(space.install(std::move(identical), buffer, sizeof(buffer)).error()
			== Error::illegalArgs);

	assert(!space.numAreas());
	// Only the trampoline's page tables were allocated.
	assert(fixture::freeFrames() == free - 2);
}))

DEFINE_TEST(space_pages_without_read_or_execute, ([] {
	auto source = makeSpace();
	assert(source.addFramed(0x1000, 0x2000, Permission::write | Permission::user));
	assert(source.addFramed(0x2000, 0x3000, Permission::user));
	assert(source.addFramed(0x3000, 0x4000, Permission::none));

	auto writeOnly = source.translate(1);
	assert(writeOnly);
	assert(writeOnly->permission() == (Permission::write | Permission::user));
	assert(source.translate(2)->permission() == Permission::user);
	assert(source.translate(3)->permission() == Permission::none);

	pageData(source, 1)[5] = 0x5A;

	auto cloned = AddressSpace::cloneFrom(source);
	assert(cloned);
	auto copy = std::move(cloned.value());
	assert(copy.translate(1)->permission() == (Permission::write | Permission::user));
	assert(copy.translate(3));
	assert(pageData(copy, 1)[5] == 0x5A);

	// The entries are released again.
	auto free = fixture::freeFrames();
	assert(source.removeByStart(1));
	assert(!source.translate(1));
	assert(fixture::freeFrames() == free + 1);
}))

DEFINE_TEST(space_grow_stops_at_empty_area, ([] {
	auto space = makeSpace();
	assert(space.addFramed(0x4000, 0x5000, permissions::rwu));
	assert(space.addFramed(0x5000, 0x5000, permissions::rwu));

	auto outcome = space.growArea(0x4000, 0x7000);
	assert(!outcome);
	assert(outcome.error() == Error::alreadyExists);
	assert(space.findArea(4)->endPage() == 5);
	assert(!space.translate(5));

	// The empty area itself still grows.
	assert(space.growArea(0x5000, 0x6000));
	assert(space.translate(5));
}))

DEFINE_TEST(builder_cannot_be_reused, ([] {
	AddressSpaceBuilder builder;
	auto first = std::move(builder).pushFramed(0x1000, 0x2000, permissions::rw).build();
	assert(first);

	auto second = std::move(builder).pushFramed(0x3000, 0x4000, permissions::rw).build();
	assert(!second);
	assert(second.error() == Error::illegalArgs);
	assert(first.value().numAreas() == 1);
}))
