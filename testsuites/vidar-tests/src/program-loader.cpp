#include <string.h>

#include <vidar-internal/config.hpp>
#include <vidar-internal/program-loader.hpp>

#include "elf-builder.hpp"
#include "fixture.hpp"
#include "testsuite.hpp"

using namespace vidar;

namespace {

ProgramLayout testLayout(size_t stackSize) {
	auto layout = ProgramLayout::fromConfig(fixture::trampolineAddress,
			fixture::trampolinePhysical);
	layout.userStackSize = stackSize;
	return layout;
}

std::vector<unsigned char> twoSegmentImage() {
	std::vector<unsigned char> code(0x1000);
	for(size_t i = 0; i < code.size(); i++)
		code[i] = static_cast<unsigned char>(i * 7);

	ElfBuilder builder{0x1080};
	builder.addLoad(0x1000, 0x1000, PF_R | PF_X, std::move(code));
	builder.addLoad(0x2000, 0x1000, PF_R | PF_W);
	return builder.build();
}

} // anonymous namespace

DEFINE_TEST(loader_layout_from_config, ([] {
	configure("vidar.stack-size=0x3000");
	auto layout = ProgramLayout::fromConfig(fixture::trampolineAddress,
			fixture::trampolinePhysical);
	assert(layout.trapContextAddress == fixture::trampolineAddress - kPageSize);
	assert(layout.userStackSize == 0x3000);
	resetConfig();
}))

DEFINE_TEST(loader_two_segment_image, ([] {
	auto image = twoSegmentImage();
	auto free = fixture::freeFrames();
	{
		auto loaded = loadProgram(image.data(), image.size(), testLayout(0x1000));
		assert(loaded);
		auto &program = loaded.value();
		auto &space = program.space;

		assert(program.entryIp == 0x1080);
		assert(program.stackPointer == 0x5000);

		// Code, data, stack, the empty area above the stack and the trap context.
		assert(space.numAreas() == 5);
		assert(space.hasTrampoline());

		auto text = space.translate(1);
		assert(text);
		assert(text->permission() == (permissions::rx | Permission::user));
		auto code = static_cast<const unsigned char *>(mapDirectPhysical(text->physicalAddress()));
		assert(code[0] == 0 && code[1] == 7 && code[0xFFF] == static_cast<unsigned char>(0xFFF * 7));

		auto bss = space.translate(2);
		assert(bss);
		assert(bss->permission() == permissions::rwu);
		auto zeros = static_cast<const unsigned char *>(mapDirectPhysical(bss->physicalAddress()));
		for(size_t i = 0; i < kPageSize; i++)
			assert(!zeros[i]);

		// Guard page between the image and the stack.
		assert(!space.translate(3));

		auto stack = space.findArea(4);
		assert(stack);
		assert(stack->endPage() == 5);
		assert(space.translate(4)->permission() == permissions::rwu);

		auto heap = space.findArea(5);
		assert(heap);
		assert(!heap->numPages());
		assert(!space.translate(5));

		auto trapContext = space.translate(pageFloor(fixture::trampolineAddress) - 1);
		assert(trapContext);
		assert(trapContext->permission() == permissions::rw);

		auto trampoline = space.translate(pageFloor(fixture::trampolineAddress));
		assert(trampoline);
		assert(trampoline->physicalAddress() == fixture::trampolinePhysical);
		assert(trampoline->permission() == permissions::rx);

		// The area above the stack can grow into a heap.
		assert(space.growArea(0x5000, 0x7000));
		assert(space.translate(6));
	}
	assert(fixture::freeFrames() == free);
}))

DEFINE_TEST(loader_stack_follows_highest_segment, ([] {
	// Segments are not sorted by address.
	ElfBuilder builder{0x10000};
	builder.addLoad(0x10000, 0x800, PF_R | PF_X, {0x13, 0, 0, 0});
	builder.addLoad(0x1000, 0x1000, PF_R);
	auto image = builder.build();

	auto loaded = loadProgram(image.data(), image.size(), testLayout(0x2000));
	assert(loaded);
	assert(loaded.value().stackPointer == 0x11000 + kPageSize + 0x2000);
	assert(!loaded.value().space.translate(0x11));
	assert(loaded.value().space.translate(0x12));
}))

DEFINE_TEST(loader_misaligned_segment, ([] {
	ElfBuilder builder{0x1000};
	builder.addLoad(0x1000, 0x1000, PF_R | PF_X, {0x73, 0, 0, 0});
	// Data starts in the middle of a page.
	builder.addLoad(0x2ff8, 0x10, PF_R | PF_W, {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12});
	builder.addLoad(0x9000, 0, PF_R);
	auto image = builder.build();

	auto loaded = loadProgram(image.data(), image.size(), testLayout(0x1000));
	assert(loaded);
	auto &space = loaded.value().space;

	// The empty segment does not produce an area.
	assert(space.numAreas() == 5);
	assert(!space.findArea(9));

	auto first = static_cast<const unsigned char *>(
			mapDirectPhysical(space.translate(2)->physicalAddress()));
	auto second = static_cast<const unsigned char *>(
			mapDirectPhysical(space.translate(3)->physicalAddress()));
	assert(first[0xFF8] == 1 && first[0xFFF] == 8);
	assert(second[0] == 9 && second[3] == 12 && !second[4]);

	assert(loaded.value().stackPointer == 0x5000 + 0x1000);
}))

DEFINE_TEST(loader_rejects_bad_image, ([] {
	auto image = twoSegmentImage();
	image[0] = 0;
	auto free = fixture::freeFrames();

	auto loaded = loadProgram(image.data(), image.size(), testLayout(0x1000));
	assert(!loaded);
	assert(loaded.error() == Error::badExecutable);
	assert(fixture::freeFrames() == free);
}))

DEFINE_TEST(loader_out_of_memory, ([] {
	auto image = twoSegmentImage();
	fixture::ExhaustPhysical exhaust;
	exhaust.release(6);

	auto loaded = loadProgram(image.data(), image.size(), testLayout(0x1000));
	assert(!loaded);
	assert(loaded.error() == Error::noMemory);
}))

DEFINE_TEST(loader_write_only_segment, ([] {
	ElfBuilder builder{0x1000};
	builder.addLoad(0x1000, 0x1000, PF_R | PF_X, {0x73, 0, 0, 0});
	builder.addLoad(0x2000, 0x1000, PF_W, {0xDE, 0xAD, 0xBE, 0xEF});
	auto image = builder.build();

	auto loaded = loadProgram(image.data(), image.size(), testLayout(0x1000));
	assert(loaded);
	auto &space = loaded.value().space;

	auto data = space.translate(2);
	assert(data);
	assert(data->permission() == (Permission::write | Permission::user));
	auto bytes = static_cast<const unsigned char *>(mapDirectPhysical(data->physicalAddress()));
	assert(bytes[0] == 0xDE && bytes[3] == 0xEF);
}))

DEFINE_TEST(loader_stack_cannot_swallow_heap, ([] {
	auto image = twoSegmentImage();
	auto loaded = loadProgram(image.data(), image.size(), testLayout(0x1000));
	assert(loaded);
	auto &space = loaded.value().space;

	// The stack is [0x4000, 0x5000) and the heap anchor starts at 0x5000.
	auto outcome = space.growArea(0x4000, 0x7000);
	assert(!outcome);
	assert(outcome.error() == Error::alreadyExists);
	assert(!space.translate(5));

	assert(space.growArea(0x5000, 0x6000));
	assert(space.translate(5));
}))

DEFINE_TEST(loader_rounds_stack_size, ([] {
	auto image = twoSegmentImage();
	auto loaded = loadProgram(image.data(), image.size(), testLayout(0x1800));
	assert(loaded);
	assert(loaded.value().stackPointer == 0x6000);

	auto &space = loaded.value().space;
	assert(space.findArea(4)->endPage() == 6);
	assert(space.findArea(6));
	assert(!space.findArea(6)->numPages());
}))
