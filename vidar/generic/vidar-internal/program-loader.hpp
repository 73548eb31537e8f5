#pragma once

#include <frg/expected.hpp>
#include <vidar-internal/address-space.hpp>
#include <vidar-internal/elf-image.hpp>

namespace vidar {

// Fixed locations that every user address space shares.
struct ProgramLayout {
	// Uses the configured stack size and places the trap context page
	// directly below the trampoline.
	static ProgramLayout fromConfig(VirtualAddr trampolineAddress,
			PhysicalAddr trampolinePhysical);

	VirtualAddr trampolineAddress;
	PhysicalAddr trampolinePhysical;
	VirtualAddr trapContextAddress;
	size_t userStackSize;
};

struct LoadedProgram {
	AddressSpace space;
	// Initial user stack pointer (top of the user stack).
	VirtualAddr stackPointer;
	VirtualAddr entryIp;
};

// Builds the address space of a new task from an ELF image: the trampoline,
// one framed area per PT_LOAD segment, a guard page, the user stack, an empty
// area above the stack that can be grown later and the trap context page.
// A malformed image yields Error::badExecutable before anything is mapped.
frg::expected<Error, LoadedProgram> loadProgram(const void *image, size_t size,
		const ProgramLayout &layout);

// Permission of a segment; always accessible from user mode.
Permission segmentPermission(const ProgramSegment &segment);

} // namespace vidar
