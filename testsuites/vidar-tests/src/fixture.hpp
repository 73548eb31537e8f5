#pragma once

#include <assert.h>
#include <stdlib.h>
#include <vector>

#include <vidar-internal/physical.hpp>

namespace fixture {

// Simulated physical memory. The frame allocator manages the lower part;
// the upper part is left to tests that need memory of their own.
constexpr vidar::PhysicalAddr physicalBase = 0x8000'0000;
constexpr size_t numWindowPages = 2048;
constexpr size_t numManagedPages = 1024;

constexpr vidar::PhysicalAddr unmanagedBase = physicalBase + numManagedPages * vidar::kPageSize;

// Stands in for the trampoline code page.
constexpr vidar::PhysicalAddr trampolinePhysical = physicalBase
		+ (numWindowPages - 1) * vidar::kPageSize;
constexpr vidar::VirtualAddr trampolineAddress = 0x3F'FFFF'F000;

inline void setupPhysical() {
	static bool initialized = false;
	if(initialized)
		return;

	auto arena = aligned_alloc(vidar::kPageSize, numWindowPages * vidar::kPageSize);
	assert(arena);
	vidar::setDirectPhysicalWindow(physicalBase, arena, numWindowPages * vidar::kPageSize);

	vidar::physicalAllocator.initialize();
	vidar::physicalAllocator->bootstrapRegion(physicalBase, numManagedPages);
	initialized = true;
}

inline size_t freeFrames() {
	return vidar::physicalAllocator->numFreePages();
}

// Takes every remaining frame until the destructor runs.
struct ExhaustPhysical {
	ExhaustPhysical() {
		while(true) {
			auto physical = vidar::physicalAllocator->allocate();
			if(physical == vidar::PhysicalAddr(-1))
				break;
			frames.push_back(physical);
		}
	}

	ExhaustPhysical(const ExhaustPhysical &) = delete;

	~ExhaustPhysical() {
		for(auto physical : frames)
			vidar::physicalAllocator->free(physical);
	}

	ExhaustPhysical &operator= (const ExhaustPhysical &) = delete;

	// Gives n frames back so that exactly n allocations succeed.
	void release(size_t n) {
		for(size_t i = 0; i < n; i++) {
			assert(!frames.empty());
			vidar::physicalAllocator->free(frames.back());
			frames.pop_back();
		}
	}

	std::vector<vidar::PhysicalAddr> frames;
};

} // namespace fixture
