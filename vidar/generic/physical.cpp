#include <string.h>

#include <frg/mutex.hpp>
#include <vidar-internal/config.hpp>
#include <vidar-internal/debug.hpp>
#include <vidar-internal/physical.hpp>

namespace vidar {

namespace {
	PhysicalAddr windowBase;
	char *windowPointer;
	size_t windowSize;
} // anonymous namespace

constinit frg::manual_box<PhysicalFrameAllocator> physicalAllocator;

// --------------------------------------------------------
// Direct physical window.
// --------------------------------------------------------

void setDirectPhysicalWindow(PhysicalAddr base, void *pointer, size_t size) {
	windowBase = base;
	windowPointer = static_cast<char *>(pointer);
	windowSize = size;
}

void *mapDirectPhysical(PhysicalAddr physical) {
	if(physical < windowBase || physical - windowBase >= windowSize)
		panicLogger() << "vidar: Physical address 0x" << frg::hex_fmt{physical}
				<< " is outside of the physical window" << frg::endlog;
	return windowPointer + (physical - windowBase);
}

// --------------------------------------------------------
// PhysicalFrameAllocator
// --------------------------------------------------------

PhysicalFrameAllocator::PhysicalFrameAllocator() {
}

void PhysicalFrameAllocator::bootstrapRegion(PhysicalAddr address, size_t numPages) {
	assert(!(address & (kPageSize - 1)));

	if(_numRegions >= maxRegions) {
		infoLogger() << "vidar: Ignoring memory region (can only handle "
				<< maxRegions << " regions)" << frg::endlog;
		return;
	}

	size_t bitmapWords = (numPages + 63) / 64;
	size_t bitmapPages = (bitmapWords * sizeof(uint64_t) + kPageSize - 1) / kPageSize;
	if(bitmapPages >= numPages) {
		infoLogger() << "vidar: Ignoring memory region at 0x" << frg::hex_fmt{address}
				<< " (too small)" << frg::endlog;
		return;
	}

	auto bitmap = static_cast<uint64_t *>(mapDirectPhysical(address));
	memset(bitmap, 0, bitmapWords * sizeof(uint64_t));
	// The bitmap itself stays allocated forever.
	for(size_t i = 0; i < bitmapPages; i++)
		bitmap[i / 64] |= uint64_t(1) << (i % 64);
	// So do the padding bits behind the last page.
	for(size_t i = numPages; i < bitmapWords * 64; i++)
		bitmap[i / 64] |= uint64_t(1) << (i % 64);

	auto lock = frg::guard(&_mutex);

	int n = _numRegions++;
	_allRegions[n].physicalBase = address;
	_allRegions[n].numPages = numPages;
	_allRegions[n].bitmap = bitmap;
	_allRegions[n].nextWord = 0;

	auto usable = numPages - bitmapPages;
	auto currentTotal = _totalPages.load(std::memory_order_relaxed);
	auto currentFree = _freePages.load(std::memory_order_relaxed);
	_totalPages.store(currentTotal + usable, std::memory_order_relaxed);
	_freePages.store(currentFree + usable, std::memory_order_relaxed);
}

PhysicalAddr PhysicalFrameAllocator::allocate() {
	// Logging happens outside of _mutex since log handlers may allocate.
	auto physical = _allocateFrame();
	if(config().logPhysicalAllocs) {
		if(physical == PhysicalAddr(-1)) {
			infoLogger() << "vidar: Out of physical frames" << frg::endlog;
		}else{
			infoLogger() << "vidar: Allocated frame 0x" << frg::hex_fmt{physical}
					<< frg::endlog;
		}
	}
	return physical;
}

PhysicalAddr PhysicalFrameAllocator::_allocateFrame() {
	auto lock = frg::guard(&_mutex);

	for(int i = 0; i < _numRegions; i++) {
		auto &region = _allRegions[i];
		size_t numWords = (region.numPages + 63) / 64;

		for(size_t k = 0; k < numWords; k++) {
			size_t w = (region.nextWord + k) % numWords;
			if(region.bitmap[w] == ~uint64_t(0))
				continue;

			int bit = __builtin_ctzll(~region.bitmap[w]);
			region.bitmap[w] |= uint64_t(1) << bit;
			region.nextWord = w;

			auto currentFree = _freePages.load(std::memory_order_relaxed);
			auto currentUsed = _usedPages.load(std::memory_order_relaxed);
			_freePages.store(currentFree - 1, std::memory_order_relaxed);
			_usedPages.store(currentUsed + 1, std::memory_order_relaxed);

			return region.physicalBase + (w * 64 + bit) * kPageSize;
		}
	}

	return static_cast<PhysicalAddr>(-1);
}

void PhysicalFrameAllocator::free(PhysicalAddr address) {
	{
		auto lock = frg::guard(&_mutex);

		auto region = _findRegion(address);
		if(!region || (address & (kPageSize - 1)))
			panicLogger() << "vidar: Frame 0x" << frg::hex_fmt{address}
					<< " is not part of any region" << frg::endlog;

		size_t index = (address - region->physicalBase) / kPageSize;
		auto mask = uint64_t(1) << (index % 64);
		if(!(region->bitmap[index / 64] & mask))
			panicLogger() << "vidar: Frame 0x" << frg::hex_fmt{address}
					<< " is freed twice" << frg::endlog;
		region->bitmap[index / 64] &= ~mask;

		auto currentFree = _freePages.load(std::memory_order_relaxed);
		auto currentUsed = _usedPages.load(std::memory_order_relaxed);
		assert(currentUsed > 0);
		_freePages.store(currentFree + 1, std::memory_order_relaxed);
		_usedPages.store(currentUsed - 1, std::memory_order_relaxed);
	}

	if(config().logPhysicalAllocs)
		infoLogger() << "vidar: Released frame 0x" << frg::hex_fmt{address} << frg::endlog;
}

bool PhysicalFrameAllocator::isAllocated(PhysicalAddr address) {
	auto lock = frg::guard(&_mutex);

	auto region = _findRegion(address);
	if(!region)
		return false;
	size_t index = (address - region->physicalBase) / kPageSize;
	return region->bitmap[index / 64] & (uint64_t(1) << (index % 64));
}

PhysicalFrameAllocator::Region *PhysicalFrameAllocator::_findRegion(PhysicalAddr address) {
	for(int i = 0; i < _numRegions; i++) {
		auto &region = _allRegions[i];
		if(address < region.physicalBase)
			continue;
		if(address - region.physicalBase >= region.numPages * kPageSize)
			continue;
		return &region;
	}
	return nullptr;
}

// --------------------------------------------------------
// PhysicalFrame
// --------------------------------------------------------

frg::expected<Error, PhysicalFrame> PhysicalFrame::allocateZeroed() {
	auto physical = physicalAllocator->allocate();
	if(physical == PhysicalAddr(-1))
		return Error::noMemory;

	PageAccessor accessor{physical};
	memset(accessor.get(), 0, kPageSize);
	return PhysicalFrame{physical};
}

PhysicalFrame::~PhysicalFrame() {
	if(_physical != PhysicalAddr(-1))
		physicalAllocator->free(_physical);
}

} // namespace vidar
