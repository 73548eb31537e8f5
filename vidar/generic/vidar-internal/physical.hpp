#pragma once

#include <assert.h>
#include <atomic>
#include <utility>

#include <frg/expected.hpp>
#include <frg/manual_box.hpp>
#include <frg/spinlock.hpp>
#include <vidar-internal/arch-generic/paging-consts.hpp>
#include <vidar-internal/error.hpp>
#include <vidar-internal/types.hpp>

namespace vidar {

// --------------------------------------------------------
// Direct physical window.
// --------------------------------------------------------

// All physical memory that vidar touches is reachable through one linear
// window: physical address base maps to pointer.
void setDirectPhysicalWindow(PhysicalAddr base, void *pointer, size_t size);

void *mapDirectPhysical(PhysicalAddr physical);

struct PageAccessor {
	friend void swap(PageAccessor &a, PageAccessor &b) {
		using std::swap;
		swap(a._pointer, b._pointer);
	}

	PageAccessor()
	: _pointer{nullptr} { }

	PageAccessor(PhysicalAddr physical) {
		assert(physical != PhysicalAddr(-1) && "trying to access invalid physical page");
		assert(!(physical & (kPageSize - 1)) && "physical page is not aligned");
		_pointer = mapDirectPhysical(physical);
	}

	PageAccessor(const PageAccessor &) = delete;

	PageAccessor(PageAccessor &&other)
	: PageAccessor{} {
		swap(*this, other);
	}

	~PageAccessor() { }

	PageAccessor &operator= (PageAccessor other) {
		swap(*this, other);
		return *this;
	}

	explicit operator bool () {
		return _pointer;
	}

	void *get() {
		return _pointer;
	}

private:
	void *_pointer;
};

// --------------------------------------------------------
// Frame allocator.
// --------------------------------------------------------

// Hands out single 4 KiB frames. Safe to call from multiple threads.
class PhysicalFrameAllocator {
	typedef frg::ticket_spinlock Mutex;
public:
	static constexpr int maxRegions = 8;

	PhysicalFrameAllocator();

	PhysicalFrameAllocator(const PhysicalFrameAllocator &) = delete;
	PhysicalFrameAllocator &operator= (const PhysicalFrameAllocator &) = delete;

	// The bitmap describing the region is carved out of the region itself.
	void bootstrapRegion(PhysicalAddr address, size_t numPages);

	// Returns PhysicalAddr(-1) if no frame is left.
	PhysicalAddr allocate();
	void free(PhysicalAddr address);

	bool isAllocated(PhysicalAddr address);

	size_t numTotalPages() {
		return _totalPages.load(std::memory_order_relaxed);
	}
	size_t numUsedPages() {
		return _usedPages.load(std::memory_order_relaxed);
	}
	size_t numFreePages() {
		return _freePages.load(std::memory_order_relaxed);
	}

private:
	struct Region {
		PhysicalAddr physicalBase;
		size_t numPages;
		// One bit per page; set bits are in use.
		uint64_t *bitmap;
		// Hint for the next search.
		size_t nextWord;
	};

	PhysicalAddr _allocateFrame();
	Region *_findRegion(PhysicalAddr address);

	Mutex _mutex;

	Region _allRegions[maxRegions];
	int _numRegions = 0;

	std::atomic<size_t> _totalPages{0};
	std::atomic<size_t> _usedPages{0};
	std::atomic<size_t> _freePages{0};
};

extern constinit frg::manual_box<PhysicalFrameAllocator> physicalAllocator;

// --------------------------------------------------------
// Frame ownership.
// --------------------------------------------------------

// Owns exactly one frame and returns it to physicalAllocator on destruction.
struct PhysicalFrame {
	friend void swap(PhysicalFrame &a, PhysicalFrame &b) {
		using std::swap;
		swap(a._physical, b._physical);
	}

	// Allocates a frame and fills it with zeros.
	static frg::expected<Error, PhysicalFrame> allocateZeroed();

	PhysicalFrame()
	: _physical{PhysicalAddr(-1)} { }

	explicit PhysicalFrame(PhysicalAddr physical)
	: _physical{physical} { }

	PhysicalFrame(const PhysicalFrame &) = delete;

	PhysicalFrame(PhysicalFrame &&other)
	: PhysicalFrame{} {
		swap(*this, other);
	}

	~PhysicalFrame();

	PhysicalFrame &operator= (PhysicalFrame other) {
		swap(*this, other);
		return *this;
	}

	explicit operator bool () const {
		return _physical != PhysicalAddr(-1);
	}

	PhysicalAddr address() const {
		return _physical;
	}

	// The frame's contents through the physical window.
	void *data() const {
		return mapDirectPhysical(_physical);
	}

private:
	PhysicalAddr _physical;
};

} // namespace vidar
