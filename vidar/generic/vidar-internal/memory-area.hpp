#pragma once

#include <map>

#include <frg/expected.hpp>
#include <vidar-internal/arch/paging.hpp>
#include <vidar-internal/error.hpp>
#include <vidar-internal/permission.hpp>
#include <vidar-internal/physical.hpp>

namespace vidar {

enum class AreaPolicy {
	// Virtual page n is backed by physical page n; no frames are owned.
	identical,
	// Every virtual page is backed by a frame that the area owns.
	framed
};

// A contiguous run of virtual pages [startPage, endPage) with one policy
// and one permission.
struct MemoryArea {
	// Rounds start down and end up to page boundaries.
	MemoryArea(VirtualAddr start, VirtualAddr end, AreaPolicy policy, Permission permission);

	// Same range, policy and permission but no pages.
	static MemoryArea cloneShape(const MemoryArea &other);

	MemoryArea(const MemoryArea &) = delete;
	MemoryArea(MemoryArea &&) = default;

	MemoryArea &operator= (const MemoryArea &) = delete;
	MemoryArea &operator= (MemoryArea &&) = default;

	VirtualPageNumber startPage() const {
		return _startPage;
	}

	VirtualPageNumber endPage() const {
		return _endPage;
	}

	size_t numPages() const {
		return _endPage - _startPage;
	}

	AreaPolicy policy() const {
		return _policy;
	}

	Permission permission() const {
		return _permission;
	}

	size_t numOwnedFrames() const {
		return _frames.size();
	}

	// Physical address that backs page, if the area owns a frame for it.
	frg::optional<PhysicalAddr> frameOf(VirtualPageNumber page) const;

	// Maps every page of the range. On Error::noMemory, the pages that were
	// mapped before the failure stay mapped.
	frg::expected<Error> map(ClientPageSpace *pageSpace);

	// Unmaps every page of the range and releases owned frames.
	void unmap(ClientPageSpace *pageSpace);

	// Unmaps [newEnd, endPage()) and narrows the range.
	void shrinkTo(ClientPageSpace *pageSpace, VirtualPageNumber newEnd);

	// Maps [endPage(), newEnd) and widens the range. On Error::noMemory, the
	// range covers exactly the pages that were mapped.
	frg::expected<Error> extendTo(ClientPageSpace *pageSpace, VirtualPageNumber newEnd);

	// Copies size bytes to the start of the area, offset bytes into the first
	// page. Frames are zeroed on allocation; bytes that are not copied stay zero.
	void copyInitialData(ClientPageSpace *pageSpace, const void *data, size_t size,
			size_t offset = 0);

private:
	frg::expected<Error> _mapOne(ClientPageSpace *pageSpace, VirtualPageNumber page);
	void _unmapOne(ClientPageSpace *pageSpace, VirtualPageNumber page);

	VirtualPageNumber _startPage;
	VirtualPageNumber _endPage;
	AreaPolicy _policy;
	Permission _permission;

	std::map<VirtualPageNumber, PhysicalFrame> _frames;
};

} // namespace vidar
