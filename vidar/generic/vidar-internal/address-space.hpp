#pragma once

#include <memory>
#include <vector>

#include <frg/expected.hpp>
#include <frg/optional.hpp>
#include <vidar-internal/memory-area.hpp>

namespace vidar {

// The trampoline page is shared by all address spaces. It is mapped
// directly into the page table and never owned by an area.
struct TrampolineMapping {
	VirtualAddr address;
	PhysicalAddr physical;
};

// Virtual address space of one task: a page table plus the areas that
// populate it. Areas are identified by their start page, which is unique.
struct AddressSpace {
	// Empty page table, no areas.
	static frg::expected<Error, AddressSpace> create();

	// Deep copy of source. Every page is copied into a fresh frame; the
	// trampoline is mapped at the location recorded in source.
	static frg::expected<Error, AddressSpace> cloneFrom(const AddressSpace &source);

	AddressSpace(const AddressSpace &) = delete;
	AddressSpace(AddressSpace &&) = default;

	~AddressSpace();

	AddressSpace &operator= (const AddressSpace &) = delete;
	AddressSpace &operator= (AddressSpace &&) = default;

	// Installs the R+X trampoline mapping outside of the area list.
	// Both addresses must be page aligned; a space has at most one trampoline.
	frg::expected<Error> mapTrampoline(VirtualAddr address, PhysicalAddr physical);

	bool hasTrampoline() const {
		return static_cast<bool>(_trampoline);
	}

	// Maps area and appends it to the area list. If data is given, size
	// bytes are copied to the start of the area (offset bytes into its first
	// page). Data is only accepted for framed areas and must fit into the
	// area; this is checked before anything is mapped. On failure, the area
	// is dropped.
	frg::expected<Error> install(MemoryArea area, const void *data = nullptr,
			size_t size = 0, size_t offset = 0);

	// Installs a framed area over [start, end) without initial data.
	frg::expected<Error> addFramed(VirtualAddr start, VirtualAddr end, Permission permission);

	// Unmaps and removes the area that starts at startPage.
	frg::expected<Error> removeByStart(VirtualPageNumber startPage);

	// Unmaps all areas and releases their frames. The trampoline stays mapped.
	void dropAllAreas();

	// Resize the area that starts at the page of start.
	frg::expected<Error> shrinkArea(VirtualAddr start, VirtualAddr newEnd);
	frg::expected<Error> growArea(VirtualAddr start, VirtualAddr newEnd);

	frg::optional<PageTableEntry> translate(VirtualPageNumber page) const;

	uint64_t rootToken() const;

	// Switches this CPU to the address space. Only call this right before
	// running code in the space.
	void activate() const;

	size_t numAreas() const {
		return _areas.size();
	}

	const MemoryArea *findArea(VirtualPageNumber startPage) const;

	// Number of frames owned by all areas (page table pages excluded).
	size_t numOwnedFrames() const;

private:
	explicit AddressSpace(std::unique_ptr<ClientPageSpace> pageSpace);

	std::vector<MemoryArea>::iterator _findArea(VirtualPageNumber startPage);

	std::unique_ptr<ClientPageSpace> _pageSpace;
	frg::optional<TrampolineMapping> _trampoline;
	std::vector<MemoryArea> _areas;
};

// Assembles an address space step by step. Each step consumes the builder;
// the first failing step's error is reported by build().
struct AddressSpaceBuilder {
	AddressSpaceBuilder();

	AddressSpaceBuilder(const AddressSpaceBuilder &) = delete;
	AddressSpaceBuilder(AddressSpaceBuilder &&) = default;

	AddressSpaceBuilder &operator= (const AddressSpaceBuilder &) = delete;

	AddressSpaceBuilder &&mapTrampoline(VirtualAddr address, PhysicalAddr physical) &&;

	AddressSpaceBuilder &&pushIdentical(VirtualAddr start, VirtualAddr end,
			Permission permission) &&;

	AddressSpaceBuilder &&pushFramed(VirtualAddr start, VirtualAddr end,
			Permission permission) &&;

	AddressSpaceBuilder &&pushFramedWithData(VirtualAddr start, VirtualAddr end,
			Permission permission, const void *data, size_t size, size_t offset = 0) &&;

	// Hands out the space. Steps and builds after this report Error::illegalArgs.
	frg::expected<Error, AddressSpace> build() &&;

private:
	AddressSpaceBuilder &&_push(MemoryArea area, const void *data, size_t size, size_t offset);

	frg::optional<AddressSpace> _space;
	Error _error = Error::success;
};

} // namespace vidar
