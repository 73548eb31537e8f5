#pragma once

#include <assert.h>
#include <memory>

#include <frg/optional.hpp>
#include <vidar-internal/arch-generic/cursor.hpp>
#include <vidar-internal/arch-generic/paging-consts.hpp>
#include <vidar-internal/error.hpp>
#include <vidar-internal/permission.hpp>
#include <vidar-internal/physical.hpp>
#include <vidar-internal/types.hpp>

#include <frg/expected.hpp>

namespace vidar {

constexpr uint64_t pteValid = UINT64_C(1) << 0;
constexpr uint64_t pteRead = UINT64_C(1) << 1;
constexpr uint64_t pteWrite = UINT64_C(1) << 2;
constexpr uint64_t pteExecute = UINT64_C(1) << 3;
constexpr uint64_t pteUser = UINT64_C(1) << 4;
constexpr uint64_t pteGlobal = UINT64_C(1) << 5;
constexpr uint64_t pteAccess = UINT64_C(1) << 6;
constexpr uint64_t pteDirty = UINT64_C(1) << 7;
constexpr uint64_t ptePpnMask = (((UINT64_C(1) << 44) - 1) << 10);

// satp.MODE value selecting Sv39.
constexpr uint64_t satpModeSv39 = 8;

struct Sv39CursorPolicy {
	static inline constexpr size_t numLevels = 3;
	static inline constexpr size_t bitsPerLevel = 9;

	// Only called on last-level entries, where every valid entry is a page
	// regardless of its R/W/X bits.
	static constexpr bool ptePagePresent(uint64_t pte) {
		return pte & pteValid;
	}

	static constexpr PhysicalAddr ptePageAddress(uint64_t pte) { return (pte & ptePpnMask) << 2; }

	static constexpr uint64_t pteBuild(PhysicalAddr physical, Permission permission) {
		return (physical >> 2) | pteValid | permissionBits(permission);
	}

	static constexpr bool pteTablePresent(uint64_t pte) {
		return (pte & pteValid) && !(pte & (pteRead | pteWrite | pteExecute));
	}

	static constexpr PhysicalAddr pteTableAddress(uint64_t pte) { return (pte & ptePpnMask) << 2; }

	static constexpr uint64_t pteTable(PhysicalAddr physical) {
		return (physical >> 2) | pteValid;
	}
};

static_assert(CursorPolicy<Sv39CursorPolicy>);

// A leaf entry as read from the page table.
struct PageTableEntry {
	explicit PageTableEntry(uint64_t bits)
	: bits_{bits} { }

	uint64_t bits() const {
		return bits_;
	}

	bool isValid() const {
		return bits_ & pteValid;
	}

	PhysicalPageNumber physicalPage() const {
		return (bits_ & ptePpnMask) >> 10;
	}

	PhysicalAddr physicalAddress() const {
		return Sv39CursorPolicy::ptePageAddress(bits_);
	}

	Permission permission() const {
		return permissionFromBits(bits_);
	}

private:
	uint64_t bits_;
};

// Page table of one address space.
struct ClientPageSpace : PageSpace {
private:
	// Restricts construction to create().
	struct ConstructTag { };

public:
	using Cursor = vidar::PageCursor<Sv39CursorPolicy>;

	// Returns Error::noMemory if the root table cannot be allocated.
	static frg::expected<Error, std::unique_ptr<ClientPageSpace>> create();

	ClientPageSpace(ConstructTag, PhysicalAddr rootTable);

	ClientPageSpace(const ClientPageSpace &) = delete;

	~ClientPageSpace();

	ClientPageSpace &operator= (const ClientPageSpace &) = delete;

	frg::expected<Error> mapSingle4k(VirtualAddr pointer, PhysicalAddr physical,
			Permission permission);

	// Returns the physical address that was mapped, if any.
	frg::optional<PhysicalAddr> unmapSingle4k(VirtualAddr pointer);

	frg::optional<PageTableEntry> translate(VirtualPageNumber page);

	// Value of satp that activates this page space.
	uint64_t token() {
		return (satpModeSv39 << 60) | physicalPageOf(rootTable());
	}
};

} // namespace vidar
