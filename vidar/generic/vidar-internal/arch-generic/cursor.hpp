#pragma once

#include <stddef.h>
#include <concepts>
#include <string.h>

#include <frg/mutex.hpp>
#include <frg/spinlock.hpp>
#include <vidar-internal/arch-generic/paging-consts.hpp>
#include <vidar-internal/permission.hpp>
#include <vidar-internal/physical.hpp>

namespace vidar {

struct PageSpace {
	explicit PageSpace(PhysicalAddr rootTable)
	: rootTable_{rootTable} { }

	PageSpace(const PageSpace &) = delete;
	PageSpace &operator= (const PageSpace &) = delete;

	PhysicalAddr rootTable() {
		return rootTable_;
	}

	auto &tableMutex() {
		return tableMutex_;
	}

private:
	PhysicalAddr rootTable_;

	frg::ticket_spinlock tableMutex_;
};

template <typename T>
concept CursorPolicy = requires (uint64_t pte, PhysicalAddr pa, Permission permission) {
	// Number of table levels.
	{ T::numLevels } -> std::convertible_to<size_t>;
	// How many bits of the address each level resolves.
	{ T::bitsPerLevel } -> std::convertible_to<size_t>;

	// Check whether the given PTE says the page is present.
	{ T::ptePagePresent(pte) } -> std::same_as<bool>;
	// Get the page address from the given PTE.
	{ T::ptePageAddress(pte) } -> std::same_as<PhysicalAddr>;
	// Construct a new leaf PTE from the given parameters.
	{ T::pteBuild(pa, permission) } -> std::same_as<uint64_t>;

	// Check whether the given PTE says the table is present.
	{ T::pteTablePresent(pte) } -> std::same_as<bool>;
	// Get the table address from the given PTE.
	{ T::pteTableAddress(pte) } -> std::same_as<PhysicalAddr>;
	// Construct a PTE that points to the table at the given address.
	{ T::pteTable(pa) } -> std::same_as<uint64_t>;
};

template <CursorPolicy Policy>
struct PageCursor {
	inline static constexpr uintptr_t levelMask = (uintptr_t{1} << Policy::bitsPerLevel) - 1;
	inline static constexpr size_t lastLevel = Policy::numLevels - 1;

	PageCursor(PageSpace *space, uintptr_t va)
	: space_{space}, va_{} {
		accessors_[0] = {space->rootTable()};
		moveTo(va);
	}

private:
	static constexpr size_t levelShift(size_t level) {
		return Policy::bitsPerLevel * (Policy::numLevels - 1 - level) + kPageShift;
	}

	uint64_t *currentPtePtr_() {
		return reinterpret_cast<uint64_t *>(accessors_[lastLevel].get())
			+ ((va_ >> kPageShift) & levelMask);
	}

	uint64_t readCurrentPte_() {
		return __atomic_load_n(currentPtePtr_(), __ATOMIC_RELAXED);
	}

	uint64_t exchangeCurrentPte_(uint64_t value) {
		return __atomic_exchange_n(currentPtePtr_(), value, __ATOMIC_RELAXED);
	}

public:
	void moveTo(uintptr_t va) {
		for(size_t i = 1; i < Policy::numLevels; i++) {
			if((va_ ^ va) & (levelMask << levelShift(i - 1))) {
				for(size_t j = i; j < Policy::numLevels; j++)
					accessors_[j] = {};
				break;
			}
		}

		va_ = va;
		reloadLevel_(lastLevel);
	}

	// Returns the raw leaf PTE, or zero if no last-level table exists.
	uint64_t peek4k() {
		if(!accessors_[lastLevel])
			return 0;
		return readCurrentPte_();
	}

	// Returns false if a page table could not be allocated.
	bool map4k(PhysicalAddr pa, Permission permission) {
		if(!accessors_[lastLevel] && !realizePts_())
			return false;

		auto ptEnt = readCurrentPte_();
		if(Policy::ptePagePresent(ptEnt))
			panicLogger() << "vidar: Page at 0x" << frg::hex_fmt{va_}
					<< " is already mapped" << frg::endlog;

		ptEnt = Policy::pteBuild(pa, permission);
		__atomic_store_n(currentPtePtr_(), ptEnt, __ATOMIC_RELAXED);
		return true;
	}

	// Returns the previous PTE.
	uint64_t unmap4k() {
		if(!accessors_[lastLevel])
			return 0;

		return exchangeCurrentPte_(0);
	}

private:
	bool doReloadLevel_(PageAccessor &subPt, PageAccessor &pt, size_t level) {
		auto ptPtr = reinterpret_cast<uint64_t *>(pt.get())
			+ ((va_ >> levelShift(level)) & levelMask);
		auto ptEnt = __atomic_load_n(ptPtr, __ATOMIC_ACQUIRE);

		if(!Policy::pteTablePresent(ptEnt))
			return false;

		subPt = PageAccessor{Policy::pteTableAddress(ptEnt)};
		return true;
	}

	bool reloadLevel_(size_t level) {
		if(accessors_[level])
			return true;
		assert(level);
		if(!reloadLevel_(level - 1))
			return false;
		return doReloadLevel_(accessors_[level], accessors_[level - 1], level - 1);
	}

	bool doRealizeLevel_(PageAccessor &subPt, PageAccessor &pt, size_t level) {
		auto ptPtr = reinterpret_cast<uint64_t *>(pt.get())
			+ ((va_ >> levelShift(level)) & levelMask);
		auto ptEnt = __atomic_load_n(ptPtr, __ATOMIC_ACQUIRE);

		if(Policy::pteTablePresent(ptEnt)) {
			subPt = PageAccessor{Policy::pteTableAddress(ptEnt)};
			return true;
		}

		auto newPtAddr = physicalAllocator->allocate();
		if(newPtAddr == PhysicalAddr(-1))
			return false;
		subPt = PageAccessor{newPtAddr};
		memset(subPt.get(), 0, kPageSize);

		__atomic_store_n(ptPtr, Policy::pteTable(newPtAddr), __ATOMIC_RELEASE);
		return true;
	}

	bool realizeLevel_(size_t level) {
		if(accessors_[level])
			return true;
		assert(level);
		if(!realizeLevel_(level - 1))
			return false;
		return doRealizeLevel_(accessors_[level], accessors_[level - 1], level - 1);
	}

	bool realizePts_() {
		auto lock = frg::guard(&space_->tableMutex());
		return realizeLevel_(lastLevel);
	}

	PageSpace *space_;
	uintptr_t va_;

	PageAccessor accessors_[Policy::numLevels];
};

// Free page tables recursively. Only frees the page table pages, not the leaf pages.
// Upper levels only hold table pointers; leaves live in the last level.
template<CursorPolicy Policy, size_t N>
void freePt(PhysicalAddr tblPa) {
	PageAccessor accessor{tblPa};
	auto tblPtr = reinterpret_cast<uint64_t *>(accessor.get());
	for(size_t i = 0; i < (size_t{1} << Policy::bitsPerLevel); i++) {
		if(!Policy::pteTablePresent(tblPtr[i]))
			continue;
		auto subTblPa = Policy::pteTableAddress(tblPtr[i]);
		if constexpr (N > 1) {
			freePt<Policy, N - 1>(subTblPa);
		} else {
			// Free last level page table.
			physicalAllocator->free(subTblPa);
		}
	}

	// Free higher level page table.
	physicalAllocator->free(tblPa);
}

} // namespace vidar
