#pragma once

#include <vidar-internal/types.hpp>

namespace vidar {

enum {
	kPageSize = 0x1000,
	kPageShift = 12
};

inline constexpr VirtualPageNumber pageFloor(VirtualAddr address) {
	return address >> kPageShift;
}

inline constexpr VirtualPageNumber pageCeil(VirtualAddr address) {
	return (address >> kPageShift) + ((address & (kPageSize - 1)) ? 1 : 0);
}

inline constexpr VirtualAddr pageAddress(VirtualPageNumber page) {
	return page << kPageShift;
}

inline constexpr PhysicalAddr physicalPageAddress(PhysicalPageNumber page) {
	return page << kPageShift;
}

inline constexpr PhysicalPageNumber physicalPageOf(PhysicalAddr address) {
	return address >> kPageShift;
}

} // namespace vidar
