#pragma once

#include <stdint.h>

namespace vidar {

// Access rights of a region. The bit positions match the R/W/X/U bits of
// an Sv39 page table entry, so encoding a permission is a plain OR.
enum class Permission : uint8_t {
	none = 0,
	read = 1 << 1,
	write = 1 << 2,
	execute = 1 << 3,
	user = 1 << 4
};

constexpr uint8_t permissionMask = 0x1E;

inline constexpr Permission operator| (Permission a, Permission b) {
	return static_cast<Permission>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline constexpr Permission operator& (Permission a, Permission b) {
	return static_cast<Permission>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline constexpr Permission operator~ (Permission p) {
	return static_cast<Permission>(~static_cast<uint8_t>(p) & permissionMask);
}

inline constexpr Permission &operator|= (Permission &a, Permission b) {
	a = a | b;
	return a;
}

inline constexpr Permission &operator&= (Permission &a, Permission b) {
	a = a & b;
	return a;
}

// True if every bit of mask is present in p.
inline constexpr bool hasPermission(Permission p, Permission mask) {
	return (p & mask) == mask;
}

inline constexpr uint8_t permissionBits(Permission p) {
	return static_cast<uint8_t>(p);
}

// Bits outside of R/W/X/U are dropped.
inline constexpr Permission permissionFromBits(uint64_t bits) {
	return static_cast<Permission>(bits & permissionMask);
}

namespace permissions {
	inline constexpr Permission rx = Permission::read | Permission::execute;
	inline constexpr Permission rw = Permission::read | Permission::write;
	inline constexpr Permission rwu = Permission::read | Permission::write | Permission::user;
}

} // namespace vidar
