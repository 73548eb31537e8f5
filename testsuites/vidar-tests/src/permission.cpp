#include <vidar-internal/arch/paging.hpp>
#include <vidar-internal/permission.hpp>

#include "testsuite.hpp"

using namespace vidar;

DEFINE_TEST(permission_composition, ([] {
	auto p = Permission::read | Permission::write;
	assert(hasPermission(p, Permission::read));
	assert(hasPermission(p, Permission::write));
	assert(!hasPermission(p, Permission::execute));
	assert(!hasPermission(p, permissions::rwu));
	assert(hasPermission(p, Permission::none));

	p |= Permission::user;
	assert(p == permissions::rwu);
	p &= ~Permission::write;
	assert(p == (Permission::read | Permission::user));
}))

DEFINE_TEST(permission_matches_pte_bits, ([] {
	assert(permissionBits(Permission::read) == pteRead);
	assert(permissionBits(Permission::write) == pteWrite);
	assert(permissionBits(Permission::execute) == pteExecute);
	assert(permissionBits(Permission::user) == pteUser);

	// V, G, A and D are not permissions.
	auto bits = pteValid | pteRead | pteExecute | pteAccess | pteDirty | pteGlobal;
	assert(permissionFromBits(bits) == permissions::rx);
}))

DEFINE_TEST(permission_pte_encoding, ([] {
	PhysicalAddr physical = 0x8020'3000;
	auto pte = Sv39CursorPolicy::pteBuild(physical, permissions::rwu);
	assert(pte & pteValid);
	assert(Sv39CursorPolicy::ptePagePresent(pte));
	assert(!Sv39CursorPolicy::pteTablePresent(pte));
	assert(Sv39CursorPolicy::ptePageAddress(pte) == physical);

	PageTableEntry entry{pte};
	assert(entry.isValid());
	assert(entry.physicalPage() == physicalPageOf(physical));
	assert(entry.permission() == permissions::rwu);
}))
