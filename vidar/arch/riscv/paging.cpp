#include <string.h>

#include <vidar-internal/arch/paging.hpp>
#include <vidar-internal/debug.hpp>

namespace vidar {

// --------------------------------------------------------
// User page management.
// --------------------------------------------------------

frg::expected<Error, std::unique_ptr<ClientPageSpace>> ClientPageSpace::create() {
	auto root = physicalAllocator->allocate();
	if(root == PhysicalAddr(-1))
		return Error::noMemory;

	PageAccessor accessor{root};
	memset(accessor.get(), 0, kPageSize);
	return std::make_unique<ClientPageSpace>(ConstructTag{}, root);
}

ClientPageSpace::ClientPageSpace(ConstructTag, PhysicalAddr rootTable)
: PageSpace{rootTable} { }

ClientPageSpace::~ClientPageSpace() {
	freePt<Sv39CursorPolicy, Sv39CursorPolicy::numLevels - 1>(rootTable());
}

frg::expected<Error> ClientPageSpace::mapSingle4k(VirtualAddr pointer, PhysicalAddr physical,
		Permission permission) {
	assert(!(pointer & (kPageSize - 1)));
	assert(!(physical & (kPageSize - 1)));

	Cursor cursor{this, pointer};
	if(!cursor.map4k(physical, permission))
		return Error::noMemory;
	return {};
}

frg::optional<PhysicalAddr> ClientPageSpace::unmapSingle4k(VirtualAddr pointer) {
	assert(!(pointer & (kPageSize - 1)));

	Cursor cursor{this, pointer};
	auto pte = cursor.unmap4k();
	if(!Sv39CursorPolicy::ptePagePresent(pte))
		return frg::null_opt;
	return Sv39CursorPolicy::ptePageAddress(pte);
}

frg::optional<PageTableEntry> ClientPageSpace::translate(VirtualPageNumber page) {
	Cursor cursor{this, pageAddress(page)};
	auto pte = cursor.peek4k();
	if(!Sv39CursorPolicy::ptePagePresent(pte))
		return frg::null_opt;
	return PageTableEntry{pte};
}

} // namespace vidar
