#include <string.h>
#include <algorithm>

#include <vidar-internal/address-space.hpp>
#include <vidar-internal/arch-generic/cpu.hpp>
#include <vidar-internal/config.hpp>
#include <vidar-internal/debug.hpp>

namespace vidar {

// --------------------------------------------------------
// AddressSpace
// --------------------------------------------------------

frg::expected<Error, AddressSpace> AddressSpace::create() {
	auto pageSpace = ClientPageSpace::create();
	if(!pageSpace)
		return pageSpace.error();
	return AddressSpace{std::move(pageSpace.value())};
}

AddressSpace::AddressSpace(std::unique_ptr<ClientPageSpace> pageSpace)
: _pageSpace{std::move(pageSpace)} { }

AddressSpace::~AddressSpace() {
	if(!_pageSpace)
		return;

	dropAllAreas();
	if(_trampoline)
		_pageSpace->unmapSingle4k(_trampoline->address);
}

frg::expected<Error> AddressSpace::mapTrampoline(VirtualAddr address, PhysicalAddr physical) {
	if((address & (kPageSize - 1)) || (physical & (kPageSize - 1)))
		return Error::illegalArgs;
	if(_trampoline)
		return Error::alreadyExists;

	if(auto outcome = _pageSpace->mapSingle4k(address, physical, permissions::rx); !outcome)
		return outcome.error();
	_trampoline = TrampolineMapping{address, physical};
	return {};
}

frg::expected<Error> AddressSpace::install(MemoryArea area, const void *data,
		size_t size, size_t offset) {
	if(data) {
		if(area.policy() != AreaPolicy::framed)
			return Error::illegalArgs;
		size_t capacity = area.numPages() * kPageSize;
		if(offset >= kPageSize || offset > capacity || size > capacity - offset)
			return Error::outOfBounds;
	}

	// Start pages identify areas, so they must not collide.
	for(const auto &other : _areas) {
		bool overlaps = area.startPage() < other.endPage()
				&& other.startPage() < area.endPage();
		if(other.startPage() == area.startPage() || overlaps) {
			warningLogger() << "vidar: Area at page 0x" << frg::hex_fmt{area.startPage()}
					<< " collides with area at page 0x" << frg::hex_fmt{other.startPage()}
					<< frg::endlog;
			return Error::alreadyExists;
		}
	}

	if(auto outcome = area.map(_pageSpace.get()); !outcome) {
		area.unmap(_pageSpace.get());
		return outcome.error();
	}
	if(data)
		area.copyInitialData(_pageSpace.get(), data, size, offset);
	_areas.push_back(std::move(area));
	return {};
}

frg::expected<Error> AddressSpace::addFramed(VirtualAddr start, VirtualAddr end,
		Permission permission) {
	return install(MemoryArea{start, end, AreaPolicy::framed, permission});
}

std::vector<MemoryArea>::iterator AddressSpace::_findArea(VirtualPageNumber startPage) {
	return std::find_if(_areas.begin(), _areas.end(), [&] (const MemoryArea &area) {
		return area.startPage() == startPage;
	});
}

const MemoryArea *AddressSpace::findArea(VirtualPageNumber startPage) const {
	for(const auto &area : _areas) {
		if(area.startPage() == startPage)
			return &area;
	}
	return nullptr;
}

frg::expected<Error> AddressSpace::removeByStart(VirtualPageNumber startPage) {
	auto it = _findArea(startPage);
	if(it == _areas.end())
		return Error::noSuchArea;

	it->unmap(_pageSpace.get());
	_areas.erase(it);
	return {};
}

void AddressSpace::dropAllAreas() {
	for(auto &area : _areas)
		area.unmap(_pageSpace.get());
	_areas.clear();
}

frg::expected<Error> AddressSpace::shrinkArea(VirtualAddr start, VirtualAddr newEnd) {
	auto it = _findArea(pageFloor(start));
	if(it == _areas.end())
		return Error::noSuchArea;

	it->shrinkTo(_pageSpace.get(), pageCeil(newEnd));
	return {};
}

frg::expected<Error> AddressSpace::growArea(VirtualAddr start, VirtualAddr newEnd) {
	auto it = _findArea(pageFloor(start));
	if(it == _areas.end())
		return Error::noSuchArea;

	auto newEndPage = pageCeil(newEnd);
	// The grown range must not run into the next area, even an empty one.
	for(const auto &other : _areas) {
		if(&other == &*it)
			continue;
		if(other.startPage() >= it->endPage() && other.startPage() < newEndPage) {
			warningLogger() << "vidar: Growing area 0x" << frg::hex_fmt{it->startPage()}
					<< " would overlap area 0x" << frg::hex_fmt{other.startPage()}
					<< frg::endlog;
			return Error::alreadyExists;
		}
	}

	return it->extendTo(_pageSpace.get(), newEndPage);
}

frg::optional<PageTableEntry> AddressSpace::translate(VirtualPageNumber page) const {
	return _pageSpace->translate(page);
}

uint64_t AddressSpace::rootToken() const {
	return _pageSpace->token();
}

void AddressSpace::activate() const {
	switchToPageTable(_pageSpace->token());
}

size_t AddressSpace::numOwnedFrames() const {
	size_t n = 0;
	for(const auto &area : _areas)
		n += area.numOwnedFrames();
	return n;
}

frg::expected<Error, AddressSpace> AddressSpace::cloneFrom(const AddressSpace &source) {
	auto created = AddressSpace::create();
	if(!created)
		return created.error();
	AddressSpace space = std::move(created.value());

	if(source._trampoline) {
		auto outcome = space.mapTrampoline(source._trampoline->address,
				source._trampoline->physical);
		if(!outcome)
			return outcome.error();
	}

	for(const auto &area : source._areas) {
		if(auto outcome = space.install(MemoryArea::cloneShape(area)); !outcome)
			return outcome.error();
		if(area.policy() != AreaPolicy::framed)
			continue;

		for(auto page = area.startPage(); page < area.endPage(); page++) {
			auto srcPte = source.translate(page);
			auto destPte = space.translate(page);
			assert(srcPte && destPte);

			PageAccessor srcAccessor{srcPte->physicalAddress()};
			PageAccessor destAccessor{destPte->physicalAddress()};
			memcpy(destAccessor.get(), srcAccessor.get(), kPageSize);
		}
	}

	if(config().logMappings)
		infoLogger() << "vidar: Cloned " << source._areas.size() << " areas, "
				<< space.numOwnedFrames() << " frames" << frg::endlog;
	return space;
}

// --------------------------------------------------------
// AddressSpaceBuilder
// --------------------------------------------------------

AddressSpaceBuilder::AddressSpaceBuilder() {
	auto space = AddressSpace::create();
	if(!space) {
		_error = space.error();
		return;
	}
	_space.emplace(std::move(space.value()));
}

AddressSpaceBuilder &&AddressSpaceBuilder::mapTrampoline(VirtualAddr address,
		PhysicalAddr physical) && {
	if(_error == Error::success) {
		if(auto outcome = _space->mapTrampoline(address, physical); !outcome)
			_error = outcome.error();
	}
	return std::move(*this);
}

AddressSpaceBuilder &&AddressSpaceBuilder::pushIdentical(VirtualAddr start, VirtualAddr end,
		Permission permission) && {
	return _push(MemoryArea{start, end, AreaPolicy::identical, permission}, nullptr, 0, 0);
}

AddressSpaceBuilder &&AddressSpaceBuilder::pushFramed(VirtualAddr start, VirtualAddr end,
		Permission permission) && {
	return _push(MemoryArea{start, end, AreaPolicy::framed, permission}, nullptr, 0, 0);
}

AddressSpaceBuilder &&AddressSpaceBuilder::pushFramedWithData(VirtualAddr start,
		VirtualAddr end, Permission permission,
		const void *data, size_t size, size_t offset) && {
	return _push(MemoryArea{start, end, AreaPolicy::framed, permission}, data, size, offset);
}

AddressSpaceBuilder &&AddressSpaceBuilder::_push(MemoryArea area,
		const void *data, size_t size, size_t offset) {
	if(_error == Error::success) {
		if(auto outcome = _space->install(std::move(area), data, size, offset); !outcome)
			_error = outcome.error();
	}
	return std::move(*this);
}

frg::expected<Error, AddressSpace> AddressSpaceBuilder::build() && {
	if(_error != Error::success)
		return _error;

	// The builder is left with a moved-from space; later steps are no-ops.
	_error = Error::illegalArgs;
	return std::move(*_space);
}

} // namespace vidar
