#include <string.h>

#include <vidar-internal/config.hpp>
#include <vidar-internal/debug.hpp>
#include <vidar-internal/memory-area.hpp>

namespace vidar {

MemoryArea::MemoryArea(VirtualAddr start, VirtualAddr end,
		AreaPolicy policy, Permission permission)
: _startPage{pageFloor(start)}, _endPage{pageCeil(end)},
		_policy{policy}, _permission{permission} {
	if(start > end)
		panicLogger() << "vidar: Area starts at 0x" << frg::hex_fmt{start}
				<< " but ends at 0x" << frg::hex_fmt{end} << frg::endlog;
}

MemoryArea MemoryArea::cloneShape(const MemoryArea &other) {
	return MemoryArea{pageAddress(other._startPage), pageAddress(other._endPage),
			other._policy, other._permission};
}

frg::optional<PhysicalAddr> MemoryArea::frameOf(VirtualPageNumber page) const {
	auto it = _frames.find(page);
	if(it == _frames.end())
		return frg::null_opt;
	return it->second.address();
}

frg::expected<Error> MemoryArea::_mapOne(ClientPageSpace *pageSpace, VirtualPageNumber page) {
	if(_policy == AreaPolicy::identical)
		return pageSpace->mapSingle4k(pageAddress(page), physicalPageAddress(page), _permission);

	auto frame = PhysicalFrame::allocateZeroed();
	if(!frame)
		return frame.error();

	auto physical = frame.value().address();
	if(auto outcome = pageSpace->mapSingle4k(pageAddress(page), physical, _permission); !outcome)
		return outcome.error();
	_frames.emplace(page, std::move(frame.value()));
	return {};
}

void MemoryArea::_unmapOne(ClientPageSpace *pageSpace, VirtualPageNumber page) {
	// The frame is released before its page table entry disappears.
	if(_policy == AreaPolicy::framed)
		_frames.erase(page);
	pageSpace->unmapSingle4k(pageAddress(page));
}

frg::expected<Error> MemoryArea::map(ClientPageSpace *pageSpace) {
	if(config().logMappings)
		infoLogger() << "vidar: Mapping pages 0x" << frg::hex_fmt{_startPage}
				<< " to 0x" << frg::hex_fmt{_endPage} << frg::endlog;

	for(auto page = _startPage; page < _endPage; page++) {
		if(auto outcome = _mapOne(pageSpace, page); !outcome) {
			warningLogger() << "vidar: Failed to map page 0x" << frg::hex_fmt{page}
					<< ": " << errorName(outcome.error()) << frg::endlog;
			return outcome.error();
		}
	}
	return {};
}

void MemoryArea::unmap(ClientPageSpace *pageSpace) {
	if(config().logMappings)
		infoLogger() << "vidar: Unmapping pages 0x" << frg::hex_fmt{_startPage}
				<< " to 0x" << frg::hex_fmt{_endPage} << frg::endlog;

	for(auto page = _startPage; page < _endPage; page++)
		_unmapOne(pageSpace, page);
}

void MemoryArea::shrinkTo(ClientPageSpace *pageSpace, VirtualPageNumber newEnd) {
	if(newEnd > _endPage || newEnd < _startPage)
		panicLogger() << "vidar: Cannot shrink area 0x" << frg::hex_fmt{_startPage}
				<< "-0x" << frg::hex_fmt{_endPage} << " to 0x" << frg::hex_fmt{newEnd}
				<< frg::endlog;

	if(config().logMappings)
		infoLogger() << "vidar: Shrinking area 0x" << frg::hex_fmt{_startPage}
				<< " from 0x" << frg::hex_fmt{_endPage}
				<< " to 0x" << frg::hex_fmt{newEnd} << frg::endlog;

	for(auto page = newEnd; page < _endPage; page++)
		_unmapOne(pageSpace, page);
	_endPage = newEnd;
}

frg::expected<Error> MemoryArea::extendTo(ClientPageSpace *pageSpace, VirtualPageNumber newEnd) {
	if(newEnd < _endPage)
		panicLogger() << "vidar: Cannot extend area 0x" << frg::hex_fmt{_startPage}
				<< "-0x" << frg::hex_fmt{_endPage} << " to 0x" << frg::hex_fmt{newEnd}
				<< frg::endlog;

	if(config().logMappings)
		infoLogger() << "vidar: Extending area 0x" << frg::hex_fmt{_startPage}
				<< " from 0x" << frg::hex_fmt{_endPage}
				<< " to 0x" << frg::hex_fmt{newEnd} << frg::endlog;

	while(_endPage < newEnd) {
		if(auto outcome = _mapOne(pageSpace, _endPage); !outcome)
			return outcome.error();
		_endPage++;
	}
	return {};
}

void MemoryArea::copyInitialData(ClientPageSpace *pageSpace, const void *data, size_t size,
		size_t offset) {
	if(_policy != AreaPolicy::framed)
		panicLogger() << "vidar: Cannot copy data into an identical area" << frg::endlog;
	if(offset >= kPageSize || offset + size > numPages() * kPageSize)
		panicLogger() << "vidar: 0x" << frg::hex_fmt{size} << " bytes at offset 0x"
				<< frg::hex_fmt{offset} << " do not fit into area 0x"
				<< frg::hex_fmt{_startPage} << "-0x" << frg::hex_fmt{_endPage} << frg::endlog;

	auto src = static_cast<const char *>(data);
	size_t progress = 0;
	auto page = _startPage;
	while(progress < size) {
		auto pte = pageSpace->translate(page);
		if(!pte)
			panicLogger() << "vidar: Page 0x" << frg::hex_fmt{page}
					<< " is not mapped" << frg::endlog;

		size_t chunk = kPageSize - offset;
		if(chunk > size - progress)
			chunk = size - progress;

		PageAccessor accessor{pte->physicalAddress()};
		memcpy(static_cast<char *>(accessor.get()) + offset, src + progress, chunk);

		progress += chunk;
		offset = 0;
		page++;
	}
}

} // namespace vidar
