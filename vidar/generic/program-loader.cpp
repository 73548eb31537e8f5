#include <vidar-internal/config.hpp>
#include <vidar-internal/debug.hpp>
#include <vidar-internal/program-loader.hpp>

namespace vidar {

ProgramLayout ProgramLayout::fromConfig(VirtualAddr trampolineAddress,
		PhysicalAddr trampolinePhysical) {
	return ProgramLayout{
		.trampolineAddress = trampolineAddress,
		.trampolinePhysical = trampolinePhysical,
		.trapContextAddress = trampolineAddress - kPageSize,
		.userStackSize = config().userStackSize,
	};
}

Permission segmentPermission(const ProgramSegment &segment) {
	auto permission = Permission::user;
	if(segment.readable)
		permission |= Permission::read;
	if(segment.writable)
		permission |= Permission::write;
	if(segment.executable)
		permission |= Permission::execute;
	return permission;
}

frg::expected<Error, LoadedProgram> loadProgram(const void *image, size_t size,
		const ProgramLayout &layout) {
	auto parsed = ElfImage::parse(image, size);
	if(!parsed)
		return parsed.error();
	auto &elf = parsed.value();

	auto builder = AddressSpaceBuilder{}.mapTrampoline(layout.trampolineAddress,
			layout.trampolinePhysical);

	// Map the PT_LOAD segments with user access.
	VirtualPageNumber maxEndPage = 0;
	for(size_t i = 0; i < elf.numSegments(); i++) {
		auto segment = elf.segment(i);
		if(segment.type != PT_LOAD)
			continue;
		if(!segment.memorySize) // Skip empty segments.
			continue;

		auto start = segment.virtualAddress;
		auto end = segment.virtualAddress + segment.memorySize;
		auto permission = segmentPermission(segment);
		if(config().logLoader)
			infoLogger() << "vidar: Loading segment 0x" << frg::hex_fmt{start}
					<< "-0x" << frg::hex_fmt{end} << ", permission 0x"
					<< frg::hex_fmt{permissionBits(permission)} << ", 0x"
					<< frg::hex_fmt{segment.fileSize} << " bytes from file" << frg::endlog;

		// The data starts at the segment's offset within its first page.
		std::move(builder).pushFramedWithData(start, end, permission,
				elf.segmentData(segment), segment.fileSize, start & (kPageSize - 1));

		if(pageCeil(end) > maxEndPage)
			maxEndPage = pageCeil(end);
	}

	// One unmapped guard page separates the stack from the image.
	VirtualAddr stackBottom = pageAddress(maxEndPage) + kPageSize;
	VirtualAddr stackTop = pageAddress(pageCeil(stackBottom + layout.userStackSize));
	if(config().logLoader)
		infoLogger() << "vidar: User stack at 0x" << frg::hex_fmt{stackBottom}
				<< "-0x" << frg::hex_fmt{stackTop} << ", entry at 0x"
				<< frg::hex_fmt{elf.entry()} << frg::endlog;

	auto space = std::move(builder)
			.pushFramed(stackBottom, stackTop, permissions::rwu)
			.pushFramed(stackTop, stackTop, permissions::rwu)
			.pushFramed(layout.trapContextAddress, layout.trampolineAddress, permissions::rw)
			.build();
	if(!space) {
		warningLogger() << "vidar: Failed to build address space: "
				<< errorName(space.error()) << frg::endlog;
		return space.error();
	}

	return LoadedProgram{
		.space = std::move(space.value()),
		.stackPointer = stackTop,
		.entryIp = elf.entry(),
	};
}

} // namespace vidar
