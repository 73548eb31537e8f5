#pragma once

#include <elf.h>

#include <frg/expected.hpp>
#include <vidar-internal/error.hpp>
#include <vidar-internal/types.hpp>

namespace vidar {

struct ProgramSegment {
	uint32_t type;
	VirtualAddr virtualAddress;
	size_t memorySize;
	size_t fileOffset;
	size_t fileSize;
	bool readable;
	bool writable;
	bool executable;
};

// Read-only view of an ELF64 executable. The view does not copy the image;
// the image must outlive it.
struct ElfImage {
	// Validates the header, the program header table and the file ranges
	// of all PT_LOAD segments.
	static frg::expected<Error, ElfImage> parse(const void *data, size_t size);

	VirtualAddr entry() const {
		return _ehdr->e_entry;
	}

	size_t numSegments() const {
		return _ehdr->e_phnum;
	}

	ProgramSegment segment(size_t index) const;

	// File-backed bytes of a segment.
	const void *segmentData(const ProgramSegment &segment) const {
		return _data + segment.fileOffset;
	}

private:
	ElfImage(const char *data, size_t size);

	const Elf64_Phdr *_phdr(size_t index) const;

	const char *_data;
	size_t _size;
	const Elf64_Ehdr *_ehdr;
};

} // namespace vidar
