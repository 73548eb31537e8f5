#include <assert.h>

#include <vidar-internal/debug.hpp>
#include <vidar-internal/elf-image.hpp>

namespace vidar {

ElfImage::ElfImage(const char *data, size_t size)
: _data{data}, _size{size}, _ehdr{reinterpret_cast<const Elf64_Ehdr *>(data)} { }

frg::expected<Error, ElfImage> ElfImage::parse(const void *data, size_t size) {
	auto bytes = static_cast<const char *>(data);

	// Read the elf file header and verify the signature.
	if(size < sizeof(Elf64_Ehdr)) {
		infoLogger() << "vidar: ELF image is too small" << frg::endlog;
		return Error::badExecutable;
	}
	auto ehdr = reinterpret_cast<const Elf64_Ehdr *>(bytes);
	if(!(ehdr->e_ident[0] == 0x7F
			&& ehdr->e_ident[1] == 'E'
			&& ehdr->e_ident[2] == 'L'
			&& ehdr->e_ident[3] == 'F')) {
		infoLogger() << "vidar: Invalid ELF magic" << frg::endlog;
		return Error::badExecutable;
	}
	if(ehdr->e_ident[EI_CLASS] != ELFCLASS64) {
		infoLogger() << "vidar: ELF image is not ELF64" << frg::endlog;
		return Error::badExecutable;
	}
	if(ehdr->e_type != ET_EXEC && ehdr->e_type != ET_DYN) {
		infoLogger() << "vidar: ELF image is not an executable" << frg::endlog;
		return Error::badExecutable;
	}

	// The program header table must be inside of the image.
	if(ehdr->e_phnum && ehdr->e_phentsize < sizeof(Elf64_Phdr)) {
		infoLogger() << "vidar: ELF program headers are too small" << frg::endlog;
		return Error::badExecutable;
	}
	size_t phdrBytes = size_t(ehdr->e_phnum) * ehdr->e_phentsize;
	if(ehdr->e_phoff > size || phdrBytes > size - ehdr->e_phoff) {
		infoLogger() << "vidar: ELF program headers exceed the image" << frg::endlog;
		return Error::badExecutable;
	}

	ElfImage image{bytes, size};
	for(size_t i = 0; i < image.numSegments(); i++) {
		auto segment = image.segment(i);
		if(segment.type != PT_LOAD)
			continue;

		if(segment.fileSize > segment.memorySize
				|| segment.fileOffset > size
				|| segment.fileSize > size - segment.fileOffset) {
			infoLogger() << "vidar: ELF segment " << i << " exceeds the image" << frg::endlog;
			return Error::badExecutable;
		}
		if(segment.virtualAddress + segment.memorySize < segment.virtualAddress) {
			infoLogger() << "vidar: ELF segment " << i << " wraps around" << frg::endlog;
			return Error::badExecutable;
		}
	}

	return image;
}

const Elf64_Phdr *ElfImage::_phdr(size_t index) const {
	return reinterpret_cast<const Elf64_Phdr *>(_data + _ehdr->e_phoff
			+ index * _ehdr->e_phentsize);
}

ProgramSegment ElfImage::segment(size_t index) const {
	assert(index < numSegments());
	auto phdr = _phdr(index);

	return ProgramSegment{
		.type = phdr->p_type,
		.virtualAddress = phdr->p_vaddr,
		.memorySize = phdr->p_memsz,
		.fileOffset = phdr->p_offset,
		.fileSize = phdr->p_filesz,
		.readable = (phdr->p_flags & PF_R) != 0,
		.writable = (phdr->p_flags & PF_W) != 0,
		.executable = (phdr->p_flags & PF_X) != 0,
	};
}

} // namespace vidar
