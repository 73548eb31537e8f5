#include <vidar-internal/elf-image.hpp>

#include "elf-builder.hpp"
#include "testsuite.hpp"

using namespace vidar;

DEFINE_TEST(elf_parses_segments, ([] {
	ElfBuilder builder{0x1234};
	builder.addLoad(0x1000, 0x1000, PF_R | PF_X, std::vector<unsigned char>(16, 0x90));
	builder.addNote();
	builder.addLoad(0x2000, 0x3000, PF_R | PF_W);
	auto image = builder.build();

	auto parsed = ElfImage::parse(image.data(), image.size());
	assert(parsed);
	auto &elf = parsed.value();
	assert(elf.entry() == 0x1234);
	assert(elf.numSegments() == 3);

	auto text = elf.segment(0);
	assert(text.type == PT_LOAD);
	assert(text.virtualAddress == 0x1000);
	assert(text.fileSize == 16);
	assert(text.readable && text.executable && !text.writable);
	auto bytes = static_cast<const unsigned char *>(elf.segmentData(text));
	assert(bytes[0] == 0x90 && bytes[15] == 0x90);

	assert(elf.segment(1).type == PT_NOTE);

	auto bss = elf.segment(2);
	assert(!bss.fileSize);
	assert(bss.memorySize == 0x3000);
	assert(bss.readable && bss.writable && !bss.executable);
}))

DEFINE_TEST(elf_rejects_bad_magic, ([] {
	ElfBuilder builder{0x1000};
	builder.addLoad(0x1000, 0x1000, PF_R | PF_X);
	auto image = builder.build();
	image[1] = 'X';

	auto parsed = ElfImage::parse(image.data(), image.size());
	assert(!parsed);
	assert(parsed.error() == Error::badExecutable);
}))

DEFINE_TEST(elf_rejects_truncated_image, ([] {
	ElfBuilder builder{0x1000};
	builder.addLoad(0x1000, 0x1000, PF_R | PF_X);
	auto image = builder.build();

	assert(ElfImage::parse(image.data(), 16).error() == Error::badExecutable);
	// The header is complete but the program headers are cut off.
	assert(ElfImage::parse(image.data(), sizeof(Elf64_Ehdr) + 8).error()
			== Error::badExecutable);
}))

DEFINE_TEST(elf_rejects_wrong_class_and_type, ([] {
	ElfBuilder builder{0x1000};
	builder.ehdr.e_ident[EI_CLASS] = ELFCLASS32;
	auto image = builder.build();
	assert(ElfImage::parse(image.data(), image.size()).error() == Error::badExecutable);

	ElfBuilder object{0x1000};
	object.ehdr.e_type = ET_REL;
	image = object.build();
	assert(ElfImage::parse(image.data(), image.size()).error() == Error::badExecutable);
}))

DEFINE_TEST(elf_rejects_segment_out_of_bounds, ([] {
	ElfBuilder builder{0x1000};
	builder.addLoad(0x1000, 0x1000, PF_R | PF_X, std::vector<unsigned char>(64, 1));
	auto image = builder.build();
	image.resize(image.size() - 1);
	assert(ElfImage::parse(image.data(), image.size()).error() == Error::badExecutable);

	// More file bytes than memory bytes.
	ElfBuilder oversized{0x1000};
	oversized.addLoad(0x1000, 0x10, PF_R, std::vector<unsigned char>(64, 1));
	image = oversized.build();
	assert(ElfImage::parse(image.data(), image.size()).error() == Error::badExecutable);

	ElfBuilder wrapping{0x1000};
	wrapping.addLoad(~Elf64_Addr{0xFFF}, 0x2000, PF_R);
	image = wrapping.build();
	assert(ElfImage::parse(image.data(), image.size()).error() == Error::badExecutable);
}))
