#pragma once

#include <elf.h>
#include <string.h>
#include <vector>

// Assembles minimal ELF64 executables in memory.
struct ElfBuilder {
	explicit ElfBuilder(Elf64_Addr entry) {
		memset(&ehdr, 0, sizeof(Elf64_Ehdr));
		ehdr.e_ident[EI_MAG0] = ELFMAG0;
		ehdr.e_ident[EI_MAG1] = ELFMAG1;
		ehdr.e_ident[EI_MAG2] = ELFMAG2;
		ehdr.e_ident[EI_MAG3] = ELFMAG3;
		ehdr.e_ident[EI_CLASS] = ELFCLASS64;
		ehdr.e_ident[EI_DATA] = ELFDATA2LSB;
		ehdr.e_ident[EI_VERSION] = EV_CURRENT;
		ehdr.e_type = ET_EXEC;
		ehdr.e_machine = EM_RISCV;
		ehdr.e_version = EV_CURRENT;
		ehdr.e_entry = entry;
		ehdr.e_ehsize = sizeof(Elf64_Ehdr);
		ehdr.e_phentsize = sizeof(Elf64_Phdr);
	}

	// Adds a PT_LOAD segment whose file contents are the given bytes.
	void addLoad(Elf64_Addr vaddr, Elf64_Xword memsz, Elf64_Word flags,
			std::vector<unsigned char> contents = {}) {
		Elf64_Phdr phdr;
		memset(&phdr, 0, sizeof(Elf64_Phdr));
		phdr.p_type = PT_LOAD;
		phdr.p_flags = flags;
		phdr.p_vaddr = vaddr;
		phdr.p_paddr = vaddr;
		phdr.p_filesz = contents.size();
		phdr.p_memsz = memsz;
		phdr.p_align = 0x1000;
		phdrs.push_back(phdr);
		payloads.push_back(std::move(contents));
	}

	void addNote() {
		Elf64_Phdr phdr;
		memset(&phdr, 0, sizeof(Elf64_Phdr));
		phdr.p_type = PT_NOTE;
		phdrs.push_back(phdr);
		payloads.push_back({});
	}

	std::vector<unsigned char> build() {
		ehdr.e_phoff = sizeof(Elf64_Ehdr);
		ehdr.e_phnum = phdrs.size();

		size_t offset = sizeof(Elf64_Ehdr) + phdrs.size() * sizeof(Elf64_Phdr);
		for(size_t i = 0; i < phdrs.size(); i++) {
			phdrs[i].p_offset = payloads[i].empty() ? 0 : offset;
			offset += payloads[i].size();
		}

		std::vector<unsigned char> image(offset);
		memcpy(image.data(), &ehdr, sizeof(Elf64_Ehdr));
		memcpy(image.data() + sizeof(Elf64_Ehdr), phdrs.data(),
				phdrs.size() * sizeof(Elf64_Phdr));
		for(size_t i = 0; i < phdrs.size(); i++) {
			if(!payloads[i].empty())
				memcpy(image.data() + phdrs[i].p_offset, payloads[i].data(),
						payloads[i].size());
		}
		return image;
	}

	Elf64_Ehdr ehdr;
	std::vector<Elf64_Phdr> phdrs;
	std::vector<std::vector<unsigned char>> payloads;
};
