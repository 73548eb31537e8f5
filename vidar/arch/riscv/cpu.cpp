#include <vidar-internal/arch-generic/cpu.hpp>
#include <vidar-internal/debug.hpp>

namespace vidar {

namespace {
	// TODO: Index by hart ID once vidar runs on more than one hart.
	constinit CpuData bootCpuData;
} // anonymous namespace

CpuData *getCpuData() {
	return &bootCpuData;
}

void switchToPageTable(uint64_t token) {
	asm volatile("csrw satp, %0" : : "r"(token) : "memory");
	asm volatile("sfence.vma" : : : "memory");

	auto cpuData = getCpuData();
	cpuData->activeToken = token;
	cpuData->numTlbFlushes++;
}

void panic() {
	asm volatile("csrci sstatus, 2" : : : "memory");
	while(true)
		asm volatile("wfi");
}

} // namespace vidar
