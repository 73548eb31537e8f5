#include <stdlib.h>

#include <vidar-internal/arch-generic/cpu.hpp>
#include <vidar-internal/debug.hpp>

// Hosted builds run on top of another OS; the translation register and the
// TLB only exist as per-thread state.

namespace vidar {

namespace {
	thread_local CpuData threadCpuData;
} // anonymous namespace

CpuData *getCpuData() {
	return &threadCpuData;
}

void switchToPageTable(uint64_t token) {
	auto cpuData = getCpuData();
	cpuData->activeToken = token;
	cpuData->numTlbFlushes++;
}

void panic() {
	abort();
}

} // namespace vidar
