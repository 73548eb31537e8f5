#pragma once

#include <vidar-internal/types.hpp>

namespace vidar {

// Per-CPU translation state.
struct CpuData {
	// Token of the page table that is currently active on this CPU.
	uint64_t activeToken = 0;
	uint64_t numTlbFlushes = 0;
	// Set while this CPU runs LogHandler::emit().
	bool emittingLog = false;
};

CpuData *getCpuData();

// Makes the page table identified by token the active one on this CPU
// and flushes the TLB. Implemented by the architecture code.
void switchToPageTable(uint64_t token);

} // namespace vidar
