#pragma once

#include <stddef.h>
#include <stdint.h>

namespace vidar {

typedef uint64_t PhysicalAddr;
typedef uintptr_t VirtualAddr;

// Page numbers are addresses divided by the page size.
typedef uintptr_t VirtualPageNumber;
typedef uint64_t PhysicalPageNumber;

} // namespace vidar
