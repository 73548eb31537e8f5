#pragma once

#include <frg/string.hpp>
#include <vidar-internal/types.hpp>

namespace vidar {

struct Config {
	// Trace every area map/unmap/resize.
	bool logMappings = false;
	// Trace every frame allocation/release.
	bool logPhysicalAllocs = false;
	// Trace segment loading and stack placement.
	bool logLoader = false;

	size_t userStackSize = 0x2000;
};

Config &config();

// Parses a kernel command line, e.g. "vidar.log-loader vidar.stack-size=0x4000".
// Unknown options are ignored.
void configure(frg::string_view cmdline);

// Restores the defaults.
void resetConfig();

} // namespace vidar
