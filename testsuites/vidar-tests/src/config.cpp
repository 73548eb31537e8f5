#include <vidar-internal/config.hpp>

#include "testsuite.hpp"

using namespace vidar;

DEFINE_TEST(config_defaults, ([] {
	resetConfig();
	assert(!config().logMappings);
	assert(!config().logPhysicalAllocs);
	assert(!config().logLoader);
	assert(config().userStackSize == 0x2000);
}))

DEFINE_TEST(config_flags, ([] {
	resetConfig();
	configure("quiet vidar.log-loader root=/dev/vda vidar.log-mappings");
	assert(config().logLoader);
	assert(config().logMappings);
	assert(!config().logPhysicalAllocs);
	resetConfig();
}))

DEFINE_TEST(config_stack_size, ([] {
	resetConfig();
	configure("vidar.stack-size=0x4000");
	assert(config().userStackSize == 0x4000);

	// Rounded up to whole pages.
	configure("vidar.stack-size=5000");
	assert(config().userStackSize == 0x2000);

	// Malformed values keep the previous setting.
	configure("vidar.stack-size=0x12zz");
	assert(config().userStackSize == 0x2000);
	configure("vidar.stack-size=0");
	assert(config().userStackSize == 0x2000);
	configure("vidar.stack-size=");
	assert(config().userStackSize == 0x2000);

	resetConfig();
	assert(config().userStackSize == 0x2000);
}))
