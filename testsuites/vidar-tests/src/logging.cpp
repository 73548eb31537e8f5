#include <string.h>
#include <string>
#include <vector>

#include <vidar-internal/address-space.hpp>
#include <vidar-internal/config.hpp>
#include <vidar-internal/debug.hpp>
#include <vidar-internal/physical.hpp>

#include "testsuite.hpp"

using namespace vidar;

namespace {

struct CaptureHandler : LogHandler {
	void emit(Severity severity, frg::string_view message) override {
		records.push_back({severity, std::string{message.data(), message.size()}});
	}

	bool contains(Severity severity, const std::string &needle) const {
		for(const auto &record : records) {
			if(record.first == severity && record.second.find(needle) != std::string::npos)
				return true;
		}
		return false;
	}

	std::vector<std::pair<Severity, std::string>> records;
};

// Allocates a frame for every record it sees.
struct AllocatingHandler : LogHandler {
	void emit(Severity, frg::string_view) override {
		auto physical = physicalAllocator->allocate();
		assert(physical != PhysicalAddr(-1));
		physicalAllocator->free(physical);
		numRecords++;
	}

	int numRecords = 0;
};

} // anonymous namespace

DEFINE_TEST(log_handler_receives_records, ([] {
	CaptureHandler handler;
	enableLogHandler(&handler);
	infoLogger() << "vidar-tests: value 0x" << frg::hex_fmt{0x1234} << frg::endlog;
	warningLogger() << "vidar-tests: careful" << frg::endlog;
	disableLogHandler(&handler);
	infoLogger() << "vidar-tests: not captured" << frg::endlog;

	assert(handler.records.size() == 2);
	assert(handler.contains(Severity::info, "value 0x1234"));
	assert(handler.contains(Severity::warning, "careful"));
}))

DEFINE_TEST(log_mappings_when_enabled, ([] {
	CaptureHandler handler;
	enableLogHandler(&handler);

	configure("vidar.log-mappings");
	{
		auto space = AddressSpace::create();
		assert(space);
		assert(space.value().addFramed(0x1000, 0x2000, permissions::rw));
	}
	resetConfig();
	{
		auto space = AddressSpace::create();
		assert(space);
		assert(space.value().addFramed(0x1000, 0x2000, permissions::rw));
	}

	disableLogHandler(&handler);

	size_t mapped = 0;
	for(const auto &record : handler.records) {
		if(record.second.find("Mapping pages") != std::string::npos)
			mapped++;
	}
	assert(mapped == 1);
	assert(handler.contains(Severity::info, "Unmapping pages"));
}))

DEFINE_TEST(log_collision_warning, ([] {
	CaptureHandler handler;
	enableLogHandler(&handler);
	{
		auto space = AddressSpace::create();
		assert(space);
		assert(space.value().addFramed(0x1000, 0x2000, permissions::rw));
		assert(!space.value().addFramed(0x1000, 0x3000, permissions::rw));
	}
	disableLogHandler(&handler);
	assert(handler.contains(Severity::warning, "collides"));
}))

DEFINE_TEST(log_severities, ([] {
	CaptureHandler handler;
	enableLogHandler(&handler);
	debugLogger() << "vidar-tests: debug record" << frg::endlog;
	// Urgent records go straight to stderr.
	urgentLogger() << "vidar-tests: urgent record" << frg::endlog;
	disableLogHandler(&handler);

	assert(handler.records.size() == 1);
	assert(handler.contains(Severity::debug, "debug record"));
	assert(!strcmp(severityName(Severity::debug), "debug"));
	assert(!strcmp(severityName(Severity::warning), "warning"));
}))

DEFINE_TEST(log_handler_may_allocate, ([] {
	configure("vidar.log-physical");
	auto free = physicalAllocator->numFreePages();

	AllocatingHandler handler;
	enableLogHandler(&handler);
	infoLogger() << "vidar-tests: record that triggers an allocation" << frg::endlog;
	auto physical = physicalAllocator->allocate();
	physicalAllocator->free(physical);
	disableLogHandler(&handler);
	resetConfig();

	// Records logged by the allocator inside emit() do not reach the handler.
	assert(handler.numRecords == 3);
	assert(physicalAllocator->numFreePages() == free);
}))
