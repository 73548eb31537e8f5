#pragma once

#include <frg/list.hpp>
#include <frg/logging.hpp>
#include <frg/string.hpp>

namespace vidar {

// Stops the machine. Provided by the architecture code.
[[noreturn]] void panic();

// --------------------------------------------------------
// Log infrastructure.
// --------------------------------------------------------

constexpr size_t logLineLength = 256;

// see RFC 5424
enum class Severity : uint8_t {
	emergency,
	alert,
	critical,
	error,
	warning,
	notice,
	info,
	debug,
};

const char *severityName(Severity severity);

// Synchronous logging sink.
//
// Handlers are called with the global logging mutex held, i.e., all calls
// to emit() are serialized. Messages are not null-terminated and do not
// end with a newline. Records that are logged from within emit() bypass
// the handlers and go to stderr.
struct LogHandler {
	virtual void emit(Severity severity, frg::string_view message) = 0;

	frg::default_list_hook<LogHandler> hook;

protected:
	~LogHandler() = default;
};

// While no handler is enabled, records are written to stderr.
void enableLogHandler(LogHandler *sink);
void disableLogHandler(LogHandler *sink);

// --------------------------------------------------------
// Loggers.
// --------------------------------------------------------

struct DebugSink {
	constexpr DebugSink() = default;

	void operator() (const char *msg);
};

struct WarningSink {
	constexpr WarningSink() = default;

	void operator() (const char *msg);
};

struct InfoSink {
	constexpr InfoSink() = default;

	void operator() (const char *msg);
};

struct UrgentSink {
	constexpr UrgentSink() = default;

	void operator() (const char *msg);
};

struct PanicSink {
	constexpr PanicSink() = default;

	void operator() (const char *msg);
	void finalize(bool);
};

extern frg::stack_buffer_logger<DebugSink, logLineLength> debugLogger;
extern frg::stack_buffer_logger<WarningSink, logLineLength> warningLogger;
extern frg::stack_buffer_logger<InfoSink, logLineLength> infoLogger;
extern frg::stack_buffer_logger<UrgentSink, logLineLength> urgentLogger;
extern frg::stack_buffer_logger<PanicSink, logLineLength> panicLogger;

} // namespace vidar
