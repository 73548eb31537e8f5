#include <stdio.h>
#include <string.h>

#include <frg/manual_box.hpp>
#include <frg/mutex.hpp>
#include <frg/spinlock.hpp>
#include <vidar-internal/arch-generic/cpu.hpp>
#include <vidar-internal/debug.hpp>

namespace vidar {

namespace {
	// Protects the data structures below.
	constinit frg::ticket_spinlock logMutex;

	frg::manual_box<frg::intrusive_list<
		LogHandler,
		frg::locate_member<
			LogHandler,
			frg::default_list_hook<LogHandler>,
			&LogHandler::hook
		>
	>> globalLogList;

	void postLogRecord(Severity severity, const char *msg) {
		frg::string_view message{msg, strlen(msg)};

		// Records produced by a handler itself cannot take logMutex again.
		auto cpuData = getCpuData();
		if(cpuData->emittingLog) {
			fprintf(stderr, "%.*s\n", static_cast<int>(message.size()), message.data());
			return;
		}

		auto lock = frg::guard(&logMutex);
		if(!globalLogList)
			globalLogList.initialize();

		if(globalLogList->empty()) {
			fprintf(stderr, "%.*s\n", static_cast<int>(message.size()), message.data());
			return;
		}

		cpuData->emittingLog = true;
		for(const auto &it : *globalLogList)
			it->emit(severity, message);
		cpuData->emittingLog = false;
	}
} // anonymous namespace

const char *severityName(Severity severity) {
	switch(severity) {
	case Severity::emergency: return "emergency";
	case Severity::alert: return "alert";
	case Severity::critical: return "critical";
	case Severity::error: return "error";
	case Severity::warning: return "warning";
	case Severity::notice: return "notice";
	case Severity::info: return "info";
	case Severity::debug: return "debug";
	}
	return "unknown";
}

void enableLogHandler(LogHandler *sink) {
	auto lock = frg::guard(&logMutex);
	if(!globalLogList)
		globalLogList.initialize();

	globalLogList->push_back(sink);
}

void disableLogHandler(LogHandler *sink) {
	auto lock = frg::guard(&logMutex);
	if(!globalLogList)
		globalLogList.initialize();

	auto it = globalLogList->iterator_to(sink);
	globalLogList->erase(it);
}

constinit frg::stack_buffer_logger<DebugSink, logLineLength> debugLogger;
constinit frg::stack_buffer_logger<WarningSink, logLineLength> warningLogger;
constinit frg::stack_buffer_logger<InfoSink, logLineLength> infoLogger;
constinit frg::stack_buffer_logger<UrgentSink, logLineLength> urgentLogger;
constinit frg::stack_buffer_logger<PanicSink, logLineLength> panicLogger;

void DebugSink::operator() (const char *msg) {
	postLogRecord(Severity::debug, msg);
}

void WarningSink::operator() (const char *msg) {
	postLogRecord(Severity::warning, msg);
}

void InfoSink::operator() (const char *msg) {
	postLogRecord(Severity::info, msg);
}

void UrgentSink::operator() (const char *msg) {
	// Bypass the handlers; they might be what is broken.
	fprintf(stderr, "%s\n", msg);
}

void PanicSink::operator() (const char *msg) {
	fprintf(stderr, "%s\n", msg);
}

void PanicSink::finalize(bool) {
	panic();
}

} // namespace vidar
