#pragma once

namespace vidar {

enum class Error {
	success,
	illegalArgs,
	noMemory,
	// No area starts at the requested page.
	noSuchArea,
	alreadyExists,
	badExecutable,
	outOfBounds
};

inline const char *errorName(Error error) {
	switch(error) {
	case Error::success: return "success";
	case Error::illegalArgs: return "illegalArgs";
	case Error::noMemory: return "noMemory";
	case Error::noSuchArea: return "noSuchArea";
	case Error::alreadyExists: return "alreadyExists";
	case Error::badExecutable: return "badExecutable";
	case Error::outOfBounds: return "outOfBounds";
	}
	return "unknown";
}

} // namespace vidar
