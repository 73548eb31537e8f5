#include <charconv>

#include <frg/array.hpp>
#include <frg/cmdline.hpp>
#include <frg/optional.hpp>
#include <vidar-internal/arch-generic/paging-consts.hpp>
#include <vidar-internal/config.hpp>
#include <vidar-internal/debug.hpp>

namespace vidar {

namespace {
	Config globalConfig;

	frg::optional<size_t> sizeFromString(frg::string_view str) {
		int base = 10;
		if(str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
			str = str.sub_string(2, str.size() - 2);
			base = 16;
		}
		if(!str.size())
			return frg::null_opt;

		size_t value;
		auto res = std::from_chars(str.data(), str.data() + str.size(), value, base);
		if(res.ec != std::errc{} || res.ptr != str.data() + str.size())
			return frg::null_opt;
		return value;
	}
} // anonymous namespace

Config &config() {
	return globalConfig;
}

void configure(frg::string_view cmdline) {
	frg::string_view stackSize = "";

	frg::array args = {
		frg::option{"vidar.log-mappings", frg::store_true(globalConfig.logMappings)},
		frg::option{"vidar.log-physical", frg::store_true(globalConfig.logPhysicalAllocs)},
		frg::option{"vidar.log-loader", frg::store_true(globalConfig.logLoader)},
		frg::option{"vidar.stack-size", frg::as_string_view(stackSize)},
	};
	frg::parse_arguments(cmdline, args);

	if(stackSize.size()) {
		auto value = sizeFromString(stackSize);
		if(!value || !*value) {
			warningLogger() << "vidar: Ignoring malformed vidar.stack-size" << frg::endlog;
		}else{
			globalConfig.userStackSize = (*value + kPageSize - 1) & ~size_t(kPageSize - 1);
		}
	}

	infoLogger() << "vidar: User stacks are 0x" << frg::hex_fmt{globalConfig.userStackSize}
			<< " bytes" << (globalConfig.logMappings ? ", logging mappings" : "")
			<< frg::endlog;
}

void resetConfig() {
	globalConfig = Config{};
}

} // namespace vidar
