#include <fnmatch.h>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <vidar-internal/config.hpp>

#include "fixture.hpp"
#include "testsuite.hpp"

std::vector<abstract_test_case *> &test_case_ptrs() {
	static std::vector<abstract_test_case *> singleton;
	return singleton;
}

void abstract_test_case::register_case(abstract_test_case *tcp) {
	test_case_ptrs().push_back(tcp);
}

static void run_case(abstract_test_case *tcp, const std::string &cmdline) {
	std::cout << "vidar-tests: Running " << tcp->name() << std::endl;
	vidar::resetConfig();
	if(!cmdline.empty())
		vidar::configure(frg::string_view{cmdline.data(), cmdline.size()});
	tcp->run();
}

int main(int argc, char **argv) {
	CLI::App app{"Address space testsuite for vidar"};

	std::vector<std::string> globs;
	app.add_option("globs", globs, "tests to run");

	std::string cmdline;
	app.add_option("--cmdline", cmdline, "vidar command line applied before each test");

	CLI11_PARSE(app, argc, argv);

	fixture::setupPhysical();

	for(abstract_test_case *tcp : test_case_ptrs()) {
		bool selected = globs.empty();
		for(const auto &glob : globs) {
			if(fnmatch(glob.c_str(), tcp->name(), 0) == 0)
				selected = true;
		}
		if(!selected)
			continue;

		run_case(tcp, cmdline);
	}

	return EXIT_SUCCESS;
}
