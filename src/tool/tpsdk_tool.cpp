// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <common/showmsg.hpp>
#include <tpsdk/descriptor_generator.hpp>
#include <tpsdk/descriptor_validator.hpp>
#include <tpsdk/errors.hpp>

using namespace tpsdk;

namespace {

enum class e_tool_mode {
	GENERATE,
	VALIDATE
};

struct s_tool_options {
	e_tool_mode mode = e_tool_mode::GENERATE;
	std::string target;
	std::string output;
	int indent = 2;
};

/**
 * Check if the specified option has an argument following it.
 * @param option: actual args string
 * @param i: index of current args
 * @param argc: arguments count
 * @return false when no value follows, after a warning
 */
bool opt_has_next_value(const char* option, int i, int argc) {
	if (i >= argc - 1) {
		ShowWarning("Missing value for option '%s'.\n", option);
		return false;
	}
	return true;
}

void display_helpscreen() {
	ShowInfo("Usage: tpsdk-tool [options] <target>\n");
	ShowInfo("Generates a plugin descriptor from a YAML/JSON declaration, or validates a descriptor.\n");
	ShowInfo("Options:\n");
	ShowInfo(CL_WHITE "  -g, --generate" CL_RESET "       Generate a descriptor from the declaration <target> (default).\n");
	ShowInfo(CL_WHITE "  -v, --validate" CL_RESET "       Validate the descriptor <target>, '-' reads standard input.\n");
	ShowInfo(CL_WHITE "  -o, --output <file>" CL_RESET "  Output file for -g, '-' for standard output (default: entry.tp beside <target>).\n");
	ShowInfo(CL_WHITE "  -i, --indent <n>" CL_RESET "     JSON indentation, negative for compact output (default: 2).\n");
	ShowInfo(CL_WHITE "  -h, --help" CL_RESET "           Show this screen.\n");
}

void print_violations(const std::vector<Violation>& violations) {
	for (const auto& violation : violations) {
		ShowError("%s\n", violation.to_string().c_str());
	}
}

std::string default_output(const std::string& target) {
	size_t slash = target.find_last_of("/\\");
	if (slash == std::string::npos)
		return "entry.tp";
	return target.substr(0, slash + 1) + "entry.tp";
}

int run_generate(const s_tool_options& options) {
	Document descriptor;

	try {
		PluginDeclaration declaration = PluginDeclaration::load_file(options.target);
		DescriptorGenerator generator;
		descriptor = generator.generate(declaration);
	} catch (const DescriptorError& e) {
		ShowError("%s\n", e.what());
		print_violations(e.violations());
		return EXIT_FAILURE;
	}

	std::string text;
	try {
		text = descriptor.dump(options.indent);
	} catch (const nlohmann::json::type_error& e) {
		ShowError("Cannot serialize the descriptor: %s\n", e.what());
		return EXIT_FAILURE;
	}
	const std::string output = options.output.empty() ? default_output(options.target) : options.output;

	if (output == "-") {
		std::cout << text << std::endl;
		return EXIT_SUCCESS;
	}

	std::ofstream file(output);
	if (!file.is_open()) {
		ShowError("Cannot write '%s'.\n", output.c_str());
		return EXIT_FAILURE;
	}
	file << text << '\n';
	if (!file.good()) {
		ShowError("Failed writing '%s'.\n", output.c_str());
		return EXIT_FAILURE;
	}

	ShowStatus("Generated '" CL_WHITE "%s" CL_RESET "' from '%s'.\n", output.c_str(), options.target.c_str());
	return EXIT_SUCCESS;
}

int run_validate(const s_tool_options& options) {
	DescriptorValidator validator;
	std::vector<Violation> violations;

	if (options.target == "-") {
		std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
		violations = validator.validate_string(text);
	} else {
		violations = validator.validate_file(options.target);
	}

	if (!violations.empty()) {
		print_violations(violations);
		ShowError("'%s' has %zu violation(s).\n", options.target.c_str(), violations.size());
		return EXIT_FAILURE;
	}

	ShowStatus("'" CL_WHITE "%s" CL_RESET "' is valid.\n", options.target.c_str());
	return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
	s_tool_options options;

	for (int i = 1; i < argc; i++) {
		const char* arg = argv[i];

		if (strcmp(arg, "-g") == 0 || strcmp(arg, "--generate") == 0) {
			options.mode = e_tool_mode::GENERATE;
		} else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--validate") == 0) {
			options.mode = e_tool_mode::VALIDATE;
		} else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
			if (!opt_has_next_value(arg, i, argc))
				return EXIT_FAILURE;
			options.output = argv[++i];
		} else if (strcmp(arg, "-i") == 0 || strcmp(arg, "--indent") == 0) {
			if (!opt_has_next_value(arg, i, argc))
				return EXIT_FAILURE;
			options.indent = atoi(argv[++i]);
		} else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
			display_helpscreen();
			return EXIT_SUCCESS;
		} else if (arg[0] == '-' && arg[1] != '\0') {
			ShowError("Unknown option '%s'.\n", arg);
			display_helpscreen();
			return EXIT_FAILURE;
		} else if (options.target.empty()) {
			options.target = arg;
		} else {
			ShowError("Only one target may be given, '%s' is extra.\n", arg);
			return EXIT_FAILURE;
		}
	}

	if (options.target.empty()) {
		ShowError("No target given.\n");
		display_helpscreen();
		return EXIT_FAILURE;
	}

	if (options.mode == e_tool_mode::VALIDATE)
		return run_validate(options);
	return run_generate(options);
}
