#include "notetrack/quick.hpp"
#include "notetrack/utils/date_format.hpp"
#include "notetrack/utils/logging.hpp"
#include <iomanip>
#include <sstream>
#include <iostream>
#include <string>
#include <vector>

using namespace notetrack;

namespace {

void printUsage(const char *program) {
	std::cout << "Usage: " << program << " <vault> <type:target>... [options]\n\n"
	          << "Types: frontmatter, tag, wiki, text, dvField, table\n\n"
	          << "Options:\n"
	          << "  --folder <path>     folder inside the vault (default /)\n"
	          << "  --format <pattern>  date format of note names (default YYYY-MM-DD)\n"
	          << "  --prefix <text>     text before the date in note names\n"
	          << "  --suffix <text>     text after the date in note names\n"
	          << "  --start <date>      first day, in the date format\n"
	          << "  --end <date>        last day, in the date format\n"
	          << "  --flat              do not descend into subfolders\n"
	          << "  --verbose           log skipped notes\n";
}

std::string formatValue(const core::Dataset::Value &value, bool time_value) {
	if (!value) {
		return "-";
	}
	std::ostringstream out;
	if (time_value) {
		const int seconds = static_cast<int>(*value);
		out << std::setfill('0') << std::setw(2) << seconds / 3600 << ':' << std::setw(2) << (seconds / 60) % 60;
	} else {
		out << *value;
	}
	return out.str();
}

} // namespace

int main(int argc, char **argv) {
	if (argc < 3) {
		printUsage(argv[0]);
		return 1;
	}

	pipeline::AggregationConfig config;
	std::vector<std::string> query_specs;
	std::string start_text;
	std::string end_text;
	bool verbose = false;

	for (int i = 2; i < argc; ++i) {
		const std::string arg = argv[i];
		const bool has_value = i + 1 < argc;
		if (arg == "--folder" && has_value) {
			config.folder = argv[++i];
		} else if (arg == "--format" && has_value) {
			config.date_format = argv[++i];
		} else if (arg == "--prefix" && has_value) {
			config.date_format_prefix = argv[++i];
		} else if (arg == "--suffix" && has_value) {
			config.date_format_suffix = argv[++i];
		} else if (arg == "--start" && has_value) {
			start_text = argv[++i];
		} else if (arg == "--end" && has_value) {
			end_text = argv[++i];
		} else if (arg == "--flat") {
			config.include_subfolders = false;
		} else if (arg == "--verbose") {
			verbose = true;
		} else {
			query_specs.push_back(arg);
		}
	}

#ifndef NOTETRACK_NO_LOGGING
	utils::Logging::init(verbose ? spdlog::level::debug : spdlog::level::warn);
#endif

	try {
		const utils::DateFormat date_format(config.date_format);
		if (!start_text.empty()) {
			config.start_date = date_format.parseDate(start_text);
			if (!config.start_date) {
				std::cerr << "Start date '" << start_text << "' does not match " << config.date_format << "\n";
				return 1;
			}
		}
		if (!end_text.empty()) {
			config.end_date = date_format.parseDate(end_text);
			if (!config.end_date) {
				std::cerr << "End date '" << end_text << "' does not match " << config.date_format << "\n";
				return 1;
			}
		}

		std::vector<core::Query> queries;
		for (const auto &spec : query_specs) {
			const auto colon = spec.find(':');
			if (colon == std::string::npos) {
				std::cerr << "Query '" << spec << "' must look like type:target\n";
				return 1;
			}
			const int id = static_cast<int>(queries.size());
			const std::string type = spec.substr(0, colon);
			std::string target = spec.substr(colon + 1);
			// A trailing "@x" marks the date column of a table.
			const bool is_x = type == "table" && target.size() > 2 && target.compare(target.size() - 2, 2, "@x") == 0;
			if (is_x) {
				target.resize(target.size() - 2);
			}
			queries.push_back(core::QueryBuilder()
			                      .withId(id)
			                      .withSearchType(core::parseSearchType(type))
			                      .withTarget(target)
			                      .asXDataset(is_x)
			                      .build());
		}
		if (queries.empty()) {
			printUsage(argv[0]);
			return 1;
		}

		const auto result = quick::trackFolder(argv[1], queries, config);
		if (!result) {
			std::cerr << pipeline::toString(result.error().code) << ": " << result.error().message << "\n";
			return 2;
		}

		const auto &output = result.value();
		std::cout << "Window: " << output.window.start.toIsoString() << " to " << output.window.end.toIsoString()
		          << " (" << output.window.days() << " days)\n\n";

		std::cout << std::setw(12) << std::left << "date";
		for (const auto &dataset : output.datasets) {
			std::cout << " | " << std::setw(14) << dataset.name();
		}
		std::cout << "\n";

		for (std::size_t day = 0; day < output.window.days(); ++day) {
			std::cout << std::setw(12) << output.datasets.front().dateAt(day).toIsoString();
			for (const auto &dataset : output.datasets) {
				std::cout << " | " << std::setw(14) << formatValue(dataset.valueAt(day), dataset.usingTimeValue());
			}
			std::cout << "\n";
		}

		std::cout << "\nDays with data:";
		for (const auto &dataset : output.datasets) {
			std::cout << " " << dataset.name() << "=" << dataset.countPresent();
		}
		std::cout << "\n";
	} catch (const std::exception &e) {
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}

	return 0;
}
