#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>

#include <lime/lime.hpp>
#include <lime/utility.hpp>

#include <internal_use_only/config.hpp>

using lime_type = lime::interpreter<>;

namespace {
struct Options
{
  std::string file;
  bool keep_going = false;
  lime_type::size_type max_depth = lime_type::default_max_depth;
};

// returns true if every statement succeeded
bool run(const Options &options)
{
  std::ifstream source(options.file);
  if (!source) {
    spdlog::error("unable to open file: `{}`", options.file);
    return false;
  }
  spdlog::debug("running `{}` with a maximum depth of {}", options.file, options.max_depth);

  lime_type evaluator;
  evaluator.max_depth = options.max_depth;

  bool succeeded = true;
  std::string line;
  for (lime_type::size_type line_number = 1; std::getline(source, line); ++line_number) {
    const auto result = evaluator.evaluate(line, line_number);
    if (!result) {
      spdlog::debug("{}: no value", line_number);
      continue;
    }

    if (const auto *error = lime_type::get_if<lime_type::error_type>(&*result); error != nullptr) {
      spdlog::error("{}", lime::describe(evaluator, *error));
      succeeded = false;
      if (!options.keep_going) { break; }
      continue;
    }

    spdlog::debug("{}: {}", line_number, lime::to_string(evaluator, true, *result));
    evaluator.output(evaluator.display(*result));
  }

  spdlog::debug("{} bindings, {} thunks, {} frames, {} bytes of strings",
    evaluator.global_scope.size(),
    evaluator.thunks.size(),
    evaluator.frames.size(),
    evaluator.strings.size());

  return succeeded;
}
}// namespace


int main(int argc, const char **argv)
{
  try {
    CLI::App app{ fmt::format("{} version {}", lime::cmake::project_name, lime::cmake::project_version) };

    Options options;
    bool show_version = false;
    bool verbose = false;
    app.add_flag("--version", show_version, "Show version information");
    app.add_option("file", options.file, "Source file to run, one statement per line");
    app.add_flag("--keep-going", options.keep_going, "Report a failing statement and continue with the next line");
    app.add_option("--max-depth", options.max_depth, "Maximum evaluation depth")->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Log debug information");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_default_logger(spdlog::stderr_color_mt("lime"));
    spdlog::set_pattern("[%^%l%$] %v");
    if (verbose) { spdlog::set_level(spdlog::level::debug); }

    if (show_version) {
      std::puts(fmt::format("{}", lime::cmake::project_version).c_str());
      return EXIT_SUCCESS;
    }

    if (options.file.empty()) {
      spdlog::error("lime requires exactly one argument: a file name");
      return EXIT_FAILURE;
    }

    return run(options) ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (const std::exception &e) {
    spdlog::error("Unhandled exception in main: {}", e.what());
    return EXIT_FAILURE;
  }
}
