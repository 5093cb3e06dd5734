#pragma once

#include <memory>
#include <string>
#include <ostream>
#include <stdexcept>
#include <functional>

#include "config.hpp"
#include "pipeline.hpp"

enum ExitCode {
	EXIT_OK = 0,
	EXIT_WRITE_FAILED = 1,
	EXIT_USAGE = 2
};

// Malformed command line, reported along with the usage text.
struct UsageError: public std::invalid_argument
{
	using std::invalid_argument::invalid_argument;
};

struct CliArgs
{
	ThumbnailConfig cfg;
	std::string input;
	std::string output;
	std::string batch_file;
	unsigned workers = 0;
	bool help = false;
};

void print_usage(std::ostream& out, const char *cmd);

// Options override env_cfg. Throws UsageError. Like any getopt_long
// user, it may reorder argv.
CliArgs parse_args(int argc, char *argv[], const ThumbnailConfig& env_cfg);

// Builds the pipeline for a configuration, one per worker in batch mode.
using ConfiguredPipelineFactory = std::function<
	std::unique_ptr<ThumbnailPipeline>(const ThumbnailConfig&)>;

// The functions below write result lines to out, errors to err,
// and return the process exit code.
int run_single(const CliArgs& args, const ConfiguredPipelineFactory& make,
	std::ostream& out, std::ostream& err);
int run_batch(const CliArgs& args, const ConfiguredPipelineFactory& make,
	std::ostream& out, std::ostream& err);

int run_cli(int argc, char *argv[], const ThumbnailConfig& env_cfg,
	const ConfiguredPipelineFactory& make,
	std::ostream& out, std::ostream& err);
