#pragma once

#include <string>
#include <vector>
#include <istream>
#include <optional>
#include <functional>

#include "pipeline.hpp"

// One line of a jobs file:
//   source-path artifact-id [size] [backend]
struct BatchJob
{
	std::filesystem::path source;
	std::string artifact_id;
	std::optional<uint32_t> size;
	std::optional<BackendMode> backend;
};

// Blank lines and lines starting with # are skipped.
// Throws std::invalid_argument naming the offending line.
std::vector<BatchJob> parse_jobs(std::istream& in);

struct BatchResult
{
	BatchJob job;

	// Empty if the job failed. error tells why, and is also set
	// when only the turntable could not be written.
	std::optional<ThumbnailOutcome> outcome;
	std::string error;

	// Set when turntables are enabled and the thumbnail was written.
	std::optional<TurntableOutcome> turntable;
};

struct BatchSummary
{
	size_t ok = 0;
	size_t placeholder = 0;
	size_t failed = 0;
};

BatchSummary summarize(const std::vector<BatchResult>& results);

using PipelineFactory = std::function<std::unique_ptr<ThumbnailPipeline>()>;

// Runs jobs on worker threads, each owning its own pipeline,
// so renderers are never shared between threads.
class BatchDispatcher
{
public:
	explicit BatchDispatcher(PipelineFactory factory);

	// Jobs for the same artifact id are collapsed into the last
	// one, so no two workers ever publish the same artifact.
	// Results follow the order of the remaining jobs.
	std::vector<BatchResult> run(const std::vector<BatchJob>& jobs,
		unsigned workers);

	static std::vector<BatchJob> dedup(const std::vector<BatchJob>& jobs);

private:
	PipelineFactory factory;
};
