#include <thread>
#include <exception>
#include <sstream>
#include <algorithm>
#include <unordered_map>

#include <concurrentqueue.h>
#include <lightweightsemaphore.h>

#include <spdlog/spdlog.h>

#include "batch.hpp"

std::vector<BatchJob> parse_jobs(std::istream& in)
{
	std::vector<BatchJob> jobs;
	std::string line;
	size_t line_no = 0;

	while(std::getline(in, line)) {
		++line_no;

		std::istringstream fields{line};
		std::vector<std::string> tokens;
		std::string tok;
		while(fields >> tok) {
			tokens.push_back(tok);
		}

		if(tokens.empty() || tokens[0][0] == '#') {
			continue;
		}

		try {
			if(tokens.size() < 2 || tokens.size() > 4) {
				throw std::invalid_argument(
					"expected: source-path artifact-id [size] [backend]");
			}

			BatchJob job;
			job.source = tokens[0];
			job.artifact_id = tokens[1];
			validate_artifact_id(job.artifact_id);

			if(tokens.size() >= 3) {
				job.size = parse_size(tokens[2]);
			}
			if(tokens.size() == 4) {
				job.backend = parse_backend_mode(tokens[3]);
			}
			jobs.push_back(std::move(job));
		} catch(const std::invalid_argument& e) {
			throw std::invalid_argument("Line " + std::to_string(line_no)
				+ ": " + e.what());
		}
	}

	return jobs;
}

BatchSummary summarize(const std::vector<BatchResult>& results)
{
	BatchSummary s;
	for(const auto& r: results) {
		if(!r.outcome || !r.error.empty()) {
			++s.failed;
		} else if(r.outcome->is_placeholder()) {
			++s.placeholder;
		} else {
			++s.ok;
		}
	}
	return s;
}

BatchDispatcher::BatchDispatcher(PipelineFactory factory):
	factory{std::move(factory)}
{}

std::vector<BatchJob> BatchDispatcher::dedup(const std::vector<BatchJob>& jobs)
{
	// Position of the last job for each id.
	std::unordered_map<std::string, size_t> last;
	for(size_t i = 0; i < jobs.size(); ++i) {
		last[jobs[i].artifact_id] = i;
	}

	std::vector<BatchJob> ret;
	ret.reserve(last.size());
	for(size_t i = 0; i < jobs.size(); ++i) {
		if(last[jobs[i].artifact_id] == i) {
			ret.push_back(jobs[i]);
		}
	}
	return ret;
}

std::vector<BatchResult> BatchDispatcher::run(
	const std::vector<BatchJob>& all_jobs, unsigned workers)
{
	const std::vector<BatchJob> jobs = dedup(all_jobs);
	if(jobs.size() != all_jobs.size()) {
		spdlog::info("[Batch] {} duplicated artifact id(s) collapsed",
			all_jobs.size() - jobs.size());
	}

	std::vector<BatchResult> results(jobs.size());
	if(jobs.empty()) {
		return results;
	}

	workers = std::clamp<unsigned>(workers, 1, unsigned(jobs.size()));

	// Each job index will be inserted into the queue
	// and signaled on the semaphore.
	moodycamel::ConcurrentQueue<size_t> queue;
	moodycamel::LightweightSemaphore sem;
	moodycamel::ProducerToken t(queue);

	// Every worker writes only to the results of the jobs it
	// dequeued, so the vector needs no lock.
	auto work = [&](unsigned worker_idx) {
		std::unique_ptr<ThumbnailPipeline> pipeline;
		size_t idx;

		for(;;) {
			sem.wait();

			if(!queue.try_dequeue_from_producer(t, idx)) {
				break;
			}

			BatchResult& r = results[idx];
			r.job = jobs[idx];

			try {
				if(!pipeline) {
					pipeline = factory();
				}

				const ThumbnailRequest req{
					r.job.source, r.job.artifact_id,
					r.job.size, r.job.backend, std::nullopt
				};
				r.outcome = pipeline->render(req);
				if(pipeline->config().turntable.frames) {
					r.turntable = pipeline->render_turntable(req);
				}
			} catch(const FilesystemError& e) {
				r.error = e.what();
				spdlog::error("[Batch] Worker {}: {} failed: {}",
					worker_idx, r.job.artifact_id, r.error);
			} catch(const std::invalid_argument& e) {
				r.error = e.what();
				spdlog::error("[Batch] Worker {}: {} rejected: {}",
					worker_idx, r.job.artifact_id, r.error);
			} catch(const std::exception& e) {
				// Anything else escaping would terminate every
				// other job of the batch with this thread.
				r.error = e.what();
				spdlog::error("[Batch] Worker {}: {} aborted: {}",
					worker_idx, r.job.artifact_id, r.error);
			}
		}
	};

	std::vector<std::thread> threads;
	threads.reserve(workers);
	for(unsigned i = 0; i < workers; ++i) {
		threads.emplace_back(work, i);
	}

	// Produce the jobs and notify the workers.
	for(size_t i = 0; i < jobs.size(); ++i) {
		queue.enqueue(t, i);
		sem.signal();
	}

	// Notify the workers without producing anything.
	sem.signal(workers);

	for(auto &th: threads) {
		th.join();
	}

	const BatchSummary s = summarize(results);
	spdlog::info("[Batch] {} ok, {} placeholder, {} failed",
		s.ok, s.placeholder, s.failed);

	return results;
}
