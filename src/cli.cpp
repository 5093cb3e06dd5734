#include <fstream>
#include <thread>
#include <algorithm>
#include <getopt.h>

#include <spdlog/spdlog.h>

#include "batch.hpp"
#include "cli.hpp"

void print_usage(std::ostream& out, const char *cmd)
{
	out << "Usage:\n"
		"    " << cmd << " [options] input-mesh output.png\n"
		"    " << cmd << " [options] --batch=<jobs-file> [--workers=<n>]\n"
		"\n"
		"Options:\n"
		"    -s --size=<pixels>\n"
		"\tStarting width and height of the thumbnail (default: 1024).\n"
		"\n"
		"    -m --margin=<fraction>\n"
		"\tRelative margin around the model (default: 0.06).\n"
		"\n"
		"    -a --azim=<degrees>\n"
		"\tCamera azimuth around the up axis (default: 45).\n"
		"\n"
		"    -e --elev=<degrees>\n"
		"\tCamera elevation above the ground plane (default: 25).\n"
		"\n"
		"    -b --bg=<r>,<g>,<b>\n"
		"\tBackground color, components in [0, 1] (default: 1,1,1).\n"
		"\n"
		"    -g --grey=<level>\n"
		"\tAlbedo of models without vertex colors (default: 0.9).\n"
		"\n"
		"    -B --backend=auto|gpu|cpu\n"
		"\tRenderer backend. auto tries the GPU, then the CPU\n"
		"\tdevice (default: auto).\n"
		"\n"
		"    -r --max-ratio=<ratio>\n"
		"\tLargest thumbnail size relative to the source file\n"
		"\tsize (default: 0.5).\n"
		"\n"
		"    -n --min-size=<pixels>\n"
		"\tSmallest resolution tried, accepted regardless of\n"
		"\tfile size (default: 64).\n"
		"\n"
		"    -u --up=z|y\n"
		"\tUp axis of the input model (default: z).\n"
		"\n"
		"    -t --turntable=<frames>\n"
		"\tAlso render this many views around the up axis, written\n"
		"\tas frame_NNN.png files into a .turntable directory beside\n"
		"\tthe thumbnail. 0 disables it (default: 0).\n"
		"\n"
		"    -T --turntable-size=<pixels>\n"
		"\tWidth and height of the turntable frames (default: 512).\n"
		"\n"
		"    -j --batch=<jobs-file>\n"
		"\tRender every job of the file, one per line:\n"
		"\t  source-path artifact-id [size] [backend]\n"
		"\tOutputs go to THUMBNAILS_DIR (default: current directory).\n"
		"\n"
		"    -w --workers=<n>\n"
		"\tWorker threads for batch mode (default: number of CPUs).\n"
		"\n"
		"    -v --verbose\n"
		"\tLog every render attempt.\n"
		"\n"
		"    -h --help\n"
		"\tShow this help.\n"
		"\n"
		"Environment:\n"
		"    THUMBNAIL_SIZE, THUMBNAIL_MARGIN, THUMBNAIL_AZIM_DEG,\n"
		"    THUMBNAIL_ELEV_DEG, THUMBNAIL_BG_RGB, MODEL_GREY,\n"
		"    THUMBNAIL_BACKEND, THUMBNAIL_MAX_RATIO, THUMBNAIL_MIN_SIZE,\n"
		"    THUMBNAIL_TURNTABLE_FRAMES, THUMBNAIL_TURNTABLE_SIZE,\n"
		"    UPLOAD_DIR, THUMBNAILS_DIR, THUMBNAIL_SCRATCH_DIR,\n"
		"    MESHTHUMB_LOG_LEVEL\n"
		"\tDefaults for the options above, overridden by them.\n";
}

CliArgs parse_args(int argc, char *argv[], const ThumbnailConfig& env_cfg)
{
	const static struct option long_options[] =
	{
		{"size",           required_argument, nullptr, 's'},
		{"margin",         required_argument, nullptr, 'm'},
		{"azim",           required_argument, nullptr, 'a'},
		{"elev",           required_argument, nullptr, 'e'},
		{"bg",             required_argument, nullptr, 'b'},
		{"grey",           required_argument, nullptr, 'g'},
		{"backend",        required_argument, nullptr, 'B'},
		{"max-ratio",      required_argument, nullptr, 'r'},
		{"min-size",       required_argument, nullptr, 'n'},
		{"up",             required_argument, nullptr, 'u'},
		{"turntable",      required_argument, nullptr, 't'},
		{"turntable-size", required_argument, nullptr, 'T'},
		{"batch",          required_argument, nullptr, 'j'},
		{"workers",        required_argument, nullptr, 'w'},
		{"verbose",        no_argument,       nullptr, 'v'},
		{"help",           no_argument,       nullptr, 'h'},
		{nullptr, 0, nullptr, 0}
	};

	CliArgs args;
	args.cfg = env_cfg;

	// 0 rather than 1 makes glibc start over on every call.
	optind = 0;
	opterr = 0;
	try {
		for(;;) {
			int opt = getopt_long(argc, argv,
				"s:m:a:e:b:g:B:r:n:u:t:T:j:w:vh", long_options, nullptr);

			if(opt == -1) {
				break;
			}

			switch(opt) {
			case 's':
				args.cfg.size = parse_size(optarg);
				break;
			case 'm':
				args.cfg.framing.margin = parse_real(optarg);
				break;
			case 'a':
				args.cfg.framing.azimuth_deg = parse_real(optarg);
				break;
			case 'e':
				args.cfg.framing.elevation_deg = parse_real(optarg);
				break;
			case 'b':
				args.cfg.style.background = parse_rgb(optarg);
				break;
			case 'g':
				args.cfg.style.grey = parse_real(optarg);
				break;
			case 'B':
				args.cfg.backend = parse_backend_mode(optarg);
				break;
			case 'r':
				args.cfg.max_ratio = parse_real(optarg);
				break;
			case 'n':
				args.cfg.min_size = parse_size(optarg);
				break;
			case 'u':
				args.cfg.source_up = parse_up_axis(optarg);
				break;
			case 't':
				args.cfg.turntable.frames = parse_frame_count(optarg);
				break;
			case 'T':
				args.cfg.turntable.size = parse_size(optarg);
				break;
			case 'j':
				args.batch_file = optarg;
				break;
			case 'w':
				args.workers = parse_size(optarg);
				break;
			case 'v':
				args.cfg.log_level = spdlog::level::debug;
				break;
			case 'h':
				args.help = true;
				return args;
			default:
				throw UsageError(std::string("Unknown or incomplete option \"")
					+ argv[optind - 1] + "\".");
			}
		}

		validate_config(args.cfg);
	} catch(const UsageError&) {
		throw;
	} catch(const std::invalid_argument& e) {
		throw UsageError(e.what());
	}

	if(args.batch_file.empty()) {
		if(argc - optind != 2) {
			throw UsageError("Expected input mesh and output image.");
		}
		args.input = argv[optind];
		args.output = argv[optind+1];
	} else if(argc != optind) {
		throw UsageError("Batch mode takes no positional arguments.");
	}

	return args;
}

static void report(std::ostream& out, const ThumbnailOutcome& r)
{
	out << "wrote: " << r.artifact.path.string()
		<< "  size: " << r.artifact.bytes << " bytes"
		<< "  shape: " << r.resolution << 'x' << r.resolution;
	if(r.is_placeholder()) {
		out << "  placeholder: " << failure_reason_name(r.failure->reason);
	} else {
		out << "  backend: " << backend_name(*r.backend);
	}
	out << std::endl;
}

static void report(std::ostream& out, const TurntableOutcome& r)
{
	if(!r.published()) {
		out << "turntable: not written  reason: "
			<< failure_reason_name(r.failure->reason) << std::endl;
		return;
	}
	out << "turntable: " << r.artifact.path.string()
		<< "  frames: " << r.artifact.frames.size()
		<< "  shape: " << r.resolution << 'x' << r.resolution
		<< "  backend: " << backend_name(*r.backend) << std::endl;
}

int run_single(const CliArgs& args, const ConfiguredPipelineFactory& make,
	std::ostream& out, std::ostream& err)
{
	const std::filesystem::path dest{args.output};

	ThumbnailRequest req;
	req.source = args.input;
	req.artifact_id = dest.stem().string();
	req.destination = dest;

	try {
		auto pipeline = make(args.cfg);
		report(out, pipeline->render(req));
		if(args.cfg.turntable.frames) {
			report(out, pipeline->render_turntable(req));
		}
	} catch(const FilesystemError& e) {
		spdlog::error("[Main] Cannot write {}: {}", dest.string(), e.what());
		return EXIT_WRITE_FAILED;
	} catch(const std::invalid_argument& e) {
		err << "Error: " << e.what() << std::endl;
		return EXIT_USAGE;
	}
	return EXIT_OK;
}

int run_batch(const CliArgs& args, const ConfiguredPipelineFactory& make,
	std::ostream& out, std::ostream& err)
{
	std::ifstream in(args.batch_file);
	if(!in) {
		err << "Error: Cannot open jobs file \""
			<< args.batch_file << "\"." << std::endl;
		return EXIT_USAGE;
	}

	std::vector<BatchJob> jobs;
	try {
		jobs = parse_jobs(in);
	} catch(const std::invalid_argument& e) {
		err << "Error: " << args.batch_file << ": " << e.what()
			<< std::endl;
		return EXIT_USAGE;
	}

	unsigned workers = args.workers;
	if(workers == 0) {
		workers = std::max(1u, std::thread::hardware_concurrency());
	}

	const ThumbnailConfig& cfg = args.cfg;
	BatchDispatcher dispatcher{[&make, &cfg]() {
		return make(cfg);
	}};

	const auto results = dispatcher.run(jobs, workers);
	for(const auto& r: results) {
		if(r.outcome) {
			report(out, *r.outcome);
		}
		if(r.turntable) {
			report(out, *r.turntable);
		}
		if(!r.error.empty()) {
			out << "failed: " << r.job.artifact_id
				<< "  error: " << r.error << std::endl;
		}
	}

	return summarize(results).failed ? EXIT_WRITE_FAILED : EXIT_OK;
}

int run_cli(int argc, char *argv[], const ThumbnailConfig& env_cfg,
	const ConfiguredPipelineFactory& make,
	std::ostream& out, std::ostream& err)
{
	CliArgs args;
	try {
		args = parse_args(argc, argv, env_cfg);
	} catch(const UsageError& e) {
		err << "Error: " << e.what() << std::endl;
		print_usage(err, argv[0]);
		return EXIT_USAGE;
	}

	if(args.help) {
		print_usage(out, argv[0]);
		return EXIT_OK;
	}

	spdlog::set_level(args.cfg.log_level);

	if(!args.batch_file.empty()) {
		return run_batch(args, make, out, err);
	}
	return run_single(args, make, out, err);
}
