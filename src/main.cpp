#include "core/runner.hpp"
#include "speedtest/policy.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

struct Options {
  std::string address = "0.0.0.0";
  int port = -1; // -1 = $PORT, else 3000
  int threads = 1;
  int actor_threads = 2;
  std::string results_out =
      "results/run_" + timeutil::TimestampForFile() + ".ndjson";
  std::int64_t max_size = -1;
  std::int64_t max_chunk = -1;
  std::int64_t upload_limit = -1;
  int high_water = -1;
  int seconds = 0; // 0 = run until SIGINT/SIGTERM
};

static void PrintUsage(const char *argv0) {
  std::cout
      << "Usage: " << argv0 << " [options]\n"
      << "  -a, --address ADDR     listen address (default 0.0.0.0)\n"
      << "  -p, --port N           listen port (default $PORT or 3000)\n"
      << "  -t, --threads N        main reactor threads (default 1)\n"
      << "      --actor-threads N  actor reactor threads (default 2)\n"
      << "  -o, --results-out F    NDJSON results file, '' disables\n"
      << "      --max-size BYTES   download size cap (default 100 MiB)\n"
      << "      --max-chunk BYTES  chunk size cap (default 1 MiB)\n"
      << "      --upload-limit B   upload body/frame limit (default 50 MiB)\n"
      << "      --high-water N     queued frames before backpressure (4)\n"
      << "  -s, --seconds N        stop after N seconds (0 = never)\n";
}

static Options ParseArgs(int argc, char **argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-a" || a == "--address") && i + 1 < argc)
      opt.address = argv[++i];
    else if ((a == "-p" || a == "--port") && i + 1 < argc)
      opt.port = std::clamp(std::atoi(argv[++i]), 0, 65535);
    else if ((a == "-t" || a == "--threads") && i + 1 < argc)
      opt.threads = std::max(1, std::atoi(argv[++i]));
    else if (a == "--actor-threads" && i + 1 < argc)
      opt.actor_threads = std::max(1, std::atoi(argv[++i]));
    else if ((a == "-o" || a == "--results-out") && i + 1 < argc)
      opt.results_out = argv[++i];
    else if (a == "--max-size" && i + 1 < argc)
      opt.max_size = std::max<std::int64_t>(0, std::atoll(argv[++i]));
    else if (a == "--max-chunk" && i + 1 < argc)
      opt.max_chunk = std::max<std::int64_t>(1, std::atoll(argv[++i]));
    else if (a == "--upload-limit" && i + 1 < argc)
      opt.upload_limit = std::max<std::int64_t>(1, std::atoll(argv[++i]));
    else if (a == "--high-water" && i + 1 < argc)
      opt.high_water = std::max(1, std::atoi(argv[++i]));
    else if ((a == "-s" || a == "--seconds") && i + 1 < argc)
      opt.seconds = std::max(0, std::atoi(argv[++i]));
    else if (a == "-h" || a == "--help") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else
      std::cerr << "Ignoring unknown argument: " << a << "\n";
  }
  if (opt.port < 0) {
    const char *env = std::getenv("PORT");
    opt.port = env != nullptr ? std::clamp(std::atoi(env), 0, 65535) : 3000;
  }
  return opt;
}

int main(int argc, char **argv) {
  auto opt = ParseArgs(argc, argv);

  speedtest::Policy policy;
  if (opt.max_size >= 0)
    policy.max_total_size = static_cast<std::uint64_t>(opt.max_size);
  if (opt.max_chunk > 0)
    policy.max_chunk_size = static_cast<std::uint64_t>(opt.max_chunk);
  if (opt.upload_limit > 0)
    policy.upload_body_limit = static_cast<std::uint64_t>(opt.upload_limit);
  if (opt.high_water > 0)
    policy.outbound_high_water = static_cast<std::size_t>(opt.high_water);

  RunOptions ro{.server = {.address = opt.address,
                           .port = static_cast<std::uint16_t>(opt.port),
                           .threads = opt.threads,
                           .actorThreads = opt.actor_threads,
                           .resultsOut = opt.results_out,
                           .policy = policy},
                .seconds = opt.seconds};
  return Run(ro);
}
