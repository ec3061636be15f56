#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <parley/checkpoint/checkpoint.hpp>
#include <parley/clustering/partition.hpp>
#include <parley/common/logging.hpp>
#include <parley/common/matrix.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

#include "settings.hpp"

using json = nlohmann::json;

namespace {

  void print_usage(const char* program) {
    std::cout << "Usage: " << program << " -k <clusters> [options]\n"
              << "Options:\n"
              << "  -k, --clusters <num>     Requested cluster count\n"
              << "  -I, --iterations <num>   Maximum iterations (default: 100)\n"
              << "  -S, --seed <num>         Random seed (default: 42)\n"
              << "  --dtype <type>           float32 or float64 (default: float64)\n"
              << "  -i, --input <file>       JSON vectors, array of rows or {\"vectors\": [...]}"
                 " (default: stdin)\n"
              << "  -o, --output <file>      Write a checkpoint (.json or .msgpack)\n"
              << "  -c, --config <file>      Clustering config JSON\n"
              << "  -v, --verbose            Debug logging\n"
              << "  -h, --help               Show this help\n";
  }

  json read_input(const std::string& path) {
    if (path.empty() || path == "-") {
      return json::parse(std::istreambuf_iterator<char>(std::cin),
                         std::istreambuf_iterator<char>());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error("Cannot open input file: " + path);
    }
    return json::parse(file);
  }

  bool is_msgpack_path(const std::string& path) {
    return path.ends_with(".msgpack") || path.ends_with(".bin");
  }

  template <typename Scalar> int run(const Settings& settings, const json& input) {
    const json& rows = input.is_object() ? input.at("vectors") : input;
    auto vectors = parley::Matrix<Scalar>::from_rows(rows.get<std::vector<std::vector<Scalar>>>());

    spdlog::info("Partitioning {} vectors of dimension {} into k={} (max_iter={}, seed={})",
                 vectors.rows(), vectors.cols(), *settings.k, settings.max_iterations,
                 settings.seed);

    parley::clustering::PartitionOptions options{.max_iterations = settings.max_iterations,
                                                 .seed = settings.seed,
                                                 .tolerance = settings.tolerance};
    auto result = parley::clustering::partition(vectors, *settings.k, options);

    if (result.converged) {
      spdlog::info("Converged after {} iterations, inertia={}", result.n_iter, result.inertia);
    } else {
      spdlog::warn("Stopped at the iteration cap ({}) without converging", result.n_iter);
    }

    json out = {{"labels", result.labels},
                {"centroids", result.centroids.to_rows()},
                {"cluster_sizes", result.cluster_sizes},
                {"inertia", result.inertia},
                {"n_iter", result.n_iter},
                {"converged", result.converged}};
    std::cout << out.dump(2) << std::endl;

    if (!settings.output_file.empty() && result.n_clusters() == 0) {
      spdlog::warn("No vectors to partition; not writing a checkpoint to {}",
                   settings.output_file);
    } else if (!settings.output_file.empty()) {
      parley::ClusteringConfig config;
      config.random_state = settings.seed;
      config.max_iter = std::max(settings.max_iterations, 1);
      config.rtol = settings.tolerance.rtol;
      config.atol = settings.tolerance.atol;

      auto checkpoint = parley::ClusteringCheckpoint::from_result(
          result, config, {.model = settings.embedding_model});
      if (is_msgpack_path(settings.output_file)) {
        checkpoint.to_msgpack(settings.output_file);
      } else {
        checkpoint.to_json(settings.output_file);
      }
      spdlog::info("Checkpoint written to {}", settings.output_file);
    }

    return 0;
  }

}  // namespace

int main(int argc, char** argv) {
  auto console = spdlog::stderr_color_mt("console");
  spdlog::set_default_logger(console);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  CliArguments args;
  try {
    args = parse_arguments(argc, argv);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    print_usage(argv[0]);
    return 2;
  }

  if (args.help) {
    print_usage(argv[0]);
    return 0;
  }

  try {
    Settings settings = load_settings();
    if (!args.config_file.empty()) {
      apply_config(settings, parley::ClusteringConfig::from_json_file(args.config_file));
    }
    apply_arguments(settings, args);

    spdlog::set_level(spdlog::level::from_str(settings.log_level));
    parley::set_log_level(settings.log_level);

    if (!settings.k) {
      spdlog::error("a cluster count is required (-k or \"n_clusters\" in --config)");
      print_usage(argv[0]);
      return 2;
    }

    json input = read_input(settings.input_file);
    if (settings.dtype == "float64") {
      return run<double>(settings, input);
    }
    return run<float>(settings, input);
  } catch (const std::exception& e) {
    spdlog::critical("Fatal error: {}", e.what());
    return 1;
  }
}
