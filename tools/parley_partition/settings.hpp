#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <parley/checkpoint/checkpoint.hpp>
#include <parley/clustering/partition.hpp>
#include <stdexcept>
#include <string>

struct Settings {
  std::string log_level = "info";
  std::string dtype = "float64";

  std::optional<int> k;
  int max_iterations = parley::clustering::DEFAULT_MAX_ITERATIONS;
  std::uint64_t seed = parley::clustering::DEFAULT_SEED;
  parley::clustering::Tolerance tolerance;

  std::string input_file;   // "-" or empty reads stdin
  std::string output_file;  // checkpoint path, .json or .msgpack
  std::string embedding_model;
};

// Command-line overrides; unset fields keep the environment/config value.
struct CliArguments {
  std::optional<int> k;
  std::optional<int> max_iterations;
  std::optional<std::uint64_t> seed;
  std::optional<std::string> dtype;
  std::string input_file;
  std::string output_file;
  std::string config_file;
  bool verbose = false;
  bool help = false;
};

inline Settings load_settings() {
  Settings s;
  auto get_env = [](const char* name, const std::string& def) -> std::string {
    const char* val = std::getenv(name);
    return val ? std::string(val) : def;
  };
  auto get_int = [](const char* name, int def) -> int {
    const char* val = std::getenv(name);
    return val ? std::stoi(val) : def;
  };
  auto get_u64 = [](const char* name, std::uint64_t def) -> std::uint64_t {
    const char* val = std::getenv(name);
    return val ? std::stoull(val) : def;
  };

  s.log_level = get_env("PARLEY_LOG_LEVEL", s.log_level);
  s.dtype = get_env("PARLEY_DTYPE", s.dtype);
  s.max_iterations = get_int("PARLEY_MAX_ITER", s.max_iterations);
  s.seed = get_u64("PARLEY_SEED", s.seed);
  s.embedding_model = get_env("PARLEY_EMBEDDING_MODEL", s.embedding_model);

  return s;
}

inline void apply_config(Settings& s, const parley::ClusteringConfig& config) {
  if (config.n_clusters > 0) s.k = config.n_clusters;
  s.max_iterations = config.max_iter;
  s.seed = config.random_state;
  s.tolerance = {.rtol = config.rtol, .atol = config.atol};
}

inline void apply_arguments(Settings& s, const CliArguments& args) {
  if (args.k) s.k = *args.k;
  if (args.max_iterations) s.max_iterations = *args.max_iterations;
  if (args.seed) s.seed = *args.seed;
  if (args.dtype) s.dtype = *args.dtype;
  if (args.verbose) s.log_level = "debug";
  s.input_file = args.input_file;
  s.output_file = args.output_file;
}

// Throws std::invalid_argument on unknown flags or missing values.
inline CliArguments parse_arguments(int argc, char** argv) {
  CliArguments args;

  auto next_value = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) {
      throw std::invalid_argument("missing value for " + flag);
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-k" || arg == "--clusters") {
      args.k = std::stoi(next_value(i, arg));
    } else if (arg == "-I" || arg == "--iterations") {
      args.max_iterations = std::stoi(next_value(i, arg));
    } else if (arg == "-S" || arg == "--seed") {
      args.seed = std::stoull(next_value(i, arg));
    } else if (arg == "--dtype") {
      args.dtype = next_value(i, arg);
      if (*args.dtype != "float32" && *args.dtype != "float64") {
        throw std::invalid_argument("--dtype must be float32 or float64");
      }
    } else if (arg == "-i" || arg == "--input") {
      args.input_file = next_value(i, arg);
    } else if (arg == "-o" || arg == "--output") {
      args.output_file = next_value(i, arg);
    } else if (arg == "-c" || arg == "--config") {
      args.config_file = next_value(i, arg);
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.help = true;
    } else {
      throw std::invalid_argument("unknown argument: " + arg);
    }
  }

  return args;
}
