#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <execbox/logger.h>
#include "execbox/engine.h"
#include "server_io.h"

namespace fs = std::filesystem;

namespace {

const char kDefaultConfig[] = "/etc/execbox.conf";

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  kHost = ini[""]["host"] | kHost;
  kPort = ini[""]["port"] | kPort;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kTimeLimit = ini[""]["time_limit_ms"] | kTimeLimit;
  kMaxOutput = ini[""]["max_output_kib"] | kMaxOutput;
  kMaxDepth = ini[""]["max_depth"] | kMaxDepth;
  kMaxObjects = ini[""]["max_objects"] | kMaxObjects;
  kMaxMemory = ini[""]["max_memory_mib"] | kMaxMemory;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "execbox");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default /etc/execbox.conf)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-H", "--host")
    .help("Address to listen on");
  parser.add_argument("-P", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of worker threads");
  parser.add_argument("-t", "--time-limit")
    .scan<'d', long>()
    .help("Wall-clock limit of one execution in milliseconds");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  InitLogger(verbosity);
  if (auto config_file = parser.present<std::string>("--config")) {
    if (!ParseConfig(*config_file)) {
      spdlog::error("Failed to parse configuration file {}", *config_file);
      exit(1);
    }
  } else if (ParseConfig(kDefaultConfig)) {
    spdlog::info("Loaded configuration file {}", kDefaultConfig);
  }
  if (auto val = parser.present<std::string>("--host")) kHost = val.value();
  if (auto val = parser.present<int>("--port")) kPort = val.value();
  if (auto val = parser.present<int>("--parallel")) kMaxParallel = val.value();
  if (auto val = parser.present<long>("--time-limit")) kTimeLimit = val.value();
}

} // namespace

int main(int argc, char** argv) {
  ParseArgs(argc, argv);
  if (kMaxParallel < 1) {
    spdlog::error("Invalid number of workers: {}", kMaxParallel);
    return 1;
  }
  return ServerWorkLoop() ? 0 : 1;
}
