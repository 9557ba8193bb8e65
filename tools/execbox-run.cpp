#include <fstream>
#include <sstream>
#include <iostream>

#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <execbox/engine.h>
#include <execbox/logger.h>

static std::string ReadAll(std::istream& in) {
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

int main(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "execbox-run");
  parser.add_argument("file")
    .nargs(argparse::nargs_pattern::optional)
    .help("Snippet to run (default: standard input)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-t", "--time-limit")
    .scan<'d', long>()
    .help("Wall-clock limit in milliseconds");
  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 2;
  }
  InitLogger(verbosity);
  if (auto val = parser.present<long>("--time-limit")) kTimeLimit = val.value();

  ExecutionRequest request;
  if (auto file = parser.present<std::string>("file")) {
    std::ifstream fin(*file);
    if (!fin) {
      std::cerr << "Cannot open " << *file << std::endl;
      return 2;
    }
    request.code = ReadAll(fin);
  } else {
    request.code = ReadAll(std::cin);
  }

  ExecutionOutcome outcome = Execute(request);
  int status = HttpStatus(outcome);
  std::cout << OutcomeToJSON(outcome).dump(2, ' ', true, nlohmann::json::error_handler_t::replace)
            << std::endl;
  std::cerr << "HTTP " << status << " (" << OutcomeKindName(KindOf(outcome)) << ")" << std::endl;
  return status == 200 ? 0 : 1;
}
