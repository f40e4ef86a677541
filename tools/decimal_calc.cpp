#include "calculator.hpp"
#include "decimal_engine.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

void usage() {
  std::cerr << "Usage: decimal_calc --input FILE [--scale N] [--rounding MODE] "
            << "[--overflow MODE]\n"
            << "  input lines: op,a[,b]\n"
            << "  ops: add sub mul div avg min max abs neg inv sqr sqrt pow shl shr "
            << "round tolong todouble\n";
}

bool parse_args(int argc, char **argv, std::string &input_path,
                fixdec::EngineConfig &config) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--scale" && i + 1 < argc) {
      config.scale = std::stoi(argv[++i]);
    } else if (arg == "--rounding" && i + 1 < argc) {
      config.rounding = fixdec::parse_rounding_mode(argv[++i]);
    } else if (arg == "--overflow" && i + 1 < argc) {
      config.overflow = fixdec::parse_overflow_mode(argv[++i]);
    } else if (arg == "--help") {
      usage();
      return false;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      usage();
      return false;
    }
  }
  if (input_path.empty()) {
    usage();
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  std::string input_path;
  fixdec::EngineConfig config;

  try {
    if (!parse_args(argc, argv, input_path, config)) {
      return 1;
    }
  } catch (const std::exception &ex) {
    std::cerr << "invalid argument: " << ex.what() << "\n";
    usage();
    return 1;
  }

  std::ifstream file(input_path);
  if (!file.is_open()) {
    std::cerr << "failed to open input file: " << input_path << "\n";
    return 1;
  }

  std::unique_ptr<fixdec::DecimalEngine> engine;
  try {
    engine = std::make_unique<fixdec::DecimalEngine>(config);
  } catch (const std::exception &ex) {
    std::cerr << "failed to create engine: " << ex.what() << "\n";
    return 1;
  }
  std::cout << "# " << engine->describe() << std::endl;

  const fixdec::CalculatorSummary summary =
      fixdec::run_calculator(*engine, file, std::cout, std::cerr);

  if (summary.evaluated == 0) {
    std::cerr << "no lines evaluated from input" << std::endl;
    return 1;
  }
  std::cout << "evaluated " << summary.evaluated << " lines";
  if (summary.failed > 0) {
    std::cout << ", " << summary.failed << " failed";
  }
  std::cout << std::endl;
  return 0;
}
