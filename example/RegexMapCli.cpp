#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

// regexmap includes
#include "regexmap/rules/RegexOperation.h"
#include "regexmap/transform/RegexMapModule.h"
#include "regexmap/transform/TransformConfig.h"
#include "regexmap/transform/TransformError.h"

using namespace regexmap::transform;

class RegexMapRunner {
 private:
  RegexMapModule& module_;
  bool fail_fast_;
  size_t processed_ = 0;
  size_t failed_ = 0;

 public:
  RegexMapRunner(RegexMapModule& module, bool fail_fast)
      : module_(module), fail_fast_(fail_fast) {}

  // Returns false when processing stopped on a failed record
  bool run(std::istream& in, std::ostream& out) {
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
      line_number++;
      if (line.find_first_not_of(" \t\r") == std::string::npos) {
        continue;
      }

      try {
        Record result = module_.map(Record::fromString(line));
        out << result.valueAsString() << std::endl;
        processed_++;
      } catch (const RecordError& e) {
        failed_++;
        std::cerr << "Line " << line_number << ": " << e.what() << std::endl;
        if (fail_fast_) {
          return false;
        }
      }
    }
    return true;
  }

  size_t processed() const { return processed_; }
  size_t failed() const { return failed_; }
};

void print_usage(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS]" << std::endl;
  std::cout << "Reads newline-delimited JSON records and writes them transformed." << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  -s, --spec <file>         Operation list as a JSON file" << std::endl;
  std::cout << "  -j, --spec-json <json>    Operation list given inline" << std::endl;
  std::cout << "  -i, --input <file>        Read records from a file (default: stdin)" << std::endl;
  std::cout << "  -f, --fail-fast           Stop at the first record that fails" << std::endl;
  std::cout << "  -h, --help                Show this help message" << std::endl;
}

bool read_file(const std::string& path, std::string& contents) {
  std::ifstream file(path);
  if (!file) {
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  contents = buffer.str();
  return true;
}

int main(int argc, char* argv[]) {
  std::string spec_file;
  std::string spec_json;
  std::string input_file;
  bool fail_fast = false;

  // Parse command line arguments
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if ((arg == "-s" || arg == "--spec") && i + 1 < argc) {
      spec_file = argv[++i];
    } else if ((arg == "-j" || arg == "--spec-json") && i + 1 < argc) {
      spec_json = argv[++i];
    } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
      input_file = argv[++i];
    } else if (arg == "-f" || arg == "--fail-fast") {
      fail_fast = true;
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      print_usage(argv[0]);
      return 2;
    }
  }

  // Validate required arguments
  if (spec_file.empty() == spec_json.empty()) {
    std::cerr << "Error: exactly one of --spec or --spec-json is required" << std::endl;
    print_usage(argv[0]);
    return 2;
  }

  if (!spec_file.empty() && !read_file(spec_file, spec_json)) {
    std::cerr << "Error: cannot read spec file " << spec_file << std::endl;
    return 2;
  }

  TransformParams params;
  params[SPEC_PARAM_NAME] = spec_json;

  RegexMapModule& module = global_module::getInstance();
  try {
    module.init(params);
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  }

  auto transformer = module.getTransformer();
  const auto& operations = transformer->getOperations();
  std::cerr << "Loaded " << operations.size() << " regex operations" << std::endl;
  for (const auto& operation : operations) {
    std::cerr << "  " << regexmap::rules::operationName(operation) << " "
              << regexmap::rules::sourcePath(operation) << " -> "
              << regexmap::rules::destinationPath(operation) << std::endl;
  }

  std::ifstream input;
  if (!input_file.empty()) {
    input.open(input_file);
    if (!input) {
      std::cerr << "Error: cannot open input file " << input_file << std::endl;
      return 2;
    }
  }

  RegexMapRunner runner(module, fail_fast);
  bool completed = runner.run(input_file.empty() ? std::cin : input, std::cout);

  std::cerr << "Transformed " << runner.processed() << " records, "
            << runner.failed() << " failed" << std::endl;

  return completed ? 0 : 1;
}
