// STL includes
#include <string>
#include <vector>

// Misc includes
#include <fmt/format.h>

// Pigmix includes
#include <pigmix/cli/cli.hpp>

int main(int argc, char **argv) {
  std::vector<std::string> args = { argv, argv + argc };

  fmt::memory_buffer out;
  int code = pmx::cli::run(args, out);
  fmt::print("{}", fmt::to_string(out));

  return code;
}
