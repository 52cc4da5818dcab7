#include "boost/program_options.hpp"

#include <iostream>
#include <string>
#include <string_view>

#include "google/protobuf/stubs/common.h"

#include "cista/hash.h"

#include "fmt/ostream.h"

#include "tnsw/config.h"

#include "./flags.h"

#if !defined(TNSW_VERSION)
#define TNSW_VERSION "unknown"
#endif

namespace po = boost::program_options;
using namespace std::string_view_literals;
namespace fs = std::filesystem;

namespace tnsw {
int trip(int, char**);
int feed(int, char**);
}  // namespace tnsw

using namespace tnsw;

int main(int ac, char** av) {
  auto const tnsw_version = std::string_view{TNSW_VERSION};
  if (ac > 1 && av[1] == "--help"sv) {
    fmt::println(
        "tnsw {}\n\n"
        "Usage:\n"
        "  --help    print this help message\n"
        "  --version print program version\n\n"
        "Commands:\n"
        "  trip      plan journeys and match them with live vehicle "
        "positions\n"
        "  feed      print the vehicle positions of one realtime feed\n"
        "  config    read, verify and print a config file\n",
        tnsw_version);
    return 0;
  } else if (ac <= 1 || (ac >= 2 && av[1] == "--version"sv)) {
    fmt::println("{}", tnsw_version);
    return 0;
  }

  // Skip program argument, quit if no command.
  --ac;
  ++av;

  auto return_value = 0;

  auto const cmd = std::string_view{av[0]};
  switch (cista::hash(cmd)) {
    case cista::hash("trip"): return_value = trip(ac, av); break;
    case cista::hash("feed"): return_value = feed(ac, av); break;

    case cista::hash("config"): {
      try {
        auto config_path = fs::path{"config.yml"};

        auto desc = po::options_description{"Config Options"};
        add_config_path_opt(desc, config_path);
        add_help_opt(desc);
        auto vm = parse_opt(ac, av, desc);
        if (vm.count("help")) {
          std::cout << desc << "\n";
          return_value = 0;
          break;
        }

        auto const c = config::read(config_path);
        fmt::println("{}", fmt::streamed(c));
        return_value = 0;
      } catch (std::exception const& e) {
        fmt::println(std::cerr, "invalid config: {}", e.what());
        return_value = 1;
      }
      break;
    }

    default:
      fmt::println("Invalid command. Type tnsw --help for a list of commands.");
      return_value = 1;
      break;
  }

  google::protobuf::ShutdownProtobufLibrary();
  return return_value;
}
