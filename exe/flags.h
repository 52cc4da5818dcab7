#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "boost/program_options.hpp"

namespace tnsw {

inline void add_help_opt(boost::program_options::options_description& desc) {
  desc.add_options()("help,h", "print this help message");
}

inline void add_config_path_opt(
    boost::program_options::options_description& desc,
    std::filesystem::path& p) {
  desc.add_options()(
      "config,c", boost::program_options::value(&p),
      "Configuration YAML file with the API key and the list of trips.");
}

inline void add_api_key_opt(boost::program_options::options_description& desc,
                            std::string& api_key) {
  desc.add_options()(
      "api-key,k", boost::program_options::value(&api_key),
      "Transport NSW Open Data API key.\n"
      "Falls back to the TNSW_API_KEY environment variable.");
}

inline void add_log_level_opt(boost::program_options::options_description& desc,
                              std::string& log_lvl) {
  desc.add_options()(
      "log-level",
      boost::program_options::value(&log_lvl)->default_value(log_lvl),
      "Set the log level.\n"
      "Supported log levels: ERROR, INFO, DEBUG");
}

inline boost::program_options::variables_map parse_opt(
    int ac, char** av, boost::program_options::options_description& desc) {
  namespace po = boost::program_options;
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(ac, av).options(desc).run(), vm);
  po::notify(vm);
  return vm;
}

}  // namespace tnsw
