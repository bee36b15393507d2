#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager keys: `--key value`, `-alias value`, bare bool flags,
// and positional tokens filled in order (command, target, output by default).
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "drivesplit",
                             std::vector<std::string> positional_keys = {"command", "target", "output"});

  // Returns false with `error` set; settings may be partially applied.
  bool try_parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;

  // Reports the error and usage on failure.
  bool parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  static bool looks_like_option(const std::string& token);

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
