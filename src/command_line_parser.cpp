#include "command_line_parser.hpp"

#include <cctype>
#include <stdexcept>

#include "log.hpp"

namespace {

std::string describe_default(const SettingSpec& spec) {
  if(spec.default_value.is_string()) return spec.default_value.get<std::string>();
  return spec.default_value.dump();
}

std::string join_aliases(const std::vector<std::string>& aliases) {
  std::string out;
  for(const auto& alias : aliases) {
    out += out.empty() ? " (alias: -" : ", -";
    out += alias;
  }
  if(!out.empty()) out += ")";
  return out;
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name, std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {
  SettingsManager defaults;
  for(auto& key : positional_keys_) {
    auto resolved = defaults.resolve_key(key);
    if(!resolved) {
      throw std::invalid_argument("positional argument maps to unknown setting '" + key + "'");
    }
    key = *resolved;
  }
}

bool CommandLineParser::looks_like_option(const std::string& token) {
  return token.size() >= 2 && token[0] == '-' &&
         (token[1] == '-' || std::isalpha(static_cast<unsigned char>(token[1])));
}

bool CommandLineParser::try_parse(const std::vector<std::string>& args,
                                  SettingsManager& settings,
                                  std::string& error) const {
  std::size_t next_positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const auto& token = args[i];
    const bool long_form = token.rfind("--", 0) == 0;
    const bool short_form = !long_form && token.size() > 1 && token[0] == '-';

    if(long_form || short_form) {
      const auto name = token.substr(long_form ? 2 : 1);
      const auto* spec = settings.find_spec(name);
      if(!spec && long_form) {
        error = "Unknown option " + token;
        return false;
      }
      if(spec) {
        std::string value = "true";
        if(spec->type == SettingType::Bool) {
          // A bare flag means true; an explicit literal right after it is consumed.
          if(i + 1 < args.size() && !looks_like_option(args[i + 1]) && parse_bool_literal(args[i + 1])) {
            value = args[++i];
          }
        } else if(i + 1 < args.size()) {
          value = args[++i];
        } else {
          error = "Missing value for option " + token;
          return false;
        }
        std::string set_error;
        if(!settings.set_from_string(spec->key, value, set_error)) {
          error = "Invalid value for option " + token + ": " + set_error;
          return false;
        }
        continue;
      }
      // Unrecognised single-dash tokens (e.g. "-") are positional.
    }

    if(next_positional >= positional_keys_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& key = positional_keys_[next_positional++];
    std::string set_error;
    if(!settings.set_from_string(key, token, set_error)) {
      error = "Invalid value for " + key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);
  std::string error;
  if(try_parse(args, settings, error)) return true;
  print_err(nullptr, "{}", error);
  usage(settings);
  return false;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_;
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";

  print_out(nullptr, "{} - split files across several cloud remotes", process_name_);
  print_out(nullptr, "Usage:\n  {} [options]\n", synopsis);
  print_out(nullptr, "Commands:");
  print_out(nullptr, "  upload <file>                 split, upload and record a manifest");
  print_out(nullptr, "  download <manifest> [output]  fetch, merge and verify a file");
  print_out(nullptr, "  delete <manifest>             remove chunks from the remotes, then the manifest");
  print_out(nullptr, "  list                          show manifests, newest first");
  print_out(nullptr, "  status <manifest>             chunk progress of one manifest");
  print_out(nullptr, "  remotes                       configured destinations and backend remotes");
  print_out(nullptr, "  stats                         storage usage per destination");
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& spec : settings.specs()) {
    const std::string hint = spec.type == SettingType::Bool
      ? "[true|false]"
      : std::string("<") + to_string(spec.type) + ">";
    print_out(nullptr, "  --{} {:<12} {}{} (default: {}{})",
              spec.key, hint, spec.description, join_aliases(spec.aliases),
              describe_default(spec), spec.persistent ? "" : ", not saved");
  }
  print_out(nullptr, "");
}
