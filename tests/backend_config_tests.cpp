#include "command_line_parser.hpp"
#include "distribution_policy.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "rclone_backend.hpp"
#include "settings_manager.hpp"
#include "subprocess.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace {

using drivesplit::test::TestCase;
using drivesplit::test::TestContext;
using drivesplit::test::expect;

std::vector<Destination> named(const std::vector<std::string>& names) {
  std::vector<Destination> out;
  for(const auto& n : names) {
    Destination d;
    d.name = n;
    d.backend_ref = n;
    out.push_back(d);
  }
  return out;
}

bool test_round_robin_assignment(TestContext& ctx) {
  RoundRobinPolicy policy;
  auto spread = policy.assign(5, named({"a", "b", "c"}));
  auto single = policy.assign(3, named({"only"}));
  bool threw = false;
  try {
    policy.assign(2, {});
  } catch(const ConfigurationError&) {
    threw = true;
  }
  return expect(ctx, spread == std::vector<std::string>({"a", "b", "c", "a", "b"}), "i mod n") &&
         expect(ctx, single == std::vector<std::string>({"only", "only", "only"}), "single destination") &&
         expect(ctx, policy.assign(0, named({"a"})).empty(), "no chunks") &&
         expect(ctx, threw, "empty destination list rejected");
}

bool test_backend_errors_are_classified(TestContext& ctx) {
  bool ok = true;
  ok &= expect(ctx, classify_backend_error("HTTP 429 Too Many Requests") == ErrorCategory::RateLimit, "429");
  ok &= expect(ctx, classify_backend_error("googleapi: Error 403: User Rate Limit Exceeded, userRateLimitExceeded")
                    == ErrorCategory::RateLimit, "drive 403 rate limit");
  ok &= expect(ctx, classify_backend_error("couldn't fetch token - maybe it has expired?") == ErrorCategory::Auth,
               "token refresh");
  ok &= expect(ctx, classify_backend_error("oauth2: cannot fetch token: 400 Bad Request") == ErrorCategory::Auth,
               "oauth");
  ok &= expect(ctx, classify_backend_error("dial tcp 142.250.1.1:443: i/o timeout") == ErrorCategory::Transient,
               "timeout");
  ok &= expect(ctx, classify_backend_error("read: connection reset by peer") == ErrorCategory::Transient,
               "connection reset");
  ok &= expect(ctx, classify_backend_error("directory not found") == ErrorCategory::Other, "unrecognised");
  ok &= expect(ctx, is_chunk_retryable(ErrorCategory::Transient) && is_chunk_retryable(ErrorCategory::RateLimit) &&
                    is_chunk_retryable(ErrorCategory::Other), "retryable categories");
  ok &= expect(ctx, !is_chunk_retryable(ErrorCategory::Auth) && !is_chunk_retryable(ErrorCategory::Integrity) &&
                    !is_chunk_retryable(ErrorCategory::Configuration), "non-retryable categories");
  return ok;
}

bool test_engine_config_from_settings(TestContext& ctx) {
  SettingsManager settings;
  auto defaults = engine_config_from_settings(settings, "/work");
  bool ok = true;
  ok &= expect(ctx, defaults.chunk_size_bytes == 100ull * 1024 * 1024, "default chunk size");
  ok &= expect(ctx, defaults.max_concurrent_transfers == 3, "default parallelism");
  ok &= expect(ctx, defaults.upload_folder == "MultiDriveSplit", "default upload folder");
  ok &= expect(ctx, defaults.manifest_folder == std::filesystem::path("/work/manifests"), "relative folder resolved");
  ok &= expect(ctx, defaults.job_retry_base == std::chrono::seconds(60), "job retry base");

  std::string error;
  settings.set_from_string("manifest_folder", "/var/lib/drivesplit", error);
  settings.set_from_string("job_retry_max_seconds", "5", error);
  auto custom = engine_config_from_settings(settings, "/work");
  ok &= expect(ctx, custom.manifest_folder == std::filesystem::path("/var/lib/drivesplit"), "absolute folder kept");
  ok &= expect(ctx, custom.job_retry_cap == custom.job_retry_base, "cap never below base");

  settings.set_from_string("chunk_size_bytes", "0", error);
  bool threw = false;
  try {
    engine_config_from_settings(settings, "/work");
  } catch(const ConfigurationError& e) {
    threw = std::string(e.what()).find("chunk_size_bytes") != std::string::npos;
  }
  ok &= expect(ctx, threw, "zero chunk size rejected by name");
  return ok;
}

bool test_destinations_from_settings(TestContext& ctx) {
  SettingsManager settings;
  std::string error;
  settings.set_from_json("destinations", nlohmann::json::array({
    {{"name", "gd1"}, {"remote", "gdrive1"}, {"description", "personal"}},
    {{"name", "gd2"}, {"enabled", false}}
  }), error);
  auto all = destinations_from_settings(settings);
  auto enabled = enabled_destinations(all);

  bool ok = true;
  ok &= expect(ctx, all.size() == 2, "two destinations");
  if(!ok) return false;
  ok &= expect(ctx, all[0].backend_ref == "gdrive1" && all[0].description == "personal", "fields read");
  ok &= expect(ctx, all[1].backend_ref == "gd2", "remote defaults to name");
  ok &= expect(ctx, enabled.size() == 1 && enabled[0].name == "gd1", "disabled destination filtered");

  settings.set_from_json("destinations", nlohmann::json::array({42}), error);
  bool threw = false;
  try {
    destinations_from_settings(settings);
  } catch(const ConfigurationError&) {
    threw = true;
  }
  ok &= expect(ctx, threw, "malformed entry rejected");
  return ok;
}

bool test_rclone_output_parsing(TestContext& ctx) {
  const std::string lsjson = R"([
    {"Path":"a.part0000.bin.chunk","Name":"a.part0000.bin.chunk","Size":1024,"ModTime":"2024-01-01T00:00:00Z","IsDir":false},
    {"Path":"sub","Name":"sub","Size":-1,"IsDir":true}
  ])";
  auto entries = RcloneBackend::parse_lsjson(lsjson, "MultiDriveSplit");
  auto usage = RcloneBackend::parse_about(R"({"total":16106127360,"used":1073741824,"free":15032385536})");
  auto remotes = RcloneBackend::parse_listremotes("gdrive1:\ngdrive2:\r\n\n");

  std::string noisy;
  for(int i = 1; i <= 15; ++i) noisy += "line " + std::to_string(i) + "\n\n";
  auto tail = RcloneBackend::tail_lines(noisy, 10);

  bool ok = true;
  ok &= expect(ctx, entries.size() == 2, "two entries");
  if(entries.size() == 2) {
    ok &= expect(ctx, entries[0].path == "MultiDriveSplit/a.part0000.bin.chunk", "path joined with base");
    ok &= expect(ctx, entries[0].size == 1024 && !entries[0].is_dir, "file entry");
    ok &= expect(ctx, entries[1].is_dir && entries[1].size == 0, "negative size clamped for dirs");
  }
  ok &= expect(ctx, RcloneBackend::parse_lsjson("not json", "").empty(), "garbage yields nothing");
  ok &= expect(ctx, usage && usage->free_bytes == 15032385536ull, "about parsed");
  ok &= expect(ctx, !RcloneBackend::parse_about("[]").has_value(), "non-object about rejected");
  ok &= expect(ctx, remotes == std::vector<std::string>({"gdrive1", "gdrive2"}), "remote names without colon");
  ok &= expect(ctx, RcloneBackend::remote_spec("gdrive1", "MultiDriveSplit/x") == "gdrive1:MultiDriveSplit/x",
               "remote spec");
  ok &= expect(ctx, tail.rfind("line 6\n", 0) == 0 && tail.find("line 15") != std::string::npos,
               "last ten non-empty lines");
  return ok;
}

bool test_rclone_failures_become_messages(TestContext& ctx) {
  RcloneOptions options;
  options.executable = "false";
  options.query_timeout = std::chrono::seconds(5);
  options.transfer_timeout = std::chrono::seconds(5);
  RcloneBackend backend(options);

  auto result = backend.upload("/tmp/nothing", "gdrive1", "MultiDriveSplit/x");
  auto listing = backend.list_destinations();
  return expect(ctx, !result.ok, "upload fails") &&
         expect(ctx, result.error.rfind("rclone copyto failed with exit code 1", 0) == 0, "message: " + result.error) &&
         expect(ctx, !backend.stat("gdrive1").has_value(), "stat reports no usage") &&
         expect(ctx, !listing.ok && listing.names.empty(), "failed listing is not an empty success") &&
         expect(ctx, listing.error.rfind("rclone listremotes failed with exit code 1", 0) == 0,
                "listing error: " + listing.error);
}

bool test_run_process(TestContext& ctx) {
  auto echo = run_process({"sh", "-c", "echo hello; echo oops 1>&2; exit 3"}, std::chrono::seconds(5));
  auto slow = run_process({"sleep", "5"}, std::chrono::milliseconds(100));
  auto missing = run_process({"drivesplit-no-such-binary"}, std::chrono::seconds(5));
  auto empty = run_process({}, std::chrono::seconds(1));

  bool ok = true;
  ok &= expect(ctx, echo.exit_code == 3 && !echo.ok(), "exit code captured");
  ok &= expect(ctx, echo.output.find("hello") != std::string::npos, "stdout captured");
  ok &= expect(ctx, echo.output.find("oops") != std::string::npos, "stderr captured");
  ok &= expect(ctx, slow.timed_out && !slow.ok(), "timeout kills the child");
  ok &= expect(ctx, missing.exit_code == 127 && missing.output.find("exec failed") != std::string::npos,
               "missing executable reported");
  ok &= expect(ctx, !empty.spawn_error.empty(), "empty command rejected");
  return ok;
}

bool test_run_process_passes_arguments_verbatim(TestContext& ctx) {
  const std::vector<std::string> argv = {"sh", "-c", "printf '%s|' \"$@\"", "sh", "two words", "", "it's"};
  const auto before = argv;
  auto result = run_process(argv, std::chrono::seconds(5));
  return expect(ctx, result.ok(), "printf ran: " + result.output + result.spawn_error) &&
         expect(ctx, result.output == "two words||it's|", "arguments arrive unsplit: " + result.output) &&
         expect(ctx, argv == before, "caller's argv untouched");
}

bool test_command_line_parsing(TestContext& ctx) {
  CommandLineParser parser;
  bool ok = true;

  SettingsManager settings;
  std::string error;
  ok &= expect(ctx, parser.try_parse({"upload", "movie.mkv", "--chunk_size", "1048576", "-v"}, settings, error),
               "valid command line: " + error);
  ok &= expect(ctx, settings.get<std::string>("command") == "upload", "command positional");
  ok &= expect(ctx, settings.get<std::string>("target") == "movie.mkv", "target positional");
  ok &= expect(ctx, settings.get<int64_t>("chunk_size_bytes") == 1048576, "alias sets chunk size");
  ok &= expect(ctx, settings.get<bool>("verbose"), "bare bool flag");

  SettingsManager toggles;
  ok &= expect(ctx, parser.try_parse({"download", "m1", "out.bin", "--sweep", "false"}, toggles, error), "bool literal");
  ok &= expect(ctx, !toggles.get<bool>("rate_limit_sweeps_queue"), "bool literal consumed");
  ok &= expect(ctx, toggles.get<std::string>("output") == "out.bin", "third positional");

  SettingsManager bad;
  error.clear();
  ok &= expect(ctx, !parser.try_parse({"list", "--bogus", "1"}, bad, error), "unknown option rejected");
  ok &= expect(ctx, error.find("--bogus") != std::string::npos, "error names the option");
  ok &= expect(ctx, !parser.try_parse({"download", "--output"}, bad, error), "missing value rejected");
  ok &= expect(ctx, !parser.try_parse({"a", "b", "c", "d"}, bad, error), "extra positional rejected");
  ok &= expect(ctx, !parser.try_parse({"--parallel", "many"}, bad, error), "non-integer rejected");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"round_robin_assignment", test_round_robin_assignment},
    {"backend_errors_are_classified", test_backend_errors_are_classified},
    {"engine_config_from_settings", test_engine_config_from_settings},
    {"destinations_from_settings", test_destinations_from_settings},
    {"rclone_output_parsing", test_rclone_output_parsing},
    {"rclone_failures_become_messages", test_rclone_failures_become_messages},
    {"run_process", test_run_process},
    {"run_process_passes_arguments_verbatim", test_run_process_passes_arguments_verbatim},
    {"command_line_parsing", test_command_line_parsing}
  };
  return drivesplit::test::run_tests("backend and config", tests, argc, argv);
}
