#include <cpptrace/cpptrace.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_set>

#include "command_line_parser.hpp"
#include "engine.hpp"
#include "log.hpp"
#include "manifest_store.hpp"
#include "settings_manager.hpp"
#include "transfer_backend.hpp"
#include "utils.hpp"

namespace {

constexpr std::chrono::seconds kIdlePollInterval{1};

int print_manifest_list(Engine& engine) {
  auto logger = engine.logger();
  auto manifests = engine.store().list();
  if(manifests.empty()) {
    logger->print("No manifests in {}", engine.config().manifest_folder.string());
    return 0;
  }
  for(const auto& m : manifests) {
    logger->print("{:<40} {:<10} {:>10} {:>4} chunks  {}",
                  m.id, to_string(m.status), format_size(m.original.size), m.chunks.size(), m.created_at);
  }
  return 0;
}

int print_status(Engine& engine, const std::string& manifest_id) {
  auto logger = engine.logger();
  auto manifest = engine.store().load(manifest_id);
  auto progress = engine.store().upload_progress(manifest_id);
  if(!manifest || !progress) {
    logger->print_err("Manifest '{}' not found", manifest_id);
    return 1;
  }
  logger->print("{} ({}, {})", manifest->original.filename, format_size(manifest->original.size), to_string(manifest->status));
  logger->print("  {}/{} chunks done, {} failed, {} remaining ({:.1f}%)",
                progress->done, progress->total, progress->failed, progress->remaining, progress->percent);
  if(manifest->error) {
    logger->print("  error: {}", *manifest->error);
  }
  std::unordered_set<std::string> known;
  for(const auto& d : engine.destinations()) known.insert(d.name);
  for(const auto& chunk : manifest->chunks) {
    logger->print("  [{}] {:<12} {:<10} {}{}", chunk.index, to_string(chunk.status),
                  format_size(chunk.size), chunk.destination_id,
                  known.count(chunk.destination_id) ? "" : " (orphaned)");
  }
  return 0;
}

int print_remotes(Engine& engine) {
  auto logger = engine.logger();
  auto listing = engine.backend().list_destinations();
  if(!listing.ok) {
    logger->print_err("Unable to list backend remotes: {}", listing.error);
  }
  std::unordered_set<std::string> available(listing.names.begin(), listing.names.end());
  auto destinations = engine.destinations();
  if(destinations.empty()) {
    logger->print("No destinations configured; set --destinations '[{{\"name\":\"drive1\"}}]' --save");
  }
  for(const auto& d : destinations) {
    logger->print("{:<20} remote={:<20} {}{}", d.name, d.backend_ref,
                  d.enabled ? "enabled" : "disabled",
                  !listing.ok || available.count(d.backend_ref) ? "" : " (not known to backend)");
  }
  return 0;
}

int print_stats(Engine& engine) {
  auto logger = engine.logger();
  for(const auto& d : enabled_destinations(engine.destinations())) {
    auto usage = engine.backend().stat(d.backend_ref);
    if(!usage) {
      logger->print("{:<20} usage not available", d.name);
      continue;
    }
    logger->print("{:<20} used {:>10} free {:>10} total {:>10}", d.name,
                  format_size(usage->used_bytes), format_size(usage->free_bytes), format_size(usage->total_bytes));
  }
  auto s = engine.stats();
  logger->print("Manifests: {} ({} completed, {} failed, {} in progress)",
                s.manifests, s.completed, s.failed, s.in_progress);
  return 0;
}

int run_job_command(Engine& engine, SettingsManager& settings, const std::string& command) {
  auto logger = engine.logger();
  const auto target = settings.get<std::string>("target");
  if(target.empty()) {
    logger->print_err("'{}' needs a target", command);
    return 1;
  }

  std::atomic<std::size_t> failures{0};
  engine.set_job_event_callback([&](const JobEvent& event){
    switch(event.type) {
      case JobEventType::Completed:
        logger->print("{} {} done{}", to_string(event.job.kind), event.job.id,
                      event.outcome.manifest_id.empty() ? "" : " (manifest " + event.outcome.manifest_id + ")");
        break;
      case JobEventType::RetryScheduled:
        logger->print("{} will retry in {}s: {}", event.job.id,
                      std::chrono::duration_cast<std::chrono::seconds>(event.delay).count(), event.outcome.message);
        break;
      case JobEventType::FailedTerminal:
      case JobEventType::Cancelled:
      case JobEventType::AuthRequired:
        ++failures;
        logger->print_err("{} {}{}: {}", event.job.id, to_string(event.type),
                          event.blocked_by.empty() ? "" : " (waiting behind " + event.blocked_by + ")",
                          event.outcome.message);
        break;
      default:
        break;
    }
  });

  if(command == "upload") {
    auto replaces = settings.get<std::string>("replaces");
    engine.upload(target, replaces.empty() ? std::nullopt : std::optional<std::string>(replaces));
  } else if(command == "download") {
    auto output = settings.get<std::string>("output");
    if(output.empty()) {
      auto manifest = engine.store().load(target);
      if(!manifest) {
        logger->print_err("Manifest '{}' not found", target);
        return 1;
      }
      output = manifest->original.filename;
    }
    engine.download(target, output);
  } else {
    engine.remove(target);
  }

  while(!engine.wait_idle(std::chrono::duration_cast<std::chrono::milliseconds>(kIdlePollInterval))) {
  }
  return failures.load() == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char** argv){
  try {
    Engine::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? std::filesystem::path(argv[0]).filename().string() : "drivesplit");
    if(!parser.parse(argc, argv, *settings)) {
      return 1;
    }
    const auto command = to_lower_copy(settings->get<std::string>("command"));
    if(settings->help_requested() || (command.empty() && !settings->save_requested())) {
      parser.usage(*settings);
      return 0;
    }

    std::shared_ptr<Logger> progress_logger = std::make_shared<Logger>("progress");
    options.progress.on_progress = [progress_logger](const std::string& job_id, const std::string& stage,
                                                     std::size_t current, std::size_t total) {
      if(total > 0) {
        progress_logger->print("{} {} {}/{}", job_id, stage, current, total);
      } else {
        progress_logger->print("{} {}", job_id, stage);
      }
    };
    options.progress.on_chunk_status = [progress_logger](const std::string& job_id, std::size_t index,
                                                         std::size_t total, const std::string& status) {
      progress_logger->debug("{} chunk {}/{} {}", job_id, index + 1, total, status);
    };

    Engine engine(settings, options);
    engine.start();
    auto logger = engine.logger();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      } else {
        logger->print("Settings saved to {}", settings->settings_path().string());
      }
    }

    int rc = 0;
    if(command.empty()) {
      rc = 0;
    } else if(command == "upload" || command == "download" || command == "delete") {
      rc = run_job_command(engine, *settings, command);
    } else if(command == "list") {
      rc = print_manifest_list(engine);
    } else if(command == "status") {
      rc = print_status(engine, settings->get<std::string>("target"));
    } else if(command == "remotes") {
      rc = print_remotes(engine);
    } else if(command == "stats") {
      rc = print_stats(engine);
    } else {
      logger->print_err("Unknown command '{}'", command);
      parser.usage(*settings);
      rc = 1;
    }
    engine.stop();
    return rc;
  } catch(std::exception& e) {
    init_logging();
    Logger logger("drivesplit-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
