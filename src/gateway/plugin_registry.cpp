#include "gateway/plugin_registry.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <set>
#include <stdexcept>
#include <system_error>

#include "gateway/logging.hpp"

namespace gateway {
namespace {

using gateway::logging::LogDebug;
using gateway::logging::LogInfo;
using gateway::logging::LogWarn;

namespace fs = std::filesystem;

const std::vector<std::string> kEntryPointNames = {"cli", "cli.py", "cli.sh",
                                                   "main", "main.py", "main.sh"};

std::optional<fs::path> FindEntryPoint(const fs::path& plugin_dir) {
  std::error_code ec;
  for (const auto& name : kEntryPointNames) {
    const fs::path candidate = plugin_dir / name;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }
  return std::nullopt;
}

bool LooksLikeScript(const fs::path& path) {
  const auto extension = path.extension().string();
  if (extension == ".py" || extension == ".sh") {
    return true;
  }
  std::error_code ec;
  const auto perms = fs::status(path, ec).permissions();
  return !ec && (perms & fs::perms::owner_exec) != fs::perms::none;
}

}  // namespace

std::vector<PluginCandidate> DiscoverCandidates(const std::string& directory,
                                                std::vector<DiscoveryFailure>* failures) {
  std::vector<PluginCandidate> candidates;
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    LogWarn("Plugins directory " + directory + " does not exist or is not a directory");
    return candidates;
  }

  std::vector<fs::directory_entry> entries;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
    entries.push_back(*it);
  }
  if (ec) {
    LogWarn("Failed to list plugins directory " + directory + ": " + ec.message());
  }
  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry& lhs, const fs::directory_entry& rhs) {
              return lhs.path().filename() < rhs.path().filename();
            });

  for (const auto& entry : entries) {
    const auto filename = entry.path().filename().string();
    if (filename.empty() || filename.front() == '.') {
      continue;
    }

    std::string name;
    fs::path entry_point;
    if (entry.is_directory(ec)) {
      const auto found = FindEntryPoint(entry.path());
      if (!found) {
        LogDebug("Skipping " + entry.path().string() + ": no cli or main entry point");
        continue;
      }
      name = filename;
      entry_point = *found;
    } else if (entry.is_regular_file(ec) && LooksLikeScript(entry.path())) {
      name = entry.path().stem().string();
      entry_point = entry.path();
    } else {
      continue;
    }

    try {
      candidates.push_back(MakeCandidate(name, entry_point.string()));
    } catch (const IntrospectionError& ex) {
      LogWarn(std::string{"Excluding plugin: "} + ex.what());
      if (failures != nullptr) {
        failures->push_back({name, ex.what()});
      }
    }
  }
  return candidates;
}

std::shared_ptr<const RegistrySnapshot> MakeSnapshot(std::vector<Plugin> plugins,
                                                     std::vector<DiscoveryFailure> failures,
                                                     std::string directory,
                                                     std::uint64_t generation) {
  auto snapshot = std::make_shared<RegistrySnapshot>();
  snapshot->directory = std::move(directory);
  snapshot->generation = generation;
  snapshot->scanned_at = std::chrono::system_clock::now();
  snapshot->failures = std::move(failures);

  std::set<std::string> plugin_names;
  std::set<std::string> tool_names;
  std::vector<Plugin> accepted;
  for (auto& plugin : plugins) {
    std::string conflict;
    if (plugin_names.count(plugin.name) != 0) {
      conflict = "plugin name '" + plugin.name + "' is already registered";
    }
    for (const auto& command : plugin.commands) {
      if (!conflict.empty()) {
        break;
      }
      const auto qualified = QualifiedToolName(plugin, command);
      if (tool_names.count(qualified) != 0) {
        conflict = "tool '" + qualified + "' is already registered";
      }
    }
    if (!conflict.empty()) {
      LogWarn("Dropping plugin '" + plugin.name + "' from " + plugin.executable_path + ": " +
              conflict);
      snapshot->failures.push_back({plugin.name, conflict});
      continue;
    }

    plugin_names.insert(plugin.name);
    for (const auto& command : plugin.commands) {
      tool_names.insert(QualifiedToolName(plugin, command));
    }
    accepted.push_back(std::move(plugin));
  }

  std::stable_sort(accepted.begin(), accepted.end(),
                   [](const Plugin& lhs, const Plugin& rhs) { return lhs.name < rhs.name; });
  for (std::size_t p = 0; p < accepted.size(); ++p) {
    for (std::size_t c = 0; c < accepted[p].commands.size(); ++c) {
      snapshot->tools.emplace(QualifiedToolName(accepted[p], accepted[p].commands[c]),
                              std::make_pair(p, c));
    }
  }
  snapshot->plugins = std::move(accepted);
  return snapshot;
}

PluginRegistry::PluginRegistry(IntrospectionOptions options)
    : options_(options),
      snapshot_(MakeSnapshot({}, {}, std::string{}, 0)) {}

std::shared_ptr<const RegistrySnapshot> PluginRegistry::Scan(const std::string& directory) {
  std::lock_guard<std::mutex> scan_lock(scan_mutex_);
  const auto started = std::chrono::steady_clock::now();

  std::vector<DiscoveryFailure> failures;
  const auto candidates = DiscoverCandidates(directory, &failures);

  std::vector<std::future<Plugin>> pending;
  pending.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    pending.push_back(std::async(std::launch::async, [candidate, options = options_] {
      return Introspect(candidate, options);
    }));
  }

  std::vector<Plugin> plugins;
  for (std::size_t i = 0; i < pending.size(); ++i) {
    try {
      plugins.push_back(pending[i].get());
    } catch (const IntrospectionError& ex) {
      LogWarn(std::string{"Excluding plugin: "} + ex.what());
      failures.push_back({candidates[i].name, ex.what()});
    } catch (const std::exception& ex) {
      LogWarn("Excluding plugin '" + candidates[i].name + "': " + ex.what());
      failures.push_back({candidates[i].name, ex.what()});
    }
  }

  auto snapshot = MakeSnapshot(std::move(plugins), std::move(failures), directory, ++generation_);
  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - started)
                              .count();
  LogInfo("Scanned " + directory + ": " + std::to_string(snapshot->PluginCount()) +
          " plugin(s), " + std::to_string(snapshot->ToolCount()) + " tool(s), " +
          std::to_string(snapshot->failures.size()) + " excluded in " +
          std::to_string(elapsed_ms) + " ms (generation " +
          std::to_string(snapshot->generation) + ")");
  Publish(snapshot);
  return snapshot;
}

void PluginRegistry::Publish(std::shared_ptr<const RegistrySnapshot> snapshot) {
  if (!snapshot) {
    throw std::invalid_argument("Registry snapshot must not be null");
  }
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = std::move(snapshot);
}

std::shared_ptr<const RegistrySnapshot> PluginRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

std::optional<ToolBinding> PluginRegistry::Lookup(const std::string& qualified_name) const {
  auto snapshot = Snapshot();
  const auto it = snapshot->tools.find(qualified_name);
  if (it == snapshot->tools.end()) {
    return std::nullopt;
  }
  ToolBinding binding;
  binding.plugin = &snapshot->plugins[it->second.first];
  binding.command = &binding.plugin->commands[it->second.second];
  binding.qualified_name = qualified_name;
  binding.snapshot = std::move(snapshot);
  return binding;
}

std::size_t PluginRegistry::Count() const { return Snapshot()->PluginCount(); }

}  // namespace gateway
