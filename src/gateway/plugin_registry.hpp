#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gateway/plugin_introspector.hpp"
#include "gateway/plugin_model.hpp"

namespace gateway {

struct DiscoveryFailure {
  std::string plugin;
  std::string reason;
};

// Immutable once published. Readers hold it through shared_ptr, so a rescan
// never invalidates a lookup that is still in use.
struct RegistrySnapshot {
  std::vector<Plugin> plugins;
  // qualified tool name -> (plugin index, command index)
  std::map<std::string, std::pair<std::size_t, std::size_t>> tools;
  std::vector<DiscoveryFailure> failures;
  std::string directory;
  std::uint64_t generation = 0;
  std::chrono::system_clock::time_point scanned_at;

  std::size_t PluginCount() const { return plugins.size(); }
  std::size_t ToolCount() const { return tools.size(); }
};

struct ToolBinding {
  std::shared_ptr<const RegistrySnapshot> snapshot;
  const Plugin* plugin = nullptr;
  const Command* command = nullptr;
  std::string qualified_name;
};

// Lists launchable plugin entry points in `directory`, in lexical order.
std::vector<PluginCandidate> DiscoverCandidates(const std::string& directory,
                                                std::vector<DiscoveryFailure>* failures);

// Applies first-registered-wins to `plugins` (in registration order) and
// indexes the survivors. Rejected plugins are appended to `failures`.
std::shared_ptr<const RegistrySnapshot> MakeSnapshot(std::vector<Plugin> plugins,
                                                     std::vector<DiscoveryFailure> failures,
                                                     std::string directory,
                                                     std::uint64_t generation);

class PluginRegistry {
 public:
  explicit PluginRegistry(IntrospectionOptions options = {});

  PluginRegistry(const PluginRegistry&) = delete;
  PluginRegistry& operator=(const PluginRegistry&) = delete;

  std::shared_ptr<const RegistrySnapshot> Scan(const std::string& directory);
  void Publish(std::shared_ptr<const RegistrySnapshot> snapshot);

  std::shared_ptr<const RegistrySnapshot> Snapshot() const;
  std::optional<ToolBinding> Lookup(const std::string& qualified_name) const;
  std::size_t Count() const;

 private:
  IntrospectionOptions options_;
  std::mutex scan_mutex_;
  std::uint64_t generation_ = 0;
  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const RegistrySnapshot> snapshot_;
};

}  // namespace gateway
