#pragma once

#include <string>

#include "gateway/plugin_model.hpp"
#include "gateway/plugin_registry.hpp"
#include "nlohmann/json.hpp"

namespace gateway {

// JSON-Schema object describing a command's arguments. Never fails: a
// parameter of unknown type becomes an unconstrained property.
nlohmann::json BuildInputSchema(const Command& command);

nlohmann::json BuildToolJson(const Plugin& plugin, const Command& command);

// {"tools": [...]} ordered by (plugin name, command name).
nlohmann::json BuildManifest(const RegistrySnapshot& snapshot);

}  // namespace gateway
