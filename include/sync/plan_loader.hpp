#pragma once

#include "sync/sync_plan.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct PlanDocument {
    std::string name;
    std::vector<SyncTask> tasks;
};

// Plan files: {"name": ..., "tasks": [{"name", "type", "strategy",
// "source", "target", "options"}]}. Task options are layered over
// `defaults`. Throws SyncError (CONFIGURATION) on any malformed entry.
PlanDocument parsePlan(const nlohmann::json& j, const SyncOptions& defaults = SyncOptions());
PlanDocument loadPlanFile(const std::string& path, const SyncOptions& defaults = SyncOptions());

Endpoint endpointFromJson(const nlohmann::json& j);
// Credentials are left out unless `includeSecrets` is set.
nlohmann::json endpointToJson(const Endpoint& endpoint, bool includeSecrets = false);
