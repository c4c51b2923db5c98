#pragma once

#include "sync/sync_config.hpp"
#include <string>

// Print the top-level usage information
void printSyncUsage();

// "run <plan.json>": executes the plan, printing events as JSON lines
int runMain(int argc, char* argv[], const SyncConfig& config);

// "verify <plan.json>": verifies every task without syncing
int verifyMain(int argc, char* argv[], const SyncConfig& config);

// "strategies": lists the registered strategies and their capabilities
int strategiesMain(const SyncConfig& config);
