#pragma once

#include "qapp/supervisor.hpp"
#include "qapp/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace qapp {

// ============================================================================
// Dependency Resolution
// ============================================================================

// Service -> services it depends on, in declaration order
struct DependencyGraph {
    std::vector<std::string> nodes;  // discovery order, root first
    std::map<std::string, std::vector<std::string>> edges;
};

// Walk the supervisor's declared dependencies from `root`, keeping only
// services whose name starts with "{app}--". Self references are dropped.
Result<DependencyGraph> discover_dependency_graph(Supervisor& supervisor,
                                                  const std::string& root,
                                                  const std::string& app_name);

// Reversed Kahn order: dependencies first, `root` last.
// DEPENDENCY_ERROR naming the services involved when the graph has a cycle.
Result<std::vector<std::string>> restart_order(const DependencyGraph& graph,
                                               const std::string& root);

/**
 * Order in which the application's services must be restarted.
 *
 * For main -> {A, B} and B -> C the result is [C, B, A, main].
 * Services outside the application prefix are never included.
 */
Result<std::vector<std::string>> resolve_restart_order(Supervisor& supervisor,
                                                       const std::string& main_service,
                                                       const std::string& app_name);

} // namespace qapp
