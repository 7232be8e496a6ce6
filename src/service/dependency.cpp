#include "qapp/dependency.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <set>

namespace qapp {

Result<DependencyGraph> discover_dependency_graph(Supervisor& supervisor,
                                                  const std::string& root,
                                                  const std::string& app_name) {
    DependencyGraph graph;
    std::string prefix = app_name + PREFIX_SEPARATOR;

    std::set<std::string> visited{root};
    std::deque<std::string> pending{root};
    graph.nodes.push_back(root);

    while (!pending.empty()) {
        std::string service = pending.front();
        pending.pop_front();

        auto deps = supervisor.dependencies(service);
        if (deps.isErr()) {
            return Result<DependencyGraph>::err(deps.error());
        }

        auto& edges = graph.edges[service];
        for (const auto& dep : deps.value()) {
            if (dep == service) continue;
            if (dep.compare(0, prefix.size(), prefix) != 0) {
                spdlog::debug("{}: ignoring foreign dependency {}", service, dep);
                continue;
            }
            if (std::find(edges.begin(), edges.end(), dep) != edges.end()) continue;

            edges.push_back(dep);
            if (visited.insert(dep).second) {
                graph.nodes.push_back(dep);
                pending.push_back(dep);
            }
        }
    }

    return Result<DependencyGraph>::ok(graph);
}

Result<std::vector<std::string>> restart_order(const DependencyGraph& graph,
                                               const std::string& root) {
    std::map<std::string, size_t> in_degree;
    for (const auto& node : graph.nodes) {
        in_degree[node];
    }
    for (const auto& [node, deps] : graph.edges) {
        in_degree[node];
        for (const auto& dep : deps) {
            ++in_degree[dep];
        }
    }

    // Dependents before dependencies, declaration order among siblings
    std::deque<std::string> ready;
    for (const auto& node : graph.nodes) {
        if (in_degree[node] == 0) ready.push_back(node);
    }

    std::vector<std::string> order;
    while (!ready.empty()) {
        std::string node = ready.front();
        ready.pop_front();
        order.push_back(node);

        auto it = graph.edges.find(node);
        if (it == graph.edges.end()) continue;
        for (const auto& dep : it->second) {
            if (--in_degree[dep] == 0) ready.push_back(dep);
        }
    }

    if (order.size() != in_degree.size()) {
        std::string cycle;
        for (const auto& [node, degree] : in_degree) {
            if (degree == 0) continue;
            if (!cycle.empty()) cycle += ", ";
            cycle += node;
        }
        return Result<std::vector<std::string>>::err(Error(ErrorCode::DEPENDENCY_ERROR,
            "dependency cycle detected from " + root + " involving: " + cycle));
    }

    std::reverse(order.begin(), order.end());
    return Result<std::vector<std::string>>::ok(order);
}

Result<std::vector<std::string>> resolve_restart_order(Supervisor& supervisor,
                                                       const std::string& main_service,
                                                       const std::string& app_name) {
    auto graph = discover_dependency_graph(supervisor, main_service, app_name);
    if (graph.isErr()) {
        return Result<std::vector<std::string>>::err(graph.error());
    }

    auto order = restart_order(graph.value(), main_service);
    if (order.isOk()) {
        spdlog::debug("restart order for {}: {} service(s)", main_service, order.value().size());
    }
    return order;
}

} // namespace qapp
