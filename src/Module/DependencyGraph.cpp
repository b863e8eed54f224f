/// \file DependencyGraph.cpp
/// \brief 模块依赖图实现

#include "machlink/Module/DependencyGraph.h"
#include <algorithm>
#include <deque>

namespace machlink {

DependencyGraph::Node& DependencyGraph::getOrCreate(const ModuleId& id) {
    auto result = Nodes.insert(std::make_pair(id.str(), Node()));
    Node& node = result.first->second;
    if (result.second) {
        node.Id = id;
    }
    return node;
}

void DependencyGraph::addModule(const ModuleId& id) {
    getOrCreate(id);
}

void DependencyGraph::addDependency(const ModuleId& from, const ModuleId& to) {
    getOrCreate(to);
    getOrCreate(from).Dependencies.insert(to.str());
    Nodes.find(to.str())->second.Dependents.insert(from.str());
}

bool DependencyGraph::removeDependency(const ModuleId& from, const ModuleId& to) {
    auto fromIt = Nodes.find(from.str());
    auto toIt = Nodes.find(to.str());
    if (fromIt == Nodes.end() || toIt == Nodes.end()) {
        return false;
    }

    bool removed = fromIt->second.Dependencies.remove(to.str());
    toIt->second.Dependents.remove(from.str());
    return removed;
}

void DependencyGraph::removeModule(const ModuleId& id) {
    auto it = Nodes.find(id.str());
    if (it == Nodes.end()) {
        return;
    }

    const std::string& key = it->first;
    for (const std::string& dep : it->second.Dependencies) {
        auto depIt = Nodes.find(dep);
        if (depIt != Nodes.end()) {
            depIt->second.Dependents.remove(key);
        }
    }
    for (const std::string& dependent : it->second.Dependents) {
        auto depIt = Nodes.find(dependent);
        if (depIt != Nodes.end()) {
            depIt->second.Dependencies.remove(key);
        }
    }

    Nodes.erase(it);
}

std::vector<ModuleId> DependencyGraph::toIds(const KeySet& keys) const {
    std::vector<ModuleId> ids;
    ids.reserve(keys.size());
    for (const std::string& key : keys) {
        auto it = Nodes.find(key);
        if (it != Nodes.end()) {
            ids.push_back(it->second.Id);
        }
    }
    return ids;
}

std::vector<ModuleId> DependencyGraph::getDependencies(const ModuleId& id) const {
    const Node* node = getNode(id);
    return node ? toIds(node->Dependencies) : std::vector<ModuleId>();
}

std::vector<ModuleId> DependencyGraph::getDependents(const ModuleId& id) const {
    const Node* node = getNode(id);
    return node ? toIds(node->Dependents) : std::vector<ModuleId>();
}

std::vector<ModuleId> DependencyGraph::getAllModules() const {
    std::vector<ModuleId> ids;
    ids.reserve(Nodes.size());
    for (const auto& entry : Nodes) {
        ids.push_back(entry.second.Id);
    }
    return ids;
}

bool DependencyGraph::hasModule(const ModuleId& id) const {
    return Nodes.count(id.str()) > 0;
}

bool DependencyGraph::hasDependency(const ModuleId& from, const ModuleId& to) const {
    const Node* node = getNode(from);
    return node && node->Dependencies.count(to.str()) > 0;
}

const DependencyGraph::Node* DependencyGraph::getNode(const ModuleId& id) const {
    auto it = Nodes.find(id.str());
    return it == Nodes.end() ? nullptr : &it->second;
}

// ============================================================================
// 环检测
// ============================================================================

std::vector<std::vector<ModuleId>> DependencyGraph::detectCycles() const {
    std::vector<std::vector<ModuleId>> cycles;
    std::set<std::string> visited;
    std::vector<std::string> stack;
    std::set<std::string> onStack;

    for (const auto& entry : Nodes) {
        if (!visited.count(entry.first)) {
            findCycles(entry.first, visited, stack, onStack, cycles);
        }
    }
    return cycles;
}

void DependencyGraph::findCycles(const std::string& key, std::set<std::string>& visited,
                                 std::vector<std::string>& stack,
                                 std::set<std::string>& onStack,
                                 std::vector<std::vector<ModuleId>>& cycles) const {
    visited.insert(key);
    stack.push_back(key);
    onStack.insert(key);

    const Node& node = Nodes.find(key)->second;
    for (const std::string& dep : node.Dependencies) {
        if (onStack.count(dep)) {
            auto start = std::find(stack.begin(), stack.end(), dep);
            std::vector<ModuleId> cycle;
            for (auto it = start; it != stack.end(); ++it) {
                cycle.push_back(Nodes.find(*it)->second.Id);
            }
            cycle.push_back(Nodes.find(dep)->second.Id);
            cycles.push_back(std::move(cycle));
        } else if (!visited.count(dep)) {
            findCycles(dep, visited, stack, onStack, cycles);
        }
    }

    stack.pop_back();
    onStack.erase(key);
}

// ============================================================================
// 拓扑排序
// ============================================================================

std::optional<std::vector<ModuleId>> DependencyGraph::topologicalSort() const {
    if (!detectCycles().empty()) {
        return std::nullopt;
    }

    std::vector<ModuleId> order;
    order.reserve(Nodes.size());
    std::set<std::string> visited;
    for (const auto& entry : Nodes) {
        visitPostOrder(entry.first, visited, order);
    }
    return order;
}

void DependencyGraph::visitPostOrder(const std::string& key, std::set<std::string>& visited,
                                     std::vector<ModuleId>& order) const {
    if (!visited.insert(key).second) {
        return;
    }

    const Node& node = Nodes.find(key)->second;
    for (const std::string& dep : node.Dependencies) {
        visitPostOrder(dep, visited, order);
    }
    order.push_back(node.Id);
}

// ============================================================================
// 可达性
// ============================================================================

bool DependencyGraph::hasPath(const ModuleId& from, const ModuleId& to) const {
    std::set<std::string> visited;
    std::deque<std::string> queue = {from.str()};

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        if (current == to.str()) {
            return true;
        }
        if (!visited.insert(current).second) {
            continue;
        }

        auto it = Nodes.find(current);
        if (it != Nodes.end()) {
            for (const std::string& dep : it->second.Dependencies) {
                queue.push_back(dep);
            }
        }
    }
    return false;
}

} // namespace machlink
