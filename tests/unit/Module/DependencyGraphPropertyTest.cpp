/// \file DependencyGraphPropertyTest.cpp
/// \brief 依赖图属性测试
///
/// 在随机生成的图上验证：边的对称性、无环图的拓扑序满足所有边、
/// 有环图不产生拓扑序，以及环检测结果本身都是真实的环。

#include "machlink/Module/DependencyGraph.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <random>
#include <set>
#include <utility>

namespace machlink {
namespace {

class DependencyGraphPropertyTest : public ::testing::Test {
protected:
    static ModuleId moduleAt(int index) {
        return ModuleId::forVirtual("/m" + std::to_string(index) + ".dygram");
    }

    /// 随机 DAG：只生成 i -> j (i > j) 的边
    static DependencyGraph randomDAG(std::mt19937& gen, int numModules, int numEdges) {
        DependencyGraph graph;
        std::uniform_int_distribution<int> dist(0, numModules - 1);
        for (int i = 0; i < numModules; ++i) {
            graph.addModule(moduleAt(i));
        }
        for (int e = 0; e < numEdges; ++e) {
            int a = dist(gen);
            int b = dist(gen);
            if (a == b) {
                continue;
            }
            graph.addDependency(moduleAt(std::max(a, b)), moduleAt(std::min(a, b)));
        }
        return graph;
    }

    /// 随机有向图，可能含环与自环
    static DependencyGraph randomGraph(std::mt19937& gen, int numModules, int numEdges) {
        DependencyGraph graph;
        std::uniform_int_distribution<int> dist(0, numModules - 1);
        for (int e = 0; e < numEdges; ++e) {
            graph.addDependency(moduleAt(dist(gen)), moduleAt(dist(gen)));
        }
        return graph;
    }

    static std::set<std::pair<std::string, std::string>> edgeSet(const DependencyGraph& graph) {
        std::set<std::pair<std::string, std::string>> edges;
        for (const ModuleId& id : graph.getAllModules()) {
            for (const ModuleId& dep : graph.getDependencies(id)) {
                edges.insert({id.str(), dep.str()});
            }
        }
        return edges;
    }
};

/// 属性：每条依赖边都有对应的反向边
TEST_F(DependencyGraphPropertyTest, EdgesAreSymmetric) {
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> dist(0, 9);

    for (int iter = 0; iter < 50; ++iter) {
        DependencyGraph graph;
        for (int e = 0; e < 30; ++e) {
            int a = dist(gen);
            int b = dist(gen);
            if (dist(gen) < 2) {
                graph.removeDependency(moduleAt(a), moduleAt(b));
            } else {
                graph.addDependency(moduleAt(a), moduleAt(b));
            }
        }
        if (dist(gen) < 5) {
            graph.removeModule(moduleAt(dist(gen)));
        }

        for (const ModuleId& id : graph.getAllModules()) {
            for (const ModuleId& dep : graph.getDependencies(id)) {
                auto dependents = graph.getDependents(dep);
                EXPECT_NE(std::find(dependents.begin(), dependents.end(), id),
                          dependents.end());
            }
            for (const ModuleId& dependent : graph.getDependents(id)) {
                EXPECT_TRUE(graph.hasDependency(dependent, id));
            }
        }
    }
}

/// 属性：无环图的拓扑序包含全部模块，且每条边的依赖排在前面
TEST_F(DependencyGraphPropertyTest, TopologicalOrderRespectsEdges) {
    std::mt19937 gen(42);

    for (int iter = 0; iter < 100; ++iter) {
        DependencyGraph graph = randomDAG(gen, 12, 25);
        ASSERT_TRUE(graph.detectCycles().empty());

        auto order = graph.topologicalSort();
        ASSERT_TRUE(order.has_value());
        ASSERT_EQ(order->size(), graph.size());

        std::map<std::string, size_t> position;
        for (size_t i = 0; i < order->size(); ++i) {
            position[(*order)[i].str()] = i;
        }
        for (const ModuleId& id : graph.getAllModules()) {
            for (const ModuleId& dep : graph.getDependencies(id)) {
                EXPECT_LT(position[dep.str()], position[id.str()]);
                EXPECT_TRUE(graph.hasPath(id, dep));
            }
        }
    }
}

/// 属性：加入一条回边后检测到环，拓扑排序失败，且每个环首尾相同、
/// 相邻元素之间都有边
TEST_F(DependencyGraphPropertyTest, BackEdgeCreatesDetectableCycle) {
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> dist(0, 11);

    for (int iter = 0; iter < 100; ++iter) {
        DependencyGraph graph = randomDAG(gen, 12, 25);

        // 选取一条已有路径 from ->* to，再加入 to -> from
        int from = dist(gen);
        auto deps = graph.getDependencies(moduleAt(from));
        if (deps.empty()) {
            continue;
        }
        graph.addDependency(deps.front(), moduleAt(from));

        auto cycles = graph.detectCycles();
        ASSERT_FALSE(cycles.empty());
        EXPECT_FALSE(graph.topologicalSort().has_value());

        for (const auto& cycle : cycles) {
            ASSERT_GE(cycle.size(), 2u);
            EXPECT_EQ(cycle.front(), cycle.back());
            for (size_t i = 0; i + 1 < cycle.size(); ++i) {
                EXPECT_TRUE(graph.hasDependency(cycle[i], cycle[i + 1]));
            }
        }
    }
}

/// 属性：拓扑排序为空当且仅当检测到环；环检测结果可重复
TEST_F(DependencyGraphPropertyTest, SortFailsExactlyWhenCyclic) {
    std::mt19937 gen(42);

    for (int iter = 0; iter < 100; ++iter) {
        DependencyGraph graph = randomGraph(gen, 8, 10);
        auto cycles = graph.detectCycles();
        EXPECT_EQ(graph.topologicalSort().has_value(), cycles.empty());
        EXPECT_EQ(graph.detectCycles(), cycles);
    }
}

/// 属性：删除模块后按原有边重新加入，得到相同的边集
TEST_F(DependencyGraphPropertyTest, RemoveThenReAddRestoresEdges) {
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> pick(0, 9);

    for (int iter = 0; iter < 50; ++iter) {
        DependencyGraph graph = randomGraph(gen, 10, 20);
        ModuleId victim = moduleAt(pick(gen));
        if (!graph.hasModule(victim)) {
            continue;
        }

        auto before = edgeSet(graph);
        auto dependencies = graph.getDependencies(victim);
        auto dependents = graph.getDependents(victim);

        graph.removeModule(victim);
        EXPECT_FALSE(graph.hasModule(victim));
        for (const ModuleId& id : graph.getAllModules()) {
            EXPECT_FALSE(graph.hasDependency(id, victim));
        }

        graph.addModule(victim);
        for (const ModuleId& dep : dependencies) {
            graph.addDependency(victim, dep);
        }
        for (const ModuleId& dependent : dependents) {
            graph.addDependency(dependent, victim);
        }
        EXPECT_EQ(edgeSet(graph), before);
    }
}

} // namespace
} // namespace machlink
