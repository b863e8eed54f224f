/// \file DependencyGraph.h
/// \brief 模块依赖图 - 环检测、拓扑排序与可达性查询

#ifndef MACHLINK_MODULE_DEPENDENCYGRAPH_H
#define MACHLINK_MODULE_DEPENDENCYGRAPH_H

#include "machlink/Module/ModuleId.h"
#include "llvm/ADT/MapVector.h"
#include "llvm/ADT/SetVector.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace machlink {

/// \brief 模块之间的有向依赖图
///
/// 边 A -> B 表示 A 导入 B。每条记录在 A.Dependencies 中的边都同时以
/// A 的形式出现在 B.Dependents 中，所有修改操作都维护这一对称性。
/// 节点与集合都按插入顺序迭代，因此所有算法的结果是确定的。
class DependencyGraph {
public:
    /// \brief 按插入顺序迭代的规范名集合
    using KeySet = llvm::SetVector<std::string, std::vector<std::string>,
                                   std::set<std::string>>;

    /// \brief 图节点
    struct Node {
        ModuleId Id;
        KeySet Dependencies;    ///< 本模块导入的模块
        KeySet Dependents;      ///< 导入本模块的模块
    };

    /// \brief 添加模块（已存在时无操作）
    void addModule(const ModuleId& id);

    /// \brief 添加依赖边 from -> to，缺失的端点会自动加入
    void addDependency(const ModuleId& from, const ModuleId& to);

    /// \brief 删除依赖边，返回边是否存在
    bool removeDependency(const ModuleId& from, const ModuleId& to);

    /// \brief 删除模块及所有引用它的边（两个方向）
    void removeModule(const ModuleId& id);

    /// \brief 直接依赖（插入顺序），模块不存在时为空
    std::vector<ModuleId> getDependencies(const ModuleId& id) const;

    /// \brief 直接被依赖方（插入顺序），模块不存在时为空
    std::vector<ModuleId> getDependents(const ModuleId& id) const;

    std::vector<ModuleId> getAllModules() const;

    bool hasModule(const ModuleId& id) const;
    bool hasDependency(const ModuleId& from, const ModuleId& to) const;

    size_t size() const { return Nodes.size(); }
    bool empty() const { return Nodes.empty(); }
    void clear() { Nodes.clear(); }

    /// \brief 检测所有依赖环
    ///
    /// 深度优先搜索并维护递归栈；遇到栈中节点时，从该节点首次出现处到
    /// 当前节点的栈切片再追加该节点即为一个环。记录后继续遍历，因此
    /// 多个独立的环都会被报告。自依赖是长度为 1 的环 [A, A]。
    std::vector<std::vector<ModuleId>> detectCycles() const;

    /// \brief 拓扑排序：依赖在被依赖方之前
    /// \return 存在环时返回 std::nullopt
    std::optional<std::vector<ModuleId>> topologicalSort() const;

    /// \brief 沿依赖边是否存在 from 到 to 的路径（广度优先）
    bool hasPath(const ModuleId& from, const ModuleId& to) const;

    /// \brief 获取节点（测试与诊断使用）
    const Node* getNode(const ModuleId& id) const;

private:
    llvm::MapVector<std::string, Node, std::map<std::string, unsigned>> Nodes;

    Node& getOrCreate(const ModuleId& id);
    std::vector<ModuleId> toIds(const KeySet& keys) const;

    void findCycles(const std::string& key, std::set<std::string>& visited,
                    std::vector<std::string>& stack, std::set<std::string>& onStack,
                    std::vector<std::vector<ModuleId>>& cycles) const;

    void visitPostOrder(const std::string& key, std::set<std::string>& visited,
                        std::vector<ModuleId>& order) const;
};

} // namespace machlink

#endif // MACHLINK_MODULE_DEPENDENCYGRAPH_H
