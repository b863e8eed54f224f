/// \file MergedMachineJSON.h
/// \brief 合并结果的 JSON 表示

#ifndef MACHLINK_MERGE_MERGEDMACHINEJSON_H
#define MACHLINK_MERGE_MERGEDMACHINEJSON_H

#include <nlohmann/json.hpp>
#include <string>

namespace machlink {

struct MergedMachine;
class NodeDecl;
class EdgeDecl;

/// \brief 将合并后的机器序列化为 JSON
///
/// 结构：
/// \code
/// {
///   "title": "...",
///   "attributes": [{"name": ..., "value": ...}],
///   "nodes": [{"name", "type", "title"?, "annotations", "attributes", "nodes", "edges"}],
///   "edges": [{"source": "A", "target": "B", "arrow": "-->"}],
///   "sourceMap": {"A": {"sourceFile": "...", "originalName"?: "..."}},
///   "_metadata": {"sourceFiles": [...], "entryPoint": "...", "multiFile": true}
/// }
/// \endcode
nlohmann::json toJSON(const MergedMachine& merged);

/// \brief 单个节点（含子节点与节点体内的边）
nlohmann::json nodeToJSON(const NodeDecl& node);

/// \brief 边链展开为逐段的 source/target 对
nlohmann::json edgeToJSON(const EdgeDecl& edge);

/// \brief 序列化为字符串
std::string toJSONString(const MergedMachine& merged, int indent = 2);

} // namespace machlink

#endif // MACHLINK_MERGE_MERGEDMACHINEJSON_H
