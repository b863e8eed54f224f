/// \file MergedMachineJSON.cpp
/// \brief 合并结果的 JSON 序列化

#include "machlink/Merge/MergedMachineJSON.h"
#include "machlink/Merge/ModuleMerger.h"

namespace machlink {

namespace {

nlohmann::json attributesToJSON(const std::vector<Attribute>& attributes) {
    nlohmann::json result = nlohmann::json::array();
    for (const Attribute& attr : attributes) {
        result.push_back({{"name", attr.Name}, {"value", attr.Value}});
    }
    return result;
}

void appendEdges(nlohmann::json& out, const EdgeDecl& edge) {
    for (const auto& entry : edgeToJSON(edge)) {
        out.push_back(entry);
    }
}

} // anonymous namespace

nlohmann::json edgeToJSON(const EdgeDecl& edge) {
    nlohmann::json result = nlohmann::json::array();
    const auto& groups = edge.getGroups();
    const auto& arrows = edge.getArrows();

    for (size_t i = 0; i + 1 < groups.size(); ++i) {
        const std::string arrow = i < arrows.size() ? arrows[i] : "->";
        for (const NodeRef& source : groups[i]) {
            for (const NodeRef& target : groups[i + 1]) {
                result.push_back({{"source", source.Name},
                                  {"target", target.Name},
                                  {"arrow", arrow}});
            }
        }
    }
    return result;
}

nlohmann::json nodeToJSON(const NodeDecl& node) {
    nlohmann::json result;
    result["name"] = node.getName();
    result["type"] = node.getType();
    if (node.getTitle()) {
        result["title"] = *node.getTitle();
    }
    result["annotations"] = node.getAnnotations();
    result["attributes"] = attributesToJSON(node.getAttributes());

    nlohmann::json children = nlohmann::json::array();
    for (const auto& child : node.getChildren()) {
        children.push_back(nodeToJSON(*child));
    }
    result["nodes"] = std::move(children);

    nlohmann::json edges = nlohmann::json::array();
    for (const auto& edge : node.getEdges()) {
        appendEdges(edges, *edge);
    }
    result["edges"] = std::move(edges);
    return result;
}

nlohmann::json toJSON(const MergedMachine& merged) {
    const MachineDecl& machine = *merged.Machine;
    nlohmann::json result;

    result["title"] = machine.getTitle() ? nlohmann::json(*machine.getTitle())
                                         : nlohmann::json(nullptr);
    result["attributes"] = attributesToJSON(machine.getAttributes());

    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : machine.getNodes()) {
        nodes.push_back(nodeToJSON(*node));
    }
    result["nodes"] = std::move(nodes);

    nlohmann::json edges = nlohmann::json::array();
    for (const auto& edge : machine.getEdges()) {
        appendEdges(edges, *edge);
    }
    result["edges"] = std::move(edges);

    nlohmann::json sourceMap = nlohmann::json::object();
    for (const auto& entry : merged.SourceMap) {
        nlohmann::json info;
        info["sourceFile"] = entry.second.SourceFile;
        if (entry.second.OriginalName) {
            info["originalName"] = *entry.second.OriginalName;
        }
        sourceMap[entry.first] = std::move(info);
    }
    result["sourceMap"] = std::move(sourceMap);

    result["_metadata"] = {
        {"sourceFiles", merged.SourceFiles},
        {"entryPoint", merged.SourceFiles.empty() ? std::string() : merged.getEntryPoint()},
        {"multiFile", true},
    };
    return result;
}

std::string toJSONString(const MergedMachine& merged, int indent) {
    // 源码中的非法 UTF-8 字节以替换字符输出，而不是抛出异常
    return toJSON(merged).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace machlink
