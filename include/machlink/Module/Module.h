/// \file Module.h
/// \brief 已加载的模块 - 一个文件的标识、AST 与原始内容

#ifndef MACHLINK_MODULE_MODULE_H
#define MACHLINK_MODULE_MODULE_H

#include "machlink/AST/AST.h"
#include "machlink/Basic/SourceManager.h"
#include "machlink/Module/ImportError.h"
#include "machlink/Module/ModuleId.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace machlink {

/// \brief 已加载的模块
///
/// 首次加载时创建，更新时整体替换（从不原地修改），显式移除时销毁。
/// 模块拥有自己的 AST；合并输出只持有其中节点的克隆。
class Module {
public:
    Module(ModuleId id, std::unique_ptr<MachineDecl> machine, std::string rawContent,
           SourceManager::FileID fileID)
        : Id(std::move(id)), Machine(std::move(machine)),
          RawContent(std::move(rawContent)), FileID(fileID) {}

    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;

    const ModuleId& getId() const { return Id; }
    const MachineDecl* getMachine() const { return Machine.get(); }
    const std::string& getRawContent() const { return RawContent; }

    /// \brief 模块内容在 SourceManager 中的缓冲区
    SourceManager::FileID getFileID() const { return FileID; }

    /// \brief import 语句（声明顺序）
    const std::vector<std::unique_ptr<ImportDecl>>& getImports() const {
        return Machine->getImports();
    }

private:
    ModuleId Id;
    std::unique_ptr<MachineDecl> Machine;
    std::string RawContent;
    SourceManager::FileID FileID;
};

/// \brief 模块语法分析结果
struct ModuleParseResult {
    std::unique_ptr<Module> Mod;        ///< 成功时非空
    std::optional<ImportError> Error;   ///< 失败时为 ModuleParseError
    unsigned ErrorCount = 0;            ///< 词法/语法错误数
};

/// \brief 语法分析模块内容
///
/// 内容以模块位置为名称载入 \p sm，诊断收集在局部引擎中：任何词法或
/// 语法错误都使结果失败，第一个错误以 "行:列: 信息" 的形式写入
/// ModuleParseError 的详情。
ModuleParseResult parseModule(const ModuleId& id, const std::string& content,
                              SourceManager& sm,
                              std::optional<ModuleId> fromModule = std::nullopt);

} // namespace machlink

#endif // MACHLINK_MODULE_MODULE_H
