/// \file ImportError.h
/// \brief 导入错误 - 模块解析、链接与合并共用的错误类型

#ifndef MACHLINK_MODULE_IMPORTERROR_H
#define MACHLINK_MODULE_IMPORTERROR_H

#include "machlink/Basic/DiagnosticIDs.h"
#include "machlink/Basic/SourceLocation.h"
#include "machlink/Module/ModuleId.h"
#include <optional>
#include <string>
#include <vector>

namespace machlink {

class ASTNode;
class DiagnosticEngine;

/// \brief 导入错误
///
/// 值类型，不作为异常抛出。每个错误携带：出错的导入路径、发起导入的
/// 模块（已知时）、触发错误的 AST 节点（可用时）以及对应的诊断 ID，
/// 可以直接通过 DiagnosticEngine 报告。
class ImportError {
public:
    enum class Kind {
        ModuleNotFound,         ///< 没有解析器能定位导入目标
        CircularDependency,     ///< 存在可达的依赖环
        SymbolNotFound,         ///< 模块已解析但缺少（或有歧义的）符号
        SymbolCollision,        ///< 两个导入（或导入与本地定义）有效名称相同
        ModuleParse,            ///< 解析到的内容无法语法分析
        URLImport               ///< 网络获取失败
    };

    // =========================================================================
    // 构造
    // =========================================================================

    static ImportError moduleNotFound(const std::string& importPath,
                                      std::optional<ModuleId> fromModule);

    /// \param cycle 闭合路径，首尾为同一模块
    static ImportError circularDependency(std::vector<ModuleId> cycle);

    static ImportError symbolNotFound(const std::string& symbolName,
                                      const std::string& importPath,
                                      std::optional<ModuleId> fromModule);

    /// \brief 限定名的短名称匹配到多个定义
    static ImportError ambiguousSymbol(const std::string& symbolName,
                                       const std::string& importPath,
                                       const std::vector<std::string>& candidates,
                                       std::optional<ModuleId> fromModule);

    /// \brief 两个导入产生相同的有效名称
    static ImportError symbolCollision(const std::string& effectiveName,
                                       const std::string& firstImportPath,
                                       const std::string& secondImportPath,
                                       std::optional<ModuleId> fromModule);

    /// \brief 导入的有效名称与本地节点冲突
    static ImportError collidesWithLocal(const std::string& effectiveName,
                                         const std::string& localName,
                                         const std::string& importPath,
                                         std::optional<ModuleId> fromModule);

    static ImportError moduleParse(const std::string& importPath,
                                   const std::string& detail,
                                   std::optional<ModuleId> fromModule);

    /// \param status HTTP 状态码；传输层失败时为空
    static ImportError urlImport(const std::string& url, std::optional<long> status,
                                 const std::string& detail,
                                 std::optional<ModuleId> fromModule);

    // =========================================================================
    // 附加信息
    // =========================================================================

    /// \brief 设置触发错误的 AST 节点及其属性名
    ImportError& setNode(const ASTNode* node, const std::string& property);

    ImportError& setLocation(SourceLocation loc) {
        Loc = loc;
        return *this;
    }

    // =========================================================================
    // 访问
    // =========================================================================

    Kind getKind() const { return ErrorKind; }
    DiagID getDiagID() const { return ID; }

    const std::string& getImportPath() const { return ImportPath; }
    const std::optional<ModuleId>& getFromModule() const { return FromModule; }

    const ASTNode* getNode() const { return Node; }
    const std::string& getProperty() const { return Property; }
    SourceLocation getLocation() const { return Loc; }

    /// \brief 相关的符号名（SymbolNotFound / SymbolCollision）
    const std::string& getSymbolName() const { return SymbolName; }

    /// \brief 冲突的另一条导入路径，或冲突的本地节点名
    const std::string& getConflictingName() const { return ConflictingName; }

    const std::vector<ModuleId>& getCycle() const { return Cycle; }
    const std::optional<long>& getHTTPStatus() const { return HTTPStatus; }
    const std::string& getDetail() const { return Detail; }

    /// \brief 格式化后的错误信息
    std::string getMessage() const;

    /// \brief 通过诊断引擎报告此错误
    void report(DiagnosticEngine& diag) const;

    /// \brief 将依赖环格式化为 "a.dygram → b.dygram → a.dygram"
    static std::string formatCycle(const std::vector<ModuleId>& cycle);

private:
    ImportError(Kind kind, DiagID id) : ErrorKind(kind), ID(id) {}

    Kind ErrorKind;
    DiagID ID;
    std::vector<std::string> Args;

    std::string ImportPath;
    std::optional<ModuleId> FromModule;
    const ASTNode* Node = nullptr;
    std::string Property;
    SourceLocation Loc;

    std::string SymbolName;
    std::string ConflictingName;
    std::vector<ModuleId> Cycle;
    std::optional<long> HTTPStatus;
    std::string Detail;
};

/// \brief 获取错误类型名称，例如 "ModuleNotFoundError"
const char* getImportErrorKindName(ImportError::Kind kind);

} // namespace machlink

#endif // MACHLINK_MODULE_IMPORTERROR_H
