/// \file ModuleId.h
/// \brief 模块标识 - 统一文件路径、URL 与虚拟路径的规范名称

#ifndef MACHLINK_MODULE_MODULEID_H
#define MACHLINK_MODULE_MODULEID_H

#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace machlink {

/// \brief 模块的规范标识
///
/// 规范形式：
/// - 文件：`file://<绝对、词法规范化的路径>`
/// - 远程：URL 本身（scheme 与 host 小写）
/// - 虚拟：`vfs://<绝对、规范化的 posix 路径>`
///
/// 两个 ModuleId 相等当且仅当规范字符串相等。
class ModuleId {
public:
    enum class Kind {
        Invalid,
        File,
        URL,
        Virtual
    };

    ModuleId() = default;

    /// \brief 由文件系统路径构造（相对路径基于当前工作目录）
    static ModuleId forFile(const std::string& path);

    /// \brief 由 http(s) URL 构造
    static ModuleId forURL(const std::string& url);

    /// \brief 由虚拟文件系统路径构造（相对路径基于 "/"）
    static ModuleId forVirtual(const std::string& path);

    /// \brief 解析规范字符串；无法识别的形式返回 std::nullopt
    static std::optional<ModuleId> fromString(const std::string& str);

    Kind getKind() const { return IdKind; }
    bool isValid() const { return IdKind != Kind::Invalid; }
    bool isFile() const { return IdKind == Kind::File; }
    bool isURL() const { return IdKind == Kind::URL; }
    bool isVirtual() const { return IdKind == Kind::Virtual; }

    /// \brief 规范字符串
    const std::string& str() const { return Canonical; }

    /// \brief 位置：文件/虚拟路径，或 URL
    const std::string& getLocation() const { return Location; }

    /// \brief 位置的最后一段（用于循环依赖信息）
    std::string getFileName() const;

    bool operator==(const ModuleId& other) const { return Canonical == other.Canonical; }
    bool operator!=(const ModuleId& other) const { return Canonical != other.Canonical; }
    bool operator<(const ModuleId& other) const { return Canonical < other.Canonical; }

private:
    ModuleId(Kind kind, std::string location, std::string canonical)
        : IdKind(kind), Location(std::move(location)), Canonical(std::move(canonical)) {}

    Kind IdKind = Kind::Invalid;
    std::string Location;
    std::string Canonical;
};

inline std::ostream& operator<<(std::ostream& os, const ModuleId& id) {
    return os << id.str();
}

/// \brief 导入路径是否为 http:// 或 https:// URL
bool isURLImportPath(const std::string& importPath);

/// \brief 导入路径是否为相对路径（./ 或 ../）
bool isRelativeImportPath(const std::string& importPath);

/// \brief 导入路径是否为裸绝对路径（以单个 '/' 开头）
bool isAbsoluteImportPath(const std::string& importPath);

} // namespace machlink

namespace std {
template <>
struct hash<machlink::ModuleId> {
    size_t operator()(const machlink::ModuleId& id) const {
        return hash<string>()(id.str());
    }
};
} // namespace std

#endif // MACHLINK_MODULE_MODULEID_H
