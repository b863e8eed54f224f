/// \file Module.cpp
/// \brief 模块语法分析

#include "machlink/Module/Module.h"
#include "machlink/Basic/Diagnostic.h"
#include "machlink/Lexer/Lexer.h"
#include "machlink/Parser/Parser.h"

namespace machlink {

ModuleParseResult parseModule(const ModuleId& id, const std::string& content,
                              SourceManager& sm, std::optional<ModuleId> fromModule) {
    ModuleParseResult result;
    SourceManager::FileID fileID = sm.createBuffer(content, id.getLocation());

    DiagnosticEngine diag(sm);
    auto consumer = std::make_unique<StoredDiagnosticConsumer>();
    StoredDiagnosticConsumer* stored = consumer.get();
    diag.setConsumer(std::move(consumer));

    Lexer lexer(sm, diag, fileID);
    Parser parser(lexer, diag);
    std::unique_ptr<MachineDecl> machine = parser.parseMachine();

    result.ErrorCount = diag.getErrorCount();
    if (parser.hasErrors() || !machine) {
        std::string detail = "syntax error";
        for (const Diagnostic& d : stored->getDiagnostics()) {
            if (d.getLevel() != DiagnosticLevel::Error &&
                d.getLevel() != DiagnosticLevel::Fatal) {
                continue;
            }
            auto [line, column] = sm.getLineAndColumn(d.getLocation());
            detail = std::to_string(line) + ":" + std::to_string(column) + ": " +
                     d.getMessage();
            break;
        }
        result.Error = ImportError::moduleParse(id.getLocation(), detail,
                                                std::move(fromModule));
        return result;
    }

    result.Mod = std::make_unique<Module>(id, std::move(machine), content, fileID);
    return result;
}

} // namespace machlink
