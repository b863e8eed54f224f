/// \file ParserTest.cpp
/// \brief 结构化语法分析器单元测试。
///
/// 覆盖机器标题、import 语句、节点定义（含嵌套与限定名）、边链、
/// 属性、注解以及错误恢复。

#include "machlink/Parser/Parser.h"
#include "machlink/Lexer/Lexer.h"
#include "machlink/Basic/Diagnostic.h"
#include "machlink/Basic/SourceManager.h"
#include <gtest/gtest.h>

namespace machlink {
namespace {

// ============================================================================
// 测试辅助类
// ============================================================================

class ParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        SM = std::make_unique<SourceManager>();
        Diag = std::make_unique<DiagnosticEngine>(*SM);
        auto consumer = std::make_unique<StoredDiagnosticConsumer>();
        Stored = consumer.get();
        Diag->setConsumer(std::move(consumer));
    }

    /// \brief 解析源码并返回根节点
    std::unique_ptr<MachineDecl> parse(const std::string& source) {
        auto fileID = SM->createBuffer(source, "test.dygram");
        Lexer lexer(*SM, *Diag, fileID);
        Parser parser(lexer, *Diag);
        auto machine = parser.parseMachine();
        HadErrors = parser.hasErrors();
        return machine;
    }

    std::unique_ptr<SourceManager> SM;
    std::unique_ptr<DiagnosticEngine> Diag;
    StoredDiagnosticConsumer* Stored = nullptr;
    bool HadErrors = false;
};

// ============================================================================
// 机器标题
// ============================================================================

TEST_F(ParserTest, MachineTitle) {
    auto machine = parse("machine \"Traffic Light\"\n");
    ASSERT_TRUE(machine->getTitle().has_value());
    EXPECT_EQ(*machine->getTitle(), "Traffic Light");
    EXPECT_FALSE(HadErrors);
}

TEST_F(ParserTest, EmptyFileHasNoTitle) {
    auto machine = parse("");
    EXPECT_FALSE(machine->getTitle().has_value());
    EXPECT_TRUE(machine->getNodes().empty());
    EXPECT_FALSE(HadErrors);
}

TEST_F(ParserTest, DuplicateTitleKeepsFirst) {
    auto machine = parse("machine \"One\"\nmachine \"Two\"\n");
    EXPECT_EQ(*machine->getTitle(), "One");
    EXPECT_EQ(Stored->count(DiagID::err_duplicate_machine_title), 1u);
}

// ============================================================================
// import
// ============================================================================

TEST_F(ParserTest, ImportWithAliases) {
    auto machine = parse(
        "import { Start, Group.Child as GC } from \"./lib.dygram\"\n"
        "import { Other } from 'https://example.com/x.dygram';\n");

    ASSERT_EQ(machine->getImports().size(), 2u);
    const ImportDecl* first = machine->getImports()[0].get();
    EXPECT_EQ(first->getPath(), "./lib.dygram");
    ASSERT_EQ(first->getSymbols().size(), 2u);

    const ImportedSymbol* start = first->getSymbols()[0].get();
    EXPECT_EQ(start->getName(), "Start");
    EXPECT_FALSE(start->hasAlias());
    EXPECT_EQ(start->getEffectiveName(), "Start");

    const ImportedSymbol* child = first->getSymbols()[1].get();
    EXPECT_EQ(child->getName(), "Group.Child");
    ASSERT_TRUE(child->hasAlias());
    EXPECT_EQ(*child->getAlias(), "GC");
    EXPECT_EQ(child->getEffectiveName(), "GC");
    EXPECT_EQ(child->getParent(), first);

    EXPECT_EQ(machine->getImports()[1]->getPath(), "https://example.com/x.dygram");
    EXPECT_FALSE(HadErrors);
}

TEST_F(ParserTest, ImportPathRangeCoversLiteral) {
    auto machine = parse("import { A } from \"./a.dygram\"");
    ASSERT_EQ(machine->getImports().size(), 1u);
    SourceRange range = machine->getImports()[0]->getPathRange();
    auto [line, column] = SM->getLineAndColumn(range.getBegin());
    EXPECT_EQ(line, 1u);
    EXPECT_EQ(column, 19u);
    EXPECT_EQ(range.getEnd().getOffset() - range.getBegin().getOffset(), 12u);
}

TEST_F(ParserTest, EmptyImportListIsAccepted) {
    auto machine = parse("import { } from \"./a.dygram\"");
    ASSERT_EQ(machine->getImports().size(), 1u);
    EXPECT_TRUE(machine->getImports()[0]->getSymbols().empty());
    EXPECT_FALSE(HadErrors);
}

TEST_F(ParserTest, TrailingCommaInImportList) {
    auto machine = parse("import { A, B, } from \"./a.dygram\"");
    ASSERT_EQ(machine->getImports().size(), 1u);
    EXPECT_EQ(machine->getImports()[0]->getSymbols().size(), 2u);
    EXPECT_FALSE(HadErrors);
}

TEST_F(ParserTest, ImportMissingFromIsReported) {
    auto machine = parse("import { A } \"./a.dygram\"\nStart\n");
    EXPECT_TRUE(machine->getImports().empty());
    EXPECT_EQ(Stored->count(DiagID::err_expected_token), 1u);
    ASSERT_EQ(machine->getNodes().size(), 1u);
    EXPECT_EQ(machine->getNodes()[0]->getName(), "Start");
}

TEST_F(ParserTest, ImportAfterDefinitionIsReported) {
    auto machine = parse("Start\nimport { A } from \"./a.dygram\"\n");
    EXPECT_EQ(Stored->count(DiagID::err_import_after_definition), 1u);
    EXPECT_EQ(machine->getImports().size(), 1u);
}

// ============================================================================
// 节点
// ============================================================================

TEST_F(ParserTest, TypedNodeWithTitle) {
    auto machine = parse("state Idle \"Waiting\"\n");
    ASSERT_EQ(machine->getNodes().size(), 1u);
    const NodeDecl* node = machine->getNodes()[0].get();
    EXPECT_EQ(node->getType(), "state");
    EXPECT_EQ(node->getName(), "Idle");
    ASSERT_TRUE(node->getTitle().has_value());
    EXPECT_EQ(*node->getTitle(), "Waiting");
}

TEST_F(ParserTest, UntypedNodesOnSeparateLines) {
    auto machine = parse("Start\nEnd\n");
    ASSERT_EQ(machine->getNodes().size(), 2u);
    EXPECT_EQ(machine->getNodes()[0]->getType(), "");
    EXPECT_EQ(machine->getNodes()[0]->getName(), "Start");
    EXPECT_EQ(machine->getNodes()[1]->getName(), "End");
}

TEST_F(ParserTest, NestedNodesAndQualifiedNames) {
    auto machine = parse(
        "state Group {\n"
        "    state Child\n"
        "    state Inner {\n"
        "        Leaf\n"
        "    }\n"
        "}\n");

    ASSERT_EQ(machine->getNodes().size(), 1u);
    const NodeDecl* group = machine->getNodes()[0].get();
    ASSERT_EQ(group->getChildren().size(), 2u);
    const NodeDecl* inner = group->getChildren()[1].get();
    ASSERT_EQ(inner->getChildren().size(), 1u);
    EXPECT_EQ(inner->getChildren()[0]->getQualifiedName(), "Group.Inner.Leaf");

    auto all = machine->getAllNodes();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0]->getName(), "Group");
    EXPECT_EQ(all[1]->getName(), "Child");
    EXPECT_EQ(all[2]->getName(), "Inner");
    EXPECT_EQ(all[3]->getName(), "Leaf");
    EXPECT_FALSE(HadErrors);
}

TEST_F(ParserTest, NodeAttributes) {
    auto machine = parse(
        "task Fetch {\n"
        "    url: \"https://api.example.com\"\n"
        "    retries: 3\n"
        "    timeout<Duration>: 30s\n"
        "}\n");

    const NodeDecl* node = machine->getNodes()[0].get();
    ASSERT_EQ(node->getAttributes().size(), 3u);
    EXPECT_EQ(node->getAttributes()[0].Name, "url");
    EXPECT_EQ(node->getAttributes()[0].Value, "https://api.example.com");
    EXPECT_EQ(node->getAttributes()[1].Value, "3");
    EXPECT_EQ(node->getAttributes()[2].Name, "timeout");
    EXPECT_EQ(node->getAttributes()[2].Value, "30s");
    EXPECT_FALSE(HadErrors);
}

TEST_F(ParserTest, TopLevelAttribute) {
    auto machine = parse("version: \"1.0\"\n");
    ASSERT_EQ(machine->getAttributes().size(), 1u);
    EXPECT_EQ(machine->getAttributes()[0].Name, "version");
    EXPECT_EQ(machine->getAttributes()[0].Value, "1.0");
    EXPECT_TRUE(machine->getNodes().empty());
}

TEST_F(ParserTest, AnnotationsAttachToFollowingNode) {
    auto machine = parse("@Async\nstate Worker @Retry(3)\n");
    ASSERT_EQ(machine->getNodes().size(), 1u);
    const auto& annotations = machine->getNodes()[0]->getAnnotations();
    ASSERT_EQ(annotations.size(), 2u);
    EXPECT_EQ(annotations[0], "@Async");
    EXPECT_EQ(annotations[1], "@Retry(3)");
}

// ============================================================================
// 边
// ============================================================================

TEST_F(ParserTest, SimpleEdge) {
    auto machine = parse("Start --> End\n");
    ASSERT_EQ(machine->getEdges().size(), 1u);
    const EdgeDecl* edge = machine->getEdges()[0].get();
    ASSERT_EQ(edge->getGroups().size(), 2u);
    ASSERT_EQ(edge->getArrows().size(), 1u);
    EXPECT_EQ(edge->getArrows()[0], "-->");
    EXPECT_EQ(edge->getGroups()[0][0].Name, "Start");
    EXPECT_EQ(edge->getGroups()[1][0].Name, "End");
    EXPECT_TRUE(machine->getNodes().empty());
}

TEST_F(ParserTest, EdgeChainWithGroups) {
    auto machine = parse("A, B -> C => D.E\n");
    ASSERT_EQ(machine->getEdges().size(), 1u);
    const EdgeDecl* edge = machine->getEdges()[0].get();
    ASSERT_EQ(edge->getGroups().size(), 3u);
    EXPECT_EQ(edge->getGroups()[0].size(), 2u);
    EXPECT_EQ(edge->getArrows()[1], "=>");

    auto refs = edge->getAllRefs();
    ASSERT_EQ(refs.size(), 4u);
    EXPECT_EQ(refs[3].Name, "D.E");
}

TEST_F(ParserTest, EdgeAttributeBlockIsSkipped) {
    auto machine = parse("A --> B { label: \"go\" }\nC\n");
    ASSERT_EQ(machine->getEdges().size(), 1u);
    ASSERT_EQ(machine->getNodes().size(), 1u);
    EXPECT_EQ(machine->getNodes()[0]->getName(), "C");
    EXPECT_FALSE(HadErrors);
}

TEST_F(ParserTest, EdgesInsideNodeBody) {
    auto machine = parse(
        "state Group {\n"
        "    Inner1 --> Inner2\n"
        "}\n"
        "Group --> Done\n");

    const NodeDecl* group = machine->getNodes()[0].get();
    ASSERT_EQ(group->getEdges().size(), 1u);
    EXPECT_EQ(group->getEdges()[0]->getParent(), group);
    EXPECT_EQ(machine->getAllEdges().size(), 2u);
}

// ============================================================================
// 错误恢复
// ============================================================================

TEST_F(ParserTest, MissingClosingBraceIsReported) {
    auto machine = parse("state Group {\n    Child\n");
    EXPECT_EQ(Stored->count(DiagID::err_expected_rbrace), 1u);
    ASSERT_EQ(machine->getNodes().size(), 1u);
    EXPECT_EQ(machine->getNodes()[0]->getChildren().size(), 1u);
}

TEST_F(ParserTest, UnexpectedTopLevelTokenRecovers) {
    auto machine = parse("-> \nStart\n");
    EXPECT_EQ(Stored->count(DiagID::err_unexpected_token), 1u);
    ASSERT_EQ(machine->getNodes().size(), 1u);
    EXPECT_EQ(machine->getNodes()[0]->getName(), "Start");
    EXPECT_TRUE(HadErrors);
}

TEST_F(ParserTest, EdgeMissingTargetRecovers) {
    auto machine = parse("A --> ;\nB\n");
    EXPECT_TRUE(HadErrors);
    EXPECT_EQ(Stored->count(DiagID::err_expected_identifier), 1u);
    EXPECT_TRUE(machine->getEdges().empty());
    ASSERT_EQ(machine->getNodes().size(), 1u);
    EXPECT_EQ(machine->getNodes()[0]->getName(), "B");
}

TEST_F(ParserTest, LexerErrorsCountAsParseErrors) {
    auto machine = parse("Start $\n");
    EXPECT_TRUE(HadErrors);
    ASSERT_EQ(machine->getNodes().size(), 1u);
}

} // namespace
} // namespace machlink
