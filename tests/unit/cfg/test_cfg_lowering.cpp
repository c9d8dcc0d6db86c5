// tests/unit/cfg/test_cfg_lowering.cpp - AST to CFG lowering (before pruning)
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cfgc/cfg/cfg_lowering.hpp"
#include "cfgc/test_support/parse_helpers.hpp"

using namespace cfgc;

namespace
{

Program lower_source(const std::string & src)
{
  auto parsed = test_support::parse(src);
  EXPECT_FALSE(parsed.diags.has_errors());
  if (parsed.unit == nullptr) {
    return Program{};
  }
  return lower_translation_unit(*parsed.unit);
}

std::string text_of(const Cfg & cfg, size_t number)
{
  return join_fragments(cfg.block(cfg.numbered_blocks().at(number)).fragments);
}

}  // namespace

TEST(CfgLowering, FunctionHeader)
{
  Program program = lower_source("float scale(int v[], float k) { return k; }");
  ASSERT_EQ(program.functions.size(), 1U);
  const Cfg & cfg = program.functions[0];
  EXPECT_EQ(cfg.name(), "scale");
  EXPECT_EQ(cfg.return_type, std::vector<std::string>{"float "});
  const std::vector<std::string> params = {"int ", "v ", "[ ", "] ", ", ", "float ", "k "};
  EXPECT_EQ(cfg.params, params);
  EXPECT_FALSE(cfg.is_pruned());
}

TEST(CfgLowering, GlobalsCollectDeclarationLines)
{
  Program program = lower_source("int g; float h[4];\nint main() { return 0; }");
  EXPECT_EQ(join_fragments(program.globals.fragments), "    int g ; \n    float h [ 4 ] ; \n");
}

TEST(CfgLowering, StatementLines)
{
  const auto line = make_statement_line({});
  ASSERT_EQ(line.size(), 2U);
  EXPECT_TRUE(line[0].is_stmt_start());
  EXPECT_EQ(line[0].text, "    ");
  EXPECT_EQ(line[1].text, "\n");

  Program program = lower_source("int main() { int x; x = 1; print(x); ; return x; }");
  const Cfg & cfg = program.functions[0];
  ASSERT_EQ(cfg.numbered_blocks().size(), 1U);
  EXPECT_EQ(text_of(cfg, 0), "    int x ; \n    x = 1 ; \n    print ( x ) ; \n    ; \n    return x ; \n");
}

TEST(CfgLowering, IfRecordsBranchTargets)
{
  Program program = lower_source("int main() { if (a == 1) x = 1; else x = 2; y = 3; }");
  const Cfg & cfg = program.functions[0];
  ASSERT_EQ(cfg.numbered_blocks().size(), 4U);

  const Block & b0 = cfg.block(cfg.numbered_blocks()[0]);
  EXPECT_EQ(b0.then_target, cfg.numbered_blocks()[1]);
  EXPECT_EQ(b0.else_target, cfg.numbered_blocks()[2]);
  EXPECT_EQ(join_fragments(b0.fragments), "    if( a == 1 ) ");

  // Exactly one control keyword, tagged as such.
  size_t keywords = 0;
  for (const auto & f : b0.fragments) {
    if (f.is_keyword()) {
      EXPECT_EQ(f.keyword, ControlKeyword::If);
      ++keywords;
    }
  }
  EXPECT_EQ(keywords, 1U);

  EXPECT_EQ(text_of(cfg, 1), "    x = 1 ; \n");
  EXPECT_EQ(text_of(cfg, 2), "    x = 2 ; \n");
  EXPECT_EQ(text_of(cfg, 3), "    y = 3 ; \n");
}

TEST(CfgLowering, IfWithoutElseStillCreatesElseBlock)
{
  Program program = lower_source("int main() { if (a) x = 1; }");
  const Cfg & cfg = program.functions[0];
  ASSERT_EQ(cfg.numbered_blocks().size(), 4U);
  EXPECT_TRUE(text_of(cfg, 2).empty());
  EXPECT_TRUE(text_of(cfg, 3).empty());
}

TEST(CfgLowering, WhileRecordsLoopExit)
{
  Program program = lower_source("int main() { while (i < n) i = i + 1; return i; }");
  const Cfg & cfg = program.functions[0];
  ASSERT_EQ(cfg.numbered_blocks().size(), 4U);

  const Block & header = cfg.block(cfg.numbered_blocks()[1]);
  EXPECT_EQ(join_fragments(header.fragments), "    while( i < n ) ");
  EXPECT_EQ(header.loop_exit, cfg.numbered_blocks()[3]);
  EXPECT_EQ(text_of(cfg, 2), "    i = i + 1 ; \n");
  EXPECT_EQ(text_of(cfg, 3), "    return i ; \n");
}

TEST(CfgLowering, ForSplitsInitHeaderAndUpdate)
{
  Program program = lower_source("int main() { for (i = 0; i < n; i = i + 1) s = s + i; }");
  const Cfg & cfg = program.functions[0];

  // B0 init, B1 header, B2 body, B3 update, B4 loop exit.
  ASSERT_EQ(cfg.numbered_blocks().size(), 5U);
  EXPECT_EQ(text_of(cfg, 0), "    i = 0 ; \n");
  EXPECT_EQ(text_of(cfg, 1), "    for( ; i < n ; ) ");
  EXPECT_EQ(text_of(cfg, 2), "    s = s + i ; \n");
  EXPECT_EQ(text_of(cfg, 3), "    i = i + 1 ; \n");

  const BlockId header = cfg.numbered_blocks()[1];
  const BlockId update = cfg.numbered_blocks()[3];
  EXPECT_EQ(cfg.block(header).loop_exit, cfg.numbered_blocks()[4]);
  EXPECT_EQ(cfg.block(update).succs.to_vector(), std::vector<BlockId>{header});
}

TEST(CfgLowering, ReturnDropsFollowingStatements)
{
  Program program = lower_source("int main() { return 0; x = 1; while (y) y = 0; if (z) z = 1; }");
  const Cfg & cfg = program.functions[0];
  ASSERT_EQ(cfg.numbered_blocks().size(), 1U);
  EXPECT_EQ(text_of(cfg, 0), "    return 0 ; \n");
  EXPECT_TRUE(cfg.block(cfg.numbered_blocks()[0]).sealed);
}

TEST(CfgLowering, ReturnInsideArmOnlySealsThatArm)
{
  Program program = lower_source("int main() { if (a) return 1; x = 2; }");
  const Cfg & cfg = program.functions[0];
  ASSERT_EQ(cfg.numbered_blocks().size(), 4U);

  const BlockId then_block = cfg.numbered_blocks()[1];
  EXPECT_TRUE(cfg.block(then_block).sealed);
  EXPECT_EQ(cfg.block(then_block).succs.to_vector(), std::vector<BlockId>{cfg.exit()});
  EXPECT_EQ(text_of(cfg, 3), "    x = 2 ; \n");
}

TEST(CfgLowering, EveryFunctionGetsItsOwnGraph)
{
  Program program = lower_source(
    "int a() { return 1; }\n"
    "int b() { if (x) return 2; return 3; }\n");
  ASSERT_EQ(program.functions.size(), 2U);
  EXPECT_EQ(program.functions[0].name(), "a");
  EXPECT_EQ(program.functions[1].name(), "b");
  EXPECT_EQ(program.functions[0].numbered_blocks().size(), 1U);
  EXPECT_EQ(program.functions[1].numbered_blocks().size(), 4U);
}
