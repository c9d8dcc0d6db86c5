// tests/unit/cfg/test_graph_builder.cpp - Unit tests for incremental CFG construction
//
#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "cfgc/cfg/cfg.hpp"
#include "cfgc/cfg/graph_builder.hpp"

using namespace cfgc;

// ============================================================================
// Helper Functions
// ============================================================================

static std::vector<BlockId> succs_of(const Cfg & cfg, BlockId id)
{
  return cfg.block(id).succs.to_vector();
}

static std::vector<BlockId> preds_of(const Cfg & cfg, BlockId id)
{
  return cfg.block(id).preds.to_vector();
}

static BlockId numbered(const Cfg & cfg, size_t n) { return cfg.numbered_blocks().at(n); }

// ============================================================================
// Tests
// ============================================================================

TEST(CfgGraphBuilder, StartsWithEntryBlockZeroExit)
{
  Cfg cfg("main");
  GraphBuilder builder(cfg);

  ASSERT_EQ(cfg.numbered_blocks().size(), 1U);
  const BlockId b0 = numbered(cfg, 0);
  EXPECT_EQ(builder.current(), b0);
  EXPECT_EQ(*cfg.block(b0).number, 0U);

  // The initial entry -> exit edge has been spliced away.
  EXPECT_EQ(succs_of(cfg, cfg.entry()), std::vector<BlockId>{b0});
  EXPECT_TRUE(preds_of(cfg, cfg.entry()).empty());
  EXPECT_EQ(succs_of(cfg, b0), std::vector<BlockId>{cfg.exit()});
  EXPECT_EQ(preds_of(cfg, cfg.exit()), std::vector<BlockId>{b0});
  EXPECT_TRUE(succs_of(cfg, cfg.exit()).empty());
}

TEST(CfgGraphBuilder, AdvanceSplicesIntoFallthroughEdge)
{
  Cfg cfg("f");
  GraphBuilder builder(cfg);
  const BlockId b0 = builder.current();
  builder.append(Fragment::make_text("a "));

  const BlockId b1 = builder.advance();
  EXPECT_NE(b1, b0);
  EXPECT_EQ(builder.current(), b1);
  EXPECT_EQ(*cfg.block(b1).number, 1U);

  EXPECT_EQ(succs_of(cfg, b0), std::vector<BlockId>{b1});
  EXPECT_EQ(succs_of(cfg, b1), std::vector<BlockId>{cfg.exit()});
  EXPECT_EQ(preds_of(cfg, cfg.exit()), std::vector<BlockId>{b1});

  builder.append(Fragment::make_text("b "));
  EXPECT_EQ(join_fragments(cfg.block(b0).fragments), "a ");
  EXPECT_EQ(join_fragments(cfg.block(b1).fragments), "b ");
}

TEST(CfgGraphBuilder, SealingMakesAppendAndAdvanceNoOps)
{
  Cfg cfg("f");
  GraphBuilder builder(cfg);
  const BlockId b0 = builder.current();
  builder.append(Fragment::make_text("return "));
  builder.seal_to_exit();

  EXPECT_TRUE(builder.is_sealed());
  builder.append(Fragment::make_text("dead "));
  EXPECT_EQ(builder.advance(), b0);
  EXPECT_EQ(cfg.numbered_blocks().size(), 1U);
  EXPECT_EQ(join_fragments(cfg.block(b0).fragments), "return ");
  EXPECT_EQ(succs_of(cfg, b0), std::vector<BlockId>{cfg.exit()});

  // Scope opens fail with an empty guard and leave the graph untouched.
  ScopeGuard loop = builder.open_loop_scope();
  EXPECT_FALSE(loop);
  ScopeGuard branch = builder.open_branch_scope();
  EXPECT_FALSE(branch);
  EXPECT_EQ(builder.open_scope_count(), 0U);
  EXPECT_EQ(cfg.block_count(), 3U);  // entry, exit, B0
}

TEST(CfgGraphBuilder, SealDetachesAllSuccessors)
{
  Cfg cfg("f");
  GraphBuilder builder(cfg);
  const BlockId b0 = builder.current();

  ScopeGuard branch = builder.open_branch_scope();
  ASSERT_TRUE(branch);
  const BlockId join = builder.current();
  builder.reset_to_scope_start();
  EXPECT_EQ(builder.current(), b0);

  builder.seal_to_exit();
  EXPECT_EQ(succs_of(cfg, b0), std::vector<BlockId>{cfg.exit()});
  EXPECT_TRUE(preds_of(cfg, join).empty());
}

TEST(CfgGraphBuilder, BranchScopeNumbersJoinOnClose)
{
  Cfg cfg("f");
  GraphBuilder builder(cfg);
  const BlockId b0 = builder.current();

  ScopeGuard branch = builder.open_branch_scope();
  ASSERT_TRUE(branch);
  const BlockId join = builder.current();
  EXPECT_FALSE(cfg.block(join).is_numbered());
  EXPECT_EQ(builder.open_scope_count(), 1U);

  builder.reset_to_scope_start();
  const BlockId then_block = builder.advance();
  builder.reset_to_scope_start();
  const BlockId else_block = builder.advance();

  EXPECT_EQ(succs_of(cfg, b0), (std::vector<BlockId>{then_block, else_block}));
  EXPECT_EQ(succs_of(cfg, then_block), std::vector<BlockId>{join});
  EXPECT_EQ(succs_of(cfg, else_block), std::vector<BlockId>{join});
  EXPECT_EQ(succs_of(cfg, join), std::vector<BlockId>{cfg.exit()});

  branch.close();
  EXPECT_FALSE(branch);
  EXPECT_EQ(builder.open_scope_count(), 0U);
  EXPECT_EQ(builder.current(), join);
  ASSERT_TRUE(cfg.block(join).is_numbered());
  EXPECT_EQ(*cfg.block(join).number, 3U);
  EXPECT_EQ(numbered(cfg, 3), join);
}

TEST(CfgGraphBuilder, LoopScopeKeepsHeaderEdgeToLoopExit)
{
  Cfg cfg("f");
  GraphBuilder builder(cfg);

  ScopeGuard loop = builder.open_loop_scope();
  ASSERT_TRUE(loop);
  const BlockId header = builder.current();
  EXPECT_EQ(*cfg.block(header).number, 1U);

  const BlockId body = builder.advance();
  EXPECT_EQ(succs_of(cfg, body), std::vector<BlockId>{header});

  loop.close();
  EXPECT_EQ(builder.current(), header);

  const BlockId loop_exit = builder.advance();
  EXPECT_EQ(succs_of(cfg, header), (std::vector<BlockId>{body, loop_exit}));
  EXPECT_EQ(preds_of(cfg, header).size(), 2U);
  EXPECT_EQ(succs_of(cfg, loop_exit), std::vector<BlockId>{cfg.exit()});
}

TEST(CfgGraphBuilder, NestedScopesUseInnermostEnd)
{
  Cfg cfg("f");
  GraphBuilder builder(cfg);

  ScopeGuard loop = builder.open_loop_scope();
  const BlockId header = builder.current();
  const BlockId body = builder.advance();

  ScopeGuard update = builder.open_branch_scope();
  const BlockId update_block = builder.current();
  EXPECT_EQ(builder.open_scope_count(), 2U);
  EXPECT_EQ(succs_of(cfg, body), std::vector<BlockId>{update_block});
  EXPECT_EQ(succs_of(cfg, update_block), std::vector<BlockId>{header});

  builder.reset_to_scope_start();
  EXPECT_EQ(builder.current(), body);

  update.close();
  EXPECT_EQ(builder.current(), update_block);
  loop.close();
  EXPECT_EQ(builder.current(), header);
  EXPECT_EQ(builder.open_scope_count(), 0U);
}

TEST(CfgGraphBuilder, GuardClosesScopeOnDestruction)
{
  Cfg cfg("f");
  GraphBuilder builder(cfg);
  BlockId join = BlockId::invalid();
  {
    ScopeGuard branch = builder.open_branch_scope();
    ASSERT_TRUE(branch);
    join = builder.current();
    builder.reset_to_scope_start();
  }
  EXPECT_EQ(builder.open_scope_count(), 0U);
  EXPECT_EQ(builder.current(), join);
  EXPECT_TRUE(cfg.block(join).is_numbered());
}

TEST(CfgGraphBuilder, MovedGuardClosesOnce)
{
  Cfg cfg("f");
  GraphBuilder builder(cfg);

  ScopeGuard outer = builder.open_loop_scope();
  ScopeGuard inner = builder.open_branch_scope();
  ScopeGuard moved = std::move(inner);
  EXPECT_FALSE(inner);  // NOLINT(bugprone-use-after-move)
  EXPECT_TRUE(moved);
  EXPECT_EQ(builder.open_scope_count(), 2U);

  moved.close();
  moved.close();
  EXPECT_EQ(builder.open_scope_count(), 1U);
  outer.close();
  EXPECT_EQ(builder.open_scope_count(), 0U);
}
