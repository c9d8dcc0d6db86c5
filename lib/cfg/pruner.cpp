// cfgc/cfg/pruner.cpp - CFG normalization passes
#include "cfgc/cfg/pruner.hpp"

#include <cassert>
#include <unordered_set>

namespace cfgc
{

namespace
{

struct BlockIdHash
{
  size_t operator()(BlockId id) const noexcept { return id.value; }
};

void redirect_target(BlockId & target, BlockId from, BlockId to)
{
  if (target == from) {
    target = to;
  }
}

}  // namespace

namespace prune_passes
{

// ============================================================================
// Pass 1: reachability
// ============================================================================

size_t remove_unreachable(Cfg & cfg)
{
  const auto & table = cfg.numbered_blocks();
  if (table.empty()) {
    return 0;
  }

  // Blocks only ever branch forward in creation order, except loop back
  // edges to an already reached header, so one sweep finds everything.
  std::unordered_set<BlockId, BlockIdHash> reached;
  reached.insert(table.front());

  size_t removed = 0;
  for (const BlockId id : table) {
    Block & b = cfg.block(id);
    if (reached.count(id) == 0) {
      b.dead = true;
      for (const BlockId succ : b.succs) {
        cfg.block(succ).preds.erase(id);
      }
      ++removed;
      continue;
    }
    for (const BlockId succ : b.succs) {
      reached.insert(succ);
    }
  }
  return removed;
}

// ============================================================================
// Pass 2: empty-block elision
// ============================================================================

size_t elide_empty_blocks(Cfg & cfg)
{
  size_t elided = 0;
  for (const BlockId id : cfg.numbered_blocks()) {
    Block & b = cfg.block(id);
    if (b.dead || !b.fragments.empty() || b.succs.size() != 1) {
      continue;
    }
    const BlockId succ = b.succs.front();
    if (succ == id) {
      continue;
    }

    for (const BlockId pred : b.preds.to_vector()) {
      Block & p = cfg.block(pred);
      redirect_target(p.then_target, id, succ);
      redirect_target(p.else_target, id, succ);
      redirect_target(p.loop_exit, id, succ);
      cfg.remove_edge(pred, id);
      cfg.add_edge(pred, succ);
    }
    cfg.remove_edge(id, succ);
    b.dead = true;
    ++elided;
  }
  return elided;
}

// ============================================================================
// Pass 3: straight-line merge
// ============================================================================

size_t merge_straight_lines(Cfg & cfg)
{
  size_t merged = 0;
  for (const BlockId id : cfg.numbered_blocks()) {
    Block & b = cfg.block(id);
    if (b.dead) {
      continue;
    }

    while (b.succs.size() == 1) {
      const BlockId next_id = b.succs.front();
      Block & next = cfg.block(next_id);
      if (next_id == id || next_id == cfg.exit() || next.preds.size() != 1) {
        break;
      }

      b.fragments.insert(b.fragments.end(), next.fragments.begin(), next.fragments.end());

      cfg.remove_edge(id, next_id);
      for (const BlockId after : next.succs.to_vector()) {
        cfg.remove_edge(next_id, after);
        cfg.add_edge(id, after);
      }

      // The absorbed block's annotations replace ours, absent ones included.
      b.then_target = next.then_target;
      b.else_target = next.else_target;
      b.loop_exit = next.loop_exit;

      next.dead = true;
      ++merged;
    }
  }
  return merged;
}

// ============================================================================
// Pass 4: canonical renumbering
// ============================================================================

size_t renumber(Cfg & cfg)
{
  uint32_t index = 0;
  for (const BlockId id : cfg.numbered_blocks()) {
    Block & b = cfg.block(id);
    if (b.dead) {
      continue;
    }
    b.display_index = index++;
  }
  return index;
}

}  // namespace prune_passes

PruneStats prune(Cfg & cfg)
{
  assert(!cfg.is_pruned() && "a graph must be pruned exactly once");

  PruneStats stats;
  stats.unreachable = prune_passes::remove_unreachable(cfg);
  stats.elided = prune_passes::elide_empty_blocks(cfg);
  stats.merged = prune_passes::merge_straight_lines(cfg);
  stats.remaining = prune_passes::renumber(cfg);
  cfg.mark_pruned();
  return stats;
}

}  // namespace cfgc
