// cfgc/cfg/pruner.hpp - CFG normalization passes
#pragma once

#include <cstddef>

#include "cfgc/cfg/cfg.hpp"

namespace cfgc
{

/// Blocks touched by each pass, mostly for verbose logging and tests.
struct PruneStats
{
  size_t unreachable = 0;  ///< Marked dead by the reachability sweep
  size_t elided = 0;       ///< Empty blocks bypassed
  size_t merged = 0;       ///< Blocks absorbed into their predecessor
  size_t remaining = 0;    ///< Live numbered blocks at the end
};

/**
 * Normalize a fully built graph, in place.
 *
 * 1. Reachability: one ascending sweep seeded with B0; unreached blocks die.
 * 2. Empty-block elision: an empty block is bypassed; branch and loop
 *    targets that named it are redirected to its successor.
 * 3. Straight-line merge: a block absorbs its sole successor while that
 *    successor has no other predecessor and is not exit.
 * 4. Renumbering: live blocks get display indices 0..k-1 in creation order.
 *
 * Pruning is destructive and runs once per graph.
 */
PruneStats prune(Cfg & cfg);

namespace prune_passes
{

// Individual passes, exposed for tests. prune() runs them in order.

size_t remove_unreachable(Cfg & cfg);
size_t elide_empty_blocks(Cfg & cfg);
size_t merge_straight_lines(Cfg & cfg);
size_t renumber(Cfg & cfg);

}  // namespace prune_passes

}  // namespace cfgc
