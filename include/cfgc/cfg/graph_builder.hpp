// cfgc/cfg/graph_builder.hpp - Incremental CFG construction
//
// Builds one function graph while the AST is walked in source order.
//
#pragma once

#include <cstddef>
#include <vector>

#include "cfgc/cfg/cfg.hpp"

namespace cfgc
{

class GraphBuilder;

/**
 * Closes a scope opened by GraphBuilder::open_loop_scope() or
 * GraphBuilder::open_branch_scope().
 *
 * An empty guard means the open failed because the current block was sealed;
 * the caller must skip the construct. A non-empty guard closes its scope
 * exactly once, either through close() or on destruction.
 */
class ScopeGuard
{
public:
  ScopeGuard() = default;
  explicit ScopeGuard(GraphBuilder & builder) : builder_(&builder) {}

  ScopeGuard(const ScopeGuard &) = delete;
  ScopeGuard & operator=(const ScopeGuard &) = delete;

  ScopeGuard(ScopeGuard && other) noexcept : builder_(other.builder_)
  {
    other.builder_ = nullptr;
  }

  ScopeGuard & operator=(ScopeGuard && other) noexcept;

  ~ScopeGuard() { close(); }

  /// True if the scope was opened and is still open.
  explicit operator bool() const noexcept { return builder_ != nullptr; }

  /// Close the scope now. Later calls do nothing.
  void close();

private:
  GraphBuilder * builder_ = nullptr;
};

/**
 * Incremental graph builder.
 *
 * ## Fallthrough edge
 *
 * At every point there is exactly one open fallthrough edge, from the current
 * block to the innermost scope end (or to exit when no scope is open). New
 * blocks are spliced into that edge:
 *
 * ```
 * current -> end      becomes      current -> fresh -> end
 * ```
 *
 * ## Scope stacks
 *
 * `segment_start_` and `segment_end_` are parallel. A loop scope pushes its
 * header on both; a branch scope pushes the branching block on the start
 * stack and an anonymous join block on the end stack.
 *
 * ## Usage
 * ```cpp
 * Cfg cfg("main");
 * GraphBuilder builder(cfg);
 * builder.append(Fragment::make_text("x "));
 * if (auto loop = builder.open_loop_scope()) {
 *   builder.advance();
 *   // ... body ...
 *   loop.close();
 * }
 * ```
 */
class GraphBuilder
{
public:
  /// Sets up entry -> B0 -> exit with B0 current.
  explicit GraphBuilder(Cfg & cfg);

  GraphBuilder(const GraphBuilder &) = delete;
  GraphBuilder & operator=(const GraphBuilder &) = delete;

  /// Append to the current block. Dropped if the block is sealed.
  void append(Fragment fragment);

  /// Splice a new numbered block after the current one and make it current.
  /// Returns the current block afterwards (unchanged if sealed).
  BlockId advance();

  /// advance() and push the new block on both stacks.
  [[nodiscard]] ScopeGuard open_loop_scope();

  /// Splice an anonymous join block and open a branch scope around it.
  [[nodiscard]] ScopeGuard open_branch_scope();

  /// Move back to the block that opened the innermost scope.
  void reset_to_scope_start();

  /// Redirect the current block to exit and seal it.
  void seal_to_exit();

  [[nodiscard]] BlockId current() const noexcept { return current_; }
  [[nodiscard]] bool is_sealed() const { return cfg_.block(current_).sealed; }
  [[nodiscard]] size_t open_scope_count() const noexcept { return segment_end_.size(); }
  [[nodiscard]] Cfg & cfg() noexcept { return cfg_; }

private:
  friend class ScopeGuard;

  /// Pop both stacks, move to the popped end block and number it if needed.
  void close_scope();

  /// Target of the open fallthrough edge.
  [[nodiscard]] BlockId fallthrough_target() const;

  /// Replace current -> end with current -> fresh -> end; fresh becomes current.
  void splice(BlockId fresh);

  Cfg & cfg_;
  BlockId current_;
  std::vector<BlockId> segment_start_;
  std::vector<BlockId> segment_end_;
};

}  // namespace cfgc
