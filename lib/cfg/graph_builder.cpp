// cfgc/cfg/graph_builder.cpp - Incremental CFG construction
#include "cfgc/cfg/graph_builder.hpp"

#include <cassert>
#include <utility>

namespace cfgc
{

// ============================================================================
// ScopeGuard
// ============================================================================

ScopeGuard & ScopeGuard::operator=(ScopeGuard && other) noexcept
{
  if (this != &other) {
    close();
    builder_ = other.builder_;
    other.builder_ = nullptr;
  }
  return *this;
}

void ScopeGuard::close()
{
  if (builder_ != nullptr) {
    GraphBuilder * b = builder_;
    builder_ = nullptr;
    b->close_scope();
  }
}

// ============================================================================
// GraphBuilder
// ============================================================================

GraphBuilder::GraphBuilder(Cfg & cfg) : cfg_(cfg), current_(cfg.entry())
{
  // Entry starts with the fallthrough edge to exit; the first advance
  // splices B0 into it.
  cfg_.add_edge(cfg_.entry(), cfg_.exit());
  advance();
}

BlockId GraphBuilder::fallthrough_target() const
{
  return segment_end_.empty() ? cfg_.exit() : segment_end_.back();
}

void GraphBuilder::splice(BlockId fresh)
{
  const BlockId end = fallthrough_target();
  cfg_.remove_edge(current_, end);
  cfg_.add_edge(current_, fresh);
  cfg_.add_edge(fresh, end);
  current_ = fresh;
}

void GraphBuilder::append(Fragment fragment)
{
  Block & b = cfg_.block(current_);
  if (b.sealed) {
    return;
  }
  b.fragments.push_back(std::move(fragment));
}

BlockId GraphBuilder::advance()
{
  if (is_sealed()) {
    return current_;
  }
  const BlockId fresh = cfg_.create_block();
  cfg_.assign_number(fresh);
  splice(fresh);
  return current_;
}

ScopeGuard GraphBuilder::open_loop_scope()
{
  if (is_sealed()) {
    return ScopeGuard{};
  }
  const BlockId header = advance();
  segment_start_.push_back(header);
  segment_end_.push_back(header);
  return ScopeGuard{*this};
}

ScopeGuard GraphBuilder::open_branch_scope()
{
  if (is_sealed()) {
    return ScopeGuard{};
  }
  const BlockId start = current_;
  const BlockId join = cfg_.create_block();
  splice(join);
  segment_start_.push_back(start);
  segment_end_.push_back(join);
  return ScopeGuard{*this};
}

void GraphBuilder::reset_to_scope_start()
{
  assert(!segment_start_.empty() && "reset_to_scope_start() without an open scope");
  current_ = segment_start_.back();
}

void GraphBuilder::close_scope()
{
  assert(!segment_start_.empty() && !segment_end_.empty() && "close_scope() without an open scope");
  segment_start_.pop_back();
  current_ = segment_end_.back();
  segment_end_.pop_back();
  cfg_.assign_number(current_);
}

void GraphBuilder::seal_to_exit()
{
  Block & b = cfg_.block(current_);
  for (const BlockId succ : b.succs.to_vector()) {
    cfg_.remove_edge(current_, succ);
  }
  cfg_.add_edge(current_, cfg_.exit());
  b.sealed = true;
}

}  // namespace cfgc
