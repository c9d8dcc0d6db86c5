// cfgc/cfg/cfg.cpp - Control flow graph containers
#include "cfgc/cfg/cfg.hpp"

#include <algorithm>
#include <utility>

namespace cfgc
{

// ============================================================================
// Fragment
// ============================================================================

Fragment Fragment::make_text(std::string text)
{
  Fragment f;
  f.kind = FragmentKind::Text;
  f.text = std::move(text);
  return f;
}

Fragment Fragment::make_stmt_start()
{
  Fragment f;
  f.kind = FragmentKind::StmtStart;
  f.text = std::string(k_indent);
  return f;
}

Fragment Fragment::make_keyword(ControlKeyword kw)
{
  Fragment f;
  f.kind = FragmentKind::Keyword;
  f.keyword = kw;
  f.text = std::string(to_string(kw));
  return f;
}

std::string join_fragments(const std::vector<Fragment> & fragments)
{
  std::string out;
  for (const auto & f : fragments) {
    out += f.text;
  }
  return out;
}

// ============================================================================
// OrderedBlockSet
// ============================================================================

bool OrderedBlockSet::insert(BlockId id)
{
  if (contains(id)) {
    return false;
  }
  items_.push_back(id);
  return true;
}

bool OrderedBlockSet::erase(BlockId id)
{
  auto it = std::find(items_.begin(), items_.end(), id);
  if (it == items_.end()) {
    return false;
  }
  items_.erase(it);
  return true;
}

bool OrderedBlockSet::contains(BlockId id) const noexcept
{
  return std::find(items_.begin(), items_.end(), id) != items_.end();
}

// ============================================================================
// Cfg
// ============================================================================

Cfg::Cfg(std::string function_name) : name_(std::move(function_name))
{
  entry_ = make_block(BlockRole::Entry);
  exit_ = make_block(BlockRole::Exit);
}

BlockId Cfg::make_block(BlockRole role)
{
  auto block = std::make_unique<Block>();
  block->id = BlockId{static_cast<uint32_t>(blocks_.size())};
  block->role = role;
  const BlockId id = block->id;
  blocks_.push_back(std::move(block));
  return id;
}

BlockId Cfg::create_block() { return make_block(BlockRole::Body); }

void Cfg::assign_number(BlockId id)
{
  Block & b = block(id);
  if (b.role != BlockRole::Body || b.is_numbered()) {
    return;
  }
  b.number = next_number_;
  // Until renumbering runs the display index is the permanent number.
  b.display_index = next_number_;
  ++next_number_;
  numbered_.push_back(id);
}

size_t Cfg::live_block_count() const noexcept
{
  size_t n = 0;
  for (const BlockId id : numbered_) {
    if (blocks_[id.value]->is_alive()) {
      ++n;
    }
  }
  return n;
}

void Cfg::add_edge(BlockId from, BlockId to)
{
  block(from).succs.insert(to);
  block(to).preds.insert(from);
}

void Cfg::remove_edge(BlockId from, BlockId to)
{
  block(from).succs.erase(to);
  block(to).preds.erase(from);
}

std::string Cfg::label(BlockId id) const
{
  const Block & b = block(id);
  switch (b.role) {
    case BlockRole::Entry:
      return name_ + "_entry";
    case BlockRole::Exit:
      return name_ + "_exit";
    case BlockRole::Body:
      break;
  }
  if (!b.is_numbered()) {
    return name_ + "_<anon>";
  }
  return name_ + "_B" + std::to_string(b.display_index);
}

std::vector<std::string> Cfg::sorted_labels(const OrderedBlockSet & set) const
{
  std::vector<const Block *> live;
  for (const BlockId id : set) {
    const Block & b = block(id);
    if (b.is_alive()) {
      live.push_back(&b);
    }
  }

  // Numbered blocks first in ascending order; named blocks after, where
  // "entry" sorts before "exit".
  std::stable_sort(live.begin(), live.end(), [](const Block * a, const Block * b) {
    if (a->is_numbered() && b->is_numbered()) {
      return *a->number < *b->number;
    }
    if (a->is_numbered() != b->is_numbered()) {
      return a->is_numbered();
    }
    return a->role < b->role;
  });

  std::vector<std::string> out;
  out.reserve(live.size());
  for (const Block * b : live) {
    out.push_back(label(b->id));
  }
  return out;
}

}  // namespace cfgc
