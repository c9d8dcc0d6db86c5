// cfgc/cfg/cfg.hpp - Control flow graph of a simpleC function
//
// Blocks live in an arena owned by their Cfg and refer to each other through
// BlockId handles. Edges are kept twice (successor set on the source,
// predecessor set on the target) so the pruning passes can rewrite them from
// either side.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cfgc
{

// ============================================================================
// BlockId
// ============================================================================

/// Stable handle of a Block inside its Cfg.
struct BlockId
{
  static constexpr uint32_t k_invalid = UINT32_MAX;

  uint32_t value = k_invalid;

  [[nodiscard]] static constexpr BlockId invalid() noexcept { return BlockId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  friend constexpr bool operator==(BlockId a, BlockId b) noexcept { return a.value == b.value; }
  friend constexpr bool operator!=(BlockId a, BlockId b) noexcept { return a.value != b.value; }
};

// ============================================================================
// Fragments
// ============================================================================

enum class FragmentKind : uint8_t {
  Text,       ///< Token text or punctuation, printed verbatim
  StmtStart,  ///< Four-space indent opening a statement line
  Keyword,    ///< Control keyword (`if`, `while`, `for`)
};

enum class ControlKeyword : uint8_t {
  None,
  If,
  While,
  For,
};

[[nodiscard]] constexpr std::string_view to_string(ControlKeyword kw) noexcept
{
  switch (kw) {
    case ControlKeyword::None:
      return "";
    case ControlKeyword::If:
      return "if";
    case ControlKeyword::While:
      return "while";
    case ControlKeyword::For:
      return "for";
  }
  return "";
}

/**
 * One piece of rendered statement text.
 *
 * The role tag lets the renderer find statement starts and control keywords
 * without looking at the text.
 */
struct Fragment
{
  FragmentKind kind = FragmentKind::Text;
  ControlKeyword keyword = ControlKeyword::None;
  std::string text;

  static constexpr std::string_view k_indent = "    ";

  [[nodiscard]] static Fragment make_text(std::string text);
  [[nodiscard]] static Fragment make_stmt_start();
  [[nodiscard]] static Fragment make_keyword(ControlKeyword kw);

  [[nodiscard]] bool is_keyword() const noexcept { return kind == FragmentKind::Keyword; }
  [[nodiscard]] bool is_stmt_start() const noexcept { return kind == FragmentKind::StmtStart; }
  [[nodiscard]] size_t size() const noexcept { return text.size(); }
};

/// Concatenated text of a fragment sequence.
[[nodiscard]] std::string join_fragments(const std::vector<Fragment> & fragments);

// ============================================================================
// OrderedBlockSet
// ============================================================================

/**
 * Insertion-ordered set of block handles.
 *
 * Edge sets in a function graph hold a handful of entries, so a flat vector
 * with linear lookup is enough.
 */
class OrderedBlockSet
{
public:
  using const_iterator = std::vector<BlockId>::const_iterator;

  /// Append `id` unless present. Returns true if it was added.
  bool insert(BlockId id);

  /// Remove `id` if present. Returns true if it was removed.
  bool erase(BlockId id);

  [[nodiscard]] bool contains(BlockId id) const noexcept;
  [[nodiscard]] size_t size() const noexcept { return items_.size(); }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
  [[nodiscard]] BlockId front() const noexcept { return items_.front(); }
  void clear() noexcept { items_.clear(); }

  [[nodiscard]] const_iterator begin() const noexcept { return items_.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return items_.end(); }

  /// Snapshot for iteration while the set itself is being modified.
  [[nodiscard]] std::vector<BlockId> to_vector() const { return items_; }

private:
  std::vector<BlockId> items_;
};

// ============================================================================
// Block
// ============================================================================

enum class BlockRole : uint8_t {
  Entry,
  Exit,
  Body,
};

/**
 * A basic block.
 *
 * Body blocks get a permanent number either when created or, for the
 * anonymous join block of a scope, when that scope closes. Pruning never
 * deletes a block; it marks it dead.
 */
struct Block
{
  BlockId id;
  BlockRole role = BlockRole::Body;

  /// Permanent creation-order number; empty while anonymous
  std::optional<uint32_t> number;

  /// Canonical index assigned by the renumbering pass (display only)
  uint32_t display_index = 0;

  std::vector<Fragment> fragments;

  /// Set by a `return`: the block falls through to exit only and ignores
  /// further content.
  bool sealed = false;
  bool dead = false;

  OrderedBlockSet preds;
  OrderedBlockSet succs;

  BlockId then_target = BlockId::invalid();  ///< Only on a block ending an `if`
  BlockId else_target = BlockId::invalid();  ///< Only on a block ending an `if`
  BlockId loop_exit = BlockId::invalid();    ///< Only on a loop header

  [[nodiscard]] bool is_alive() const noexcept { return !dead; }
  [[nodiscard]] bool is_numbered() const noexcept { return number.has_value(); }
};

// ============================================================================
// Cfg
// ============================================================================

/**
 * Control flow graph of one function.
 *
 * Owns all its blocks. `entry` and `exit` exist from construction; body
 * blocks are created through GraphBuilder.
 */
class Cfg
{
public:
  explicit Cfg(std::string function_name);

  // Non-copyable, movable
  Cfg(const Cfg &) = delete;
  Cfg & operator=(const Cfg &) = delete;
  Cfg(Cfg &&) = default;
  Cfg & operator=(Cfg &&) = default;
  ~Cfg() = default;

  // ===========================================================================
  // Function header
  // ===========================================================================

  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  /// Return type tokens, each with its trailing space
  std::vector<std::string> return_type;

  /// Parameter tokens (commas included), each with its trailing space
  std::vector<std::string> params;

  // ===========================================================================
  // Blocks
  // ===========================================================================

  [[nodiscard]] BlockId entry() const noexcept { return entry_; }
  [[nodiscard]] BlockId exit() const noexcept { return exit_; }

  [[nodiscard]] Block & block(BlockId id) { return *blocks_.at(id.value); }
  [[nodiscard]] const Block & block(BlockId id) const { return *blocks_.at(id.value); }

  /// Create an anonymous body block.
  BlockId create_block();

  /// Give `id` the next permanent number and register it in the table.
  /// Does nothing if the block is already numbered.
  void assign_number(BlockId id);

  /// Numbered blocks in ascending number order.
  [[nodiscard]] const std::vector<BlockId> & numbered_blocks() const noexcept
  {
    return numbered_;
  }

  /// Total blocks ever created, entry and exit included.
  [[nodiscard]] size_t block_count() const noexcept { return blocks_.size(); }

  /// Numbered blocks that are still alive.
  [[nodiscard]] size_t live_block_count() const noexcept;

  // ===========================================================================
  // Edges
  // ===========================================================================

  void add_edge(BlockId from, BlockId to);
  void remove_edge(BlockId from, BlockId to);

  // ===========================================================================
  // Naming
  // ===========================================================================

  /// `<func>_entry`, `<func>_exit` or `<func>_B<display index>`.
  [[nodiscard]] std::string label(BlockId id) const;

  /// Predecessor or successor labels: live numbered blocks first by number,
  /// then entry/exit by name. Dead blocks are skipped.
  [[nodiscard]] std::vector<std::string> sorted_labels(const OrderedBlockSet & set) const;

  [[nodiscard]] bool is_pruned() const noexcept { return pruned_; }
  void mark_pruned() noexcept { pruned_ = true; }

private:
  BlockId make_block(BlockRole role);

  std::string name_;
  std::vector<std::unique_ptr<Block>> blocks_;
  std::vector<BlockId> numbered_;
  uint32_t next_number_ = 0;
  BlockId entry_;
  BlockId exit_;
  bool pruned_ = false;
};

// ============================================================================
// Program
// ============================================================================

/// File-scope declarations. They have no graph structure.
struct Global
{
  std::vector<Fragment> fragments;

  [[nodiscard]] bool empty() const noexcept { return fragments.empty(); }
};

/// All graphs of one translation unit, in source order.
struct Program
{
  Global globals;
  std::vector<Cfg> functions;
};

}  // namespace cfgc
