// cfgc/basic/source_manager.hpp - Source files, locations and ranges
//
// Locations are byte offsets tagged with the FileId of the file they belong to.
// Line/column information is computed on demand by SourceFile.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cfgc
{

namespace fs = std::filesystem;

// ============================================================================
// FileId
// ============================================================================

/// Index of a file inside a SourceRegistry.
struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceLocation / SourceRange
// ============================================================================

class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;
  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }
  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && offset_ != k_invalid_offset;
  }

  /// Orders by file first, then by offset.
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    if (file_.value != other.file_.value) return file_.value < other.file_.value;
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return file_ == other.file_ && offset_ == other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

/**
 * Half-open byte range [begin, end) inside a single file.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : file_(file), begin_(begin), end_(end)
  {
  }
  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : file_(begin.file_id()), begin_(begin.offset()), end_(end.offset())
  {
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return {file_, begin_}; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return {file_, end_}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && begin_ != SourceLocation::k_invalid_offset &&
           end_ != SourceLocation::k_invalid_offset;
  }
  [[nodiscard]] constexpr uint32_t size() const noexcept { return is_valid() ? end_ - begin_ : 0; }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return file_ == other.file_ && begin_ == other.begin_ && end_ == other.end_;
  }

private:
  FileId file_;
  uint32_t begin_ = SourceLocation::k_invalid_offset;
  uint32_t end_ = SourceLocation::k_invalid_offset;
};

/// Range spanning from the start of `a` to the end of `b`.
[[nodiscard]] inline SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (!a.is_valid()) return b;
  if (!b.is_valid()) return a;
  return {a.get_begin(), b.get_end()};
}

/// 1-indexed line and column (0 = invalid).
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * Content of one source file with a precomputed line table.
 */
class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Text of a 0-indexed line without its terminating newline.
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/**
 * Owns every SourceFile loaded during a compile and hands out FileIds.
 *
 * Registering the same path twice returns the first FileId.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  [[nodiscard]] FileId register_file(fs::path path, std::string content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;
  [[nodiscard]] std::optional<FileId> find_by_path(const fs::path & path) const;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  static std::string normalize_key(const fs::path & path);

  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> path_to_id_;
};

}  // namespace cfgc
