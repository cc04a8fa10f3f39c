// pg_sema/basic/source_manager.hpp - Source files, locations and ranges
//
// A SourceLocation is a (file, byte offset) pair packed into 8 bytes.
// Line/column information is computed on demand through SourceRegistry.
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

namespace pg_sema
{

namespace fs = std::filesystem;

// ============================================================================
// FileId
// ============================================================================

/**
 * Index of a file registered in a SourceRegistry.
 */
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
// SourceLocation
// ============================================================================

class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;
  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && offset_ != k_invalid_offset;
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return file_ == other.file_ && offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return !(*this == other);
  }

  /// Orders by file first, then by offset. Invalid locations sort last.
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    if (file_.value != other.file_.value) {
      return file_.value < other.file_.value;
    }
    return offset_ < other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange
// ============================================================================

/**
 * Half-open byte range [begin, end) inside one file.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
  {
  }

  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : begin_(file, begin), end_(file, end)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr FileId file_id() const noexcept { return begin_.file_id(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_.offset() - begin_.offset() : 0;
  }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// Smallest range covering both inputs. Invalid inputs are ignored.
[[nodiscard]] inline SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.get_begin(), b.get_end()};
}

// ============================================================================
// Resolved positions
// ============================================================================

struct LineColumn
{
  uint32_t line = 0;    ///< 1-based
  uint32_t column = 0;  ///< 1-based, in bytes
};

struct FullSourceRange
{
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line != 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }

  void set_content(std::string new_content);

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Line text without its terminator. `line_index` is 0-based.
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

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
 * Owns every source file of an analysis run and hands out FileIds.
 *
 * Registering the same (normalized) path twice returns the existing id.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  FileId register_file(fs::path path, std::string content);
  void update_content(FileId id, std::string new_content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;
  [[nodiscard]] std::optional<FileId> find_by_path(const fs::path & path) const;

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  static std::string normalize_key(const fs::path & path);

  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> path_to_id_;
};

}  // namespace pg_sema
