// tshl/basic/source_manager.hpp - Source location and range management
//
// This header provides types for tracking locations inside loaded text files
// (rule files, highlighted documents) and the registry that owns them.
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

namespace tshl
{

namespace fs = std::filesystem;

// ============================================================================
// FileId - Index into SourceRegistry
// ============================================================================

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
// SourceLocation - Compact source position
// ============================================================================

/**
 * A byte offset inside a registered file.
 *
 * Line and column information is computed on demand via SourceRegistry.
 */
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;

  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return offset_ != k_invalid_offset;
  }

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
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    if (file_.value != other.file_.value) return file_.value < other.file_.value;
    return offset_ < other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange - Half-open [begin, end) range inside one file
// ============================================================================

class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t start_offset, uint32_t end_offset) noexcept
  : file_(file), start_(start_offset), end_(end_offset)
  {
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept
  {
    return SourceLocation(file_, start_);
  }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept
  {
    return SourceLocation(file_, end_);
  }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_ != SourceLocation::k_invalid_offset &&
           end_ != SourceLocation::k_invalid_offset;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return file_ == other.file_ && start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  FileId file_;
  uint32_t start_ = SourceLocation::k_invalid_offset;
  uint32_t end_ = SourceLocation::k_invalid_offset;
};

// ============================================================================
// LineColumn / FullSourceRange - Human-readable positions
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

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
// SourceFile - Content of one file plus its line table
// ============================================================================

class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  void set_content(std::string new_content);

  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Convert a byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a line without its terminator (0-indexed)
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Byte offset of the start of a line (0-indexed)
  [[nodiscard]] uint32_t get_line_offset(uint32_t line_index) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry - Owns every loaded file
// ============================================================================

class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /// Register a file; registering the same path twice returns the first id.
  FileId register_file(fs::path path, std::string content);

  /// Read and register a file from disk. Returns std::nullopt when unreadable.
  std::optional<FileId> load_file(const fs::path & path);

  void update_content(FileId id, std::string new_content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;
private:
  static std::string normalize_key(const fs::path & path);

  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> path_to_id_;
};

}  // namespace tshl
