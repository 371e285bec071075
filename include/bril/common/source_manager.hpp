#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace bril {

struct FileId {
  uint32_t value = 0;

  explicit operator bool() const {
    return value != 0;
  }
  auto operator==(const FileId&) const -> bool = default;
};

inline constexpr FileId kInvalidFileId{};

struct FileInfo {
  std::string path;
  std::string content;
};

// Owns the text of every input read during one invocation so that
// diagnostics can point back into it. Not thread-safe.
class SourceManager {
 public:
  auto AddFile(std::string path, std::string content) -> FileId {
    auto value = static_cast<uint32_t>(files_.size() + 1);
    files_.push_back(
        FileInfo{.path = std::move(path), .content = std::move(content)});
    return FileId{.value = value};
  }

  [[nodiscard]] auto GetFile(FileId id) const -> const FileInfo* {
    if (!id || id.value > files_.size()) {
      return nullptr;
    }
    return &files_[id.value - 1];
  }

 private:
  std::vector<FileInfo> files_;
};

}  // namespace bril
