#ifndef VAULT_STORAGE_PATH_GUARD_HPP
#define VAULT_STORAGE_PATH_GUARD_HPP

#include <filesystem>
#include <string>

namespace vault {
namespace storage {

// Confines user supplied names to a sandbox root
class PathGuard {
public:
  // Returns the canonical absolute path for raw_name under sandbox_root.
  // Throws network::PathRejected for empty names, absolute paths, and any
  // candidate that resolves (through ".." or symlinks) outside the root.
  static std::filesystem::path resolve(const std::filesystem::path& sandbox_root,
                                       const std::string& raw_name);

  // True if candidate equals root or lies beneath it (both canonical)
  static bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);
};

} // namespace storage
} // namespace vault

#endif // VAULT_STORAGE_PATH_GUARD_HPP
