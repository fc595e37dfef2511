#ifndef VAULT_STORAGE_USER_STORE_HPP
#define VAULT_STORAGE_USER_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace vault {
namespace storage {

// Per-user file storage rooted at <base_path>/<username>
class UserStore {
public:
  static constexpr std::size_t PREVIEW_SIZE = 1024;
  static constexpr const char* STAGING_SUFFIX = ".part";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit UserStore(const std::string& base_path);


  // ---- SANDBOX OPERATIONS ----
  // Path of a user's sandbox, throws network::PathRejected for unusable usernames
  std::filesystem::path sandbox_for(const std::string& username) const;
  // Creates the sandbox if needed and returns its path
  std::filesystem::path ensure_sandbox(const std::string& username) const;
  // Confines a file name to the sandbox
  std::filesystem::path resolve(const std::filesystem::path& sandbox, const std::string& filename) const;


  // ---- CORE STORAGE OPERATIONS ----
  // Creates or truncates the file for writing
  std::unique_ptr<std::ofstream> open_for_write(const std::filesystem::path& file_path) const;
  // Throws network::NotFound if the file is missing
  std::unique_ptr<std::ifstream> open_for_read(const std::filesystem::path& file_path) const;
  // Returns at most max_bytes from the start of the file
  std::string read_prefix(const std::filesystem::path& file_path, std::size_t max_bytes = PREVIEW_SIZE) const;
  // Throws network::NotFound if the file is missing
  void remove(const std::filesystem::path& file_path) const;
  // Best-effort removal of a partially written file
  void discard(const std::filesystem::path& file_path) const noexcept;


  // ---- STAGED WRITES ----
  // Hidden sibling that receives an upload until it is complete.
  // Throws StoreError if file_path is a directory.
  std::filesystem::path staging_path(const std::filesystem::path& file_path) const;
  // Atomically replaces file_path with the staged file
  void commit(const std::filesystem::path& staging, const std::filesystem::path& file_path) const;
  static bool is_staging_name(const std::string& name);


  // ---- QUERY OPERATIONS ----
  bool has(const std::filesystem::path& file_path) const;
  std::uintmax_t get_file_size(const std::filesystem::path& file_path) const;
  // Regular files directly under the sandbox, sorted by name, without staged uploads
  std::vector<std::string> list(const std::filesystem::path& sandbox) const;

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all sandboxes
  std::filesystem::path base_path_;

  // Throws network::NotFound unless file_path is a regular file
  void verify_file_exists(const std::filesystem::path& file_path) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace storage
} // namespace vault

#endif // VAULT_STORAGE_USER_STORE_HPP
