#include "storage/user_store.hpp"
#include "storage/path_guard.hpp"
#include "network/protocol_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace vault {
namespace storage {

namespace fs = std::filesystem;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
UserStore::UserStore(const std::string& base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing store with base path: " << base_path;
  try {
    fs::create_directories(base_path);
    base_path_ = fs::canonical(base_path);
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Cannot prepare base path " << base_path << ": " << e.what();
    throw StoreError("Store: Failed to prepare base path: " + base_path);
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path_.string();
}


//==============================================
// SANDBOX OPERATIONS
//==============================================

fs::path UserStore::sandbox_for(const std::string& username) const {
  fs::path sandbox = PathGuard::resolve(base_path_, username);

  // A username must name exactly one directory level below the base
  if (sandbox.parent_path() != base_path_) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Username does not map to a single directory: " << username;
    throw network::PathRejected("invalid username: " + username);
  }
  return sandbox;
}

fs::path UserStore::ensure_sandbox(const std::string& username) const {
  fs::path sandbox = sandbox_for(username);

  std::error_code ec;
  fs::create_directories(sandbox, ec);
  if (ec || !fs::is_directory(sandbox)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create sandbox " << sandbox.string() << ": " << ec.message();
    throw StoreError("Store: Failed to create sandbox for " + username);
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Sandbox ready at: " << sandbox.string();
  return sandbox;
}

fs::path UserStore::resolve(const fs::path& sandbox, const std::string& filename) const {
  return PathGuard::resolve(sandbox, filename);
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::unique_ptr<std::ofstream> UserStore::open_for_write(const fs::path& file_path) const {
  BOOST_LOG_TRIVIAL(info) << "Store: Opening for write: " << file_path.string();

  if (fs::is_directory(file_path)) {
    throw StoreError("Store: Target is a directory: " + file_path.filename().string());
  }

  // Open output file in binary mode for cross-platform consistency
  auto file = std::make_unique<std::ofstream>(file_path, std::ios::binary | std::ios::trunc);
  if (!*file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create file: " << file_path.string();
    throw StoreError("Store: Failed to create file: " + file_path.filename().string());
  }
  return file;
}

std::unique_ptr<std::ifstream> UserStore::open_for_read(const fs::path& file_path) const {
  BOOST_LOG_TRIVIAL(info) << "Store: Opening for read: " << file_path.string();
  verify_file_exists(file_path);

  auto file = std::make_unique<std::ifstream>(file_path, std::ios::binary);
  if (!*file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to open file: " << file_path.string();
    throw StoreError("Store: Failed to open file: " + file_path.filename().string());
  }
  return file;
}

std::string UserStore::read_prefix(const fs::path& file_path, std::size_t max_bytes) const {
  auto file = open_for_read(file_path);

  std::string prefix(max_bytes, '\0');
  file->read(&prefix[0], static_cast<std::streamsize>(max_bytes));
  if (file->bad()) {
    throw StoreError("Store: Failed to read file: " + file_path.filename().string());
  }
  prefix.resize(static_cast<std::size_t>(file->gcount()));

  BOOST_LOG_TRIVIAL(debug) << "Store: Read " << prefix.size() << " byte prefix of " << file_path.string();
  return prefix;
}

void UserStore::remove(const fs::path& file_path) const {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing file: " << file_path.string();
  verify_file_exists(file_path);

  std::error_code ec;
  if (!fs::remove(file_path, ec) || ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove file " << file_path.string() << ": " << ec.message();
    throw StoreError("Store: Failed to remove file: " + file_path.filename().string());
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Successfully removed file: " << file_path.string();
}

void UserStore::discard(const fs::path& file_path) const noexcept {
  std::error_code ec;
  if (fs::remove(file_path, ec)) {
    BOOST_LOG_TRIVIAL(info) << "Store: Discarded partial file: " << file_path.string();
  } else if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to discard " << file_path.string() << ": " << ec.message();
  }
}


//==============================================
// STAGED WRITES
//==============================================

fs::path UserStore::staging_path(const fs::path& file_path) const {
  if (fs::is_directory(file_path)) {
    throw StoreError("Store: Target is a directory: " + file_path.filename().string());
  }
  return file_path.parent_path() / ("." + file_path.filename().string() + STAGING_SUFFIX);
}

void UserStore::commit(const fs::path& staging, const fs::path& file_path) const {
  std::error_code ec;
  fs::rename(staging, file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to commit " << staging.string() << " to "
                             << file_path.string() << ": " << ec.message();
    throw StoreError("Store: Failed to store file: " + file_path.filename().string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Committed " << file_path.string();
}

bool UserStore::is_staging_name(const std::string& name) {
  const std::string suffix = STAGING_SUFFIX;
  return name.size() > suffix.size() + 1 && name[0] == '.' &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool UserStore::has(const fs::path& file_path) const {
  std::error_code ec;
  bool exists = fs::is_regular_file(file_path, ec);
  BOOST_LOG_TRIVIAL(debug) << "Store: " << file_path.string() << (exists ? " exists" : " not found");
  return exists;
}

std::uintmax_t UserStore::get_file_size(const fs::path& file_path) const {
  verify_file_exists(file_path);
  return fs::file_size(file_path);
}

std::vector<std::string> UserStore::list(const fs::path& sandbox) const {
  std::vector<std::string> files;

  std::error_code ec;
  for (fs::directory_iterator it(sandbox, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code status_ec;
    std::string name = it->path().filename().string();
    if (it->is_regular_file(status_ec) && !is_staging_name(name)) {
      files.push_back(name);
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to list " << sandbox.string() << ": " << ec.message();
    throw StoreError("Store: Failed to list files");
  }

  std::sort(files.begin(), files.end());
  BOOST_LOG_TRIVIAL(debug) << "Store: Listed " << files.size() << " files in " << sandbox.string();
  return files;
}

void UserStore::verify_file_exists(const fs::path& file_path) const {
  if (!has(file_path)) {
    BOOST_LOG_TRIVIAL(warning) << "Store: File not found: " << file_path.string();
    throw network::NotFound(file_path.filename().string());
  }
}

} // namespace storage
} // namespace vault
