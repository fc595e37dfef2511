#include "storage/path_guard.hpp"
#include "network/protocol_error.hpp"
#include <boost/log/trivial.hpp>

namespace vault {
namespace storage {

namespace fs = std::filesystem;

fs::path PathGuard::resolve(const fs::path& sandbox_root, const std::string& raw_name) {
  if (raw_name.empty()) {
    throw network::PathRejected("empty file name");
  }
  if (raw_name.find('\0') != std::string::npos) {
    BOOST_LOG_TRIVIAL(warning) << "Path guard: Rejected name with embedded NUL";
    throw network::PathRejected("invalid character in file name");
  }

  fs::path candidate(raw_name);
  if (candidate.is_absolute() || candidate.has_root_name() || candidate.has_root_directory()) {
    BOOST_LOG_TRIVIAL(warning) << "Path guard: Rejected absolute name: " << raw_name;
    throw network::PathRejected("absolute paths are not allowed: " + raw_name);
  }

  fs::path canonical_root;
  fs::path resolved;
  try {
    canonical_root = fs::weakly_canonical(sandbox_root);
    // Resolves ".." and every symlink along the existing prefix
    resolved = fs::weakly_canonical(canonical_root / candidate);
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(warning) << "Path guard: Failed to canonicalize " << raw_name << ": " << e.what();
    throw network::PathRejected("cannot resolve " + raw_name);
  }

  if (!is_within(canonical_root, resolved)) {
    BOOST_LOG_TRIVIAL(warning) << "Path guard: Rejected escape from " << canonical_root.string()
                               << " via " << raw_name;
    throw network::PathRejected("outside of sandbox: " + raw_name);
  }

  // Existing symlinks were resolved above, so any left here dangle and could be written through
  std::error_code ec;
  if (fs::is_symlink(fs::symlink_status(resolved, ec))) {
    BOOST_LOG_TRIVIAL(warning) << "Path guard: Rejected dangling symlink: " << resolved.string();
    throw network::PathRejected("dangling symlink: " + raw_name);
  }

  BOOST_LOG_TRIVIAL(trace) << "Path guard: Resolved " << raw_name << " to " << resolved.string();
  return resolved;
}

bool PathGuard::is_within(const fs::path& root, const fs::path& candidate) {
  fs::path relative = candidate.lexically_relative(root);
  if (relative.empty()) {
    return false;
  }
  if (relative == ".") {
    return true;
  }
  return *relative.begin() != "..";
}

} // namespace storage
} // namespace vault
