#include <stubgate/project_root_resolver.h>

#include <algorithm>
#include <iterator>
#include <system_error>

namespace stubgate {
namespace {

bool HasMarker(const std::filesystem::path &directory,
               const std::vector<std::string> &markers) {
  return std::any_of(markers.begin(), markers.end(),
                     [&](const std::string &marker) {
                       std::error_code error;
                       return std::filesystem::exists(directory / marker,
                                                      error);
                     });
}

} // namespace

std::optional<std::filesystem::path>
FindProjectRoot(const std::filesystem::path &file,
                const std::vector<std::string> &markers, int max_ascents) {
  if (markers.empty()) {
    return std::nullopt;
  }

  std::error_code error;
  const auto absolute = std::filesystem::absolute(file, error);
  if (error) {
    return std::nullopt;
  }
  // Dot-dot components must not count as directories of their own.
  auto directory = absolute.lexically_normal().parent_path();

  for (int ascents = 0;; ++ascents) {
    if (HasMarker(directory, markers)) {
      return directory;
    }
    const auto parent = directory.parent_path();
    if (ascents >= max_ascents || parent == directory) {
      return std::nullopt;
    }
    directory = parent;
  }
}

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &potential_parent) {
  if (potential_parent.empty()) {
    return false;
  }

  std::error_code error;
  const auto parent =
      std::filesystem::weakly_canonical(potential_parent, error);
  if (error) {
    return false;
  }
  const auto normalized_candidate =
      std::filesystem::weakly_canonical(candidate, error);
  if (error) {
    return false;
  }

  return std::distance(parent.begin(), parent.end()) <=
             std::distance(normalized_candidate.begin(),
                           normalized_candidate.end()) &&
         std::equal(parent.begin(), parent.end(), normalized_candidate.begin());
}

} // namespace stubgate
