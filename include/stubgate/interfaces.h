#pragma once

#include <stubgate/models.h>

#include <cstddef>
#include <filesystem>
#include <vector>

namespace stubgate {

class StubDetector {
public:
  virtual ~StubDetector() = default;
  virtual std::vector<Finding> Scan(const std::filesystem::path &file) = 0;
};

class Linter {
public:
  virtual ~Linter() = default;
  virtual std::vector<DiagnosticLine> Lint(const std::filesystem::path &file,
                                           std::size_t max_errors) = 0;
};

class AdvisoryComposer {
public:
  virtual ~AdvisoryComposer() = default;
  virtual Advisory Compose(const std::filesystem::path &file,
                           const std::vector<Finding> &findings,
                           const std::vector<DiagnosticLine> &diagnostics) = 0;
};

} // namespace stubgate
