#pragma once

#include <stubgate/interfaces.h>

namespace stubgate {

constexpr std::size_t kMaxListedFindings = 5;
constexpr std::size_t kMaxListedDiagnostics = 10;

class TextAdvisoryComposer : public AdvisoryComposer {
public:
  Advisory Compose(const std::filesystem::path &file,
                   const std::vector<Finding> &findings,
                   const std::vector<DiagnosticLine> &diagnostics) override;
};

} // namespace stubgate
