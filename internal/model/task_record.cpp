#include "internal/model/task_record.hpp"

#include <array>

namespace taskvault::model {
namespace {

constexpr std::array<std::string_view, 4> kApprovalStatusNames = {"pending", "approved", "rejected", "expired"};

} // namespace

std::string_view ToString(ApprovalStatus status) {
  const auto index = static_cast<std::size_t>(status);
  return index < kApprovalStatusNames.size() ? kApprovalStatusNames[index] : "unknown";
}

std::optional<ApprovalStatus> ParseApprovalStatus(std::string_view text) {
  for (std::size_t i = 0; i < kApprovalStatusNames.size(); ++i) {
    if (kApprovalStatusNames[i] == text) {
      return static_cast<ApprovalStatus>(i);
    }
  }
  return std::nullopt;
}

} // namespace taskvault::model
