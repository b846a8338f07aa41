#include "internal/audit/audit_logger.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace taskvault::audit {

using observability::StringField;

AuditLogger::AuditLogger(storage::FileSystemPtr fs, storage::VaultLayout layout, util::ClockFn clock)
    : fs_(std::move(fs)), layout_(std::move(layout)), clock_(std::move(clock)) {
}

std::filesystem::path AuditLogger::LogPathFor(util::TimePoint tp) const {
  return layout_.LogsDir() / (util::DayStamp(tp) + ".log");
}

void AuditLogger::Record(taskvault::v1::AuditEntry entry) noexcept {
  try {
    if (entry.entry_id().empty()) {
      entry.set_entry_id(util::ToString(util::GenerateUUID()));
    }
    if (!entry.has_timestamp()) {
      *entry.mutable_timestamp() = util::ToProto(clock_());
    }

    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string line;
    auto        status = google::protobuf::util::MessageToJsonString(entry, &line, options);
    if (!status.ok()) {
      throw std::runtime_error("audit entry serialization failed: " + std::string(status.message()));
    }

    fs_->AppendLine(LogPathFor(util::FromProto(entry.timestamp())), line);
  } catch (const std::exception& e) {
    failures_.fetch_add(1);
    TASKVAULT_LOG_ERROR("Audit log write failed",
                        {StringField("action", entry.action()), StringField("task_id", entry.task_id()), StringField("error", e.what())});
  }
}

} // namespace taskvault::audit
