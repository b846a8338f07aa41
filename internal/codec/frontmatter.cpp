#include "internal/codec/frontmatter.hpp"

#include <yaml-cpp/yaml.h>

#include <initializer_list>
#include <set>

#include "internal/util/errors.hpp"

namespace taskvault::codec {

using model::ApprovalRecord;
using model::HistoryEntry;
using model::TaskRecord;
using util::MalformedRecord;

namespace {

constexpr std::string_view kDelimiter = "---";

const std::set<std::string> kTaskKeys = {
    "task_id", "state", "priority", "created_at", "modified_at", "retry_count", "state_history", "metadata",
};

const std::set<std::string> kApprovalKeys = {
    "approval_id", "task_id",     "state",    "priority",   "created_at",       "modified_at", "retry_count",
    "state_history", "metadata",  "nonce",    "integrity_hash", "approval_status", "expires_at",  "action_type",
    "risk_level",  "rejection_reason", "reviewed_at", "reviewer",
};

const std::set<std::string> kHistoryKeys = {"state", "timestamp", "actor", "reason"};

// ------------------------------------------------------------
// Decoding helpers
// ------------------------------------------------------------

void RejectUnknownKeys(const YAML::Node& map, const std::set<std::string>& allowed, std::string_view context) {
  for (const auto& item : map) {
    const auto key = item.first.as<std::string>();
    if (allowed.count(key) == 0) {
      throw MalformedRecord("unknown field '" + key + "' in " + std::string(context));
    }
  }
}

const YAML::Node Require(const YAML::Node& map, const char* key, std::string_view context) {
  const YAML::Node node = map[key];
  if (!node || node.IsNull()) {
    throw MalformedRecord("missing required field '" + std::string(key) + "' in " + std::string(context));
  }
  return node;
}

std::string AsString(const YAML::Node& node, const char* key) {
  if (!node.IsScalar()) {
    throw MalformedRecord("field '" + std::string(key) + "' must be a scalar");
  }
  return node.Scalar();
}

std::string RequireString(const YAML::Node& map, const char* key, std::string_view context) {
  return AsString(Require(map, key, context), key);
}

std::optional<std::string> OptionalString(const YAML::Node& map, const char* key) {
  const YAML::Node node = map[key];
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  return AsString(node, key);
}

util::TimePoint AsTimestamp(const YAML::Node& node, const char* key) {
  const auto text = AsString(node, key);
  try {
    return util::ParseTimestamp(text);
  } catch (const std::invalid_argument&) {
    throw MalformedRecord("field '" + std::string(key) + "' is not an RFC 3339 timestamp: '" + text + "'");
  }
}

model::TaskState AsState(const YAML::Node& node, const char* key) {
  const auto text  = AsString(node, key);
  const auto state = model::ParseTaskState(text);
  if (!state) {
    throw MalformedRecord("field '" + std::string(key) + "' names unknown state '" + text + "'");
  }
  return *state;
}

uint32_t AsCount(const YAML::Node& node, const char* key) {
  const auto text = AsString(node, key);
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 9) {
    throw MalformedRecord("field '" + std::string(key) + "' must be a non-negative integer, got '" + text + "'");
  }
  return static_cast<uint32_t>(std::stoul(text));
}

std::vector<HistoryEntry> DecodeHistory(const YAML::Node& node) {
  if (!node.IsSequence()) {
    throw MalformedRecord("field 'state_history' must be a list");
  }

  std::vector<HistoryEntry> history;
  history.reserve(node.size());
  for (const auto& item : node) {
    if (!item.IsMap()) {
      throw MalformedRecord("state_history entries must be mappings");
    }
    RejectUnknownKeys(item, kHistoryKeys, "state_history entry");

    HistoryEntry entry;
    entry.state     = AsState(Require(item, "state", "state_history entry"), "state");
    entry.timestamp = AsTimestamp(Require(item, "timestamp", "state_history entry"), "timestamp");
    entry.actor     = OptionalString(item, "actor").value_or("");
    entry.reason    = OptionalString(item, "reason").value_or("");
    history.push_back(std::move(entry));
  }
  return history;
}

std::map<std::string, std::string> DecodeMetadata(const YAML::Node& node) {
  if (!node || node.IsNull()) {
    return {};
  }
  if (!node.IsMap()) {
    throw MalformedRecord("field 'metadata' must be a mapping");
  }

  std::map<std::string, std::string> metadata;
  for (const auto& item : node) {
    metadata[item.first.as<std::string>()] = AsString(item.second, "metadata");
  }
  return metadata;
}

YAML::Node LoadFrontmatter(const std::string& yaml_text, std::string_view context) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw MalformedRecord("unparseable frontmatter: " + std::string(e.what()));
  }
  if (!root.IsMap()) {
    throw MalformedRecord("frontmatter of " + std::string(context) + " must be a mapping");
  }
  return root;
}

// Fields shared by tasks and approvals. `id_key` names the identity field.
void DecodeCommon(const YAML::Node& root, const char* id_key, std::string_view context, TaskRecord* record) {
  record->id            = RequireString(root, id_key, context);
  record->state         = AsState(Require(root, "state", context), "state");
  record->created_at    = AsTimestamp(Require(root, "created_at", context), "created_at");
  record->state_history = DecodeHistory(Require(root, "state_history", context));
  record->priority      = OptionalString(root, "priority").value_or("normal");
  record->metadata      = DecodeMetadata(root["metadata"]);

  const auto modified = root["modified_at"];
  record->modified_at = (modified && !modified.IsNull()) ? AsTimestamp(modified, "modified_at") : record->created_at;

  const auto retries  = root["retry_count"];
  record->retry_count = (retries && !retries.IsNull()) ? AsCount(retries, "retry_count") : 0;
}

// ------------------------------------------------------------
// Encoding helpers
// ------------------------------------------------------------

void EmitCommonHead(YAML::Emitter& out, const TaskRecord& record) {
  out << YAML::Key << "state" << YAML::Value << std::string(model::ToString(record.state));
  out << YAML::Key << "priority" << YAML::Value << record.priority;
  out << YAML::Key << "created_at" << YAML::Value << util::FormatTimestamp(record.created_at);
  out << YAML::Key << "modified_at" << YAML::Value << util::FormatTimestamp(record.modified_at);
  out << YAML::Key << "retry_count" << YAML::Value << record.retry_count;
}

void EmitCommonTail(YAML::Emitter& out, const TaskRecord& record) {
  out << YAML::Key << "state_history" << YAML::Value << YAML::BeginSeq;
  for (const auto& entry : record.state_history) {
    out << YAML::BeginMap;
    out << YAML::Key << "state" << YAML::Value << std::string(model::ToString(entry.state));
    out << YAML::Key << "timestamp" << YAML::Value << util::FormatTimestamp(entry.timestamp);
    if (!entry.actor.empty()) {
      out << YAML::Key << "actor" << YAML::Value << entry.actor;
    }
    if (!entry.reason.empty()) {
      out << YAML::Key << "reason" << YAML::Value << entry.reason;
    }
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  if (!record.metadata.empty()) {
    out << YAML::Key << "metadata" << YAML::Value << YAML::BeginMap;
    for (const auto& [key, value] : record.metadata) {
      out << YAML::Key << key << YAML::Value << value;
    }
    out << YAML::EndMap;
  }
}

std::string Assemble(const YAML::Emitter& out, const std::string& body) {
  if (!out.good()) {
    throw MalformedRecord("failed to emit frontmatter: " + out.GetLastError());
  }

  std::string text;
  text.reserve(out.size() + body.size() + 16);
  text.append(kDelimiter).append("\n");
  text.append(out.c_str());
  text.append("\n").append(kDelimiter).append("\n\n");
  text.append(body);
  return text;
}

} // namespace

Document SplitDocument(std::string_view text) {
  if (text.substr(0, kDelimiter.size() + 1) != "---\n") {
    throw MalformedRecord("task file must start with a '---' line");
  }

  // closing delimiter is a line holding exactly "---"
  const auto open_end = kDelimiter.size();
  auto       search   = open_end;
  auto       close    = std::string_view::npos;
  while (true) {
    close = text.find("\n---", search);
    if (close == std::string_view::npos) {
      throw MalformedRecord("task file has no closing '---' line");
    }
    const auto line_end = close + 1 + kDelimiter.size();
    if (line_end == text.size() || text[line_end] == '\n') {
      break;
    }
    search = close + 1;
  }

  Document doc;
  if (close > open_end) {
    doc.frontmatter = std::string(text.substr(open_end + 1, close - open_end - 1));
  }

  auto after = close + 1 + kDelimiter.size();
  if (after < text.size()) {
    ++after; // newline ending the delimiter line
  }
  if (after < text.size() && text[after] == '\n') {
    ++after; // separating blank line
  }
  doc.body = std::string(text.substr(after));
  return doc;
}

bool IsApprovalDocument(std::string_view text) {
  try {
    const auto doc  = SplitDocument(text);
    const auto root = YAML::Load(doc.frontmatter);
    return root.IsMap() && root["approval_id"];
  } catch (const YAML::Exception&) {
    return false;
  } catch (const MalformedRecord&) {
    return false;
  }
}

TaskRecord ParseTask(std::string_view text) {
  const auto doc  = SplitDocument(text);
  const auto root = LoadFrontmatter(doc.frontmatter, "task");

  if (root["approval_id"]) {
    throw MalformedRecord("document is an approval record, not a task");
  }
  RejectUnknownKeys(root, kTaskKeys, "task frontmatter");

  TaskRecord record;
  try {
    DecodeCommon(root, "task_id", "task frontmatter", &record);
  } catch (const YAML::Exception& e) {
    throw MalformedRecord("malformed task frontmatter: " + std::string(e.what()));
  }
  record.body = doc.body;
  return record;
}

ApprovalRecord ParseApproval(std::string_view text) {
  const auto doc  = SplitDocument(text);
  const auto root = LoadFrontmatter(doc.frontmatter, "approval");

  RejectUnknownKeys(root, kApprovalKeys, "approval frontmatter");

  ApprovalRecord record;
  try {
    DecodeCommon(root, "approval_id", "approval frontmatter", &record);

    record.task_id = RequireString(root, "task_id", "approval frontmatter");
    record.nonce   = RequireString(root, "nonce", "approval frontmatter");

    const auto status_text = RequireString(root, "approval_status", "approval frontmatter");
    const auto status      = model::ParseApprovalStatus(status_text);
    if (!status) {
      throw MalformedRecord("field 'approval_status' has unknown value '" + status_text + "'");
    }
    record.approval_status = *status;

    record.expires_at       = AsTimestamp(Require(root, "expires_at", "approval frontmatter"), "expires_at");
    record.integrity_hash   = OptionalString(root, "integrity_hash");
    record.action_type      = OptionalString(root, "action_type").value_or("");
    record.risk_level       = OptionalString(root, "risk_level").value_or("");
    record.rejection_reason = OptionalString(root, "rejection_reason");
    record.reviewer         = OptionalString(root, "reviewer");

    const auto reviewed = root["reviewed_at"];
    if (reviewed && !reviewed.IsNull()) {
      record.reviewed_at = AsTimestamp(reviewed, "reviewed_at");
    }
  } catch (const YAML::Exception& e) {
    throw MalformedRecord("malformed approval frontmatter: " + std::string(e.what()));
  }
  record.body = doc.body;
  return record;
}

std::string Serialize(const TaskRecord& record) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "task_id" << YAML::Value << record.id;
  EmitCommonHead(out, record);
  EmitCommonTail(out, record);
  out << YAML::EndMap;
  return Assemble(out, record.body);
}

std::string Serialize(const ApprovalRecord& record) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "approval_id" << YAML::Value << record.id;
  out << YAML::Key << "task_id" << YAML::Value << record.task_id;
  EmitCommonHead(out, record);
  out << YAML::Key << "nonce" << YAML::Value << record.nonce;
  if (record.integrity_hash) {
    out << YAML::Key << "integrity_hash" << YAML::Value << *record.integrity_hash;
  }
  out << YAML::Key << "approval_status" << YAML::Value << std::string(model::ToString(record.approval_status));
  out << YAML::Key << "expires_at" << YAML::Value << util::FormatTimestamp(record.expires_at);
  if (!record.action_type.empty()) {
    out << YAML::Key << "action_type" << YAML::Value << record.action_type;
  }
  if (!record.risk_level.empty()) {
    out << YAML::Key << "risk_level" << YAML::Value << record.risk_level;
  }
  if (record.rejection_reason) {
    out << YAML::Key << "rejection_reason" << YAML::Value << *record.rejection_reason;
  }
  if (record.reviewed_at) {
    out << YAML::Key << "reviewed_at" << YAML::Value << util::FormatTimestamp(*record.reviewed_at);
  }
  if (record.reviewer) {
    out << YAML::Key << "reviewer" << YAML::Value << *record.reviewer;
  }
  EmitCommonTail(out, record);
  out << YAML::EndMap;
  return Assemble(out, record.body);
}

} // namespace taskvault::codec
