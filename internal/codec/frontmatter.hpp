#pragma once

#include <string>
#include <string_view>

#include "internal/model/task_record.hpp"

namespace taskvault::codec {

/*
  Task file codec.

  Layout:

    ---
    <yaml mapping>
    ---

    <body>

  Decoding is strict: unknown keys, missing required keys, unknown state
  names and wrongly typed values all throw util::MalformedRecord. The body
  is never interpreted and round-trips byte for byte.
*/

struct Document {
  std::string frontmatter;
  std::string body;
};

// Splits on the opening and closing "---" lines.
Document SplitDocument(std::string_view text);

// True when the frontmatter carries an approval_id key.
bool IsApprovalDocument(std::string_view text);

model::TaskRecord     ParseTask(std::string_view text);
model::ApprovalRecord ParseApproval(std::string_view text);

std::string Serialize(const model::TaskRecord& record);
std::string Serialize(const model::ApprovalRecord& record);

} // namespace taskvault::codec
