#include "core/batch/batch_types.hpp"

#include <algorithm>
#include <utility>

#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/time_utils.hpp"

namespace netbatch::core::batch {

namespace json = common::json;

const char* ToString(CommandStatus status) {
  switch (status) {
    case CommandStatus::Ok:      return "ok";
    case CommandStatus::Error:   return "error";
    case CommandStatus::Timeout: return "timeout";
    default:                     return "unknown";
  }
}

CommandResult CommandResult::Success(const CommandTask& task, std::string output,
                                     std::chrono::milliseconds duration) {
  CommandResult r;
  r.device_name = task.device.name;
  r.command = task.command;
  r.intent = task.intent;
  r.status = CommandStatus::Ok;
  r.output = std::move(output);
  r.duration = duration;
  r.attempts = task.attempt;
  return r;
}

CommandResult CommandResult::Failure(const CommandTask& task, CommandStatus status,
                                     common::ErrorCode code, std::string detail,
                                     std::chrono::milliseconds duration) {
  CommandResult r;
  r.device_name = task.device.name;
  r.command = task.command;
  r.intent = task.intent;
  r.status = status == CommandStatus::Ok ? CommandStatus::Error : status;
  r.error = detail.empty() ? std::string(common::ToString(code)) : std::move(detail);
  r.error_code = code;
  r.duration = duration;
  r.attempts = task.attempt;
  return r;
}

std::string CommandResult::ToJson() const {
  json::Fields f{
      {"device", json::Quote(device_name)},
      {"command", json::Quote(command)},
  };
  if (!intent.empty()) f.emplace_back("intent", json::Quote(intent));
  f.emplace_back("status", json::Quote(ToString(status)));
  if (output) f.emplace_back("output", json::Quote(*output));
  if (error) {
    f.emplace_back("error", json::Quote(*error));
    f.emplace_back("error_code", json::Quote(common::ToString(error_code)));
  }
  f.emplace_back("duration_ms", json::Number(static_cast<std::int64_t>(duration.count())));
  f.emplace_back("attempts", json::Number(static_cast<std::uint64_t>(attempts)));
  return json::Object(f);
}

std::vector<CommandResult> BatchResult::ResultsFor(const std::string& device_name) const {
  std::vector<CommandResult> out;
  for (const auto& r : results) {
    if (r.device_name == device_name) out.push_back(r);
  }
  return out;
}

std::size_t BatchResult::CountStatus(CommandStatus status) const {
  return static_cast<std::size_t>(std::count_if(
      results.begin(), results.end(), [status](const CommandResult& r) { return r.status == status; }));
}

std::chrono::milliseconds BatchResult::Elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(finished_at - started_at);
}

std::string BatchResult::Summary() const {
  std::string s = "Batch " + run_id;
  s += cancelled ? " cancelled" : " finished";
  s += " (devices=" + std::to_string(devices_requested.size());
  s += ", succeeded=" + std::to_string(devices_succeeded.size());
  s += ", failed=" + std::to_string(devices_failed.size());
  s += ", ok=" + std::to_string(CountStatus(CommandStatus::Ok));
  s += ", error=" + std::to_string(CountStatus(CommandStatus::Error));
  s += ", timeout=" + std::to_string(CountStatus(CommandStatus::Timeout));
  s += ", elapsed_ms=" + std::to_string(Elapsed().count()) + ")";
  return s;
}

std::string BatchResult::ToJson() const {
  std::vector<std::string> items;
  items.reserve(results.size());
  for (const auto& r : results) items.push_back(r.ToJson());

  return json::Object({
      {"run_id", json::Quote(run_id)},
      {"started_at", json::Quote(common::time::FormatIso8601Utc(started_at))},
      {"finished_at", json::Quote(common::time::FormatIso8601Utc(finished_at))},
      {"duration_ms", json::Number(static_cast<std::int64_t>(Elapsed().count()))},
      {"cancelled", json::Bool(cancelled)},
      {"commands", json::StringArray(commands)},
      {"devices_requested", json::StringArray(devices_requested)},
      {"devices_succeeded", json::StringArray(devices_succeeded)},
      {"devices_failed", json::StringArray(devices_failed)},
      {"results", json::Array(items)},
  });
}

}  // namespace netbatch::core::batch
