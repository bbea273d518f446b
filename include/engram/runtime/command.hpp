#pragma once

#include "engram/audit/audit_log.hpp"
#include "engram/common/result.hpp"
#include "engram/dag/record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace engram::runtime {

class Engine;

struct WriteCommand {
  std::string lobe;
  std::string payload;
  std::optional<std::string> key;
};

struct ReadCommand {
  std::string id;
  std::optional<std::string> prefer;
};

struct ReadManyCommand {
  std::vector<std::string> ids;
  std::optional<std::string> prefer;
};

struct RecentCommand {
  std::string lobe;
  std::size_t n = 10;
};

struct StatsCommand {
  std::optional<std::string> lobe;
};

struct EvaluatePolicyCommand {
  std::string text;
  std::string purpose;
};

struct SproutCommand {
  std::string path;
  std::optional<std::string> base;
  std::optional<std::string> lobe;
};

struct AppendCommand {
  std::string path;
  std::string payload;
  dag::Tags meta;
};

struct ConsolidateCommand {
  std::string src;
  std::string dst;
};

struct TraceCommand {
  std::string path;
  std::size_t limit = 50;
};

struct LatestCommand {
  std::string path;
};

struct CiteCommand {
  std::string target;
};

struct IntegrityCommand {
  std::size_t verify_limit = 0;
};

struct AuditQueryCommand {
  audit::AuditFilter filter;
};

using Command =
    std::variant<WriteCommand, ReadCommand, ReadManyCommand, RecentCommand, StatsCommand,
                 EvaluatePolicyCommand, SproutCommand, AppendCommand, ConsolidateCommand,
                 TraceCommand, LatestCommand, CiteCommand, IntegrityCommand, AuditQueryCommand>;

/// Parses `{"action": "...", ...}`. Unknown actions and missing required
/// fields fail with InvalidArgument.
[[nodiscard]] common::Result<Command> decode_command(const std::string &json);

[[nodiscard]] std::string dispatch(Engine &engine, const Command &command);

[[nodiscard]] std::string handle_request(Engine &engine, const std::string &json);

} // namespace engram::runtime
