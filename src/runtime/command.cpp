#include "engram/runtime/command.hpp"

#include "engram/common/json_util.hpp"
#include "engram/policy/engine.hpp"
#include "engram/recall/resolver.hpp"
#include "engram/runtime/engine.hpp"

#include <charconv>

namespace engram::runtime {

namespace {

using CommandResult = common::Result<Command>;

CommandResult missing(const std::string &action, const std::string &field) {
  return CommandResult::failure(common::ErrorCode::InvalidArgument,
                                "'" + action + "' requires field '" + field + "'");
}

std::optional<std::string> optional_string(const std::string &json, const std::string &field) {
  if (!common::json_has_field(json, field)) {
    return std::nullopt;
  }
  return common::json_get_string(json, field);
}

/// Missing field yields `fallback`; a present non-integer fails.
common::Result<std::size_t> size_field(const std::string &json, const std::string &field,
                                       const std::size_t fallback) {
  if (!common::json_has_field(json, field)) {
    return common::Result<std::size_t>::success(fallback);
  }
  const std::string text = common::json_get_number(json, field);
  std::size_t value = 0;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
    return common::Result<std::size_t>::failure(common::ErrorCode::InvalidArgument,
                                                "field '" + field +
                                                    "' must be a non-negative integer");
  }
  return common::Result<std::size_t>::success(value);
}

std::string ok_response(const std::string &result_json) {
  return common::JsonWriter().boolean("ok", true).raw("result", result_json).str();
}

std::string error_response(const common::ErrorCode code, const std::string &message) {
  return common::JsonWriter()
      .boolean("ok", false)
      .string("error", std::string(common::error_code_name(code)))
      .string("message", message)
      .str();
}

template <typename T, typename Render>
std::string respond(const common::Result<T> &result, Render render) {
  if (!result.ok()) {
    return error_response(result.code(), result.error());
  }
  return ok_response(render(result.value()));
}

std::string render_id(const std::string &id) { return common::json_quote(id); }

std::string render_tiers(const std::vector<recall::Tier> &tiers) {
  std::vector<std::string> names;
  names.reserve(tiers.size());
  for (const auto tier : tiers) {
    names.push_back(recall::tier_name(tier));
  }
  return common::json_string_array(names);
}

// One overload per command alternative; std::visit fails to compile if one
// is missing.

std::string run(Engine &engine, const WriteCommand &cmd) {
  return respond(engine.write(cmd.lobe, cmd.payload, cmd.key), render_id);
}

std::string run(Engine &engine, const ReadCommand &cmd) {
  return respond(engine.read(cmd.id, cmd.prefer), [](const recall::RecallHit &hit) {
    return common::JsonWriter()
        .string("id", hit.id)
        .string("payload", hit.payload)
        .string("source", recall::tier_name(hit.source))
        .str();
  });
}

std::string run(Engine &engine, const ReadManyCommand &cmd) {
  return respond(engine.read_many(cmd.ids, cmd.prefer),
                 [](const std::vector<recall::RecallOutcome> &outcomes) {
                   std::vector<std::string> items;
                   for (const auto &outcome : outcomes) {
                     common::JsonWriter item;
                     item.string("id", outcome.id).boolean("ok", outcome.ok());
                     if (outcome.ok()) {
                       item.string("payload", outcome.hit->payload)
                           .string("source", recall::tier_name(outcome.hit->source));
                     } else {
                       item.string("error", std::string(common::error_code_name(outcome.code)))
                           .string("message", outcome.message);
                     }
                     items.push_back(item.str());
                   }
                   return common::json_array(items);
                 });
}

std::string run(Engine &engine, const RecentCommand &cmd) {
  return respond(engine.recent(cmd.lobe, cmd.n), [](const std::vector<std::string> &ids) {
    return common::json_string_array(ids);
  });
}

std::string run(Engine &engine, const StatsCommand &cmd) {
  return respond(engine.stats(cmd.lobe), [](const Stats &stats) {
    common::JsonWriter by_lobe;
    for (const auto &[lobe, count] : stats.by_lobe) {
      by_lobe.unsigned_integer(lobe, count);
    }
    return common::JsonWriter()
        .unsigned_integer("total", stats.total)
        .unsigned_integer("archived_count", stats.archived_count)
        .raw("by_lobe", by_lobe.str())
        .string("last_updated", stats.last_updated)
        .str();
  });
}

std::string run(Engine &engine, const EvaluatePolicyCommand &cmd) {
  return respond(engine.evaluate_policy(cmd.text, cmd.purpose), policy::decision_to_json);
}

std::string run(Engine &engine, const SproutCommand &cmd) {
  return respond(engine.sprout(cmd.path, cmd.base, cmd.lobe), render_id);
}

std::string run(Engine &engine, const AppendCommand &cmd) {
  return respond(engine.append_to_path(cmd.path, cmd.payload, cmd.meta), render_id);
}

std::string run(Engine &engine, const ConsolidateCommand &cmd) {
  return respond(engine.consolidate(cmd.src, cmd.dst), render_id);
}

std::string run(Engine &engine, const TraceCommand &cmd) {
  return respond(engine.trace(cmd.path, cmd.limit), [](const std::vector<dag::TraceEntry> &trace) {
    std::vector<std::string> items;
    for (const auto &entry : trace) {
      items.push_back(common::JsonWriter()
                          .string("record_id", entry.record_id)
                          .string("timestamp", entry.timestamp)
                          .string("lobe", entry.lobe)
                          .string("key", entry.key)
                          .str());
    }
    return common::json_array(items);
  });
}

std::string run(Engine &engine, const LatestCommand &cmd) {
  return respond(engine.latest_on_path(cmd.path), [](const LatestRecord &latest) {
    return common::JsonWriter()
        .string("record_id", latest.record_id)
        .string("payload", latest.payload)
        .raw("meta", dag::encode_tags(latest.meta))
        .str();
  });
}

std::string run(Engine &engine, const CiteCommand &cmd) {
  return respond(engine.cite_sources(cmd.target), [](const std::vector<Citation> &citations) {
    std::vector<std::string> items;
    for (const auto &citation : citations) {
      common::JsonWriter item;
      item.string("record_id", citation.record_id);
      if (citation.source.has_value()) {
        item.string("source", *citation.source);
      } else {
        item.null("source");
      }
      item.raw("tiers", render_tiers(citation.tiers));
      items.push_back(item.str());
    }
    return common::json_array(items);
  });
}

std::string run(Engine &engine, const IntegrityCommand &cmd) {
  const auto report = engine.integrity_check();
  common::JsonWriter out;
  out.boolean("fast_index_present", report.fast_index_present)
      .boolean("blob_store_present", report.blob_store_present)
      .boolean("graph_present", report.graph_present)
      .boolean("audit_log_present", report.audit_log_present);

  if (cmd.verify_limit > 0) {
    const auto verification = engine.verify_records(cmd.verify_limit);
    std::vector<std::string> failures;
    for (const auto &failure : verification.failures) {
      failures.push_back(common::JsonWriter()
                             .string("record_id", failure.record_id)
                             .string("error", std::string(common::error_code_name(failure.code)))
                             .string("message", failure.message)
                             .str());
    }
    out.raw("verification", common::JsonWriter()
                                .unsigned_integer("checked", verification.checked)
                                .raw("failures", common::json_array(failures))
                                .str());
  }
  return ok_response(out.str());
}

std::string run(Engine &engine, const AuditQueryCommand &cmd) {
  return respond(engine.audit_query(cmd.filter), [](const std::vector<audit::AuditEntry> &entries) {
    std::vector<std::string> items;
    items.reserve(entries.size());
    for (const auto &entry : entries) {
      items.push_back(audit::entry_to_json(entry));
    }
    return common::json_array(items);
  });
}

} // namespace

common::Result<Command> decode_command(const std::string &json) {
  const std::string action = common::json_get_string(json, "action");
  if (action.empty()) {
    return CommandResult::failure(common::ErrorCode::InvalidArgument,
                                  "request has no 'action' field");
  }

  const auto require = [&](const std::string &field) {
    return common::json_has_field(json, field);
  };

  if (action == "write") {
    if (!require("payload")) {
      return missing(action, "payload");
    }
    return CommandResult::success(WriteCommand{common::json_get_string(json, "lobe"),
                                               common::json_get_string(json, "payload"),
                                               optional_string(json, "key")});
  }
  if (action == "read") {
    if (!require("id")) {
      return missing(action, "id");
    }
    return CommandResult::success(
        ReadCommand{common::json_get_string(json, "id"), optional_string(json, "prefer")});
  }
  if (action == "read_many") {
    if (!require("ids")) {
      return missing(action, "ids");
    }
    return CommandResult::success(ReadManyCommand{common::json_get_string_array(json, "ids"),
                                                  optional_string(json, "prefer")});
  }
  if (action == "recent") {
    const auto n = size_field(json, "n", 10);
    if (!n.ok()) {
      return CommandResult::failure(n.status());
    }
    return CommandResult::success(RecentCommand{common::json_get_string(json, "lobe"), n.value()});
  }
  if (action == "stats") {
    return CommandResult::success(StatsCommand{optional_string(json, "lobe")});
  }
  if (action == "evaluate_policy") {
    if (!require("text")) {
      return missing(action, "text");
    }
    std::string purpose = common::json_get_string(json, "purpose");
    if (purpose.empty()) {
      purpose = "chat_message";
    }
    return CommandResult::success(
        EvaluatePolicyCommand{common::json_get_string(json, "text"), std::move(purpose)});
  }
  if (action == "sprout") {
    if (!require("path")) {
      return missing(action, "path");
    }
    return CommandResult::success(SproutCommand{common::json_get_string(json, "path"),
                                                optional_string(json, "base"),
                                                optional_string(json, "lobe")});
  }
  if (action == "append") {
    if (!require("path")) {
      return missing(action, "path");
    }
    if (!require("payload")) {
      return missing(action, "payload");
    }
    dag::Tags meta;
    if (require("meta")) {
      meta = dag::decode_tags(common::json_get_object(json, "meta"));
    }
    return CommandResult::success(AppendCommand{common::json_get_string(json, "path"),
                                                common::json_get_string(json, "payload"),
                                                std::move(meta)});
  }
  if (action == "consolidate") {
    if (!require("src")) {
      return missing(action, "src");
    }
    return CommandResult::success(ConsolidateCommand{common::json_get_string(json, "src"),
                                                     common::json_get_string(json, "dst")});
  }
  if (action == "trace") {
    if (!require("path")) {
      return missing(action, "path");
    }
    const auto limit = size_field(json, "limit", 50);
    if (!limit.ok()) {
      return CommandResult::failure(limit.status());
    }
    return CommandResult::success(TraceCommand{common::json_get_string(json, "path"), limit.value()});
  }
  if (action == "latest") {
    if (!require("path")) {
      return missing(action, "path");
    }
    return CommandResult::success(LatestCommand{common::json_get_string(json, "path")});
  }
  if (action == "cite") {
    if (!require("target")) {
      return missing(action, "target");
    }
    return CommandResult::success(CiteCommand{common::json_get_string(json, "target")});
  }
  if (action == "integrity") {
    const auto verify = size_field(json, "verify_limit", 0);
    if (!verify.ok()) {
      return CommandResult::failure(verify.status());
    }
    return CommandResult::success(IntegrityCommand{verify.value()});
  }
  if (action == "audit_query") {
    audit::AuditFilter filter;
    if (const auto kind = optional_string(json, "kind"); kind.has_value()) {
      filter.kind = audit::parse_entry_kind(*kind);
      if (!filter.kind.has_value()) {
        return CommandResult::failure(common::ErrorCode::InvalidArgument,
                                      "unknown audit entry kind '" + *kind + "'");
      }
    }
    filter.action = optional_string(json, "filter_action");
    filter.outcome = optional_string(json, "outcome");
    filter.path = optional_string(json, "path");
    filter.record_id = optional_string(json, "record_id");
    if (require("passed")) {
      filter.passed = common::json_get_bool(json, "passed", false);
    }
    filter.since = optional_string(json, "since");
    filter.until = optional_string(json, "until");
    const auto limit = size_field(json, "limit", 0);
    if (!limit.ok()) {
      return CommandResult::failure(limit.status());
    }
    filter.limit = limit.value();
    return CommandResult::success(AuditQueryCommand{std::move(filter)});
  }

  return CommandResult::failure(common::ErrorCode::InvalidArgument,
                                "unknown action '" + action + "'");
}

std::string dispatch(Engine &engine, const Command &command) {
  return std::visit([&engine](const auto &cmd) { return run(engine, cmd); }, command);
}

std::string handle_request(Engine &engine, const std::string &json) {
  const auto command = decode_command(json);
  if (!command.ok()) {
    return error_response(command.code(), command.error());
  }
  return dispatch(engine, command.value());
}

} // namespace engram::runtime
