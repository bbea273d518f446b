#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "engram/audit/audit_log.hpp"

#include <fstream>
#include <sstream>

namespace {

engram::audit::AuditEntry policy_entry(const std::string &outcome, bool passed,
                                       const std::string &risk) {
  engram::audit::AuditEntry entry;
  entry.kind = engram::audit::EntryKind::Policy;
  entry.action = "evaluate";
  entry.outcome = outcome;
  entry.passed = passed;
  entry.risk = risk;
  entry.detail = "reason: text";
  return entry;
}

engram::audit::AuditEntry graph_entry(const std::string &action, const std::string &path) {
  engram::audit::AuditEntry entry;
  entry.kind = engram::audit::EntryKind::Graph;
  entry.action = action;
  entry.outcome = "ok";
  entry.path = path;
  entry.record_id = std::string(64, 'c');
  entry.detail = action + " " + path;
  return entry;
}

std::vector<std::string> read_lines(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

void write_lines(const std::filesystem::path &path, const std::vector<std::string> &lines) {
  std::ofstream out(path, std::ios::trunc);
  for (const auto &line : lines) {
    out << line << '\n';
  }
}

} // namespace

void register_audit_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  using engram::testing::TempWorkspace;
  namespace audit = engram::audit;

  tests.push_back({"audit_append_assigns_sequence_and_chain", [] {
                     TempWorkspace temp;
                     auto log = audit::AuditLog::open(temp.path() / "logbook", 120);
                     require(log.ok(), log.error());
                     auto first = log.value()->append(policy_entry("allow", true, "low"));
                     auto second = log.value()->append(graph_entry("sprout", "feature"));
                     require(first.ok() && second.ok(), "appends succeed");
                     require(first.value().seq == 1 && second.value().seq == 2, "seq increments");
                     require(first.value().prev_hash == std::string(64, '0'), "genesis prev hash");
                     require(second.value().prev_hash == first.value().hash, "entries chain");
                     require(second.value().timestamp >= first.value().timestamp,
                             "timestamps never go backwards");

                     auto verified = log.value()->verify_chain();
                     require(verified.ok(), verified.error());
                     require(verified.value().intact && verified.value().entries == 2,
                             "fresh chain is intact");
                   }});

  tests.push_back({"audit_entry_json_roundtrip_keeps_optional_fields", [] {
                     audit::AuditEntry entry = policy_entry("block", false, "high");
                     entry.seq = 7;
                     entry.timestamp = "2026-01-01T00:00:00.000000Z";
                     entry.category = "harm";
                     entry.constraints = {"deny_harm", "log_violation"};
                     entry.requires_escalation = true;
                     entry.ruleset_digest = std::string(64, 'd');
                     entry.prev_hash = std::string(64, '0');
                     entry.hash = std::string(64, 'e');
                     const std::string json = audit::entry_to_json(entry);
                     require(json.find("\"path\"") == std::string::npos, "absent path omitted");

                     auto parsed = audit::entry_from_json(json);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().seq == 7, "seq");
                     require(parsed.value().passed == std::optional<bool>(false), "passed");
                     require(parsed.value().constraints.size() == 2, "constraints");
                     require(parsed.value().requires_escalation, "escalation");
                     require(!parsed.value().path.has_value(), "path stays absent");
                     require(parsed.value().hash == entry.hash, "hash");
                   }});

  tests.push_back({"audit_detects_edited_entry", [] {
                     TempWorkspace temp;
                     auto log = audit::AuditLog::open(temp.path() / "logbook", 120);
                     require(log.ok(), log.error());
                     for (int i = 0; i < 3; ++i) {
                       require(log.value()->append(graph_entry("append", "p" + std::to_string(i))).ok(),
                               "append");
                     }
                     const auto path = log.value()->audit_path();
                     auto lines = read_lines(path);
                     require(lines.size() == 3, "three lines on disk");
                     const auto pos = lines[1].find("\"path\":\"p1\"");
                     require(pos != std::string::npos, "path field present");
                     lines[1].replace(pos, 11, "\"path\":\"px\"");
                     write_lines(path, lines);

                     auto verified = log.value()->verify_chain();
                     require(verified.ok(), verified.error());
                     require(!verified.value().intact, "edit detected");
                     require(verified.value().first_broken_seq == std::optional<std::uint64_t>(2),
                             "second entry reported");
                   }});

  tests.push_back({"audit_detects_deleted_entry", [] {
                     TempWorkspace temp;
                     auto log = audit::AuditLog::open(temp.path() / "logbook", 120);
                     require(log.ok(), log.error());
                     for (int i = 0; i < 3; ++i) {
                       require(log.value()->append(policy_entry("allow", true, "low")).ok(), "append");
                     }
                     auto lines = read_lines(log.value()->audit_path());
                     lines.erase(lines.begin() + 1);
                     write_lines(log.value()->audit_path(), lines);

                     auto verified = log.value()->verify_chain();
                     require(verified.ok(), verified.error());
                     require(!verified.value().intact, "gap detected");
                     require(verified.value().first_broken_seq == std::optional<std::uint64_t>(3),
                             "entry after the gap reported");
                   }});

  tests.push_back({"audit_query_filters_and_limits", [] {
                     TempWorkspace temp;
                     auto log = audit::AuditLog::open(temp.path() / "logbook", 120);
                     require(log.ok(), log.error());
                     require(log.value()->append(policy_entry("allow", true, "low")).ok(), "p1");
                     require(log.value()->append(graph_entry("sprout", "alpha")).ok(), "g1");
                     require(log.value()->append(policy_entry("block", false, "high")).ok(), "p2");
                     require(log.value()->append(graph_entry("append", "alpha")).ok(), "g2");
                     require(log.value()->append(graph_entry("append", "beta")).ok(), "g3");

                     audit::AuditFilter by_kind;
                     by_kind.kind = audit::EntryKind::Policy;
                     require(log.value()->query(by_kind).value().size() == 2, "kind filter");

                     audit::AuditFilter by_path;
                     by_path.path = "alpha";
                     require(log.value()->query(by_path).value().size() == 2, "path filter");

                     audit::AuditFilter failed;
                     failed.passed = false;
                     const auto blocked = log.value()->query(failed).value();
                     require(blocked.size() == 1 && blocked[0].outcome == "block", "passed filter");

                     audit::AuditFilter newest;
                     newest.action = "append";
                     newest.limit = 1;
                     const auto tail = log.value()->query(newest).value();
                     require(tail.size() == 1 && tail[0].path == std::optional<std::string>("beta"),
                             "limit keeps newest");

                     audit::AuditFilter future;
                     future.since = "2999-01-01T00:00:00Z";
                     require(log.value()->query(future).value().empty(), "time bound");
                   }});

  tests.push_back({"audit_stats_survive_reopen", [] {
                     TempWorkspace temp;
                     const auto dir = temp.path() / "logbook";
                     std::string last_hash;
                     {
                       auto log = audit::AuditLog::open(dir, 120);
                       require(log.ok(), log.error());
                       require(log.value()->append(policy_entry("allow", true, "low")).ok(), "p");
                       require(log.value()->append(policy_entry("block", false, "high")).ok(), "v");
                       auto g = log.value()->append(graph_entry("sprout", "main"));
                       require(g.ok(), g.error());
                       last_hash = g.value().hash;
                     }
                     auto log = audit::AuditLog::open(dir, 120);
                     require(log.ok(), log.error());
                     const auto stats = log.value()->stats();
                     require(stats.total_entries == 3, "total");
                     require(stats.evaluation_count == 2, "evaluations");
                     require(stats.mutation_count == 1, "mutations");
                     require(stats.violation_count == 1, "violations");

                     auto next = log.value()->append(graph_entry("append", "main"));
                     require(next.ok(), next.error());
                     require(next.value().seq == 4, "seq continues");
                     require(next.value().prev_hash == last_hash, "chain continues");
                     require(log.value()->verify_chain().value().intact, "still intact");
                   }});

  tests.push_back({"audit_violations_are_mirrored", [] {
                     TempWorkspace temp;
                     auto log = audit::AuditLog::open(temp.path() / "logbook", 120);
                     require(log.ok(), log.error());
                     require(log.value()->append(policy_entry("allow", true, "low")).ok(), "allow");
                     require(log.value()->append(policy_entry("block", false, "high")).ok(), "block");
                     require(log.value()->append(policy_entry("allow", true, "high")).ok(),
                             "high risk pass");
                     const auto mirrored = read_lines(log.value()->violations_path());
                     require(mirrored.size() == 2, "only violations mirrored");
                     require(read_lines(log.value()->audit_path()).size() == 3, "main log complete");
                   }});

  tests.push_back({"audit_preview_truncates_and_flattens", [] {
                     TempWorkspace temp;
                     auto log = audit::AuditLog::open(temp.path() / "logbook", 10);
                     require(log.ok(), log.error());
                     require(log.value()->preview("short") == "short", "short text unchanged");
                     require(log.value()->preview("line\nbreak") == "line break", "newline flattened");
                     require(log.value()->preview("abcdefghijklmnop") == "abcdefghij...",
                             "long text truncated");
                     // "é" is two bytes; the cut must not land between them.
                     require(log.value()->preview("abcdefghi\xC3\xA9xyz") == "abcdefghi...",
                             "utf-8 sequence kept whole");

                     audit::AuditEntry entry = graph_entry("append", "p");
                     entry.detail = std::string(50, 'x');
                     auto stored = log.value()->append(entry);
                     require(stored.ok(), stored.error());
                     require(stored.value().detail == std::string(10, 'x') + "...", "detail stored as preview");
                   }});
}
