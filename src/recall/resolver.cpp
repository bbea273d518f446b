#include "engram/recall/resolver.hpp"

#include "engram/common/fs.hpp"

namespace engram::recall {

namespace {

constexpr Tier ALL_TIERS[] = {Tier::Fast, Tier::Blob, Tier::Graph};

} // namespace

std::string tier_name(const Tier tier) {
  switch (tier) {
  case Tier::Fast:
    return "fast";
  case Tier::Blob:
    return "blob";
  case Tier::Graph:
    return "graph";
  }
  return "fast";
}

std::string prefer_name(const Prefer prefer) {
  switch (prefer) {
  case Prefer::Auto:
    return "auto";
  case Prefer::Fast:
    return "fast";
  case Prefer::Blob:
    return "blob";
  case Prefer::Graph:
    return "graph";
  }
  return "auto";
}

common::Result<Prefer> parse_prefer(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized.empty() || normalized == "auto") {
    return common::Result<Prefer>::success(Prefer::Auto);
  }
  if (normalized == "fast" || normalized == "hot") {
    return common::Result<Prefer>::success(Prefer::Fast);
  }
  if (normalized == "blob" || normalized == "archive") {
    return common::Result<Prefer>::success(Prefer::Blob);
  }
  if (normalized == "graph" || normalized == "dag") {
    return common::Result<Prefer>::success(Prefer::Graph);
  }
  return common::Result<Prefer>::failure(common::ErrorCode::InvalidArgument,
                                         "unknown recall preference '" + value + "'");
}

Resolver::Resolver(store::FastIndex &fast, store::BlobStore &blobs, dag::GraphStore &graph,
                   const bool verify_tiers)
    : fast_(fast), blobs_(blobs), graph_(graph), verify_tiers_(verify_tiers) {}

common::Result<std::optional<std::string>> Resolver::fetch(const Tier tier,
                                                           const std::string &id) const {
  using FetchResult = common::Result<std::optional<std::string>>;
  switch (tier) {
  case Tier::Fast: {
    const auto row = fast_.get(id);
    if (!row.ok()) {
      return FetchResult::failure(row.status());
    }
    if (!row.value().has_value()) {
      return FetchResult::success(std::nullopt);
    }
    return FetchResult::success(row.value()->payload);
  }
  case Tier::Blob: {
    std::optional<std::string> cid;
    const auto row = fast_.get(id);
    if (row.ok() && row.value().has_value()) {
      cid = row.value()->cid;
    } else if (const auto node = graph_.get(id); node.has_value()) {
      cid = node->cid;
    }
    if (!cid.has_value()) {
      return FetchResult::success(std::nullopt);
    }
    auto bytes = blobs_.get(*cid);
    if (!bytes.ok()) {
      if (bytes.code() == common::ErrorCode::NotFound) {
        return FetchResult::success(std::nullopt);
      }
      return FetchResult::failure(bytes.status());
    }
    return FetchResult::success(std::move(bytes.value()));
  }
  case Tier::Graph: {
    const auto node = graph_.get(id);
    if (!node.has_value()) {
      return FetchResult::success(std::nullopt);
    }
    return FetchResult::success(node->payload);
  }
  }
  return FetchResult::success(std::nullopt);
}

common::Status Resolver::verify_against_others(const std::string &id,
                                               const std::string &payload,
                                               const Tier source) const {
  for (const Tier tier : ALL_TIERS) {
    if (tier == source) {
      continue;
    }
    const auto other = fetch(tier, id);
    if (!other.ok()) {
      return other.status();
    }
    if (other.value().has_value() && *other.value() != payload) {
      return common::Status::error(common::ErrorCode::IntegrityMismatch,
                                   "record " + id + " differs between " + tier_name(source) +
                                       " and " + tier_name(tier) + " tiers");
    }
  }
  return common::Status::success();
}

common::Result<RecallHit> Resolver::recall(const std::string &id, const Prefer prefer) const {
  std::vector<Tier> order;
  switch (prefer) {
  case Prefer::Auto:
    order.assign(std::begin(ALL_TIERS), std::end(ALL_TIERS));
    break;
  case Prefer::Fast:
    order.push_back(Tier::Fast);
    break;
  case Prefer::Blob:
    order.push_back(Tier::Blob);
    break;
  case Prefer::Graph:
    order.push_back(Tier::Graph);
    break;
  }

  for (const Tier tier : order) {
    auto payload = fetch(tier, id);
    if (!payload.ok()) {
      return common::Result<RecallHit>::failure(payload.status());
    }
    if (!payload.value().has_value()) {
      continue;
    }
    if (verify_tiers_) {
      const auto agreement = verify_against_others(id, *payload.value(), tier);
      if (!agreement.ok()) {
        return common::Result<RecallHit>::failure(agreement);
      }
    }
    return common::Result<RecallHit>::success(
        RecallHit{.id = id, .payload = std::move(*payload.value()), .source = tier});
  }

  return common::Result<RecallHit>::failure(
      common::ErrorCode::NotFound,
      "record " + id + " not found" +
          (prefer == Prefer::Auto ? std::string() : " in " + prefer_name(prefer) + " tier"));
}

std::vector<RecallOutcome> Resolver::recall_many(const std::vector<std::string> &ids,
                                                 const Prefer prefer) const {
  std::vector<RecallOutcome> out;
  out.reserve(ids.size());
  for (const auto &id : ids) {
    RecallOutcome outcome;
    outcome.id = id;
    auto hit = recall(id, prefer);
    if (hit.ok()) {
      outcome.hit = std::move(hit.value());
    } else {
      outcome.code = hit.code();
      outcome.message = hit.error();
    }
    out.push_back(std::move(outcome));
  }
  return out;
}

std::vector<Tier> Resolver::tiers_holding(const std::string &id) const {
  std::vector<Tier> out;
  std::optional<std::string> cid;
  if (const auto row = fast_.get(id); row.ok() && row.value().has_value()) {
    out.push_back(Tier::Fast);
    cid = row.value()->cid;
  }
  const auto node = graph_.get(id);
  if (!cid.has_value() && node.has_value()) {
    cid = node->cid;
  }
  if (cid.has_value() && blobs_.contains(*cid)) {
    out.push_back(Tier::Blob);
  }
  if (node.has_value()) {
    out.push_back(Tier::Graph);
  }
  return out;
}

common::Status Resolver::check_agreement(const std::string &id) const {
  std::optional<std::string> reference;
  for (const Tier tier : ALL_TIERS) {
    const auto payload = fetch(tier, id);
    if (!payload.ok()) {
      return payload.status();
    }
    if (!payload.value().has_value()) {
      return common::Status::error(common::ErrorCode::IntegrityMismatch,
                                   "record " + id + " is missing from the " + tier_name(tier) +
                                       " tier");
    }
    if (!reference.has_value()) {
      reference = payload.value();
    } else if (*reference != *payload.value()) {
      return common::Status::error(common::ErrorCode::IntegrityMismatch,
                                   "record " + id + " differs in the " + tier_name(tier) +
                                       " tier");
    }
  }
  return common::Status::success();
}

} // namespace engram::recall
