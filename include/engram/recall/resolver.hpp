#pragma once

#include "engram/common/result.hpp"
#include "engram/dag/graph_store.hpp"
#include "engram/store/blob_store.hpp"
#include "engram/store/fast_index.hpp"

#include <optional>
#include <string>
#include <vector>

namespace engram::recall {

enum class Tier { Fast, Blob, Graph };
enum class Prefer { Auto, Fast, Blob, Graph };

[[nodiscard]] std::string tier_name(Tier tier);
[[nodiscard]] std::string prefer_name(Prefer prefer);
[[nodiscard]] common::Result<Prefer> parse_prefer(const std::string &value);

struct RecallHit {
  std::string id;
  std::string payload;
  Tier source = Tier::Fast;
};

struct RecallOutcome {
  std::string id;
  std::optional<RecallHit> hit;
  common::ErrorCode code = common::ErrorCode::None;
  std::string message;

  [[nodiscard]] bool ok() const { return hit.has_value(); }
};

/// Resolves record ids against the fast index, the blob store and the graph.
class Resolver {
public:
  Resolver(store::FastIndex &fast, store::BlobStore &blobs, dag::GraphStore &graph,
           bool verify_tiers);

  [[nodiscard]] common::Result<RecallHit> recall(const std::string &id, Prefer prefer) const;
  [[nodiscard]] std::vector<RecallOutcome> recall_many(const std::vector<std::string> &ids,
                                                       Prefer prefer) const;

  [[nodiscard]] std::vector<Tier> tiers_holding(const std::string &id) const;
  [[nodiscard]] common::Status check_agreement(const std::string &id) const;

private:
  [[nodiscard]] common::Result<std::optional<std::string>> fetch(Tier tier,
                                                                 const std::string &id) const;
  [[nodiscard]] common::Status verify_against_others(const std::string &id,
                                                     const std::string &payload,
                                                     Tier source) const;

  store::FastIndex &fast_;
  store::BlobStore &blobs_;
  dag::GraphStore &graph_;
  bool verify_tiers_;
};

} // namespace engram::recall
