#pragma once

#include <lanebridge/schema/message_payload.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/schema/weight.hpp>

#include <optional>
#include <string>

namespace lanebridge::dispatch {

struct call_outcome final {
  bool success{};
  /// Post-execution weight, when the runtime can report it.
  std::optional<lanebridge::schema::weight_t> actual_weight;
  std::string error;
};

using call_outcome_t = call_outcome;

/// The command set executed on behalf of bridged origins. Owned by the
/// embedding chain; the dispatcher only orchestrates it.
class call_runtime {
 public:
  virtual ~call_runtime() = default;

  /// Statically computed cost of `call`, known before execution.
  virtual lanebridge::schema::weight_t minimal_weight(
      const lanebridge::schema::call_t& call) const = 0;

  virtual call_outcome_t execute(const lanebridge::schema::account_id_t& origin,
                                 const lanebridge::schema::call_t& call) = 0;
};

}  // namespace lanebridge::dispatch
