#pragma once

#include "caprouter/util/json.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace caprouter {

struct ProofStep {
  std::string step;
  bool passed{false};
  JsonValue details;
};

// Audit record of a policy-checked execution. The digest covers the step list
// only, so a proof can be replayed and re-verified later.
struct ComplianceProof {
  std::string version{"1.0"};
  std::int64_t timestamp{0}; // unix ms
  std::vector<ProofStep> steps;
  bool all_passed{false};
  std::string digest;
};

[[nodiscard]] auto steps_json(const std::vector<ProofStep> &steps) -> JsonValue;

/// Hex SHA-256 over the canonical JSON of the step list.
[[nodiscard]] auto proof_digest(const std::vector<ProofStep> &steps)
    -> std::string;

[[nodiscard]] auto make_compliance_proof(std::vector<ProofStep> steps)
    -> ComplianceProof;

[[nodiscard]] auto verify_proof(const ComplianceProof &proof) -> bool;

[[nodiscard]] auto to_json(const ComplianceProof &proof) -> JsonValue;

} // namespace caprouter
