#include "caprouter/policy/compliance_proof.hpp"

#include "caprouter/util/digest.hpp"
#include "caprouter/util/time.hpp"

#include <algorithm>

namespace caprouter {

auto steps_json(const std::vector<ProofStep> &steps) -> JsonValue {
  JsonValue arr = std::vector<JsonValue>{};
  for (const auto &s : steps) {
    arr.get_array().emplace_back(JsonValue{
        {"step", s.step}, {"passed", s.passed}, {"details", s.details}});
  }
  return arr;
}

auto proof_digest(const std::vector<ProofStep> &steps) -> std::string {
  return util::sha256_hex(dump_json(steps_json(steps)));
}

auto make_compliance_proof(std::vector<ProofStep> steps) -> ComplianceProof {
  ComplianceProof proof;
  proof.timestamp = util::now_unix_millis();
  proof.all_passed =
      std::ranges::all_of(steps, [](const ProofStep &s) { return s.passed; });
  proof.digest = proof_digest(steps);
  proof.steps = std::move(steps);
  return proof;
}

auto verify_proof(const ComplianceProof &proof) -> bool {
  const bool all_passed = std::ranges::all_of(
      proof.steps, [](const ProofStep &s) { return s.passed; });
  return all_passed == proof.all_passed &&
         proof_digest(proof.steps) == proof.digest;
}

auto to_json(const ComplianceProof &proof) -> JsonValue {
  return JsonValue{{"version", proof.version},
                   {"timestamp", proof.timestamp},
                   {"steps", steps_json(proof.steps)},
                   {"all_passed", proof.all_passed},
                   {"digest", proof.digest}};
}

} // namespace caprouter
