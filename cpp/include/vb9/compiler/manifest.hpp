#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "vb9/compiler/kernel.hpp"
#include "vb9/compiler/proof.hpp"
#include "vb9/core/errors.hpp"
#include "vb9/core/types.hpp"

namespace vb9::compiler {

    struct Manifest {
        std::vector<KernelMeta> kernels;
        std::vector<ProofEdge> proof_tree;
        vb9::core::Hash128 proof_hash{};
    };

    // Compact JSON array of {"node", "deps"} objects. Its bytes are what proof_hash covers.
    [[nodiscard]] std::string proof_tree_json(const std::vector<ProofEdge>& tree);

    // Fills proof_hash from the other two fields.
    vb9::core::Status manifest_seal(Manifest* m) noexcept;

    // {"kernels": [...], "proof_tree": [...], "proof_hash": hex} with two-space indentation.
    [[nodiscard]] std::string manifest_to_json(const Manifest& m);

    // symbol -> hash from a persisted manifest. Absent, malformed or partially
    // malformed input contributes nothing; this never fails.
    [[nodiscard]] std::map<std::string, vb9::core::Hash128> manifest_previous_hashes(std::string_view json_text);

} // namespace vb9::compiler
