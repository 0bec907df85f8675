#pragma once

#include <libemochain/zkp/BatchProofCoordinator.h>
#include <libemochain/zkp/CommitmentGenerator.h>
#include <libemochain/zkp/DummyTransactionGenerator.h>
#include <libemochain/zkp/ProofSubmitter.h>
#include <xrpl/basics/BasicConfig.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace emochain {
namespace zkp {

/**
 * Settings of the [batch_proofs] section. Every field has a default, so
 * an empty section yields a working configuration.
 */
struct BatchConfig {
    enum class Backend { hash, snark };

    BatchProofCoordinator::Setup coordinator;
    ProofSubmitter::Setup submitter;
    FreshnessPolicy freshness;
    ScoreDomain scores;

    std::chrono::seconds dummyMinInterval{30};
    std::chrono::seconds dummyMaxInterval{120};
    DummyTransactionGenerator::SizeRange dummySizes;
    double dummyPassRate = 0.7;

    Backend backend = Backend::hash;
    std::size_t snarkBits = 7;

    // Unset means seed from the system RNG
    std::optional<std::uint64_t> prngSeed;
};

inline constexpr char batchSectionName[] = "batch_proofs";

/**
 * @brief Build a BatchConfig from a section, validating every value
 *
 * @throws std::runtime_error naming the offending key
 */
BatchConfig setup_BatchConfig(ripple::Section const& section);

// Extracts the named section from ini text. Missing sections are empty.
ripple::Section parseIniSection(std::string const& text, std::string const& name);

// @throws std::runtime_error if the file cannot be read
ripple::Section loadIniSection(std::string const& path, std::string const& name);

} // namespace zkp
} // namespace emochain
