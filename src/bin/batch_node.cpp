#include <libemochain/zkp/AsioScheduler.h>
#include <libemochain/zkp/BatchConfig.h>
#include <libemochain/zkp/BatchProofCoordinator.h>
#include <libemochain/zkp/BatchVerifier.h>
#include <libemochain/zkp/CommitmentGenerator.h>
#include <libemochain/zkp/DummyProofGenerator.h>
#include <libemochain/zkp/DummyTransactionGenerator.h>
#include <libemochain/zkp/ProofSubmitter.h>
#include <libemochain/zkp/SnarkThresholdBackend.h>
#include <libemochain/zkp/ThresholdProofBackend.h>
#include <xrpl/basics/Log.h>
#include <xrpl/basics/random.h>
#include <xrpl/basics/strHex.h>
#include <xrpl/beast/xor_shift_engine.h>
#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace emochain::zkp;

namespace {

void usage(char const* argv0) {
    std::cerr << "usage: " << argv0
              << " [config_file] [run_seconds] [validator_count]\n";
}

std::unique_ptr<ThresholdProofBackend> makeBackend(
    BatchConfig const& config,
    ripple::Logs& logs)
{
    if (config.backend == BatchConfig::Backend::snark)
        return std::make_unique<SnarkThresholdBackend>(
            config.snarkBits, logs.journal("SnarkThresholdBackend"));
    return std::make_unique<HashCommitmentBackend>();
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 4) {
        usage(argv[0]);
        return 1;
    }

    std::string const confPath = argc > 1 ? argv[1] : "";
    long runSeconds = 120;
    std::size_t validatorCount = 25;
    try {
        if (argc > 2)
            runSeconds = std::stol(argv[2]);
        if (argc > 3)
            validatorCount = std::stoul(argv[3]);
    } catch (std::exception const&) {
        usage(argv[0]);
        return 1;
    }
    if (runSeconds <= 0 || validatorCount == 0) {
        usage(argv[0]);
        return 1;
    }

    ripple::Logs logs(beast::severities::kInfo);
    auto const j = logs.journal("BatchNode");

    try {
        auto const section = confPath.empty()
            ? ripple::Section(batchSectionName)
            : loadIniSection(confPath, batchSectionName);
        auto const config = setup_BatchConfig(section);

        NonceSource& nonces = defaultNonceSource();
        beast::xor_shift_engine seeds(
            config.prngSeed ? *config.prngSeed : nonces.prngSeed());
        auto nextSeed = [&seeds] { return seeds() | 1; };

        auto& clock = beast::get_abstract_clock<NetClock>();
        auto backend = makeBackend(config, logs);

        // Counters outlive the callbacks that update them
        std::atomic<std::size_t> published{0};
        std::atomic<std::size_t> trafficCount{0};

        // Declared before the components so each stops before it goes away
        AsioScheduler scheduler;

        CommitmentGenerator generator(
            *backend, nonces, clock, config.scores, config.freshness,
            logs.journal("CommitmentGenerator"));
        DummyProofGenerator dummies(
            nonces, clock, backend->nominalArtifactSize(),
            config.dummyPassRate, nextSeed(),
            logs.journal("DummyProofGenerator"));
        BatchVerifier verifier(
            clock, config.freshness, logs.journal("BatchVerifier"));
        BatchProofCoordinator coordinator(
            config.coordinator, dummies, verifier, nonces, clock, scheduler,
            nextSeed(), logs.journal("BatchProofCoordinator"));
        DummyTransactionGenerator traffic(
            scheduler, nonces, clock, config.dummySizes, nextSeed(),
            logs.journal("DummyTransactionGenerator"));

        coordinator.start([&](BatchProof const& batch) {
            ++published;
            auto const verdict = verifier.verify(batch);
            JLOG(j.info()) << "Published batch " << batch.batchId << ": "
                           << batch.thresholdsPassed << "/"
                           << batch.validatorCount << " passed, "
                           << to_string(verdict);
            JLOG(j.debug()) << getJson(batch).toStyledString();
        });

        traffic.startGenerating(
            config.dummyMinInterval, config.dummyMaxInterval,
            [&](DummyTransaction const&) { ++trafficCount; });

        std::mutex scoreMutex;
        beast::xor_shift_engine scoreEngine(nextSeed());
        auto const domain = config.scores;

        std::vector<std::unique_ptr<ProofSubmitter>> submitters;
        submitters.reserve(validatorCount);
        for (std::size_t i = 0; i < validatorCount; ++i) {
            submitters.push_back(std::make_unique<ProofSubmitter>(
                config.submitter, ripple::strHex(nonces.bytes(20)),
                generator, scheduler, nextSeed(),
                logs.journal("ProofSubmitter")));
            submitters.back()->start(
                [&scoreMutex, &scoreEngine, domain] {
                    std::lock_guard lock(scoreMutex);
                    return ripple::rand_int(scoreEngine, domain.min, domain.max);
                },
                [&coordinator](ThresholdProof proof) {
                    coordinator.queueProof(std::move(proof));
                });
        }

        JLOG(j.info()) << "Simulating " << validatorCount << " validators for "
                       << runSeconds << "s with " << backend->name()
                       << " proofs";

        std::this_thread::sleep_for(std::chrono::seconds(runSeconds));

        for (auto& submitter : submitters)
            submitter->stop();
        traffic.stopGenerating();

        auto const status = coordinator.getQueueStatus();
        coordinator.stop();

        JLOG(j.info()) << "Published " << published.load() << " batches, "
                       << trafficCount.load() << " dummy transactions, "
                       << status.size << " proofs left queued";
    } catch (std::exception const& e) {
        JLOG(j.fatal()) << "batch_node failed: " << e.what();
        return 1;
    }

    return 0;
}
