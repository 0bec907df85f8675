#pragma once

#include <libemochain/zkp/CommitmentGenerator.h>
#include <libemochain/zkp/TaskSet.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/beast/xor_shift_engine.h>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace emochain {
namespace zkp {

/**
 * Periodically proves one validator's current score against the threshold
 * and hands the proof on after a random delay, so submission time does not
 * reveal when the score was sampled.
 */
class ProofSubmitter {
public:
    struct Setup {
        std::chrono::milliseconds interval = std::chrono::minutes(10);
        std::chrono::milliseconds jitterMax = std::chrono::seconds(60);
        std::uint32_t threshold = 75;
    };

    using ScoreProvider = std::function<std::uint32_t()>;
    using ProofSink = std::function<void(ThresholdProof)>;

    ProofSubmitter(
        Setup const& setup,
        std::string submitterId,
        CommitmentGenerator& generator,
        Scheduler& scheduler,
        std::uint64_t seed,
        beast::Journal journal);

    ~ProofSubmitter();

    ProofSubmitter(ProofSubmitter const&) = delete;
    ProofSubmitter& operator=(ProofSubmitter const&) = delete;

    // First submission is immediate
    void start(ScoreProvider scores, ProofSink sink);

    void stop();

    bool running() const;

    std::string const& submitterId() const { return submitter_id_; }

private:
    Setup const setup_;
    std::string const submitter_id_;
    CommitmentGenerator& generator_;
    beast::Journal const j_;

    mutable std::mutex mutex_;
    beast::xor_shift_engine prng_;
    ScoreProvider scores_;
    ProofSink sink_;
    bool running_ = false;

    TaskSet tasks_;

    void submit();
    void deliver(ThresholdProof proof);
};

} // namespace zkp
} // namespace emochain
