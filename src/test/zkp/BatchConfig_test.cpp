#include <libemochain/zkp/BatchConfig.h>
#include <xrpl/beast/unit_test.h>

namespace emochain {
namespace zkp {

class BatchConfig_test : public beast::unit_test::suite
{
    static BatchConfig
    load(std::string const& body)
    {
        return setup_BatchConfig(
            parseIniSection("[batch_proofs]\n" + body, batchSectionName));
    }

    // True if the body is rejected with a message naming key
    bool
    rejects(std::string const& body, std::string const& key)
    {
        try
        {
            load(body);
        }
        catch (std::runtime_error const& e)
        {
            return std::string(e.what()).find(key) != std::string::npos;
        }
        return false;
    }

public:
    void
    run() override
    {
        testDefaults();
        testOverrides();
        testSectionParsing();
        testPassRate();
        testInvalidValues();
    }

    void
    testDefaults()
    {
        testcase("Defaults");
        using namespace std::chrono;
        auto const c = setup_BatchConfig(ripple::Section(batchSectionName));

        BEAST_EXPECT(c.coordinator.batchSize == 10);
        BEAST_EXPECT(c.coordinator.maxWait == minutes(5));
        BEAST_EXPECT(c.coordinator.flushCheckInterval == seconds(30));
        BEAST_EXPECT(c.coordinator.jitterMin == seconds(0));
        BEAST_EXPECT(c.coordinator.jitterMax == seconds(30));
        BEAST_EXPECT(c.dummyMinInterval == seconds(30));
        BEAST_EXPECT(c.dummyMaxInterval == seconds(120));
        BEAST_EXPECT(c.dummySizes.min == 100);
        BEAST_EXPECT(c.dummySizes.max == 1100);
        BEAST_EXPECT(c.dummyPassRate == 0.7);
        BEAST_EXPECT(c.freshness.replayWindow == minutes(15));
        BEAST_EXPECT(c.freshness.futureTolerance == seconds(30));
        BEAST_EXPECT(c.scores.min == 0);
        BEAST_EXPECT(c.scores.max == 100);
        BEAST_EXPECT(c.submitter.threshold == 75);
        BEAST_EXPECT(c.submitter.interval == minutes(10));
        BEAST_EXPECT(c.submitter.jitterMax == seconds(60));
        BEAST_EXPECT(c.backend == BatchConfig::Backend::hash);
        BEAST_EXPECT(c.snarkBits == 7);
        BEAST_EXPECT(!c.prngSeed);
    }

    void
    testOverrides()
    {
        testcase("Overrides");
        using namespace std::chrono;
        auto const c = load(
            "batch_size=25\n"
            "max_wait_minutes=2\n"
            "jitter_min_seconds=5\n"
            "jitter_max_seconds=10\n"
            "dummy_pass_rate=0.5\n"
            "replay_window_minutes=30\n"
            "score_max=1000\n"
            "threshold=600\n"
            "backend=snark\n"
            "snark_bits=10\n"
            "prng_seed=1977\n");

        BEAST_EXPECT(c.coordinator.batchSize == 25);
        BEAST_EXPECT(c.coordinator.maxWait == minutes(2));
        BEAST_EXPECT(c.coordinator.jitterMin == seconds(5));
        BEAST_EXPECT(c.coordinator.jitterMax == seconds(10));
        BEAST_EXPECT(c.dummyPassRate == 0.5);
        BEAST_EXPECT(c.freshness.replayWindow == minutes(30));
        BEAST_EXPECT(c.scores.max == 1000);
        BEAST_EXPECT(c.submitter.threshold == 600);
        BEAST_EXPECT(c.backend == BatchConfig::Backend::snark);
        BEAST_EXPECT(c.snarkBits == 10);
        BEAST_EXPECT(c.prngSeed && *c.prngSeed == 1977);
    }

    void
    testSectionParsing()
    {
        testcase("Section parsing");
        auto const section = parseIniSection(
            "# leading comment\n"
            "[server]\n"
            "batch_size=99\n"
            "\n"
            "[batch_proofs]\n"
            "  batch_size=12  \n"
            "# threshold=10\n"
            "[other]\n"
            "threshold=20\n",
            batchSectionName);

        auto const c = setup_BatchConfig(section);
        BEAST_EXPECT(c.coordinator.batchSize == 12);
        BEAST_EXPECT(c.submitter.threshold == 75);

        auto const missing = parseIniSection("[server]\nport=1\n", batchSectionName);
        BEAST_EXPECT(!missing.exists("port"));

        BEAST_EXPECT(except<std::runtime_error>(
            [] { loadIniSection("/nonexistent/batch_proofs.cfg", batchSectionName); }));
    }

    void
    testPassRate()
    {
        testcase("Pass rate");

        BEAST_EXPECT(load("dummy_pass_rate=0.25").dummyPassRate == 0.25);
        BEAST_EXPECT(load("dummy_pass_rate=0").dummyPassRate == 0.0);
        BEAST_EXPECT(load("dummy_pass_rate=1").dummyPassRate == 1.0);

        BEAST_EXPECT(rejects("dummy_pass_rate=0.5x", "dummy_pass_rate"));
        BEAST_EXPECT(rejects("dummy_pass_rate=-0.1", "dummy_pass_rate"));
        BEAST_EXPECT(rejects("dummy_pass_rate=nan", "dummy_pass_rate"));
    }

    void
    testInvalidValues()
    {
        testcase("Invalid values");

        BEAST_EXPECT(rejects("batch_size=0", "batch_size"));
        BEAST_EXPECT(rejects("batch_size=ten", "batch_size"));
        BEAST_EXPECT(rejects("batch_size=-3", "batch_size"));
        BEAST_EXPECT(rejects("max_wait_minutes=0", "max_wait_minutes"));
        BEAST_EXPECT(rejects(
            "jitter_min_seconds=40\njitter_max_seconds=30", "jitter_min_seconds"));
        BEAST_EXPECT(rejects(
            "dummy_min_interval_seconds=200", "dummy_min_interval_seconds"));
        BEAST_EXPECT(rejects("dummy_min_size=2000", "dummy_min_size"));
        BEAST_EXPECT(rejects("dummy_pass_rate=1.5", "dummy_pass_rate"));
        BEAST_EXPECT(rejects("dummy_pass_rate=often", "dummy_pass_rate"));
        BEAST_EXPECT(rejects("score_min=50\nscore_max=40", "score_min"));
        BEAST_EXPECT(rejects("threshold=101", "threshold"));
        BEAST_EXPECT(rejects("backend=bulletproofs", "backend"));
        BEAST_EXPECT(rejects("backend=snark\nsnark_bits=6", "snark_bits"));
        BEAST_EXPECT(rejects("snark_bits=40", "snark_bits"));
        BEAST_EXPECT(rejects("prng_seed=0", "prng_seed"));
    }
};

BEAST_DEFINE_TESTSUITE(BatchConfig, zkp, emochain);

}  // namespace zkp
}  // namespace emochain
