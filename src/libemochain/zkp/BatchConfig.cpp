#include "BatchConfig.h"
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace emochain {
namespace zkp {

namespace {

[[noreturn]] void badValue(std::string const& key) {
    throw std::runtime_error(
        std::string("Invalid [") + batchSectionName + "] value for " + key);
}

std::int64_t readInteger(
    ripple::Section const& section,
    std::string const& key,
    std::int64_t fallback,
    std::int64_t lo,
    std::int64_t hi)
{
    if (!section.exists(key))
        return fallback;

    std::int64_t value = 0;
    if (!ripple::set(value, key, section) || value < lo || value > hi)
        badValue(key);
    return value;
}

} // namespace

BatchConfig setup_BatchConfig(ripple::Section const& section) {
    using namespace std::chrono;
    constexpr std::int64_t maxSeconds = 24 * 60 * 60;

    BatchConfig c;

    auto& co = c.coordinator;
    co.batchSize = readInteger(section, "batch_size", co.batchSize, 1, 10000);
    co.maxWait = minutes(readInteger(section, "max_wait_minutes",
        duration_cast<minutes>(co.maxWait).count(), 1, 24 * 60));
    co.flushCheckInterval = seconds(readInteger(section, "flush_check_seconds",
        duration_cast<seconds>(co.flushCheckInterval).count(), 1, maxSeconds));
    co.jitterMin = seconds(readInteger(section, "jitter_min_seconds",
        duration_cast<seconds>(co.jitterMin).count(), 0, maxSeconds));
    co.jitterMax = seconds(readInteger(section, "jitter_max_seconds",
        duration_cast<seconds>(co.jitterMax).count(), 0, maxSeconds));
    if (co.jitterMin > co.jitterMax)
        badValue("jitter_min_seconds");

    c.dummyMinInterval = seconds(readInteger(section, "dummy_min_interval_seconds",
        c.dummyMinInterval.count(), 0, maxSeconds));
    c.dummyMaxInterval = seconds(readInteger(section, "dummy_max_interval_seconds",
        c.dummyMaxInterval.count(), 0, maxSeconds));
    if (c.dummyMinInterval > c.dummyMaxInterval)
        badValue("dummy_min_interval_seconds");

    c.dummySizes.min = readInteger(section, "dummy_min_size",
        c.dummySizes.min, 1, 1 << 20);
    c.dummySizes.max = readInteger(section, "dummy_max_size",
        c.dummySizes.max, 2, 1 << 20);
    if (c.dummySizes.min >= c.dummySizes.max)
        badValue("dummy_min_size");

    if (section.exists("dummy_pass_rate")) {
        std::string text;
        if (!ripple::set(text, "dummy_pass_rate", section))
            badValue("dummy_pass_rate");

        double rate = 0;
        try {
            rate = boost::lexical_cast<double>(text);
        } catch (boost::bad_lexical_cast const&) {
            badValue("dummy_pass_rate");
        }
        if (!(rate >= 0.0 && rate <= 1.0))
            badValue("dummy_pass_rate");
        c.dummyPassRate = rate;
    }

    c.freshness.replayWindow = minutes(readInteger(section,
        "replay_window_minutes",
        duration_cast<minutes>(c.freshness.replayWindow).count(), 1, 24 * 60));
    c.freshness.futureTolerance = seconds(readInteger(section,
        "future_tolerance_seconds",
        duration_cast<seconds>(c.freshness.futureTolerance).count(),
        0, maxSeconds));

    constexpr std::int64_t maxScore = std::numeric_limits<std::uint32_t>::max();
    c.scores.min = readInteger(section, "score_min", c.scores.min, 0, maxScore);
    c.scores.max = readInteger(section, "score_max", c.scores.max, 0, maxScore);
    if (c.scores.min > c.scores.max)
        badValue("score_min");

    auto& sub = c.submitter;
    sub.threshold = readInteger(section, "threshold", sub.threshold, 0, maxScore);
    if (!c.scores.contains(sub.threshold))
        badValue("threshold");
    sub.interval = minutes(readInteger(section, "submission_interval_minutes",
        duration_cast<minutes>(sub.interval).count(), 1, 24 * 60));
    sub.jitterMax = seconds(readInteger(section, "submission_jitter_seconds",
        duration_cast<seconds>(sub.jitterMax).count(), 0, maxSeconds));

    if (section.exists("backend")) {
        std::string backend;
        if (!ripple::set(backend, "backend", section))
            badValue("backend");
        if (backend == "hash")
            c.backend = BatchConfig::Backend::hash;
        else if (backend == "snark")
            c.backend = BatchConfig::Backend::snark;
        else
            badValue("backend");
    }

    c.snarkBits = readInteger(section, "snark_bits", c.snarkBits, 1, 32);
    if (c.backend == BatchConfig::Backend::snark &&
        c.scores.max > (std::uint64_t{1} << c.snarkBits) - 1)
        badValue("snark_bits");

    if (section.exists("prng_seed")) {
        std::uint64_t seed = 0;
        if (!ripple::set(seed, "prng_seed", section) || seed == 0)
            badValue("prng_seed");
        c.prngSeed = seed;
    }

    return c;
}

ripple::Section parseIniSection(std::string const& text, std::string const& name) {
    ripple::Section section(name);
    std::vector<std::string> lines;

    std::istringstream in(text);
    std::string line;
    bool inSection = false;
    while (std::getline(in, line)) {
        boost::algorithm::trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line.front() == '[' && line.back() == ']') {
            inSection = line.substr(1, line.size() - 2) == name;
            continue;
        }
        if (inSection)
            lines.push_back(line);
    }

    section.append(lines);
    return section;
}

ripple::Section loadIniSection(std::string const& path, std::string const& name) {
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("Unable to open config file " + path);

    std::stringstream ss;
    ss << file.rdbuf();
    return parseIniSection(ss.str(), name);
}

} // namespace zkp
} // namespace emochain
