#include <test/zkp/ZkTestSupport.h>
#include <libemochain/zkp/AsioScheduler.h>
#include <libemochain/zkp/ManualScheduler.h>
#include <libemochain/zkp/TaskSet.h>
#include <xrpl/beast/unit_test.h>
#include <atomic>
#include <future>
#include <string>
#include <thread>

namespace emochain {
namespace zkp {

class Scheduler_test : public beast::unit_test::suite
{
public:
    void
    run() override
    {
        testManualOrdering();
        testManualCancel();
        testAsioScheduler();
        testTaskSet();
        testTaskSetWaitsForRunning();
    }

    void
    testManualOrdering()
    {
        testcase("Manual scheduler ordering");
        using namespace std::chrono;
        test::ManualClock clock{test::startTime()};
        ManualScheduler scheduler(clock);

        std::string order;
        std::vector<NetClock::time_point> at;
        auto record = [&](char c) {
            return [&, c] {
                order += c;
                at.push_back(clock.now());
            };
        };

        scheduler.schedule(seconds(20), record('c'));
        scheduler.schedule(seconds(10), record('a'));
        scheduler.schedule(seconds(10), record('b'));
        scheduler.schedule(milliseconds(0), record('z'));
        BEAST_EXPECT(scheduler.pending() == 4);

        BEAST_EXPECT(scheduler.runDue() == 1);
        BEAST_EXPECT(order == "z");

        BEAST_EXPECT(scheduler.advance(seconds(15)) == 2);
        BEAST_EXPECT(order == "zab");
        BEAST_EXPECT(at[1] == test::startTime() + seconds(10));
        BEAST_EXPECT(clock.now() == test::startTime() + seconds(15));

        // A task scheduled while running falls due within the same advance
        scheduler.schedule(seconds(1), [&] {
            order += 'x';
            scheduler.schedule(seconds(1), record('y'));
        });
        BEAST_EXPECT(scheduler.advance(seconds(10)) == 3);
        BEAST_EXPECT(order == "zabxyc");
        BEAST_EXPECT(scheduler.pending() == 0);
    }

    void
    testManualCancel()
    {
        testcase("Manual scheduler cancel");
        using namespace std::chrono;
        test::ManualClock clock{test::startTime()};
        ManualScheduler scheduler(clock);

        int ran = 0;
        auto a = scheduler.schedule(seconds(5), [&] { ++ran; });
        auto b = scheduler.schedule(seconds(5), [&] { ++ran; });
        BEAST_EXPECT(a != 0 && b != 0 && a != b);

        BEAST_EXPECT(scheduler.cancel(a));
        BEAST_EXPECT(!scheduler.cancel(a));
        scheduler.advance(seconds(5));
        BEAST_EXPECT(ran == 1);
        BEAST_EXPECT(!scheduler.cancel(b));
    }

    void
    testAsioScheduler()
    {
        testcase("Asio scheduler");
        using namespace std::chrono;
        AsioScheduler scheduler;

        std::promise<std::thread::id> first;
        std::promise<void> second;
        std::atomic<bool> cancelledRan{false};

        scheduler.schedule(milliseconds(5), [&] {
            first.set_value(std::this_thread::get_id());
        });
        auto cancelled = scheduler.schedule(seconds(30), [&] { cancelledRan = true; });
        scheduler.schedule(milliseconds(20), [&] { second.set_value(); });

        auto f1 = first.get_future();
        auto f2 = second.get_future();
        BEAST_EXPECT(f1.wait_for(seconds(5)) == std::future_status::ready);
        BEAST_EXPECT(f2.wait_for(seconds(5)) == std::future_status::ready);
        BEAST_EXPECT(f1.get() != std::this_thread::get_id());

        BEAST_EXPECT(scheduler.pending() == 1);
        BEAST_EXPECT(scheduler.cancel(cancelled));
        BEAST_EXPECT(!scheduler.cancel(cancelled));
        BEAST_EXPECT(scheduler.pending() == 0);
        BEAST_EXPECT(!cancelledRan);
    }

    void
    testTaskSet()
    {
        testcase("Task set");
        using namespace std::chrono;
        test::ManualClock clock{test::startTime()};
        ManualScheduler scheduler(clock);

        int ran = 0;
        {
            TaskSet tasks(scheduler);
            auto a = tasks.schedule(seconds(1), [&] { ++ran; });
            tasks.schedule(seconds(2), [&] { ++ran; });
            tasks.schedule(seconds(3), [&] { ++ran; });
            BEAST_EXPECT(tasks.pending() == 3);

            scheduler.advance(seconds(1));
            BEAST_EXPECT(ran == 1);
            BEAST_EXPECT(tasks.pending() == 2);
            BEAST_EXPECT(!tasks.cancel(a));

            tasks.cancelAll();
            BEAST_EXPECT(tasks.pending() == 0);
            BEAST_EXPECT(scheduler.pending() == 0);

            // A callback may cancel its own set, including itself
            tasks.schedule(seconds(1), [&] {
                ++ran;
                tasks.cancelAll();
            });
            tasks.schedule(seconds(2), [&] { ++ran; });
            scheduler.advance(seconds(5));
            BEAST_EXPECT(ran == 2);

            tasks.schedule(seconds(1), [&] { ++ran; });
        }

        // Destruction cancels what is left
        BEAST_EXPECT(scheduler.pending() == 0);
        scheduler.advance(seconds(5));
        BEAST_EXPECT(ran == 2);
    }

    void
    testTaskSetWaitsForRunning()
    {
        testcase("Task set waits for running callbacks");
        using namespace std::chrono;
        AsioScheduler scheduler;
        TaskSet tasks(scheduler);

        std::promise<void> started;
        std::atomic<bool> finished{false};
        std::atomic<int> rearmed{0};

        tasks.schedule(milliseconds(0), [&] {
            started.set_value();
            std::this_thread::sleep_for(milliseconds(100));
            finished = true;
            // Re-arming during cancelAll must not survive it
            tasks.schedule(milliseconds(0), [&] { ++rearmed; });
        });

        auto f = started.get_future();
        BEAST_EXPECT(f.wait_for(seconds(5)) == std::future_status::ready);

        tasks.cancelAll();
        BEAST_EXPECT(finished);
        BEAST_EXPECT(tasks.pending() == 0);

        std::this_thread::sleep_for(milliseconds(50));
        BEAST_EXPECT(rearmed == 0);
    }
};

BEAST_DEFINE_TESTSUITE(Scheduler, zkp, emochain);

}  // namespace zkp
}  // namespace emochain
