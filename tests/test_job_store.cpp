#undef NDEBUG
#include "job_store.hpp"

#include <assert.h>
#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

int main() {
    /* Creation and lookup.  */
    {
        JobStore store;
        auto id = store.create("a girl with cat ears", "42", std::string("zh-hans"), JobStatus::AwaitingPayment);
        assert(id.size() == 36);

        auto job = store.get(id);
        assert(job);
        assert(job->prompt == "a girl with cat ears");
        assert(job->originator == "42");
        assert(job->locale && *job->locale == "zh-hans");
        assert(job->status == JobStatus::AwaitingPayment);

        assert(!store.get("no-such-job"));

        bool threw = false;
        try {
            store.create("x", "42", std::nullopt, JobStatus::Running);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(store.size() == 1);
    }

    /* Ids are unique.  */
    {
        JobStore store;
        std::set<std::string> ids;
        for (int i = 0; i < 1000; ++i) {
            ids.insert(store.create("p", "1", std::nullopt, JobStatus::Pending));
        }
        assert(ids.size() == 1000);
    }

    /* A colliding generator is retried, then gives up.  */
    {
        int calls = 0;
        JobStore store([&calls]() { return ++calls <= 2 ? std::string("same") : "other-" + std::to_string(calls); });
        assert(store.create("p", "1", std::nullopt, JobStatus::Pending) == "same");
        assert(store.create("p", "1", std::nullopt, JobStatus::Pending) == "other-3");

        JobStore stuck([]() { return std::string("fixed"); });
        stuck.create("p", "1", std::nullopt, JobStatus::Pending);
        bool threw = false;
        try {
            stuck.create("p", "1", std::nullopt, JobStatus::Pending);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        assert(stuck.size() == 1);
    }

    /* Claims go in the order jobs became PENDING.  */
    {
        JobStore store;
        auto first = store.create("first", "1", std::nullopt, JobStatus::Pending);
        auto gated = store.create("gated", "1", std::nullopt, JobStatus::AwaitingPayment);
        auto second = store.create("second", "1", std::nullopt, JobStatus::Pending);

        assert(store.transition(gated, JobStatus::Pending).applied());

        auto a = store.claimNextPending();
        auto b = store.claimNextPending();
        auto c = store.claimNextPending();
        assert(a && a->id == first && a->status == JobStatus::Running);
        assert(b && b->id == second);
        assert(c && c->id == gated);
        assert(!store.claimNextPending());
        assert(store.get(first)->status == JobStatus::Running);
    }

    /* Awaiting payment is never claimable.  */
    {
        JobStore store;
        store.create("p", "1", std::nullopt, JobStatus::AwaitingPayment);
        assert(!store.claimNextPending());
    }

    /* Transitions: unknown ids, illegal edges, terminal states.  */
    {
        JobStore store;
        for (auto status : {JobStatus::AwaitingPayment, JobStatus::Pending, JobStatus::Running,
                            JobStatus::Completed, JobStatus::Failed}) {
            auto r = store.transition("missing", status);
            assert(r.outcome == TransitionResult::Outcome::NotFound);
            assert(!r.job);
        }

        auto id = store.create("p", "1", std::nullopt, JobStatus::AwaitingPayment);
        auto skip = store.transition(id, JobStatus::Running);
        assert(skip.outcome == TransitionResult::Outcome::Illegal);
        assert(skip.job->status == JobStatus::AwaitingPayment);

        assert(store.transition(id, JobStatus::Pending).applied());
        auto again = store.transition(id, JobStatus::Pending);
        assert(again.outcome == TransitionResult::Outcome::Illegal);
        assert(again.previousStatus == JobStatus::Pending);

        auto claimed = store.claimNextPending();
        assert(claimed && claimed->id == id);

        auto done = store.transition(id, JobStatus::Completed);
        assert(done.applied());
        assert(done.previousStatus == JobStatus::Running);
        assert(done.job->status == JobStatus::Completed);

        auto back = store.transition(id, JobStatus::Running);
        assert(back.outcome == TransitionResult::Outcome::Illegal);
        assert(store.transition(id, JobStatus::Failed).outcome == TransitionResult::Outcome::Illegal);
        assert(store.get(id)->status == JobStatus::Completed);
    }

    /* A direct PENDING -> RUNNING transition is not offered again.  */
    {
        JobStore store;
        auto id = store.create("p", "1", std::nullopt, JobStatus::Pending);
        assert(store.transition(id, JobStatus::Running).applied());
        assert(!store.claimNextPending());
    }

    /* Concurrent claims hand out each job exactly once.  */
    {
        JobStore store;
        const int jobs = 200;
        for (int i = 0; i < jobs; ++i) {
            store.create("p" + std::to_string(i), "1", std::nullopt, JobStatus::Pending);
        }

        std::mutex claimedMutex;
        std::vector<std::string> claimed;
        std::vector<std::thread> workers;
        for (int w = 0; w < 8; ++w) {
            workers.emplace_back([&]() {
                while (auto job = store.claimNextPending()) {
                    std::lock_guard<std::mutex> lock(claimedMutex);
                    claimed.push_back(job->id);
                }
            });
        }
        for (auto& t : workers) t.join();

        assert(claimed.size() == static_cast<size_t>(jobs));
        assert(std::set<std::string>(claimed.begin(), claimed.end()).size() == claimed.size());
        assert(store.countByStatus()[JobStatus::Running] == static_cast<size_t>(jobs));
    }

    /* Two pollers, one pending job.  */
    for (int round = 0; round < 50; ++round) {
        JobStore store;
        auto id = store.create("only", "1", std::nullopt, JobStatus::Pending);

        std::atomic<int> winners{0};
        std::atomic<int> empty{0};
        auto poll = [&]() {
            if (auto job = store.claimNextPending()) {
                assert(job->id == id);
                ++winners;
            } else {
                ++empty;
            }
        };
        std::thread a(poll);
        std::thread b(poll);
        a.join();
        b.join();
        assert(winners == 1);
        assert(empty == 1);
    }

    /* Stale RUNNING jobs are failed, others left alone.  */
    {
        JobStore store;
        auto running = store.create("r", "1", std::nullopt, JobStatus::Pending);
        auto pending = store.create("p", "1", std::nullopt, JobStatus::Pending);
        assert(store.claimNextPending()->id == running);

        auto none = store.failRunningClaimedBefore(std::chrono::system_clock::now() - std::chrono::hours(1));
        assert(none.empty());

        auto expired = store.failRunningClaimedBefore(std::chrono::system_clock::now() + std::chrono::seconds(1));
        assert(expired.size() == 1);
        assert(expired[0].id == running && expired[0].status == JobStatus::Failed);
        assert(store.get(running)->status == JobStatus::Failed);
        assert(store.get(pending)->status == JobStatus::Pending);
    }

    return 0;
}
