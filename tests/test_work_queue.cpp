#include "test_common.h"
#include "gradebench/grader.h"
#include "gradebench/work_queue.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace gradebench;

int main() {
    // Test 1: FIFO order
    {
        WorkQueue<int> q;
        for (int i = 0; i < 5; i++) expect_true(q.push(i), "push");
        expect_eq_ll((long long)q.size(), 5, "size");
        int v = -1;
        for (int i = 0; i < 5; i++) {
            expect_true(q.pop(v), "pop");
            expect_eq_ll(v, i, "fifo order");
        }
    }

    // Test 2: shutdown drains queued items, then rejects
    {
        WorkQueue<int> q;
        q.push(7);
        q.shutdown();
        expect_true(q.closed(), "closed");
        expect_true(!q.push(8), "push after shutdown rejected");
        int v = 0;
        expect_true(q.pop(v) && v == 7, "queued item still handed out");
        expect_true(!q.pop(v), "drained");
    }

    // Test 3: blocked consumer is woken by shutdown
    {
        WorkQueue<int> q;
        std::atomic<bool> returned{false};
        std::thread t([&] {
            int v = 0;
            bool got = q.pop(v);
            returned = !got;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        q.shutdown();
        t.join();
        expect_true(returned.load(), "pop returns false after shutdown");
    }

    // Test 4: multiple consumers see every item exactly once
    {
        WorkQueue<int> q;
        const int N = 1000;
        for (int i = 0; i < N; i++) q.push(i);
        q.shutdown();
        std::atomic<long long> sum{0};
        std::atomic<int> count{0};
        std::vector<std::thread> ts;
        for (int w = 0; w < 4; w++) {
            ts.emplace_back([&] {
                int v = 0;
                while (q.pop(v)) { sum += v; count++; }
            });
        }
        for (auto& t : ts) t.join();
        expect_eq_ll(count.load(), N, "all items consumed");
        expect_eq_ll(sum.load(), (long long)N * (N - 1) / 2, "each item once");
    }

    // Test 5: run_jobs stores results in job order regardless of finish order
    {
        std::vector<LLMSolution> sols(6);
        std::vector<GradingJob> jobs;
        for (size_t i = 0; i < sols.size(); i++) {
            sols[i].model_identifier = "m" + std::to_string(i);
            jobs.push_back(GradingJob{nullptr, nullptr, &sols[i]});
        }
        auto out = run_jobs(jobs, 3, [](const GradingJob& j) {
            // earlier jobs finish later
            const int idx = std::stoi(j.solution->model_identifier.substr(1));
            std::this_thread::sleep_for(std::chrono::milliseconds(5 * (6 - idx)));
            SolutionGrade g;
            g.model_identifier = j.solution->model_identifier;
            g.score = idx / 10.0;
            return g;
        });
        expect_eq_ll((long long)out.size(), 6, "one result per job");
        for (size_t i = 0; i < out.size(); i++) {
            expect_eq_str(out[i].model_identifier, "m" + std::to_string(i), "job order kept");
        }
    }

    // Test 6: an exception in a worker reaches the caller after all workers stop
    {
        std::vector<LLMSolution> sols(4);
        std::vector<GradingJob> jobs;
        for (auto& s : sols) jobs.push_back(GradingJob{nullptr, nullptr, &s});
        sols[2].model_identifier = "boom";
        std::atomic<int> calls{0};
        bool threw = false;
        try {
            run_jobs(jobs, 2, [&](const GradingJob& j) {
                calls++;
                if (j.solution->model_identifier == "boom") throw std::runtime_error("grader failed");
                return SolutionGrade{};
            });
        } catch (const std::runtime_error& e) {
            threw = contains(e.what(), "grader failed");
        }
        expect_true(threw, "exception rethrown");
        expect_eq_ll(calls.load(), 4, "remaining jobs still ran");
    }

    // Test 7: empty job list
    {
        auto out = run_jobs({}, 4, [](const GradingJob&) { return SolutionGrade{}; });
        expect_true(out.empty(), "no jobs, no results");
    }

    std::cerr << "test_work_queue: ALL PASSED" << std::endl;
    return 0;
}
