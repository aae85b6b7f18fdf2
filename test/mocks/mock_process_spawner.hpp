#pragma once

#include <sre_gateway/exec/i_process_spawner.hpp>

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace sre_gateway {
namespace testing {

// ---------------------------------------------------------------------------
// MockProcessSpawner — hand-written spy for offline unit testing.
//
// Usage:
//   auto spawner = std::make_unique<MockProcessSpawner>();
//   auto* spy = spawner.get();
//   spy->Enqueue(MockProcessSpawner::Exit(0, "out"));
//   ProcessRunner runner(std::move(spawner), options);
//   runner.Run(cmd);
//   CHECK(spy->CallCount() == 1);
//
// Outcomes are consumed FIFO; an empty queue yields a clean exit 0.
// ---------------------------------------------------------------------------

struct SpawnCall {
    Command command;
    std::vector<std::string> environment;
};

class MockProcessSpawner : public IProcessSpawner {
public:
    static SpawnOutcome Exit(int code, std::string out = {}, std::string err = {}) {
        SpawnOutcome o;
        o.termination = Termination::Exited;
        o.status = code;
        o.stdout_data = std::move(out);
        o.stderr_data = std::move(err);
        return o;
    }

    static SpawnOutcome With(Termination termination, int status = 0,
                             std::string error = {}) {
        SpawnOutcome o;
        o.termination = termination;
        o.status = status;
        o.error = std::move(error);
        return o;
    }

    void Enqueue(SpawnOutcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push_back(std::move(outcome));
    }

    [[nodiscard]] size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    [[nodiscard]] std::vector<SpawnCall> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    [[nodiscard]] std::vector<std::vector<std::string>> Argvs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::vector<std::string>> out;
        for (const auto& call : calls_) {
            out.push_back(call.command.argv);
        }
        return out;
    }

    SpawnOutcome Spawn(const SpawnRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back({request.command, request.environment});
        if (outcomes_.empty()) {
            return Exit(0);
        }
        auto next = std::move(outcomes_.front());
        outcomes_.pop_front();
        return next;
    }

private:
    mutable std::mutex mutex_;
    std::deque<SpawnOutcome> outcomes_;
    std::vector<SpawnCall> calls_;
};

} // namespace testing
} // namespace sre_gateway
