#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "command_queue.hpp"
#include "container_runtime.hpp"
#include "frame_types.hpp"
#include "inference_client.hpp"
#include "standby_state.hpp"

namespace printmon {

enum class TriggerSource { Startup, Manual, Remote, Auto, Motion, Reconcile };

inline const char* trigger_source_to_string(TriggerSource s) {
    switch (s) {
        case TriggerSource::Startup: return "startup";
        case TriggerSource::Manual: return "manual";
        case TriggerSource::Remote: return "remote";
        case TriggerSource::Auto: return "auto";
        case TriggerSource::Motion: return "motion";
        case TriggerSource::Reconcile: return "reconcile";
    }
    return "manual";
}

enum class RequestResult { Accepted, AlreadyInState, Busy, Disabled };

enum class OutcomeCode { Succeeded, Already, Busy, Disabled, Failed, TimedOut };

struct TransitionOutcome {
    OutcomeCode code{OutcomeCode::Failed};
    StandbyMode mode{StandbyMode::Active};
    std::string message;

    bool ok() const { return code == OutcomeCode::Succeeded || code == OutcomeCode::Already; }
};

struct StandbyOptions {
    bool enabled{true};
    std::string container_name{"ml_api"};
    std::chrono::seconds auto_timeout{300};              // zero disables auto-standby
    std::chrono::milliseconds op_timeout{30000};         // per runtime call
    std::chrono::milliseconds retry_backoff{60000};      // after a failure, before automatic retries
    std::chrono::milliseconds resume_max_wait{60000};
    std::chrono::milliseconds resume_poll_interval{1000};
};

// Owns the standby mode. Every trigger goes through request_standby() or
// request_active(); the accepted one is executed on the controller's worker
// thread, and triggers arriving while a transition is in flight are dropped.
class StandbyController {
public:
    using ModeListener = std::function<void(StandbyMode from, StandbyMode to, TriggerSource source)>;

    // Held for the duration of one inference request. While any lease taken in
    // active mode is alive, a stop waits (up to the op timeout) before it runs.
    class InferenceLease {
    public:
        InferenceLease() = default;
        InferenceLease(InferenceLease&& other) noexcept;
        InferenceLease& operator=(InferenceLease&& other) noexcept;
        InferenceLease(const InferenceLease&) = delete;
        InferenceLease& operator=(const InferenceLease&) = delete;
        ~InferenceLease();

        // Mode observed when the lease was taken.
        StandbyMode mode() const { return mode_; }
        explicit operator bool() const { return owner_ != nullptr; }

    private:
        friend class StandbyController;
        InferenceLease(StandbyController* owner, StandbyMode mode) : owner_(owner), mode_(mode) {}
        void release();

        StandbyController* owner_{nullptr};
        StandbyMode mode_{StandbyMode::Standby};
    };

    StandbyController(StandbyOptions opts,
                      std::shared_ptr<ContainerRuntime> runtime,
                      std::shared_ptr<InferenceService> health);
    ~StandbyController();

    // Reconciles with the runtime, then starts the worker.
    void start(Clock::time_point now);
    void stop();

    RequestResult request_standby(TriggerSource source);
    RequestResult request_active(TriggerSource source);

    // Blocking variants used by the control API.
    TransitionOutcome enable_standby(TriggerSource source = TriggerSource::Manual);
    TransitionOutcome disable_standby(TriggerSource source = TriggerSource::Manual);

    // Called once per monitoring cycle: motion resumes from standby, a long
    // enough idle period triggers auto-standby. A container call that timed out
    // and has since finished gets the mode re-checked against the runtime.
    void on_cycle(const MotionState& motion, Clock::time_point now);

    // Empty unless the mode is active; a held lease keeps a stop from starting.
    InferenceLease hold_active();

    StandbyState state() const;
    std::optional<std::string> last_error() const;

    // Listeners run on the thread that made the transition, without locks held.
    void add_listener(ModeListener listener);

    // True once no transition is in flight, false on timeout.
    bool wait_until_settled(std::chrono::milliseconds timeout) const;

private:
    struct Command {
        bool reconcile{false};
        bool to_standby{true};
        TriggerSource source{TriggerSource::Manual};
        std::shared_ptr<std::promise<TransitionOutcome>> done;
    };

    RequestResult submit(bool to_standby, TriggerSource source, std::shared_future<TransitionOutcome>* pending);
    TransitionOutcome wait_for(bool to_standby, TriggerSource source);

    void run();
    TransitionOutcome do_enter(TriggerSource source);
    TransitionOutcome do_resume(TriggerSource source);
    void do_reconcile();
    // Runs one start/stop with the op timeout; returns the error text, empty on success.
    std::string run_op(const std::string& what, std::function<void()> op);
    void wait_for_inference();
    std::optional<bool> query_running();
    TransitionOutcome fail(StandbyMode revert_to, TriggerSource source, const std::string& what);
    void transition(StandbyMode to, TriggerSource source);

    StandbyOptions opts_;
    std::shared_ptr<ContainerRuntime> runtime_;
    std::shared_ptr<InferenceService> health_;

    mutable std::mutex mu_;
    mutable std::condition_variable settled_cv_;
    StandbyState state_;
    std::optional<std::string> last_error_;
    std::optional<Clock::time_point> retry_not_before_;
    bool in_flight_to_standby_{false};
    std::shared_future<TransitionOutcome> in_flight_;
    bool running_{false};
    std::vector<ModeListener> listeners_;
    // start/stop that outlived its timeout and may still change the container
    std::shared_future<void> abandoned_op_;
    bool reconcile_queued_{false};
    int inference_in_flight_{0};
    std::condition_variable inference_cv_;

    CommandQueue<Command> queue_;
    std::thread worker_;
};

}  // namespace printmon
