#include "printmon/standby_controller.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "printmon/errors.hpp"

namespace printmon {

namespace {

// Runs `fn` on a detached thread so a hung runtime call can be abandoned.
template <typename Fn>
auto launch_detached(Fn fn) -> std::future<decltype(fn())> {
    using R = decltype(fn());
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto fut = task->get_future();
    std::thread([task] { (*task)(); }).detach();
    return fut;
}

std::string timeout_text(const std::string& what, std::chrono::milliseconds timeout) {
    return what + " timed out after " + std::to_string(timeout.count()) + "ms";
}

// Exceptions from `fn` are rethrown here.
template <typename Fn>
auto call_with_timeout(Fn fn, std::chrono::milliseconds timeout, const std::string& what) -> decltype(fn()) {
    auto fut = launch_detached(std::move(fn));
    if (fut.wait_for(timeout) == std::future_status::timeout) throw ContainerOpError(timeout_text(what, timeout));
    return fut.get();
}

bool is_transitional(StandbyMode m) {
    return m == StandbyMode::Entering || m == StandbyMode::Resuming;
}

}  // namespace

StandbyController::StandbyController(StandbyOptions opts,
                                     std::shared_ptr<ContainerRuntime> runtime,
                                     std::shared_ptr<InferenceService> health)
    : opts_(std::move(opts)), runtime_(std::move(runtime)), health_(std::move(health)) {
    state_.enabled = opts_.enabled;
    state_.auto_timeout = opts_.auto_timeout;
}

StandbyController::~StandbyController() {
    stop();
}

void StandbyController::start(Clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (running_) return;
        running_ = true;
        state_.last_activity_at = now;
    }

    if (!opts_.enabled) {
        spdlog::info("[standby] standby mode is DISABLED - ML container will always run");
    } else if (auto running = query_running()) {
        std::lock_guard<std::mutex> lock(mu_);
        state_.container_running = *running;
        if (!*running) {
            state_.mode = StandbyMode::Standby;
            spdlog::info("[standby] container {} is not running, starting in standby", opts_.container_name);
        } else {
            spdlog::info("[standby] managing container {}", opts_.container_name);
        }
    } else {
        spdlog::error("[standby] cannot query container {}; transitions will still be attempted",
                      opts_.container_name);
    }

    worker_ = std::thread(&StandbyController::run, this);
}

void StandbyController::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) return;
        running_ = false;
    }
    queue_.stop();
    if (worker_.joinable()) worker_.join();
    settled_cv_.notify_all();
}

RequestResult StandbyController::request_standby(TriggerSource source) {
    return submit(true, source, nullptr);
}

RequestResult StandbyController::request_active(TriggerSource source) {
    return submit(false, source, nullptr);
}

RequestResult StandbyController::submit(bool to_standby, TriggerSource source,
                                        std::shared_future<TransitionOutcome>* pending) {
    StandbyMode from;
    Command cmd;
    std::vector<ModeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!opts_.enabled) return RequestResult::Disabled;
        if (!running_) return RequestResult::Busy;

        from = state_.mode;
        if (is_transitional(from)) {
            if (pending && in_flight_to_standby_ == to_standby) *pending = in_flight_;
            spdlog::debug("[standby] {} request ignored, {} in progress",
                          trigger_source_to_string(source), standby_mode_to_string(from));
            return RequestResult::Busy;
        }
        if (from == (to_standby ? StandbyMode::Standby : StandbyMode::Active)) {
            return RequestResult::AlreadyInState;
        }

        state_.mode = to_standby ? StandbyMode::Entering : StandbyMode::Resuming;
        cmd.to_standby = to_standby;
        cmd.source = source;
        cmd.done = std::make_shared<std::promise<TransitionOutcome>>();
        in_flight_ = cmd.done->get_future().share();
        in_flight_to_standby_ = to_standby;
        if (pending) *pending = in_flight_;
        listeners = listeners_;
    }

    spdlog::info("[standby] {} ({})", to_standby ? "entering standby" : "exiting standby",
                 trigger_source_to_string(source));
    for (auto& l : listeners) l(from, to_standby ? StandbyMode::Entering : StandbyMode::Resuming, source);

    queue_.push(std::move(cmd));
    return RequestResult::Accepted;
}

TransitionOutcome StandbyController::wait_for(bool to_standby, TriggerSource source) {
    std::shared_future<TransitionOutcome> pending;
    const RequestResult r = submit(to_standby, source, &pending);
    const StandbyMode mode = state().mode;

    switch (r) {
        case RequestResult::Disabled:
            return {OutcomeCode::Disabled, mode, "Standby mode is disabled in configuration"};
        case RequestResult::AlreadyInState:
            return {OutcomeCode::Already, mode, to_standby ? "Already in standby mode" : "Not in standby mode"};
        case RequestResult::Busy:
            if (!pending.valid()) {
                return {OutcomeCode::Busy, mode, std::string("Transition in progress: ") + standby_mode_to_string(mode)};
            }
            break;
        case RequestResult::Accepted:
            break;
    }

    const auto limit = opts_.op_timeout * 3 + opts_.resume_max_wait;
    if (pending.wait_for(limit) == std::future_status::timeout) {
        return {OutcomeCode::TimedOut, state().mode, "Timed out waiting for the container transition"};
    }
    try {
        return pending.get();
    } catch (const std::future_error& e) {
        return {OutcomeCode::Failed, state().mode, std::string("Controller stopped: ") + e.what()};
    }
}

TransitionOutcome StandbyController::enable_standby(TriggerSource source) {
    return wait_for(true, source);
}

TransitionOutcome StandbyController::disable_standby(TriggerSource source) {
    return wait_for(false, source);
}

void StandbyController::on_cycle(const MotionState& motion, Clock::time_point now) {
    StandbyMode mode;
    Clock::duration since_activity;
    bool held_off;
    bool reconcile = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (motion.has_motion && now > state_.last_activity_at) state_.last_activity_at = now;
        mode = state_.mode;
        since_activity = now - state_.last_activity_at;
        held_off = retry_not_before_ && now < *retry_not_before_;
        if (running_ && !reconcile_queued_ && !is_transitional(mode) && abandoned_op_.valid() &&
            abandoned_op_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            abandoned_op_ = {};
            reconcile_queued_ = true;
            reconcile = true;
        }
    }
    if (reconcile) {
        spdlog::info("[standby] timed-out container call finished, re-checking {}", opts_.container_name);
        Command cmd;
        cmd.reconcile = true;
        cmd.source = TriggerSource::Reconcile;
        queue_.push(std::move(cmd));
        return;
    }
    if (!opts_.enabled || held_off) return;

    if (motion.has_motion && mode == StandbyMode::Standby) {
        spdlog::info("[standby] motion detected while in standby - exiting standby");
        request_active(TriggerSource::Motion);
        return;
    }

    if (mode != StandbyMode::Active || opts_.auto_timeout.count() == 0) return;
    const auto idle = std::min(motion.idle_duration(now), since_activity);
    if (idle >= opts_.auto_timeout) {
        spdlog::info("[standby] auto-standby: {}s since last activity (threshold: {}s)",
                     std::chrono::duration_cast<std::chrono::seconds>(idle).count(), opts_.auto_timeout.count());
        request_standby(TriggerSource::Auto);
    }
}

StandbyController::InferenceLease StandbyController::hold_active() {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_.mode != StandbyMode::Active) return InferenceLease(nullptr, state_.mode);
    inference_in_flight_++;
    return InferenceLease(this, StandbyMode::Active);
}

StandbyController::InferenceLease::InferenceLease(InferenceLease&& other) noexcept
    : owner_(other.owner_), mode_(other.mode_) {
    other.owner_ = nullptr;
}

StandbyController::InferenceLease& StandbyController::InferenceLease::operator=(InferenceLease&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        mode_ = other.mode_;
        other.owner_ = nullptr;
    }
    return *this;
}

StandbyController::InferenceLease::~InferenceLease() {
    release();
}

void StandbyController::InferenceLease::release() {
    if (!owner_) return;
    {
        std::lock_guard<std::mutex> lock(owner_->mu_);
        owner_->inference_in_flight_--;
    }
    owner_->inference_cv_.notify_all();
    owner_ = nullptr;
}

StandbyState StandbyController::state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
}

std::optional<std::string> StandbyController::last_error() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_error_;
}

void StandbyController::add_listener(ModeListener listener) {
    std::lock_guard<std::mutex> lock(mu_);
    listeners_.push_back(std::move(listener));
}

bool StandbyController::wait_until_settled(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mu_);
    return settled_cv_.wait_for(lock, timeout, [&] { return !is_transitional(state_.mode) || !running_; });
}

void StandbyController::run() {
    Command cmd;
    while (queue_.pop(cmd)) {
        if (cmd.reconcile) {
            do_reconcile();
            continue;
        }
        TransitionOutcome out = cmd.to_standby ? do_enter(cmd.source) : do_resume(cmd.source);
        cmd.done->set_value(out);
    }
}

std::optional<bool> StandbyController::query_running() {
    auto rt = runtime_;
    auto name = opts_.container_name;
    try {
        return call_with_timeout([rt, name] { return rt->is_running(name); }, opts_.op_timeout, "inspect " + name);
    } catch (const ContainerOpError& e) {
        spdlog::error("[standby] error checking container status: {}", e.what());
    } catch (const std::exception& e) {
        spdlog::error("[standby] unexpected error checking container status: {}", e.what());
    }
    return std::nullopt;
}

std::string StandbyController::run_op(const std::string& what, std::function<void()> op) {
    std::shared_future<void> fut = launch_detached(std::move(op)).share();
    if (fut.wait_for(opts_.op_timeout) == std::future_status::timeout) {
        std::lock_guard<std::mutex> lock(mu_);
        abandoned_op_ = fut;
        return timeout_text(what, opts_.op_timeout);
    }
    try {
        fut.get();
    } catch (const ContainerOpError& e) {
        return e.what();
    } catch (const std::exception& e) {
        return what + ": " + e.what();
    }
    return {};
}

void StandbyController::wait_for_inference() {
    std::unique_lock<std::mutex> lock(mu_);
    if (!inference_cv_.wait_for(lock, opts_.op_timeout, [&] { return inference_in_flight_ == 0; })) {
        spdlog::warn("[standby] inference request still in flight after {}ms, stopping anyway",
                     opts_.op_timeout.count());
    }
}

void StandbyController::do_reconcile() {
    const auto running = query_running();
    StandbyMode from;
    StandbyMode to;
    std::vector<ModeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mu_);
        reconcile_queued_ = false;
        if (!running) return;
        state_.container_running = *running;
        from = state_.mode;
        if (from == StandbyMode::Active && !*running) {
            to = StandbyMode::Standby;
        } else if (from == StandbyMode::Standby && *running) {
            to = StandbyMode::Active;
            state_.last_activity_at = Clock::now();
        } else {
            return;
        }
        state_.mode = to;
        last_error_.reset();
        retry_not_before_.reset();
        listeners = listeners_;
    }
    settled_cv_.notify_all();
    spdlog::warn("[standby] container {} is {} after a timed-out call, now {}", opts_.container_name,
                 *running ? "running" : "stopped", standby_mode_to_string(to));
    for (auto& l : listeners) l(from, to, TriggerSource::Reconcile);
}

TransitionOutcome StandbyController::do_enter(TriggerSource source) {
    wait_for_inference();
    spdlog::info("[standby] stopping ML API container: {}", opts_.container_name);
    auto rt = runtime_;
    auto name = opts_.container_name;
    std::string err = run_op("stop " + name, [rt, name] { rt->stop(name); });

    // the call result alone is not trusted; the runtime has the final word
    const auto running = query_running();
    if (running) {
        std::lock_guard<std::mutex> lock(mu_);
        state_.container_running = *running;
    }
    if (!err.empty() && running && !*running) {
        spdlog::warn("[standby] stop reported '{}' but the container is stopped", err);
        err.clear();
    }
    if (err.empty() && running && *running) err = "container still running after stop";
    if (!err.empty()) return fail(StandbyMode::Active, source, "Failed to enter standby: " + err);

    {
        std::lock_guard<std::mutex> lock(mu_);
        state_.container_running = false;
        last_error_.reset();
        retry_not_before_.reset();
    }
    transition(StandbyMode::Standby, source);
    spdlog::info("[standby] entered standby - VRAM freed");
    return {OutcomeCode::Succeeded, StandbyMode::Standby, "Entered standby"};
}

TransitionOutcome StandbyController::do_resume(TriggerSource source) {
    spdlog::info("[standby] starting ML API container: {}", opts_.container_name);
    auto rt = runtime_;
    auto name = opts_.container_name;
    std::string err = run_op("start " + name, [rt, name] { rt->start(name); });

    const auto running = query_running();
    if (running) {
        std::lock_guard<std::mutex> lock(mu_);
        state_.container_running = *running;
    }
    if (!err.empty() && running && *running) {
        spdlog::warn("[standby] start reported '{}' but the container is running", err);
        err.clear();
    }
    if (err.empty() && running && !*running) err = "container not running after start";
    if (!err.empty()) return fail(StandbyMode::Standby, source, "Failed to exit standby: " + err);

    spdlog::info("[standby] ML API container started - warming up...");
    const auto deadline = Clock::now() + opts_.resume_max_wait;
    bool ready = health_->healthy();
    while (!ready) {
        if (Clock::now() >= deadline) {
            return fail(StandbyMode::Standby, source,
                        "Failed to exit standby: ML API not ready after " +
                            std::to_string(opts_.resume_max_wait.count()) + "ms");
        }
        if (!queue_.sleep_for(opts_.resume_poll_interval)) {
            return fail(StandbyMode::Standby, source, "Resume abandoned: shutting down");
        }
        ready = health_->healthy();
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        state_.container_running = true;
        state_.last_activity_at = Clock::now();
        last_error_.reset();
        retry_not_before_.reset();
    }
    transition(StandbyMode::Active, source);
    spdlog::info("[standby] exited standby - ML API ready");
    return {OutcomeCode::Succeeded, StandbyMode::Active, "Exited standby"};
}

TransitionOutcome StandbyController::fail(StandbyMode revert_to, TriggerSource source, const std::string& what) {
    spdlog::error("[standby] {}", what);
    {
        std::lock_guard<std::mutex> lock(mu_);
        last_error_ = what;
        retry_not_before_ = Clock::now() + opts_.retry_backoff;
    }
    transition(revert_to, source);
    return {OutcomeCode::Failed, revert_to, what};
}

void StandbyController::transition(StandbyMode to, TriggerSource source) {
    StandbyMode from;
    std::vector<ModeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mu_);
        from = state_.mode;
        state_.mode = to;
        listeners = listeners_;
    }
    settled_cv_.notify_all();
    if (from == to) return;
    for (auto& l : listeners) l(from, to, source);
}

}  // namespace printmon
