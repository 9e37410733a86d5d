#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shardwire/core/transport/concepts.hpp"
#include "shardwire/core/gateway/close_code.hpp"
#include "shardwire/core/gateway/decompressor.hpp"
#include "shardwire/core/gateway/dispatch_event.hpp"
#include "shardwire/core/gateway/error.hpp"
#include "shardwire/core/gateway/identify_throttle.hpp"
#include "shardwire/core/gateway/notice.hpp"
#include "shardwire/core/gateway/opcode.hpp"
#include "shardwire/core/gateway/shard_config.hpp"
#include "shardwire/core/gateway/state.hpp"
#include "shardwire/core/gateway/parser/frame.hpp"
#include "shardwire/core/gateway/parser/hello.hpp"
#include "shardwire/core/gateway/parser/ready.hpp"
#include "shardwire/core/gateway/schema/heartbeat.hpp"
#include "shardwire/core/gateway/schema/identify.hpp"
#include "shardwire/core/gateway/schema/resume.hpp"
#include "shardwire/core/gateway/telemetry/shard.hpp"
#include "shardwire/core/policy/gateway/shard_bundle.hpp"
#include "shardwire/core/config/gateway.hpp"
#include "shardwire/core/deadline.hpp"
#include "shardwire/core/telemetry.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace shardwire::core::gateway {

/*
===============================================================================
 shardwire::core::gateway::Shard
===============================================================================

One gateway session over one transport, parameterized by a transport
conforming to transport::TransportConcept and a policy bundle
(policy::gateway::shard_bundle).

A Shard keeps its identity (shard id, session id, sequence) across transport
lifetimes. Every connection attempt creates a fresh transport and a fresh
Decompressor; session_id and sequence survive a drop only when resuming is
legal.

-------------------------------------------------------------------------------
 Lifecycle
-------------------------------------------------------------------------------
  Disconnected --open()--> Connecting --Hello--> Identifying --READY--> Ready
                                       \-Hello--> Resuming --RESUMED--> Ready

  any connected state --drop--> Reconnecting --backoff--> Connecting
  any connected state --fatal close--> Disconnected (terminal)
  Reconnecting --policy rejects attempt--> Disconnected (terminal)

Drops are classified by the close-code table (close_code.hpp). Opcode 7,
a resumable opcode 9, a zombie connection (heartbeat not acknowledged before
the next one is due) and an abrupt transport drop keep the session.

-------------------------------------------------------------------------------
 Identify throttling
-------------------------------------------------------------------------------
Identifying shards queue in the IdentifyThrottle shared with their manager
and send identify only when granted. Resumes bypass the throttle.

-------------------------------------------------------------------------------
 Consumer model
-------------------------------------------------------------------------------
No callbacks. poll() advances the state machine and fills two queues:
  - dispatch events (opcode 0, raw data) -> pop_dispatch() / drain_dispatch()
  - lifecycle notices                     -> pop_notice()   / drain_notices()
A terminal failure is surfaced exactly once as a Disconnected notice carrying
the classified error.

Single-threaded: every call happens on the poll thread.
===============================================================================
*/

template <
    transport::TransportConcept WS,
    typename Policies = policy::gateway::ShardDefault
>
class Shard {
    using ReconnectPolicy = typename Policies::reconnect;
    using HeartbeatPolicy = typename Policies::heartbeat;

    struct Cause {
        Error error{Error::None};
        lcr::optional<std::uint16_t> close_code{};
        std::string reason{};
        bool remote{false};     // transport already closed by the peer
    };

public:
    Shard(ShardConfig cfg, IdentifyThrottle& throttle) noexcept
        : config_(std::move(cfg))
        , throttle_(throttle)
    {
    }

    // Transport is closed on destruction; no reconnection afterwards.
    ~Shard() {
        teardown_(true, config::gateway::CLOSE_NORMAL);
    }

    Shard(const Shard&) = delete;
    Shard& operator=(const Shard&) = delete;

    // Starts the first connection attempt. A failed attempt is retried by
    // poll() under the reconnect policy; the transport error is returned.
    [[nodiscard]]
    inline transport::Error open() {
        if (state_ != State::Disconnected) {
            SW_WARN("[SHARD " << id() << "] open() called while not disconnected (state: " << to_string(state_) << "). Ignoring.");
            return transport::Error::InvalidState;
        }
        terminal_error_ = Error::None;
        attempts_ = 0;
        transition_(Event::OpenRequested);
        return connect_();
    }

    // Unconditional shutdown. The session is discarded.
    inline void close() {
        if (state_ == State::Disconnected) {
            return; // idempotent
        }
        transition_(Event::CloseRequested);
    }

    // Drops the current transport and reconnects. A resumable request keeps
    // the session. Ignored unless a transport is active.
    inline void request_reconnect(bool resumable = true) {
        if (!ws_) {
            SW_DEBUG("[SHARD " << id() << "] request_reconnect() without transport (state: " << to_string(state_) << "). Ignoring.");
            return;
        }
        Cause cause{Error::Disconnect, {}, "Reconnect requested by client", false};
        transition_(resumable ? Event::DropResumable : Event::DropReidentify, std::move(cause));
    }

    // Sends a raw gateway payload (presence update, member request, ...).
    // Only allowed while Ready.
    [[nodiscard]]
    inline bool send(std::string_view payload) {
        if (state_ != State::Ready) {
            SW_WARN("[SHARD " << id() << "] send() called while not ready (state: " << to_string(state_) << "). Ignoring.");
            return false;
        }
        return send_(payload);
    }

    // Event loop
    inline void poll(Deadline::time_point now = Deadline::clock::now()) {
        // === Drain transport ===
        if (ws_) {
            while (ws_ && ws_->poll_chunk(chunk_)) {
                on_chunk_(now);
            }
            transport::CloseFrame frame;
            if (ws_ && ws_->poll_close(frame)) {
                on_transport_closed_(std::move(frame));
            }
        }
        // === Identify throttle ===
        if (state_ == State::Identifying && !identify_sent_) {
            try_identify_();
        }
        // === Heartbeat ===
        if (ws_ && heartbeat_.expired(now)) {
            on_heartbeat_due_(now);
        }
        // === Reconnection ===
        if (state_ == State::Reconnecting && backoff_.expired(now)) {
            reconnect_();
        }
    }

    // -------------------------------------------------------------------------
    // Consumer queues
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool pop_dispatch(DispatchEvent& out) {
        if (dispatch_.empty()) {
            return false;
        }
        out = std::move(dispatch_.front());
        dispatch_.pop_front();
        return true;
    }

    template<class F>
    inline std::size_t drain_dispatch(F&& f) {
        std::size_t n = 0;
        DispatchEvent ev;
        while (pop_dispatch(ev)) {
            f(ev);
            ++n;
        }
        return n;
    }

    [[nodiscard]]
    inline bool pop_notice(LifecycleNotice& out) {
        if (notices_.empty()) {
            return false;
        }
        out = std::move(notices_.front());
        notices_.pop_front();
        return true;
    }

    template<class F>
    inline std::size_t drain_notices(F&& f) {
        std::size_t n = 0;
        LifecycleNotice notice;
        while (pop_notice(notice)) {
            f(notice);
            ++n;
        }
        return n;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] inline std::uint32_t id() const noexcept { return config_.shard_id; }
    [[nodiscard]] inline State state() const noexcept { return state_; }
    [[nodiscard]] inline const ShardConfig& config() const noexcept { return config_; }
    [[nodiscard]] inline const lcr::optional<std::string>& session_id() const noexcept { return session_id_; }
    [[nodiscard]] inline const lcr::optional<std::uint64_t>& sequence() const noexcept { return sequence_; }
    [[nodiscard]] inline const lcr::optional<std::string>& resume_url() const noexcept { return resume_url_; }
    [[nodiscard]] inline std::chrono::milliseconds heartbeat_interval() const noexcept { return heartbeat_interval_; }
    [[nodiscard]] inline std::uint32_t attempts() const noexcept { return attempts_; }

    // Non-None once the shard gave up (fatal close code, reconnect check)
    [[nodiscard]] inline Error terminal_error() const noexcept { return terminal_error_; }

    [[nodiscard]]
    inline bool is_active() const noexcept {
        return state_ != State::Disconnected;
    }

    [[nodiscard]]
    inline bool is_idle() const noexcept {
        return dispatch_.empty() && notices_.empty();
    }

    [[nodiscard]]
    inline const telemetry::Shard& telemetry() const noexcept {
        return telemetry_;
    }

#ifdef SW_UNIT_TEST
public:
    [[nodiscard]] inline bool has_transport() const noexcept { return static_cast<bool>(ws_); }
    [[nodiscard]] inline WS& transport() { return *ws_; }
    [[nodiscard]] inline const Deadline& heartbeat_deadline() const noexcept { return heartbeat_; }
    [[nodiscard]] inline const Deadline& backoff_deadline() const noexcept { return backoff_; }
#endif // SW_UNIT_TEST

private:
    // State mutator with logging
    inline void set_state_(State new_state) noexcept {
        SW_TRACE("[SHARD " << id() << "] State:  " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
    }

    // State machine transition function
    inline void transition_(Event event, Cause cause = {}) {
        const State state = state_;

        SW_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        switch (state) {

        // ================================================================
        case State::Disconnected:
            switch (event) {
            case Event::OpenRequested:
                set_state_(State::Connecting);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportConnected:
                emit_(NoticeKind::Connected);
                break;

            case Event::TransportConnectFailed:
                SW_TL1( telemetry_.connect_failures_total.inc() );
                teardown_(false, config::gateway::CLOSE_RESUMABLE);
                schedule_retry_();
                break;

            case Event::HelloResume:
                set_state_(State::Resuming);
                send_resume_();
                break;

            case Event::HelloIdentify:
                set_state_(State::Identifying);
                identify_sent_ = false;
                throttle_.enqueue(id());
                try_identify_();
                break;

            default:
                on_drop_(event, std::move(cause));
                break;
            }
            break;

        // ================================================================
        case State::Identifying:
        case State::Resuming:
            switch (event) {
            case Event::SessionReady:
                set_state_(State::Ready);
                attempts_ = 0;
                resumable_ = true;
                emit_(state == State::Resuming ? NoticeKind::Resumed : NoticeKind::Identified);
                break;

            default:
                on_drop_(event, std::move(cause));
                break;
            }
            break;

        // ================================================================
        case State::Ready:
            on_drop_(event, std::move(cause));
            break;

        // ================================================================
        case State::Reconnecting:
            switch (event) {
            case Event::RetryTimerExpired:
                set_state_(State::Connecting);
                break;

            case Event::RetryRejected:
                SW_ERROR("[SHARD " << id() << "] Reconnect check rejected attempt " << attempts_ << " -> giving up.");
                backoff_.cancel();
                clear_session_();
                set_state_(State::Disconnected);
                terminal_error_ = Error::ReconnectCheckFailed;
                emit_(NoticeKind::Disconnected, Cause{Error::ReconnectCheckFailed, {}, "Reconnect check failed", false});
                break;

            case Event::CloseRequested:
                backoff_.cancel();
                clear_session_();
                set_state_(State::Disconnected);
                emit_(NoticeKind::Disconnected, Cause{Error::None, {}, "Closed by client", false});
                break;

            default:
                break;
            }
            break;
        }
    }

    // Drop handling shared by every state holding a transport
    inline void on_drop_(Event event, Cause cause) {
        switch (event) {
        case Event::DropResumable:
            SW_TL1( telemetry_.resumable_drops_total.inc() );
            SW_INFO("[SHARD " << id() << "] Disconnected (" << cause.reason << "), session kept for resume.");
            teardown_(!cause.remote, config::gateway::CLOSE_RESUMABLE);
            resumable_ = true;
            emit_(NoticeKind::Disconnected, std::move(cause));
            schedule_retry_();
            break;

        case Event::DropReidentify:
            SW_TL1( telemetry_.reidentify_drops_total.inc() );
            SW_INFO("[SHARD " << id() << "] Disconnected (" << cause.reason << "), session discarded.");
            teardown_(!cause.remote, config::gateway::CLOSE_NORMAL);
            clear_session_();
            emit_(NoticeKind::Disconnected, std::move(cause));
            schedule_retry_();
            break;

        case Event::DropFatal:
            SW_ERROR("[SHARD " << id() << "] Fatal close (" << to_string(cause.error) << ": " << cause.reason << ") -> giving up.");
            teardown_(!cause.remote, config::gateway::CLOSE_NORMAL);
            clear_session_();
            set_state_(State::Disconnected);
            terminal_error_ = cause.error;
            emit_(NoticeKind::Disconnected, std::move(cause));
            break;

        case Event::CloseRequested:
            SW_DEBUG("[SHARD " << id() << "] Closing.");
            teardown_(true, config::gateway::CLOSE_NORMAL);
            clear_session_();
            set_state_(State::Disconnected);
            emit_(NoticeKind::Disconnected, Cause{Error::None, {}, "Closed by client", false});
            break;

        default:
            break;
        }
    }

    // -------------------------------------------------------------------------
    // Connection management
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline transport::Error connect_() {
        SW_TL1( telemetry_.connect_attempts_total.inc() );
        ws_ = std::make_unique<WS>();
        decompressor_ = config_.compress ? std::make_unique<Decompressor>() : nullptr;
        heartbeat_acked_ = true;

        const std::string url = build_url_();
        SW_DEBUG("[SHARD " << id() << "] Connecting to: " << url << " (attempt " << attempts_ << ")");
        const transport::Error err = ws_->connect(url);
        if (err != transport::Error::None) {
            SW_WARN("[SHARD " << id() << "] Connection failed (" << transport::to_string(err) << ")");
            transition_(Event::TransportConnectFailed);
            return err;
        }
        transition_(Event::TransportConnected);
        return transport::Error::None;
    }

    inline void reconnect_() {
        if (!ReconnectPolicy::allow(attempts_)) {
            transition_(Event::RetryRejected);
            return;
        }
        transition_(Event::RetryTimerExpired);
        (void)connect_();
    }

    inline void schedule_retry_() {
        ++attempts_;
        const auto delay = ReconnectPolicy::backoff(attempts_);
        set_state_(State::Reconnecting);
        backoff_.arm_in(delay);
        SW_INFO("[SHARD " << id() << "] Next connection attempt in " << std::chrono::milliseconds(delay).count() << " ms");
    }

    // Tears down the transport and every per-connection wait
    inline void teardown_(bool close_transport, std::uint16_t code) noexcept {
        heartbeat_.cancel();
        if (state_ == State::Identifying && !identify_sent_) {
            throttle_.cancel(id());
        }
        identify_sent_ = false;
        if (ws_) {
            if (close_transport) {
                ws_->close(code);
            }
            ws_.reset();
        }
        decompressor_.reset();
    }

    inline void clear_session_() noexcept {
        session_id_.reset();
        sequence_.reset();
        resume_url_.reset();
        resumable_ = false;
    }

    [[nodiscard]]
    inline bool can_resume_() const noexcept {
        return resumable_ && session_id_.has() && sequence_.has();
    }

    [[nodiscard]]
    inline std::string build_url_() const {
        std::string url = (can_resume_() && resume_url_.has()) ? resume_url_.value() : config_.gateway_url;
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        url += (url.find('?') == std::string::npos) ? "/?" : "&";
        url += "v=";
        url += std::to_string(config::gateway::API_VERSION);
        url += "&encoding=json";
        if (config_.compress) {
            url += "&compress=zlib-stream";
        }
        return url;
    }

    // -------------------------------------------------------------------------
    // Inbound
    // -------------------------------------------------------------------------

    inline void on_chunk_(Deadline::time_point now) {
        SW_TL1( telemetry_.chunks_received_total.inc() );
        if (!decompressor_) {
            on_payload_(chunk_, now);
            return;
        }
        payloads_.clear();
        const auto r = decompressor_->feed(chunk_, payloads_);
        if (r != decompress::Result::Ok) {
            SW_TL1( telemetry_.decompress_failures_total.inc() );
            SW_WARN("[SHARD " << id() << "] Decompression failed (" << decompress::to_string(r) << ")");
            transition_(Event::DropResumable, Cause{Error::TransportFailure, {}, "Decompression failed", false});
            return;
        }
        for (const auto& payload : payloads_) {
            if (!ws_) {
                break; // dropped while handling an earlier payload
            }
            on_payload_(payload, now);
        }
    }

    inline void on_payload_(std::string_view text, Deadline::time_point now) {
        SW_TL1( telemetry_.payloads_received_total.inc() );
        parser::Frame frame;
        if (parser::frame::parse(json_, text, frame) != core::parser::Result::Parsed) {
            SW_TL1( telemetry_.parse_failures_total.inc() );
            SW_WARN("[SHARD " << id() << "] Unparseable gateway payload ignored.");
            return;
        }
        if (frame.sequence.has()) {
            sequence_ = frame.sequence.value();
        }

        if (frame.op > static_cast<std::uint64_t>(Opcode::HeartbeatAck)) {
            SW_DEBUG("[SHARD " << id() << "] Unknown opcode " << frame.op << " ignored.");
            return;
        }
        switch (static_cast<Opcode>(frame.op)) {
        case Opcode::Dispatch:
            on_dispatch_(frame);
            break;

        case Opcode::Heartbeat:
            SW_DEBUG("[SHARD " << id() << "] Heartbeat requested by server.");
            send_heartbeat_();
            break;

        case Opcode::Reconnect:
            transition_(Event::DropResumable, Cause{Error::Disconnect, {}, "Reconnect requested by server", false});
            break;

        case Opcode::InvalidSession: {
            bool resumable = false;
            if (frame.has_data && frame.data.get(resumable)) {
                resumable = false;
            }
            transition_(resumable ? Event::DropResumable : Event::DropReidentify,
                        Cause{Error::SessionInvalidated, {}, resumable ? "Invalid session (resumable)" : "Invalid session", false});
            break;
        }

        case Opcode::Hello:
            on_hello_(frame, now);
            break;

        case Opcode::HeartbeatAck:
            SW_TL1( telemetry_.heartbeat_acks_total.inc() );
            heartbeat_acked_ = true;
            break;

        default:
            SW_DEBUG("[SHARD " << id() << "] Unexpected opcode " << frame.op << " ignored.");
            break;
        }
    }

    inline void on_hello_(const parser::Frame& frame, Deadline::time_point now) {
        if (state_ != State::Connecting) {
            SW_WARN("[SHARD " << id() << "] Hello received while " << to_string(state_) << ". Ignoring.");
            return;
        }
        schema::Hello hello;
        if (!frame.has_data || parser::hello::parse(frame.data, hello) != core::parser::Result::Parsed) {
            SW_WARN("[SHARD " << id() << "] Invalid hello ignored.");
            return;
        }
        heartbeat_interval_ = hello.heartbeat_interval;
        heartbeat_acked_ = true;
        heartbeat_.arm_in(std::chrono::milliseconds(HeartbeatPolicy::first_delay(heartbeat_interval_)), now);
        SW_DEBUG("[SHARD " << id() << "] Hello (heartbeat interval " << heartbeat_interval_.count() << " ms)");

        transition_(can_resume_() ? Event::HelloResume : Event::HelloIdentify);
    }

    inline void on_dispatch_(const parser::Frame& frame) {
        SW_TL1( telemetry_.dispatch_events_total.inc() );
        const std::string_view name = frame.name;

        if (name == "READY") {
            schema::Ready ready;
            if (frame.has_data && parser::ready::parse(frame.data, ready) == core::parser::Result::Parsed) {
                session_id_ = std::move(ready.session_id);
                if (ready.resume_gateway_url.has()) {
                    resume_url_ = ready.resume_gateway_url.value();
                }
                SW_INFO("[SHARD " << id() << "] Identified (session " << session_id_.value() << ")");
                transition_(Event::SessionReady);
            }
            else {
                SW_WARN("[SHARD " << id() << "] READY without session id.");
            }
        }
        else if (name == "RESUMED") {
            SW_INFO("[SHARD " << id() << "] Resumed at sequence " << sequence_.value_or(0));
            transition_(Event::SessionReady);
        }

        DispatchEvent ev;
        ev.shard_id = id();
        ev.sequence = sequence_.value_or(0);
        ev.name = std::string(name);
        if (frame.has_data) {
            ev.data = simdjson::minify(frame.data);
        }
        else {
            ev.data = "null";
        }
        dispatch_.push_back(std::move(ev));
    }

    inline void on_transport_closed_(transport::CloseFrame frame) {
        const CloseRule rule = classify_close(frame.code);
        Cause cause{rule.error, frame.code, frame.reason.empty() ? std::string(rule.name) : std::move(frame.reason), true};

        switch (rule.action) {
        case CloseAction::Resume:
            transition_(Event::DropResumable, std::move(cause));
            break;

        case CloseAction::Reidentify:
            transition_(Event::DropReidentify, std::move(cause));
            break;

        case CloseAction::Fatal:
            transition_(Event::DropFatal, std::move(cause));
            break;

        case CloseAction::Unhandled:
            SW_WARN("[SHARD " << id() << "] Unhandled close code " << lcr::to_string(frame.code) << " -> reconnecting without resume.");
            transition_(Event::DropReidentify, std::move(cause));
            break;
        }
    }

    inline void on_heartbeat_due_(Deadline::time_point now) {
        if (!heartbeat_acked_) {
            SW_TL1( telemetry_.zombie_connections_total.inc() );
            SW_WARN("[SHARD " << id() << "] Heartbeat not acknowledged -> zombie connection.");
            transition_(Event::DropResumable, Cause{Error::Disconnect, {}, "Zombie connection", false});
            return;
        }
        heartbeat_acked_ = false;
        send_heartbeat_();
        heartbeat_.arm_in(heartbeat_interval_, now);
    }

    // -------------------------------------------------------------------------
    // Outbound
    // -------------------------------------------------------------------------

    inline void try_identify_() {
        std::chrono::milliseconds wait{0};
        if (!throttle_.try_acquire(id(), wait)) {
            return;
        }
        schema::Identify identify;
        identify.token = config_.token;
        identify.intents = config_.intents;
        identify.shard_id = config_.shard_id;
        identify.shard_count = config_.shard_count;
        identify.large_threshold = config_.large_threshold;
        identify.properties = config_.properties;
        identify.presence = config_.presence;

        identify_sent_ = true;
        SW_TL1( telemetry_.identifies_sent_total.inc() );
        SW_DEBUG("[SHARD " << id() << "] Identifying as shard [" << config_.shard_id << ", " << config_.shard_count << "]");
        (void)send_(identify.to_json());
    }

    inline void send_resume_() {
        schema::Resume resume;
        resume.token = config_.token;
        resume.session_id = session_id_.value();
        resume.sequence = sequence_.value();
        SW_TL1( telemetry_.resumes_sent_total.inc() );
        SW_DEBUG("[SHARD " << id() << "] Resuming session " << resume.session_id << " at sequence " << resume.sequence);
        (void)send_(resume.to_json());
    }

    inline void send_heartbeat_() {
        schema::Heartbeat hb;
        hb.sequence = sequence_;
        SW_TL1( telemetry_.heartbeats_sent_total.inc() );
        (void)send_(hb.to_json());
    }

    [[nodiscard]]
    inline bool send_(std::string_view text) {
        if (!ws_) {
            return false;
        }
        if (!ws_->send(text)) {
            // The transport reports the failure through poll_close()
            SW_WARN("[SHARD " << id() << "] Transport rejected outbound payload.");
            return false;
        }
        SW_TL1( telemetry_.payloads_sent_total.inc() );
        return true;
    }

    inline void emit_(NoticeKind kind, Cause cause = {}) {
        LifecycleNotice notice;
        notice.shard_id = id();
        notice.kind = kind;
        notice.error = cause.error;
        notice.close_code = cause.close_code;
        notice.reason = std::move(cause.reason);
        notices_.push_back(std::move(notice));
    }

private:
    ShardConfig config_;
    IdentifyThrottle& throttle_;            // shared with the manager (not owned)

    std::unique_ptr<WS> ws_;                // fresh instance per connection attempt
    std::unique_ptr<Decompressor> decompressor_;
    simdjson::dom::parser json_;

    // Reused buffers
    std::string chunk_;
    std::vector<std::string> payloads_;

    // Session
    lcr::optional<std::string> session_id_;
    lcr::optional<std::uint64_t> sequence_;
    lcr::optional<std::string> resume_url_;
    bool resumable_{false};                 // last drop allows resuming

    // Heartbeat
    std::chrono::milliseconds heartbeat_interval_{0};
    bool heartbeat_acked_{true};
    Deadline heartbeat_;

    // Identify
    bool identify_sent_{false};

    // State machine
    State state_{State::Disconnected};
    Deadline backoff_;
    std::uint32_t attempts_{0};             // connection attempts since last Ready
    Error terminal_error_{Error::None};

    // Consumer queues
    std::deque<DispatchEvent> dispatch_;
    std::deque<LifecycleNotice> notices_;

    telemetry::Shard telemetry_;
};

} // namespace shardwire::core::gateway
