#pragma once

#include "umelink/connector/broadcast_channel.hpp"
#include "umelink/connector/connection_state.hpp"
#include "umelink/connector/connector_config.hpp"
#include "umelink/connector/observable_state.hpp"
#include "umelink/net/connection/endpoint_resolver.hpp"
#include "umelink/net/connection/reconnect_policy.hpp"
#include "umelink/net/connection/stream_session.hpp"
#include "umelink/net/discovery/discovery_client.hpp"
#include "umelink/net/discovery/service_record.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace umelink
{

/// Counters since construction. Read them through BackendConnector::stats().
struct ConnectorStats
{
    std::uint64_t discovery_cycles    = 0;
    std::uint64_t records_found       = 0;
    std::uint64_t resolutions_failed  = 0;
    std::uint64_t sessions_opened     = 0;
    std::uint64_t connection_failures = 0;
    std::uint64_t endpoints_abandoned = 0;
    std::uint64_t messages_received   = 0;
    std::uint64_t messages_sent       = 0;
    std::uint64_t messages_dropped    = 0;
};

/**
 * Finds a backend on the local network and keeps one session to it open.
 *
 * The connector walks Idle -> Discovering -> ServiceFound -> Resolved -> Connecting -> Connected and
 * falls back to Reconnecting (with backoff) or Disconnected -> Discovering when the session or the
 * endpoint goes away. Only stop() returns it to Idle.
 *
 * Everything the collaborators report is posted to the io_context and applied under one mutex,
 * tagged with the scan, record or session it belongs to; events of anything already superseded are
 * dropped. start(), stop() and send() may be called from any thread.
 *
 * State observers run while the connector's lock is held. They must not call back into the
 * connector.
 *
 * Must be owned by a std::shared_ptr.
 */
class BackendConnector : public std::enable_shared_from_this<BackendConnector>
{
public:
    /// UDP discovery, system resolver and WebSocket sessions, all set up from @p config.
    /// Also sets the process-wide log level to config.log_level.
    static std::shared_ptr<BackendConnector> create(boost::asio::io_context& io_context, const ConnectorConfig& config);

    /// Throws std::invalid_argument when the config doesn't validate. Leaves the log level alone.
    BackendConnector(boost::asio::io_context& io_context, ConnectorConfig config, std::shared_ptr<DiscoveryClient> discovery,
                     std::shared_ptr<EndpointResolver> resolver, std::shared_ptr<SessionFactory> session_factory);

    ~BackendConnector();

    BackendConnector(const BackendConnector&)            = delete;
    BackendConnector& operator=(const BackendConnector&) = delete;
    BackendConnector(BackendConnector&&)                 = delete;
    BackendConnector& operator=(BackendConnector&&)      = delete;

    /**
     * Begin discovery. Only acts in Idle or Disconnected.
     * @return false if the connector was already running
     */
    bool start();

    /// Cancel everything in flight and return to Idle. Safe to call repeatedly.
    void stop();

    /**
     * Send a text message over the open session.
     * @return false when there's no open session or the transport refused; the message is counted as dropped
     */
    bool send(const std::string& text);

    ConnectionState state() const;
    ObservableState<ConnectionState>& state_observable() { return _state; }

    /// Messages received from now on. 0 uses the configured buffer capacity.
    std::shared_ptr<Subscriber<std::string>> subscribe_messages(std::size_t capacity = 0);

    ConnectorStats stats() const;
    std::optional<ServiceRecord> current_record() const;
    int reconnect_attempts() const;

    const ConnectorConfig& config() const { return _config; }

private:
    using Lock = std::lock_guard<std::mutex>;

    void handle_found(std::uint64_t scan, const ServiceRecord& record);
    void handle_lost(std::uint64_t scan, const std::string& name);
    void handle_discovery_failed(std::uint64_t scan, const boost::system::error_code& error_code);
    void handle_resolved(std::uint64_t record_generation, const boost::system::error_code& error_code, const ServiceRecord& record);
    void handle_opened(SessionId id);
    void handle_message(SessionId id, const std::string& text);
    void handle_session_ended(SessionId id, const std::string& reason);
    void handle_retry_timer(std::uint64_t timer_generation, const boost::system::error_code& error_code);
    void handle_discovery_timer(std::uint64_t timer_generation, const boost::system::error_code& error_code);

    // Everything below runs with _mutex held.
    void set_state(ConnectionState state);
    void begin_discovery();
    void stop_discovery();
    void restart_discovery_later();
    bool count_discovery_failure();
    void open_session();
    void close_session(std::uint16_t code, const std::string& reason);
    void handle_connection_loss(const std::string& reason);
    void abandon_endpoint(const std::string& reason);
    void forget_record();
    void cancel_timers();

    DiscoveryHandlers make_discovery_handlers(std::uint64_t scan);
    SessionHandlers make_session_handlers();

    template <typename Function>
    void post_event(Function function);

    boost::asio::io_context& _io_context;
    const ConnectorConfig _config;
    std::shared_ptr<DiscoveryClient> _discovery;
    std::shared_ptr<EndpointResolver> _resolver;
    std::shared_ptr<SessionFactory> _session_factory;

    mutable std::mutex _mutex;
    ObservableState<ConnectionState> _state {ConnectionState::idle};
    BroadcastChannel<std::string> _messages;
    ConnectorStats _stats;

    std::optional<ServiceRecord> _record;
    bool _resolving = false;
    std::shared_ptr<StreamSession> _session;
    SessionId _last_session_id = 0;
    ReconnectCounter _reconnects;
    int _discovery_failures = 0;

    std::uint64_t _scan              = 0;
    std::uint64_t _record_generation = 0;

    boost::asio::steady_timer _retry_timer;
    std::uint64_t _retry_timer_generation = 0;
    boost::asio::steady_timer _discovery_timer;
    std::uint64_t _discovery_timer_generation = 0;
};

} // namespace umelink
