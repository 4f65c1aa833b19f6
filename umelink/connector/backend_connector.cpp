#include "umelink/connector/backend_connector.hpp"
#include "umelink/logging/umelink_logging.hpp"
#include "umelink/net/connection/tcp_endpoint_resolver.hpp"
#include "umelink/net/connection/websocket_session.hpp"
#include "umelink/net/discovery/udp_discovery_client.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>

#include <stdexcept>
#include <utility>

namespace umelink
{

std::shared_ptr<BackendConnector> BackendConnector::create(boost::asio::io_context& io_context, const ConnectorConfig& config)
{
    config.validate();
    logging::current_log_level = config.log_level;

    auto discovery = std::make_shared<UdpDiscoveryClient>(io_context, config.service_type, config.name_prefix, config.discovery_port,
                                                          config.discovery_interval, config.record_ttl);
    discovery->set_destination_address(boost::asio::ip::make_address(config.discovery_address));

    WebSocketOptions options;
    options.path             = config.path;
    options.open_timeout     = config.open_timeout;
    options.max_queued_bytes = config.max_queued_bytes;

    return std::make_shared<BackendConnector>(io_context, config, std::move(discovery), std::make_shared<TcpEndpointResolver>(io_context),
                                              std::make_shared<WebSocketSessionFactory>(io_context, options));
}

BackendConnector::BackendConnector(boost::asio::io_context& io_context, ConnectorConfig config, std::shared_ptr<DiscoveryClient> discovery,
                                   std::shared_ptr<EndpointResolver> resolver, std::shared_ptr<SessionFactory> session_factory)
    : _io_context(io_context),
      _config(std::move(config)),
      _discovery(std::move(discovery)),
      _resolver(std::move(resolver)),
      _session_factory(std::move(session_factory)),
      _reconnects(_config.reconnect),
      _retry_timer(io_context),
      _discovery_timer(io_context)
{
    _config.validate();
    if (!_discovery || !_resolver || !_session_factory)
    {
        throw std::invalid_argument("BackendConnector needs a discovery client, a resolver and a session factory");
    }
}

BackendConnector::~BackendConnector()
{
    stop();
}

bool BackendConnector::start()
{
    Lock lock(_mutex);
    const ConnectionState current = _state.get();
    if (current != ConnectionState::idle && current != ConnectionState::disconnected)
    {
        UMELINK_LOG_DEBUG("Already running (" << current << ")");
        return false;
    }

    UMELINK_LOG_INFO("Looking for " << _config.service_type << " services named " << _config.name_prefix << "*");
    _discovery_failures = 0;
    _reconnects.reset();
    forget_record();
    begin_discovery();
    return true;
}

void BackendConnector::stop()
{
    Lock lock(_mutex);
    cancel_timers();
    stop_discovery();
    _resolver->cancel();
    close_session(close_code::normal, "client stopping");
    forget_record();
    _reconnects.reset();
    _discovery_failures = 0;
    set_state(ConnectionState::idle);
}

bool BackendConnector::send(const std::string& text)
{
    Lock lock(_mutex);
    if (_state.get() != ConnectionState::connected || !_session)
    {
        ++_stats.messages_dropped;
        UMELINK_LOG_DEBUG("Not connected, dropping message of " << text.size() << " bytes");
        return false;
    }

    if (_session->send(text))
    {
        ++_stats.messages_sent;
        return true;
    }

    ++_stats.messages_dropped;
    ++_stats.connection_failures;
    UMELINK_LOG_WARNING("Session " << _session->id() << " refused a message, treating the connection as lost");
    close_session(close_code::going_away, "send failed");
    handle_connection_loss("send failed");
    return false;
}

ConnectionState BackendConnector::state() const
{
    return _state.get();
}

std::shared_ptr<Subscriber<std::string>> BackendConnector::subscribe_messages(std::size_t capacity)
{
    return _messages.subscribe(capacity == 0 ? _config.message_buffer_capacity : capacity);
}

ConnectorStats BackendConnector::stats() const
{
    Lock lock(_mutex);
    return _stats;
}

std::optional<ServiceRecord> BackendConnector::current_record() const
{
    Lock lock(_mutex);
    return _record;
}

int BackendConnector::reconnect_attempts() const
{
    Lock lock(_mutex);
    return _reconnects.attempts();
}

template <typename Function>
void BackendConnector::post_event(Function function)
{
    std::weak_ptr<BackendConnector> weak = weak_from_this();
    boost::asio::post(_io_context,
                      [weak, function = std::move(function)]() mutable
                      {
                          if (auto self = weak.lock())
                          {
                              function(*self);
                          }
                      });
}

DiscoveryHandlers BackendConnector::make_discovery_handlers(std::uint64_t scan)
{
    // Collaborators may report from inside their own locks; hop through the io_context first.
    std::weak_ptr<BackendConnector> weak = weak_from_this();
    auto post_to_self = [weak](auto function)
    {
        if (auto self = weak.lock())
        {
            self->post_event(std::move(function));
        }
    };

    DiscoveryHandlers handlers;
    handlers.on_found = [post_to_self, scan](const ServiceRecord& record)
    { post_to_self([scan, record](BackendConnector& self) { self.handle_found(scan, record); }); };
    handlers.on_lost = [post_to_self, scan](const std::string& name)
    { post_to_self([scan, name](BackendConnector& self) { self.handle_lost(scan, name); }); };
    handlers.on_failed = [post_to_self, scan](const boost::system::error_code& error_code)
    { post_to_self([scan, error_code](BackendConnector& self) { self.handle_discovery_failed(scan, error_code); }); };
    return handlers;
}

SessionHandlers BackendConnector::make_session_handlers()
{
    std::weak_ptr<BackendConnector> weak = weak_from_this();
    auto post_to_self = [weak](auto function)
    {
        if (auto self = weak.lock())
        {
            self->post_event(std::move(function));
        }
    };

    SessionHandlers handlers;
    handlers.on_opened = [post_to_self](SessionId id) { post_to_self([id](BackendConnector& self) { self.handle_opened(id); }); };
    handlers.on_message = [post_to_self](SessionId id, const std::string& text)
    { post_to_self([id, text](BackendConnector& self) { self.handle_message(id, text); }); };
    handlers.on_closed = [post_to_self](SessionId id, std::uint16_t code, const std::string& reason)
    {
        std::string description = "closed by peer (" + std::to_string(code) + (reason.empty() ? ")" : ", " + reason + ")");
        post_to_self([id, description](BackendConnector& self) { self.handle_session_ended(id, description); });
    };
    handlers.on_failed = [post_to_self](SessionId id, const std::string& reason)
    { post_to_self([id, reason](BackendConnector& self) { self.handle_session_ended(id, reason); }); };
    return handlers;
}

void BackendConnector::handle_found(std::uint64_t scan, const ServiceRecord& record)
{
    Lock lock(_mutex);
    if (scan != _scan)
    {
        UMELINK_LOG_DEBUG("Ignoring " << record.name << " from an old scan");
        return;
    }
    ++_stats.records_found;

    if (_record || _resolving || _state.get() != ConnectionState::discovering)
    {
        UMELINK_LOG_DEBUG("Already pursuing a service, ignoring " << record.name);
        return;
    }

    UMELINK_LOG_INFO("Found " << record);
    _record = record;
    ++_record_generation;
    _resolving = true;
    set_state(ConnectionState::service_found);

    const std::uint64_t generation = _record_generation;
    std::weak_ptr<BackendConnector> weak = weak_from_this();
    const bool accepted = _resolver->async_resolve(
        record,
        [weak, generation](const boost::system::error_code& error_code, const ServiceRecord& resolved)
        {
            if (auto self = weak.lock())
            {
                self->post_event([generation, error_code, resolved](BackendConnector& connector)
                                 { connector.handle_resolved(generation, error_code, resolved); });
            }
        });

    if (!accepted)
    {
        // An abandoned resolution of the same name is still pending; try again with a fresh scan.
        UMELINK_LOG_WARNING("Resolver busy with " << record.name << ", retrying discovery");
        ++_stats.resolutions_failed;
        forget_record();
        if (!count_discovery_failure())
        {
            set_state(ConnectionState::discovering);
            stop_discovery();
            restart_discovery_later();
        }
    }
}

void BackendConnector::handle_lost(std::uint64_t scan, const std::string& name)
{
    Lock lock(_mutex);
    if (scan != _scan)
    {
        UMELINK_LOG_DEBUG("Ignoring loss of " << name << " from an old scan");
        return;
    }
    if (!_record || _record->name != name)
    {
        UMELINK_LOG_DEBUG("Lost " << name << ", not the service in use");
        return;
    }

    UMELINK_LOG_WARNING("Service " << name << " went away");
    _resolver->cancel();
    cancel_timers();
    close_session(close_code::going_away, "service lost");
    forget_record();
    _reconnects.reset();
    set_state(ConnectionState::disconnected);
    begin_discovery();
}

void BackendConnector::handle_discovery_failed(std::uint64_t scan, const boost::system::error_code& error_code)
{
    Lock lock(_mutex);
    if (scan != _scan)
    {
        UMELINK_LOG_DEBUG("Ignoring failure of an old scan: " << error_code.message());
        return;
    }

    UMELINK_LOG_WARNING("Discovery failed: " << error_code.message());
    const ConnectionState current = _state.get();
    if (current != ConnectionState::discovering && current != ConnectionState::disconnected)
    {
        // A record is already being pursued; discovery restarts when it's given up.
        return;
    }
    if (count_discovery_failure())
    {
        return;
    }
    set_state(ConnectionState::disconnected);
    restart_discovery_later();
}

void BackendConnector::handle_resolved(std::uint64_t record_generation, const boost::system::error_code& error_code, const ServiceRecord& record)
{
    Lock lock(_mutex);
    if (record_generation != _record_generation)
    {
        UMELINK_LOG_DEBUG("Ignoring resolution of " << record.name << " that is no longer wanted");
        return;
    }
    _resolving = false;

    const bool usable = !error_code && record.resolved && record.host && !record.host->empty() && record.port && *record.port != 0;
    if (!usable)
    {
        UMELINK_LOG_WARNING("Could not resolve " << record.name << ": " << (error_code ? error_code.message() : "no endpoint"));
        ++_stats.resolutions_failed;
        forget_record();
        if (count_discovery_failure())
        {
            return;
        }
        // Known names aren't reported again by a running scan; start a fresh one after the pause.
        set_state(ConnectionState::discovering);
        stop_discovery();
        restart_discovery_later();
        return;
    }

    UMELINK_LOG_INFO("Resolved " << record.name << " to " << *record.host << ":" << *record.port);
    _record = record;
    set_state(ConnectionState::resolved);
    stop_discovery();
    _reconnects.reset();
    open_session();
}

void BackendConnector::handle_opened(SessionId id)
{
    Lock lock(_mutex);
    if (!_session || _session->id() != id)
    {
        UMELINK_LOG_DEBUG("Ignoring open of stale session " << id);
        return;
    }

    UMELINK_LOG_INFO("Session " << id << " open to " << *_record->host << ":" << *_record->port);
    ++_stats.sessions_opened;
    _reconnects.reset();
    _discovery_failures = 0;
    set_state(ConnectionState::connected);
}

void BackendConnector::handle_message(SessionId id, const std::string& text)
{
    std::size_t delivered = 0;
    {
        Lock lock(_mutex);
        if (!_session || _session->id() != id)
        {
            UMELINK_LOG_DEBUG("Ignoring message of stale session " << id);
            return;
        }
        ++_stats.messages_received;
        delivered = _messages.publish(text);
    }
    UMELINK_LOG_TRACE("Message of " << text.size() << " bytes to " << delivered << " subscriber(s)");
}

void BackendConnector::handle_session_ended(SessionId id, const std::string& reason)
{
    Lock lock(_mutex);
    if (!_session || _session->id() != id)
    {
        UMELINK_LOG_DEBUG("Ignoring end of stale session " << id << ": " << reason);
        return;
    }

    UMELINK_LOG_WARNING("Session " << id << " ended: " << reason);
    ++_stats.connection_failures;
    _session.reset();
    handle_connection_loss(reason);
}

void BackendConnector::handle_retry_timer(std::uint64_t timer_generation, const boost::system::error_code& error_code)
{
    Lock lock(_mutex);
    if (error_code == boost::asio::error::operation_aborted || timer_generation != _retry_timer_generation)
    {
        return;
    }
    if (error_code)
    {
        UMELINK_LOG_ERROR("Reconnect timer failed: " << error_code.message());
    }
    if (_state.get() != ConnectionState::reconnecting || !_record)
    {
        UMELINK_LOG_DEBUG("Reconnect no longer wanted");
        return;
    }
    open_session();
}

void BackendConnector::handle_discovery_timer(std::uint64_t timer_generation, const boost::system::error_code& error_code)
{
    Lock lock(_mutex);
    if (error_code == boost::asio::error::operation_aborted || timer_generation != _discovery_timer_generation)
    {
        return;
    }
    if (error_code)
    {
        UMELINK_LOG_ERROR("Discovery retry timer failed: " << error_code.message());
    }
    const ConnectionState current = _state.get();
    if (_record || (current != ConnectionState::discovering && current != ConnectionState::disconnected))
    {
        return;
    }
    begin_discovery();
}

void BackendConnector::set_state(ConnectionState state)
{
    const ConnectionState previous = _state.get();
    if (previous == state)
    {
        return;
    }
    UMELINK_LOG_INFO(previous << " -> " << state);
    _state.set(state);
}

void BackendConnector::begin_discovery()
{
    set_state(ConnectionState::discovering);
    if (_discovery->is_active())
    {
        return;
    }

    ++_scan;
    ++_stats.discovery_cycles;
    if (!_discovery->async_start(make_discovery_handlers(_scan)))
    {
        UMELINK_LOG_WARNING("Discovery refused to start");
    }
}

void BackendConnector::stop_discovery()
{
    // Bumping the scan first drops anything the old scan already posted.
    ++_scan;
    _discovery->stop();
}

void BackendConnector::restart_discovery_later()
{
    const std::uint64_t generation = ++_discovery_timer_generation;
    std::weak_ptr<BackendConnector> weak = weak_from_this();
    _discovery_timer.expires_after(_config.discovery_retry_delay);
    _discovery_timer.async_wait(
        [weak, generation](const boost::system::error_code& error_code)
        {
            if (auto self = weak.lock())
            {
                self->handle_discovery_timer(generation, error_code);
            }
        });
    UMELINK_LOG_DEBUG("Retrying discovery in " << _config.discovery_retry_delay.count() << "ms");
}

bool BackendConnector::count_discovery_failure()
{
    ++_discovery_failures;
    if (_config.max_discovery_failures == 0 || _discovery_failures < _config.max_discovery_failures)
    {
        return false;
    }

    UMELINK_LOG_ERROR("Giving up after " << _discovery_failures << " discovery failures, call start() to try again");
    cancel_timers();
    stop_discovery();
    set_state(ConnectionState::disconnected);
    return true;
}

void BackendConnector::open_session()
{
    const SessionId id = ++_last_session_id;
    _session           = _session_factory->create(id, make_session_handlers());
    set_state(ConnectionState::connecting);
    UMELINK_LOG_DEBUG("Session " << id << " connecting to " << *_record->host << ":" << *_record->port);
    _session->async_open(*_record->host, *_record->port);
}

void BackendConnector::close_session(std::uint16_t code, const std::string& reason)
{
    if (!_session)
    {
        return;
    }
    auto session = std::move(_session);
    _session.reset();
    session->close(code, reason);
}

void BackendConnector::handle_connection_loss(const std::string& reason)
{
    const ConnectionState current = _state.get();
    const bool was_pursuing_endpoint = current == ConnectionState::connecting || current == ConnectionState::connected ||
                                       current == ConnectionState::reconnecting;
    if (!was_pursuing_endpoint || !_record || !_record->resolved)
    {
        forget_record();
        set_state(ConnectionState::disconnected);
        begin_discovery();
        return;
    }

    const auto delay = _reconnects.next();
    if (!delay)
    {
        abandon_endpoint(reason);
        return;
    }

    UMELINK_LOG_INFO("Reconnect attempt " << _reconnects.attempts() << " of " << _config.reconnect.max_attempts << " in " << delay->count()
                                          << "ms");
    set_state(ConnectionState::reconnecting);

    const std::uint64_t generation = ++_retry_timer_generation;
    std::weak_ptr<BackendConnector> weak = weak_from_this();
    _retry_timer.expires_after(*delay);
    _retry_timer.async_wait(
        [weak, generation](const boost::system::error_code& error_code)
        {
            if (auto self = weak.lock())
            {
                self->handle_retry_timer(generation, error_code);
            }
        });
}

void BackendConnector::abandon_endpoint(const std::string& reason)
{
    UMELINK_LOG_WARNING("Abandoning " << _record->name << " after " << _reconnects.attempts() << " failed attempts (last: " << reason
                                      << ")");
    ++_stats.endpoints_abandoned;
    forget_record();
    _reconnects.reset();
    set_state(ConnectionState::disconnected);
    begin_discovery();
}

void BackendConnector::forget_record()
{
    _record.reset();
    _resolving = false;
    ++_record_generation;
}

void BackendConnector::cancel_timers()
{
    ++_retry_timer_generation;
    _retry_timer.cancel();
    ++_discovery_timer_generation;
    _discovery_timer.cancel();
}

} // namespace umelink
