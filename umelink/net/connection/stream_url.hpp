#pragma once

#include <cstdint>
#include <string>

namespace umelink
{

/**
 * Compose "scheme://host:port/path". IPv6 hosts are bracketed and a leading '/' is added to the
 * path when it's missing.
 */
std::string make_stream_url(const std::string& scheme, const std::string& host, std::uint16_t port, const std::string& path);

/// The "/path" part as sent in the handshake request.
std::string normalize_path(const std::string& path);

} // namespace umelink
