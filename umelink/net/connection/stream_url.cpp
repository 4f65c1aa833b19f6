#include "umelink/net/connection/stream_url.hpp"

#include "umelink/net/network_utils.hpp"

namespace umelink
{

std::string normalize_path(const std::string& path)
{
    if (path.empty() || path.front() != '/')
    {
        return "/" + path;
    }
    return path;
}

std::string make_stream_url(const std::string& scheme, const std::string& host, std::uint16_t port, const std::string& path)
{
    return scheme + "://" + format_host_for_url(host) + ":" + std::to_string(port) + normalize_path(path);
}

} // namespace umelink
