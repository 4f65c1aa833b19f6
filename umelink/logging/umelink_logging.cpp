#include "umelink/logging/umelink_logging.hpp"

namespace umelink
{
namespace logging
{

LogLevel current_log_level = LogLevel::Info;

} // namespace logging
} // namespace umelink
