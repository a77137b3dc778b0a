#include "net/PortAllocator.hpp"

#include "utils/Errors.hpp"
#include "utils/Log.hpp"

namespace tbl::net
{

std::uint16_t allocate_port(std::uint16_t base_port, int max_attempts,
                            BindAttempt const &try_bind)
{
    int const attempts = max_attempts > 0 ? max_attempts : 1;
    for (int offset = 0; offset < attempts; ++offset)
    {
        int candidate = static_cast<int>(base_port) + offset;
        if (candidate > 65535)
        {
            break;
        }
        auto port = static_cast<std::uint16_t>(candidate);
        if (try_bind(port))
        {
            if (offset > 0)
            {
                TBL_LOG_INFO("port {} busy, bound {} instead", base_port, port);
            }
            return port;
        }
        TBL_LOG_DEBUG("port {} not bindable", port);
    }
    throw PortsExhausted(base_port, attempts);
}

} // namespace tbl::net
