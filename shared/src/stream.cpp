#include "tonnerre/stream.hpp"

namespace tonnerre
{

    std::string Endpoint::to_string() const
    {
        if (host.find(':') != std::string::npos)
        {
            return "[" + host + "]:" + std::to_string(port);
        }
        return host + ":" + std::to_string(port);
    }

} // namespace tonnerre
