#include <limits>

#include "memc/expiration.hpp"

namespace memc
{
    tl::expected<int32_t, Error> toSeconds(std::chrono::nanoseconds ttl)
    {
        if (ttl == std::chrono::nanoseconds::zero())
        {
            return 0;
        }

        if (ttl < std::chrono::nanoseconds::zero()
            || ttl % std::chrono::seconds(1) != std::chrono::nanoseconds::zero())
        {
            return tl::make_unexpected(errors::ExpirationNotValid {.duration = ttl});
        }

        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(ttl).count();
        if (seconds > std::numeric_limits<int32_t>::max())
        {
            return tl::make_unexpected(errors::ExpirationNotValid {.duration = ttl});
        }
        return static_cast<int32_t>(seconds);
    }
}  // namespace memc
