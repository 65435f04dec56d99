#include "memc/key.hpp"

#include <fmt/format.h>

namespace memc
{
    tl::expected<void, Error> checkKey(std::string_view key)
    {
        if (key.empty())
        {
            return tl::make_unexpected(errors::KeyNotValid {.message = "key is empty"});
        }
        if (key.size() > MAX_KEY_LENGTH)
        {
            return tl::make_unexpected(errors::KeyNotValid {
                .message = fmt::format(
                    "key is {} bytes long, the limit is {}", key.size(), MAX_KEY_LENGTH)});
        }

        for (std::size_t i = 0; i < key.size(); ++i)
        {
            auto c = static_cast<unsigned char>(key[i]);
            // Space, C0 controls and DEL. Bytes above 0x7f are allowed.
            if (c <= ' ' || c == 0x7f)
            {
                return tl::make_unexpected(errors::KeyNotValid {
                    .message = fmt::format(
                        "key contains whitespace or control character 0x{:02x} at offset {}", c, i)});
            }
        }
        return {};
    }
}  // namespace memc
