#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace memc::impl
{
    namespace detail
    {
        constexpr std::array<uint32_t, 256> makeCrc32Table()
        {
            std::array<uint32_t, 256> table {};
            for (uint32_t i = 0; i < table.size(); ++i)
            {
                uint32_t crc = i;
                for (int bit = 0; bit < 8; ++bit)
                {
                    crc = (crc & 1U) != 0 ? (crc >> 1) ^ 0xEDB88320U : crc >> 1;
                }
                table[i] = crc;
            }
            return table;
        }

        inline constexpr std::array<uint32_t, 256> CRC32_TABLE = makeCrc32Table();
    }  // namespace detail

    // CRC-32 with the IEEE polynomial, as used by zlib and most memcached clients.
    constexpr uint32_t crc32(std::string_view data)
    {
        uint32_t crc = 0xFFFFFFFFU;
        for (char c : data)
        {
            crc = detail::CRC32_TABLE[(crc ^ static_cast<uint8_t>(c)) & 0xFFU] ^ (crc >> 8);
        }
        return crc ^ 0xFFFFFFFFU;
    }
}  // namespace memc::impl
