#include <charconv>
#include <vector>

#include "protocol.hpp"

#include <fmt/format.h>

namespace memc::impl::protocol
{
    namespace
    {
        constexpr std::string_view CLIENT_ERROR = "CLIENT_ERROR";
        constexpr std::string_view SERVER_ERROR = "SERVER_ERROR";

        tl::unexpected<Error> failure(std::string message)
        {
            return tl::unexpected<Error>(errors::TransportFailure {.message = std::move(message)});
        }

        std::vector<std::string_view> splitFields(std::string_view line)
        {
            std::vector<std::string_view> fields;
            std::size_t start = 0;
            while (start < line.size())
            {
                auto end = line.find(' ', start);
                if (end == std::string_view::npos)
                {
                    end = line.size();
                }
                if (end > start)
                {
                    fields.push_back(line.substr(start, end - start));
                }
                start = end + 1;
            }
            return fields;
        }

        template<typename T>
        std::optional<T> parseNumber(std::string_view text)
        {
            T value {};
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc {} || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

        std::string_view trimLeft(std::string_view text)
        {
            auto start = text.find_first_not_of(' ');
            return start == std::string_view::npos ? std::string_view {} : text.substr(start);
        }

        // Error replies that can follow any command.
        std::optional<tl::unexpected<Error>> parseErrorReply(std::string_view line)
        {
            if (line == "ERROR")
            {
                return failure("server does not recognize the command");
            }
            if (line.starts_with(CLIENT_ERROR))
            {
                return failure(
                    fmt::format("client error: {}", trimLeft(line.substr(CLIENT_ERROR.size()))));
            }
            if (line.starts_with(SERVER_ERROR))
            {
                return failure(
                    fmt::format("server error: {}", trimLeft(line.substr(SERVER_ERROR.size()))));
            }
            return std::nullopt;
        }
    }  // namespace

    std::string formatSet(Item const& item)
    {
        std::string command = fmt::format(
            "set {} {} {} {}\r\n", item.key, item.flags, item.expiration, item.value.size());
        command.append(reinterpret_cast<char const*>(item.value.data()), item.value.size());
        command.append(CRLF);
        return command;
    }

    std::string formatGet(std::string_view key)
    {
        return fmt::format("get {}\r\n", key);
    }

    tl::expected<void, Error> parseStoreReply(std::string_view line)
    {
        if (line == "STORED")
        {
            return {};
        }
        if (line == "NOT_STORED")
        {
            return failure("item not stored");
        }
        if (auto error = parseErrorReply(line))
        {
            return *error;
        }
        return failure(fmt::format("unexpected reply to set: '{}'", line));
    }

    bool isFailureReply(std::string_view line)
    {
        return line == "NOT_STORED" || line == "ERROR" || line.starts_with(CLIENT_ERROR)
            || line.starts_with(SERVER_ERROR);
    }

    tl::expected<std::optional<ValueHeader>, Error> parseValueLine(std::string_view line,
                                                                   std::size_t maxLength)
    {
        if (line == "END")
        {
            return std::nullopt;
        }
        if (auto error = parseErrorReply(line))
        {
            return *error;
        }

        // VALUE <key> <flags> <bytes> [<cas unique>]
        auto fields = splitFields(line);
        if (fields.size() < 4 || fields.size() > 5 || fields[0] != "VALUE")
        {
            return failure(fmt::format("unexpected reply to get: '{}'", line));
        }

        auto flags = parseNumber<uint32_t>(fields[2]);
        auto length = parseNumber<std::size_t>(fields[3]);
        if (!flags || !length)
        {
            return failure(fmt::format("malformed value line: '{}'", line));
        }

        if (*length > maxLength)
        {
            return failure(fmt::format(
                "value of {} bytes exceeds the limit of {} bytes: '{}'", *length, maxLength, line));
        }

        return ValueHeader {.key = std::string(fields[1]), .flags = *flags, .length = *length};
    }
}  // namespace memc::impl::protocol
