#include <algorithm>
#include <mutex>
#include <unordered_map>

#include "memc/inmemory/server.hpp"

#include "memc/expiration.hpp"

namespace memc::inmemory
{
    namespace
    {
        using Clock = std::chrono::system_clock;

        struct Entry
        {
            Item item;
            std::optional<Clock::time_point> expiresAt;
        };

        class ServerImpl final : public Server
        {
          public:
            ServerImpl()
                : now_(std::chrono::time_point_cast<std::chrono::seconds>(Clock::now()))
            {
            }

            tl::expected<void, Error> store(Item const& item) override
            {
                std::lock_guard lock {mutex_};
                if (auto usable = checkUsable(); !usable)
                {
                    return usable;
                }

                auto expiresAt = expirationTime(item.expiration);
                if (expiresAt && *expiresAt <= now_)
                {
                    // Already expired, so the write replaces and removes any existing value.
                    entries_.erase(item.key);
                    return {};
                }
                entries_[item.key] = Entry {.item = item, .expiresAt = expiresAt};
                return {};
            }

            tl::expected<std::optional<Item>, Error> retrieve(std::string const& key) override
            {
                std::lock_guard lock {mutex_};
                if (auto usable = checkUsable(); !usable)
                {
                    return tl::make_unexpected(usable.error());
                }

                auto it = entries_.find(key);
                if (it == entries_.end())
                {
                    return std::nullopt;
                }
                if (expired(it->second))
                {
                    entries_.erase(it);
                    return std::nullopt;
                }
                return it->second.item;
            }

            void close() override
            {
                std::lock_guard lock {mutex_};
                closed_ = true;
                entries_.clear();
            }

            void advance(std::chrono::seconds duration) override
            {
                std::lock_guard lock {mutex_};
                now_ += duration;
            }

            void setAvailable(bool available) override
            {
                std::lock_guard lock {mutex_};
                available_ = available;
            }

            [[nodiscard]] std::size_t size() const override
            {
                std::lock_guard lock {mutex_};
                return static_cast<std::size_t>(
                    std::count_if(entries_.begin(),
                                  entries_.end(),
                                  [this](auto const& entry) { return !expired(entry.second); }));
            }

          private:
            tl::expected<void, Error> checkUsable() const
            {
                if (closed_)
                {
                    return tl::make_unexpected(errors::TransportFailure {.message = "transport closed"});
                }
                if (!available_)
                {
                    return tl::make_unexpected(errors::TransportFailure {.message = "server unavailable"});
                }
                return {};
            }

            [[nodiscard]] std::optional<Clock::time_point> expirationTime(int32_t expiration) const
            {
                if (expiration == 0)
                {
                    return std::nullopt;
                }
                if (expiration < 0)
                {
                    return now_;
                }
                if (std::chrono::seconds(expiration) > MAX_RELATIVE_EXPIRATION)
                {
                    return Clock::time_point(std::chrono::seconds(expiration));
                }
                return now_ + std::chrono::seconds(expiration);
            }

            [[nodiscard]] bool expired(Entry const& entry) const
            {
                return entry.expiresAt && *entry.expiresAt <= now_;
            }

            mutable std::mutex mutex_;
            Clock::time_point now_;
            bool available_ = true;
            bool closed_ = false;
            std::unordered_map<std::string, Entry> entries_;
        };
    }  // namespace

    std::shared_ptr<Server> createServer()
    {
        return std::make_shared<ServerImpl>();
    }
}  // namespace memc::inmemory
