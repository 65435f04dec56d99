#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <asio.hpp>

namespace memc::testing
{
    /// A minimal memcached text protocol server for exercising the TCP transport. It
    /// understands "set" and "get" and records what it was sent. Runs on its own thread.
    class FakeMemcached
    {
      public:
        FakeMemcached();
        ~FakeMemcached();

        FakeMemcached(FakeMemcached const&) = delete;
        FakeMemcached& operator=(FakeMemcached const&) = delete;

        /// The "127.0.0.1:port" address the server listens on.
        [[nodiscard]] std::string address() const;

        /// The number of connections accepted so far.
        [[nodiscard]] std::size_t connections() const { return connections_; }

        /// The number of items stored.
        [[nodiscard]] std::size_t size() const;

        /// The exptime field of the last set command for a key.
        [[nodiscard]] std::optional<int32_t> expiration(std::string const& key) const;

        /// Replaces the reply to set commands. The value is still stored.
        void setStoreReply(std::string reply);

        /// Sends the given bytes, unchanged, as the reply to the next get command.
        void replyToNextGet(std::string reply);

        /// Closes the connection that receives the next command without replying.
        void dropNextCommand() { dropNext_ = true; }

      private:
        class Session;

        struct Entry
        {
            std::string data;
            uint32_t flags;
            int32_t expiration;
        };

        void accept();

        asio::io_context io_;
        asio::ip::tcp::acceptor acceptor_;
        std::thread thread_;

        std::atomic<std::size_t> connections_ {0};
        std::atomic<bool> dropNext_ {false};

        mutable std::mutex mutex_;
        std::map<std::string, Entry> entries_;
        std::string storeReply_ = "STORED";
        std::optional<std::string> nextGetReply_;
    };
}  // namespace memc::testing
