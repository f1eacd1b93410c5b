#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "archivist/sessions/session_store.h"

namespace archivist::sessions {

/// @brief Periodically deletes chunk sessions that were abandoned before completion.
class SessionSweeper {
public:
    SessionSweeper(boost::asio::io_context& ioc, std::shared_ptr<SessionStore> store,
                   std::chrono::seconds interval, std::chrono::seconds retention);

    /// @brief Sweep once right away, then every interval.
    void Start();
    void Stop();
    /// @brief Delete every session older than the retention window. Returns how many were
    /// removed; a failed delete is logged and the sweep continues.
    std::size_t SweepOnce();

private:
    void Schedule();

    boost::asio::steady_timer timer_;
    std::shared_ptr<SessionStore> store_;
    std::chrono::seconds interval_;
    std::chrono::seconds retention_;
    std::atomic<bool> running_{false};
};

}  // namespace archivist::sessions
