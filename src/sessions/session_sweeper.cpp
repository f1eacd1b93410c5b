#include "archivist/sessions/session_sweeper.h"

#include <boost/system/error_code.hpp>

#include "archivist/core/logger.h"
#include "archivist/observability/metrics.h"

namespace archivist::sessions {

SessionSweeper::SessionSweeper(boost::asio::io_context& ioc,
                               std::shared_ptr<SessionStore> store,
                               std::chrono::seconds interval, std::chrono::seconds retention)
    : timer_(ioc), store_(std::move(store)), interval_(interval), retention_(retention) {}

void SessionSweeper::Start() {
    running_ = true;
    SweepOnce();
    Schedule();
}

void SessionSweeper::Stop() {
    running_ = false;
    timer_.cancel();
}

void SessionSweeper::Schedule() {
    if (!running_) {
        return;
    }
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        SweepOnce();
        Schedule();
    });
}

std::size_t SessionSweeper::SweepOnce() {
    auto expired = store_->ListExpired(retention_);
    if (!expired.ok()) {
        core::LogError("Session sweep failed to list sessions: " + expired.error().message);
        return 0;
    }

    std::size_t removed = 0;
    for (const auto& session_id : expired.value()) {
        auto deleted = store_->Delete(session_id);
        if (!deleted.ok()) {
            core::LogWarning("Session sweep could not delete " + session_id + ": " +
                             deleted.error().message);
            continue;
        }
        ++removed;
    }
    if (removed > 0) {
        core::LogInfo("Session sweep removed " + std::to_string(removed) + " stale session(s)");
        observability::RecordSessionsSwept(removed);
    }
    return removed;
}

}  // namespace archivist::sessions
