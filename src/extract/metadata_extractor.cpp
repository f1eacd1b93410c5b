#include "archivist/extract/metadata_extractor.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <Poco/Exception.h>
#include <Poco/Process.h>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include "archivist/core/logger.h"
#include "archivist/observability/metrics.h"

#ifndef _WIN32
#include <sys/types.h>
#include <sys/wait.h>
#endif

namespace archivist::extract {
namespace {

/// One child process run, kept alive by its pending timer wait.
class ExtractionJob : public std::enable_shared_from_this<ExtractionJob> {
public:
    ExtractionJob(boost::asio::io_context& ioc, const core::ExtractorConfig& config,
                  std::string filename, MetadataExtractor::DoneHandler done)
        : timer_(ioc),
          poll_interval_(config.poll_interval_ms),
          deadline_(std::chrono::steady_clock::now() +
                    std::chrono::seconds(config.timeout_seconds)),
          filename_(std::move(filename)),
          done_(std::move(done)) {}

    void Start(const std::string& command, const Poco::Process::Args& args) {
        try {
            handle_.emplace(Poco::Process::launch(command, args));
        } catch (const Poco::Exception& ex) {
            return Report(core::Error{core::ErrorCode::kInternal,
                                      "failed to launch " + command + ": " + ex.displayText()});
        }
        core::LogDebug("metadata extraction started for " + filename_ + " (pid " +
                       std::to_string(handle_->id()) + ")");
        Schedule();
    }

private:
    void Schedule() {
        timer_.expires_after(poll_interval_);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            self->Poll();
        });
    }

    void Poll() {
        auto exit_code = TryReap();
        if (exit_code) {
            if (*exit_code != 0) {
                return Report(core::Error{core::ErrorCode::kInternal,
                                          "extractor exited with code " +
                                              std::to_string(*exit_code)});
            }
            return Report(core::Ok());
        }
        if (std::chrono::steady_clock::now() >= deadline_) {
            Kill();
            return Report(core::Error{core::ErrorCode::kInternal, "extractor timed out"});
        }
        Schedule();
    }

    // Exit code once the child has terminated, nullopt while it still runs.
    std::optional<int> TryReap() {
#ifdef _WIN32
        if (Poco::Process::isRunning(*handle_)) {
            return std::nullopt;
        }
        return handle_->wait();
#else
        int status = 0;
        const pid_t pid = ::waitpid(static_cast<pid_t>(handle_->id()), &status, WNOHANG);
        if (pid == 0) {
            return std::nullopt;
        }
        if (pid < 0) {
            return -1;
        }
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
    }

    void Kill() {
        try {
            Poco::Process::kill(*handle_);
        } catch (const Poco::Exception& ex) {
            core::LogWarning("failed to kill extractor: " + ex.displayText());
            return;
        }
#ifdef _WIN32
        handle_->wait();
#else
        int status = 0;
        ::waitpid(static_cast<pid_t>(handle_->id()), &status, 0);
#endif
    }

    void Report(core::Result<void> result) {
        if (!result.ok()) {
            core::LogWarning("metadata extraction for " + filename_ +
                             " failed: " + result.error().message);
            observability::RecordExtractionFailure();
        }
        done_(std::move(result));
    }

    boost::asio::steady_timer timer_;
    std::chrono::milliseconds poll_interval_;
    std::chrono::steady_clock::time_point deadline_;
    std::string filename_;
    MetadataExtractor::DoneHandler done_;
    std::optional<Poco::ProcessHandle> handle_;
};

}  // namespace

ProcessMetadataExtractor::ProcessMetadataExtractor(boost::asio::io_context& ioc,
                                                   core::ExtractorConfig config,
                                                   std::string archive_path)
    : ioc_(ioc), config_(std::move(config)), archive_path_(std::move(archive_path)) {}

void ProcessMetadataExtractor::Extract(const std::string& filename, DoneHandler done) {
    const auto final_file = (std::filesystem::path(archive_path_) / filename).string();
    Poco::Process::Args args{archive_path_, config_.output_root, final_file};
    auto job = std::make_shared<ExtractionJob>(ioc_, config_, filename, std::move(done));
    // Launch from the loop so done never runs inside this call.
    boost::asio::post(ioc_, [job, command = config_.command, args = std::move(args)] {
        job->Start(command, args);
    });
}

void NoopMetadataExtractor::Extract(const std::string&, DoneHandler done) {
    boost::asio::post(ioc_, [done = std::move(done)] { done(core::Ok()); });
}

}  // namespace archivist::extract
