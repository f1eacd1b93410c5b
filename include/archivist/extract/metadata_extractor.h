#pragma once

#include <functional>
#include <string>

#include <boost/asio/io_context.hpp>

#include "archivist/core/config.h"
#include "archivist/core/result.h"

namespace archivist::extract {

/// @brief Produces the metadata and thumbnail sidecars of a freshly placed archive.
class MetadataExtractor {
public:
    using DoneHandler = std::function<void(core::Result<void>)>;

    virtual ~MetadataExtractor() = default;

    /// @brief Run extraction for filename (relative to the archive collection). done is
    /// invoked from the io_context once the run has finished, failed or timed out.
    virtual void Extract(const std::string& filename, DoneHandler done) = 0;
};

/// @brief Runs `command <archive_path> <output_root> <archive_path>/<filename>` as a child
/// process and polls it on a steady_timer until it exits or the timeout kills it.
class ProcessMetadataExtractor : public MetadataExtractor {
public:
    ProcessMetadataExtractor(boost::asio::io_context& ioc, core::ExtractorConfig config,
                             std::string archive_path);

    void Extract(const std::string& filename, DoneHandler done) override;

private:
    boost::asio::io_context& ioc_;
    core::ExtractorConfig config_;
    std::string archive_path_;
};

/// @brief Used when extraction is disabled; reports success immediately.
class NoopMetadataExtractor : public MetadataExtractor {
public:
    explicit NoopMetadataExtractor(boost::asio::io_context& ioc) : ioc_(ioc) {}

    void Extract(const std::string& filename, DoneHandler done) override;

private:
    boost::asio::io_context& ioc_;
};

}  // namespace archivist::extract
