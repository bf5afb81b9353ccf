#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#include "ingest/request_source.hpp"

namespace ingest {

// Reads search requests from an Elasticsearch slowlog file, one pass per cycle.
class SlowlogFileSource final : public RequestSource {
public:
    explicit SlowlogFileSource(std::filesystem::path path);

    // Opens the file for the first pass.
    bool open();

    SourceReadStatus next(core::RequestEvent& out) override;
    bool rewind() override;
    const SourceStats& stats() const noexcept override { return stats_; }

    const std::string& last_error() const noexcept override { return last_error_; }
    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream in_;
    std::string line_;
    std::string last_error_;
    std::uint64_t line_no_{0};
    SourceStats stats_{};
};

} // namespace ingest
