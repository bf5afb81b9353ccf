#include "ingest/slowlog_file_source.hpp"

#include <utility>

#include "ingest/slowlog_parser.hpp"

namespace ingest {

SlowlogFileSource::SlowlogFileSource(std::filesystem::path path)
    : path_(std::move(path)) {}

bool SlowlogFileSource::open() {
    in_.close();
    in_.clear();
    in_.open(path_);
    line_no_ = 0;
    if (!in_.is_open()) {
        last_error_ = "cannot open " + path_.string();
        return false;
    }
    return true;
}

bool SlowlogFileSource::rewind() {
    if (!in_.is_open()) {
        return open();
    }
    in_.clear();
    in_.seekg(0, std::ios::beg);
    line_no_ = 0;
    if (!in_) {
        last_error_ = "cannot rewind " + path_.string();
        return false;
    }
    return true;
}

SourceReadStatus SlowlogFileSource::next(core::RequestEvent& out) {
    if (!in_.is_open()) {
        last_error_ = "source not open: " + path_.string();
        return SourceReadStatus::IoError;
    }
    while (std::getline(in_, line_)) {
        ++line_no_;
        ++stats_.lines_read;
        std::string error;
        switch (parse_slowlog_line(line_, out, error)) {
        case SlowlogParseResult::Ok:
            ++stats_.events_yielded;
            return SourceReadStatus::Ok;
        case SlowlogParseResult::Skipped:
            ++stats_.lines_skipped;
            continue;
        case SlowlogParseResult::Malformed:
            last_error_ = path_.string() + ":" + std::to_string(line_no_) + ": " + error;
            return SourceReadStatus::Malformed;
        }
    }
    if (in_.bad()) {
        last_error_ = "read error on " + path_.string();
        return SourceReadStatus::IoError;
    }
    ++stats_.cycles_completed;
    return SourceReadStatus::EndOfCycle;
}

} // namespace ingest
