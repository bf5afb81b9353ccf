#pragma once

#include <cstdint>
#include <string>

#include "core/request_event.hpp"

namespace ingest {

enum class SourceReadStatus {
    Ok = 0,
    EndOfCycle,
    Malformed,
    IoError,
};

struct SourceStats {
    std::uint64_t lines_read{0};
    std::uint64_t events_yielded{0};
    std::uint64_t lines_skipped{0};
    std::uint64_t cycles_completed{0};
};

// Finite capture replayed as an endless sequence: after EndOfCycle the caller
// rewinds and the same events come back in the same order. Timestamps are
// returned as captured; the caller owns any cross-cycle adjustment.
class RequestSource {
public:
    virtual ~RequestSource() = default;

    virtual SourceReadStatus next(core::RequestEvent& out) = 0;

    // Restarts from the first event. Returns false if the capture can no
    // longer be read.
    virtual bool rewind() = 0;

    virtual const SourceStats& stats() const noexcept = 0;

    // Describes the last Malformed/IoError result or failed rewind.
    virtual const std::string& last_error() const noexcept = 0;
};

inline const char* to_string(SourceReadStatus status) noexcept {
    switch (status) {
    case SourceReadStatus::Ok: return "ok";
    case SourceReadStatus::EndOfCycle: return "end_of_cycle";
    case SourceReadStatus::Malformed: return "malformed";
    case SourceReadStatus::IoError: return "io_error";
    }
    return "unknown";
}

} // namespace ingest
