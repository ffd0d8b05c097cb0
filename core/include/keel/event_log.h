#pragma once
#include "events.h"

#include <cstdint>
#include <string>

namespace keel {

// JsonlEventLog: append-only, tamper-evident JSONL log of kernel events.
//
// Each line is a canonical JSON object:
//   {"chain_hash":..,"chain_prev":..,"event":..,"kernel":..,"payload":{..},"seq":N,"ts":..}
// with chain_hash = SHA256(chain_prev || canonical record without chain fields).
// The first chain_prev is 64 zeros.
class JsonlEventLog : public EventSink {
public:
    // Opens (truncating) path. Throws std::runtime_error if it cannot be opened.
    JsonlEventLog(const std::string& path, const std::string& kernel_id, bool fsync_each = false);
    ~JsonlEventLog() override;

    JsonlEventLog(const JsonlEventLog&) = delete;
    JsonlEventLog& operator=(const JsonlEventLog&) = delete;

    void emit(const KernelEvent& ev) override;

    const std::string& path() const { return path_; }
    const std::string& head() const { return chain_prev_; }
    uint64_t seq() const { return seq_; }

private:
    std::string path_;
    std::string kernel_id_;
    bool fsync_each_;
    int fd_{-1};
    uint64_t seq_{0};
    std::string chain_prev_;
};

struct EventLogVerifyResult {
    bool ok{false};
    uint64_t lines{0};
    std::string error; // first failure, empty when ok
};

// Re-walks the hash chain of a log written by JsonlEventLog.
EventLogVerifyResult verify_event_log(const std::string& path);

} // namespace keel
