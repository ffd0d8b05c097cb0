#include "keel/event_log.h"
#include "keel/hash.h"
#include "keel/serialization.h"

#include <json-c/json.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

namespace keel {

static const std::string kGenesisHash(64, '0');

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

static std::string chain_next(const std::string& prev, const std::string& record) {
    hash::Sha256 h;
    h.update(prev);
    h.update(record);
    auto d = h.finish();
    return hash::to_hex(d.data(), d.size());
}

JsonlEventLog::JsonlEventLog(const std::string& path, const std::string& kernel_id, bool fsync_each)
    : path_(path), kernel_id_(kernel_id), fsync_each_(fsync_each), chain_prev_(kGenesisHash) {
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("event log: cannot open " + path + ": " + std::strerror(errno));
    }
}

JsonlEventLog::~JsonlEventLog() {
    if (fd_ >= 0) ::close(fd_);
}

void JsonlEventLog::emit(const KernelEvent& ev) {
    const uint64_t seq = seq_ + 1;
    const std::string ts = iso_now();

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(event_kind_name(ev.kind)));
    json_object_object_add(rec, "kernel", json_object_new_string(kernel_id_.c_str()));
    json_object* payload = json_tokener_parse(ev.payload_json.c_str());
    json_object_object_add(rec, "payload", payload ? payload : json_object_new_string(ev.payload_json.c_str()));
    json_object_object_add(rec, "seq", json_object_new_int64((int64_t)seq));
    json_object_object_add(rec, "ts", json_object_new_string(ts.c_str()));

    std::string record = canonical_json(rec);
    std::string chain_hash = chain_next(chain_prev_, record);

    json_object_object_add(rec, "chain_hash", json_object_new_string(chain_hash.c_str()));
    json_object_object_add(rec, "chain_prev", json_object_new_string(chain_prev_.c_str()));
    std::string line = canonical_json(rec) + "\n";
    json_object_put(rec);

    const char* p = line.data();
    size_t left = line.size();
    while (left > 0) {
        ssize_t n = ::write(fd_, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("event log: write failed on " + path_ + ": " + std::strerror(errno));
        }
        p += n;
        left -= (size_t)n;
    }
    if (fsync_each_ && ::fsync(fd_) != 0) {
        throw std::runtime_error("event log: fsync failed on " + path_ + ": " + std::strerror(errno));
    }

    seq_ = seq;
    chain_prev_ = chain_hash;
}

EventLogVerifyResult verify_event_log(const std::string& path) {
    EventLogVerifyResult res;
    std::ifstream in(path);
    if (!in) {
        res.error = "cannot open " + path;
        return res;
    }

    std::string expected_prev = kGenesisHash;
    std::string line;
    uint64_t lineno = 0;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        lineno++;
        const std::string where = "line " + std::to_string(lineno) + ": ";

        json_object* obj = json_tokener_parse(line.c_str());
        if (!obj || !json_object_is_type(obj, json_type_object)) {
            if (obj) json_object_put(obj);
            res.error = where + "not a JSON object";
            return res;
        }

        std::string chain_hash, chain_prev;
        if (!json_get_string(obj, "chain_hash", &chain_hash) || !json_get_string(obj, "chain_prev", &chain_prev)) {
            json_object_put(obj);
            res.error = where + "missing chain fields";
            return res;
        }
        json_object* seqv = nullptr;
        int64_t seq = -1;
        if (json_object_object_get_ex(obj, "seq", &seqv) && json_object_is_type(seqv, json_type_int)) {
            seq = json_object_get_int64(seqv);
        }

        json_object_object_del(obj, "chain_hash");
        json_object_object_del(obj, "chain_prev");
        std::string record = canonical_json(obj);
        json_object_put(obj);

        if (chain_prev != expected_prev) {
            res.error = where + "chain_prev does not match previous chain_hash";
            return res;
        }
        if (seq != (int64_t)lineno) {
            res.error = where + "sequence gap";
            return res;
        }
        if (chain_next(chain_prev, record) != chain_hash) {
            res.error = where + "chain_hash mismatch";
            return res;
        }
        expected_prev = chain_hash;
        res.lines = lineno;
    }

    res.ok = true;
    return res;
}

} // namespace keel
