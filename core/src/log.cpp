#include "gradebench/log.h"
#include "gradebench/hash.h"
#include "gradebench/json_util.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace gradebench {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Sorted keys at every level, no whitespace.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_util::Doc ks{json_util::new_string(keys[i])};
            out << json_object_to_json_string_ext(ks.root, JSON_C_TO_STRING_PLAIN) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

static std::string canonical_of(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

std::string canonicalize_json(const std::string& raw) {
    json_util::Doc doc = json_util::parse(raw);
    if (!doc) return raw;
    return canonical_of(doc.root);
}

JsonlLogger::JsonlLogger(const LogHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path), out_(path, std::ios::out | std::ios::trunc), chain_prev_(std::string(64, '0')) {}

std::string JsonlLogger::chain_head() const {
    std::lock_guard<std::mutex> lk(mu_);
    return chain_prev_;
}

void JsonlLogger::event(const std::string& name, const std::string& payload_json) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string ts = iso_now();

    json_util::Doc rec{json_object_new_object()};
    json_object_object_add(rec.root, "event", json_util::new_string(name));
    json_util::Doc payload = json_util::parse(payload_json);
    json_object_object_add(rec.root, "payload",
                           payload ? payload.release() : json_util::new_string(payload_json));
    json_object_object_add(rec.root, "profile_id", json_util::new_string(hdr_.profile_id));
    json_object_object_add(rec.root, "run_id", json_util::new_string(hdr_.run_id));
    json_object_object_add(rec.root, "step", json_object_new_int(step_));
    json_object_object_add(rec.root, "ts", json_util::new_string(ts));

    const std::string record = canonical_of(rec.root);
    const std::string chain_hash = hash::sha256_hex(chain_prev_, record);

    // The output line is the record plus the two chain fields, still canonical.
    json_object_object_add(rec.root, "chain_hash", json_util::new_string(chain_hash));
    json_object_object_add(rec.root, "chain_prev", json_util::new_string(chain_prev_));
    out_ << canonical_of(rec.root) << "\n";
    out_.flush();

    chain_prev_ = chain_hash;
    step_++;
}

bool verify_log_chain(const std::string& path, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    std::string expected_prev(64, '0');
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        if (json_util::trim_ws(line).empty()) continue;
        json_util::Doc doc = json_util::parse(line);
        std::string prev, hash_hex;
        if (!doc || !json_util::get_string(doc.root, "chain_prev", &prev) ||
            !json_util::get_string(doc.root, "chain_hash", &hash_hex)) {
            if (err) *err = "line " + std::to_string(lineno) + ": not a chained record";
            return false;
        }
        if (prev != expected_prev) {
            if (err) *err = "line " + std::to_string(lineno) + ": chain_prev mismatch";
            return false;
        }
        json_object_object_del(doc.root, "chain_prev");
        json_object_object_del(doc.root, "chain_hash");
        if (hash::sha256_hex(prev, canonical_of(doc.root)) != hash_hex) {
            if (err) *err = "line " + std::to_string(lineno) + ": chain_hash mismatch";
            return false;
        }
        expected_prev = hash_hex;
    }
    return true;
}

} // namespace gradebench
