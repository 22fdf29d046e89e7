/**
 * @file mock_transport.cpp
 * @brief openSwitchSync source file.
 */

#include "openswitchsync/transport/mock_transport.hpp"

#include <algorithm>

namespace oss {
namespace {

// SNMPv2 error-status noCreation(11).
constexpr std::int32_t kErrorStatusNoCreation = 11;

} // namespace

MockTransport::MockTransport() = default;

MockTransport::MockTransport(SessionConfig session) : session_(std::move(session)) {}

bool MockTransport::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    opened_ = true;
    error_.clear();
    return true;
}

void MockTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    opened_ = false;
}

TransportResult<SnmpValue> MockTransport::get(const std::string& oid) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++getCount_;
    if (!opened_) {
        error_ = "not opened";
        return TransportResult<SnmpValue>::failure(TransportErrorKind::Transport, error_);
    }
    if (matchesAny(failedGets_, oid)) {
        error_ = "injected get failure for " + oid;
        return TransportResult<SnmpValue>::failure(TransportErrorKind::Transport, error_);
    }
    const auto it = values_.find(oid);
    if (it == values_.end()) {
        return TransportResult<SnmpValue>::success(SnmpValue::exception(SnmpValueType::NoSuchObject));
    }
    return TransportResult<SnmpValue>::success(it->second);
}

TransportResult<std::vector<VarBind>> MockTransport::walk(const std::string& oidPrefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++walkCount_;
    if (!opened_) {
        error_ = "not opened";
        return TransportResult<std::vector<VarBind>>::failure(TransportErrorKind::Transport, error_);
    }
    if (matchesAny(failedWalks_, oidPrefix)) {
        error_ = "injected walk failure for " + oidPrefix;
        return TransportResult<std::vector<VarBind>>::failure(TransportErrorKind::Transport, error_);
    }

    std::vector<VarBind> rows;
    for (const auto& kv : values_) {
        if (underPrefix(kv.first, oidPrefix) && kv.first != oidPrefix) {
            rows.push_back({kv.first, kv.second});
        }
    }
    return TransportResult<std::vector<VarBind>>::success(std::move(rows));
}

TransportStatus MockTransport::set(const std::string& oid, const SnmpValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!opened_) {
        error_ = "not opened";
        return TransportStatus::failure(TransportErrorKind::Transport, error_);
    }
    if (matchesAny(failedSets_, oid)) {
        error_ = "injected set failure for " + oid;
        return TransportStatus::failure(TransportErrorKind::Transport, error_);
    }
    for (const auto& kv : rejectedSets_) {
        if (underPrefix(oid, kv.first)) {
            error_ = "device rejected set for " + oid + " (error-status " + std::to_string(kv.second) + ")";
            return TransportStatus::failure(TransportErrorKind::ErrorStatus, error_, kv.second);
        }
    }
    const auto it = values_.find(oid);
    if (it == values_.end()) {
        error_ = "noCreation for " + oid;
        return TransportStatus::failure(TransportErrorKind::ErrorStatus, error_, kErrorStatusNoCreation);
    }

    it->second = value;
    writes_.push_back({oid, value, session_.writeAuth().principal});
    return TransportStatus::success(std::monostate{});
}

std::string MockTransport::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void MockTransport::setValue(const std::string& oid, SnmpValue value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[oid] = std::move(value);
}

void MockTransport::removeValue(const std::string& oid) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(oid);
}

void MockTransport::clearValues() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

bool MockTransport::hasValue(const std::string& oid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.find(oid) != values_.end();
}

SnmpValue MockTransport::value(const std::string& oid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = values_.find(oid);
    return it == values_.end() ? SnmpValue::exception(SnmpValueType::NoSuchObject) : it->second;
}

void MockTransport::failWalk(const std::string& oidPrefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    failedWalks_.insert(oidPrefix);
}

void MockTransport::failGet(const std::string& oidPrefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    failedGets_.insert(oidPrefix);
}

void MockTransport::failSet(const std::string& oidPrefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    failedSets_.insert(oidPrefix);
}

void MockTransport::rejectSet(const std::string& oidPrefix, std::int32_t errorStatus) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejectedSets_[oidPrefix] = errorStatus;
}

void MockTransport::clearFailures() {
    std::lock_guard<std::mutex> lock(mutex_);
    failedWalks_.clear();
    failedGets_.clear();
    failedSets_.clear();
    rejectedSets_.clear();
}

std::vector<MockTransport::WriteRecord> MockTransport::writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

std::size_t MockTransport::getCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getCount_;
}

std::size_t MockTransport::walkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return walkCount_;
}

bool MockTransport::underPrefix(const std::string& oid, const std::string& prefix) {
    if (oid.size() < prefix.size() || oid.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return oid.size() == prefix.size() || oid[prefix.size()] == '.';
}

bool MockTransport::oidLess(const std::string& a, const std::string& b) {
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() && j < b.size()) {
        const auto aEnd = std::min(a.find('.', i), a.size());
        const auto bEnd = std::min(b.find('.', j), b.size());
        // Shorter decimal component is the smaller arc; equal lengths compare textually.
        const auto aLen = aEnd - i;
        const auto bLen = bEnd - j;
        if (aLen != bLen) {
            return aLen < bLen;
        }
        const auto cmp = a.compare(i, aLen, b, j, bLen);
        if (cmp != 0) {
            return cmp < 0;
        }
        i = aEnd + 1U;
        j = bEnd + 1U;
    }
    return a.size() < b.size();
}

bool MockTransport::matchesAny(const std::set<std::string>& prefixes, const std::string& oid) const {
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [&](const std::string& prefix) { return underPrefix(oid, prefix); });
}

} // namespace oss
