#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "openswitchsync/config/session_config.hpp"
#include "openswitchsync/transport/i_transport.hpp"

namespace oss {

/**
 * @brief In-memory agent holding an OID tree, with failure injection and write capture.
 */
class MockTransport final : public ITransport {
public:
    struct WriteRecord {
        std::string oid;
        SnmpValue value;
        std::string principal;
    };

    MockTransport();
    explicit MockTransport(SessionConfig session);

    bool open() override;
    void close() override;
    TransportResult<SnmpValue> get(const std::string& oid) override;
    TransportResult<std::vector<VarBind>> walk(const std::string& oidPrefix) override;
    TransportStatus set(const std::string& oid, const SnmpValue& value) override;
    std::string lastError() const override;

    void setValue(const std::string& oid, SnmpValue value);
    void removeValue(const std::string& oid);
    void clearValues();
    bool hasValue(const std::string& oid) const;
    SnmpValue value(const std::string& oid) const;

    // Every walk/get/set whose OID starts with the given prefix fails at transport level.
    void failWalk(const std::string& oidPrefix);
    void failGet(const std::string& oidPrefix);
    void failSet(const std::string& oidPrefix);
    // Sets answered with a device error status instead of a transport failure.
    void rejectSet(const std::string& oidPrefix, std::int32_t errorStatus);
    void clearFailures();

    std::vector<WriteRecord> writes() const;
    std::size_t getCount() const;
    std::size_t walkCount() const;

private:
    static bool underPrefix(const std::string& oid, const std::string& prefix);
    static bool oidLess(const std::string& a, const std::string& b);
    bool matchesAny(const std::set<std::string>& prefixes, const std::string& oid) const;

    struct OidOrder {
        bool operator()(const std::string& a, const std::string& b) const { return oidLess(a, b); }
    };

    mutable std::mutex mutex_;
    SessionConfig session_{};
    std::map<std::string, SnmpValue, OidOrder> values_;
    std::set<std::string> failedWalks_;
    std::set<std::string> failedGets_;
    std::set<std::string> failedSets_;
    std::map<std::string, std::int32_t> rejectedSets_;
    std::vector<WriteRecord> writes_;
    std::size_t getCount_ = 0;
    std::size_t walkCount_ = 0;
    bool opened_ = false;
    std::string error_;
};

} // namespace oss
