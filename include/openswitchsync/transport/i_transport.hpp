/**
 * @file i_transport.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <string>
#include <vector>

#include "openswitchsync/core/result.hpp"
#include "openswitchsync/transport/snmp_value.hpp"

namespace oss {

/**
 * @brief Abstract management-protocol transport used by the synchronization coordinator.
 *
 * Implementations own the session (target address, credentials, security
 * negotiation) and convert protocol-level outcomes into TransportResult once,
 * so callers never inspect raw error-indicator/error-status triples.
 * Implementations shared between a poll cycle and control operations must be
 * safe to call from multiple threads.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Open and initialize transport resources.
     * @return true on success, false on failure.
     */
    virtual bool open() = 0;
    /**
     * @brief Close and release transport resources.
     */
    virtual void close() = 0;

    /**
     * @brief Read one scalar instance.
     *
     * A device answering with noSuchObject/noSuchInstance is a successful read
     * whose value isException().
     */
    virtual TransportResult<SnmpValue> get(const std::string& oid) = 0;

    /**
     * @brief Enumerate all rows under an OID prefix in lexicographic order.
     *
     * Batch sizing is an implementation detail; the result is the complete
     * subtree or an error.
     */
    virtual TransportResult<std::vector<VarBind>> walk(const std::string& oidPrefix) = 0;

    /**
     * @brief Write one scalar instance using the session's write credentials.
     */
    virtual TransportStatus set(const std::string& oid, const SnmpValue& value) = 0;

    /**
     * @brief Return last transport error string.
     */
    virtual std::string lastError() const = 0;
};

} // namespace oss
