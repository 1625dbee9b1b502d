#pragma once

#include "../core/ports/IChainClient.hpp"
#include <string>

namespace rainoracle {

/**
 * @brief Evidence hashing and report signing for ledger submissions
 *
 * The evidence hash is the hex SHA-256 of the serialized evidence document.
 * The signature is the hex HMAC-SHA256, keyed with the reporter secret, of
 * the canonical report string:
 *   policyId \n outcome \n eventOccurred \n observedAt \n cumulative \n evidenceHash \n reporter
 */
class ReportSigner {
public:
    ReportSigner(std::string reporterId, std::string reporterSecret);
    
    /// Fills evidenceHash, reporter and signature.
    ports::SignedReport sign(ports::SignedReport report, const std::string& evidenceJson) const;
    
    const std::string& reporterId() const { return reporterId_; }
    
    static std::string sha256Hex(const std::string& data);
    static std::string hmacSha256Hex(const std::string& key, const std::string& message);
    static std::string canonicalString(const ports::SignedReport& report);
    static std::string toHex(const std::string& bytes);
    
private:
    std::string reporterId_;
    std::string reporterSecret_;
};

} // namespace rainoracle
