/**
 * @file ReportSigner.cpp
 * @brief Evidence hashing and HMAC report signatures using OpenSSL
 */

#include "ReportSigner.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rainoracle {

ReportSigner::ReportSigner(std::string reporterId, std::string reporterSecret)
    : reporterId_(std::move(reporterId)), reporterSecret_(std::move(reporterSecret)) {
    if (reporterSecret_.empty()) {
        throw std::invalid_argument("ReportSigner: reporter secret cannot be empty");
    }
}

ports::SignedReport ReportSigner::sign(ports::SignedReport report, const std::string& evidenceJson) const {
    report.evidenceHash = sha256Hex(evidenceJson);
    report.reporter = reporterId_;
    report.signature = hmacSha256Hex(reporterSecret_, canonicalString(report));
    return report;
}

/**
 * @brief Hex SHA-256 digest of arbitrary data
 * @note Uses the EVP one-shot digest so it builds against OpenSSL 1.1 and 3.x
 */
std::string ReportSigner::sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    
    if (EVP_Digest(data.data(), data.size(), digest, &digestLength, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("ReportSigner: SHA-256 digest failed");
    }
    
    return toHex(std::string(reinterpret_cast<char*>(digest), digestLength));
}

std::string ReportSigner::hmacSha256Hex(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    
    unsigned char* result = HMAC(EVP_sha256(),
                                 key.data(), static_cast<int>(key.size()),
                                 reinterpret_cast<const unsigned char*>(message.data()),
                                 message.size(),
                                 digest, &digestLength);
    if (result == nullptr) {
        throw std::runtime_error("ReportSigner: HMAC-SHA256 failed");
    }
    
    return toHex(std::string(reinterpret_cast<char*>(digest), digestLength));
}

std::string ReportSigner::canonicalString(const ports::SignedReport& report) {
    std::ostringstream ss;
    ss << report.policyId << '\n'
       << report.outcome << '\n'
       << (report.eventOccurred ? "1" : "0") << '\n'
       << report.observedAt << '\n'
       << report.cumulative << '\n'
       << report.evidenceHash << '\n'
       << report.reporter;
    return ss.str();
}

std::string ReportSigner::toHex(const std::string& bytes) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;
    
    for (char c : bytes) {
        escaped << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
    }
    
    return escaped.str();
}

} // namespace rainoracle
