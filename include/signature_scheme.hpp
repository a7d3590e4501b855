#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

using NotificationFields = std::map<std::string, std::string>;

enum class DigestAlgorithm {
    Md5,
    Sha256
};

// Lower-case hex digest of `data` via OpenSSL EVP.
std::string hexDigest(DigestAlgorithm algorithm, const std::string& data);

/**
 * @class SignatureScheme
 * @brief Strategy for signing and verifying payment gateway parameters.
 *
 * A scheme turns the signable subset of the fields into a canonical string,
 * appends the shared secret and hashes it. Gateways have changed both the
 * field selection and the digest between deployments, so the concrete scheme
 * is picked from configuration (see makeSignatureScheme).
 */
class SignatureScheme {
public:
    SignatureScheme(DigestAlgorithm digest, std::string secret, std::set<std::string> unsignedFields);
    virtual ~SignatureScheme() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Builds the string that is hashed, without the secret.
     *
     * Fields listed as unsigned (always including the signature field itself)
     * never contribute to it.
     */
    virtual std::string canonicalize(const NotificationFields& fields) const = 0;

    std::string sign(const NotificationFields& fields) const;

    // Case-insensitive, fixed-time comparison against sign(fields).
    bool verify(const NotificationFields& fields, const std::string& signature) const;

protected:
    bool isSignable(const std::string& key) const;

private:
    DigestAlgorithm digest_;
    std::string secret_;
    std::set<std::string> unsignedFields_;
};

// key=value pairs sorted by key and joined with '&'.
class SortedParamsScheme : public SignatureScheme {
public:
    SortedParamsScheme(DigestAlgorithm digest, std::string secret, std::set<std::string> unsignedFields);

    std::string name() const override;
    std::string canonicalize(const NotificationFields& fields) const override;

private:
    DigestAlgorithm algorithm_;
};

// key=value pairs in a fixed, configured order; absent fields are skipped.
class FixedOrderScheme : public SignatureScheme {
public:
    FixedOrderScheme(DigestAlgorithm digest, std::string secret,
                     std::vector<std::string> fieldOrder, std::set<std::string> unsignedFields);

    std::string name() const override;
    std::string canonicalize(const NotificationFields& fields) const override;

private:
    DigestAlgorithm algorithm_;
    std::vector<std::string> fieldOrder_;
};

/**
 * @brief Creates a scheme from its configured name.
 *
 * "md5-sorted", "sha256-sorted" or "sha256-fixed" (needs fieldOrder).
 * Throws std::invalid_argument for anything else.
 */
std::unique_ptr<SignatureScheme> makeSignatureScheme(const std::string& schemeName,
                                                     const std::string& secret,
                                                     const std::string& signatureField,
                                                     std::set<std::string> unsignedFields,
                                                     const std::vector<std::string>& fieldOrder = {});
