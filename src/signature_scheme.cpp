#include "signature_scheme.hpp"
#include "utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <stdexcept>

std::string hexDigest(DigestAlgorithm algorithm, const std::string& data) {
    const EVP_MD* md = algorithm == DigestAlgorithm::Md5 ? EVP_md5() : EVP_sha256();

    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), hash.data(), &length, md, nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
    hash.resize(length);
    return Utils::binToHex(hash);
}

// ---------------- SignatureScheme ----------------

SignatureScheme::SignatureScheme(DigestAlgorithm digest, std::string secret, std::set<std::string> unsignedFields)
    : digest_(digest),
      secret_(std::move(secret)),
      unsignedFields_(std::move(unsignedFields)) {}

std::string SignatureScheme::sign(const NotificationFields& fields) const {
    return hexDigest(digest_, canonicalize(fields) + secret_);
}

bool SignatureScheme::verify(const NotificationFields& fields, const std::string& signature) const {
    std::string expected = sign(fields);
    std::string received = Utils::toLower(Utils::trim(signature));
    if (received.size() != expected.size()) return false;
    return CRYPTO_memcmp(expected.data(), received.data(), expected.size()) == 0;
}

bool SignatureScheme::isSignable(const std::string& key) const {
    return !unsignedFields_.contains(key);
}

// ---------------- SortedParamsScheme ----------------

SortedParamsScheme::SortedParamsScheme(DigestAlgorithm digest, std::string secret, std::set<std::string> unsignedFields)
    : SignatureScheme(digest, std::move(secret), std::move(unsignedFields)),
      algorithm_(digest) {}

std::string SortedParamsScheme::name() const {
    return algorithm_ == DigestAlgorithm::Md5 ? "md5-sorted" : "sha256-sorted";
}

std::string SortedParamsScheme::canonicalize(const NotificationFields& fields) const {
    // std::map iterates in lexicographic key order
    std::string canonical;
    for (const auto& [key, value] : fields) {
        if (!isSignable(key)) continue;
        if (!canonical.empty()) canonical += '&';
        canonical += key + "=" + value;
    }
    return canonical;
}

// ---------------- FixedOrderScheme ----------------

FixedOrderScheme::FixedOrderScheme(DigestAlgorithm digest, std::string secret,
                                   std::vector<std::string> fieldOrder, std::set<std::string> unsignedFields)
    : SignatureScheme(digest, std::move(secret), std::move(unsignedFields)),
      algorithm_(digest),
      fieldOrder_(std::move(fieldOrder)) {}

std::string FixedOrderScheme::name() const {
    return algorithm_ == DigestAlgorithm::Md5 ? "md5-fixed" : "sha256-fixed";
}

std::string FixedOrderScheme::canonicalize(const NotificationFields& fields) const {
    std::string canonical;
    for (const auto& key : fieldOrder_) {
        if (!isSignable(key)) continue;
        auto it = fields.find(key);
        if (it == fields.end()) continue;
        if (!canonical.empty()) canonical += '&';
        canonical += key + "=" + it->second;
    }
    return canonical;
}

std::unique_ptr<SignatureScheme> makeSignatureScheme(const std::string& schemeName,
                                                     const std::string& secret,
                                                     const std::string& signatureField,
                                                     std::set<std::string> unsignedFields,
                                                     const std::vector<std::string>& fieldOrder) {
    unsignedFields.insert(signatureField);

    if (schemeName == "md5-sorted") {
        return std::make_unique<SortedParamsScheme>(DigestAlgorithm::Md5, secret, std::move(unsignedFields));
    }
    if (schemeName == "sha256-sorted") {
        return std::make_unique<SortedParamsScheme>(DigestAlgorithm::Sha256, secret, std::move(unsignedFields));
    }
    if (schemeName == "sha256-fixed") {
        if (fieldOrder.empty()) {
            throw std::invalid_argument("sha256-fixed needs a signed field list");
        }
        return std::make_unique<FixedOrderScheme>(DigestAlgorithm::Sha256, secret, fieldOrder, std::move(unsignedFields));
    }
    throw std::invalid_argument("Unknown signature scheme: " + schemeName);
}
