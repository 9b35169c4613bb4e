#include "sftpovw/Hashing.hpp"

#include <openssl/evp.h>

namespace sftpovw {

static const EVP_MD* evpFor(DigestAlgorithm algo) {
    switch (algo) {
    case DigestAlgorithm::Md5:
        return EVP_md5();
    case DigestAlgorithm::Sha1:
        return EVP_sha1();
    case DigestAlgorithm::Sha224:
        return EVP_sha224();
    case DigestAlgorithm::Sha256:
        return EVP_sha256();
    case DigestAlgorithm::Sha384:
        return EVP_sha384();
    case DigestAlgorithm::Sha512:
        return EVP_sha512();
    }
    return nullptr;
}

Hasher::Hasher() : ctx_(EVP_MD_CTX_new()) {}

Hasher::~Hasher() {
    if (ctx_)
        EVP_MD_CTX_free(ctx_);
}

bool Hasher::init(DigestAlgorithm algo, std::string& err) {
    active_ = false;
    if (!ctx_) {
        err = "EVP_MD_CTX_new failed";
        return false;
    }
    const EVP_MD* md = evpFor(algo);
    if (!md) {
        err = std::string("digest not available: ") + digestAlgorithmName(algo);
        return false;
    }
    if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
        err = std::string("EVP_DigestInit_ex failed for ") + digestAlgorithmName(algo);
        return false;
    }
    active_ = true;
    return true;
}

bool Hasher::update(const void* data, std::size_t len, std::string& err) {
    if (!active_) {
        err = "digest not initialized";
        return false;
    }
    if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
        err = "EVP_DigestUpdate failed";
        return false;
    }
    return true;
}

bool Hasher::finalHex(std::string& hex, std::string& err) {
    if (!active_) {
        err = "digest not initialized";
        return false;
    }
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    active_ = false;
    if (EVP_DigestFinal_ex(ctx_, md, &len) != 1) {
        err = "EVP_DigestFinal_ex failed";
        return false;
    }
    static const char digits[] = "0123456789abcdef";
    hex.clear();
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex.push_back(digits[md[i] >> 4]);
        hex.push_back(digits[md[i] & 0x0f]);
    }
    return true;
}

bool hexDigest(DigestAlgorithm algo, const std::string& data, std::string& hex,
               std::string& err) {
    Hasher h;
    return h.init(algo, err) && h.update(data.data(), data.size(), err) &&
           h.finalHex(hex, err);
}

} // namespace sftpovw
