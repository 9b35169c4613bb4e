// Digest incremental sobre OpenSSL EVP.
#pragma once
#include "SftpTypes.hpp"
#include <cstddef>
#include <string>

struct evp_md_ctx_st;

namespace sftpovw {

class Hasher {
public:
    Hasher();
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    bool init(DigestAlgorithm algo, std::string& err);
    bool update(const void* data, std::size_t len, std::string& err);
    // Cierra el digest; hay que llamar init() de nuevo antes de reutilizarlo.
    bool finalHex(std::string& hex, std::string& err);

private:
    evp_md_ctx_st* ctx_ = nullptr;
    bool active_ = false;
};

// Digest de un buffer en memoria, de una vez.
bool hexDigest(DigestAlgorithm algo, const std::string& data, std::string& hex,
               std::string& err);

} // namespace sftpovw
