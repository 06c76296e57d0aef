#pragma once

#include <cstddef>
#include <string>

struct evp_md_ctx_st;

// Incremental SHA-256 digest backed by OpenSSL EVP.
class Sha256Digest {
public:
    Sha256Digest();
    ~Sha256Digest();

    Sha256Digest(const Sha256Digest&) = delete;
    Sha256Digest& operator=(const Sha256Digest&) = delete;

    void update(const void* data, size_t length);

    // Returns the lowercase hex digest and resets the context for reuse.
    std::string finalizeHex();

private:
    void reset();

    evp_md_ctx_st* ctx_;
};
