#include "common/checksum.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

Sha256Digest::Sha256Digest() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Failed to create OpenSSL context");
    }
    reset();
}

Sha256Digest::~Sha256Digest() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256Digest::reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize digest");
    }
}

void Sha256Digest::update(const void* data, size_t length) {
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_, data, length) != 1) {
        throw std::runtime_error("Failed to update digest");
    }
}

std::string Sha256Digest::finalizeHex() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &hashLen) != 1) {
        throw std::runtime_error("Failed to finalize digest");
    }
    reset();

    std::ostringstream oss;
    for (unsigned int i = 0; i < hashLen; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}
