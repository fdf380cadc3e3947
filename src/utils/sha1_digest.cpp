#include "sha1_digest.hpp"
#include "helpers.hpp"
#include <openssl/evp.h>
#include <stdexcept>

Sha1Digest::Sha1Digest() : ctx(EVP_MD_CTX_new()) {
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestInit_ex(sha1) failed");
    }
}

Sha1Digest::~Sha1Digest() {
    EVP_MD_CTX_free(ctx);
}

void Sha1Digest::update(const std::uint8_t* data, size_t length) {
    if (finished) {
        throw std::logic_error("Sha1Digest::update after finalHex");
    }
    if (length == 0)
        return;
    if (EVP_DigestUpdate(ctx, data, length) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Sha1Digest::finalHex() {
    if (finished) {
        throw std::logic_error("Sha1Digest::finalHex called twice");
    }
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_DigestFinal_ex(ctx, md, &mdLen) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finished = true;
    return to_hex(md, mdLen);
}
