#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

// Incremental SHA-1 over a byte stream, finished as lowercase hex.
class Sha1Digest {
public:
    Sha1Digest();
    ~Sha1Digest();
    Sha1Digest(const Sha1Digest&) = delete;
    Sha1Digest& operator=(const Sha1Digest&) = delete;

    void update(const std::uint8_t* data, size_t length);
    std::string finalHex();

private:
    EVP_MD_CTX* ctx = nullptr;
    bool finished = false;
};
