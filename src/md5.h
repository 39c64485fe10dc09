#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace hid {

static constexpr size_t MD5_SIZE = 16;
using Md5Digest = std::array<uint8_t, MD5_SIZE>;

// Streaming MD5 over OpenSSL EVP. Not copyable; owns its EVP_MD_CTX.
class Md5 {
public:
    Md5();
    ~Md5();

    Md5(const Md5&) = delete;
    Md5& operator=(const Md5&) = delete;

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    // Finalize; the context is re-initialized so the object can be reused.
    Md5Digest final();

    uint64_t bytes_hashed() const { return total_; }

private:
    void reset();

    EVP_MD_CTX* ctx_;
    uint64_t    total_{0};
};

Md5Digest md5(const uint8_t* data, size_t len);
Md5Digest md5(const std::vector<uint8_t>& data);
Md5Digest md5(const std::string& s);

}
