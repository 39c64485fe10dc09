#include "md5.h"
#include "errors.h"

#include <openssl/evp.h>
#include <openssl/err.h>

namespace hid {

static std::string openssl_err(const char* what) {
    char buf[256];
    unsigned long e = ERR_get_error();
    if (e == 0) return what;
    ERR_error_string_n(e, buf, sizeof(buf));
    return std::string(what) + ": " + buf;
}

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error(openssl_err("EVP_MD_CTX_new failed"));
    reset();
}

Md5::~Md5() {
    EVP_MD_CTX_free(ctx_);
}

void Md5::reset() {
    if (1 != EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr)) {
        throw std::runtime_error(openssl_err("EVP_DigestInit_ex(md5) failed"));
    }
    total_ = 0;
}

void Md5::update(const uint8_t* data, size_t len) {
    if (len == 0) return;
    if (1 != EVP_DigestUpdate(ctx_, data, len)) {
        throw std::runtime_error(openssl_err("EVP_DigestUpdate failed"));
    }
    total_ += len;
}

Md5Digest Md5::final() {
    Md5Digest out{};
    unsigned int l = 0;
    if (1 != EVP_DigestFinal_ex(ctx_, out.data(), &l) || l != MD5_SIZE) {
        throw std::runtime_error(openssl_err("EVP_DigestFinal_ex failed"));
    }
    reset();
    return out;
}

Md5Digest md5(const uint8_t* data, size_t len) {
    Md5 h;
    h.update(data, len);
    return h.final();
}

Md5Digest md5(const std::vector<uint8_t>& data) {
    return md5(data.data(), data.size());
}

Md5Digest md5(const std::string& s) {
    return md5(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

}
