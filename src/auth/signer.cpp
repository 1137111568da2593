#include "marketlink/signer.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <spdlog/spdlog.h>

namespace marketlink {

struct Signer::Impl {
    std::string key_id;
    EVP_PKEY* pkey{nullptr};

    ~Impl() {
        if (pkey) {
            EVP_PKEY_free(pkey);
        }
    }
};

Signer::Signer(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Signer::~Signer() = default;

Signer::Signer(Signer&&) noexcept = default;

Signer& Signer::operator=(Signer&&) noexcept = default;

std::string_view Signer::key_id() const noexcept {
    return impl_->key_id;
}

namespace {

std::string get_openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "no OpenSSL error queued";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

// PSS parameters shared by signing and verification
bool configure_pss(EVP_PKEY_CTX* pkey_ctx) {
    return EVP_PKEY_CTX_set_rsa_padding(pkey_ctx, RSA_PKCS1_PSS_PADDING) == 1 &&
           EVP_PKEY_CTX_set_rsa_mgf1_md(pkey_ctx, EVP_sha256()) == 1 &&
           EVP_PKEY_CTX_set_rsa_pss_saltlen(pkey_ctx, RSA_PSS_SALTLEN_DIGEST) == 1;
}

} // namespace

std::string base64_encode(const unsigned char* data, std::size_t len) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_push(b64, bio);
    BIO_write(b64, data, static_cast<int>(len));
    (void)BIO_flush(b64);

    BUF_MEM* bptr;
    BIO_get_mem_ptr(b64, &bptr);

    std::string result(bptr->data, bptr->length);
    BIO_free_all(b64);
    return result;
}

std::string canonical_message(std::int64_t timestamp_ms, std::string_view method,
                              std::string_view path) {
    std::string_view bare_path = path.substr(0, path.find('?'));

    std::string message = std::to_string(timestamp_ms);
    message.reserve(message.size() + method.size() + bare_path.size());
    std::transform(method.begin(), method.end(), std::back_inserter(message),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    message.append(bare_path);
    return message;
}

Result<Signer> Signer::from_pem(std::string_view key_id, std::string_view pem_key) {
    std::unique_ptr<Impl> impl = std::make_unique<Impl>();
    impl->key_id = std::string(key_id);

    if (pem_key.empty()) {
        return std::unexpected(Error::signing("Private key is empty"));
    }

    BIO* bio = BIO_new_mem_buf(pem_key.data(), static_cast<int>(pem_key.size()));
    if (!bio) {
        return std::unexpected(Error::signing("Failed to create BIO"));
    }

    impl->pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!impl->pkey) {
        return std::unexpected(
            Error::signing("Failed to read private key: " + get_openssl_error()));
    }

    // PSS over anything but an RSA key is a caller error, not a fallback
    int key_type = EVP_PKEY_base_id(impl->pkey);
    if (key_type != EVP_PKEY_RSA && key_type != EVP_PKEY_RSA_PSS) {
        return std::unexpected(Error::signing("Private key is not an RSA key"));
    }

    spdlog::debug("[Signer] Loaded {}-bit RSA key for key id {}", EVP_PKEY_bits(impl->pkey),
                  impl->key_id);
    return Signer(std::move(impl));
}

Result<std::vector<unsigned char>> Signer::sign(std::int64_t timestamp_ms, std::string_view method,
                                                std::string_view path) const {
    std::string message = canonical_message(timestamp_ms, method, path);

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return std::unexpected(Error::signing("Failed to create signing context"));
    }

    EVP_PKEY_CTX* pkey_ctx = nullptr;
    if (EVP_DigestSignInit(ctx, &pkey_ctx, EVP_sha256(), nullptr, impl_->pkey) != 1) {
        EVP_MD_CTX_free(ctx);
        return std::unexpected(Error::signing("Failed to init signing: " + get_openssl_error()));
    }

    if (!configure_pss(pkey_ctx)) {
        EVP_MD_CTX_free(ctx);
        return std::unexpected(Error::signing("Failed to set PSS parameters: " + get_openssl_error()));
    }

    if (EVP_DigestSignUpdate(ctx, message.data(), message.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        return std::unexpected(Error::signing("Failed to update digest: " + get_openssl_error()));
    }

    size_t sig_len = 0;
    if (EVP_DigestSignFinal(ctx, nullptr, &sig_len) != 1) {
        EVP_MD_CTX_free(ctx);
        return std::unexpected(
            Error::signing("Failed to get signature length: " + get_openssl_error()));
    }

    std::vector<unsigned char> signature(sig_len);
    if (EVP_DigestSignFinal(ctx, signature.data(), &sig_len) != 1) {
        EVP_MD_CTX_free(ctx);
        return std::unexpected(Error::signing("Failed to sign: " + get_openssl_error()));
    }

    EVP_MD_CTX_free(ctx);
    signature.resize(sig_len);
    return signature;
}

Result<AuthHeaders> Signer::sign_headers(std::int64_t timestamp_ms, std::string_view method,
                                         std::string_view path) const {
    Result<std::vector<unsigned char>> signature = sign(timestamp_ms, method, path);
    if (!signature) {
        return std::unexpected(signature.error());
    }

    return AuthHeaders{.access_key = impl_->key_id,
                       .signature = base64_encode(signature->data(), signature->size()),
                       .timestamp = std::to_string(timestamp_ms)};
}

Result<bool> Signer::verify(std::int64_t timestamp_ms, std::string_view method,
                            std::string_view path,
                            const std::vector<unsigned char>& signature) const {
    std::string message = canonical_message(timestamp_ms, method, path);

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return std::unexpected(Error::signing("Failed to create verification context"));
    }

    EVP_PKEY_CTX* pkey_ctx = nullptr;
    if (EVP_DigestVerifyInit(ctx, &pkey_ctx, EVP_sha256(), nullptr, impl_->pkey) != 1 ||
        !configure_pss(pkey_ctx)) {
        EVP_MD_CTX_free(ctx);
        return std::unexpected(Error::signing("Failed to init verification: " + get_openssl_error()));
    }

    if (EVP_DigestVerifyUpdate(ctx, message.data(), message.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        return std::unexpected(Error::signing("Failed to update digest: " + get_openssl_error()));
    }

    int rc = EVP_DigestVerifyFinal(ctx, signature.data(), signature.size());
    EVP_MD_CTX_free(ctx);
    if (rc != 1) {
        // A mismatch leaves an entry on the error queue
        ERR_clear_error();
    }
    return rc == 1;
}

} // namespace marketlink
