#include "infrastructure/digest.h"
#include "domain/errors.h"
#include "domain/ipv6_network.h"
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <stdexcept>

namespace ip6gen::infrastructure {

namespace {

constexpr const char* BLAKE2B_ALGORITHM = "BLAKE2B-512";

std::string openssl_error(const std::string& operation) {
    std::string message = operation + " failed";
    unsigned long code = ERR_get_error();
    if (code != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        message += ": ";
        message += buffer;
    }
    ERR_clear_error();
    return message;
}

struct MdDeleter {
    void operator()(EVP_MD* md) const { EVP_MD_free(md); }
};

}

void Blake2bDigest::ContextDeleter::operator()(evp_md_ctx_st* context) const {
    EVP_MD_CTX_free(context);
}

Blake2bDigest::Blake2bDigest(size_t output_length)
    : output_length_(output_length) {
    if (output_length < MIN_OUTPUT_LENGTH || output_length > MAX_OUTPUT_LENGTH) {
        throw std::invalid_argument("blake2b output length must be between 1 and 64 bytes, got " +
                                    std::to_string(output_length));
    }

    std::unique_ptr<EVP_MD, MdDeleter> md(EVP_MD_fetch(nullptr, BLAKE2B_ALGORITHM, nullptr));
    if (!md) {
        THROW_DIGEST_ERROR(openssl_error("EVP_MD_fetch(" + std::string(BLAKE2B_ALGORITHM) + ")"));
    }

    context_.reset(EVP_MD_CTX_new());
    if (!context_) {
        THROW_DIGEST_ERROR(openssl_error("EVP_MD_CTX_new"));
    }

    size_t size = output_length_;
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_size_t(OSSL_DIGEST_PARAM_SIZE, &size),
        OSSL_PARAM_construct_end()
    };
    if (EVP_DigestInit_ex2(context_.get(), md.get(), params) != 1) {
        THROW_DIGEST_ERROR(openssl_error("EVP_DigestInit_ex2 with a " +
                                         std::to_string(output_length_) + "-byte digest"));
    }
}

void Blake2bDigest::update(const uint8_t* data, size_t length) {
    if (finalized_) {
        throw std::logic_error("blake2b update after finalize");
    }
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(context_.get(), data, length) != 1) {
        THROW_DIGEST_ERROR(openssl_error("EVP_DigestUpdate"));
    }
}

void Blake2bDigest::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> Blake2bDigest::finalize() {
    if (finalized_) {
        throw std::logic_error("blake2b finalize called twice");
    }
    finalized_ = true;

    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(context_.get(), digest.data(), &digest_length) != 1) {
        THROW_DIGEST_ERROR(openssl_error("EVP_DigestFinal_ex"));
    }
    // A provider that ignored the size parameter returns the full 64 bytes.
    if (digest_length != output_length_) {
        THROW_DIGEST_ERROR("blake2b provider returned " + std::to_string(digest_length) +
                           " bytes instead of " + std::to_string(output_length_));
    }

    digest.resize(digest_length);
    return digest;
}

std::vector<uint8_t> Blake2bDigest::hash(const std::string& data, size_t output_length) {
    Blake2bDigest hasher(output_length);
    hasher.update(data);
    return hasher.finalize();
}

std::string Blake2bDigest::hex_digest(const std::string& data, size_t output_length) {
    return domain::to_hex(hash(data, output_length));
}

}
