#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace ip6gen::infrastructure {

// Unkeyed BLAKE2b through the OpenSSL EVP provider. The digest length goes
// into the parameter block, so a 10-byte digest is not a prefix of the
// 64-byte one.
class Blake2bDigest {
public:
    static constexpr size_t MIN_OUTPUT_LENGTH = 1;
    static constexpr size_t MAX_OUTPUT_LENGTH = 64;

    // Throws std::invalid_argument for a length outside 1..64 and
    // DigestException when the provider refuses the length.
    explicit Blake2bDigest(size_t output_length);

    Blake2bDigest(const Blake2bDigest&) = delete;
    Blake2bDigest& operator=(const Blake2bDigest&) = delete;

    void update(const uint8_t* data, size_t length);
    void update(const std::string& data);
    std::vector<uint8_t> finalize();

    size_t output_length() const { return output_length_; }

    static std::vector<uint8_t> hash(const std::string& data, size_t output_length);
    static std::string hex_digest(const std::string& data, size_t output_length);

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* context) const;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> context_;
    size_t output_length_;
    bool finalized_{false};
};

}
