#include "batchdl/hash.hpp"

#include "batchdl/detail/file.hpp"
#include "batchdl/error.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fmt/format.h>
#include <openssl/evp.h>

namespace batchdl {

namespace {

const EVP_MD* digestFor(HashAlgorithm algorithm) {
    switch (algorithm) {
    case HashAlgorithm::Md5:
        return EVP_md5();
    case HashAlgorithm::Sha1:
        return EVP_sha1();
    case HashAlgorithm::Sha256:
        return EVP_sha256();
    case HashAlgorithm::Sha512:
        return EVP_sha512();
    }
    return nullptr;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

class Hash::Impl {
public:
    explicit Impl(HashAlgorithm algorithm) : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        const EVP_MD* md = digestFor(algorithm);
        if (!ctx_ || !md || EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
            throw Error(ErrorKind::Internal, "Failed to initialize digest context");
        }
    }

    void update(const void* data, std::size_t size) {
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw Error(ErrorKind::Internal, "Failed to update digest");
        }
    }

    Digest finish() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
            throw Error(ErrorKind::Internal, "Failed to finalize digest");
        }
        return Digest(hash, hash + hash_len);
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

Hash::Hash(HashAlgorithm algorithm) : impl_(std::make_unique<Impl>(algorithm)) {}

Hash::~Hash() = default;

void Hash::update(const void* data, std::size_t size) { impl_->update(data, size); }

Digest Hash::finish() { return impl_->finish(); }

Digest hashFile(const std::string& path, HashAlgorithm algorithm, std::size_t buffer_size) {
    detail::FilePtr file{std::fopen(path.c_str(), "rb")};
    if (!file) {
        throw Error(ErrorKind::Filesystem,
                    fmt::format("Cannot open {} for verification: {}", path, std::strerror(errno)));
    }

    Hash hash(algorithm);
    std::vector<char> buffer(buffer_size > 0 ? buffer_size : 8192);
    while (true) {
        const std::size_t n = std::fread(buffer.data(), 1, buffer.size(), file.get());
        if (n > 0) {
            hash.update(buffer.data(), n);
        }
        if (n < buffer.size()) {
            if (std::ferror(file.get())) {
                throw Error(ErrorKind::Filesystem,
                            fmt::format("Failed to read {} for verification", path));
            }
            break;
        }
    }
    return hash.finish();
}

std::string toHex(const Digest& digest) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest.size() * 2);
    for (const unsigned char byte : digest) {
        hex.push_back(kDigits[byte >> 4]);
        hex.push_back(kDigits[byte & 0x0f]);
    }
    return hex;
}

Digest fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw Error(ErrorKind::InvalidRequest, fmt::format("Odd-length hex digest: {}", hex));
    }

    Digest digest;
    digest.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hexValue(hex[i]);
        const int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw Error(ErrorKind::InvalidRequest, fmt::format("Invalid hex digest: {}", hex));
        }
        digest.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return digest;
}

} // namespace batchdl
