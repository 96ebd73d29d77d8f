#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace batchdl {

enum class HashAlgorithm { Md5, Sha1, Sha256, Sha512 };

using Digest = std::vector<unsigned char>;

// Streaming message digest. Each instance owns its own context and must not be
// shared between concurrent transfers.
class Hash {
public:
    explicit Hash(HashAlgorithm algorithm);
    ~Hash();

    Hash(const Hash&) = delete;
    Hash& operator=(const Hash&) = delete;

    void update(const void* data, std::size_t size);
    [[nodiscard]] Digest finish();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Streams the file at `path` through a fresh Hash. Throws Error(Filesystem) if
// the file cannot be opened or read.
[[nodiscard]] Digest hashFile(const std::string& path, HashAlgorithm algorithm,
                              std::size_t buffer_size = 8192);

[[nodiscard]] std::string toHex(const Digest& digest);

// Throws Error(InvalidRequest) on odd length or non-hex characters.
[[nodiscard]] Digest fromHex(const std::string& hex);

} // namespace batchdl
