#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace strata::crypto {

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    // Convenience overload for text content
    void update(std::string_view text) { update(std::as_bytes(std::span(text.data(), text.size()))); }
};

// SHA-256 implementation
class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    using IContentHasher::update;

    void init() override;
    void update(std::span<const std::byte> data) override;

    /**
     * @brief Finish the digest and return it as lowercase hex; the hasher is re-initialized
     */
    std::string finalize() override;

    // Static utility for one-shot hashing
    static std::string hash(std::span<const std::byte> data);
    static std::string hash(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Factory function
std::unique_ptr<IContentHasher> createSHA256Hasher();

} // namespace strata::crypto
