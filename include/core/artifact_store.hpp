#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Keyed blob storage for input videos and job artifacts
 *
 * References returned by put() are the storage keys themselves. Safe for
 * concurrent use by several jobs as long as they write distinct keys.
 */
class ArtifactStore
{
public:
    virtual ~ArtifactStore() = default;

    /**
     * @brief Store bytes under key, overwriting any previous object
     * @return Reference to the stored object
     * @throws TransientIOError on I/O failure
     */
    virtual std::string put(const std::string &key, const std::vector<uint8_t> &bytes) = 0;

    /**
     * @throws TransientIOError when the object is missing or unreadable
     */
    virtual std::vector<uint8_t> get(const std::string &ref) const = 0;

    /**
     * @brief Time-limited URL for the object
     */
    virtual std::string presign(const std::string &ref) const = 0;

    virtual bool exists(const std::string &ref) const = 0;

    /**
     * @throws TransientIOError when the object is missing or unreadable
     */
    virtual uint64_t size(const std::string &ref) const = 0;

    /**
     * @brief Remove every object whose key starts with prefix
     * @return Number of objects removed
     */
    virtual size_t removePrefix(const std::string &prefix) = 0;
};

/**
 * @brief ArtifactStore on the local filesystem
 *
 * Writes are atomic (temp file, then rename). Presigned URLs have the form
 * <base>/<key>?expires=<unix>&signature=<hex HMAC-SHA256(secret, key + "\n" + expires)>.
 */
class FileSystemArtifactStore : public ArtifactStore
{
public:
    FileSystemArtifactStore(std::filesystem::path root, std::string public_base_url, std::string presign_secret,
                            int presign_expiry_seconds);

    std::string put(const std::string &key, const std::vector<uint8_t> &bytes) override;
    std::vector<uint8_t> get(const std::string &ref) const override;
    std::string presign(const std::string &ref) const override;
    bool exists(const std::string &ref) const override;
    uint64_t size(const std::string &ref) const override;
    size_t removePrefix(const std::string &prefix) override;

    /**
     * @brief Presign with an explicit expiry instant (unix seconds)
     */
    std::string presignUntil(const std::string &ref, int64_t expires_at) const;

    /**
     * @brief Hex HMAC-SHA256 signature of key and expiry
     */
    static std::string sign(const std::string &secret, const std::string &key, int64_t expires_at);

    bool verify(const std::string &key, int64_t expires_at, const std::string &signature) const;

    const std::filesystem::path &root() const { return root_; }

private:
    /**
     * @throws ValidationError for empty, absolute or escaping keys
     */
    std::filesystem::path resolve(const std::string &key) const;

    std::filesystem::path root_;
    std::string public_base_url_;
    std::string presign_secret_;
    int presign_expiry_seconds_;
};
