#include "core/artifact_store.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"

namespace
{
    std::string toHex(const unsigned char *data, size_t length)
    {
        std::stringstream ss;
        for (size_t i = 0; i < length; i++)
        {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
        }
        return ss.str();
    }

    // Regular files at or below path; entries vanishing mid-walk are skipped
    size_t countObjects(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec))
            return 1;
        size_t count = 0;
        for (auto it = std::filesystem::recursive_directory_iterator(path, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
        {
            std::error_code entry_ec;
            if (it->is_regular_file(entry_ec))
                ++count;
        }
        return count;
    }

    std::string tempSuffix()
    {
        static std::atomic<uint64_t> counter{0};
        auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
        return ".tmp-" + std::to_string(ticks) + "-" + std::to_string(counter.fetch_add(1));
    }
}

FileSystemArtifactStore::FileSystemArtifactStore(std::filesystem::path root, std::string public_base_url,
                                                 std::string presign_secret, int presign_expiry_seconds)
    : root_(std::move(root)),
      public_base_url_(std::move(public_base_url)),
      presign_secret_(std::move(presign_secret)),
      presign_expiry_seconds_(presign_expiry_seconds)
{
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec)
        throw TransientIOError("could not create storage root " + root_.string() + ": " + ec.message());
    while (!public_base_url_.empty() && public_base_url_.back() == '/')
        public_base_url_.pop_back();
}

std::filesystem::path FileSystemArtifactStore::resolve(const std::string &key) const
{
    if (key.empty())
        throw ValidationError("storage key must not be empty");
    std::filesystem::path relative(key);
    if (relative.is_absolute() || relative.has_root_name())
        throw ValidationError("storage key must be relative: " + key);
    for (const auto &part : relative)
    {
        if (part == "..")
            throw ValidationError("storage key must not escape the storage root: " + key);
    }
    return root_ / relative;
}

std::string FileSystemArtifactStore::put(const std::string &key, const std::vector<uint8_t> &bytes)
{
    const std::filesystem::path target = resolve(key);
    const std::filesystem::path temp = target.string() + tempSuffix();

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec)
        throw TransientIOError("could not create directory for " + key + ": " + ec.message());

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            throw TransientIOError("could not open " + temp.string() + " for writing");
        file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file.good())
        {
            file.close();
            std::filesystem::remove(temp, ec);
            throw TransientIOError("could not write " + key);
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec)
    {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp, cleanup_ec);
        throw TransientIOError("could not move " + key + " into place: " + ec.message());
    }
    Logger::debug("Stored " + key + " (" + std::to_string(bytes.size()) + " bytes)");
    return key;
}

std::vector<uint8_t> FileSystemArtifactStore::get(const std::string &ref) const
{
    const std::filesystem::path path = resolve(ref);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw TransientIOError("object not found: " + ref);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
        throw TransientIOError("could not read " + ref);
    return bytes;
}

bool FileSystemArtifactStore::exists(const std::string &ref) const
{
    std::error_code ec;
    return std::filesystem::is_regular_file(resolve(ref), ec);
}

uint64_t FileSystemArtifactStore::size(const std::string &ref) const
{
    std::error_code ec;
    auto file_size = std::filesystem::file_size(resolve(ref), ec);
    if (ec)
        throw TransientIOError("could not stat " + ref + ": " + ec.message());
    return static_cast<uint64_t>(file_size);
}

size_t FileSystemArtifactStore::removePrefix(const std::string &prefix)
{
    if (prefix.empty())
        throw ValidationError("storage prefix must not be empty");

    // Only the directory holding the prefix is listed, so other jobs' trees are never walked
    const size_t slash = prefix.rfind('/');
    const std::string parent_key = slash == std::string::npos ? "" : prefix.substr(0, slash);
    const std::string stem = slash == std::string::npos ? prefix : prefix.substr(slash + 1);
    const std::filesystem::path parent = parent_key.empty() ? root_ : resolve(parent_key);

    std::error_code ec;
    std::vector<std::filesystem::path> doomed;
    if (stem.empty())
    {
        if (std::filesystem::exists(parent, ec))
            doomed.push_back(parent);
    }
    else
    {
        for (auto it = std::filesystem::directory_iterator(parent, ec);
             !ec && it != std::filesystem::directory_iterator(); it.increment(ec))
        {
            if (it->path().filename().string().compare(0, stem.size(), stem) == 0)
                doomed.push_back(it->path());
        }
        if (ec && ec != std::errc::no_such_file_or_directory)
            throw TransientIOError("could not list storage under " + prefix + ": " + ec.message());
    }

    size_t removed = 0;
    for (const auto &path : doomed)
    {
        removed += countObjects(path);
        std::filesystem::remove_all(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory)
            throw TransientIOError("could not remove " + path.string() + ": " + ec.message());
    }
    return removed;
}

std::string FileSystemArtifactStore::sign(const std::string &secret, const std::string &key, int64_t expires_at)
{
    const std::string message = key + "\n" + std::to_string(expires_at);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (!HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
              reinterpret_cast<const unsigned char *>(message.data()), message.size(), digest, &digest_length))
    {
        throw TransientIOError("HMAC-SHA256 signing failed");
    }
    return toHex(digest, digest_length);
}

bool FileSystemArtifactStore::verify(const std::string &key, int64_t expires_at, const std::string &signature) const
{
    const std::string expected = sign(presign_secret_, key, expires_at);
    return expected.size() == signature.size() &&
           CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) == 0;
}

std::string FileSystemArtifactStore::presignUntil(const std::string &ref, int64_t expires_at) const
{
    resolve(ref);
    return public_base_url_ + "/" + ref + "?expires=" + std::to_string(expires_at) +
           "&signature=" + sign(presign_secret_, ref, expires_at);
}

std::string FileSystemArtifactStore::presign(const std::string &ref) const
{
    const int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    return presignUntil(ref, now + presign_expiry_seconds_);
}
