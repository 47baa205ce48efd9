#include <BucketCache/Cache/DiskStore.hpp>

#include <fstream>      // std::{ifstream, ofstream}
#include <iterator>     // std::istreambuf_iterator
#include <system_error> // std::error_code
#include <utility>      // std::move

#include <BucketCache/Cache/Buckets.hpp>
#include <BucketCache/Cache/Codec.hpp>
#include <BucketCache/Utils/Logging.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::error::BkcError;
    using utils::types::Err;
    using utils::types::isize;
    using utils::types::Option;
    using utils::types::String;

    using enum utils::error::BkcErrorCode;

    // Entry files, and temporaries left behind by an interrupted write.
    fn IsEntryFile(const fs::path& file) -> bool {
      const String name = file.filename().string();

      return name.ends_with(DiskStore::ENTRY_EXTENSION) ||
        name.ends_with(String(DiskStore::ENTRY_EXTENSION) + String(DiskStore::TEMP_EXTENSION));
    }
  } // namespace

  DiskStore::DiskStore(fs::path root)
    : m_root(std::move(root)) {}

  fn DiskStore::bucketDirectory(const StringView bucket) const -> fs::path {
    return m_root / CACHE_DIR_NAME / bucket;
  }

  fn DiskStore::entryPath(const StringView bucket, const StringView identifier) const -> Result<fs::path> {
    if (IsReservedBucket(bucket))
      return m_root / LIBRARY_FILE_NAME;

    if (identifier.empty())
      ERR(InvalidArgument, "Cache identifier cannot be empty");

    if (identifier.find_first_of("/\\") != StringView::npos || identifier == "." || identifier == "..")
      ERR_FMT(InvalidArgument, "Cache identifier '{}' is not usable as a file name", identifier);

    return bucketDirectory(bucket) / (String(identifier) + String(ENTRY_EXTENSION));
  }

  fn DiskStore::ensureLayout() const -> Result<> {
    Option<BkcError> firstError;

    for (const StringView bucket : BUCKET_NAMES) {
      if (IsReservedBucket(bucket))
        continue;

      const fs::path directory = bucketDirectory(bucket);

      if (std::error_code errc; !fs::create_directories(directory, errc) && errc) {
        BkcError failure(std::format("Failed to create cache directory '{}'", directory.string()), errc);
        error_at(failure);

        if (!firstError)
          firstError = std::move(failure);
      }
    }

    if (firstError)
      ERR_FROM(*firstError);

    return {};
  }

  fn DiskStore::read(const StringView bucket, const StringView identifier) const -> Result<Entry> {
    Result<fs::path> pathResult = entryPath(bucket, identifier);
    if (!pathResult)
      ERR_FROM(pathResult.error());

    const fs::path& path = *pathResult;

    debug_log("Retrieving cache entry from disk at {}", path.string());

    if (std::error_code existsEc; !fs::exists(path, existsEc) || existsEc) {
      if (existsEc)
        ERR_FROM(BkcError(std::format("Failed to check cache file '{}'", path.string()), existsEc));

      ERR_FMT(NotFound, "Cache file not found: {}", path.string());
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open())
      ERR_FMT(IoError, "Failed to open cache file for reading: {}", path.string());

    const String content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

    if (ifs.bad())
      ERR_FMT(IoError, "Failed to read cache file: {}", path.string());

    Result<Entry> entry = Decode<Entry>(content);
    if (!entry)
      ERR_FMT(ParseError, "Cache file '{}' is corrupt: {}", path.string(), entry.error().message);

    return entry;
  }

  fn DiskStore::write(const StringView bucket, const StringView identifier, const Entry& entry) const -> Result<> {
    Result<fs::path> pathResult = entryPath(bucket, identifier);
    if (!pathResult)
      ERR_FROM(pathResult.error());

    const fs::path& path     = *pathResult;
    fs::path        tempPath = path;
    tempPath += TEMP_EXTENSION;

    Result<String> buffer = Encode(entry);
    if (!buffer)
      ERR_FROM(buffer.error());

    if (std::error_code dirEc; !fs::create_directories(path.parent_path(), dirEc) && dirEc)
      ERR_FROM(BkcError(std::format("Failed to create directory for cache file '{}'", path.string()), dirEc));

    {
      std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
      if (!ofs.is_open())
        ERR_FMT(IoError, "Failed to open temporary cache file: {}", tempPath.string());

      ofs.write(buffer->data(), static_cast<isize>(buffer->size()));

      if (!ofs) {
        std::error_code removeEc;
        fs::remove(tempPath, removeEc);
        ERR_FMT(IoError, "Failed to write to temporary cache file: {}", tempPath.string());
      }
    }

    std::error_code renameEc;
    fs::rename(tempPath, path, renameEc);

    if (renameEc) {
      std::error_code removeEc;
      fs::remove(tempPath, removeEc);
      ERR_FROM(BkcError(std::format("Failed to replace cache file '{}'", path.string()), renameEc));
    }

    debug_log("Wrote cache entry to {}", path.string());
    return {};
  }

  fn DiskStore::remove(const StringView bucket, const StringView identifier) const -> Result<> {
    Result<fs::path> pathResult = entryPath(bucket, identifier);
    if (!pathResult)
      ERR_FROM(pathResult.error());

    if (std::error_code removeEc; !fs::remove(*pathResult, removeEc) && removeEc)
      ERR_FROM(BkcError(std::format("Failed to remove cache file '{}'", pathResult->string()), removeEc));

    return {};
  }

  fn DiskStore::exists(const StringView bucket, const StringView identifier) const -> bool {
    Result<fs::path> pathResult = entryPath(bucket, identifier);
    if (!pathResult)
      return false;

    std::error_code existsEc;
    return fs::exists(*pathResult, existsEc) && !existsEc;
  }

  fn DiskStore::clearBucket(const StringView bucket) const -> Result<> {
    if (IsReservedBucket(bucket))
      return {};

    const fs::path directory = bucketDirectory(bucket);

    std::error_code        iterEc;
    fs::directory_iterator dirIter(directory, fs::directory_options::skip_permission_denied, iterEc);

    if (iterEc) {
      if (iterEc == std::errc::no_such_file_or_directory)
        return {};

      ERR_FROM(BkcError(std::format("Failed to list cache directory '{}'", directory.string()), iterEc));
    }

    Option<BkcError> firstError;

    for (; dirIter != fs::directory_iterator(); dirIter.increment(iterEc)) {
      const fs::path& file = dirIter->path();

      if (!IsEntryFile(file))
        continue;

      if (std::error_code removeEc; !fs::remove(file, removeEc) && removeEc) {
        BkcError failure(std::format("Failed to remove cache file '{}'", file.string()), removeEc);
        warn_at(failure);

        if (!firstError)
          firstError = std::move(failure);
      }
    }

    if (iterEc)
      ERR_FROM(BkcError(std::format("Failed to list cache directory '{}'", directory.string()), iterEc));

    if (firstError)
      ERR_FROM(*firstError);

    debug_log("Cleared disk cache of bucket {}", bucket);
    return {};
  }
} // namespace bucketcache::cache
