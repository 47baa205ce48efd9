#pragma once

#include <filesystem> // std::filesystem::path

#include <BucketCache/Cache/Entry.hpp>
#include <BucketCache/Utils/Error.hpp>
#include <BucketCache/Utils/Types.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::types::Result;
    using utils::types::StringView;

    namespace fs = std::filesystem;
  } // namespace

  /**
   * @class DiskStore
   * @brief Per-entry file persistence rooted at the host data directory.
   *
   * Every (bucket, identifier) pair maps to `<root>/cache/<bucket>/<identifier>.cache`,
   * except the reserved library bucket, which always maps to `<root>/library.ndb`.
   * The store has no state of its own beyond the root path; callers decide how
   * to treat the errors it returns.
   */
  class DiskStore {
   public:
    static constexpr StringView CACHE_DIR_NAME    = "cache";
    static constexpr StringView ENTRY_EXTENSION   = ".cache";
    static constexpr StringView LIBRARY_FILE_NAME = "library.ndb";
    static constexpr StringView TEMP_EXTENSION    = ".tmp";

    explicit DiskStore(fs::path root);

    [[nodiscard]] fn root() const -> const fs::path& {
      return m_root;
    }

    /**
     * @brief Directory holding the entry files of a bucket.
     * @note The reserved bucket has no directory; its file lives in the root.
     */
    [[nodiscard]] fn bucketDirectory(StringView bucket) const -> fs::path;

    /**
     * @brief Resolves the file for a cache entry.
     * @return The path, or InvalidArgument for identifiers that are empty or
     * contain path separators (they would escape the bucket directory).
     */
    [[nodiscard]] fn entryPath(StringView bucket, StringView identifier) const -> Result<fs::path>;

    /**
     * @brief Creates `cache/<bucket>/` for every known bucket except the reserved one.
     * @return The first creation failure, after attempting every bucket.
     */
    fn ensureLayout() const -> Result<>;

    /**
     * @brief Reads and decodes an entry file.
     * @return NotFound if the file is missing; IoError or ParseError if it
     * cannot be read or decoded.
     */
    [[nodiscard]] fn read(StringView bucket, StringView identifier) const -> Result<Entry>;

    /**
     * @brief Encodes an entry and atomically replaces its file.
     */
    fn write(StringView bucket, StringView identifier, const Entry& entry) const -> Result<>;

    /**
     * @brief Deletes an entry file. A missing file is not an error.
     */
    fn remove(StringView bucket, StringView identifier) const -> Result<>;

    [[nodiscard]] fn exists(StringView bucket, StringView identifier) const -> bool;

    /**
     * @brief Deletes every entry file of a bucket.
     * @note A no-op for the reserved bucket, whose file is shielded from bulk clearing.
     */
    fn clearBucket(StringView bucket) const -> Result<>;

   private:
    fs::path m_root;
  };
} // namespace bucketcache::cache
