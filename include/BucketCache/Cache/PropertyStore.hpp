#pragma once

#include <filesystem> // std::filesystem::path

#include <BucketCache/Cache/Entry.hpp>
#include <BucketCache/Utils/Error.hpp>
#include <BucketCache/Utils/Types.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::types::Mutex;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::UnorderedMap;

    namespace fs = std::filesystem;
  } // namespace

  /**
   * @class IPropertyStore
   * @brief Host-provided string key/value facility that outlives a single cache engine.
   *
   * Implementations report a missing slot as NotFound.
   */
  class IPropertyStore {
   public:
    IPropertyStore(const IPropertyStore&) = delete;
    IPropertyStore(IPropertyStore&&)      = delete;

    fn operator=(const IPropertyStore&)->IPropertyStore& = delete;
    fn operator=(IPropertyStore&&)->IPropertyStore&      = delete;

    virtual ~IPropertyStore() = default;

    [[nodiscard]] virtual fn getProperty(StringView key) const -> Result<String> = 0;

    virtual fn setProperty(StringView key, const String& value) -> Result<> = 0;

    virtual fn clearProperty(StringView key) -> Result<> = 0;

   protected:
    IPropertyStore() = default;
  };

  /**
   * @class InMemoryPropertyStore
   * @brief Process-scoped property store. Engines constructed against the same
   * instance share its slots.
   */
  class InMemoryPropertyStore final : public IPropertyStore {
   public:
    InMemoryPropertyStore() = default;

    [[nodiscard]] fn getProperty(StringView key) const -> Result<String> override;
    fn               setProperty(StringView key, const String& value) -> Result<> override;
    fn               clearProperty(StringView key) -> Result<> override;

   private:
    UnorderedMap<String, String> m_slots;
    mutable Mutex                m_slotsMutex;
  };

  /**
   * @class DirectoryPropertyStore
   * @brief Property store keeping one file per slot in a directory, for hosts
   * without a key/value facility of their own.
   */
  class DirectoryPropertyStore final : public IPropertyStore {
   public:
    explicit DirectoryPropertyStore(fs::path directory);

    [[nodiscard]] fn getProperty(StringView key) const -> Result<String> override;
    fn               setProperty(StringView key, const String& value) -> Result<> override;
    fn               clearProperty(StringView key) -> Result<> override;

   private:
    [[nodiscard]] fn slotPath(StringView key) const -> Result<fs::path>;

    fs::path m_directory;
  };

  /**
   * @class PropertyLayer
   * @brief Whole-bucket persistence into property slots named `<prefix>_<bucket>`.
   */
  class PropertyLayer {
   public:
    static constexpr StringView DEFAULT_PREFIX = "bkcmemcache";

    PropertyLayer(IPropertyStore& store, String prefix);

    [[nodiscard]] fn slotName(StringView bucket) const -> String;

    /**
     * @brief Deserializes a bucket from its slot.
     * @return NotFound when nothing is persisted, ParseError for a corrupt slot.
     */
    [[nodiscard]] fn load(StringView bucket) const -> Result<Bucket>;

    fn save(StringView bucket, const Bucket& contents) -> Result<>;

    fn clear(StringView bucket) -> Result<>;

   private:
    IPropertyStore& m_store;
    String          m_prefix;
  };
} // namespace bucketcache::cache
