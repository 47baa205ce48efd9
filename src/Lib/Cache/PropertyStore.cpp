#include <BucketCache/Cache/PropertyStore.hpp>

#include <format>       // std::format
#include <fstream>      // std::{ifstream, ofstream}
#include <iterator>     // std::istreambuf_iterator
#include <system_error> // std::error_code
#include <utility>      // std::move

#include <BucketCache/Cache/Codec.hpp>

namespace bucketcache::cache {
  namespace {
    using utils::error::BkcError;
    using utils::types::Err;
    using utils::types::isize;
    using utils::types::LockGuard;

    using enum utils::error::BkcErrorCode;

    constexpr StringView SLOT_EXTENSION = ".prop";
  } // namespace

  fn InMemoryPropertyStore::getProperty(const StringView key) const -> Result<String> {
    const LockGuard lock(m_slotsMutex);

    if (const auto iter = m_slots.find(String(key)); iter != m_slots.end())
      return iter->second;

    ERR_FMT(NotFound, "Property '{}' is not set", key);
  }

  fn InMemoryPropertyStore::setProperty(const StringView key, const String& value) -> Result<> {
    const LockGuard lock(m_slotsMutex);

    m_slots.insert_or_assign(String(key), value);
    return {};
  }

  fn InMemoryPropertyStore::clearProperty(const StringView key) -> Result<> {
    const LockGuard lock(m_slotsMutex);

    m_slots.erase(String(key));
    return {};
  }

  DirectoryPropertyStore::DirectoryPropertyStore(fs::path directory)
    : m_directory(std::move(directory)) {}

  fn DirectoryPropertyStore::slotPath(const StringView key) const -> Result<fs::path> {
    if (key.empty() || key.find_first_of("/\\") != StringView::npos)
      ERR_FMT(InvalidArgument, "Property key '{}' is not usable as a file name", key);

    return m_directory / (String(key) + String(SLOT_EXTENSION));
  }

  fn DirectoryPropertyStore::getProperty(const StringView key) const -> Result<String> {
    Result<fs::path> path = slotPath(key);
    if (!path)
      ERR_FROM(path.error());

    if (std::error_code existsEc; !fs::exists(*path, existsEc) || existsEc) {
      if (existsEc)
        ERR_FROM(BkcError(std::format("Failed to check property file '{}'", path->string()), existsEc));

      ERR_FMT(NotFound, "Property '{}' is not set", key);
    }

    std::ifstream ifs(*path, std::ios::binary);
    if (!ifs.is_open())
      ERR_FMT(IoError, "Failed to open property file for reading: {}", path->string());

    String value((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

    if (ifs.bad())
      ERR_FMT(IoError, "Failed to read property file: {}", path->string());

    return value;
  }

  fn DirectoryPropertyStore::setProperty(const StringView key, const String& value) -> Result<> {
    Result<fs::path> path = slotPath(key);
    if (!path)
      ERR_FROM(path.error());

    if (std::error_code dirEc; !fs::create_directories(m_directory, dirEc) && dirEc)
      ERR_FROM(BkcError(std::format("Failed to create property directory '{}'", m_directory.string()), dirEc));

    std::ofstream ofs(*path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open())
      ERR_FMT(IoError, "Failed to open property file for writing: {}", path->string());

    ofs.write(value.data(), static_cast<isize>(value.size()));

    if (!ofs)
      ERR_FMT(IoError, "Failed to write property file: {}", path->string());

    return {};
  }

  fn DirectoryPropertyStore::clearProperty(const StringView key) -> Result<> {
    Result<fs::path> path = slotPath(key);
    if (!path)
      ERR_FROM(path.error());

    if (std::error_code removeEc; !fs::remove(*path, removeEc) && removeEc)
      ERR_FROM(BkcError(std::format("Failed to remove property file '{}'", path->string()), removeEc));

    return {};
  }

  PropertyLayer::PropertyLayer(IPropertyStore& store, String prefix)
    : m_store(store), m_prefix(std::move(prefix)) {}

  fn PropertyLayer::slotName(const StringView bucket) const -> String {
    return std::format("{}_{}", m_prefix, bucket);
  }

  fn PropertyLayer::load(const StringView bucket) const -> Result<Bucket> {
    Result<String> serialized = m_store.getProperty(slotName(bucket));
    if (!serialized)
      ERR_FROM(serialized.error());

    Result<Bucket> contents = Decode<Bucket>(*serialized);
    if (!contents)
      ERR_FMT(ParseError, "Property slot '{}' is corrupt: {}", slotName(bucket), contents.error().message);

    return contents;
  }

  fn PropertyLayer::save(const StringView bucket, const Bucket& contents) -> Result<> {
    Result<String> serialized = Encode(contents);
    if (!serialized)
      ERR_FROM(serialized.error());

    return m_store.setProperty(slotName(bucket), *serialized);
  }

  fn PropertyLayer::clear(const StringView bucket) -> Result<> {
    return m_store.clearProperty(slotName(bucket));
  }
} // namespace bucketcache::cache
