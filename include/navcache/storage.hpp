#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace navcache {

using Blob = std::vector<std::uint8_t>;

// Persistent key -> blob engine behind the durable tier.
class IPersistentStorage {
public:
  virtual ~IPersistentStorage() = default;
  virtual std::string name() const = 0;
  virtual bool init(std::string *err = nullptr) = 0;
  virtual std::optional<Blob> get(const std::string &key,
                                  std::string *err = nullptr) = 0;
  virtual bool put(const std::string &key, const Blob &value,
                   std::string *err = nullptr) = 0;
  virtual bool del(const std::string &key, std::string *err = nullptr) = 0;
  virtual bool clear(std::string *err = nullptr) = 0;
  virtual bool contains(const std::string &key) const = 0;
  virtual std::vector<std::string> keys() const = 0;
  virtual std::size_t bytes_used() const = 0;
  // Reclaims dead space when the engine has any.
  virtual void maybe_compact() {}
};

class MemoryStorage final : public IPersistentStorage {
public:
  std::string name() const override { return "memory"; }
  bool init(std::string *err = nullptr) override;
  std::optional<Blob> get(const std::string &key,
                          std::string *err = nullptr) override;
  bool put(const std::string &key, const Blob &value,
           std::string *err = nullptr) override;
  bool del(const std::string &key, std::string *err = nullptr) override;
  bool clear(std::string *err = nullptr) override;
  bool contains(const std::string &key) const override;
  std::vector<std::string> keys() const override;
  std::size_t bytes_used() const override { return bytes_; }

private:
  std::unordered_map<std::string, Blob> blobs_;
  std::size_t bytes_{0};
};

struct StorageQuota {
  std::uint64_t usage{0};
  std::uint64_t quota{0};
  double percentage{0.0};
};

class IQuotaEstimator {
public:
  virtual ~IQuotaEstimator() = default;
  virtual std::optional<StorageQuota> estimate() = 0;
};

// Usage is what the durable engine holds; quota is that usage plus the free
// space left on the filesystem holding `dir`, capped by `budget_bytes`.
class FilesystemQuotaEstimator final : public IQuotaEstimator {
public:
  FilesystemQuotaEstimator(std::string dir, const IPersistentStorage *storage,
                           std::uint64_t budget_bytes);
  std::optional<StorageQuota> estimate() override;

private:
  std::string dir_;
  const IPersistentStorage *storage_;
  std::uint64_t budget_bytes_;
};

} // namespace navcache
