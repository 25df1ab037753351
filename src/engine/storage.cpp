#include "navcache/storage.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace navcache {

bool MemoryStorage::init(std::string *) { return true; }

std::optional<Blob> MemoryStorage::get(const std::string &key, std::string *) {
  auto it = blobs_.find(key);
  if (it == blobs_.end())
    return std::nullopt;
  return it->second;
}

bool MemoryStorage::put(const std::string &key, const Blob &value,
                        std::string *) {
  auto it = blobs_.find(key);
  if (it != blobs_.end())
    bytes_ -= it->second.size();
  blobs_[key] = value;
  bytes_ += value.size();
  return true;
}

bool MemoryStorage::del(const std::string &key, std::string *) {
  auto it = blobs_.find(key);
  if (it == blobs_.end())
    return true;
  bytes_ -= it->second.size();
  blobs_.erase(it);
  return true;
}

bool MemoryStorage::clear(std::string *) {
  blobs_.clear();
  bytes_ = 0;
  return true;
}

bool MemoryStorage::contains(const std::string &key) const {
  return blobs_.contains(key);
}

std::vector<std::string> MemoryStorage::keys() const {
  std::vector<std::string> out;
  out.reserve(blobs_.size());
  for (const auto &[k, _] : blobs_)
    out.push_back(k);
  std::sort(out.begin(), out.end());
  return out;
}

FilesystemQuotaEstimator::FilesystemQuotaEstimator(
    std::string dir, const IPersistentStorage *storage,
    std::uint64_t budget_bytes)
    : dir_(std::move(dir)), storage_(storage), budget_bytes_(budget_bytes) {}

std::optional<StorageQuota> FilesystemQuotaEstimator::estimate() {
  std::error_code ec;
  const auto info = std::filesystem::space(dir_, ec);
  if (ec)
    return std::nullopt;
  StorageQuota q;
  q.usage = storage_ ? storage_->bytes_used() : 0;
  q.quota = q.usage + static_cast<std::uint64_t>(info.available);
  if (budget_bytes_ > 0)
    q.quota = std::min(q.quota, budget_bytes_);
  if (q.quota == 0)
    return std::nullopt;
  q.percentage =
      static_cast<double>(q.usage) / static_cast<double>(q.quota) * 100.0;
  return q;
}

} // namespace navcache
