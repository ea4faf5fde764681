#include <xsc/schema_store.hpp>

#include <algorithm>
#include <mutex>
#include <utility>

namespace xsc {

  void
  schema_store::unindex(const cache_row& row) {
    if (!row.id_key) return;
    auto it = by_id_.find(*row.id_key);
    if (it == by_id_.end()) return;
    auto& sources = it->second;
    sources.erase(std::remove(sources.begin(), sources.end(), row.source_key),
                  sources.end());
    if (sources.empty()) by_id_.erase(it);
  }

  std::optional<cache_row>
  schema_store::find_by_source(const std::string& source_key) const {
    std::shared_lock lock(mutex_);
    auto it = rows_.find(source_key);
    if (it == rows_.end()) return std::nullopt;
    return it->second;
  }

  std::optional<cache_row>
  schema_store::find_by_id(const std::string& id_key) const {
    std::shared_lock lock(mutex_);
    auto it = by_id_.find(id_key);
    if (it == by_id_.end() || it->second.empty()) return std::nullopt;
    return rows_.at(it->second.back());
  }

  void
  schema_store::insert(cache_row row) {
    std::unique_lock lock(mutex_);
    auto it = rows_.find(row.source_key);
    if (it != rows_.end()) {
      unindex(it->second);
      rows_.erase(it);
    }
    if (row.id_key) by_id_[*row.id_key].push_back(row.source_key);
    auto key = row.source_key;
    rows_.emplace(std::move(key), std::move(row));
  }

  std::size_t
  schema_store::erase_by_source(const std::string& source_key) {
    std::unique_lock lock(mutex_);
    auto it = rows_.find(source_key);
    if (it == rows_.end()) return 0;
    unindex(it->second);
    rows_.erase(it);
    return 1;
  }

  std::size_t
  schema_store::erase_by_id(const std::string& id_key) {
    std::unique_lock lock(mutex_);
    auto it = by_id_.find(id_key);
    if (it == by_id_.end()) return 0;
    auto sources = std::move(it->second);
    by_id_.erase(it);
    for (const auto& source_key : sources) {
      rows_.erase(source_key);
    }
    return sources.size();
  }

  std::vector<cache_row>
  schema_store::rows() const {
    std::shared_lock lock(mutex_);
    std::vector<cache_row> result;
    result.reserve(rows_.size());
    for (const auto& [key, row] : rows_) {
      result.push_back(row);
    }
    return result;
  }

  std::size_t
  schema_store::size() const {
    std::shared_lock lock(mutex_);
    return rows_.size();
  }

} // namespace xsc
