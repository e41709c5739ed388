#include "server/record_store.hpp"

namespace server {

bool RecordStore::Insert(const ExecutionRecord& record) {
  auto entry = std::make_unique<Entry>();
  entry->record = record;
  std::lock_guard<std::mutex> lck(mutex_);
  return records_.emplace(record.id, std::move(entry)).second;
}

RecordStore::Entry* RecordStore::Find(const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  auto it = records_.find(id);
  return it == records_.end() ? nullptr : it->second.get();
}

bool RecordStore::Update(const std::string& id,
                         const std::function<void(ExecutionRecord*)>& update) {
  Entry* entry = Find(id);
  if (entry == nullptr) return false;
  std::lock_guard<std::mutex> lck(entry->mutex);
  update(&entry->record);
  return true;
}

kj::Maybe<ExecutionRecord> RecordStore::Get(const std::string& id) {
  Entry* entry = Find(id);
  if (entry == nullptr) return nullptr;
  std::lock_guard<std::mutex> lck(entry->mutex);
  return entry->record;
}

std::vector<ExecutionRecord> RecordStore::List() {
  std::vector<Entry*> entries;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    for (auto& kv : records_) entries.push_back(kv.second.get());
  }
  std::vector<ExecutionRecord> out;
  for (Entry* entry : entries) {
    std::lock_guard<std::mutex> lck(entry->mutex);
    out.push_back(entry->record);
  }
  return out;
}

size_t RecordStore::Size() {
  std::lock_guard<std::mutex> lck(mutex_);
  return records_.size();
}

}  // namespace server
