#ifndef SERVER_RECORD_STORE_HPP
#define SERVER_RECORD_STORE_HPP
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <kj/common.h>

#include "server/execution.hpp"

namespace server {

// In-memory execution records. Records are never deleted. The map lock is
// only held to find an entry; each record has its own lock, so updates of
// different executions do not contend.
class RecordStore {
 public:
  // Returns false if a record with the same id exists.
  bool Insert(const ExecutionRecord& record);

  // Applies update to the record under its lock. Returns false if the id is
  // unknown.
  bool Update(const std::string& id,
              const std::function<void(ExecutionRecord*)>& update);

  kj::Maybe<ExecutionRecord> Get(const std::string& id);
  std::vector<ExecutionRecord> List();
  size_t Size();

 private:
  struct Entry {
    std::mutex mutex;
    ExecutionRecord record;
  };

  Entry* Find(const std::string& id);

  std::mutex mutex_;
  std::map<std::string, std::unique_ptr<Entry>> records_;
};

}  // namespace server

#endif
