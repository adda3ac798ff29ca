#include <hashdiff/kv.hpp>

namespace hashdiff {

const char* TableName(Table t) {
  switch (t) {
    case Table::kCommitted: return "committed";
    case Table::kPending:   return "pending";
    case Table::kPayload:   return "payload";
    case Table::kConflicts: return "conflicts";
    case Table::kUserData:  return "user_data";
    case Table::kMeta:      return "meta";
  }
  return "unknown";
}

}  // namespace hashdiff
