#pragma once

#include <string_view>

#include <rocksdb/status.h>

namespace hashdiff {

// hashdiff reports errors as rocksdb::Status values. The helpers below build
// and classify the statuses that carry hashdiff-specific meaning.

/** Distinct content staged under an ID already seen in the current
 *  conflict-tracking epoch. Nothing was written. */
rocksdb::Status ConflictingKey(std::string_view id);
bool IsConflictingKey(const rocksdb::Status& s);

/** The value has structure the hasher refuses (NaN, excessive nesting). */
rocksdb::Status HashingError(std::string_view reason);
bool IsHashingError(const rocksdb::Status& s);

/** The operation observed a cancellation request and stopped. */
rocksdb::Status Cancelled();
bool IsCancelled(const rocksdb::Status& s);

}  // namespace hashdiff
