#include <hashdiff/differential.hpp>

#include <utility>

#include <rocksdb/env.h>

#include <hashdiff/cancellation.hpp>
#include <hashdiff/internal.hpp>
#include <hashdiff/object_queue.hpp>
#include <hashdiff/status.hpp>

namespace hashdiff {

namespace {

using internal::EmitCounter;
using internal::EmitHistogram;
using internal::SpanAttr;
using internal::SpanEvent;
using internal::StatusKind;

constexpr const char* kConflictTrackingKey = "conflict_tracking";
constexpr size_t kRefcountBytes = 8;

// Failures named in ApplyResult::ToStatus before the message is truncated.
constexpr size_t kMaxListedFailures = 64;

// Emit a counter once txn commits; a rolled-back transaction reports nothing.
void CountOnCommit(KvTransaction* txn, const Options& opt, const char* name, uint64_t delta) {
  if (!opt.metrics || delta == 0) return;
  txn->OnCommit([metrics = opt.metrics, name, delta] { metrics->Counter(name, delta); });
}

std::string Printable(std::string_view id) { return internal::PrintableKey(id); }

}  // namespace

// --------------------------
// ApplyResult / UserData
// --------------------------

std::vector<std::string> ApplyResult::FailedIds() const {
  std::vector<std::string> ids;
  ids.reserve(failures.size());
  for (const auto& f : failures) ids.push_back(f.id);
  return ids;
}

rocksdb::Status ApplyResult::ToStatus() const {
  if (ok()) return rocksdb::Status::OK();

  std::string msg = std::to_string(failures.size()) + " failed, " +
                    std::to_string(promoted) + " promoted";
  if (cancelled) msg += ", cancelled";
  size_t listed = 0;
  for (const auto& f : failures) {
    if (listed == kMaxListedFailures) {
      msg += "; ... " + std::to_string(failures.size() - listed) + " more";
      break;
    }
    msg += (listed == 0 ? "; failures: " : "; ") + Printable(f.id) + ": " + f.status.ToString();
    ++listed;
  }
  return rocksdb::Status::Incomplete("apply incomplete", msg);
}

rocksdb::Status UserData::Get(std::string_view key, std::string* value) const {
  return txn_->Get(Table::kUserData, key, value);
}

rocksdb::Status UserData::Put(std::string_view key, std::string_view value) {
  return txn_->Put(Table::kUserData, key, value);
}

rocksdb::Status UserData::Delete(std::string_view key) {
  return txn_->Delete(Table::kUserData, key);
}

rocksdb::Status UserData::ForEach(
    const std::function<bool(std::string_view key, std::string_view value)>& fn) const {
  auto cur = txn_->NewCursor(Table::kUserData);
  for (cur->SeekToFirst(); cur->Valid(); cur->Next()) {
    if (!fn(cur->key(), cur->value())) break;
  }
  return cur->status();
}

// --------------------------
// Differential
// --------------------------

Differential::Differential(std::shared_ptr<KvNamespace> ns, const Options& opt)
    : ns_(std::move(ns)), opt_(opt), hasher_(opt.hasher ? opt.hasher : DefaultHasher()) {}

void Differential::Abort(KvTransaction* txn, const char* op) const {
  rocksdb::Status s = txn->Rollback();
  if (!s.ok()) {
    rocksdb::Log(rocksdb::InfoLogLevel::WARN_LEVEL, opt_.info_log,
                 "hashdiff: %s rollback failed for %s: %s",
                 op, Printable(Name()).c_str(), s.ToString().c_str());
  }
}

rocksdb::Status Differential::ReadTracking(KvTransaction* txn, bool* tracking) const {
  std::string flag;
  rocksdb::Status s = txn->Get(Table::kMeta, kConflictTrackingKey, &flag);
  if (s.IsNotFound()) {
    *tracking = false;
    return rocksdb::Status::OK();
  }
  if (!s.ok()) return s;
  *tracking = (flag == "1");
  return rocksdb::Status::OK();
}

rocksdb::Status Differential::LoadPayload(KvTransaction* txn,
                                          const std::string& hash,
                                          std::string* encoded) const {
  std::string record;
  rocksdb::Status s = txn->Get(Table::kPayload, hash, &record);
  if (!s.ok()) return s;
  if (record.size() < kRefcountBytes) {
    return rocksdb::Status::Corruption("payload record too short", Printable(hash));
  }
  *encoded = record.substr(kRefcountBytes);
  return rocksdb::Status::OK();
}

rocksdb::Status Differential::AcquirePayload(KvTransaction* txn,
                                             const std::string& hash,
                                             std::string_view encoded) {
  std::string record;
  rocksdb::Status s = txn->Get(Table::kPayload, hash, &record);
  if (s.IsNotFound()) {
    record = internal::EncodeU64LE(1);
    record.append(encoded.data(), encoded.size());
    return txn->Put(Table::kPayload, hash, record);
  }
  if (!s.ok()) return s;

  uint64_t refs = 0;
  if (record.size() < kRefcountBytes ||
      !internal::DecodeU64LE(std::string_view(record).substr(0, kRefcountBytes), &refs)) {
    return rocksdb::Status::Corruption("payload record too short", Printable(hash));
  }
  record.replace(0, kRefcountBytes, internal::EncodeU64LE(refs + 1));
  return txn->Put(Table::kPayload, hash, record);
}

rocksdb::Status Differential::ReleasePayload(KvTransaction* txn, const std::string& hash) {
  std::string record;
  rocksdb::Status s = txn->Get(Table::kPayload, hash, &record);
  if (s.IsNotFound()) {
    rocksdb::Log(rocksdb::InfoLogLevel::ERROR_LEVEL, opt_.info_log,
                 "hashdiff: %s: missing payload for pending hash %s",
                 Printable(Name()).c_str(), Printable(hash).c_str());
    EmitCounter(opt_, "hashdiff.add.corruption_total", 1);
    return rocksdb::Status::Corruption("missing payload for pending hash", Printable(hash));
  }
  if (!s.ok()) return s;

  uint64_t refs = 0;
  if (record.size() < kRefcountBytes ||
      !internal::DecodeU64LE(std::string_view(record).substr(0, kRefcountBytes), &refs)) {
    return rocksdb::Status::Corruption("payload record too short", Printable(hash));
  }
  if (refs <= 1) return txn->Delete(Table::kPayload, hash);

  record.replace(0, kRefcountBytes, internal::EncodeU64LE(refs - 1));
  return txn->Put(Table::kPayload, hash, record);
}

rocksdb::Status Differential::StageLocked(KvTransaction* txn,
                                          const Object& obj,
                                          bool tracking,
                                          bool* updated) {
  *updated = false;

  const std::string id = obj.Id();
  const Json::Value content = obj.Content();

  // Conflict check first: an ID already staged in this epoch accepts only
  // the content it was staged with.
  rocksdb::Status s;
  std::string marker;
  bool marked = false;
  if (tracking) {
    s = txn->Get(Table::kConflicts, id, &marker);
    if (!s.ok() && !s.IsNotFound()) return s;
    marked = s.ok();
  }

  ContentHash h{};
  s = hasher_->Hash(content, &h);
  if (!s.ok()) {
    if (marked && IsHashingError(s)) {
      EmitCounter(opt_, "hashdiff.add.conflict_total", 1);
      return ConflictingKey(id);
    }
    if (IsHashingError(s)) EmitCounter(opt_, "hashdiff.add.hash_error_total", 1);
    return s;
  }
  const std::string hash = HashToBytes(h);

  if (marked && marker != hash) {
    EmitCounter(opt_, "hashdiff.add.conflict_total", 1);
    return ConflictingKey(id);
  }

  std::string committed;
  s = txn->Get(Table::kCommitted, id, &committed);
  if (s.ok() && committed == hash) {
    EmitCounter(opt_, "hashdiff.add.unchanged_total", 1);
    return rocksdb::Status::OK();
  }
  if (!s.ok() && !s.IsNotFound()) return s;

  std::string pending;
  s = txn->Get(Table::kPending, id, &pending);
  bool had_pending = s.ok();
  if (had_pending && pending == hash) {
    EmitCounter(opt_, "hashdiff.add.unchanged_total", 1);
    return rocksdb::Status::OK();
  }
  if (!s.ok() && !s.IsNotFound()) return s;

  std::string encoded;
  s = EncodeValue(content, &encoded);
  if (!s.ok()) return s;

  if (had_pending) {
    s = ReleasePayload(txn, pending);
    if (!s.ok()) return s;
  }

  s = txn->Put(Table::kPending, id, hash);
  if (!s.ok()) return s;

  s = AcquirePayload(txn, hash, encoded);
  if (!s.ok()) return s;

  if (tracking) {
    s = txn->Put(Table::kConflicts, id, hash);
    if (!s.ok()) return s;
  }

  CountOnCommit(txn, opt_, "hashdiff.add.updated_total", 1);
  *updated = true;
  return rocksdb::Status::OK();
}

rocksdb::Status Differential::BeginWrite(std::unique_ptr<KvTransaction>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  return ns_->Begin(true, out);
}

rocksdb::Status Differential::AddTx(KvTransaction* txn, const Object& obj, bool* updated) {
  if (!txn) return rocksdb::Status::InvalidArgument("txn is null");
  if (!updated) return rocksdb::Status::InvalidArgument("updated is null");
  if (!txn->writable()) return rocksdb::Status::InvalidArgument("transaction is read-only");

  EmitCounter(opt_, "hashdiff.add.calls", 1);

  bool tracking = false;
  rocksdb::Status s = ReadTracking(txn, &tracking);
  if (!s.ok()) return s;
  return StageLocked(txn, obj, tracking, updated);
}

rocksdb::Status Differential::Add(const Object& obj, bool* updated) {
  if (!updated) return rocksdb::Status::InvalidArgument("updated is null");
  *updated = false;

  EmitCounter(opt_, "hashdiff.add.calls", 1);

  const uint64_t op_start_us = internal::NowMicros();
  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("hashdiff.Add");

  bool updated_final = false;
  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    const uint64_t dur_us = internal::NowMicros() - op_start_us;
    EmitHistogram(opt_, "hashdiff.add.latency_us", dur_us);
    if (span) {
      SpanAttr(span.get(), "latency_us", dur_us);
      SpanAttr(span.get(), "updated", static_cast<uint64_t>(updated_final ? 1 : 0));
      SpanAttr(span.get(), "status", StatusKind(st));
      span->End(st);
    }
    return st;
  };

  std::unique_ptr<KvTransaction> txn;
  rocksdb::Status s = ns_->Begin(true, &txn);
  if (!s.ok()) return finish(s);

  bool tracking = false;
  s = ReadTracking(txn.get(), &tracking);
  if (s.ok()) s = StageLocked(txn.get(), obj, tracking, &updated_final);
  if (!s.ok()) {
    Abort(txn.get(), "add");
    updated_final = false;
    return finish(s);
  }

  const uint64_t commit_start_us = internal::NowMicros();
  s = txn->Commit();
  EmitHistogram(opt_, "hashdiff.add.commit_us", internal::NowMicros() - commit_start_us);
  if (!s.ok()) {
    updated_final = false;
    return finish(s);
  }

  *updated = updated_final;
  return finish(s);
}

rocksdb::Status Differential::AddAll(const std::vector<std::shared_ptr<const Object>>& objs,
                                     uint64_t* staged) {
  if (!staged) return rocksdb::Status::InvalidArgument("staged is null");
  *staged = 0;

  std::unique_ptr<KvTransaction> txn;
  rocksdb::Status s = ns_->Begin(true, &txn);
  if (!s.ok()) return s;

  bool tracking = false;
  s = ReadTracking(txn.get(), &tracking);
  if (!s.ok()) {
    Abort(txn.get(), "add all");
    return s;
  }

  uint64_t count = 0;
  for (const auto& obj : objs) {
    if (!obj) {
      Abort(txn.get(), "add all");
      return rocksdb::Status::InvalidArgument("null object in batch");
    }
    EmitCounter(opt_, "hashdiff.add.calls", 1);
    bool updated = false;
    s = StageLocked(txn.get(), *obj, tracking, &updated);
    if (!s.ok()) {
      Abort(txn.get(), "add all");
      return s;
    }
    if (updated) ++count;
  }

  s = txn->Commit();
  if (!s.ok()) return s;

  *staged = count;
  return s;
}

rocksdb::Status Differential::AddStream(ObjectQueue* queue,
                                        const CancellationToken* cancel,
                                        uint64_t* staged) {
  if (!queue) return rocksdb::Status::InvalidArgument("queue is null");
  if (!staged) return rocksdb::Status::InvalidArgument("staged is null");
  *staged = 0;

  EmitCounter(opt_, "hashdiff.stream.calls", 1);

  const uint64_t op_start_us = internal::NowMicros();
  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("hashdiff.AddStream");

  uint64_t consumed = 0;
  uint64_t count = 0;
  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    queue->Close();
    const uint64_t dur_us = internal::NowMicros() - op_start_us;
    EmitHistogram(opt_, "hashdiff.stream.latency_us", dur_us);
    if (span) {
      SpanAttr(span.get(), "latency_us", dur_us);
      SpanAttr(span.get(), "consumed", consumed);
      SpanAttr(span.get(), "staged", st.ok() ? count : 0);
      SpanAttr(span.get(), "status", StatusKind(st));
      span->End(st);
    }
    return st;
  };

  std::unique_ptr<KvTransaction> txn;
  rocksdb::Status s = ns_->Begin(true, &txn);
  if (!s.ok()) return finish(s);

  bool tracking = false;
  s = ReadTracking(txn.get(), &tracking);
  if (!s.ok()) {
    Abort(txn.get(), "stream");
    return finish(s);
  }

  // Discard everything staged by this run.
  auto roll_back = [&](const rocksdb::Status& cause) -> rocksdb::Status {
    Abort(txn.get(), "stream");
    EmitCounter(opt_, "hashdiff.stream.rolled_back_total", 1);
    SpanEvent(span.get(), "stream.rollback");
    rocksdb::Log(rocksdb::InfoLogLevel::WARN_LEVEL, opt_.info_log,
                 "hashdiff: %s: stream rolled back after %llu objects: %s",
                 Printable(Name()).c_str(), static_cast<unsigned long long>(consumed),
                 cause.ToString().c_str());
    return finish(cause);
  };

  for (;;) {
    std::shared_ptr<const Object> obj;
    ObjectQueue::PopResult r = queue->Pop(&obj, cancel);
    if (r == ObjectQueue::PopResult::kEnd) break;
    if (r == ObjectQueue::PopResult::kCancelled) return roll_back(Cancelled());

    ++consumed;
    EmitCounter(opt_, "hashdiff.add.calls", 1);
    bool updated = false;
    s = StageLocked(txn.get(), *obj, tracking, &updated);
    if (!s.ok()) return roll_back(s);
    if (updated) ++count;
  }

  CountOnCommit(txn.get(), opt_, "hashdiff.stream.staged_total", count);

  const uint64_t commit_start_us = internal::NowMicros();
  s = txn->Commit();
  EmitHistogram(opt_, "hashdiff.stream.commit_us", internal::NowMicros() - commit_start_us);
  if (!s.ok()) return finish(s);

  *staged = count;
  return finish(s);
}

rocksdb::Status Differential::EachN(const ApplyFunc& f,
                                    int n,
                                    ApplyResult* result,
                                    const CancellationToken* cancel) {
  if (!f) return rocksdb::Status::InvalidArgument("apply func is empty");

  ApplyResult local;
  ApplyResult* res = result ? result : &local;
  *res = ApplyResult{};

  EmitCounter(opt_, "hashdiff.apply.calls", 1);

  const uint64_t op_start_us = internal::NowMicros();
  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("hashdiff.Each");
  SpanAttr(span.get(), "limit", static_cast<uint64_t>(n > 0 ? n : 0));

  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    const uint64_t dur_us = internal::NowMicros() - op_start_us;
    EmitHistogram(opt_, "hashdiff.apply.latency_us", dur_us);
    if (span) {
      SpanAttr(span.get(), "latency_us", dur_us);
      SpanAttr(span.get(), "promoted", res->promoted);
      SpanAttr(span.get(), "failed", static_cast<uint64_t>(res->failures.size()));
      SpanAttr(span.get(), "cancelled", static_cast<uint64_t>(res->cancelled ? 1 : 0));
      SpanAttr(span.get(), "status", StatusKind(st));
      span->End(st);
    }
    return st;
  };

  // Aborts the whole run: nothing promoted survives.
  auto abort_run = [&](const rocksdb::Status& st) -> rocksdb::Status {
    res->promoted = 0;
    return finish(st);
  };

  std::unique_ptr<KvTransaction> txn;
  rocksdb::Status s = ns_->Begin(true, &txn);
  if (!s.ok()) return finish(s);

  {
    // Snapshot of the pending table; promotions below do not disturb it.
    auto cur = txn->NewCursor(Table::kPending);
    for (cur->SeekToFirst(); cur->Valid(); cur->Next()) {
      if (n > 0 && res->promoted >= static_cast<uint64_t>(n)) break;

      if (cancel && cancel->IsCancelled()) {
        res->cancelled = true;
        SpanEvent(span.get(), "apply.cancelled");
        break;
      }

      const std::string id(cur->key());
      const std::string hash(cur->value());

      std::string payload;
      s = LoadPayload(txn.get(), hash, &payload);
      if (s.IsNotFound()) {
        EmitCounter(opt_, "hashdiff.apply.corruption_total", 1);
        rocksdb::Log(rocksdb::InfoLogLevel::ERROR_LEVEL, opt_.info_log,
                     "hashdiff: %s: missing payload %s for pending id %s",
                     Printable(Name()).c_str(), Printable(hash).c_str(), Printable(id).c_str());
        s = rocksdb::Status::Corruption("missing payload for pending hash", Printable(id));
      }
      if (!s.ok()) {
        cur.reset();
        Abort(txn.get(), "apply");
        return abort_run(s);
      }

      rocksdb::Status fs = f(id, Decoder(payload));
      if (!fs.ok()) {
        res->failures.push_back(ApplyFailure{id, fs});
        continue;
      }

      s = txn->Put(Table::kCommitted, id, hash);
      if (s.ok()) s = txn->Delete(Table::kPending, id);
      if (s.ok()) s = ReleasePayload(txn.get(), hash);
      if (!s.ok()) {
        cur.reset();
        Abort(txn.get(), "apply");
        return abort_run(s);
      }
      ++res->promoted;
    }

    if (!cur->status().ok()) {
      s = cur->status();
      cur.reset();
      Abort(txn.get(), "apply");
      return abort_run(s);
    }
  }

  CountOnCommit(txn.get(), opt_, "hashdiff.apply.promoted_total", res->promoted);

  const uint64_t commit_start_us = internal::NowMicros();
  s = txn->Commit();
  EmitHistogram(opt_, "hashdiff.apply.commit_us", internal::NowMicros() - commit_start_us);
  if (!s.ok()) {
    rocksdb::Log(rocksdb::InfoLogLevel::ERROR_LEVEL, opt_.info_log,
                 "hashdiff: %s: apply commit failed, %llu promotions discarded: %s",
                 Printable(Name()).c_str(), static_cast<unsigned long long>(res->promoted),
                 s.ToString().c_str());
    return abort_run(s);
  }

  EmitCounter(opt_, "hashdiff.apply.failed_total", res->failures.size());
  if (res->cancelled) EmitCounter(opt_, "hashdiff.apply.cancelled_total", 1);

  if (!res->ok()) {
    rocksdb::Log(rocksdb::InfoLogLevel::WARN_LEVEL, opt_.info_log,
                 "hashdiff: %s: apply promoted %llu, failed %llu%s",
                 Printable(Name()).c_str(), static_cast<unsigned long long>(res->promoted),
                 static_cast<unsigned long long>(res->failures.size()),
                 res->cancelled ? ", cancelled" : "");
  } else if (res->promoted > 0) {
    rocksdb::Log(rocksdb::InfoLogLevel::INFO_LEVEL, opt_.info_log,
                 "hashdiff: %s: apply promoted %llu",
                 Printable(Name()).c_str(), static_cast<unsigned long long>(res->promoted));
  }

  return finish(res->ToStatus());
}

rocksdb::Status Differential::Changed(std::string_view id,
                                      const Json::Value& candidate,
                                      bool* changed) const {
  if (!changed) return rocksdb::Status::InvalidArgument("changed is null");

  ContentHash h{};
  rocksdb::Status s = hasher_->Hash(candidate, &h);
  if (!s.ok()) return s;

  std::unique_ptr<KvTransaction> txn;
  s = ns_->Begin(false, &txn);
  if (!s.ok()) return s;

  std::string committed;
  s = txn->Get(Table::kCommitted, id, &committed);
  if (!s.ok() && !s.IsNotFound()) return s;

  *changed = s.IsNotFound() || committed != HashToBytes(h);
  return txn->Commit();
}

rocksdb::Status Differential::CountTable(Table t, uint64_t* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::unique_ptr<KvTransaction> txn;
  rocksdb::Status s = ns_->Begin(false, &txn);
  if (!s.ok()) return s;

  uint64_t count = 0;
  {
    auto cur = txn->NewCursor(t);
    for (cur->SeekToFirst(); cur->Valid(); cur->Next()) ++count;
    if (!cur->status().ok()) return cur->status();
  }

  *out = count;
  return txn->Commit();
}

rocksdb::Status Differential::CountTracking(uint64_t* out) const {
  return CountTable(Table::kCommitted, out);
}

rocksdb::Status Differential::CountChanges(uint64_t* out) const {
  rocksdb::Status s = CountTable(Table::kPending, out);
  if (s.ok()) internal::EmitGauge(opt_, "hashdiff.pending", static_cast<double>(*out));
  return s;
}

rocksdb::Status Differential::ListChanges(std::vector<std::string>* ids, uint64_t limit) const {
  if (!ids) return rocksdb::Status::InvalidArgument("ids is null");

  std::unique_ptr<KvTransaction> txn;
  rocksdb::Status s = ns_->Begin(false, &txn);
  if (!s.ok()) return s;

  std::vector<std::string> out;
  {
    auto cur = txn->NewCursor(Table::kPending);
    for (cur->SeekToFirst(); cur->Valid(); cur->Next()) {
      if (limit > 0 && out.size() >= limit) break;
      out.emplace_back(cur->key());
    }
    if (!cur->status().ok()) return cur->status();
  }

  *ids = std::move(out);
  return txn->Commit();
}

rocksdb::Status Differential::SetConflictTracking(bool enabled) {
  std::unique_ptr<KvTransaction> txn;
  rocksdb::Status s = ns_->Begin(true, &txn);
  if (!s.ok()) return s;

  uint64_t cleared = 0;
  {
    auto cur = txn->NewCursor(Table::kConflicts);
    for (cur->SeekToFirst(); cur->Valid(); cur->Next()) {
      s = txn->Delete(Table::kConflicts, cur->key());
      if (!s.ok()) break;
      ++cleared;
    }
    if (s.ok()) s = cur->status();
  }
  if (s.ok()) s = txn->Put(Table::kMeta, kConflictTrackingKey, enabled ? "1" : "0");
  if (!s.ok()) {
    Abort(txn.get(), "conflict tracking");
    return s;
  }

  s = txn->Commit();
  if (!s.ok()) return s;

  rocksdb::Log(rocksdb::InfoLogLevel::INFO_LEVEL, opt_.info_log,
               "hashdiff: %s: conflict tracking %s, cleared %llu markers",
               Printable(Name()).c_str(), enabled ? "enabled" : "disabled",
               static_cast<unsigned long long>(cleared));
  return s;
}

rocksdb::Status Differential::EnableConflictTracking() { return SetConflictTracking(true); }

rocksdb::Status Differential::DisableConflictTracking() { return SetConflictTracking(false); }

rocksdb::Status Differential::IsTrackingConflicts(bool* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::unique_ptr<KvTransaction> txn;
  rocksdb::Status s = ns_->Begin(false, &txn);
  if (!s.ok()) return s;

  s = ReadTracking(txn.get(), out);
  if (!s.ok()) return s;
  return txn->Commit();
}

rocksdb::Status Differential::ViewUserData(
    const std::function<rocksdb::Status(const UserData&)>& fn) const {
  if (!fn) return rocksdb::Status::InvalidArgument("fn is empty");

  std::unique_ptr<KvTransaction> txn;
  rocksdb::Status s = ns_->Begin(false, &txn);
  if (!s.ok()) return s;

  s = fn(UserData(txn.get()));
  if (!s.ok()) return s;
  return txn->Commit();
}

rocksdb::Status Differential::UpdateUserData(
    const std::function<rocksdb::Status(UserData*)>& fn) {
  if (!fn) return rocksdb::Status::InvalidArgument("fn is empty");

  std::unique_ptr<KvTransaction> txn;
  rocksdb::Status s = ns_->Begin(true, &txn);
  if (!s.ok()) return s;

  UserData data(txn.get());
  s = fn(&data);
  if (!s.ok()) {
    Abort(txn.get(), "user data");
    return s;
  }
  return txn->Commit();
}

}  // namespace hashdiff
