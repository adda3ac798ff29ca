// Performance benchmarks for hashdiff
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: CPU-bound operations (SHA-256, encoding, hashing)
//    - No I/O, no database operations
// 2. MACROBENCHMARKS: Differential operations (Add, Each, Changed)
//    - Full RocksDB transactions with I/O
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use state.PauseTiming()/ResumeTiming() for necessary setup

#include <benchmark/benchmark.h>

#include <hashdiff/codec.hpp>
#include <hashdiff/db.hpp>
#include <hashdiff/hasher.hpp>
#include <hashdiff/internal.hpp>
#include <hashdiff/object.hpp>

#include <array>
#include <cstdio>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

class Record final : public hashdiff::Object {
 public:
  Record(std::string id, Json::Value content)
      : id_(std::move(id)), content_(std::move(content)) {}

  std::string Id() const override { return id_; }
  Json::Value Content() const override { return content_; }

 private:
  std::string id_;
  Json::Value content_;
};

// A flat record of `fields` string fields plus a revision number.
Json::Value MakeContent(size_t fields, int64_t rev) {
  Json::Value v(Json::objectValue);
  for (size_t i = 0; i < fields; ++i) {
    v["field_" + std::to_string(i)] = "value " + std::to_string(i);
  }
  v["rev"] = static_cast<Json::Int64>(rev);
  return v;
}

std::vector<Record> MakeRecords(size_t n, int64_t rev) {
  std::vector<Record> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    char id[32];
    snprintf(id, sizeof(id), "rec%08zu", i);
    out.emplace_back(id, MakeContent(8, rev));
  }
  return out;
}

// =============================================================================
// Benchmark Fixture
// =============================================================================

class DifferentialBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State& state) override {
    (void)state;
    std::error_code ec;
    std::filesystem::path temp_base = std::filesystem::temp_directory_path(ec);
    if (ec || temp_base.empty()) temp_base = ".";

    test_dir_ = temp_base / ("hashdiff_bench_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_, ec);

    hashdiff::Options opt;
    // Benchmarks measure the engine, not fsync.
    opt.sync_commits = false;
    rocksdb::Status s = hashdiff::DB::Open((test_dir_ / "bench_db").string(), &db_, opt);
    if (s.ok()) s = db_->OpenDifferential("bench", &diff_);
    open_status_ = s;
  }

  void TearDown(const benchmark::State& state) override {
    (void)state;
    diff_.reset();
    db_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  bool CheckOpen(benchmark::State& state) {
    if (open_status_.ok()) return true;
    state.SkipWithError(open_status_.ToString().c_str());
    return false;
  }

  void StageAll(const std::vector<Record>& records) {
    bool updated = false;
    for (const auto& r : records) {
      rocksdb::Status s = diff_->Add(r, &updated);
      benchmark::DoNotOptimize(s);
    }
  }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  std::filesystem::path test_dir_;
  std::unique_ptr<hashdiff::DB> db_;
  std::unique_ptr<hashdiff::Differential> diff_;
  rocksdb::Status open_status_;
};

// =============================================================================
// PART 1: MICROBENCHMARKS - CPU-bound operations without I/O
// =============================================================================

static void BM_SHA256(benchmark::State& state) {
  std::string data(state.range(0), 'x');
  std::array<uint8_t, hashdiff::internal::Sha256::kDigestBytes> digest{};
  for (auto _ : state) {
    bool ok = hashdiff::internal::Sha256::Digest(data, &digest);
    benchmark::DoNotOptimize(ok);
    benchmark::DoNotOptimize(digest);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SHA256)->Range(64, 1 << 16);

static void BM_EncodeValue(benchmark::State& state) {
  Json::Value v = MakeContent(state.range(0), 1);
  std::string out;
  for (auto _ : state) {
    rocksdb::Status s = hashdiff::EncodeValue(v, &out);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BM_EncodeValue)->Range(4, 256);

static void BM_DecodeValue(benchmark::State& state) {
  std::string enc;
  if (!hashdiff::EncodeValue(MakeContent(state.range(0), 1), &enc).ok()) {
    state.SkipWithError("encode failed");
    return;
  }
  Json::Value out;
  for (auto _ : state) {
    rocksdb::Status s = hashdiff::DecodeValue(enc, &out);
    benchmark::DoNotOptimize(s);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(enc.size()));
}
BENCHMARK(BM_DecodeValue)->Range(4, 256);

static void BM_StructuralHash(benchmark::State& state) {
  Json::Value v = MakeContent(state.range(0), 1);
  hashdiff::StructuralHasher hasher;
  hashdiff::ContentHash h{};
  for (auto _ : state) {
    rocksdb::Status s = hasher.Hash(v, &h);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(h);
  }
}
BENCHMARK(BM_StructuralHash)->Range(4, 256);

// =============================================================================
// PART 2: MACROBENCHMARKS - Differential operations with I/O
// =============================================================================

BENCHMARK_DEFINE_F(DifferentialBenchmark, Add_New)(benchmark::State& state) {
  if (!CheckOpen(state)) return;
  auto records = MakeRecords(state.range(0), 1);

  for (auto _ : state) {
    state.PauseTiming();
    std::unique_ptr<hashdiff::Differential> fresh;
    rocksdb::Status s = db_->DeleteDifferential("bench");
    if (s.ok()) s = db_->OpenDifferential("bench", &fresh);
    if (!s.ok()) {
      state.SkipWithError(s.ToString().c_str());
      break;
    }
    diff_ = std::move(fresh);
    state.ResumeTiming();

    StageAll(records);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(DifferentialBenchmark, Add_New)->Arg(100)->Arg(1000);

BENCHMARK_DEFINE_F(DifferentialBenchmark, Add_Unchanged)(benchmark::State& state) {
  if (!CheckOpen(state)) return;
  auto records = MakeRecords(state.range(0), 1);
  StageAll(records);

  for (auto _ : state) {
    StageAll(records);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(DifferentialBenchmark, Add_Unchanged)->Arg(100)->Arg(1000);

BENCHMARK_DEFINE_F(DifferentialBenchmark, AddAll_Batch)(benchmark::State& state) {
  if (!CheckOpen(state)) return;
  std::vector<std::shared_ptr<const hashdiff::Object>> batch;
  for (auto& r : MakeRecords(state.range(0), 1)) {
    batch.push_back(std::make_shared<Record>(std::move(r)));
  }

  int64_t rev = 1;
  for (auto _ : state) {
    state.PauseTiming();
    for (auto& obj : batch) {
      obj = std::make_shared<Record>(obj->Id(), MakeContent(8, rev));
    }
    ++rev;
    state.ResumeTiming();

    uint64_t staged = 0;
    rocksdb::Status s = diff_->AddAll(batch, &staged);
    benchmark::DoNotOptimize(s);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(DifferentialBenchmark, AddAll_Batch)->Arg(100)->Arg(1000);

BENCHMARK_DEFINE_F(DifferentialBenchmark, Each_Promote)(benchmark::State& state) {
  if (!CheckOpen(state)) return;
  const size_t n = state.range(0);

  int64_t rev = 1;
  for (auto _ : state) {
    state.PauseTiming();
    StageAll(MakeRecords(n, rev++));
    state.ResumeTiming();

    rocksdb::Status s = diff_->Each(
        [](std::string_view, const hashdiff::Decoder&) { return rocksdb::Status::OK(); });
    benchmark::DoNotOptimize(s);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(DifferentialBenchmark, Each_Promote)->Arg(100)->Arg(1000);

BENCHMARK_DEFINE_F(DifferentialBenchmark, Changed)(benchmark::State& state) {
  if (!CheckOpen(state)) return;
  auto records = MakeRecords(1000, 1);
  StageAll(records);
  rocksdb::Status s = diff_->Each(
      [](std::string_view, const hashdiff::Decoder&) { return rocksdb::Status::OK(); });
  if (!s.ok()) {
    state.SkipWithError(s.ToString().c_str());
    return;
  }

  size_t i = 0;
  bool changed = false;
  for (auto _ : state) {
    const Record& r = records[i++ % records.size()];
    s = diff_->Changed(r.Id(), r.Content(), &changed);
    benchmark::DoNotOptimize(changed);
  }
}
BENCHMARK_REGISTER_F(DifferentialBenchmark, Changed);

}  // namespace

BENCHMARK_MAIN();
