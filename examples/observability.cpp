#include <hashdiff/db.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace {

// Prints every metric in StatsD line format and keeps running totals.
class StatsdLineSink final : public hashdiff::MetricsSink {
 public:
  explicit StatsdLineSink(std::ostream& out) : out_(out) {}

  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lk(mu_);
    totals_[std::string(name)] += delta;
    out_ << name << ":" << delta << "|c\n";
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lk(mu_);
    out_ << name << ":" << value << "|ms\n";
  }

  void Gauge(std::string_view name, double value) override {
    std::lock_guard<std::mutex> lk(mu_);
    out_ << name << ":" << value << "|g\n";
  }

  uint64_t Total(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = totals_.find(name);
    return it == totals_.end() ? 0 : it->second;
  }

 private:
  std::ostream& out_;
  mutable std::mutex mu_;
  std::map<std::string, uint64_t> totals_;
};

// Writes one logfmt line per finished span.
class LogfmtSpan final : public hashdiff::TraceSpan {
 public:
  LogfmtSpan(std::ostream& out, std::string_view name)
      : out_(out), line_("span=" + std::string(name)), begin_(std::chrono::steady_clock::now()) {}

  void SetAttribute(std::string_view key, uint64_t value) override {
    line_ += " " + std::string(key) + "=" + std::to_string(value);
  }

  void SetAttribute(std::string_view key, std::string_view value) override {
    line_ += " " + std::string(key) + "=\"" + std::string(value) + "\"";
  }

  void AddEvent(std::string_view name) override {
    ++events_;
    line_ += " event=" + std::string(name);
  }

  void End(const rocksdb::Status& status) override {
    auto elapsed = std::chrono::steady_clock::now() - begin_;
    out_ << line_ << " events=" << events_
         << " ok=" << (status.ok() ? "true" : "false")
         << " elapsed_us="
         << std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() << "\n";
  }

 private:
  std::ostream& out_;
  std::string line_;
  int events_ = 0;
  std::chrono::steady_clock::time_point begin_;
};

class LogfmtTracer final : public hashdiff::Tracer {
 public:
  explicit LogfmtTracer(std::ostream& out) : out_(out) {}

  std::unique_ptr<hashdiff::TraceSpan> StartSpan(std::string_view name) override {
    return std::make_unique<LogfmtSpan>(out_, name);
  }

 private:
  std::ostream& out_;
};

class Item final : public hashdiff::Object {
 public:
  Item(std::string id, std::string body) : id_(std::move(id)), body_(std::move(body)) {}

  std::string Id() const override { return id_; }
  Json::Value Content() const override { return body_; }

 private:
  std::string id_;
  std::string body_;
};

bool Check(const rocksdb::Status& s, const char* what) {
  if (!s.ok()) std::cerr << what << ": " << s.ToString() << "\n";
  return s.ok();
}

}  // namespace

int main() {
  auto metrics = std::make_shared<StatsdLineSink>(std::cout);

  hashdiff::Options opt;
  opt.metrics = metrics;
  opt.tracer = std::make_shared<LogfmtTracer>(std::cout);

  std::unique_ptr<hashdiff::DB> db;
  if (!Check(hashdiff::DB::Open("./hashdiff_db", &db, opt), "Open")) return 1;

  std::unique_ptr<hashdiff::Differential> items;
  if (!Check(db->OpenDifferential("items", &items), "OpenDifferential")) return 1;

  bool updated = false;
  if (!Check(items->Add(Item("k1", "HELLO"), &updated), "Add k1")) return 1;
  if (!Check(items->Add(Item("k2", "HELLO"), &updated), "Add k2")) return 1;  // shares k1's payload
  if (!Check(items->Add(Item("k2", "HELLO"), &updated), "Add k2 again")) return 1;

  uint64_t pending = 0;
  if (!Check(items->CountChanges(&pending), "CountChanges")) return 1;

  // k2 fails downstream and stays pending; the run reports it as incomplete.
  hashdiff::ApplyResult result;
  rocksdb::Status s = items->Each(
      [](std::string_view id, const hashdiff::Decoder&) {
        return id == "k2" ? rocksdb::Status::Busy("downstream busy") : rocksdb::Status::OK();
      },
      &result);
  std::cout << "first run: " << s.ToString() << "\n";

  if (!Check(items->Each([](std::string_view, const hashdiff::Decoder&) {
                return rocksdb::Status::OK();
              }),
             "Each retry")) {
    return 1;
  }

  std::cout << "total promoted: " << metrics->Total("hashdiff.apply.promoted_total") << "\n";
  return 0;
}
