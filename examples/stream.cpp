#include <hashdiff/config.hpp>
#include <hashdiff/db.hpp>
#include <hashdiff/object_queue.hpp>
#include <hashdiff/shutdown.hpp>
#include <hashdiff/status.hpp>

#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

class Line final : public hashdiff::Object {
 public:
  Line(std::string id, std::string text) : id_(std::move(id)), text_(std::move(text)) {}

  std::string Id() const override { return id_; }
  Json::Value Content() const override { return text_; }

 private:
  std::string id_;
  std::string text_;
};

}  // namespace

// Usage: stream [config.yaml]
// Reads "id<TAB>text" lines from stdin, stages them in one run, then applies
// the changes in batches of 100. Ctrl-C cancels the run.
int main(int argc, char** argv) {
  hashdiff::Config config;
  config.db_path = "./hashdiff_db";
  try {
    if (argc > 1) config = hashdiff::Config::LoadFromFile(argv[1]);
    config.Validate();
  } catch (const std::runtime_error& e) {
    std::cerr << "Config error: " << e.what() << "\n";
    return 1;
  }

  std::unique_ptr<hashdiff::DB> db;
  auto s = hashdiff::DB::Open(config.db_path, &db, config.store);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  auto& shutdown = hashdiff::GlobalShutdownHandler();
  shutdown.RegisterDB(db.get());
  if (!shutdown.InstallSignalHandlers()) {
    std::cerr << "warning: signal handlers not installed\n";
  }

  std::unique_ptr<hashdiff::Differential> lines;
  s = db->OpenDifferential("lines", &lines);
  if (!s.ok()) {
    std::cerr << "OpenDifferential failed: " << s.ToString() << "\n";
    return 1;
  }

  auto queue = std::make_shared<hashdiff::ObjectQueue>(256);
  std::thread producer([queue] {
    std::string line;
    while (std::getline(std::cin, line)) {
      size_t tab = line.find('\t');
      if (tab == std::string::npos) continue;
      if (!queue->Push(std::make_shared<Line>(line.substr(0, tab), line.substr(tab + 1)))) return;
    }
    queue->Push(nullptr);
  });

  uint64_t staged = 0;
  s = lines->AddStream(queue.get(), &shutdown.token(), &staged);
  // On failure the producer may still be blocked reading stdin.
  if (s.ok()) {
    producer.join();
  } else {
    producer.detach();
  }
  if (hashdiff::IsCancelled(s)) {
    std::cerr << "cancelled, nothing staged\n";
    return 1;
  }
  if (!s.ok()) {
    std::cerr << "AddStream failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "staged " << staged << "\n";

  uint64_t pending = 0;
  while (lines->CountChanges(&pending).ok() && pending > 0) {
    hashdiff::ApplyResult result;
    s = lines->EachN(
        [](std::string_view id, const hashdiff::Decoder&) {
          std::cout << "changed " << id << "\n";
          return rocksdb::Status::OK();
        },
        100, &result, &shutdown.token());
    if (!s.ok()) {
      std::cerr << "EachN: " << s.ToString() << "\n";
      break;
    }
  }

  shutdown.Shutdown();
  return 0;
}
