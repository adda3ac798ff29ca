#include <hashdiff/db.hpp>

#include <iostream>

namespace {

class Product final : public hashdiff::Object {
 public:
  Product(std::string sku, std::string title, int64_t price_cents)
      : sku_(std::move(sku)), title_(std::move(title)), price_cents_(price_cents) {}

  std::string Id() const override { return sku_; }

  Json::Value Content() const override {
    Json::Value v;
    v["title"] = title_;
    v["price_cents"] = static_cast<Json::Int64>(price_cents_);
    return v;
  }

 private:
  std::string sku_;
  std::string title_;
  int64_t price_cents_;
};

// Stand-in for a downstream system (search index, warehouse, ...).
rocksdb::Status Export(std::string_view sku, const hashdiff::Decoder& data) {
  Json::Value v;
  rocksdb::Status s = data.Decode(&v);
  if (!s.ok()) return s;
  std::cout << "export " << sku << " title=" << v["title"].asString()
            << " price=" << v["price_cents"].asInt64() << "\n";
  return rocksdb::Status::OK();
}

}  // namespace

int main() {
  std::unique_ptr<hashdiff::DB> db;
  auto s = hashdiff::DB::Open("./hashdiff_db", &db);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  std::unique_ptr<hashdiff::Differential> products;
  s = db->OpenDifferential("products", &products);
  if (!s.ok()) {
    std::cerr << "OpenDifferential failed: " << s.ToString() << "\n";
    return 1;
  }

  bool updated = false;
  s = products->Add(Product("sku-1", "Anvil", 4999), &updated);
  if (!s.ok()) std::cerr << "Add sku-1 failed: " << s.ToString() << "\n";

  s = products->Add(Product("sku-2", "Bolt", 25), &updated);
  if (!s.ok()) std::cerr << "Add sku-2 failed: " << s.ToString() << "\n";

  s = products->Each(Export);
  if (!s.ok()) std::cerr << "Each failed: " << s.ToString() << "\n";

  // Unchanged content is not staged again.
  s = products->Add(Product("sku-1", "Anvil", 4999), &updated);
  if (s.ok()) std::cout << "sku-1 re-add updated=" << updated << "\n";

  // A price change is.
  s = products->Add(Product("sku-2", "Bolt", 30), &updated);
  if (s.ok()) std::cout << "sku-2 re-add updated=" << updated << "\n";

  uint64_t pending = 0;
  s = products->CountChanges(&pending);
  if (s.ok()) std::cout << "pending=" << pending << "\n";

  s = products->Each(Export);
  if (!s.ok()) std::cerr << "Each failed: " << s.ToString() << "\n";

  std::cout << "done\n";
  return 0;
}
