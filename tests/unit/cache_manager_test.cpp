#include <catch2/catch_all.hpp>
#include <lumen/cache/cache_manager.hpp>
#include <lumen/cache/fingerprint.hpp>
#include <lumen/store/store_file.hpp>
#include <tests/support/test_helpers.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace lumen;
using lumen::core::error_code;
namespace fs = std::filesystem;

namespace {

CacheConfig config_for(const test_support::TempDir& dir) {
  CacheConfig cfg;
  cfg.cache_dir = dir / "cache";
  cfg.sync = false;
  return cfg;
}

// Records for every pending key, as the orchestrator would produce them.
std::vector<EmbeddingRecord> records_for(const cache::PendingSet& pending, std::uint32_t seed = 0) {
  std::vector<EmbeddingRecord> out;
  for (const auto& k : pending.keys) {
    auto r = test_support::make_record(k.path, seed++, k.model);
    r.key = k;
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace

TEST_CASE("fresh cache is empty and has no store", "[cache][manager]") {
  test_support::TempDir dir("cm_empty");
  cache::CacheManager cm(config_for(dir));
  auto snap = cm.load(kDefaultModel);
  REQUIRE(snap.has_value());
  REQUIRE((*snap)->empty());
  REQUIRE(cm.cached_models().empty());
  auto st = cm.stats(kDefaultModel);
  REQUIRE(st.has_value());
  REQUIRE(st->records == 0);
  REQUIRE(st->store_bytes == 0);
}

TEST_CASE("commit then load returns every record once", "[cache][manager]") {
  test_support::TempDir dir("cm_commit");
  std::vector<EmbeddingRecord> recs{test_support::make_record("/p/a.jpg", 1),
                                    test_support::make_record("/p/b.jpg", 2),
                                    test_support::make_record("/p/c.jpg", 3)};
  {
    cache::CacheManager cm(config_for(dir));
    REQUIRE(cm.commit(recs).has_value());
    REQUIRE(cm.contains("/p/b.jpg", kDefaultModel));
    REQUIRE(cm.cached_models() == std::vector<ModelId>{kDefaultModel});
  }
  // A new manager reads what the first one persisted.
  cache::CacheManager cm(config_for(dir));
  auto snap = cm.load(kDefaultModel);
  REQUIRE(snap.has_value());
  REQUIRE((*snap)->size() == 3);
  for (const auto& r : recs) {
    const auto* got = (*snap)->find(r.key.path);
    REQUIRE(got != nullptr);
    REQUIRE(got->key == r.key);
    REQUIRE(got->vector == r.vector);
    REQUIRE(got->created_at == r.created_at);
  }
}

TEST_CASE("commit replaces by path and keeps models apart", "[cache][manager]") {
  test_support::TempDir dir("cm_replace");
  cache::CacheManager cm(config_for(dir));
  auto v1 = test_support::make_record("/p/a.jpg", 1);
  auto v2 = test_support::make_record("/p/a.jpg", 2);
  auto large = test_support::make_record("/p/a.jpg", 3, ModelId::clip_vit_l14);

  REQUIRE(cm.commit(std::vector<EmbeddingRecord>{v1}).has_value());
  REQUIRE(cm.commit(std::vector<EmbeddingRecord>{v2, large}).has_value());

  auto base = cm.load(kDefaultModel);
  REQUIRE((*base)->size() == 1);
  REQUIRE((*base)->find("/p/a.jpg")->vector == v2.vector);

  auto big = cm.load(ModelId::clip_vit_l14);
  REQUIRE((*big)->size() == 1);
  REQUIRE((*big)->dim() == 768);
  REQUIRE(cm.cached_models().size() == 2);
}

TEST_CASE("commit normalizes vectors and validates records", "[cache][manager]") {
  test_support::TempDir dir("cm_validate");
  cache::CacheManager cm(config_for(dir));

  auto scaled = test_support::make_record("/p/a.jpg", 1);
  for (auto& x : scaled.vector) x *= 3.0f;
  REQUIRE(cm.commit(std::vector<EmbeddingRecord>{scaled}).has_value());
  const auto* stored = (*cm.load(kDefaultModel))->find("/p/a.jpg");
  double norm = 0.0;
  for (float x : stored->vector) norm += static_cast<double>(x) * x;
  REQUIRE(norm == Catch::Approx(1.0).margin(1e-5));

  auto wrong_dim = test_support::make_record("/p/b.jpg", 2);
  wrong_dim.vector.resize(10);
  auto relative = test_support::make_record("p/c.jpg", 3);
  auto zero = test_support::make_record("/p/d.jpg", 4);
  std::fill(zero.vector.begin(), zero.vector.end(), 0.0f);
  auto bad_model = test_support::make_record("/p/e.jpg", 5);
  bad_model.key.model = static_cast<ModelId>(99);

  REQUIRE(cm.commit(std::vector<EmbeddingRecord>{wrong_dim}).error().code == error_code::invalid_argument);
  REQUIRE(cm.commit(std::vector<EmbeddingRecord>{relative}).error().code == error_code::invalid_argument);
  REQUIRE(cm.commit(std::vector<EmbeddingRecord>{zero}).error().code == error_code::invalid_argument);
  REQUIRE(cm.commit(std::vector<EmbeddingRecord>{bad_model}).error().code == error_code::unsupported);

  // A bad record rejects the whole call.
  auto good = test_support::make_record("/p/f.jpg", 6);
  REQUIRE_FALSE(cm.commit(std::vector<EmbeddingRecord>{good, wrong_dim}).has_value());
  REQUIRE_FALSE(cm.contains("/p/f.jpg", kDefaultModel));
}

TEST_CASE("recommitting identical records does not rewrite the store", "[cache][manager]") {
  test_support::TempDir dir("cm_noop");
  cache::CacheManager cm(config_for(dir));
  std::vector<EmbeddingRecord> recs{test_support::make_record("/p/a.jpg", 1)};
  REQUIRE(cm.commit(recs).has_value());
  const auto file = cm.store_file(kDefaultModel);
  const auto old_time = fs::last_write_time(file) - std::chrono::seconds(30);
  fs::last_write_time(file, old_time);

  REQUIRE(cm.commit(recs).has_value());
  REQUIRE(fs::last_write_time(file) == old_time);
}

TEST_CASE("diff is idempotent and reflects commits", "[cache][manager]") {
  test_support::TempDir dir("cm_diff");
  const auto photos = dir / "photos";
  test_support::write_png(photos / "a.png", 1);
  test_support::write_jpeg(photos / "b.jpg", 2);
  test_support::write_png(photos / "nested" / "c.png", 3);
  test_support::write_bytes(photos / "notes.txt", "skip me");
  const std::vector<fs::path> folders{photos};

  cache::CacheManager cm(config_for(dir));
  auto first = cm.diff(folders, kDefaultModel);
  auto second = cm.diff(folders, kDefaultModel);
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  REQUIRE(first->size() == 3);
  REQUIRE(first->fresh == 3);
  REQUIRE(first->scanned == 3);
  REQUIRE(first->keys == second->keys);

  REQUIRE(cm.commit(records_for(*first)).has_value());
  auto after = cm.diff(folders, kDefaultModel);
  REQUIRE(after.has_value());
  REQUIRE(after->empty());
  REQUIRE(after->scanned == 3);

  // Other models are unaffected.
  auto other = cm.diff(folders, ModelId::clip_vit_b16);
  REQUIRE(other->size() == 3);
}

TEST_CASE("changed file becomes pending and is replaced on commit", "[cache][manager]") {
  test_support::TempDir dir("cm_changed");
  const auto photos = dir / "photos";
  test_support::write_png(photos / "a.png", 1);
  test_support::write_png(photos / "b.png", 2);
  const std::vector<fs::path> folders{photos};

  cache::CacheManager cm(config_for(dir));
  REQUIRE(cm.commit(records_for(*cm.diff(folders, kDefaultModel))).has_value());

  test_support::write_png(photos / "a.png", 42);
  test_support::bump_mtime(photos / "a.png");
  auto pending = cm.diff(folders, kDefaultModel);
  REQUIRE(pending.has_value());
  REQUIRE(pending->size() == 1);
  REQUIRE(pending->stale == 1);
  REQUIRE(pending->keys[0].path == cache::normalize_path(photos / "a.png"));

  auto fresh = records_for(*pending, 100);
  REQUIRE(cm.commit(fresh).has_value());
  auto snap = *cm.load(kDefaultModel);
  REQUIRE(snap->size() == 2);
  const auto* a = snap->find(cache::normalize_path(photos / "a.png"));
  REQUIRE(a->key.fingerprint == pending->keys[0].fingerprint);
  REQUIRE(a->vector == fresh[0].vector);
}

TEST_CASE("content mode catches rewrites that keep size and mtime", "[cache][manager]") {
  test_support::TempDir dir("cm_content");
  const auto photos = dir / "photos";
  test_support::write_png(photos / "a.png", 1);
  const std::vector<fs::path> folders{photos};

  auto cfg = config_for(dir);
  cfg.fingerprint = FingerprintMode::content;
  cache::CacheManager cm(cfg);
  REQUIRE(cm.commit(records_for(*cm.diff(folders, kDefaultModel))).has_value());

  const auto mtime = fs::last_write_time(photos / "a.png");
  test_support::write_png(photos / "a.png", 2);
  fs::last_write_time(photos / "a.png", mtime);
  REQUIRE(cm.diff(folders, kDefaultModel)->size() == 1);
}

TEST_CASE("prune removes records missing from disk or outside the folders", "[cache][manager]") {
  test_support::TempDir dir("cm_prune");
  const auto keep = dir / "keep";
  const auto gone = dir / "gone";
  test_support::write_png(keep / "a.png", 1);
  test_support::write_png(keep / "b.png", 2);
  test_support::write_png(gone / "c.png", 3);
  const std::vector<fs::path> both{keep, gone};

  cache::CacheManager cm(config_for(dir));
  REQUIRE(cm.commit(records_for(*cm.diff(both, kDefaultModel))).has_value());
  REQUIRE((*cm.load(kDefaultModel))->size() == 3);

  fs::remove(keep / "b.png");
  const std::vector<fs::path> only_keep{keep};
  auto removed = cm.prune(only_keep, kDefaultModel);
  REQUIRE(removed.has_value());
  REQUIRE(*removed == 2);

  auto snap = *cm.load(kDefaultModel);
  REQUIRE(snap->size() == 1);
  REQUIRE(snap->find(cache::normalize_path(keep / "a.png")) != nullptr);

  auto again = cm.prune(only_keep, kDefaultModel);
  REQUIRE(again.has_value());
  REQUIRE(*again == 0);
}

TEST_CASE("remove and clear", "[cache][manager]") {
  test_support::TempDir dir("cm_remove");
  cache::CacheManager cm(config_for(dir));
  REQUIRE(cm.commit(std::vector<EmbeddingRecord>{test_support::make_record("/p/a.jpg", 1),
                                                 test_support::make_record("/p/b.jpg", 2)}).has_value());
  REQUIRE(cm.remove("/p/a.jpg", kDefaultModel).value());
  REQUIRE_FALSE(cm.remove("/p/a.jpg", kDefaultModel).value());
  REQUIRE_FALSE(cm.contains("/p/a.jpg", kDefaultModel));
  REQUIRE(cm.contains("/p/b.jpg", kDefaultModel));

  REQUIRE(cm.clear(kDefaultModel).has_value());
  REQUIRE_FALSE(fs::exists(cm.store_file(kDefaultModel)));
  REQUIRE((*cm.load(kDefaultModel))->empty());
  REQUIRE(cm.clear_all().has_value());
}

TEST_CASE("corrupt store is reported, then reset to empty", "[cache][manager]") {
  test_support::TempDir dir("cm_corrupt");
  {
    cache::CacheManager cm(config_for(dir));
    REQUIRE(cm.commit(std::vector<EmbeddingRecord>{test_support::make_record("/p/a.jpg", 1)}).has_value());
  }
  const auto file = store::store_path(dir / "cache", kDefaultModel);
  test_support::write_bytes(file, "definitely not a store header.................");

  cache::CacheManager cm(config_for(dir));
  auto raw = cm.load(kDefaultModel);
  REQUIRE_FALSE(raw.has_value());
  REQUIRE(raw.error().code == error_code::data_integrity);

  auto reset = cm.load_or_reset(kDefaultModel);
  REQUIRE(reset.has_value());
  REQUIRE((*reset)->empty());
  REQUIRE(fs::exists(fs::path(file.string() + ".corrupt")));

  // Writes work again afterwards.
  REQUIRE(cm.commit(std::vector<EmbeddingRecord>{test_support::make_record("/p/b.jpg", 2)}).has_value());
  REQUIRE((*cm.load(kDefaultModel))->size() == 1);
}

TEST_CASE("corrupt records are discarded and counted", "[cache][manager]") {
  test_support::TempDir dir("cm_discard");
  const auto file = store::store_path(dir / "cache", kDefaultModel);
  {
    cache::CacheManager cm(config_for(dir));
    REQUIRE(cm.commit(std::vector<EmbeddingRecord>{test_support::make_record("/p/a.jpg", 1),
                                                   test_support::make_record("/p/b.jpg", 2)}).has_value());
  }
  // Chop into the last frame.
  fs::resize_file(file, fs::file_size(file) - 5);

  cache::CacheManager cm(config_for(dir));
  auto st = cm.stats(kDefaultModel);
  REQUIRE(st.has_value());
  REQUIRE(st->records == 1);
  REQUIRE(st->discarded_on_load == 1);
}

TEST_CASE("readers see whole snapshots while commits run", "[cache][manager][concurrency]") {
  test_support::TempDir dir("cm_concurrent");
  cache::CacheManager cm(config_for(dir));
  REQUIRE(cm.commit(std::vector<EmbeddingRecord>{test_support::make_record("/p/seed.jpg", 0)}).has_value());

  std::atomic<bool> done{false};
  std::atomic<int> bad{0};
  std::thread reader([&] {
    std::size_t last = 0;
    while (!done.load()) {
      auto snap = cm.load(kDefaultModel);
      if (!snap) { bad.fetch_add(1); continue; }
      const auto n = (*snap)->size();
      // Commits only add, one record at a time.
      if (n < last) bad.fetch_add(1);
      for (const auto& r : (*snap)->records()) {
        if (r.vector.size() != 512) bad.fetch_add(1);
      }
      last = n;
    }
  });

  for (std::uint32_t i = 1; i <= 40; ++i) {
    auto r = test_support::make_record("/p/img" + std::to_string(i) + ".jpg", i);
    REQUIRE(cm.commit(std::vector<EmbeddingRecord>{r}).has_value());
  }
  done.store(true);
  reader.join();
  REQUIRE(bad.load() == 0);
  REQUIRE((*cm.load(kDefaultModel))->size() == 41);
}

TEST_CASE("discard count describes the load that was published", "[cache][manager][concurrency]") {
  test_support::TempDir dir("cm_load_race");
  const auto file = store::store_path(dir / "cache", kDefaultModel);
  fs::create_directories(dir / "cache");

  for (std::uint32_t round = 0; round < 25; ++round) {
    std::vector<EmbeddingRecord> recs{test_support::make_record("/p/a.jpg", 1),
                                      test_support::make_record("/p/b.jpg", 2)};
    REQUIRE(store::write_store(file, kDefaultModel, recs, store::WriteOptions{false}).has_value());
    fs::resize_file(file, fs::file_size(file) - 5);

    // A racing reader may finish its disk read after the commit has published a
    // clean store; its read must not replace the count of the load that won.
    cache::CacheManager cm(config_for(dir));
    std::thread reader([&] { (void)cm.load(kDefaultModel); });
    REQUIRE(cm.commit(std::vector<EmbeddingRecord>{test_support::make_record("/p/c.jpg", 3 + round)}).has_value());
    reader.join();

    auto st = cm.stats(kDefaultModel);
    REQUIRE(st.has_value());
    REQUIRE(st->records == 2);
    REQUIRE(st->discarded_on_load == 1);
  }
}
