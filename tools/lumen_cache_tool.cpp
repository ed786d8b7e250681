// lumen_cache_tool: inspect and maintain an embedding cache directory.
//
//   lumen_cache_tool [options] stats
//   lumen_cache_tool [options] pending <folder>...
//   lumen_cache_tool [options] prune <folder>...
//   lumen_cache_tool [options] remove <file>
//   lumen_cache_tool [options] clear [--all]
//   lumen_cache_tool models
//
// Exit codes: 0 ok, 1 operation failed, 2 usage error.

#include "lumen/cache/cache_manager.hpp"
#include "lumen/config.hpp"
#include "lumen/error.hpp"
#include "lumen/model.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace lumen;

static std::optional<std::string> eat_arg(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options] <command> [args]\n"
              << "Commands:\n"
              << "  stats                 record count, dimension and store size\n"
              << "  pending <folder>...   images that need (re)embedding\n"
              << "  prune <folder>...     drop records for files no longer present\n"
              << "  remove <file>         drop one record\n"
              << "  clear [--all]         delete the store for --model (or every model)\n"
              << "  models                list supported models\n"
              << "Options:\n"
              << "  --cache_dir=DIR       (default: $LUMEN_CACHE_DIR or ~/.cache/lumen)\n"
              << "  --model=NAME|SLUG     (default: " << model_info(kDefaultModel)->slug << ")\n"
              << "  --fingerprint=metadata|content\n"
              << "  --verbose\n";
}

static int fail(const core::error& e) {
    std::cerr << "error: " << core::to_string(e.code) << " [" << e.component << "] " << e.message << "\n";
    return 1;
}

static int cmd_models() {
    for (const auto& m : all_models()) {
        std::cout << m.slug << "\t" << m.name << "\tdim=" << m.dim
                  << (m.id == kDefaultModel ? "\t(default)" : "") << "\n";
    }
    return 0;
}

static int cmd_stats(cache::CacheManager& cache, ModelId model) {
    auto st = cache.stats(model);
    if (!st) return fail(st.error());
    std::cout << "model:     " << model_info(model)->name << "\n"
              << "store:     " << cache.store_file(model).string() << "\n"
              << "records:   " << st->records << "\n"
              << "dim:       " << st->dim << "\n"
              << "bytes:     " << st->store_bytes << "\n"
              << "discarded: " << st->discarded_on_load << "\n";
    return 0;
}

static int cmd_pending(cache::CacheManager& cache, ModelId model, const std::vector<fs::path>& folders) {
    auto pending = cache.diff(folders, model);
    if (!pending) return fail(pending.error());
    for (const auto& k : pending->keys) std::cout << k.path << "\n";
    std::cerr << pending->size() << " pending (" << pending->fresh << " new, " << pending->stale
              << " changed) of " << pending->scanned << " images\n";
    return 0;
}

static int cmd_prune(cache::CacheManager& cache, ModelId model, const std::vector<fs::path>& folders) {
    auto removed = cache.prune(folders, model);
    if (!removed) return fail(removed.error());
    std::cout << "pruned " << *removed << " records\n";
    return 0;
}

int main(int argc, char** argv) {
    CacheConfig cfg = cache_config_from_env();
    ModelId model = kDefaultModel;
    bool all = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
        else if (a == "--verbose") cfg.verbose = true;
        else if (a == "--all") all = true;
        else if (auto v = eat_arg(a, "--cache_dir=")) cfg.cache_dir = *v;
        else if (auto v = eat_arg(a, "--model=")) {
            auto m = parse_model(*v);
            if (!m) { std::cerr << m.error().message << "\n"; return 2; }
            model = *m;
        }
        else if (auto v = eat_arg(a, "--fingerprint=")) {
            auto f = parse_fingerprint_mode(*v);
            if (!f) { std::cerr << f.error().message << "\n"; return 2; }
            cfg.fingerprint = *f;
        }
        else if (a.rfind("--", 0) == 0) { std::cerr << "unknown option: " << a << "\n"; print_usage(argv[0]); return 2; }
        else positional.push_back(std::move(a));
    }
    if (positional.empty()) { print_usage(argv[0]); return 2; }

    const std::string cmd = positional.front();
    std::vector<fs::path> args(positional.begin() + 1, positional.end());

    if (cmd == "models") return cmd_models();

    cache::CacheManager cache(cfg);
    if (cmd == "stats") return cmd_stats(cache, model);
    if (cmd == "pending" || cmd == "prune") {
        if (args.empty()) { std::cerr << cmd << ": at least one folder required\n"; return 2; }
        return cmd == "pending" ? cmd_pending(cache, model, args) : cmd_prune(cache, model, args);
    }
    if (cmd == "remove") {
        if (args.size() != 1) { std::cerr << "remove: exactly one file required\n"; return 2; }
        auto existed = cache.remove(args.front(), model);
        if (!existed) return fail(existed.error());
        std::cout << (*existed ? "removed " : "not cached: ") << args.front().string() << "\n";
        return 0;
    }
    if (cmd == "clear") {
        auto r = all ? cache.clear_all() : cache.clear(model);
        if (!r) return fail(r.error());
        std::cout << "cleared " << (all ? std::string("all models") : std::string(model_info(model)->slug)) << "\n";
        return 0;
    }

    std::cerr << "unknown command: " << cmd << "\n";
    print_usage(argv[0]);
    return 2;
}
