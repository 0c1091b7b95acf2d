#include <raylib.h>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include <pxtank/config.hpp>
#include <pxtank/viewer/app.hpp>

using namespace pxtank;

// pxtank_viewer [config.csv] [ai_profile_key] [ai_profiles.csv]
int main(int argc, char** argv) {
  ArenaConfig cfg{};
  if (argc > 1) {
    if (auto loaded = load_arena_config_csv(argv[1])) {
      cfg = *loaded;
      TraceLog(LOG_INFO, "PXTANK: config loaded from %s", argv[1]);
    } else {
      TraceLog(LOG_WARNING, "PXTANK: cannot open config %s, using defaults", argv[1]);
    }
  }

  std::vector<AiProfile> profiles;
  if (argc > 3) {
    if (auto loaded = load_ai_profile_catalog_csv(argv[3])) {
      profiles = std::move(*loaded);
      TraceLog(LOG_INFO, "PXTANK: %zu AI profiles loaded from %s", profiles.size(), argv[3]);
    } else {
      TraceLog(LOG_WARNING, "PXTANK: cannot open AI profiles %s, using built-ins", argv[3]);
    }
  }

  if (argc > 2) {
    if (auto profile = resolve_ai_profile(argv[2], profiles)) {
      cfg.ai = ai_profile_params(*profile);
      TraceLog(LOG_INFO, "PXTANK: AI profile %s", profile->key.c_str());
    } else {
      TraceLog(LOG_WARNING, "PXTANK: unknown AI profile %s, keeping configured AI", argv[2]);
    }
  }

  std::random_device rd;
  ViewerApp app(cfg, rd());
  return app.run();
}
