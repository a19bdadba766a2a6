#include <raylib.h>
#include <utility>
#include <podium/config.hpp>
#include <podium/results.hpp>
#include <podium/viewer/app.hpp>

using namespace podium;

int main(int argc, char** argv) {
  if (argc < 2) {
    TraceLog(LOG_ERROR, "usage: podium_viewer <results.csv> [profiles.csv] [config.csv]");
    return 2;
  }

  ReplayConfig cfg{};
  if (argc > 3) {
    if (auto c = load_config_csv(argv[3])) cfg = *c;
    else TraceLog(LOG_WARNING, "PODIUM: cannot open config '%s', using defaults", argv[3]);
  }
  SetTraceLogLevel(cfg.log_level);

  auto results = load_results_csv(argv[1]);
  if (!results) {
    TraceLog(LOG_ERROR, "PODIUM: cannot open results '%s'", argv[1]);
    return 1;
  }
  TraceLog(LOG_INFO, "PODIUM: loaded %d result rows", static_cast<int>(results->size()));

  AvatarLookup avatars;
  if (argc > 2) {
    if (auto profiles = load_profiles_csv(argv[2])) avatars = avatars_from_profiles(*profiles);
    else TraceLog(LOG_WARNING, "PODIUM: cannot open profiles '%s', badges only", argv[2]);
  }

  ViewerApp app(cfg, std::move(*results), std::move(avatars));
  return app.run();
}
