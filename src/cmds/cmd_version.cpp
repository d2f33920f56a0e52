#include "cmd_version.h"

#include "CLI11.hpp"
#include "blake3.h"
#include "sol/sol.hpp"
#include "tbb/version.h"
#include "tui.h"

#include <utility>

#ifndef GRAFT_VERSION_STR
#error "GRAFT_VERSION_STR must be defined by the build system"
#endif

namespace graft {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("graft version %s", GRAFT_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  oneTBB: %s", TBB_VERSION_STRING);
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  BLAKE3: %s", BLAKE3_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace graft
