/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

// lanxfer_node: interactive LAN peer. Discovers peers on the local network,
// exchanges text messages and streams files into the download directory.
//
// Usage:
//   lanxfer_node [--config FILE] [--name NAME] [--port N]
//                [--download-dir DIR] [--no-discovery] [--verbose]

#include "lanxfer/config.hpp"
#include "lanxfer/console.hpp"
#include "lanxfer/log.hpp"
#include "lanxfer/node.hpp"

#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

// ============================================================================
// Helpers: argv lookup
// ============================================================================

static bool HasFlag(int argc, char* argv[], const char* flag) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], flag) == 0) {
      return true;
    }
  }
  return false;
}

/// Value following flag, or nullptr when absent.
static const char* FlagValue(int argc, char* argv[], const char* flag) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::strcmp(argv[i], flag) == 0) {
      return argv[i + 1];
    }
  }
  return nullptr;
}

// ============================================================================
// Observer: print inbound events above the prompt
// ============================================================================

static void OnText(const char* from, const std::string& text, void* /*ctx*/) {
  std::printf("\n[%s] %s\n> ", from, text.c_str());
  std::fflush(stdout);
}

static void OnFileOffer(const char* from, const lanxfer::FileOffer& offer,
                        const std::string& path, void* /*ctx*/) {
  std::printf("\n[*] Receiving '%s' (%llu bytes) from %s -> %s\n> ",
              offer.name.c_str(), static_cast<unsigned long long>(offer.size),
              from, path.c_str());
  std::fflush(stdout);
}

static void OnTransferComplete(const lanxfer::TransferId& /*id*/,
                               const std::string& path, void* /*ctx*/) {
  std::printf("\n[+] File saved: %s\n> ", path.c_str());
  std::fflush(stdout);
}

static void OnError(const char* what, const char* detail, void* /*ctx*/) {
  std::printf("\n[!] %s: %s\n> ", what, detail);
  std::fflush(stdout);
}

// ============================================================================
// Command rendering
// ============================================================================

static void PrintPeers(const lanxfer::Node& node) {
  auto peers = node.ListPeers();
  if (peers.empty()) {
    std::printf("No peers discovered yet.\n");
    return;
  }
  std::printf("Discovered peers:\n");
  for (const auto& p : peers) {
    std::printf("  %s  %-16s %s\n", p.id.ToString().c_str(), p.name.c_str(),
                p.address.c_str());
  }
}

static void RunSend(lanxfer::Node& node, const lanxfer::Command& cmd) {
  auto r = node.SendText(cmd.peer_id, cmd.argument);
  if (r.has_value()) {
    std::printf("[+] Message sent\n");
  } else {
    std::printf("[!] Failed to send: %s\n", lanxfer::ToString(r.get_error()));
  }
}

static void RunFile(lanxfer::Node& node, const lanxfer::Command& cmd) {
  auto r = node.SendFile(cmd.peer_id, cmd.argument);
  if (r.has_value()) {
    std::printf("[+] File sent (transfer %s)\n",
                r.value().ToString().c_str());
  } else {
    std::printf("[!] Failed to send file: %s\n",
                lanxfer::ToString(r.get_error()));
  }
}

// ============================================================================
// Configuration
// ============================================================================

/// Load --config (if any), apply command-line overrides, build NodeConfig.
static bool LoadNodeConfig(int argc, char* argv[], lanxfer::NodeConfig& out,
                           bool& name_given) {
  lanxfer::MultiConfig store;
  const char* path = FlagValue(argc, argv, "--config");
  if (path != nullptr) {
    auto r = store.LoadFile(path);
    if (!r.has_value()) {
      LANXFER_LOG_ERROR("main", "cannot load %s: %s", path,
                        lanxfer::ToString(r.get_error()));
      return false;
    }
  }

  struct Override {
    const char* flag;
    const char* section;
    const char* key;
  };
  static constexpr Override kOverrides[] = {
      {"--name", "node", "name"},
      {"--port", "transport", "port"},
      {"--download-dir", "transfer", "download_dir"},
  };
  for (const auto& o : kOverrides) {
    const char* v = FlagValue(argc, argv, o.flag);
    if (v == nullptr) continue;
    auto r = store.Set(o.section, o.key, v);
    if (!r.has_value()) {
      LANXFER_LOG_ERROR("main", "%s: %s", o.flag,
                        lanxfer::ToString(r.get_error()));
      return false;
    }
  }
  if (HasFlag(argc, argv, "--no-discovery")) {
    static_cast<void>(store.Set("discovery", "enabled", "false"));
  }
  if (HasFlag(argc, argv, "--verbose")) {
    static_cast<void>(store.Set("log", "level", "debug"));
  }

  name_given = store.HasKey("node", "name");
  auto cfg = lanxfer::NodeConfig::FromStore(store);
  if (!cfg.has_value()) {
    LANXFER_LOG_ERROR("main", "configuration rejected: %s",
                      lanxfer::ToString(cfg.get_error()));
    return false;
  }
  out = cfg.value();
  return true;
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
  lanxfer::log::Init();

  lanxfer::NodeConfig cfg;
  bool name_given = false;
  if (!LoadNodeConfig(argc, argv, cfg, name_given)) {
    lanxfer::log::Shutdown();
    return 1;
  }
  lanxfer::log::SetLevel(cfg.log_level);

  if (!name_given) {
    std::printf("Enter your name [%s]: ", cfg.name.c_str());
    std::fflush(stdout);
    std::string name;
    if (std::getline(std::cin, name)) {
      name = lanxfer::detail::Trim(name);
      if (!name.empty()) cfg.name = name;
    }
  }

  lanxfer::Node node(cfg);
  lanxfer::NodeObserver observer;
  observer.on_text = &OnText;
  observer.on_file_offer = &OnFileOffer;
  observer.on_transfer_complete = &OnTransferComplete;
  observer.on_error = &OnError;
  node.SetObserver(observer);

  auto started = node.Start();
  if (!started.has_value()) {
    LANXFER_LOG_ERROR("main", "startup failed: %s",
                      lanxfer::ToString(started.get_error()));
    lanxfer::log::Shutdown();
    return 1;
  }

  std::printf("\n=== lanxfer: %s ===\n", cfg.name.c_str());
  std::printf("Your ID: %s\n", node.Id().ToString().c_str());
  std::printf("Listening on port %u\n", static_cast<unsigned>(node.Port()));
  std::printf("Downloads go to %s/\n", node.Engine().DownloadDir().c_str());
  std::printf("%s\n\n", lanxfer::kHelpText);

  std::string line;
  for (;;) {
    std::printf("> ");
    std::fflush(stdout);
    if (!std::getline(std::cin, line)) break;

    lanxfer::Command cmd = lanxfer::ParseCommand(line);
    if (cmd.kind == lanxfer::CommandKind::kQuit) break;

    switch (cmd.kind) {
      case lanxfer::CommandKind::kEmpty:
        break;
      case lanxfer::CommandKind::kPeers:
        PrintPeers(node);
        break;
      case lanxfer::CommandKind::kSend:
        RunSend(node, cmd);
        break;
      case lanxfer::CommandKind::kFile:
        RunFile(node, cmd);
        break;
      default:
        std::printf("%s\n", cmd.message.c_str());
        break;
    }
  }

  std::printf("Goodbye!\n");
  node.Stop();
  lanxfer::log::Shutdown();
  return 0;
}
