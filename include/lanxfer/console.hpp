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

/**
 * @file console.hpp
 * @brief Interactive command parser for the lanxfer prompt.
 *
 * Commands:
 *   /peers                      list known peers
 *   /send <peer-id> <text>      send a text message
 *   /file <peer-id> <path>      offer and stream a file
 *   /help                       print the command list
 *   /quit                       leave
 *
 * Arguments are split once on the first space, so message text and file
 * paths may contain spaces. Parsing is pure; rendering is left to the
 * caller.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef LANXFER_CONSOLE_HPP_
#define LANXFER_CONSOLE_HPP_

#include "lanxfer/id.hpp"

#include <cstdint>
#include <string>

namespace lanxfer {

// ============================================================================
// Command
// ============================================================================

enum class CommandKind : uint8_t {
  kEmpty = 0,       ///< Blank line, nothing to do.
  kPeers,
  kSend,
  kFile,
  kQuit,
  kHelp,
  kUsage,           ///< Known command with missing arguments; see message.
  kInvalidPeerId,
  kUnknownCommand
};

inline const char* ToString(CommandKind k) noexcept {
  switch (k) {
    case CommandKind::kEmpty:          return "empty";
    case CommandKind::kPeers:          return "peers";
    case CommandKind::kSend:           return "send";
    case CommandKind::kFile:           return "file";
    case CommandKind::kQuit:           return "quit";
    case CommandKind::kHelp:           return "help";
    case CommandKind::kUsage:          return "usage";
    case CommandKind::kInvalidPeerId:  return "invalid peer id";
    case CommandKind::kUnknownCommand: return "unknown command";
  }
  return "unknown";
}

struct Command {
  CommandKind kind = CommandKind::kEmpty;
  PeerId peer_id;        ///< kSend / kFile only.
  std::string argument;  ///< Message text (kSend) or path (kFile).
  std::string message;   ///< Usage or error text for the user.
};

static constexpr const char* kSendUsage = "Usage: /send <peer_id> <message>";
static constexpr const char* kFileUsage = "Usage: /file <peer_id> <path>";
static constexpr const char* kInvalidPeerIdText = "[!] Invalid peer ID";
static constexpr const char* kUnknownCommandText = "[!] Unknown command";

static constexpr const char* kHelpText =
    "Commands:\n"
    "  /peers                  - List discovered peers\n"
    "  /send <peer_id> <msg>   - Send a text message\n"
    "  /file <peer_id> <path>  - Send a file\n"
    "  /help                   - Show this list\n"
    "  /quit                   - Exit";

namespace detail {

inline std::string Trim(const std::string& s) {
  static constexpr const char* kSpace = " \t\r\n";
  const size_t first = s.find_first_not_of(kSpace);
  if (first == std::string::npos) return std::string();
  const size_t last = s.find_last_not_of(kSpace);
  return s.substr(first, last - first + 1);
}

/// Split once on the first space. rest is empty when there is none.
inline void SplitOnce(const std::string& s, std::string& head,
                      std::string& rest) {
  const size_t sp = s.find(' ');
  if (sp == std::string::npos) {
    head = s;
    rest.clear();
    return;
  }
  head = s.substr(0, sp);
  rest = s.substr(sp + 1);
}

}  // namespace detail

// ============================================================================
// ParseCommand
// ============================================================================

namespace detail {

inline Command ParsePeerCommand(CommandKind kind, const std::string& args,
                                const char* usage) {
  Command cmd;
  std::string id_text;
  std::string rest;
  SplitOnce(args, id_text, rest);
  if (id_text.empty() || rest.empty()) {
    cmd.kind = CommandKind::kUsage;
    cmd.message = usage;
    return cmd;
  }
  auto id = PeerId::Parse(id_text);
  if (!id.has_value()) {
    cmd.kind = CommandKind::kInvalidPeerId;
    cmd.message = kInvalidPeerIdText;
    return cmd;
  }
  cmd.kind = kind;
  cmd.peer_id = id.value();
  cmd.argument = rest;
  return cmd;
}

}  // namespace detail

/**
 * @brief Parse one prompt line.
 *
 * Leading and trailing whitespace is ignored. "/send" and "/file" need a
 * peer id followed by a non-empty remainder; otherwise kind is kUsage and
 * message holds the usage line.
 */
inline Command ParseCommand(const std::string& line) {
  Command cmd;
  const std::string input = detail::Trim(line);
  if (input.empty()) return cmd;

  std::string name;
  std::string args;
  detail::SplitOnce(input, name, args);

  if (name == "/peers") {
    cmd.kind = CommandKind::kPeers;
  } else if (name == "/quit") {
    cmd.kind = CommandKind::kQuit;
  } else if (name == "/help") {
    cmd.kind = CommandKind::kHelp;
    cmd.message = kHelpText;
  } else if (name == "/send") {
    return detail::ParsePeerCommand(CommandKind::kSend, args, kSendUsage);
  } else if (name == "/file") {
    return detail::ParsePeerCommand(CommandKind::kFile, args, kFileUsage);
  } else {
    cmd.kind = CommandKind::kUnknownCommand;
    cmd.message = kUnknownCommandText;
  }
  return cmd;
}

}  // namespace lanxfer

#endif  // LANXFER_CONSOLE_HPP_
