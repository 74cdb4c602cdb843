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
 * @file config.hpp
 * @brief Multi-format configuration parser with template-based backend
 *        dispatch, and the NodeConfig built from it.
 *
 * IniBackend / JsonBackend / YamlBackend are tags; ConfigParser<Backend>
 * specializations flatten a document into a ConfigStore and
 * Config<Backends...> picks one by format or file extension.
 *
 * Backends (CMake options LANXFER_CONFIG_JSON / _YAML / _INI):
 *   - IniBackend  : inih library       (LANXFER_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json      (LANXFER_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (LANXFER_CONFIG_YAML_ENABLED)
 *
 * Nested documents are flattened to "section.key = value"; only the
 * first level of nesting is kept.
 *
 * Usage:
 * @code
 *   lanxfer::MultiConfig cfg;
 *   cfg.LoadFile("lanxfer.json");
 *   auto node_cfg = lanxfer::NodeConfig::FromStore(cfg);
 * @endcode
 */

#ifndef LANXFER_CONFIG_HPP_
#define LANXFER_CONFIG_HPP_

#include "lanxfer/log.hpp"
#include "lanxfer/platform.hpp"
#include "lanxfer/vocabulary.hpp"

#include <arpa/inet.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <tuple>
#include <utility>

#ifdef LANXFER_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef LANXFER_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef LANXFER_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace lanxfer {

// ============================================================================
// ConfigError / ConfigFormat
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kInvalidValue,
  kBufferFull
};

inline const char* ToString(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:       return "config file not found";
    case ConfigError::kParseError:         return "config parse error";
    case ConfigError::kFormatNotSupported: return "config format not supported";
    case ConfigError::kInvalidValue:       return "invalid config value";
    case ConfigError::kBufferFull:         return "too many config entries";
  }
  return "unknown";
}

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

#ifndef LANXFER_CONFIG_MAX_FILE_SIZE
#define LANXFER_CONFIG_MAX_FILE_SIZE 65536U
#endif

#ifndef LANXFER_CONFIG_MAX_ENTRIES
#define LANXFER_CONFIG_MAX_ENTRIES 128U
#endif

namespace detail {

inline std::string ToLowerAscii(const char* s) {
  std::string out(s != nullptr ? s : "");
  for (auto& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

/** Lower-cased extension of path without the dot; empty when none. */
inline std::string FileExtension(const char* path) {
  const char* dot = std::strrchr(path, '.');
  const char* slash = std::strrchr(path, '/');
  if (dot == nullptr || (slash != nullptr && slash > dot)) return std::string();
  return ToLowerAscii(dot + 1);
}

inline expected<std::string, ConfigError> ReadConfigFile(const char* path) {
  using Result = expected<std::string, ConfigError>;
  FILE* f = std::fopen(path, "rb");
  if (f == nullptr) return Result::error(ConfigError::kFileNotFound);
  LANXFER_SCOPE_EXIT(std::fclose(f));
  std::string text;
  char buf[4096];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    text.append(buf, n);
    if (text.size() > LANXFER_CONFIG_MAX_FILE_SIZE) break;
  }
  if (std::ferror(f) != 0 || text.size() > LANXFER_CONFIG_MAX_FILE_SIZE) {
    LANXFER_LOG_WARN("Config", "cannot read '%s' (error or larger than %u bytes)",
                     path, static_cast<unsigned>(LANXFER_CONFIG_MAX_FILE_SIZE));
    return Result::error(ConfigError::kParseError);
  }
  return Result::success(std::move(text));
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) {
    return ext == "ini" || ext == "cfg" || ext == "conf";
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) { return ext == "json"; }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) {
    return ext == "yaml" || ext == "yml";
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Flat "section.key = value" table with typed getters.
 *
 * Section and key lookups are case-insensitive. Top-level scalars of a
 * nested format land in section "". Holds at most
 * LANXFER_CONFIG_MAX_ENTRIES distinct keys.
 */
class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const std::string* v = Lookup(section, key);
    return (v != nullptr) ? v->c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    const std::string* v = Lookup(section, key);
    if (v == nullptr) return default_val;
    char* end = nullptr;
    const long n = std::strtol(v->c_str(), &end, 10);
    return (end == v->c_str()) ? default_val : static_cast<int32_t>(n);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const std::string* v = Lookup(section, key);
    return (v != nullptr) ? IsTruthy(*v) : default_val;
  }

  /** @brief Whole-number value; empty if absent or not entirely digits. */
  optional<int64_t> FindInt(const char* section, const char* key) const {
    const std::string* v = Lookup(section, key);
    if (v == nullptr) return {};
    char* end = nullptr;
    const long long n = std::strtoll(v->c_str(), &end, 10);
    if (end == v->c_str() || *end != '\0') return {};
    return optional<int64_t>{static_cast<int64_t>(n)};
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const std::string* v = Lookup(section, key);
    return (v == nullptr) ? optional<bool>{} : optional<bool>{IsTruthy(*v)};
  }

  bool HasSection(const char* section) const {
    const std::string prefix = detail::ToLowerAscii(section) + '.';
    auto it = values_.lower_bound(prefix);
    return it != values_.end() &&
           it->first.compare(0, prefix.size(), prefix) == 0;
  }

  bool HasKey(const char* section, const char* key) const {
    return Lookup(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(values_.size());
  }

  /**
   * @brief Set or override one value; backends and command-line overrides
   *        both come through here.
   * @return kBufferFull when a new key would exceed the entry limit.
   */
  expected<void, ConfigError> Set(const char* section, const char* key,
                                  const std::string& value) {
    LANXFER_ASSERT(section != nullptr && key != nullptr);
    std::string k = MakeKey(section, key);
    auto it = values_.find(k);
    if (it != values_.end()) {
      it->second = value;
    } else if (values_.size() >= LANXFER_CONFIG_MAX_ENTRIES) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    } else {
      values_.emplace(std::move(k), value);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string MakeKey(const char* section, const char* key) {
    return detail::ToLowerAscii(section) + '.' + detail::ToLowerAscii(key);
  }

  const std::string* Lookup(const char* section, const char* key) const {
    LANXFER_ASSERT(section != nullptr && key != nullptr);
    auto it = values_.find(MakeKey(section, key));
    return (it != values_.end()) ? &it->second : nullptr;
  }

  static bool IsTruthy(const std::string& v) {
    const std::string l = detail::ToLowerAscii(v.c_str());
    return l == "true" || l == "1" || l == "yes" || l == "on";
  }

  std::map<std::string, std::string> values_;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/**
 * Primary template: the backend was not compiled in. Each enabled format
 * specializes ParseText() to flatten its document into the store.
 */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseText(ConfigStore&,
                                               const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef LANXFER_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseText(ConfigStore& store,
                                               const std::string& text) {
    Ctx ctx{&store, false};
    const int rc = ini_parse_string(text.c_str(), &OnEntry, &ctx);
    if (ctx.full) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    if (rc != 0) {
      LANXFER_LOG_WARN("Config", "INI syntax error on line %d", rc);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  struct Ctx {
    ConfigStore* store;
    bool full;
  };

  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    auto* ctx = static_cast<Ctx*>(user);
    if (!ctx->store->Set(section != nullptr ? section : "",
                         name != nullptr ? name : "",
                         value != nullptr ? value : "")
             .has_value()) {
      ctx->full = true;
      return 0;
    }
    return 1;
  }
};
#endif

#ifdef LANXFER_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseText(ConfigStore& store,
                                               const std::string& text) {
    const auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (const auto& top : doc.items()) {
      if (top.value().is_object()) {
        for (const auto& kv : top.value().items()) {
          auto r = store.Set(top.key().c_str(), kv.key().c_str(),
                             Scalar(kv.value()));
          if (!r.has_value()) return r;
        }
      } else {
        auto r = store.Set("", top.key().c_str(), Scalar(top.value()));
        if (!r.has_value()) return r;
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    return v.dump();
  }
};
#endif

#ifdef LANXFER_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseText(ConfigStore& store,
                                               const std::string& text) {
    auto root = fkyaml::node::deserialize(text);
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const auto section = it.key().get_value<std::string>();
      auto& value = *it;
      if (value.is_mapping()) {
        for (auto kit = value.begin(); kit != value.end(); ++kit) {
          auto r = store.Set(section.c_str(),
                             kit.key().get_value<std::string>().c_str(),
                             Scalar(*kit));
          if (!r.has_value()) return r;
        }
      } else {
        auto r = store.Set("", section.c_str(), Scalar(value));
        if (!r.has_value()) return r;
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const fkyaml::node& v) {
    if (v.is_string()) return v.get_value<std::string>();
    if (v.is_boolean()) return v.get_value<bool>() ? "true" : "false";
    if (v.is_integer()) return std::to_string(v.get_value<int64_t>());
    if (v.is_float_number()) return std::to_string(v.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

/**
 * @brief ConfigStore that can be filled from any of Backends.
 *
 * LoadFile() picks the backend from the file extension (first backend when
 * none matches). Formats whose library was not compiled in report
 * kFormatNotSupported.
 */
template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");
  using Default = typename std::tuple_element<0, std::tuple<Backends...>>::type;

 public:
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    LANXFER_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = Detect(path);
    auto text = detail::ReadConfigFile(path);
    if (!text.has_value()) {
      return expected<void, ConfigError>::error(text.get_error());
    }
    auto r = Parse(text.value(), format);
    if (r.has_value()) {
      LANXFER_LOG_INFO("Config", "loaded %s (%u entries)", path, EntryCount());
    }
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    LANXFER_ASSERT(data != nullptr);
    return Parse(std::string(data, size), format);
  }

 private:
  expected<void, ConfigError> Parse(const std::string& text,
                                    ConfigFormat format) {
    auto result =
        expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
    static_cast<void>(
        ((Backends::kFormat == format
              ? (result = ConfigParser<Backends>::ParseText(*this, text), true)
              : false) ||
         ...));
    return result;
  }

  static ConfigFormat Detect(const char* path) {
    const std::string ext = detail::FileExtension(path);
    ConfigFormat found = Default::kFormat;
    static_cast<void>(
        ((Backends::MatchesExtension(ext) ? (found = Backends::kFormat, true)
                                          : false) ||
         ...));
    return found;
  }
};

/// Every format; JSON is the default for files without a known extension.
using MultiConfig = Config<JsonBackend, YamlBackend, IniBackend>;
using JsonConfig = Config<JsonBackend>;
using YamlConfig = Config<YamlBackend>;
using IniConfig = Config<IniBackend>;

// ============================================================================
// NodeConfig
// ============================================================================

/** @brief Machine host name, or "lanxfer" when it cannot be read. */
inline std::string LocalHostName() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
    return "lanxfer";
  }
  return std::string(buf);
}

/**
 * @brief Every tunable of a node, with defaults for absent keys.
 *
 * | section   | key           | default         |
 * |-----------|---------------|-----------------|
 * | node      | name          | host name       |
 * | transport | port          | 9876            |
 * | transport | io_timeout_ms | 0               |
 * | discovery | enabled       | true            |
 * | discovery | service       | _lanxfer._tcp   |
 * | discovery | group         | 239.255.42.99   |
 * | discovery | port          | 9877            |
 * | discovery | interval_ms   | 1000            |
 * | discovery | timeout_ms    | 3000            |
 * | transfer  | download_dir  | downloads       |
 * | log       | level         | info            |
 */
struct NodeConfig {
  std::string name;
  uint16_t port = 9876;
  uint32_t io_timeout_ms = 0;

  bool discovery_enabled = true;
  std::string discovery_service = "_lanxfer._tcp";
  std::string discovery_group = "239.255.42.99";
  uint16_t discovery_port = 9877;
  uint32_t discovery_interval_ms = 1000;
  uint32_t discovery_timeout_ms = 3000;

  std::string download_dir = "downloads";
  log::Level log_level = log::Level::kInfo;

  /**
   * @brief Build from a loaded store; absent keys take their defaults.
   * @return kInvalidValue (logged with the offending key) for out-of-range
   *         numbers, a malformed group address, an unknown log level or an
   *         empty download directory.
   */
  static expected<NodeConfig, ConfigError> FromStore(const ConfigStore& store) {
    using Result = expected<NodeConfig, ConfigError>;
    NodeConfig c;

    c.name = store.GetString("node", "name", "");
    if (c.name.empty()) c.name = LocalHostName();

    uint32_t u = 0;
    if (!ReadRange(store, "transport", "port", 0, 65535, c.port, u)) {
      return Result::error(ConfigError::kInvalidValue);
    }
    c.port = static_cast<uint16_t>(u);
    if (!ReadRange(store, "transport", "io_timeout_ms", 0, 3600000,
                   c.io_timeout_ms, c.io_timeout_ms)) {
      return Result::error(ConfigError::kInvalidValue);
    }

    c.discovery_enabled = store.GetBool("discovery", "enabled", true);
    c.discovery_service =
        store.GetString("discovery", "service", c.discovery_service.c_str());
    c.discovery_group =
        store.GetString("discovery", "group", c.discovery_group.c_str());
    in_addr group_addr{};
    if (c.discovery_service.empty() ||
        ::inet_pton(AF_INET, c.discovery_group.c_str(), &group_addr) != 1) {
      LANXFER_LOG_WARN("Config", "invalid discovery service/group");
      return Result::error(ConfigError::kInvalidValue);
    }
    if (!ReadRange(store, "discovery", "port", 1, 65535, c.discovery_port, u)) {
      return Result::error(ConfigError::kInvalidValue);
    }
    c.discovery_port = static_cast<uint16_t>(u);
    if (!ReadRange(store, "discovery", "interval_ms", 1, 3600000,
                   c.discovery_interval_ms, c.discovery_interval_ms) ||
        !ReadRange(store, "discovery", "timeout_ms", 1, 3600000,
                   c.discovery_timeout_ms, c.discovery_timeout_ms)) {
      return Result::error(ConfigError::kInvalidValue);
    }

    c.download_dir =
        store.GetString("transfer", "download_dir", c.download_dir.c_str());
    if (c.download_dir.empty()) {
      LANXFER_LOG_WARN("Config", "transfer.download_dir must not be empty");
      return Result::error(ConfigError::kInvalidValue);
    }

    const char* level = store.GetString("log", "level", "info");
    if (!log::ParseLevel(level, c.log_level)) {
      LANXFER_LOG_WARN("Config", "unknown log.level '%s'", level);
      return Result::error(ConfigError::kInvalidValue);
    }

    return Result::success(std::move(c));
  }

 private:
  static bool ReadRange(const ConfigStore& store, const char* section,
                        const char* key, int64_t lo, int64_t hi,
                        uint32_t default_val, uint32_t& out) {
    if (!store.HasKey(section, key)) {
      out = default_val;
      return true;
    }
    auto v = store.FindInt(section, key);
    if (!v.has_value() || v.value() < lo || v.value() > hi) {
      LANXFER_LOG_WARN("Config", "%s.%s = '%s' is not in [%lld, %lld]",
                       section, key, store.GetString(section, key),
                       static_cast<long long>(lo), static_cast<long long>(hi));
      return false;
    }
    out = static_cast<uint32_t>(v.value());
    return true;
  }
};

}  // namespace lanxfer

#endif  // LANXFER_CONFIG_HPP_
