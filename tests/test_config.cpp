/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - multi-format config parser and NodeConfig.
 */

#include "lanxfer/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdlib.h>
#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <string>

// ============================================================================
// ConfigStore typed getters
// ============================================================================

TEST_CASE("config - Set and typed getters", "[config][store]") {
  lanxfer::ConfigStore store;
  REQUIRE(store.Set("transport", "port", "5090").has_value());
  REQUIRE(store.Set("discovery", "enabled", "no").has_value());
  REQUIRE(store.Set("node", "name", "alice").has_value());

  REQUIRE(store.GetInt("transport", "port", 0) == 5090);
  REQUIRE(!store.GetBool("discovery", "enabled", true));
  REQUIRE(std::strcmp(store.GetString("node", "name"), "alice") == 0);
  REQUIRE(std::strcmp(store.GetString("x", "y", "default"), "default") == 0);
  REQUIRE(store.GetInt("x", "y", 42) == 42);
  REQUIRE(store.HasSection("TRANSPORT"));  // case-insensitive
  REQUIRE(store.HasKey("node", "NAME"));
  REQUIRE(store.EntryCount() == 3);

  // Set overrides in place.
  REQUIRE(store.Set("transport", "port", "6000").has_value());
  REQUIRE(store.GetInt("transport", "port", 0) == 6000);
  REQUIRE(store.EntryCount() == 3);
}

TEST_CASE("config - FindInt is strict", "[config][store]") {
  lanxfer::ConfigStore store;
  store.Set("a", "good", "123");
  store.Set("a", "suffix", "123abc");
  store.Set("a", "word", "abc");

  REQUIRE(store.FindInt("a", "good").value() == 123);
  REQUIRE(!store.FindInt("a", "suffix").has_value());
  REQUIRE(!store.FindInt("a", "word").has_value());
  REQUIRE(!store.FindInt("a", "missing").has_value());

  REQUIRE(!store.FindBool("a", "missing").has_value());
  store.Set("a", "flag", "on");
  REQUIRE(store.FindBool("a", "flag").value());
}

TEST_CASE("config - store rejects keys past the entry limit",
          "[config][store]") {
  lanxfer::ConfigStore store;
  for (uint32_t i = 0; i < LANXFER_CONFIG_MAX_ENTRIES; ++i) {
    const std::string key = "k" + std::to_string(i);
    REQUIRE(store.Set("s", key.c_str(), "v").has_value());
  }
  auto r = store.Set("s", "one_more", "v");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == lanxfer::ConfigError::kBufferFull);
  // Overwriting an existing key still works when full.
  REQUIRE(store.Set("S", "K0", "w").has_value());
  REQUIRE(std::strcmp(store.GetString("s", "k0"), "w") == 0);
}

// ============================================================================
// NodeConfig
// ============================================================================

TEST_CASE("config - NodeConfig defaults from an empty store",
          "[config][node]") {
  lanxfer::ConfigStore store;
  auto r = lanxfer::NodeConfig::FromStore(store);
  REQUIRE(r.has_value());
  const auto& c = r.value();
  REQUIRE(!c.name.empty());  // host name
  REQUIRE(c.port == 9876);
  REQUIRE(c.io_timeout_ms == 0);
  REQUIRE(c.discovery_enabled);
  REQUIRE(c.discovery_service == "_lanxfer._tcp");
  REQUIRE(c.discovery_group == "239.255.42.99");
  REQUIRE(c.discovery_port == 9877);
  REQUIRE(c.discovery_interval_ms == 1000);
  REQUIRE(c.discovery_timeout_ms == 3000);
  REQUIRE(c.download_dir == "downloads");
  REQUIRE(c.log_level == lanxfer::log::Level::kInfo);
}

TEST_CASE("config - NodeConfig reads every key", "[config][node]") {
  lanxfer::ConfigStore store;
  store.Set("node", "name", "bob");
  store.Set("transport", "port", "0");
  store.Set("transport", "io_timeout_ms", "2500");
  store.Set("discovery", "enabled", "false");
  store.Set("discovery", "service", "_test._tcp");
  store.Set("discovery", "group", "239.1.2.3");
  store.Set("discovery", "port", "20000");
  store.Set("discovery", "interval_ms", "250");
  store.Set("discovery", "timeout_ms", "900");
  store.Set("transfer", "download_dir", "/tmp/inbox");
  store.Set("log", "level", "debug");

  auto r = lanxfer::NodeConfig::FromStore(store);
  REQUIRE(r.has_value());
  const auto& c = r.value();
  REQUIRE(c.name == "bob");
  REQUIRE(c.port == 0);
  REQUIRE(c.io_timeout_ms == 2500);
  REQUIRE(!c.discovery_enabled);
  REQUIRE(c.discovery_service == "_test._tcp");
  REQUIRE(c.discovery_group == "239.1.2.3");
  REQUIRE(c.discovery_port == 20000);
  REQUIRE(c.discovery_interval_ms == 250);
  REQUIRE(c.discovery_timeout_ms == 900);
  REQUIRE(c.download_dir == "/tmp/inbox");
  REQUIRE(c.log_level == lanxfer::log::Level::kDebug);
}

TEST_CASE("config - NodeConfig rejects invalid values", "[config][node]") {
  struct Case {
    const char* section;
    const char* key;
    const char* value;
  };
  const Case cases[] = {
      {"transport", "port", "70000"},
      {"transport", "port", "-1"},
      {"transport", "port", "12ab"},
      {"transport", "io_timeout_ms", "-5"},
      {"discovery", "port", "0"},
      {"discovery", "interval_ms", "0"},
      {"discovery", "timeout_ms", "99999999"},
      {"discovery", "group", "not-an-ip"},
      {"discovery", "service", ""},
      {"transfer", "download_dir", ""},
      {"log", "level", "chatty"},
  };
  for (const auto& c : cases) {
    INFO(c.section << "." << c.key << " = '" << c.value << "'");
    lanxfer::ConfigStore store;
    store.Set(c.section, c.key, c.value);
    auto r = lanxfer::NodeConfig::FromStore(store);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == lanxfer::ConfigError::kInvalidValue);
  }
}

// ============================================================================
// JSON Backend
// ============================================================================

#ifdef LANXFER_CONFIG_JSON_ENABLED

TEST_CASE("config - JSON LoadBuffer flattens sections", "[config][json]") {
  const char* json_data = R"({
    "node": { "name": "carol" },
    "transport": { "port": 7000, "io_timeout_ms": 1500 },
    "discovery": { "enabled": false, "service": "_lanxfer._tcp" },
    "log": { "level": "warn" },
    "version": 3
  })";

  lanxfer::JsonConfig cfg;
  auto result = cfg.LoadBuffer(json_data,
                               static_cast<uint32_t>(std::strlen(json_data)),
                               lanxfer::ConfigFormat::kJson);
  REQUIRE(result.has_value());
  REQUIRE(std::strcmp(cfg.GetString("node", "name"), "carol") == 0);
  REQUIRE(cfg.GetInt("transport", "port", 0) == 7000);
  REQUIRE(!cfg.GetBool("discovery", "enabled", true));
  REQUIRE(cfg.GetInt("", "version", 0) == 3);

  auto node = lanxfer::NodeConfig::FromStore(cfg);
  REQUIRE(node.has_value());
  REQUIRE(node.value().name == "carol");
  REQUIRE(node.value().port == 7000);
  REQUIRE(node.value().io_timeout_ms == 1500);
  REQUIRE(!node.value().discovery_enabled);
  REQUIRE(node.value().log_level == lanxfer::log::Level::kWarn);
}

TEST_CASE("config - JSON parse error", "[config][json]") {
  const char* bad = "{ \"node\": ";
  lanxfer::JsonConfig cfg;
  auto r = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)),
                          lanxfer::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == lanxfer::ConfigError::kParseError);
}

TEST_CASE("config - JSON LoadFile and missing file", "[config][json]") {
  const char* path = "/tmp/lanxfer_test_config.json";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fputs("{\"transfer\": {\"download_dir\": \"/tmp/lanxfer_dl\"}}", f);
  std::fclose(f);

  lanxfer::JsonConfig cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(std::strcmp(cfg.GetString("transfer", "download_dir"),
                      "/tmp/lanxfer_dl") == 0);
  std::remove(path);

  lanxfer::JsonConfig missing;
  auto r = missing.LoadFile("/tmp/lanxfer_no_such_config.json");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == lanxfer::ConfigError::kFileNotFound);
}

TEST_CASE("config - unsupported format reported", "[config][json]") {
  lanxfer::JsonConfig cfg;
  const char* data = "[a]\nb=1\n";
  auto r = cfg.LoadBuffer(data, static_cast<uint32_t>(std::strlen(data)),
                          lanxfer::ConfigFormat::kIni);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == lanxfer::ConfigError::kFormatNotSupported);
}

TEST_CASE("config - MultiConfig picks the backend by extension",
          "[config][json]") {
  char dir_tmpl[] = "/tmp/lanxfer_cfg_XXXXXX";
  REQUIRE(::mkdtemp(dir_tmpl) != nullptr);
  const std::string dir(dir_tmpl);

  const std::string plain = dir + "/lanxfer";  // no extension -> JSON
  {
    std::FILE* f = std::fopen(plain.c_str(), "w");
    REQUIRE(f != nullptr);
    std::fputs("{\"node\": {\"name\": \"frank\"}}", f);
    std::fclose(f);
  }
  lanxfer::MultiConfig cfg;
  REQUIRE(cfg.LoadFile(plain.c_str()).has_value());
  REQUIRE(std::strcmp(cfg.GetString("node", "name"), "frank") == 0);

#ifndef LANXFER_CONFIG_YAML_ENABLED
  const std::string yaml = dir + "/lanxfer.YML";
  {
    std::FILE* f = std::fopen(yaml.c_str(), "w");
    REQUIRE(f != nullptr);
    std::fputs("node:\n  name: grace\n", f);
    std::fclose(f);
  }
  lanxfer::MultiConfig other;
  auto r = other.LoadFile(yaml.c_str());
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == lanxfer::ConfigError::kFormatNotSupported);
  std::remove(yaml.c_str());
#endif

  std::remove(plain.c_str());
  ::rmdir(dir.c_str());
}

#endif  // LANXFER_CONFIG_JSON_ENABLED

// ============================================================================
// INI Backend
// ============================================================================

#ifdef LANXFER_CONFIG_INI_ENABLED

TEST_CASE("config - INI LoadBuffer", "[config][ini]") {
  const char* ini_data =
      "[node]\n"
      "name = dave\n"
      "[transport]\n"
      "port = 5090\n";

  lanxfer::IniConfig cfg;
  auto result = cfg.LoadBuffer(ini_data,
                               static_cast<uint32_t>(std::strlen(ini_data)),
                               lanxfer::ConfigFormat::kIni);
  REQUIRE(result.has_value());
  auto node = lanxfer::NodeConfig::FromStore(cfg);
  REQUIRE(node.has_value());
  REQUIRE(node.value().name == "dave");
  REQUIRE(node.value().port == 5090);
}

#endif  // LANXFER_CONFIG_INI_ENABLED

// ============================================================================
// YAML Backend
// ============================================================================

#ifdef LANXFER_CONFIG_YAML_ENABLED

TEST_CASE("config - YAML LoadBuffer", "[config][yaml]") {
  const char* yaml_data =
      "node:\n"
      "  name: erin\n"
      "discovery:\n"
      "  port: 19877\n";

  lanxfer::YamlConfig cfg;
  auto result = cfg.LoadBuffer(yaml_data,
                               static_cast<uint32_t>(std::strlen(yaml_data)),
                               lanxfer::ConfigFormat::kYaml);
  REQUIRE(result.has_value());
  auto node = lanxfer::NodeConfig::FromStore(cfg);
  REQUIRE(node.has_value());
  REQUIRE(node.value().name == "erin");
  REQUIRE(node.value().discovery_port == 19877);
}

#endif  // LANXFER_CONFIG_YAML_ENABLED
