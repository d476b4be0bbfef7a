// src/core/util/config_loader.cpp
#include "readlog/core/util/config_loader.hpp"

#include <filesystem>

#include <yaml-cpp/yaml.h>

namespace readlog {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }
static bool is_scalar(const YAML::Node& n) { return n && n.IsScalar(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 8) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;
  const fs::path dir = path.parent_path();

  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

// Maps an already merged document onto Config defaults. yaml-cpp conversion errors
// (a string where a number belongs) surface as YAML::Exception and are caught by the callers.
static Result<Config> from_yaml(const YAML::Node& y) {
  Config cfg;

  if (y["selection"]) {
    if (!is_scalar(y["selection"])) {
      return Result<Config>::err(Status::invalid_argument("selection must be a string"));
    }
    auto sel = parse_selection(y["selection"].as<std::string>());
    if (!sel.ok()) return Result<Config>::err(sel.status());
    cfg.selection = sel.take_value();
  }

  // --- input
  if (is_map(y["input"])) {
    const auto i = y["input"];
    maybe_set(i, "type", cfg.input.type);
    maybe_set(i, "path", cfg.input.path);
  }

  // --- stats
  if (is_map(y["stats"])) {
    const auto s = y["stats"];
    if (s["quantiles"]) {
      if (!s["quantiles"].IsSequence()) {
        return Result<Config>::err(Status::invalid_argument("stats.quantiles must be a YAML sequence"));
      }
      cfg.stats.quantiles = s["quantiles"].as<std::vector<double>>();
    }
    if (s["min_session_s"]) {
      const double min_s = s["min_session_s"].as<double>();
      if (!seconds_in_range(min_s)) {
        return Result<Config>::err(Status::invalid_argument("stats.min_session_s is out of range"));
      }
      cfg.stats.min_session_ns = seconds_to_ns(min_s);
    }
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set(o, "out_dir", cfg.output.out_dir);
    maybe_set(o, "write_jsonl", cfg.output.write_jsonl);
  }

  // --- logging
  if (is_map(y["logging"])) {
    const auto l = y["logging"];
    maybe_set(l, "level", cfg.logging.level);
    maybe_set(l, "pattern", cfg.logging.pattern);
  }

  const Status st = validate_config(cfg);
  if (!st.ok()) return Result<Config>::err(st);

  return Result<Config>::ok(cfg);
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes(path, 0);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());

  try {
    return from_yaml(yaml_r.value());
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error("bad value in " + path_str + ": " + e.what()));
  }
}

Result<Config> parse_config(const std::string& yaml_text) {
  try {
    return from_yaml(YAML::Load(yaml_text));
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }
}

}  // namespace readlog
