#include <certalign/app/config.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace certalign::app {

namespace cc = certalign::core;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& value) {
  if (value == "true" || value == "1" || value == "on" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "off" || value == "no") return false;
  throw std::invalid_argument("not a boolean: " + value);
}

/// name, y_min, y_max[, threshold[, min_ink[, optional|required]]]
cc::FieldSpec parse_field(const std::string& value) {
  std::vector<std::string> parts;
  std::stringstream ss(value);
  std::string part;
  while (std::getline(ss, part, ',')) {
    trim(part);
    parts.push_back(part);
  }
  if (parts.size() < 3 || parts.size() > 6 || parts[0].empty()) {
    throw std::invalid_argument("field needs name, y_min, y_max: " + value);
  }

  cc::FieldSpec spec;
  spec.name = parts[0];
  spec.search_window.y_min = std::stod(parts[1]);
  spec.search_window.y_max = std::stod(parts[2]);
  if (parts.size() > 3) {
    const unsigned long threshold = std::stoul(parts[3]);
    if (threshold > 255) throw std::out_of_range("darkness threshold > 255");
    spec.darkness_threshold = static_cast<std::uint8_t>(threshold);
  }
  if (parts.size() > 4) spec.min_ink_pixels = static_cast<std::uint32_t>(std::stoul(parts[4]));
  if (parts.size() > 5) {
    if (parts[5] == "optional") spec.required = false;
    else if (parts[5] != "required") throw std::invalid_argument("expected optional|required");
  }
  return spec;
}

}  // namespace

std::vector<cc::FieldSpec> default_field_specs() {
  cc::FieldSpec name;
  name.name = "name";
  name.search_window = {0.20, 0.35};

  cc::FieldSpec event;
  event.name = "event";
  event.search_window = {0.43, 0.55};

  cc::FieldSpec organiser;
  organiser.name = "organiser";
  organiser.search_window = {0.55, 0.67};

  return {name, event, organiser};
}

AppConfig default_config() {
  AppConfig c;
  c.fields = default_field_specs();
  c.verifier.tolerance_px = 2.0;
  c.verifier.max_attempts = 10;
  return c;
}

std::expected<AppConfig, cc::VerifyError> parse_config(std::string_view text) {
  AppConfig c = default_config();
  bool fields_replaced = false;

  std::istringstream in{std::string(text)};
  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      spdlog::warn("config line {}: expected key=value", line_no);
      continue;
    }

    try {
      if (key == "field") {
        if (!fields_replaced) {
          c.fields.clear();
          fields_replaced = true;
        }
        c.fields.push_back(parse_field(value));
      }
      else if (key == "reference_path") c.reference_path = value;
      else if (key == "tolerance_px") c.verifier.tolerance_px = std::stod(value);
      else if (key == "max_attempts") c.verifier.max_attempts = static_cast<std::uint32_t>(std::stoul(value));
      else if (key == "convergence_window") c.verifier.refiner.convergence_window = static_cast<std::uint32_t>(std::stoul(value));
      else if (key == "initial_step") c.verifier.refiner.initial_step = std::stod(value);
      else if (key == "step_decay") c.verifier.refiner.step_decay = std::stod(value);
      else if (key == "decay_interval") c.verifier.refiner.decay_interval = static_cast<std::uint32_t>(std::stoul(value));
      else if (key == "min_step") c.verifier.refiner.min_step = std::stod(value);
      else if (key == "attempt_budget_ms") c.verifier.attempt_budget = std::chrono::milliseconds(std::stoll(value));
      else if (key == "run_budget_ms") c.verifier.run_budget = std::chrono::milliseconds(std::stoll(value));
      else if (key == "image_diff") c.verifier.compute_image_difference = parse_bool(value);
      else if (key == "cache_ttl_seconds") c.cache_ttl = std::chrono::seconds(std::stoll(value));
      else if (key == "cache_file") c.cache_file = value;
      else if (key == "stats_capacity") c.stats_capacity = static_cast<std::size_t>(std::stoul(value));
      else if (key == "stats_file") c.stats_file = value;
      else if (key == "log_level") c.log_level = value;
      else spdlog::warn("config line {}: unknown key '{}'", line_no, key);
    } catch (const std::logic_error& e) {
      spdlog::error("config line {}: bad value for '{}': {}", line_no, key, e.what());
      return std::unexpected(cc::VerifyError::InvalidConfig);
    }
  }

  if (c.fields.empty() || c.verifier.max_attempts == 0 || c.stats_capacity == 0 ||
      c.verifier.tolerance_px < 0.0 || c.cache_ttl.count() <= 0) {
    spdlog::error("config is unusable (fields={}, max_attempts={}, stats_capacity={})",
                  c.fields.size(), c.verifier.max_attempts, c.stats_capacity);
    return std::unexpected(cc::VerifyError::InvalidConfig);
  }
  return c;
}

std::expected<AppConfig, cc::VerifyError> load_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    spdlog::error("could not read config '{}'", path);
    return std::unexpected(cc::VerifyError::LoadFailed);
  }
  std::ostringstream text;
  text << f.rdbuf();
  return parse_config(text.str());
}

}  // namespace certalign::app
