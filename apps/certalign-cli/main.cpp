/**
 * certalign-cli: verify one certificate's field alignment against a reference image.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/certalign-cli/certalign_cli [--config path] [--reference image]
 *                                                 [--field name=Ada] [--drift name=0,6]
 * The renderer is the built-in synthetic one (default certificate layout); --drift
 * simulates a renderer that misplaces a field. Prints the result as JSON.
 */

#include <certalign/align/iterative_verifier.hpp>
#include <certalign/align/position_cache.hpp>
#include <certalign/align/stats_tracker.hpp>
#include <certalign/app/config.hpp>
#include <certalign/app/report.hpp>
#include <certalign/core/error.hpp>
#include <certalign/core/field_spec.hpp>
#include <certalign/core/image.hpp>
#include <certalign/vision/load_image.hpp>
#include <certalign/vision/synthetic_renderer.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <expected>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

bool split_pair(const std::string& arg, std::string& key, std::string& value) {
  const auto pos = arg.find('=');
  if (pos == std::string::npos || pos == 0) return false;
  key = arg.substr(0, pos);
  value = arg.substr(pos + 1);
  return true;
}

bool parse_drift(const std::string& value, certalign::core::FieldOffset& out) {
  const auto comma = value.find(',');
  if (comma == std::string::npos) return false;
  try {
    out.dx = std::stod(value.substr(0, comma));
    out.dy = std::stod(value.substr(comma + 1));
  } catch (const std::logic_error&) {
    return false;
  }
  return true;
}

void print_usage() {
  std::cout << "Usage: certalign_cli [options]\n"
            << "  --config <path>        Config (key=value file); default: built-in certificate fields\n"
            << "  --reference <path>     Reference image; default: synthetic render with no drift\n"
            << "  --field <key=value>    Field text (repeatable); default: demo participant\n"
            << "  --drift <key=dx,dy>    Simulated renderer error in pixels (repeatable)\n"
            << "  --tolerance <px>       Override tolerance_px\n"
            << "  --max-attempts <n>     Override max_attempts\n"
            << "  --cache-file <path>    Load/save the position cache (JSON)\n"
            << "  --stats-out <path>     Write statistics export (JSON)\n"
            << "  --output <path>        Also write the result JSON to a file\n"
            << "  --log-level <level>    trace | debug | info | warn | error | off\n"
            << "\nExit status: 0 passed, 2 not passed, 1 setup error.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string reference_path;
  std::string cache_override;
  std::string stats_override;
  std::string output_path;
  std::string log_level_override;
  std::string tolerance_override;
  std::string attempts_override;
  certalign::core::FieldValues fields;
  std::vector<std::pair<std::string, certalign::core::FieldOffset>> drifts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string key;
    std::string value;
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--reference" && i + 1 < argc) {
      reference_path = argv[++i];
    } else if (arg == "--field" && i + 1 < argc) {
      if (!split_pair(argv[++i], key, value)) {
        std::cerr << "--field expects key=value\n";
        return 1;
      }
      fields[key] = value;
    } else if (arg == "--drift" && i + 1 < argc) {
      certalign::core::FieldOffset drift;
      if (!split_pair(argv[++i], key, value) || !parse_drift(value, drift)) {
        std::cerr << "--drift expects key=dx,dy\n";
        return 1;
      }
      drifts.emplace_back(key, drift);
    } else if (arg == "--tolerance" && i + 1 < argc) {
      tolerance_override = argv[++i];
    } else if (arg == "--max-attempts" && i + 1 < argc) {
      attempts_override = argv[++i];
    } else if (arg == "--cache-file" && i + 1 < argc) {
      cache_override = argv[++i];
    } else if (arg == "--stats-out" && i + 1 < argc) {
      stats_override = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  std::expected<certalign::app::AppConfig, certalign::core::VerifyError> loaded =
      certalign::app::default_config();
  if (!config_path.empty()) loaded = certalign::app::load_config(config_path);
  if (!loaded) {
    std::cerr << "Config error: " << certalign::core::to_string(loaded.error()) << "\n";
    return 1;
  }
  certalign::app::AppConfig cfg = std::move(*loaded);

  try {
    if (!tolerance_override.empty()) cfg.verifier.tolerance_px = std::stod(tolerance_override);
    if (!attempts_override.empty()) {
      cfg.verifier.max_attempts = static_cast<std::uint32_t>(std::stoul(attempts_override));
    }
  } catch (const std::logic_error&) {
    std::cerr << "Invalid --tolerance or --max-attempts\n";
    return 1;
  }
  if (!cache_override.empty()) cfg.cache_file = cache_override;
  if (!stats_override.empty()) cfg.stats_file = stats_override;
  if (!log_level_override.empty()) cfg.log_level = log_level_override;
  if (!reference_path.empty()) cfg.reference_path = reference_path;

  spdlog::set_level(spdlog::level::from_str(cfg.log_level));

  if (fields.empty()) {
    fields = {{"name", "Ada Lovelace"},
              {"event", "Analytical Engine Workshop"},
              {"organiser", "Difference Society"}};
  }

  certalign::vision::SyntheticRenderer renderer(certalign::vision::default_certificate_layout());

  certalign::core::Image reference;
  if (!cfg.reference_path.empty()) {
    auto image = certalign::vision::load_image(cfg.reference_path);
    if (!image) {
      std::cerr << "Failed to load reference image: " << cfg.reference_path << "\n";
      return 1;
    }
    reference = std::move(*image);
  } else {
    auto image = renderer.render(fields, {});
    if (!image) {
      std::cerr << "Failed to render synthetic reference\n";
      return 1;
    }
    reference = std::move(*image);
  }

  for (const auto& [field, drift] : drifts) {
    renderer.set_drift(field, drift);
  }

  certalign::align::PositionCache cache(cfg.cache_ttl);
  if (!cfg.cache_file.empty()) {
    if (auto n = cache.load(cfg.cache_file); !n) {
      spdlog::warn("ignoring position cache '{}': {}", cfg.cache_file,
                   certalign::core::to_string(n.error()));
    }
  }
  certalign::align::StatsTracker stats(cfg.stats_capacity);
  if (!cfg.stats_file.empty()) {
    if (auto imported = stats.load(cfg.stats_file); !imported) {
      spdlog::warn("ignoring statistics '{}': {}", cfg.stats_file,
                   certalign::core::to_string(imported.error()));
    }
  }

  auto verifier = certalign::align::IterativeVerifier::create(
      cfg.fields, std::move(reference), cfg.verifier, &cache, &stats);
  if (!verifier) {
    std::cerr << "Setup error: " << certalign::core::to_string(verifier.error()) << "\n";
    return 1;
  }

  auto result = verifier->verify(fields, renderer.as_callback());
  if (!result) {
    std::cerr << "Verification error: " << certalign::core::to_string(result.error()) << "\n";
    return 1;
  }

  const std::string text = certalign::app::to_json(*result).dump(2);
  std::cout << text << "\n";

  if (!output_path.empty()) {
    std::ofstream f(output_path);
    if (f) {
      f << text << "\n";
    } else {
      std::cerr << "Warning: could not write " << output_path << "\n";
    }
  }

  if (!cfg.cache_file.empty()) {
    cache.clear_expired();
    if (auto saved = cache.save(cfg.cache_file); !saved) {
      std::cerr << "Warning: could not save position cache " << cfg.cache_file << "\n";
    }
  }
  if (!cfg.stats_file.empty()) {
    if (auto saved = stats.save(cfg.stats_file); !saved) {
      std::cerr << "Warning: could not write statistics " << cfg.stats_file << "\n";
    }
  }
  for (const auto& line : stats.recommendations()) {
    spdlog::info("{}", line);
  }

  return result->passed ? 0 : 2;
}
