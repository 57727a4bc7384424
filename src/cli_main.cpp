/// @file
/// @brief CLI entry point for the liftpack workout prescriber.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include "catalog/catalog_cache.h"
#include "catalog/json_data_source.h"
#include "core/basic_types.h"
#include "core/json_parser.h"
#include "core/version_info.h"
#include "prescriber.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string catalog_path;
  std::string workouts_path;
  std::string request_path;
  std::string output;
  liftpack::PrescriptionRequest request;
  liftpack::BackendKind backend = liftpack::BackendKind::Greedy;
  bool json_output = false;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("liftpack_cli - time-boxed workout prescriber\n\n");
  std::printf("Usage: liftpack_cli --catalog FILE [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --catalog FILE        Exercise catalog JSON (required)\n");
  std::printf("  --workouts FILE       Workout history JSON for recovery windows\n");
  std::printf("  --request FILE        Request JSON (flags below override its fields)\n");
  std::printf("  --minutes N           Time available, 15-120 (default 30)\n");
  std::printf("  --location LOC        gym, home, park, hotel, office, travel\n");
  std::printf("  --equipment A,B       Owned equipment tags\n");
  std::printf("  --goals A,B           Ordered goals: strength, hypertrophy, endurance,\n");
  std::printf("                        mobility, fat_loss\n");
  std::printf("  --level LEVEL         beginner, intermediate, advanced\n");
  std::printf("  --exclude A,B         Excluded exercise ids\n");
  std::printf("  --exclude-muscles A,B Excluded muscle ids\n");
  std::printf("  --recent A,B          Recent workout ids\n");
  std::printf("  --backend NAME        greedy (default) or indexed\n");
  std::printf("  --json                JSON output\n");
  std::printf("  --verbose             Log solver decisions to stderr\n");
  std::printf("  -o FILE               Write output to FILE instead of stdout\n");
  std::printf("  --help                Show this help\n");
}

/// @brief Split a comma-separated list, dropping empty items.
std::vector<std::string> splitList(const char* text) {
  std::vector<std::string> items;
  std::string current;
  for (const char* ptr = text; *ptr; ++ptr) {
    if (*ptr == ',') {
      if (!current.empty()) items.push_back(current);
      current.clear();
    } else {
      current += *ptr;
    }
  }
  if (!current.empty()) items.push_back(current);
  return items;
}

/// @brief Load --request into opts.request.
bool loadRequestFile(const std::string& path, CliOptions& opts) {
  std::string text;
  std::string error;
  liftpack::JsonValue root;
  if (!liftpack::readTextFile(path, text, error) || !liftpack::parseJson(text, root, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return false;
  }
  std::string detail;
  liftpack::RequestError err = liftpack::requestFromJson(root, opts.request, detail);
  if (err != liftpack::RequestError::None) {
    std::fprintf(stderr, "Error: %s: %s\n", liftpack::requestErrorToString(err),
                 detail.c_str());
    return false;
  }
  return true;
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @param exit_code Process exit code when returning false.
/// @return False if the program should exit (help or bad arguments).
bool parseArgs(int argc, char* argv[], CliOptions& opts, int& exit_code) {
  // The request file is applied first so individual flags override it.
  for (int idx = 1; idx + 1 < argc; ++idx) {
    if (std::strcmp(argv[idx], "--request") == 0) {
      opts.request_path = argv[idx + 1];
      if (!loadRequestFile(opts.request_path, opts)) {
        exit_code = 1;
        return false;
      }
    }
  }

  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    bool has_value = idx + 1 < argc;
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage();
      exit_code = 0;
      return false;
    }
    if (std::strcmp(arg, "--catalog") == 0 && has_value) {
      opts.catalog_path = argv[++idx];
    } else if (std::strcmp(arg, "--workouts") == 0 && has_value) {
      opts.workouts_path = argv[++idx];
    } else if (std::strcmp(arg, "--request") == 0 && has_value) {
      ++idx;
    } else if (std::strcmp(arg, "--minutes") == 0 && has_value) {
      opts.request.time_available_minutes = std::atoi(argv[++idx]);
    } else if (std::strcmp(arg, "--location") == 0 && has_value) {
      auto location = liftpack::locationFromString(argv[++idx]);
      if (!location) {
        std::fprintf(stderr, "Error: unknown location '%s'\n", argv[idx]);
        exit_code = 1;
        return false;
      }
      opts.request.location = *location;
    } else if (std::strcmp(arg, "--equipment") == 0 && has_value) {
      opts.request.equipment = splitList(argv[++idx]);
    } else if (std::strcmp(arg, "--goals") == 0 && has_value) {
      opts.request.goals.clear();
      for (const auto& name : splitList(argv[++idx])) {
        auto goal = liftpack::goalFromString(name);
        if (!goal) {
          std::fprintf(stderr, "Error: unknown goal '%s'\n", name.c_str());
          exit_code = 1;
          return false;
        }
        opts.request.goals.push_back(*goal);
      }
    } else if (std::strcmp(arg, "--level") == 0 && has_value) {
      auto level = liftpack::fitnessLevelFromString(argv[++idx]);
      if (!level) {
        std::fprintf(stderr, "Error: unknown fitness level '%s'\n", argv[idx]);
        exit_code = 1;
        return false;
      }
      opts.request.fitness_level = *level;
    } else if (std::strcmp(arg, "--exclude") == 0 && has_value) {
      opts.request.excluded_exercises = splitList(argv[++idx]);
    } else if (std::strcmp(arg, "--exclude-muscles") == 0 && has_value) {
      opts.request.excluded_muscles = splitList(argv[++idx]);
    } else if (std::strcmp(arg, "--recent") == 0 && has_value) {
      opts.request.recent_workout_ids = splitList(argv[++idx]);
    } else if (std::strcmp(arg, "--backend") == 0 && has_value) {
      auto kind = liftpack::backendKindFromString(argv[++idx]);
      if (!kind) {
        std::fprintf(stderr, "Error: unknown backend '%s'\n", argv[idx]);
        exit_code = 1;
        return false;
      }
      opts.backend = *kind;
    } else if (std::strcmp(arg, "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.verbose = true;
    } else if (std::strcmp(arg, "-o") == 0 && has_value) {
      opts.output = argv[++idx];
    } else {
      std::fprintf(stderr, "Warning: ignoring argument '%s'\n", arg);
    }
  }

  if (opts.catalog_path.empty()) {
    std::fprintf(stderr, "Error: --catalog is required\n");
    printUsage();
    exit_code = 1;
    return false;
  }
  liftpack::RequestError err = liftpack::validateRequest(opts.request);
  if (err != liftpack::RequestError::None) {
    std::fprintf(stderr, "Error: %s\n", liftpack::requestErrorToString(err));
    exit_code = 1;
    return false;
  }
  return true;
}

/// @brief Join a string list with ", ".
std::string joinList(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) out += ", ";
    out += item;
  }
  return out;
}

/// @brief Render a result as a plain-text session plan.
std::string buildTextReport(const liftpack::PrescriptionResult& result,
                            const liftpack::PrescriptionRequest& request) {
  std::string out;
  char line[256];

  std::snprintf(line, sizeof(line), "Session:    %d min at %s (%s backend)\n",
                request.time_available_minutes, liftpack::locationToString(request.location),
                result.backend_name.c_str());
  out += line;
  if (result.exercises.empty()) {
    out += "No eligible exercises for this request.\n";
    return out;
  }
  std::snprintf(line, sizeof(line), "Duration:   %d:%02d (incl. warmup/cooldown)\n\n",
                result.actual_duration_seconds / liftpack::kSecondsPerMinute,
                result.actual_duration_seconds % liftpack::kSecondsPerMinute);
  out += line;

  int index = 1;
  for (const auto& item : result.exercises) {
    std::snprintf(line, sizeof(line), "%2d. %-28s %d x %-5s rest %3ds  ~%ds\n", index++,
                  item.name.c_str(), item.sets, item.repsLabel().c_str(), item.rest_seconds,
                  item.estimated_seconds);
    out += line;
    out += "    Primary:   " + joinList(item.primary_muscles) + "\n";
    if (!item.secondary_muscles.empty()) {
      out += "    Secondary: " + joinList(item.secondary_muscles) + "\n";
    }
    if (!item.notes.empty()) out += "    Note:      " + item.notes + "\n";

    auto subs = result.substitutions.find(item.exercise_id);
    if (subs != result.substitutions.end() && !subs->second.empty()) {
      std::vector<std::string> names;
      for (const auto& alt : subs->second) names.push_back(alt.name);
      out += "    Swap for:  " + joinList(names) + "\n";
    }
  }

  out += "\nCoverage:\n";
  for (const auto& [muscle_id, entry] : result.coverage.entries()) {
    std::snprintf(line, sizeof(line), "  %-24s %-9s %2d sets\n", entry.display_name.c_str(),
                  liftpack::activationLevelToString(entry.activation_level),
                  entry.total_sets);
    out += line;
  }
  return out;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  int exit_code = 0;
  if (!parseArgs(argc, argv, opts, exit_code)) {
    return exit_code;
  }

  liftpack::JsonDataSource source;
  std::string error;
  if (!source.loadCatalogFile(opts.catalog_path, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }
  if (!opts.workouts_path.empty() && !source.loadHistoryFile(opts.workouts_path, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }

  liftpack::CatalogCache cache(source);
  liftpack::SolverConfig config;
  config.backend = opts.backend;
  config.verbose = opts.verbose;

  if (opts.verbose) {
    std::fprintf(stderr, "liftpack_cli v%s\n", LIFTPACK_VERSION);
  }

  liftpack::PrescriptionResult result =
      liftpack::prescribe(opts.request, cache, source, config);
  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }

  std::string text;
  if (opts.json_output) {
    text = liftpack::buildResultJson(result, /*pretty=*/true) + "\n";
  } else {
    text = buildTextReport(result, opts.request);
  }

  if (opts.output.empty()) {
    std::fputs(text.c_str(), stdout);
    return 0;
  }

  std::ofstream out_file(opts.output);
  if (!out_file.is_open()) {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }
  out_file << text;
  std::printf("Output:    %s\n", opts.output.c_str());
  return 0;
}
