// Conformance suite run against every solver backend, plus backend parity.

#include "solver/solver_backend.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "solver/goal_profile.h"
#include "solver/hard_filter.h"
#include "solver/time_estimator.h"
#include "test_helpers.h"

namespace liftpack {
namespace {

/// @brief Deterministic synthetic catalog.
std::vector<Exercise> syntheticCatalog(uint32_t seed, int count) {
  static const char* kMuscles[] = {"chest",  "lats",       "quads",     "hamstrings",
                                   "glutes", "core",       "triceps",   "biceps",
                                   "traps",  "front_delts", "side_delts", "calves",
                                   "forearms", "rhomboids", "lower_back", "adductors"};
  static const char* kEquipment[] = {"dumbbell", "barbell", "bench", "band", "kettlebell"};
  constexpr int kMuscleCount = sizeof(kMuscles) / sizeof(kMuscles[0]);

  std::mt19937 rng(seed);
  std::vector<Exercise> catalog;
  for (int idx = 0; idx < count; ++idx) {
    ActivationMap activations;
    int muscle_count = 1 + static_cast<int>(rng() % 4);
    for (int mus = 0; mus < muscle_count; ++mus) {
      activations[kMuscles[rng() % kMuscleCount]] = static_cast<double>(10 + rng() % 91);
    }
    std::vector<Location> locations;
    for (int loc = 0; loc < kLocationCount; ++loc) {
      if (rng() % 2 == 0) locations.push_back(static_cast<Location>(loc));
    }
    std::vector<std::string> required;
    if (rng() % 3 == 0) required.push_back(kEquipment[rng() % 5]);

    Exercise exercise = test_helpers::makeExercise(
        "ex_" + std::to_string(idx), static_cast<MovementPattern>(rng() % kMovementPatternCount),
        activations, locations, required, rng() % 2 == 0, 1 + static_cast<int>(rng() % 5),
        static_cast<Seconds>(30 + 15 * (rng() % 8)));
    exercise.is_timed = rng() % 7 == 0;
    catalog.push_back(exercise);
  }
  return catalog;
}

PrescriptionRequest makeRequest(int minutes, Location location, std::vector<Goal> goals) {
  PrescriptionRequest request;
  request.time_available_minutes = minutes;
  request.location = location;
  request.goals = std::move(goals);
  return request;
}

const Exercise* findById(const std::vector<Exercise>& catalog, const std::string& id) {
  for (const auto& exercise : catalog) {
    if (exercise.id == id) return &exercise;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Per-backend conformance
// ---------------------------------------------------------------------------

class SolverConformanceTest : public ::testing::TestWithParam<BackendKind> {
 protected:
  PackingResult solve(const std::vector<Exercise>& catalog, const PrescriptionRequest& request,
                      const RecoveryWindows& recovery = RecoveryWindows()) const {
    SolverConfig config;
    config.backend = GetParam();
    auto backend = createSolverBackend(config);
    EXPECT_STREQ(backend->name(), backendKindToString(GetParam()));
    return backend->solve(catalog, request, recovery);
  }

  /// Check every structural invariant of a result.
  void expectValidResult(const std::vector<Exercise>& catalog,
                         const PrescriptionRequest& request, const PackingResult& result) const {
    const SetsReps volume = determineSetsReps(request.goals);
    const double rest_multiplier = determineRestMultiplier(request.goals);
    const Seconds overhead = warmupCooldownOverhead(request.time_available_minutes);
    const Seconds budget = request.time_available_minutes * kSecondsPerMinute - overhead;

    std::set<std::string> seen;
    Seconds committed = 0;
    MuscleCoverage replay;
    for (const auto& item : result.exercises) {
      EXPECT_TRUE(seen.insert(item.exercise_id).second) << "duplicate " << item.exercise_id;
      const Exercise* source = findById(catalog, item.exercise_id);
      ASSERT_NE(source, nullptr);
      EXPECT_TRUE(passesHardFilter(*source, request)) << item.exercise_id;
      EXPECT_EQ(item.sets, volume.sets);
      EXPECT_EQ(item.reps, volume.reps);
      EXPECT_EQ(item.estimated_seconds,
                estimateExerciseSeconds(*source, volume.sets, volume.reps, rest_multiplier));
      EXPECT_EQ(result.substitutions.count(item.exercise_id), 1u) << item.exercise_id;
      committed += item.estimated_seconds;
      replay.update(*source, item.sets);
    }

    EXPECT_LE(committed, budget);
    EXPECT_EQ(result.substitutions.size(), result.exercises.size());
    if (result.exercises.empty()) {
      EXPECT_EQ(result.actual_duration_seconds, 0);
      EXPECT_TRUE(result.coverage.empty());
    } else {
      EXPECT_EQ(result.actual_duration_seconds, committed + overhead);
    }

    // Coverage equals the replayed accumulation.
    ASSERT_EQ(result.coverage.size(), replay.size());
    for (const auto& [muscle_id, entry] : replay.entries()) {
      const MuscleCoverageEntry* actual = result.coverage.find(muscle_id);
      ASSERT_NE(actual, nullptr) << muscle_id;
      EXPECT_EQ(actual->total_sets, entry.total_sets) << muscle_id;
      EXPECT_EQ(actual->activation_level, entry.activation_level) << muscle_id;
    }

    // Termination: either the budget is exhausted or nothing else fits.
    Seconds remaining = budget - committed;
    if (remaining > kMinRemainingSeconds) {
      for (const auto& exercise : filterExercises(catalog, request)) {
        if (seen.count(exercise.id)) continue;
        EXPECT_GT(estimateExerciseSeconds(exercise, volume.sets, volume.reps, rest_multiplier),
                  remaining)
            << exercise.id << " would still fit";
      }
    }
  }
};

TEST_P(SolverConformanceTest, EmptyCatalogGivesEmptyResult) {
  PackingResult result = solve({}, makeRequest(45, Location::Gym, {Goal::Strength}));
  EXPECT_TRUE(result.exercises.empty());
  EXPECT_TRUE(result.coverage.empty());
  EXPECT_TRUE(result.substitutions.empty());
  EXPECT_EQ(result.actual_duration_seconds, 0);
}

TEST_P(SolverConformanceTest, NothingEligibleGivesEmptyResult) {
  PrescriptionRequest request = makeRequest(45, Location::Office, {Goal::Strength});
  request.excluded_exercises = {"push_up", "bodyweight_squat", "reverse_lunge", "plank"};
  PackingResult result = solve(test_helpers::sampleCatalog(), request);
  EXPECT_TRUE(result.exercises.empty());
  EXPECT_EQ(result.actual_duration_seconds, 0);
}

TEST_P(SolverConformanceTest, HotelStrengthSession) {
  auto catalog = test_helpers::sampleCatalog();
  PrescriptionRequest request = makeRequest(20, Location::Hotel, {Goal::Strength});
  PackingResult result = solve(catalog, request);
  expectValidResult(catalog, request, result);

  // push_up and reverse_lunge tie at 65; catalog order breaks the tie.
  ASSERT_EQ(result.exercises.size(), 2u);
  EXPECT_EQ(result.exercises[0].exercise_id, "push_up");
  EXPECT_EQ(result.exercises[1].exercise_id, "reverse_lunge");
  EXPECT_EQ(result.exercises[0].sets, 5);
  EXPECT_EQ(result.exercises[0].reps, 4);
  EXPECT_EQ(result.exercises[0].estimated_seconds, 420);
  EXPECT_EQ(result.actual_duration_seconds, 420 + 420 + kShortSessionOverheadSeconds);

  EXPECT_TRUE(result.substitutions.at("push_up").empty());
  const auto& lunge_subs = result.substitutions.at("reverse_lunge");
  ASSERT_EQ(lunge_subs.size(), 2u);
  EXPECT_EQ(lunge_subs[0].exercise_id, "bodyweight_squat");
  EXPECT_EQ(lunge_subs[1].exercise_id, "glute_bridge");
  EXPECT_EQ(lunge_subs[0].sets, 5);

  EXPECT_EQ(result.coverage.find("chest")->activation_level, ActivationLevel::Primary);
  EXPECT_EQ(result.coverage.find("triceps")->activation_level, ActivationLevel::Secondary);
  EXPECT_EQ(result.coverage.find("hamstrings")->total_sets, 5);
}

TEST_P(SolverConformanceTest, SkipsTopCandidateThatNoLongerFits) {
  // No goals: 3 x 10, rest x1.0, budget 900 - 120 = 780.
  std::vector<Exercise> catalog;
  catalog.push_back(test_helpers::makeExercise(
      "big_row", MovementPattern::Pull, {{"lats", 80}, {"biceps", 50}, {"rhomboids", 50}},
      {Location::Home}, {}, true, 2, 200));  // 490s, score 50
  catalog.push_back(test_helpers::makeExercise(
      "wide_squat", MovementPattern::Squat, {{"quads", 80}, {"glutes", 60}, {"hamstrings", 30}},
      {Location::Home}, {}, true, 2, 150));  // 390s, score 50
  catalog.push_back(test_helpers::makeExercise("calf_raise", MovementPattern::Isolation,
                                               {{"calves", 90}}, {Location::Home}, {}, false,
                                               1, 30));  // 150s, score 15
  catalog.push_back(test_helpers::makeExercise("side_plank", MovementPattern::Core,
                                               {{"core", 70}, {"obliques", 60}},
                                               {Location::Home}, {}, false, 1,
                                               45));  // 180s, score 30

  PrescriptionRequest request = makeRequest(15, Location::Home, {});
  PackingResult result = solve(catalog, request);
  expectValidResult(catalog, request, result);

  // big_row wins the tie on catalog order and leaves 290s. wide_squat still
  // ranks first but needs 390s, so side_plank (180s) is taken over calf_raise.
  // The last 110s fit nothing.
  ASSERT_EQ(result.exercises.size(), 2u);
  EXPECT_EQ(result.exercises[0].exercise_id, "big_row");
  EXPECT_EQ(result.exercises[1].exercise_id, "side_plank");
  EXPECT_EQ(result.exercises[0].estimated_seconds, 490);
  EXPECT_EQ(result.exercises[1].estimated_seconds, 180);
  EXPECT_EQ(result.actual_duration_seconds, 490 + 180 + kShortSessionOverheadSeconds);
}

TEST_P(SolverConformanceTest, RecoveryPushesRecentMusclesBack) {
  auto catalog = test_helpers::sampleCatalog();
  PrescriptionRequest request = makeRequest(20, Location::Hotel, {Goal::Strength});
  RecoveryWindows recovery;
  recovery.last_24h = {"chest", "triceps", "front_delts"};
  PackingResult result = solve(catalog, request, recovery);
  expectValidResult(catalog, request, result);
  ASSERT_FALSE(result.exercises.empty());
  EXPECT_EQ(result.exercises[0].exercise_id, "reverse_lunge");
  for (const auto& item : result.exercises) {
    if (item.exercise_id == "push_up") {
      EXPECT_NE(item.notes.find("Recently trained"), std::string::npos);
    }
  }
}

TEST_P(SolverConformanceTest, ExcludedMuscleNeverSelected) {
  auto catalog = test_helpers::sampleCatalog();
  PrescriptionRequest request = makeRequest(90, Location::Gym, {Goal::Hypertrophy});
  request.excluded_muscles = {"lats"};
  PackingResult result = solve(catalog, request);
  expectValidResult(catalog, request, result);
  for (const auto& item : result.exercises) {
    EXPECT_NE(item.exercise_id, "pull_up");
    EXPECT_NE(item.exercise_id, "dumbbell_row");
  }
}

TEST_P(SolverConformanceTest, LongGymSessionUsesWholeCatalogIfItFits) {
  auto catalog = test_helpers::sampleCatalog();
  PrescriptionRequest request = makeRequest(120, Location::Gym, {Goal::Mobility});
  PackingResult result = solve(catalog, request);
  expectValidResult(catalog, request, result);
  // Mobility is 2 x 10 with short rest; all thirteen exercises fit in 115 minutes.
  EXPECT_EQ(result.exercises.size(), catalog.size());
}

TEST_P(SolverConformanceTest, SyntheticCatalogsSatisfyInvariants) {
  const Location locations[] = {Location::Gym, Location::Home, Location::Park};
  const std::vector<Goal> goal_sets[] = {
      {Goal::Strength}, {Goal::Endurance, Goal::Mobility}, {}, {Goal::FatLoss}};
  uint32_t seed = 1;
  for (Location location : locations) {
    for (const auto& goals : goal_sets) {
      for (int minutes : {15, 29, 30, 60, 120}) {
        auto catalog = syntheticCatalog(seed++, 60);
        PrescriptionRequest request = makeRequest(minutes, location, goals);
        request.equipment = {"dumbbell", "band"};
        request.fitness_level = FitnessLevel::Intermediate;
        PackingResult result = solve(catalog, request);
        SCOPED_TRACE(testing::Message() << "seed " << seed - 1 << " minutes " << minutes);
        expectValidResult(catalog, request, result);
      }
    }
  }
}

TEST_P(SolverConformanceTest, LargeCatalogTerminates) {
  auto catalog = syntheticCatalog(4242, 500);
  PrescriptionRequest request = makeRequest(120, Location::Gym, {Goal::Endurance});
  PackingResult result = solve(catalog, request);
  expectValidResult(catalog, request, result);
  EXPECT_FALSE(result.exercises.empty());
}

INSTANTIATE_TEST_SUITE_P(Backends, SolverConformanceTest,
                         ::testing::Values(BackendKind::Greedy, BackendKind::Indexed),
                         [](const ::testing::TestParamInfo<BackendKind>& info) {
                           return std::string(backendKindToString(info.param));
                         });

// ---------------------------------------------------------------------------
// Backend parity
// ---------------------------------------------------------------------------

void expectSameResult(const PackingResult& lhs, const PackingResult& rhs) {
  ASSERT_EQ(lhs.exercises.size(), rhs.exercises.size());
  for (size_t idx = 0; idx < lhs.exercises.size(); ++idx) {
    EXPECT_EQ(lhs.exercises[idx].exercise_id, rhs.exercises[idx].exercise_id) << idx;
    EXPECT_EQ(lhs.exercises[idx].estimated_seconds, rhs.exercises[idx].estimated_seconds);
    EXPECT_EQ(lhs.exercises[idx].notes, rhs.exercises[idx].notes);
  }
  EXPECT_EQ(lhs.actual_duration_seconds, rhs.actual_duration_seconds);
  ASSERT_EQ(lhs.coverage.size(), rhs.coverage.size());
  for (const auto& [muscle_id, entry] : lhs.coverage.entries()) {
    const MuscleCoverageEntry* other = rhs.coverage.find(muscle_id);
    ASSERT_NE(other, nullptr);
    EXPECT_EQ(entry.total_sets, other->total_sets);
    EXPECT_EQ(entry.activation_level, other->activation_level);
  }
  ASSERT_EQ(lhs.substitutions.size(), rhs.substitutions.size());
  for (const auto& [exercise_id, alternatives] : lhs.substitutions) {
    const auto& other = rhs.substitutions.at(exercise_id);
    ASSERT_EQ(alternatives.size(), other.size()) << exercise_id;
    for (size_t idx = 0; idx < alternatives.size(); ++idx) {
      EXPECT_EQ(alternatives[idx].exercise_id, other[idx].exercise_id);
    }
  }
}

TEST(SolverParityTest, IndexedMatchesGreedy) {
  SolverConfig greedy_config;
  greedy_config.backend = BackendKind::Greedy;
  SolverConfig indexed_config;
  indexed_config.backend = BackendKind::Indexed;
  auto greedy = createSolverBackend(greedy_config);
  auto indexed = createSolverBackend(indexed_config);

  for (uint32_t seed = 100; seed < 140; ++seed) {
    auto catalog = syntheticCatalog(seed, 80);
    PrescriptionRequest request =
        makeRequest(15 + static_cast<int>(seed % 106),
                    static_cast<Location>(seed % kLocationCount),
                    {static_cast<Goal>(seed % kGoalCount)});
    request.equipment = {"dumbbell"};
    if (seed % 3 == 0) request.fitness_level = FitnessLevel::Beginner;
    if (seed % 4 == 0) request.excluded_muscles = {"core"};

    RecoveryWindows recovery;
    if (seed % 2 == 0) {
      recovery.last_24h = {"chest", "quads"};
      recovery.last_48h = {"lats"};
    }

    SCOPED_TRACE(testing::Message() << "seed " << seed);
    expectSameResult(greedy->solve(catalog, request, recovery),
                     indexed->solve(catalog, request, recovery));
  }
}

TEST(SolverParityTest, CustomWeightsMatch) {
  SolverConfig config;
  config.weights.muscle_coverage_gap = 0.1;
  config.weights.goal_alignment = 3.3;
  config.substitution_limit = 1;
  config.backend = BackendKind::Greedy;
  auto greedy = createSolverBackend(config);
  config.backend = BackendKind::Indexed;
  auto indexed = createSolverBackend(config);

  auto catalog = syntheticCatalog(7, 120);
  PrescriptionRequest request = makeRequest(75, Location::Gym, {Goal::Hypertrophy});
  expectSameResult(greedy->solve(catalog, request, RecoveryWindows()),
                   indexed->solve(catalog, request, RecoveryWindows()));
}

// ---------------------------------------------------------------------------
// Overhead
// ---------------------------------------------------------------------------

TEST(SolverBackendTest, WarmupCooldownOverhead) {
  EXPECT_EQ(warmupCooldownOverhead(15), kShortSessionOverheadSeconds);
  EXPECT_EQ(warmupCooldownOverhead(29), kShortSessionOverheadSeconds);
  EXPECT_EQ(warmupCooldownOverhead(30), kLongSessionOverheadSeconds);
  EXPECT_EQ(warmupCooldownOverhead(120), kLongSessionOverheadSeconds);
}

}  // namespace
}  // namespace liftpack
