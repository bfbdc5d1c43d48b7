#pragma once

#include <map>
#include <set>
#include <vector>
#include <string>
#include <chrono>
#include <cstdint>
#include <optional>

using UserId = long long;
using AorbId = int;

//stored values follow the aorb_answers convention, 255 means the question was never answered
enum class AorbAnswer : std::uint8_t {
    OPTION_A = 0,
    OPTION_B = 1,
    UNANSWERED = 255
};

enum class AssociationScheme : int {
    SEEK_SIMILAR = 0,
    SEEK_COMPLEMENTARY = 1
};

struct AorbQuestion {
    AorbId id = 0;
    std::string option_a;
    std::string option_b;

    //fraction of the population answering OPTION_B
    double mean = 0.5;

    [[nodiscard]] double variance() const {
        return mean * (1.0 - mean);
    }
};

using QuestionBank = std::map<AorbId, AorbQuestion>;

using AnswerVector = std::map<AorbId, AorbAnswer>;

struct Submission {
    AnswerVector answers;
    AorbId primary_aorb_id = 0;
    AssociationScheme scheme = AssociationScheme::SEEK_SIMILAR;

    Submission() = default;

    Submission(
            AnswerVector _answers,
            AorbId _primary_aorb_id,
            AssociationScheme _scheme
    ) : answers(std::move(_answers)),
        primary_aorb_id(_primary_aorb_id),
        scheme(_scheme) {}
};

using Submissions = std::map<UserId, Submission>;

using RecencyExclusion = std::map<UserId, std::set<UserId>>;

using PreferenceList = std::vector<UserId>;

using PreferenceLists = std::map<UserId, PreferenceList>;

using Marriage = std::map<UserId, std::optional<UserId>>;

//everything an assignment strategy needs for a single round
struct MatchingInput {
    const Submissions& submissions;
    const RecencyExclusion& recency_exclusion;
    const QuestionBank& question_bank;

    //the rolled shadow profile for this round
    const Submission& shadow_submission;
};

enum class MatchingStrategyType {
    STABLE,
    LOCAL_SEARCH,
    AUTOMATIC
};

std::string matchingStrategyTypeToString(MatchingStrategyType strategy_type);

//returns std::nullopt if the string does not name a strategy
std::optional<MatchingStrategyType> matchingStrategyTypeFromString(const std::string& strategy_name);

struct MatchingConfiguration {
    std::chrono::milliseconds matching_interval;
    std::chrono::milliseconds failed_round_back_off;
    int recency_window_days;
    int minimum_shared_answers;
    size_t shadow_candidate_threshold;
    MatchingStrategyType strategy_type;
    size_t local_search_population_threshold;
    double local_search_skew_threshold;
    int local_search_max_passes;
    UserId shadow_user_id;
    unsigned long long shadow_seed;

    //all values set from matching_values
    MatchingConfiguration();
};

//Applies the optional CLASH_MATCH_STRATEGY and CLASH_MATCH_INTERVAL_SECONDS overrides. Returns false and
// sets error_message if a variable is set to an invalid value, config is not modified in that case.
bool applyEnvironmentOverrides(
        MatchingConfiguration& config,
        std::string& error_message
);

struct MatchRoundResult {
    std::chrono::milliseconds round_start_time{-1};
    std::chrono::milliseconds round_duration{0};
    MatchingStrategyType strategy_used = MatchingStrategyType::STABLE;
    size_t number_participants = 0;
    size_t number_pairs = 0;
    size_t number_unmatched = 0;
    bool shadow_used = false;
    double total_score = 0;
    int swaps_applied = 0;
    bool successful = false;
};
