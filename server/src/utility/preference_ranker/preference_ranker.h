#pragma once

#include <set>
#include <vector>

#include "matching_objects.h"

struct ScoredCandidate {
    UserId user_id;
    double score;
};

//returns the shadow submission for shadow_user_id, otherwise the submission stored inside input.submissions
//NOTE: throws std::out_of_range if user_id is neither
const Submission& getSubmissionForUser(
        const MatchingInput& input,
        UserId user_id,
        UserId shadow_user_id
);

//Builds the ranked candidate list for subject_id.
//Candidates are every user inside input.submissions (restricted to candidate_pool when it is set) except
// the subject, users inside input.recency_exclusion[subject_id] and pairs without enough shared answers.
// When the subject is the shadow, pairs without enough shared answers are kept and ranked last.
// Candidates are ranked by calculateDirectionalScore() using the subject's own scheme, highest first, with
// exact ties going to the lower user id.
//The shadow is appended as the final candidate unless the real candidates are non-empty and number at
// least config.shadow_candidate_threshold, the subject is the shadow itself, or candidate_pool is set and
// does not contain it.
PreferenceList buildPreferenceList(
        const MatchingInput& input,
        UserId subject_id,
        const MatchingConfiguration& config,
        const std::set<UserId>* candidate_pool = nullptr
);

//same as buildPreferenceList() except the scores are returned alongside the ids
std::vector<ScoredCandidate> buildScoredPreferenceList(
        const MatchingInput& input,
        UserId subject_id,
        const MatchingConfiguration& config,
        const std::set<UserId>* candidate_pool = nullptr
);

//Runs buildPreferenceList() for every id inside subject_ids. Lists are built in parallel, the result is
// identical to building them one at a time.
PreferenceLists buildPreferenceLists(
        const MatchingInput& input,
        const std::vector<UserId>& subject_ids,
        const MatchingConfiguration& config,
        const std::set<UserId>* candidate_pool = nullptr
);
