#include <algorithm>

#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

#include "preference_ranker.h"
#include "similarity_scorer.h"

const Submission& getSubmissionForUser(
        const MatchingInput& input,
        UserId user_id,
        UserId shadow_user_id
) {
    if (user_id == shadow_user_id) {
        return input.shadow_submission;
    }

    return input.submissions.at(user_id);
}

std::vector<ScoredCandidate> buildScoredPreferenceList(
        const MatchingInput& input,
        UserId subject_id,
        const MatchingConfiguration& config,
        const std::set<UserId>* candidate_pool
) {

    const UserId shadow_id = config.shadow_user_id;
    const Submission& subject = getSubmissionForUser(input, subject_id, shadow_id);

    const std::set<UserId>* excluded_users = nullptr;
    if (auto recency_it = input.recency_exclusion.find(subject_id);
        recency_it != input.recency_exclusion.end()) {
        excluded_users = &recency_it->second;
    }

    std::vector<ScoredCandidate> scored_candidates;

    auto consider_candidate = [&](UserId candidate_id, const Submission& candidate) {
        if (candidate_id == subject_id
            || candidate_id == shadow_id
            || (excluded_users != nullptr && excluded_users->contains(candidate_id))) {
            return;
        }

        const double score = calculateDirectionalScore(
                subject.answers,
                candidate.answers,
                subject.scheme,
                input.question_bank,
                config.minimum_shared_answers
        );

        //the shadow accepts every real user, ineligible scores sort to the back of its list
        if (subject_id == shadow_id || isEligiblePairScore(score)) {
            scored_candidates.emplace_back(ScoredCandidate{candidate_id, score});
        }
    };

    if (candidate_pool == nullptr) {
        for (const auto& [candidate_id, candidate] : input.submissions) {
            consider_candidate(candidate_id, candidate);
        }
    } else {
        for (UserId candidate_id : *candidate_pool) {
            auto candidate_it = input.submissions.find(candidate_id);
            if (candidate_it != input.submissions.end()) {
                consider_candidate(candidate_id, candidate_it->second);
            }
        }
    }

    std::sort(scored_candidates.begin(), scored_candidates.end(),
              [](const ScoredCandidate& lhs, const ScoredCandidate& rhs) {
                  if (lhs.score != rhs.score) {
                      return lhs.score > rhs.score;
                  }
                  return lhs.user_id < rhs.user_id;
              });

    const bool shadow_in_pool = candidate_pool == nullptr || candidate_pool->contains(shadow_id);

    if (subject_id != shadow_id
        && shadow_in_pool
        && (scored_candidates.empty() || scored_candidates.size() < config.shadow_candidate_threshold)) {

        //the shadow is always last and never needs shared answers, so it is given its real score
        // for diagnostics only
        const double shadow_score = calculateDirectionalScore(
                subject.answers,
                input.shadow_submission.answers,
                subject.scheme,
                input.question_bank,
                config.minimum_shared_answers
        );

        scored_candidates.emplace_back(ScoredCandidate{shadow_id, shadow_score});
    }

    return scored_candidates;
}

PreferenceList buildPreferenceList(
        const MatchingInput& input,
        UserId subject_id,
        const MatchingConfiguration& config,
        const std::set<UserId>* candidate_pool
) {
    const std::vector<ScoredCandidate> scored_candidates = buildScoredPreferenceList(
            input,
            subject_id,
            config,
            candidate_pool
    );

    PreferenceList preference_list;
    preference_list.reserve(scored_candidates.size());
    for (const ScoredCandidate& candidate : scored_candidates) {
        preference_list.emplace_back(candidate.user_id);
    }

    return preference_list;
}

PreferenceLists buildPreferenceLists(
        const MatchingInput& input,
        const std::vector<UserId>& subject_ids,
        const MatchingConfiguration& config,
        const std::set<UserId>* candidate_pool
) {
    std::vector<PreferenceList> built_lists(subject_ids.size());

    //each index is written by exactly one task
    tbb::parallel_for(
            tbb::blocked_range<size_t>(0, subject_ids.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    built_lists[i] = buildPreferenceList(input, subject_ids[i], config, candidate_pool);
                }
            }
    );

    PreferenceLists preference_lists;
    for (size_t i = 0; i < subject_ids.size(); ++i) {
        preference_lists[subject_ids[i]] = std::move(built_lists[i]);
    }

    return preference_lists;
}
