#include <vector>
#include <utility>
#include <optional>
#include <algorithm>

#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

#include "assignment_strategy.h"
#include "similarity_scorer.h"
#include "matching_values.h"

namespace {

    //dense symmetric matrix of pair scores indexed by position inside the participants vector
    class PairScoreMatrix {
    public:
        PairScoreMatrix(
                const MatchingInput& input,
                const std::vector<UserId>& participants,
                const MatchingConfiguration& config
        ) : size(participants.size()),
            scores(participants.size() * participants.size(), INELIGIBLE_PAIR_SCORE) {

            tbb::parallel_for(
                    tbb::blocked_range<size_t>(0, size),
                    [&](const tbb::blocked_range<size_t>& range) {
                        for (size_t i = range.begin(); i != range.end(); ++i) {
                            const Submission& first = input.submissions.at(participants[i]);
                            for (size_t j = i + 1; j < size; ++j) {
                                if (recentlyMatched(input.recency_exclusion, participants[i], participants[j])) {
                                    continue;
                                }

                                const double score = calculatePairScore(
                                        first,
                                        input.submissions.at(participants[j]),
                                        input.question_bank,
                                        config.minimum_shared_answers
                                );

                                //task i is the only writer of cells (i, j) and (j, i) for j > i
                                scores[i * size + j] = score;
                                scores[j * size + i] = score;
                            }
                        }
                    }
            );
        }

        [[nodiscard]] double at(size_t i, size_t j) const {
            return scores[i * size + j];
        }

        [[nodiscard]] bool eligible(size_t i, size_t j) const {
            return i != j && isEligiblePairScore(at(i, j));
        }

    private:
        static bool recentlyMatched(const RecencyExclusion& recency_exclusion, UserId first, UserId second) {
            auto first_it = recency_exclusion.find(first);
            if (first_it != recency_exclusion.end() && first_it->second.contains(second)) {
                return true;
            }
            auto second_it = recency_exclusion.find(second);
            return second_it != recency_exclusion.end() && second_it->second.contains(first);
        }

        const size_t size;
        std::vector<double> scores;
    };

    struct CommittedPair {
        size_t first;
        size_t second;
    };

    struct CandidatePair {
        size_t first;
        size_t second;
        double score;
    };

    double sumPairScores(const PairScoreMatrix& matrix, const std::vector<CommittedPair>& pairs) {
        double total = 0;
        for (const CommittedPair& pair : pairs) {
            total += matrix.at(pair.first, pair.second);
        }
        return total;
    }

}

AssignmentResult LocalSearchMatcher::assign(const MatchingInput& input) {

    AssignmentResult result;
    result.strategy_used = MatchingStrategyType::LOCAL_SEARCH;

    std::vector<UserId> participants;
    participants.reserve(input.submissions.size());
    for (const auto& [user_id, submission] : input.submissions) {
        participants.emplace_back(user_id);
        result.marriage[user_id] = std::nullopt;
    }

    const PairScoreMatrix matrix(input, participants, config);

    //greedy initialization
    std::vector<CandidatePair> candidate_pairs;
    for (size_t i = 0; i < participants.size(); ++i) {
        for (size_t j = i + 1; j < participants.size(); ++j) {
            if (matrix.eligible(i, j)) {
                candidate_pairs.emplace_back(CandidatePair{i, j, matrix.at(i, j)});
            }
        }
    }

    std::sort(candidate_pairs.begin(), candidate_pairs.end(),
              [](const CandidatePair& lhs, const CandidatePair& rhs) {
                  if (lhs.score != rhs.score) {
                      return lhs.score > rhs.score;
                  } else if (lhs.first != rhs.first) {
                      return lhs.first < rhs.first;
                  }
                  return lhs.second < rhs.second;
              });

    std::vector<bool> committed(participants.size(), false);
    std::vector<CommittedPair> pairs;

    for (const CandidatePair& candidate : candidate_pairs) {
        if (!committed[candidate.first] && !committed[candidate.second]) {
            committed[candidate.first] = true;
            committed[candidate.second] = true;
            pairs.emplace_back(CommittedPair{candidate.first, candidate.second});
        }
    }

    //pairwise swap improvement
    result.initial_local_search_score = sumPairScores(matrix, pairs);

    bool improved = true;
    while (improved && result.passes_run < config.local_search_max_passes) {
        improved = false;
        result.passes_run++;

        for (size_t x = 0; x < pairs.size(); ++x) {
            for (size_t y = x + 1; y < pairs.size(); ++y) {
                const size_t a = pairs[x].first;
                const size_t b = pairs[x].second;
                const size_t c = pairs[y].first;
                const size_t d = pairs[y].second;

                const double current_score = matrix.at(a, b) + matrix.at(c, d);

                double best_score = current_score;
                std::optional<std::pair<CommittedPair, CommittedPair>> best_swap;

                if (matrix.eligible(a, c) && matrix.eligible(b, d)) {
                    const double swap_score = matrix.at(a, c) + matrix.at(b, d);
                    if (swap_score > best_score) {
                        best_score = swap_score;
                        best_swap = std::make_pair(CommittedPair{a, c}, CommittedPair{b, d});
                    }
                }

                if (matrix.eligible(a, d) && matrix.eligible(b, c)) {
                    const double swap_score = matrix.at(a, d) + matrix.at(b, c);
                    if (swap_score > best_score) {
                        best_score = swap_score;
                        best_swap = std::make_pair(CommittedPair{a, d}, CommittedPair{b, c});
                    }
                }

                if (best_swap && best_score - current_score > matching_values::LOCAL_SEARCH_MINIMUM_IMPROVEMENT) {
                    pairs[x] = best_swap->first;
                    pairs[y] = best_swap->second;
                    result.applied_swap_gains.emplace_back(best_score - current_score);
                    result.swaps_applied++;
                    improved = true;
                }
            }
        }
    }

    result.final_local_search_score = sumPairScores(matrix, pairs);

    for (const CommittedPair& pair : pairs) {
        result.marriage[participants[pair.first]] = participants[pair.second];
        result.marriage[participants[pair.second]] = participants[pair.first];
    }

    //the shadow absorbs the leftover user that scores best against it, ties go to the lower id
    std::optional<UserId> shadow_partner;
    double shadow_partner_score = INELIGIBLE_PAIR_SCORE;
    for (size_t i = 0; i < participants.size(); ++i) {
        if (committed[i]) {
            continue;
        }

        const double score = calculatePairScore(
                input.submissions.at(participants[i]),
                input.shadow_submission,
                input.question_bank,
                config.minimum_shared_answers
        );

        if (!shadow_partner || score > shadow_partner_score) {
            shadow_partner = participants[i];
            shadow_partner_score = score;
        }
    }

    if (shadow_partner) {
        result.marriage[*shadow_partner] = config.shadow_user_id;
        result.marriage[config.shadow_user_id] = *shadow_partner;
        result.shadow_used = true;
    }

    result.total_score = calculateMarriageTotalScore(result.marriage, input, config);

    return result;
}
