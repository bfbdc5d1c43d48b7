#include <map>

#include "assignment_strategy.h"
#include "preference_ranker.h"
#include "similarity_scorer.h"

PrimaryQuestionPartition partitionByPrimaryQuestion(const Submissions& submissions) {
    PrimaryQuestionPartition partition;

    for (const auto& [user_id, submission] : submissions) {
        auto primary_answer = submission.answers.find(submission.primary_aorb_id);

        if (primary_answer == submission.answers.end()
            || primary_answer->second == AorbAnswer::UNANSWERED) {
            if (partition.side_b.size() < partition.side_a.size()) {
                partition.side_b.emplace_back(user_id);
            } else {
                partition.side_a.emplace_back(user_id);
            }
        } else if (primary_answer->second == AorbAnswer::OPTION_A) {
            partition.side_a.emplace_back(user_id);
        } else {
            partition.side_b.emplace_back(user_id);
        }
    }

    return partition;
}

std::optional<std::string> findMarriageInvariantViolation(
        const Marriage& marriage,
        const Submissions& submissions,
        UserId shadow_user_id
) {
    auto is_known_user = [&](UserId user_id) {
        return user_id == shadow_user_id || submissions.contains(user_id);
    };

    //partner -> user that claimed it
    std::map<UserId, UserId> claimed_partners;

    for (const auto& [user_id, partner] : marriage) {
        if (!is_known_user(user_id)) {
            return "User " + std::to_string(user_id) + " is not part of the round population.";
        }

        if (!partner) {
            continue;
        }

        const UserId partner_id = *partner;

        if (partner_id == user_id) {
            return "User " + std::to_string(user_id) + " is matched to itself.";
        }

        if (!is_known_user(partner_id)) {
            return "User " + std::to_string(user_id) + " is matched to " + std::to_string(partner_id) +
                   " which is not part of the round population.";
        }

        auto [claimed_it, inserted] = claimed_partners.insert({partner_id, user_id});
        if (!inserted) {
            return "User " + std::to_string(partner_id) + " is the partner of both " +
                   std::to_string(claimed_it->second) + " and " + std::to_string(user_id) + ".";
        }

        if (user_id != shadow_user_id && partner_id != shadow_user_id) {
            auto reverse = marriage.find(partner_id);
            if (reverse == marriage.end() || reverse->second != user_id) {
                return "Marriage is not symmetric for users " + std::to_string(user_id) +
                       " and " + std::to_string(partner_id) + ".";
            }
        }
    }

    return std::nullopt;
}

double calculateMarriageTotalScore(
        const Marriage& marriage,
        const MatchingInput& input,
        const MatchingConfiguration& config
) {
    double total = 0;
    for (const auto& [user_id, partner] : marriage) {
        //count each pair once, the shadow side of a shadow pair is skipped
        if (!partner
            || user_id == config.shadow_user_id
            || (*partner != config.shadow_user_id && *partner < user_id)) {
            continue;
        }

        const double score = calculatePairScore(
                getSubmissionForUser(input, user_id, config.shadow_user_id),
                getSubmissionForUser(input, *partner, config.shadow_user_id),
                input.question_bank,
                config.minimum_shared_answers
        );

        if (isEligiblePairScore(score)) {
            total += score;
        }
    }

    return total;
}
