#include <set>
#include <deque>
#include <unordered_map>

#include "assignment_strategy.h"
#include "preference_ranker.h"

AssignmentResult StableMatcher::assign(const MatchingInput& input) {

    AssignmentResult result;
    result.strategy_used = MatchingStrategyType::STABLE;

    for (const auto& [user_id, submission] : input.submissions) {
        result.marriage[user_id] = std::nullopt;
    }

    PrimaryQuestionPartition partition = partitionByPrimaryQuestion(input.submissions);

    //patch the shadow into the smaller side so parity can be reached
    if (partition.side_a.size() < partition.side_b.size()) {
        partition.side_a.emplace_back(config.shadow_user_id);
    } else if (partition.side_b.size() < partition.side_a.size()) {
        partition.side_b.emplace_back(config.shadow_user_id);
    }

    const std::set<UserId> side_a_pool(partition.side_a.begin(), partition.side_a.end());
    const std::set<UserId> side_b_pool(partition.side_b.begin(), partition.side_b.end());

    const PreferenceLists proposer_lists = buildPreferenceLists(input, partition.side_a, config, &side_b_pool);
    const PreferenceLists receiver_lists = buildPreferenceLists(input, partition.side_b, config, &side_a_pool);

    //receiver -> (proposer -> position inside receiver preference list)
    std::unordered_map<UserId, std::unordered_map<UserId, size_t>> receiver_ranks;
    for (const auto& [receiver_id, preference_list] : receiver_lists) {
        auto& ranks = receiver_ranks[receiver_id];
        for (size_t i = 0; i < preference_list.size(); ++i) {
            ranks[preference_list[i]] = i;
        }
    }

    std::unordered_map<UserId, size_t> next_proposal_index;
    std::unordered_map<UserId, UserId> held_proposals;

    std::deque<UserId> free_proposers(partition.side_a.begin(), partition.side_a.end());

    while (!free_proposers.empty()) {
        const UserId proposer_id = free_proposers.front();
        free_proposers.pop_front();

        const PreferenceList& proposer_list = proposer_lists.at(proposer_id);
        size_t& index = next_proposal_index[proposer_id];

        //loop until the proposer is held or its list is exhausted
        while (index < proposer_list.size()) {
            const UserId receiver_id = proposer_list[index];
            index++;

            const auto& ranks = receiver_ranks[receiver_id];
            auto proposer_rank = ranks.find(proposer_id);

            if (proposer_rank == ranks.end()) { //receiver never accepts this proposer
                continue;
            }

            auto held = held_proposals.find(receiver_id);
            if (held == held_proposals.end()) {
                held_proposals[receiver_id] = proposer_id;
                break;
            }

            if (proposer_rank->second < ranks.at(held->second)) {
                free_proposers.emplace_back(held->second);
                held->second = proposer_id;
                break;
            }
        }
    }

    for (const auto& [receiver_id, proposer_id] : held_proposals) {
        result.marriage[receiver_id] = proposer_id;
        result.marriage[proposer_id] = receiver_id;

        if (receiver_id == config.shadow_user_id || proposer_id == config.shadow_user_id) {
            result.shadow_used = true;
        }
    }

    result.total_score = calculateMarriageTotalScore(result.marriage, input, config);

    return result;
}
