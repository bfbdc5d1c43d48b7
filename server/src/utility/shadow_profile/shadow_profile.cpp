#include <random>
#include <algorithm>

#include "shadow_profile.h"

Submission rollShadowProfile(
        const QuestionBank& question_bank,
        unsigned long long seed
) {
    std::mt19937_64 generator(seed);

    AnswerVector answers;
    for (const auto& [aorb_id, question] : question_bank) {
        //means are maintained outside this server, clamp in case of drift
        const double probability_of_b = std::clamp(question.mean, 0.0, 1.0);
        std::bernoulli_distribution choose_b(probability_of_b);

        answers[aorb_id] = choose_b(generator) ? AorbAnswer::OPTION_B : AorbAnswer::OPTION_A;
    }

    const AorbId primary_aorb_id = question_bank.empty() ? 0 : question_bank.begin()->first;

    return Submission{
        std::move(answers),
        primary_aorb_id,
        AssociationScheme::SEEK_SIMILAR
    };
}

unsigned long long generateShadowSeed(
        unsigned long long configured_seed,
        const std::chrono::milliseconds& round_start_time
) {
    return configured_seed ^ static_cast<unsigned long long>(round_start_time.count());
}
