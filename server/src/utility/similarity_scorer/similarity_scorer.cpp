#include "similarity_scorer.h"

//calls function_to_run(question, first_answer, second_answer) for every question both vectors answered
template <typename Func>
static void forEachSharedAnswer(
        const AnswerVector& first_answers,
        const AnswerVector& second_answers,
        const QuestionBank& question_bank,
        Func function_to_run
) {
    //both maps are ordered by question id, so walk them together
    auto first_it = first_answers.begin();
    auto second_it = second_answers.begin();

    while (first_it != first_answers.end() && second_it != second_answers.end()) {
        if (first_it->first < second_it->first) {
            ++first_it;
        } else if (second_it->first < first_it->first) {
            ++second_it;
        } else {
            if (first_it->second != AorbAnswer::UNANSWERED
                && second_it->second != AorbAnswer::UNANSWERED) {
                auto question = question_bank.find(first_it->first);
                if (question != question_bank.end()) {
                    function_to_run(question->second, first_it->second, second_it->second);
                }
            }
            ++first_it;
            ++second_it;
        }
    }
}

double calculateDirectionalScore(
        const AnswerVector& subject_answers,
        const AnswerVector& candidate_answers,
        AssociationScheme directive,
        const QuestionBank& question_bank,
        int minimum_shared_answers
) {

    int shared = 0;
    double total = 0;

    forEachSharedAnswer(
            subject_answers,
            candidate_answers,
            question_bank,
            [&](const AorbQuestion& question, AorbAnswer subject_answer, AorbAnswer candidate_answer) {
                const bool same_answer = subject_answer == candidate_answer;
                const bool agreement = directive == AssociationScheme::SEEK_SIMILAR ? same_answer : !same_answer;

                total += agreement ? question.variance() : -question.variance();
                shared++;
            }
    );

    if (shared == 0 || shared < minimum_shared_answers) {
        return INELIGIBLE_PAIR_SCORE;
    }

    return total / shared;
}

double calculatePairScore(
        const Submission& first,
        const Submission& second,
        const QuestionBank& question_bank,
        int minimum_shared_answers
) {
    const double first_score = calculateDirectionalScore(
            first.answers,
            second.answers,
            first.scheme,
            question_bank,
            minimum_shared_answers
    );

    if (first.scheme == second.scheme || !isEligiblePairScore(first_score)) {
        return first_score;
    }

    const double second_score = calculateDirectionalScore(
            second.answers,
            first.answers,
            second.scheme,
            question_bank,
            minimum_shared_answers
    );

    return (first_score + second_score) / 2.0;
}
