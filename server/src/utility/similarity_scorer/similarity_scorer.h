#pragma once

#include <limits>

#include "matching_objects.h"

//score given to a pair that must never be matched (no shared answers or too few of them)
inline const double INELIGIBLE_PAIR_SCORE = std::numeric_limits<double>::lowest();

inline bool isEligiblePairScore(double score) {
    return score > INELIGIBLE_PAIR_SCORE;
}

//Scores candidate_answers from the point of view of a subject holding the passed directive.
// Only questions answered by both users (and present in question_bank) are considered. Each shared
// question contributes +variance if the agreement test for the directive passes and -variance
// otherwise, the sum is then divided by the number of shared questions.
//SEEK_SIMILAR agreement test: same answer. SEEK_COMPLEMENTARY agreement test: different answers.
//Returns INELIGIBLE_PAIR_SCORE when fewer than minimum_shared_answers questions are shared (or none).
double calculateDirectionalScore(
        const AnswerVector& subject_answers,
        const AnswerVector& candidate_answers,
        AssociationScheme directive,
        const QuestionBank& question_bank,
        int minimum_shared_answers
);

//symmetric score for a pair, calculatePairScore(a, b) == calculatePairScore(b, a)
//when the schemes match this is the directional score, when they differ it is the mean of
// both directional scores
double calculatePairScore(
        const Submission& first,
        const Submission& second,
        const QuestionBank& question_bank,
        int minimum_shared_answers
);
