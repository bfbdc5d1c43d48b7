#pragma once

#include <random>

#include "matching_objects.h"

//question ids are 1..number_questions, means are uniform inside [0.05, 0.95]
QuestionBank generateRandomQuestionBank(
        int number_questions,
        std::mt19937_64& generator
);

//User ids are 1..number_users. Every question is answered with probability answer_probability (otherwise
// it is stored as UNANSWERED). Primary questions and schemes are random.
Submissions generateRandomSubmissions(
        size_t number_users,
        const QuestionBank& question_bank,
        std::mt19937_64& generator,
        double answer_probability = 0.8
);

//Symmetric exclusion, each user is excluded from roughly exclusion_probability of the others.
RecencyExclusion generateRandomRecencyExclusion(
        const Submissions& submissions,
        std::mt19937_64& generator,
        double exclusion_probability = 0.1
);
