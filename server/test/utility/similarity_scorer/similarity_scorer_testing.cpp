#include <random>

#include "gtest/gtest.h"

#include "similarity_scorer.h"
#include "generate_randoms.h"

class SimilarityScorerTesting : public ::testing::Test {
protected:

    QuestionBank question_bank{
            {1, AorbQuestion{1, "Cats", "Dogs", 0.5}},
            {2, AorbQuestion{2, "Beach", "Mountains", 0.5}},
            {3, AorbQuestion{3, "Tea", "Coffee", 0.5}}
    };

    AnswerVector all_a{
            {1, AorbAnswer::OPTION_A},
            {2, AorbAnswer::OPTION_A},
            {3, AorbAnswer::OPTION_A}
    };

    AnswerVector all_b{
            {1, AorbAnswer::OPTION_B},
            {2, AorbAnswer::OPTION_B},
            {3, AorbAnswer::OPTION_B}
    };
};

TEST_F(SimilarityScorerTesting, identicalAnswers_seekSimilar) {
    const double score = calculateDirectionalScore(
            all_a, all_a, AssociationScheme::SEEK_SIMILAR, question_bank, 1
    );

    EXPECT_DOUBLE_EQ(score, 0.25);
}

TEST_F(SimilarityScorerTesting, identicalAnswers_seekComplementary) {
    const double score = calculateDirectionalScore(
            all_a, all_a, AssociationScheme::SEEK_COMPLEMENTARY, question_bank, 1
    );

    EXPECT_DOUBLE_EQ(score, -0.25);
}

TEST_F(SimilarityScorerTesting, oppositeAnswers_seekComplementary) {
    const double score = calculateDirectionalScore(
            all_a, all_b, AssociationScheme::SEEK_COMPLEMENTARY, question_bank, 1
    );

    EXPECT_DOUBLE_EQ(score, 0.25);
}

TEST_F(SimilarityScorerTesting, scoreIsWeightedByVariance) {
    question_bank[1].mean = 0.9; //variance 0.09
    question_bank[2].mean = 0.5; //variance 0.25

    AnswerVector first{
            {1, AorbAnswer::OPTION_A},
            {2, AorbAnswer::OPTION_A}
    };

    AnswerVector second{
            {1, AorbAnswer::OPTION_A},
            {2, AorbAnswer::OPTION_B}
    };

    const double score = calculateDirectionalScore(
            first, second, AssociationScheme::SEEK_SIMILAR, question_bank, 1
    );

    EXPECT_NEAR(score, (0.09 - 0.25) / 2.0, 1e-12);
}

TEST_F(SimilarityScorerTesting, noSharedAnswers_ineligible) {
    AnswerVector first{{1, AorbAnswer::OPTION_A}};
    AnswerVector second{{2, AorbAnswer::OPTION_A}};

    const double score = calculateDirectionalScore(
            first, second, AssociationScheme::SEEK_SIMILAR, question_bank, 1
    );

    EXPECT_FALSE(isEligiblePairScore(score));
}

TEST_F(SimilarityScorerTesting, noSharedAnswers_minimumZero_stillIneligible) {
    AnswerVector first{{1, AorbAnswer::OPTION_A}};
    AnswerVector second{{2, AorbAnswer::OPTION_A}};

    const double score = calculateDirectionalScore(
            first, second, AssociationScheme::SEEK_SIMILAR, question_bank, 0
    );

    EXPECT_FALSE(isEligiblePairScore(score));
}

TEST_F(SimilarityScorerTesting, belowMinimumSharedAnswers_ineligible) {
    AnswerVector first{
            {1, AorbAnswer::OPTION_A},
            {2, AorbAnswer::OPTION_A}
    };

    EXPECT_FALSE(isEligiblePairScore(calculateDirectionalScore(
            first, all_a, AssociationScheme::SEEK_SIMILAR, question_bank, 3
    )));

    EXPECT_TRUE(isEligiblePairScore(calculateDirectionalScore(
            first, all_a, AssociationScheme::SEEK_SIMILAR, question_bank, 2
    )));
}

TEST_F(SimilarityScorerTesting, unansweredQuestionsSkipped) {
    AnswerVector first = all_a;
    first[3] = AorbAnswer::UNANSWERED;

    AnswerVector second = all_a;
    second[3] = AorbAnswer::OPTION_B;

    //two shared answers remain
    EXPECT_TRUE(isEligiblePairScore(calculateDirectionalScore(
            first, second, AssociationScheme::SEEK_SIMILAR, question_bank, 2
    )));
    EXPECT_FALSE(isEligiblePairScore(calculateDirectionalScore(
            first, second, AssociationScheme::SEEK_SIMILAR, question_bank, 3
    )));

    //question 3 would have lowered the score if it counted
    EXPECT_DOUBLE_EQ(
            calculateDirectionalScore(first, second, AssociationScheme::SEEK_SIMILAR, question_bank, 1),
            0.25
    );
}

TEST_F(SimilarityScorerTesting, questionsMissingFromBankSkipped) {
    AnswerVector first = all_a;
    first[4] = AorbAnswer::OPTION_A;

    AnswerVector second = all_a;
    second[4] = AorbAnswer::OPTION_B;

    EXPECT_FALSE(isEligiblePairScore(calculateDirectionalScore(
            first, second, AssociationScheme::SEEK_SIMILAR, question_bank, 4
    )));
    EXPECT_DOUBLE_EQ(
            calculateDirectionalScore(first, second, AssociationScheme::SEEK_SIMILAR, question_bank, 1),
            0.25
    );
}

TEST_F(SimilarityScorerTesting, pairScore_sameScheme) {
    const Submission first(all_a, 1, AssociationScheme::SEEK_SIMILAR);
    const Submission second(all_a, 2, AssociationScheme::SEEK_SIMILAR);

    EXPECT_DOUBLE_EQ(calculatePairScore(first, second, question_bank, 1), 0.25);
}

TEST_F(SimilarityScorerTesting, pairScore_mixedScheme_meanOfDirections) {
    const Submission first(all_a, 1, AssociationScheme::SEEK_SIMILAR);
    const Submission second(all_a, 2, AssociationScheme::SEEK_COMPLEMENTARY);

    //+0.25 from the first user's point of view, -0.25 from the second
    EXPECT_DOUBLE_EQ(calculatePairScore(first, second, question_bank, 1), 0.0);
    EXPECT_DOUBLE_EQ(calculatePairScore(second, first, question_bank, 1), 0.0);
}

TEST_F(SimilarityScorerTesting, pairScore_ineligiblePairStaysIneligible) {
    const Submission first(AnswerVector{{1, AorbAnswer::OPTION_A}}, 1, AssociationScheme::SEEK_SIMILAR);
    const Submission second(AnswerVector{{2, AorbAnswer::OPTION_A}}, 2, AssociationScheme::SEEK_COMPLEMENTARY);

    EXPECT_FALSE(isEligiblePairScore(calculatePairScore(first, second, question_bank, 1)));
    EXPECT_FALSE(isEligiblePairScore(calculatePairScore(second, first, question_bank, 1)));
}

TEST_F(SimilarityScorerTesting, pairScore_symmetricOnRandomPopulation) {
    std::mt19937_64 generator(42);

    const QuestionBank random_bank = generateRandomQuestionBank(20, generator);
    const Submissions submissions = generateRandomSubmissions(40, random_bank, generator, 0.6);

    for (const auto& [first_id, first] : submissions) {
        for (const auto& [second_id, second] : submissions) {
            const double forward = calculatePairScore(first, second, random_bank, 1);
            const double backward = calculatePairScore(second, first, random_bank, 1);

            ASSERT_EQ(isEligiblePairScore(forward), isEligiblePairScore(backward));
            if (isEligiblePairScore(forward)) {
                EXPECT_NEAR(forward, backward, 1e-12) << first_id << ' ' << second_id;
            }
        }
    }
}

TEST_F(SimilarityScorerTesting, scoreBoundedByQuarter) {
    std::mt19937_64 generator(7);

    const QuestionBank random_bank = generateRandomQuestionBank(15, generator);
    const Submissions submissions = generateRandomSubmissions(30, random_bank, generator);

    for (const auto& [first_id, first] : submissions) {
        for (const auto& [second_id, second] : submissions) {
            const double score = calculateDirectionalScore(
                    first.answers, second.answers, first.scheme, random_bank, 1
            );
            if (isEligiblePairScore(score)) {
                EXPECT_LE(score, 0.25);
                EXPECT_GE(score, -0.25);
            }
        }
    }
}
