#pragma once

#include <string>
#include <optional>

#include "matching_objects.h"

//builds an answer vector from a string of 'A', 'B' and '-' (unanswered), question ids start at 1
AnswerVector buildAnswerVector(const std::string& letters);

//question ids 1..number_questions all with the passed mean
QuestionBank buildUniformQuestionBank(int number_questions, double mean = 0.5);

std::optional<UserId> partnerOf(const Marriage& marriage, UserId user_id);
