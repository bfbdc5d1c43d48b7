#pragma once

#include <chrono>

#include "matching_objects.h"

//Generates a fresh answer vector for the shadow participant. Every question in the bank is answered,
// OPTION_B is chosen with probability equal to the question mean. The same seed and bank will always
// produce the same profile.
//The primary question of the shadow is the lowest question id (0 if the bank is empty), it is never
// used to partition the shadow because the shadow is patched into whichever side is smaller.
Submission rollShadowProfile(
        const QuestionBank& question_bank,
        unsigned long long seed
);

//seed used for the roll of a specific round
unsigned long long generateShadowSeed(
        unsigned long long configured_seed,
        const std::chrono::milliseconds& round_start_time
);
