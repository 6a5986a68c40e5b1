/**
 * Parsing of Skeptic, Empath and Reporter replies.
 * Asserts:
 * - Scores outside their scale are rejected, including integers wider than int.
 * - Fractional scores are rejected; integral doubles are accepted.
 * - Verdict confidence is bounded; bad soft-skill ratings are dropped.
 *
 * Run from build dir: ./test_evaluators
 */

#include "behavioral_evaluator.h"
#include "logger.h"
#include "report_generator.h"
#include "session_state.h"
#include "technical_evaluator.h"
#include "test_support.h"
#include <iostream>

using namespace interview_coach;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::ERROR);

    const long long wraps_to_nine = 4294967305LL;  // 2^32 + 9

    // --- technical score bounds ---
    {
        auto ok = TechnicalEvaluator::parse(test_support::skeptic_reply(10, "accurate", "deep"));
        ASSERT(ok.is_ok());
        ASSERT(ok.value().score == 10);

        auto zero = TechnicalEvaluator::parse(test_support::skeptic_reply(0, "incorrect", "superficial"));
        ASSERT(zero.is_ok());
        ASSERT(zero.value().score == 0);

        ASSERT(TechnicalEvaluator::parse(test_support::skeptic_reply(11)).is_error());
        ASSERT(TechnicalEvaluator::parse(test_support::skeptic_reply(-1)).is_error());

        auto wide = test_support::skeptic_reply(6);
        wide["score"] = wraps_to_nine;
        auto wide_result = TechnicalEvaluator::parse(wide);
        ASSERT(wide_result.is_error());
        ASSERT(wide_result.error().type == ErrorType::SchemaViolation);

        auto wide_negative = test_support::skeptic_reply(6);
        wide_negative["score"] = -wraps_to_nine;
        ASSERT(TechnicalEvaluator::parse(wide_negative).is_error());

        auto huge_double = test_support::skeptic_reply(6);
        huge_double["score"] = 1e300;
        ASSERT(TechnicalEvaluator::parse(huge_double).is_error());

        auto unsigned_wide = test_support::skeptic_reply(6);
        unsigned_wide["score"] = 18446744073709551615ULL;
        ASSERT(TechnicalEvaluator::parse(unsigned_wide).is_error());

        auto fractional = test_support::skeptic_reply(6);
        fractional["score"] = 6.5;
        ASSERT(TechnicalEvaluator::parse(fractional).is_error());

        auto integral_double = test_support::skeptic_reply(6);
        integral_double["score"] = 7.0;
        auto integral = TechnicalEvaluator::parse(integral_double);
        ASSERT(integral.is_ok());
        ASSERT(integral.value().score == 7);

        auto text = test_support::skeptic_reply(6);
        text["score"] = "7";
        ASSERT(TechnicalEvaluator::parse(text).is_error());
    }

    // --- behavioural rating bounds ---
    {
        auto ok = BehavioralEvaluator::parse(test_support::empath_reply(1, 10));
        ASSERT(ok.is_ok());
        ASSERT(ok.value().clarity == 1);
        ASSERT(ok.value().honesty == 10);

        ASSERT(BehavioralEvaluator::parse(test_support::empath_reply(11, 8)).is_error());
        ASSERT(BehavioralEvaluator::parse(test_support::empath_reply(7, 0)).is_error());

        auto wide = test_support::empath_reply();
        wide["clarity"] = wraps_to_nine;
        ASSERT(BehavioralEvaluator::parse(wide).is_error());

        auto wide_honesty = test_support::empath_reply();
        wide_honesty["honesty"] = 4294967304LL;  // 2^32 + 8
        ASSERT(BehavioralEvaluator::parse(wide_honesty).is_error());

        auto fractional = test_support::empath_reply();
        fractional["honesty"] = 7.25;
        ASSERT(BehavioralEvaluator::parse(fractional).is_error());
    }

    // --- verdict confidence and soft skills ---
    {
        SessionState state(test_support::candidate(), SkillTree(test_support::topics(2)), 10);

        auto ok = ReportGenerator::parse(test_support::reporter_reply(), state);
        ASSERT(ok.is_ok());
        ASSERT(ok.value().confidence == 80);
        ASSERT(ok.value().soft_skills.clarity == 7);

        auto over = test_support::reporter_reply();
        over["confidence"] = 101;
        ASSERT(ReportGenerator::parse(over, state).is_error());

        auto wide = test_support::reporter_reply();
        wide["confidence"] = 4294967376LL;  // 2^32 + 80
        auto wide_result = ReportGenerator::parse(wide, state);
        ASSERT(wide_result.is_error());
        ASSERT(wide_result.error().type == ErrorType::SchemaViolation);

        auto missing = test_support::reporter_reply();
        missing.erase("confidence");
        ASSERT(ReportGenerator::parse(missing, state).is_error());

        auto soft = test_support::reporter_reply();
        soft["soft_skills"]["clarity"] = 4294967303LL;
        soft["soft_skills"]["honesty"] = 0;
        soft["soft_skills"]["engagement"] = 7.5;
        auto soft_result = ReportGenerator::parse(soft, state);
        ASSERT(soft_result.is_ok());
        ASSERT(!soft_result.value().soft_skills.clarity.has_value());
        ASSERT(!soft_result.value().soft_skills.honesty.has_value());
        ASSERT(!soft_result.value().soft_skills.engagement.has_value());
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All evaluator tests passed.\n";
    return 0;
}
