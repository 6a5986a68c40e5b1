#pragma once

#include "core/types.h"
#include <memory>

namespace interview_coach {

/**
 * @brief Turn phase enumeration
 */
enum class TurnPhase {
    AwaitingInput,  ///< Waiting for the candidate's next message
    Classifying,    ///< Router is labelling the message
    Evaluating,     ///< Skeptic and Empath are scoring an answer
    Planning,       ///< Planner is choosing the directive
    Generating,     ///< Voice is writing the next message
    Reporting,      ///< Reporter is writing the verdict
    Terminal        ///< Session closed; no further input accepted
};

const char* to_string(TurnPhase phase);

/**
 * @brief State machine for the interview turn loop
 *
 * - Planning -> Generating (on_planned, continue; also the opening turn)
 * - Generating -> AwaitingInput (on_generated ok)
 * - Generating -> Reporting (on_generated failed after retries)
 * - AwaitingInput -> Classifying (on_message_received)
 * - Classifying -> Evaluating (answer) | Planning (other intents)
 * - Evaluating -> Planning (on_evaluated)
 * - Planning -> Reporting (on_planned, terminate)
 * - any non-terminal phase -> Reporting (on_interrupted)
 * - Reporting -> Terminal (on_report_ready)
 *
 * Events that do not apply to the current phase are rejected (return false)
 * and leave the phase unchanged.
 */
class StateMachine {
public:
    StateMachine();
    ~StateMachine();

    TurnPhase get_state() const;

    bool on_message_received();
    bool on_classified(Intent intent);
    bool on_evaluated();
    bool on_planned(bool terminate);
    bool on_generated(bool ok);
    bool on_interrupted();
    bool on_report_ready();

    /// True only in AwaitingInput
    bool accepts_input() const;

    bool is_terminal() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace interview_coach
