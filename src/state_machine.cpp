#include "state_machine.h"
#include "logger.h"

namespace interview_coach {

const char* to_string(TurnPhase phase) {
    switch (phase) {
        case TurnPhase::AwaitingInput: return "awaiting_input";
        case TurnPhase::Classifying:   return "classifying";
        case TurnPhase::Evaluating:    return "evaluating";
        case TurnPhase::Planning:      return "planning";
        case TurnPhase::Generating:    return "generating";
        case TurnPhase::Reporting:     return "reporting";
        case TurnPhase::Terminal:      return "terminal";
    }
    return "terminal";
}

class StateMachine::Impl {
public:
    Impl() : state_(TurnPhase::Planning) {}

    TurnPhase get_state() const {
        return state_;
    }

    bool on_message_received() {
        return transition(TurnPhase::AwaitingInput, TurnPhase::Classifying);
    }

    bool on_classified(Intent intent) {
        return transition(TurnPhase::Classifying,
                          intent == Intent::Answer ? TurnPhase::Evaluating : TurnPhase::Planning);
    }

    bool on_evaluated() {
        return transition(TurnPhase::Evaluating, TurnPhase::Planning);
    }

    bool on_planned(bool terminate) {
        return transition(TurnPhase::Planning, terminate ? TurnPhase::Reporting : TurnPhase::Generating);
    }

    bool on_generated(bool ok) {
        return transition(TurnPhase::Generating, ok ? TurnPhase::AwaitingInput : TurnPhase::Reporting);
    }

    bool on_interrupted() {
        switch (state_) {
            case TurnPhase::Reporting:
            case TurnPhase::Terminal:
                return false;
            case TurnPhase::AwaitingInput:
            case TurnPhase::Classifying:
            case TurnPhase::Evaluating:
            case TurnPhase::Planning:
            case TurnPhase::Generating:
                state_ = TurnPhase::Reporting;
                return true;
        }
        return false;
    }

    bool on_report_ready() {
        return transition(TurnPhase::Reporting, TurnPhase::Terminal);
    }

private:
    bool transition(TurnPhase from, TurnPhase to) {
        if (state_ != from) {
            Logger::warn(std::string("Rejected phase transition ") + to_string(state_) +
                         " -> " + to_string(to));
            return false;
        }
        state_ = to;
        return true;
    }

    TurnPhase state_;
};

StateMachine::StateMachine() : pimpl_(std::make_unique<Impl>()) {}

StateMachine::~StateMachine() = default;

TurnPhase StateMachine::get_state() const {
    return pimpl_->get_state();
}

bool StateMachine::on_message_received() {
    return pimpl_->on_message_received();
}

bool StateMachine::on_classified(Intent intent) {
    return pimpl_->on_classified(intent);
}

bool StateMachine::on_evaluated() {
    return pimpl_->on_evaluated();
}

bool StateMachine::on_planned(bool terminate) {
    return pimpl_->on_planned(terminate);
}

bool StateMachine::on_generated(bool ok) {
    return pimpl_->on_generated(ok);
}

bool StateMachine::on_interrupted() {
    return pimpl_->on_interrupted();
}

bool StateMachine::on_report_ready() {
    return pimpl_->on_report_ready();
}

bool StateMachine::accepts_input() const {
    return pimpl_->get_state() == TurnPhase::AwaitingInput;
}

bool StateMachine::is_terminal() const {
    return pimpl_->get_state() == TurnPhase::Terminal;
}

} // namespace interview_coach
