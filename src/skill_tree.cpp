#include "skill_tree.h"
#include <stdexcept>
#include <utility>

namespace interview_coach {

Topic::Topic(int id, std::string label, Difficulty difficulty, std::string rationale)
    : id_(id),
      label_(std::move(label)),
      difficulty_(difficulty),
      rationale_(std::move(rationale)) {}

void Topic::record_answer(int score, ScorePolicy policy, const std::string& feedback,
                          const std::optional<std::string>& correct_answer) {
    if (covered_) {
        throw std::logic_error("topic '" + label_ + "' is already covered");
    }

    questions_asked_++;
    score_history_.push_back(score);

    if (policy == ScorePolicy::Average) {
        int sum = 0;
        for (int s : score_history_) sum += s;
        int n = static_cast<int>(score_history_.size());
        score_ = (sum + n / 2) / n;
    } else {
        score_ = score;
    }

    if (!feedback.empty()) feedback_ = feedback;
    if (correct_answer) correct_answer_ = correct_answer;

    covered_ = questions_asked_ >= required_questions();
}

SkillTree::SkillTree(std::vector<Topic> topics) : topics_(std::move(topics)) {
    cursor_ = next_uncovered(0).value_or(topics_.size());
}

const Topic* SkillTree::active_topic() const {
    if (exhausted()) return nullptr;
    return &topics_[cursor_];
}

Topic* SkillTree::active_topic_mut() {
    if (exhausted()) return nullptr;
    return &topics_[cursor_];
}

size_t SkillTree::covered_count() const {
    size_t count = 0;
    for (const auto& topic : topics_) {
        if (topic.covered()) count++;
    }
    return count;
}

std::optional<size_t> SkillTree::next_uncovered(size_t from) const {
    for (size_t i = from; i < topics_.size(); ++i) {
        if (!topics_[i].covered()) return i;
    }
    return std::nullopt;
}

void SkillTree::advance_to(size_t index) {
    if (index < cursor_) {
        throw std::logic_error("skill tree cursor cannot move backwards");
    }
    if (index > topics_.size()) {
        throw std::logic_error("skill tree cursor out of range");
    }
    cursor_ = index;
}

} // namespace interview_coach
