#pragma once

#include "core/constants.h"
#include "core/types.h"
#include <optional>
#include <string>
#include <vector>

namespace interview_coach {

class TechnicalEvaluator;
class StrategicPlanner;

/**
 * @brief One planned interview topic and its coverage state
 *
 * Read access is public. Scoring is written only by TechnicalEvaluator.
 */
class Topic {
public:
    Topic(int id, std::string label, Difficulty difficulty = Difficulty::Medium,
          std::string rationale = "");

    int id() const { return id_; }
    const std::string& label() const { return label_; }
    Difficulty difficulty() const { return difficulty_; }
    const std::string& rationale() const { return rationale_; }

    int required_questions() const { return constants::interview::QUESTIONS_PER_TOPIC; }
    int questions_asked() const { return questions_asked_; }
    bool covered() const { return covered_; }

    /// Empty until the first evaluation is applied
    std::optional<int> score() const { return score_; }
    const std::vector<int>& score_history() const { return score_history_; }

    /// Last Skeptic feedback for this topic
    const std::string& feedback() const { return feedback_; }
    const std::optional<std::string>& correct_answer() const { return correct_answer_; }

private:
    friend class TechnicalEvaluator;

    /**
     * @brief Count one evaluated answer against the quota
     * @throws std::logic_error if the topic is already covered
     */
    void record_answer(int score, ScorePolicy policy, const std::string& feedback,
                       const std::optional<std::string>& correct_answer);

    int id_;
    std::string label_;
    Difficulty difficulty_;
    std::string rationale_;

    int questions_asked_ = 0;
    bool covered_ = false;
    std::optional<int> score_;
    std::vector<int> score_history_;
    std::string feedback_;
    std::optional<std::string> correct_answer_;
};

/**
 * @brief Ordered topic registry with a forward-only cursor
 *
 * At every planning boundary the cursor points at an uncovered topic or
 * equals size() (exhausted). Between an evaluation covering the active topic
 * and the planner's commit it may briefly point at a covered topic.
 */
class SkillTree {
public:
    SkillTree() = default;
    explicit SkillTree(std::vector<Topic> topics);

    size_t size() const { return topics_.size(); }
    bool empty() const { return topics_.empty(); }
    const std::vector<Topic>& topics() const { return topics_; }
    const Topic& at(size_t index) const { return topics_.at(index); }

    size_t cursor() const { return cursor_; }
    bool exhausted() const { return cursor_ >= topics_.size(); }

    /// Topic under the cursor, or nullptr when exhausted
    const Topic* active_topic() const;

    size_t covered_count() const;

    /// First uncovered topic at or after `from`
    std::optional<size_t> next_uncovered(size_t from) const;

private:
    friend class TechnicalEvaluator;
    friend class StrategicPlanner;

    Topic* active_topic_mut();

    /**
     * @brief Move the cursor forward
     * @throws std::logic_error if index is behind the cursor or past the end
     */
    void advance_to(size_t index);

    std::vector<Topic> topics_;
    size_t cursor_ = 0;
};

} // namespace interview_coach
