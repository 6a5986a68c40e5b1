#include "session_recorder.h"
#include "common.h"
#include "logger.h"
#include "path_utils.h"
#include <cstdio>
#include <fstream>

using json = nlohmann::json;

namespace interview_coach {

namespace {

json optional_to_json(const std::optional<int>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

class SessionRecorder::Impl {
public:
    explicit Impl(const std::string& logs_dir)
        : logs_dir_(expand_path(logs_dir)), session_started_(false) {}

    void start_session(const CandidateMetadata& candidate, const std::string& session_start,
                       const std::string& scenario) {
        session_id_ = compact_timestamp_now();
        file_name_ = session_log_filename(scenario, session_id_);
        session_started_ = true;

        document_ = json::object();
        document_["participant_name"] = candidate.name;
        document_["session_id"] = session_id_;
        document_["session_start"] = session_start;
        document_["metadata"] = {
            {"role", candidate.role},
            {"target_grade", candidate.target_grade},
            {"experience", candidate.experience}
        };
        document_["turns"] = json::array();
        document_["final_feedback"] = nullptr;

        if (!ensure_directory(logs_dir_)) {
            Logger::error("Cannot create logs directory: " + logs_dir_);
        }
        write_session_log_incremental();
    }

    void record_turn(const Turn& turn) {
        if (!session_started_) return;
        document_["turns"].push_back(SessionRecorder::turn_to_json(turn));
        write_session_log_incremental();
    }

    Result<std::string> finalize_session(const Verdict& verdict, TerminationReason reason,
                                         const std::string& final_report) {
        if (!session_started_) {
            return make_invalid_state_error("no session started");
        }
        document_["final_feedback"] = SessionRecorder::verdict_to_json(verdict);
        document_["final_report"] = final_report;
        document_["termination_reason"] = to_string(reason);

        auto written = write_session_log(get_session_path());
        session_started_ = false;
        if (written.is_error()) {
            return written.error();
        }
        return get_session_path();
    }

    std::string get_session_id() const {
        return session_id_;
    }

    std::string get_session_path() const {
        return logs_dir_.empty() ? file_name_ : logs_dir_ + "/" + file_name_;
    }

    bool is_active() const {
        return session_started_;
    }

    json document() const {
        return document_;
    }

private:
    Result<void> write_session_log(const std::string& path) {
        // Write beside the target, then rename over it
        std::string tmp_path = path + ".tmp";
        {
            std::ofstream file(tmp_path);
            if (!file.is_open()) {
                return make_io_error("cannot open " + tmp_path);
            }
            file << document_.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
            if (!file.good()) {
                return make_io_error("write failed: " + tmp_path);
            }
        }
        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            return make_io_error("cannot rename " + tmp_path + " to " + path);
        }
        return Result<void>();
    }

    void write_session_log_incremental() {
        if (!session_started_) return;
        auto written = write_session_log(get_session_path());
        if (written.is_error()) {
            Logger::error("Session log not written: " + written.error().message);
        }
    }

    std::string logs_dir_;
    std::string session_id_;
    std::string file_name_;
    bool session_started_;
    json document_;
};

SessionRecorder::SessionRecorder(const std::string& logs_dir)
    : pimpl_(std::make_unique<Impl>(logs_dir)) {}

SessionRecorder::~SessionRecorder() = default;

void SessionRecorder::start_session(const CandidateMetadata& candidate, const std::string& session_start,
                                    const std::string& scenario) {
    pimpl_->start_session(candidate, session_start, scenario);
}

void SessionRecorder::record_turn(const Turn& turn) {
    pimpl_->record_turn(turn);
}

Result<std::string> SessionRecorder::finalize_session(const Verdict& verdict, TerminationReason reason,
                                                      const std::string& final_report) {
    return pimpl_->finalize_session(verdict, reason, final_report);
}

std::string SessionRecorder::get_session_id() const {
    return pimpl_->get_session_id();
}

std::string SessionRecorder::get_session_path() const {
    return pimpl_->get_session_path();
}

bool SessionRecorder::is_active() const {
    return pimpl_->is_active();
}

json SessionRecorder::document() const {
    return pimpl_->document();
}

json SessionRecorder::turn_to_json(const Turn& turn) {
    json j;
    j["turn_id"] = turn.turn_id;
    j["agent_visible_message"] = turn.agent_visible_message;
    j["user_message"] = turn.user_message ? json(*turn.user_message) : json(nullptr);
    j["internal_thoughts"] = turn.internal_thoughts;
    return j;
}

json SessionRecorder::verdict_to_json(const Verdict& verdict) {
    json topics = json::array();
    for (const auto& topic : verdict.topics) {
        topics.push_back({
            {"topic_id", topic.topic_id},
            {"topic", topic.topic},
            {"score", optional_to_json(topic.score)},
            {"questions_asked", topic.questions_asked},
            {"covered", topic.covered},
            {"feedback", topic.feedback},
            {"correct_answer", topic.correct_answer ? json(*topic.correct_answer) : json(nullptr)}
        });
    }

    json confirmed = json::array();
    for (const auto& topic : verdict.confirmed_skills()) {
        confirmed.push_back({{"topic", topic.topic}, {"score", optional_to_json(topic.score)}});
    }
    json gaps = json::array();
    for (const auto& topic : verdict.knowledge_gaps()) {
        gaps.push_back({
            {"topic", topic.topic},
            {"score", optional_to_json(topic.score)},
            {"correct_answer", topic.correct_answer ? json(*topic.correct_answer) : json(nullptr)}
        });
    }

    json j;
    j["level"] = to_string(verdict.level);
    j["recommendation"] = to_string(verdict.recommendation);
    j["confidence"] = verdict.confidence;
    j["reasoning"] = verdict.reasoning;
    j["topics"] = topics;
    j["confirmed_skills"] = confirmed;
    j["knowledge_gaps"] = gaps;
    j["soft_skills"] = {
        {"clarity", optional_to_json(verdict.soft_skills.clarity)},
        {"honesty", optional_to_json(verdict.soft_skills.honesty)},
        {"engagement", optional_to_json(verdict.soft_skills.engagement)},
        {"notes", verdict.soft_skills.notes}
    };
    j["roadmap"] = verdict.roadmap;
    j["resources"] = verdict.resources;
    j["fallback"] = verdict.fallback;
    return j;
}

} // namespace interview_coach
