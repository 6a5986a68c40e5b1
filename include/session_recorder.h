#pragma once

#include "errors.h"
#include "report_generator.h"
#include "session_state.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace interview_coach {

/**
 * @brief Writes the session log document (interview_log_<name>.json)
 *
 * The file is rewritten after every recorded turn so a crash still leaves
 * every completed turn on disk; finalize_session() adds the verdict.
 */
class SessionRecorder {
public:
    explicit SessionRecorder(const std::string& logs_dir);
    ~SessionRecorder();

    /**
     * @brief Start a new session document
     * @param scenario Names the file (interview_log_<scenario>.json); empty = timestamp id
     */
    void start_session(const CandidateMetadata& candidate, const std::string& session_start,
                       const std::string& scenario = "");

    void record_turn(const Turn& turn);

    /// Write the final document; returns its path
    Result<std::string> finalize_session(const Verdict& verdict, TerminationReason reason,
                                         const std::string& final_report);

    std::string get_session_id() const;
    std::string get_session_path() const;
    bool is_active() const;

    /// Current document as it would be written
    nlohmann::json document() const;

    static nlohmann::json turn_to_json(const Turn& turn);
    static nlohmann::json verdict_to_json(const Verdict& verdict);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace interview_coach
