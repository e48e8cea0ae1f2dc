#include "session_record.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

using json = nlohmann::json;

namespace viva {

namespace {

// "data_structures" -> "Data Structures"
std::string title_case(const std::string& topic) {
    std::string out;
    bool start = true;
    for (char c : topic) {
        if (c == '_') c = ' ';
        if (std::isspace(static_cast<unsigned char>(c))) {
            out += c;
            start = true;
        } else if (start) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            start = false;
        } else {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

std::string format_number(const json& value) {
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    if (value.is_number()) {
        std::ostringstream oss;
        oss << value.get<double>();
        return oss.str();
    }
    return "N/A";
}

} // namespace

json RecordEntry::to_json() const {
    json j;
    j["question_id"] = question_id;
    j["question_text"] = question_text;
    j["question_topic"] = topic;
    j["question_difficulty"] = difficulty;
    j["user_answer"] = answer;
    j["transcription_confidence"] = confidence;
    if (evaluation) {
        j["llm_score"] = evaluation->score;
        j["llm_feedback"] = evaluation->feedback;
        j["llm_suggestions"] = evaluation->suggestions;
        j["strengths"] = evaluation->strengths;
        j["weaknesses"] = evaluation->weaknesses;
    } else {
        j["llm_score"] = nullptr;
    }
    json follow_up_list = json::array();
    for (const auto& f : follow_ups) {
        follow_up_list.push_back({
            {"question", f.question},
            {"answer", f.answer},
            {"score", f.score ? json(*f.score) : json(nullptr)}
        });
    }
    j["follow_ups"] = follow_up_list;
    j["timestamp"] = timestamp;
    j["response_duration"] = response_seconds ? json(utils::round_to(*response_seconds, 2)) : json(nullptr);
    return j;
}

class SessionRecord::Impl {
public:
    Impl(const std::string& session_id, NowFn now)
        : session_id_(session_id)
        , now_(now ? std::move(now) : NowFn([] { return Clock::now(); }))
        , start_(now_())
        , start_timestamp_(utils::iso_timestamp()) {}

    const std::string& session_id() const { return session_id_; }

    Result<void> set_preferences(const UserPreferences& preferences) {
        if (sealed_) return sealed_error();
        preferences_ = preferences;
        if (preferences_.timestamp.empty()) {
            preferences_.timestamp = utils::iso_timestamp();
        }
        return Result<void>();
    }

    Result<void> add_question(const std::string& id, const std::string& text,
                              const std::string& topic, int difficulty) {
        if (sealed_) return sealed_error();
        RecordEntry entry;
        entry.question_id = id;
        entry.question_text = text;
        entry.topic = topic;
        entry.difficulty = difficulty;
        entry.timestamp = utils::iso_timestamp();
        entries_.push_back(std::move(entry));
        asked_at_.push_back(now_());
        LOG_SESSION("Question " + id + " recorded for session " + session_id_);
        return Result<void>();
    }

    Result<void> record_answer(const std::string& answer, double confidence) {
        if (sealed_) return sealed_error();
        if (entries_.empty()) return make_not_found_error("No question to attach the answer to");
        RecordEntry& entry = entries_.back();
        if (!entry.response_seconds) {
            entry.response_seconds = std::chrono::duration<double>(now_() - asked_at_.back()).count();
        }
        entry.answer = answer;
        entry.confidence = confidence;
        return Result<void>();
    }

    Result<void> record_evaluation(const Evaluation& evaluation) {
        if (sealed_) return sealed_error();
        if (entries_.empty()) return make_not_found_error("No question to attach the evaluation to");
        entries_.back().evaluation = evaluation;
        return Result<void>();
    }

    Result<void> add_follow_up(const std::string& question) {
        if (sealed_) return sealed_error();
        if (entries_.empty()) return make_not_found_error("No question to attach the follow-up to");
        FollowUpExchange follow_up;
        follow_up.question = question;
        entries_.back().follow_ups.push_back(std::move(follow_up));
        return Result<void>();
    }

    Result<void> record_follow_up_answer(const std::string& answer, std::optional<int> score) {
        if (sealed_) return sealed_error();
        if (entries_.empty() || entries_.back().follow_ups.empty()) {
            return make_not_found_error("No follow-up to attach the answer to");
        }
        FollowUpExchange& follow_up = entries_.back().follow_ups.back();
        follow_up.answer = answer;
        follow_up.score = score;
        return Result<void>();
    }

    const json& seal(const json& conversation_history) {
        if (sealed_) return summary_;
        duration_seconds_ = std::chrono::duration<double>(now_() - start_).count();
        end_timestamp_ = utils::iso_timestamp();
        conversation_history_ = conversation_history;
        summary_ = compute_summary();
        sealed_ = true;
        LOG_SESSION("Session " + session_id_ + " sealed after " +
                    std::to_string(entries_.size()) + " questions");
        return summary_;
    }

    bool is_sealed() const { return sealed_; }

    Result<json> summary() const {
        if (!sealed_) return make_invalid_state_error("Session record is not sealed");
        return summary_;
    }

    std::vector<RecordEntry> entries() const { return entries_; }

    std::vector<Evaluation> evaluations() const {
        std::vector<Evaluation> out;
        for (const auto& entry : entries_) {
            if (entry.evaluation) out.push_back(*entry.evaluation);
        }
        return out;
    }

    json to_json() const {
        json j;
        j["session_id"] = session_id_;
        j["start_time"] = start_timestamp_;
        j["end_time"] = sealed_ ? json(end_timestamp_) : json(nullptr);
        j["total_duration"] = sealed_ ? json(utils::round_to(duration_seconds_, 2)) : json(nullptr);
        j["user_preferences"] = preferences_json();
        json entry_list = json::array();
        for (const auto& entry : entries_) {
            entry_list.push_back(entry.to_json());
        }
        j["questions_asked"] = entry_list;
        j["session_summary"] = sealed_ ? summary_ : json(nullptr);
        j["conversation_history"] = conversation_history_;
        return j;
    }

    Result<std::string> save_to_file(const std::string& dir) const {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return make_io_error("Cannot create session directory " + dir + ": " + ec.message());
        }

        std::string path = dir + "/session_" + session_id_ + ".json";
        std::ofstream file(path);
        if (!file.is_open()) {
            return make_io_error("Cannot open " + path + " for writing");
        }
        file << to_json().dump(2);
        if (!file.good()) {
            return make_io_error("Failed writing " + path);
        }
        LOG_SESSION("Session data saved to " + path);
        return path;
    }

    std::string text_summary() const {
        std::ostringstream oss;
        oss << "Viva Interview - Session Summary\n"
            << "================================\n\n"
            << "Session ID: " << session_id_ << "\n";

        if (!sealed_) {
            oss << "(session still in progress)\n";
            return oss.str();
        }
        if (summary_.contains("error")) {
            oss << summary_["error"].get<std::string>() << "\n";
            return oss.str();
        }

        const json& stats = summary_["score_statistics"];
        auto stat = [&](const char* key) {
            return stats.contains(key) ? format_number(stats[key]) : std::string("N/A");
        };

        oss << "Duration: " << format_number(summary_["session_duration_minutes"]) << " minutes\n"
            << "Questions Asked: " << summary_["questions_asked"].get<int>() << "\n"
            << "Performance Level: " << summary_["performance_level"].get<std::string>() << "\n\n"
            << "Score Statistics:\n"
            << "- Average Score: " << stat("average") << "/10\n"
            << "- Highest Score: " << stat("highest") << "/10\n"
            << "- Lowest Score: " << stat("lowest") << "/10\n\n"
            << "Topics Covered:\n";

        for (const auto& item : summary_["topics_covered"].items()) {
            oss << "- " << title_case(item.key()) << ": " << item.value()["count"].get<int>() << " questions";
            if (item.value()["avg_score"].get<double>() > 0) {
                oss << " (avg: " << format_number(item.value()["avg_score"]) << "/10)";
            }
            oss << "\n";
        }

        int generated = summary_["follow_ups_generated"].get<int>();
        if (generated > 0) {
            oss << "\nFollow-up Questions: " << generated << " generated, "
                << summary_["follow_ups_answered"].get<int>() << " answered\n";
        }
        return oss.str();
    }

private:
    static Error sealed_error() {
        return make_invalid_state_error("Session record is sealed");
    }

    json preferences_json() const {
        json j;
        j["topics"] = preferences_.topics;
        j["difficulty"] = preferences_.difficulty;
        j["interview_duration"] = preferences_.interview_duration;
        j["timestamp"] = preferences_.timestamp;
        return j;
    }

    json compute_summary() const {
        if (entries_.empty()) {
            return json{{"error", "No questions were asked in this session"}};
        }

        std::vector<int> scores;
        std::map<std::string, std::vector<int>> topic_scores;
        std::map<std::string, int> topic_counts;
        int follow_ups_generated = 0;
        int follow_ups_answered = 0;

        for (const auto& entry : entries_) {
            topic_counts[entry.topic]++;
            topic_scores[entry.topic];
            if (entry.evaluation) {
                scores.push_back(entry.evaluation->score);
                topic_scores[entry.topic].push_back(entry.evaluation->score);
            }
            for (const auto& f : entry.follow_ups) {
                follow_ups_generated++;
                if (!f.answer.empty()) follow_ups_answered++;
            }
        }

        double average = 0.0;
        json score_stats = json::object();
        if (!scores.empty()) {
            int total = 0;
            for (int s : scores) total += s;
            average = static_cast<double>(total) / scores.size();
            score_stats["average"] = utils::round_to(average, 2);
            score_stats["highest"] = *std::max_element(scores.begin(), scores.end());
            score_stats["lowest"] = *std::min_element(scores.begin(), scores.end());
            score_stats["total_evaluated"] = scores.size();
        }

        json topics = json::object();
        for (const auto& entry : topic_counts) {
            const auto& list = topic_scores[entry.first];
            double topic_average = 0.0;
            if (!list.empty()) {
                int total = 0;
                for (int s : list) total += s;
                topic_average = utils::round_to(static_cast<double>(total) / list.size(), 2);
            }
            topics[entry.first] = {
                {"count", entry.second},
                {"avg_score", topic_average},
                {"scores", list}
            };
        }

        json summary;
        summary["session_duration_minutes"] = utils::round_to(duration_seconds_ / 60.0, 2);
        summary["questions_asked"] = entries_.size();
        summary["questions_evaluated"] = scores.size();
        summary["score_statistics"] = score_stats;
        summary["performance_level"] = performance_level(average);
        summary["topics_covered"] = topics;
        summary["user_preferences"] = preferences_json();
        summary["follow_ups_generated"] = follow_ups_generated;
        summary["follow_ups_answered"] = follow_ups_answered;
        return summary;
    }

    std::string session_id_;
    NowFn now_;
    TimePoint start_;
    std::string start_timestamp_;
    std::string end_timestamp_;
    double duration_seconds_ = 0.0;
    UserPreferences preferences_;
    std::vector<RecordEntry> entries_;
    std::vector<TimePoint> asked_at_;
    json conversation_history_ = json::array();
    json summary_;
    bool sealed_ = false;
};

SessionRecord::SessionRecord(const std::string& session_id, NowFn now)
    : pimpl_(std::make_unique<Impl>(session_id, std::move(now))) {}

SessionRecord::~SessionRecord() = default;

const std::string& SessionRecord::session_id() const {
    return pimpl_->session_id();
}

Result<void> SessionRecord::set_preferences(const UserPreferences& preferences) {
    return pimpl_->set_preferences(preferences);
}

Result<void> SessionRecord::add_question(const std::string& id, const std::string& text,
                                         const std::string& topic, int difficulty) {
    return pimpl_->add_question(id, text, topic, difficulty);
}

Result<void> SessionRecord::record_answer(const std::string& answer, double confidence) {
    return pimpl_->record_answer(answer, confidence);
}

Result<void> SessionRecord::record_evaluation(const Evaluation& evaluation) {
    return pimpl_->record_evaluation(evaluation);
}

Result<void> SessionRecord::add_follow_up(const std::string& question) {
    return pimpl_->add_follow_up(question);
}

Result<void> SessionRecord::record_follow_up_answer(const std::string& answer, std::optional<int> score) {
    return pimpl_->record_follow_up_answer(answer, score);
}

const json& SessionRecord::seal(const json& conversation_history) {
    return pimpl_->seal(conversation_history);
}

bool SessionRecord::is_sealed() const {
    return pimpl_->is_sealed();
}

Result<json> SessionRecord::summary() const {
    return pimpl_->summary();
}

std::vector<RecordEntry> SessionRecord::entries() const {
    return pimpl_->entries();
}

std::vector<Evaluation> SessionRecord::evaluations() const {
    return pimpl_->evaluations();
}

json SessionRecord::to_json() const {
    return pimpl_->to_json();
}

Result<std::string> SessionRecord::save_to_file(const std::string& dir) const {
    return pimpl_->save_to_file(dir);
}

std::string SessionRecord::text_summary() const {
    return pimpl_->text_summary();
}

} // namespace viva
