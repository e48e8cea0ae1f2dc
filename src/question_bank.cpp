#include "question_bank.h"
#include "logger.h"
#include "utils.h"
#include "common.h"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace viva {

class QuestionBank::Impl {
public:
    std::vector<Question> questions_;

    Result<void> parse(const json& doc) {
        if (!doc.is_object() || !doc.contains("questions") || !doc["questions"].is_array()) {
            return make_validation_error("Question bank must be an object with a \"questions\" array");
        }

        std::set<std::string> seen;
        size_t index = 0;
        for (const auto& q : doc["questions"]) {
            auto parsed = parse_question(q, index);
            if (!parsed) {
                return parsed.error();
            }
            Question question = std::move(parsed.value());
            if (!seen.insert(question.id).second) {
                return make_validation_error("Duplicate question id: " + question.id);
            }
            questions_.push_back(std::move(question));
            ++index;
        }

        if (questions_.empty()) {
            return make_validation_error("Question bank is empty");
        }
        return Result<void>();
    }

private:
    static Result<Question> parse_question(const json& q, size_t index) {
        std::string where = "question #" + std::to_string(index);
        if (!q.is_object()) {
            return make_validation_error(where + " is not an object");
        }
        if (q.contains("id") && q["id"].is_string()) {
            where = "question " + q["id"].get<std::string>();
        }

        for (const char* field : {"id", "text", "topic", "expected_answer"}) {
            if (!q.contains(field) || !q[field].is_string()) {
                return make_validation_error(where + ": missing string field \"" + field + "\"");
            }
        }
        if (!q.contains("difficulty") || !q["difficulty"].is_number_integer()) {
            return make_validation_error(where + ": missing integer field \"difficulty\"");
        }
        // compared at full width before narrowing to int
        const json& level = q["difficulty"];
        const bool in_range = level.is_number_unsigned()
            ? level.get<uint64_t>() >= static_cast<uint64_t>(MIN_DIFFICULTY) &&
                  level.get<uint64_t>() <= static_cast<uint64_t>(MAX_DIFFICULTY)
            : level.get<int64_t>() >= MIN_DIFFICULTY && level.get<int64_t>() <= MAX_DIFFICULTY;
        if (!in_range) {
            return make_validation_error(where + " has invalid difficulty: " + level.dump());
        }

        Question question;
        question.id = q["id"].get<std::string>();
        question.text = q["text"].get<std::string>();
        question.topic = q["topic"].get<std::string>();
        question.difficulty = level.get<int>();
        question.expected_answer = q["expected_answer"].get<std::string>();

        if (q.contains("follow_up_questions")) {
            if (!q["follow_up_questions"].is_array()) {
                return make_validation_error(where + ": follow_up_questions must be an array");
            }
            for (const auto& f : q["follow_up_questions"]) {
                if (!f.is_string()) {
                    return make_validation_error(where + ": follow_up_questions must contain strings");
                }
                question.follow_up_questions.push_back(f.get<std::string>());
            }
        }

        if (utils::is_empty_or_whitespace(question.id)) {
            return make_validation_error(where + " has an empty id");
        }
        if (utils::is_empty_or_whitespace(question.text)) {
            return make_validation_error("Question " + question.id + " has empty text");
        }
        if (utils::is_empty_or_whitespace(question.expected_answer)) {
            return make_validation_error("Question " + question.id + " has empty expected answer");
        }
        return question;
    }
};

QuestionBank::QuestionBank() : pimpl_(std::make_unique<Impl>()) {}
QuestionBank::~QuestionBank() = default;
QuestionBank::QuestionBank(QuestionBank&&) noexcept = default;
QuestionBank& QuestionBank::operator=(QuestionBank&&) noexcept = default;

Result<std::shared_ptr<const QuestionBank>> QuestionBank::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Question bank file not found: " + path);
        return make_io_error("Question bank file not found: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto bank = load_from_json(buffer.str());
    if (bank) {
        LOG_INFO("Loaded " + std::to_string(bank.value()->size()) + " questions from " + path);
    } else {
        LOG_ERROR("Invalid question bank " + path + ": " + bank.error().message);
    }
    return bank;
}

Result<std::shared_ptr<const QuestionBank>> QuestionBank::load_from_json(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::exception& e) {
        return make_parse_error("Invalid JSON in question bank: " + std::string(e.what()));
    }

    auto bank = std::make_shared<QuestionBank>();
    auto parsed = bank->pimpl_->parse(doc);
    if (!parsed) {
        return parsed.error();
    }
    return std::shared_ptr<const QuestionBank>(std::move(bank));
}

std::vector<std::string> QuestionBank::topics() const {
    std::set<std::string> unique;
    for (const auto& q : pimpl_->questions_) {
        unique.insert(q.topic);
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

std::pair<int, int> QuestionBank::difficulty_range() const {
    if (pimpl_->questions_.empty()) {
        return {MIN_DIFFICULTY, MAX_DIFFICULTY};
    }
    int lo = MAX_DIFFICULTY;
    int hi = MIN_DIFFICULTY;
    for (const auto& q : pimpl_->questions_) {
        lo = std::min(lo, q.difficulty);
        hi = std::max(hi, q.difficulty);
    }
    return {lo, hi};
}

std::vector<const Question*> QuestionBank::filter(const QuestionFilter& criteria,
                                                  const std::set<std::string>& excluded_ids) const {
    std::vector<const Question*> matches;
    for (const auto& q : pimpl_->questions_) {
        if (!criteria.topics.empty() &&
            std::find(criteria.topics.begin(), criteria.topics.end(), q.topic) == criteria.topics.end()) {
            continue;
        }
        if (criteria.difficulty && q.difficulty != *criteria.difficulty) continue;
        if (excluded_ids.count(q.id)) continue;
        matches.push_back(&q);
    }
    LOG_DEBUG("Filtered to " + std::to_string(matches.size()) + " questions");
    return matches;
}

const Question* QuestionBank::select(const QuestionFilter& criteria,
                                     const std::set<std::string>& excluded_ids,
                                     std::mt19937* rng) const {
    auto available = filter(criteria, excluded_ids);
    if (available.empty()) {
        LOG_WARN("No questions available matching criteria");
        return nullptr;
    }

    const Question* selected = available.front();
    if (rng) {
        std::uniform_int_distribution<size_t> pick(0, available.size() - 1);
        selected = available[pick(*rng)];
    }
    LOG_INFO("Selected question " + selected->id + ": " + utils::preview(selected->text));
    return selected;
}

const Question* QuestionBank::find(const std::string& id) const {
    for (const auto& q : pimpl_->questions_) {
        if (q.id == id) return &q;
    }
    return nullptr;
}

size_t QuestionBank::size() const {
    return pimpl_->questions_.size();
}

json QuestionBank::examples(size_t n) const {
    json out = json::array();
    for (size_t i = 0; i < pimpl_->questions_.size() && i < n; ++i) {
        const auto& q = pimpl_->questions_[i];
        out.push_back({{"text", q.text}, {"topic", q.topic}, {"difficulty", q.difficulty}});
    }
    return out;
}

json QuestionBank::usage_stats(const std::set<std::string>& used_ids) const {
    std::set<std::string> topics_used;
    std::set<int> difficulties_used;
    size_t used = 0;
    for (const auto& id : used_ids) {
        if (const Question* q = find(id)) {
            ++used;
            topics_used.insert(q->topic);
            difficulties_used.insert(q->difficulty);
        }
    }

    auto range = difficulty_range();
    json stats;
    stats["total_questions"] = size();
    stats["used_questions"] = used;
    stats["remaining_questions"] = size() - used;
    stats["topics_covered"] = topics_used;
    stats["difficulty_levels_used"] = difficulties_used;
    stats["available_topics"] = topics();
    stats["difficulty_range"] = {range.first, range.second};
    return stats;
}

} // namespace viva
