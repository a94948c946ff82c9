#pragma once

#include "../types.hpp"
#include "field_reader.hpp"
#include "uuid.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace quarry {
namespace decode {

namespace detail {

inline Error validation_error(const std::string& message, std::optional<std::string> context = std::nullopt) {
    return Error{ErrorCode::ValidationFailed, message, std::move(context)};
}

/// Decode every element of a JSON array with Item::from_json.
template<typename Item>
Expected<std::vector<Item>> decode_items(const nlohmann::json& array, const std::string& path) {
    if (!array.is_array()) {
        return tl::unexpected(Error{ErrorCode::UnexpectedShape, "Expected a JSON array", path});
    }
    std::vector<Item> items;
    items.reserve(array.size());
    for (size_t i = 0; i < array.size(); ++i) {
        auto item = Item::from_json(array[i], path + "[" + std::to_string(i) + "]");
        if (!item) {
            return tl::unexpected(item.error());
        }
        items.push_back(std::move(*item));
    }
    return items;
}

/// Locate the named array of an envelope object.
inline Expected<const nlohmann::json*> envelope_array(const nlohmann::json& doc, const FieldKeys& keys) {
    if (!doc.is_object()) {
        return tl::unexpected(Error{ErrorCode::UnexpectedShape, "Expected a JSON object", "$"});
    }
    const nlohmann::json* found = FieldReader(doc).find(keys);
    if (found == nullptr) {
        return tl::unexpected(Error{
            ErrorCode::MissingField,
            "Missing required field '" + keys.canonical() + "' (tried: " + keys.describe() + ")",
            "$"
        });
    }
    if (!found->is_array()) {
        return tl::unexpected(Error{
            ErrorCode::FieldTypeMismatch,
            "Field '" + keys.canonical() + "' is not an array",
            "$"
        });
    }
    return found;
}

} // namespace detail

// ============================================================================
// Skill reordering
// ============================================================================

/**
 * @brief One skill with its recommended position
 *
 * Accepted names:
 * - id
 * - originalValue | original_value
 * - newPosition | recommendedPosition
 * - reasonForReordering | reason
 * - isTitleNode | is_title_node (optional, default false)
 */
struct ReorderedSkill {
    std::string id;
    std::string original_value;
    int new_position = 0;
    std::string reason_for_reordering;
    bool is_title_node = false;

    static inline const FieldKeys kId{"id"};
    static inline const FieldKeys kOriginalValue{"originalValue", "original_value"};
    static inline const FieldKeys kNewPosition{"newPosition", "recommendedPosition"};
    static inline const FieldKeys kReason{"reasonForReordering", "reason"};
    static inline const FieldKeys kIsTitleNode{"isTitleNode", "is_title_node"};

    static Expected<ReorderedSkill> from_json(const nlohmann::json& source, const std::string& path) {
        if (!source.is_object()) {
            return tl::unexpected(Error{ErrorCode::UnexpectedShape, "Skill entry must be an object", path});
        }
        FieldReader reader(source, path);

        auto id = reader.required<std::string>(kId);
        if (!id) return tl::unexpected(id.error());
        auto original_value = reader.required<std::string>(kOriginalValue);
        if (!original_value) return tl::unexpected(original_value.error());
        auto new_position = reader.required<int>(kNewPosition);
        if (!new_position) return tl::unexpected(new_position.error());
        auto reason = reader.required<std::string>(kReason);
        if (!reason) return tl::unexpected(reason.error());

        ReorderedSkill skill;
        skill.id = std::move(*id);
        skill.original_value = std::move(*original_value);
        skill.new_position = *new_position;
        skill.reason_for_reordering = std::move(*reason);
        skill.is_title_node = reader.optional<bool>(kIsTitleNode, false);
        return skill;
    }

    bool operator==(const ReorderedSkill& other) const {
        return id == other.id &&
               original_value == other.original_value &&
               new_position == other.new_position &&
               reason_for_reordering == other.reason_for_reordering &&
               is_title_node == other.is_title_node;
    }

    bool operator!=(const ReorderedSkill& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Reordered skill list
 *
 * Envelope: reordered_skills_and_expertise | reorderedSkillsAndExpertise.
 * A bare array of skills is accepted in place of the envelope.
 *
 * Valid iff the list is non-empty, every id is a UUID, ids are unique and
 * positions are non-negative.
 */
struct ReorderSkillsResponse {
    std::vector<ReorderedSkill> reordered_skills;

    static inline const FieldKeys kEnvelope{"reordered_skills_and_expertise", "reorderedSkillsAndExpertise"};

    static Expected<ReorderSkillsResponse> from_json(const nlohmann::json& doc) {
        auto array = detail::envelope_array(doc, kEnvelope);
        if (!array) return tl::unexpected(array.error());
        return from_items(**array, "$." + kEnvelope.canonical());
    }

    static Expected<ReorderSkillsResponse> from_items(const nlohmann::json& array, const std::string& path = "$") {
        auto items = detail::decode_items<ReorderedSkill>(array, path);
        if (!items) return tl::unexpected(items.error());
        return ReorderSkillsResponse{std::move(*items)};
    }

    Expected<void> validate() const {
        if (reordered_skills.empty()) {
            return tl::unexpected(detail::validation_error("Reordered skill list is empty"));
        }
        std::set<std::string> seen;
        for (const auto& skill : reordered_skills) {
            if (!is_valid_uuid(skill.id)) {
                return tl::unexpected(detail::validation_error("Skill id is not a valid UUID", skill.id));
            }
            if (!seen.insert(skill.id).second) {
                return tl::unexpected(detail::validation_error("Duplicate skill id", skill.id));
            }
            if (skill.new_position < 0) {
                return tl::unexpected(detail::validation_error("Skill position is negative", skill.id));
            }
        }
        return {};
    }

    bool operator==(const ReorderSkillsResponse& other) const {
        return reordered_skills == other.reordered_skills;
    }

    bool operator!=(const ReorderSkillsResponse& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Skill deduplication
// ============================================================================

/**
 * @brief Skills judged to be the same
 *
 * Accepted names:
 * - canonical_name | canonicalName
 * - skill_ids | skillIds
 * - reasoning | reason (optional, default "")
 */
struct DuplicateGroup {
    std::string canonical_name;
    std::vector<std::string> skill_ids;
    std::string reasoning;

    static inline const FieldKeys kCanonicalName{"canonical_name", "canonicalName"};
    static inline const FieldKeys kSkillIds{"skill_ids", "skillIds"};
    static inline const FieldKeys kReasoning{"reasoning", "reason"};

    static Expected<DuplicateGroup> from_json(const nlohmann::json& source, const std::string& path) {
        if (!source.is_object()) {
            return tl::unexpected(Error{ErrorCode::UnexpectedShape, "Duplicate group must be an object", path});
        }
        FieldReader reader(source, path);

        auto canonical_name = reader.required<std::string>(kCanonicalName);
        if (!canonical_name) return tl::unexpected(canonical_name.error());
        auto skill_ids = reader.required<std::vector<std::string>>(kSkillIds);
        if (!skill_ids) return tl::unexpected(skill_ids.error());

        return DuplicateGroup{
            std::move(*canonical_name),
            std::move(*skill_ids),
            reader.optional<std::string>(kReasoning, "")
        };
    }

    bool operator==(const DuplicateGroup& other) const {
        return canonical_name == other.canonical_name &&
               skill_ids == other.skill_ids &&
               reasoning == other.reasoning;
    }

    bool operator!=(const DuplicateGroup& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Duplicate skill groups
 *
 * Envelope: duplicate_groups | duplicateGroups. A bare array of groups is
 * accepted in place of the envelope.
 *
 * Valid iff every group has a non-empty canonical name and at least two
 * UUID skill ids, and no id appears in more than one group. An empty list
 * means no duplicates were found and is valid.
 */
struct SkillMergeResponse {
    std::vector<DuplicateGroup> duplicate_groups;

    static inline const FieldKeys kEnvelope{"duplicate_groups", "duplicateGroups"};

    static Expected<SkillMergeResponse> from_json(const nlohmann::json& doc) {
        auto array = detail::envelope_array(doc, kEnvelope);
        if (!array) return tl::unexpected(array.error());
        return from_items(**array, "$." + kEnvelope.canonical());
    }

    static Expected<SkillMergeResponse> from_items(const nlohmann::json& array, const std::string& path = "$") {
        auto items = detail::decode_items<DuplicateGroup>(array, path);
        if (!items) return tl::unexpected(items.error());
        return SkillMergeResponse{std::move(*items)};
    }

    Expected<void> validate() const {
        std::set<std::string> seen;
        for (const auto& group : duplicate_groups) {
            if (group.canonical_name.empty()) {
                return tl::unexpected(detail::validation_error("Duplicate group has no canonical name"));
            }
            if (group.skill_ids.size() < 2) {
                return tl::unexpected(detail::validation_error(
                    "Duplicate group needs at least two skills", group.canonical_name));
            }
            for (const auto& id : group.skill_ids) {
                if (!is_valid_uuid(id)) {
                    return tl::unexpected(detail::validation_error("Skill id is not a valid UUID", id));
                }
                if (!seen.insert(id).second) {
                    return tl::unexpected(detail::validation_error("Skill id appears in more than one group", id));
                }
            }
        }
        return {};
    }

    bool operator==(const SkillMergeResponse& other) const {
        return duplicate_groups == other.duplicate_groups;
    }

    bool operator!=(const SkillMergeResponse& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Job recommendation
// ============================================================================

/**
 * @brief Best job for the candidate
 *
 * Accepted names:
 * - recommendedJobId | recommended_job_id
 * - reason | rationale
 *
 * Valid iff the job id is a UUID.
 */
struct JobRecommendation {
    std::string recommended_job_id;
    std::string reason;

    static inline const FieldKeys kRecommendedJobId{"recommendedJobId", "recommended_job_id"};
    static inline const FieldKeys kReason{"reason", "rationale"};

    static Expected<JobRecommendation> from_json(const nlohmann::json& doc) {
        if (!doc.is_object()) {
            return tl::unexpected(Error{ErrorCode::UnexpectedShape, "Expected a JSON object", "$"});
        }
        FieldReader reader(doc);

        auto job_id = reader.required<std::string>(kRecommendedJobId);
        if (!job_id) return tl::unexpected(job_id.error());
        auto reason = reader.required<std::string>(kReason);
        if (!reason) return tl::unexpected(reason.error());

        return JobRecommendation{std::move(*job_id), std::move(*reason)};
    }

    Expected<void> validate() const {
        if (!is_valid_uuid(recommended_job_id)) {
            return tl::unexpected(detail::validation_error(
                "Recommended job id is not a valid UUID", recommended_job_id));
        }
        return {};
    }

    bool operator==(const JobRecommendation& other) const {
        return recommended_job_id == other.recommended_job_id && reason == other.reason;
    }

    bool operator!=(const JobRecommendation& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Cover letter selection
// ============================================================================

/** @brief Points given to one cover letter in score voting. */
struct CoverLetterScore {
    std::string letter_uuid;
    int score = 0;
    std::string reasoning;

    static inline const FieldKeys kLetterUuid{"letterUuid", "letter_uuid"};
    static inline const FieldKeys kScore{"score"};
    static inline const FieldKeys kReasoning{"reasoning"};

    static Expected<CoverLetterScore> from_json(const nlohmann::json& source, const std::string& path) {
        if (!source.is_object()) {
            return tl::unexpected(Error{ErrorCode::UnexpectedShape, "Score allocation must be an object", path});
        }
        FieldReader reader(source, path);

        auto letter_uuid = reader.required<std::string>(kLetterUuid);
        if (!letter_uuid) return tl::unexpected(letter_uuid.error());
        auto score = reader.required<int>(kScore);
        if (!score) return tl::unexpected(score.error());

        return CoverLetterScore{std::move(*letter_uuid), *score, reader.optional<std::string>(kReasoning, "")};
    }

    bool operator==(const CoverLetterScore& other) const {
        return letter_uuid == other.letter_uuid && score == other.score && reasoning == other.reasoning;
    }

    bool operator!=(const CoverLetterScore& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Verdict of one model on a set of cover letters
 *
 * Required: strengthAndVoiceAnalysis, verdict. Optional: bestLetterUuid
 * (single-vote scheme) and scoreAllocations (score-vote scheme).
 *
 * Valid iff analysis and verdict are non-empty and either the score
 * allocations total exactly kTotalPoints with no negative score and UUID
 * letter ids, or, without allocations, bestLetterUuid is a UUID.
 */
struct BestCoverLetterResponse {
    static constexpr int kTotalPoints = 20;

    std::string strength_and_voice_analysis;
    std::optional<std::string> best_letter_uuid;
    std::string verdict;
    std::optional<std::vector<CoverLetterScore>> score_allocations;

    static inline const FieldKeys kAnalysis{"strengthAndVoiceAnalysis"};
    static inline const FieldKeys kBestLetterUuid{"bestLetterUuid"};
    static inline const FieldKeys kVerdict{"verdict"};
    static inline const FieldKeys kScoreAllocations{"scoreAllocations"};

    static Expected<BestCoverLetterResponse> from_json(const nlohmann::json& doc) {
        if (!doc.is_object()) {
            return tl::unexpected(Error{ErrorCode::UnexpectedShape, "Expected a JSON object", "$"});
        }
        FieldReader reader(doc);

        auto analysis = reader.required<std::string>(kAnalysis);
        if (!analysis) return tl::unexpected(analysis.error());
        auto verdict = reader.required<std::string>(kVerdict);
        if (!verdict) return tl::unexpected(verdict.error());

        BestCoverLetterResponse response;
        response.strength_and_voice_analysis = std::move(*analysis);
        response.verdict = std::move(*verdict);

        if (const auto* best = reader.find(kBestLetterUuid); best != nullptr && best->is_string()) {
            response.best_letter_uuid = best->get<std::string>();
        }

        if (const auto* allocations = reader.find(kScoreAllocations)) {
            auto scores = detail::decode_items<CoverLetterScore>(*allocations, "$." + kScoreAllocations.canonical());
            if (!scores) return tl::unexpected(scores.error());
            response.score_allocations = std::move(*scores);
        }
        return response;
    }

    Expected<void> validate() const {
        if (strength_and_voice_analysis.empty()) {
            return tl::unexpected(detail::validation_error("Analysis is empty"));
        }
        if (verdict.empty()) {
            return tl::unexpected(detail::validation_error("Verdict is empty"));
        }

        if (score_allocations) {
            std::int64_t total = 0;
            for (const auto& allocation : *score_allocations) {
                if (!is_valid_uuid(allocation.letter_uuid)) {
                    return tl::unexpected(detail::validation_error(
                        "Letter id is not a valid UUID", allocation.letter_uuid));
                }
                if (allocation.score < 0) {
                    return tl::unexpected(detail::validation_error(
                        "Score allocation is negative", allocation.letter_uuid));
                }
                total += allocation.score;
            }
            if (total != kTotalPoints) {
                return tl::unexpected(detail::validation_error(
                    "Score allocations must total " + std::to_string(kTotalPoints),
                    "total " + std::to_string(total)));
            }
            return {};
        }

        if (!best_letter_uuid || !is_valid_uuid(*best_letter_uuid)) {
            return tl::unexpected(detail::validation_error(
                "Best letter id is not a valid UUID", best_letter_uuid.value_or("")));
        }
        return {};
    }

    bool operator==(const BestCoverLetterResponse& other) const {
        return strength_and_voice_analysis == other.strength_and_voice_analysis &&
               best_letter_uuid == other.best_letter_uuid &&
               verdict == other.verdict &&
               score_allocations == other.score_allocations;
    }

    bool operator!=(const BestCoverLetterResponse& other) const {
        return !(*this == other);
    }
};

} // namespace decode
} // namespace quarry
