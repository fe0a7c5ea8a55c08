/**
 * @file field_parser.hpp
 * @brief Pulls the structured fields of a veterinary report out of its text.
 */

#ifndef VETSCAN_FIELD_PARSER_HPP
#define VETSCAN_FIELD_PARSER_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace vetscan {

enum class ReportField {
    PatientName,
    Species,
    Breed,
    Sex,
    Age,
    OwnerName,
    Veterinarian,
    Date,
    Diagnosis,
    Recommendations
};

inline constexpr std::array<ReportField, 10> kAllReportFields = {
    ReportField::PatientName, ReportField::Species, ReportField::Breed, ReportField::Sex,
    ReportField::Age, ReportField::OwnerName, ReportField::Veterinarian, ReportField::Date,
    ReportField::Diagnosis, ReportField::Recommendations
};

constexpr std::string_view to_string(const ReportField field) noexcept {
    switch (field) {
        case ReportField::PatientName:     return "patient_name";
        case ReportField::Species:         return "species";
        case ReportField::Breed:           return "breed";
        case ReportField::Sex:             return "sex";
        case ReportField::Age:             return "age";
        case ReportField::OwnerName:       return "owner_name";
        case ReportField::Veterinarian:    return "veterinarian";
        case ReportField::Date:            return "date";
        case ReportField::Diagnosis:       return "diagnosis";
        case ReportField::Recommendations: return "recommendations";
    }
    return "unknown";
}

/**
 * @brief Field values of one report; every field may be absent.
 */
class ReportInfo {
public:
    [[nodiscard]] const std::optional<std::string>& get(ReportField field) const noexcept {
        return values_[static_cast<std::size_t>(field)];
    }

    void set(ReportField field, std::optional<std::string> value) {
        values_[static_cast<std::size_t>(field)] = std::move(value);
    }

    /// @return Number of fields with a value.
    [[nodiscard]] std::size_t found_count() const noexcept {
        std::size_t n = 0;
        for (const auto& v : values_) n += v.has_value() ? 1 : 0;
        return n;
    }

    bool operator==(const ReportInfo&) const = default;

private:
    std::array<std::optional<std::string>, kAllReportFields.size()> values_;
};

/// How much text a label captures.
enum class CaptureMode {
    Line, ///< Rest of the line, or the next line when the label ends its line
    Block ///< Everything up to the next label of any kind
};

/// Where a label may stand.
enum class LabelPlacement {
    Delimited, ///< Anywhere followed by ':' / '-', or alone at the start of its line
    LeadIn     ///< At the start of a line; the delimiter is optional
};

/**
 * @brief One row of the label table.
 *
 * Labels are written in plain text; accented vowels and ñ also match their
 * unaccented and upper-case forms, and a space matches any run of blanks.
 * Matching is case-insensitive.
 */
struct FieldRule {
    std::optional<ReportField> field; ///< std::nullopt: a section heading that only ends other values
    std::string_view label;
    CaptureMode mode = CaptureMode::Line;
    LabelPlacement placement = LabelPlacement::Delimited;
    std::string_view value_shape;     ///< Regex the value must contain; the match becomes the value
    std::size_t min_length = 1;       ///< Shorter values are treated as no match
};

/// @return The built-in label table (Spanish and English labels).
[[nodiscard]] const std::vector<FieldRule>& default_field_rules();

/**
 * @brief Turn a plain label into an accent-tolerant regex source.
 *
 * "Diagnóstico clínico" becomes "Diagn(?:o|ó|Ó)stico[ \t]+cl(?:i|í|Í)nico".
 */
[[nodiscard]] std::string expand_label(std::string_view label);

/**
 * @brief Table-driven report parser.
 *
 * @details All label occurrences of the whole table are located first. Each
 * field then takes the value of its first rule (in table order) that yields
 * a non-empty value; within a rule the earliest occurrence in the text is
 * tried first. Every value ends where the next label occurrence begins, so a
 * block never swallows a following field.
 *
 * parse() is pure and the parser can be shared between threads.
 */
class FieldParser {
public:
    FieldParser();
    explicit FieldParser(const std::vector<FieldRule>& rules);

    [[nodiscard]] ReportInfo parse(std::string_view text) const;

private:
    struct CompiledRule {
        FieldRule rule;
        std::regex pattern;
        std::optional<std::regex> shape;
    };

    struct Occurrence {
        std::size_t rule = 0;
        std::size_t label_begin = 0;
        std::size_t value_begin = 0;
    };

    [[nodiscard]] std::vector<Occurrence> find_occurrences(std::string_view text) const;
    [[nodiscard]] std::optional<std::string> capture(std::string_view text, const Occurrence& occ,
                                                     const std::vector<Occurrence>& all) const;

    std::vector<CompiledRule> rules_;
};

} // namespace vetscan

#endif // VETSCAN_FIELD_PARSER_HPP
