#include "../../include/field_parser.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace {

using vetscan::CaptureMode;
using vetscan::FieldRule;
using vetscan::LabelPlacement;
using vetscan::ReportField;

// d/m/y not embedded in a longer run of digits (2024-05-02 is no match)
constexpr std::string_view kDateShape = R"((?:^|\D)(\d{1,2}[/\-.]\d{1,2}[/\-.]\d{2,4})(?!\d))";
constexpr std::size_t kMinBlockLength = 4;

FieldRule line(ReportField field, std::string_view label) {
    return {field, label, CaptureMode::Line, LabelPlacement::Delimited, {}, 1};
}

FieldRule date(std::string_view label) {
    return {ReportField::Date, label, CaptureMode::Line, LabelPlacement::Delimited, kDateShape, 1};
}

FieldRule block(ReportField field, std::string_view label,
                LabelPlacement placement = LabelPlacement::Delimited) {
    return {field, label, CaptureMode::Block, placement, {}, kMinBlockLength};
}

FieldRule heading(std::string_view label) {
    return {std::nullopt, label, CaptureMode::Line, LabelPlacement::Delimited, {}, 1};
}

bool is_word_byte(const char c) {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u);
}

bool is_blank(const char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool at_line_start(const std::string_view text, std::size_t pos) {
    while (pos > 0 && (text[pos - 1] == ' ' || text[pos - 1] == '\t')) --pos;
    return pos == 0 || text[pos - 1] == '\n';
}

std::string normalize_line(const std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    bool pending_space = false;
    for (const char c : raw) {
        if (is_blank(c)) {
            pending_space = !out.empty();
        } else {
            if (pending_space) out.push_back(' ');
            out.push_back(c);
            pending_space = false;
        }
    }
    return out;
}

std::string normalize_block(const std::string_view raw) {
    std::string out;
    std::size_t start = 0;
    while (start <= raw.size()) {
        auto end = raw.find('\n', start);
        if (end == std::string_view::npos) end = raw.size();
        if (auto l = normalize_line(raw.substr(start, end - start)); !l.empty()) {
            if (!out.empty()) out.push_back('\n');
            out += l;
        }
        start = end + 1;
    }
    return out;
}

} // namespace

namespace vetscan {

const std::vector<FieldRule>& default_field_rules() {
    static const std::vector<FieldRule> kRules = {
        line(ReportField::PatientName, "Paciente"),
        line(ReportField::PatientName, "Nombre del paciente"),
        line(ReportField::PatientName, "Nombre"),
        line(ReportField::PatientName, "Mascota"),
        line(ReportField::PatientName, "Patient name"),
        line(ReportField::PatientName, "Patient"),

        line(ReportField::Species, "Especie"),
        line(ReportField::Species, "Species"),

        line(ReportField::Breed, "Raza"),
        line(ReportField::Breed, "Breed"),

        line(ReportField::Sex, "Sexo"),
        line(ReportField::Sex, "Sex"),

        line(ReportField::Age, "Edad"),
        line(ReportField::Age, "Age"),

        line(ReportField::OwnerName, "Tutor"),
        line(ReportField::OwnerName, "Tutora"),
        line(ReportField::OwnerName, "Propietario"),
        line(ReportField::OwnerName, "Propietaria"),
        line(ReportField::OwnerName, "Dueño"),
        line(ReportField::OwnerName, "Dueña"),
        line(ReportField::OwnerName, "Nombre del propietario"),
        line(ReportField::OwnerName, "Nombre del tutor"),
        line(ReportField::OwnerName, "Owner"),

        // a bare "Médico veterinario" is the signature, not the referring vet
        line(ReportField::Veterinarian, "Derivante"),
        line(ReportField::Veterinarian, "Profesional"),
        line(ReportField::Veterinarian, "Referido por"),
        line(ReportField::Veterinarian, "Remitido por"),
        line(ReportField::Veterinarian, "Médico derivante"),
        line(ReportField::Veterinarian, "Médico veterinario derivante"),
        line(ReportField::Veterinarian, "Veterinario derivante"),
        line(ReportField::Veterinarian, "Veterinaria derivante"),
        line(ReportField::Veterinarian, "Veterinario tratante"),
        line(ReportField::Veterinarian, "Veterinaria tratante"),
        line(ReportField::Veterinarian, "Veterinario remitente"),
        line(ReportField::Veterinarian, "Veterinaria remitente"),
        line(ReportField::Veterinarian, "Referring veterinarian"),
        line(ReportField::Veterinarian, "Referring vet"),
        line(ReportField::Veterinarian, "Veterinarian"),

        date("Fecha"),
        date("Fecha del estudio"),
        date("Fecha de estudio"),
        date("Fecha del informe"),
        date("Date"),

        block(ReportField::Diagnosis, "Diagnóstico radiográfico"),
        block(ReportField::Diagnosis, "Diagnóstico ecográfico"),
        block(ReportField::Diagnosis, "Diagnóstico ecocardiográfico"),
        block(ReportField::Diagnosis, "Diagnóstico presuntivo"),
        block(ReportField::Diagnosis, "Diagnóstico definitivo"),
        block(ReportField::Diagnosis, "Diagnóstico"),
        block(ReportField::Diagnosis, "Diagnósticos"),
        block(ReportField::Diagnosis, "Conclusión"),
        block(ReportField::Diagnosis, "Conclusiones"),
        block(ReportField::Diagnosis, "Impresión diagnóstica"),
        block(ReportField::Diagnosis, "Hallazgos"),
        block(ReportField::Diagnosis, "Diagnosis"),
        block(ReportField::Diagnosis, "Conclusions"),
        block(ReportField::Diagnosis, "Findings"),

        block(ReportField::Recommendations, "Recomendaciones"),
        block(ReportField::Recommendations, "Recomendación"),
        block(ReportField::Recommendations, "Se recomienda", LabelPlacement::LeadIn),
        block(ReportField::Recommendations, "Se sugiere", LabelPlacement::LeadIn),
        block(ReportField::Recommendations, "Notas"),
        block(ReportField::Recommendations, "Nota"),
        block(ReportField::Recommendations, "Comentarios"),
        block(ReportField::Recommendations, "Comentario"),
        block(ReportField::Recommendations, "Observaciones"),
        block(ReportField::Recommendations, "Recommendations"),
        block(ReportField::Recommendations, "Recommendation"),
        block(ReportField::Recommendations, "Notes"),

        heading("Datos clínicos"),
        heading("Datos del paciente"),
        heading("Datos del propietario"),
        heading("Anamnesis"),
        heading("Historia clínica"),
        heading("Motivo de consulta"),
        heading("Examen físico"),
        heading("Informe"),
        heading("Informe radiológico"),
        heading("Informe radiográfico"),
        heading("Informe ecográfico"),
        heading("Informe ecocardiográfico"),
        heading("Estudio radiográfico"),
        heading("Estudio ecográfico"),
        heading("Técnica"),
        heading("Descripción"),
        heading("Proyecciones"),
        heading("Peso"),
        heading("Color"),
        heading("Microchip"),
        heading("Teléfono"),
        heading("Dirección"),
        heading("Email"),
        heading("Firma"),
    };
    return kRules;
}

std::string expand_label(const std::string_view label) {
    static constexpr std::pair<std::string_view, std::string_view> kFolds[] = {
        {"á", "(?:a|á|Á)"}, {"é", "(?:e|é|É)"}, {"í", "(?:i|í|Í)"},
        {"ó", "(?:o|ó|Ó)"}, {"ú", "(?:u|ú|Ú|ü|Ü)"}, {"ñ", "(?:n|ñ|Ñ)"},
    };
    constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";

    std::string out;
    std::size_t i = 0;
    while (i < label.size()) {
        bool folded = false;
        for (const auto& [from, to] : kFolds) {
            if (label.substr(i, from.size()) == from) {
                out += to;
                i += from.size();
                folded = true;
                break;
            }
        }
        if (folded) continue;

        const char c = label[i++];
        if (c == ' ') {
            out += "[ \\t]+";
        } else {
            if (kSpecial.find(c) != std::string_view::npos) out.push_back('\\');
            out.push_back(c);
        }
    }
    return out;
}

FieldParser::FieldParser() : FieldParser(default_field_rules()) {}

FieldParser::FieldParser(const std::vector<FieldRule>& rules) {
    constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;
    rules_.reserve(rules.size());
    for (const auto& rule : rules) {
        std::string source = "(" + expand_label(rule.label) + ")";
        if (rule.placement == LabelPlacement::LeadIn) {
            source += R"((?:[ \t]*[:\-])?)";
        } else {
            // optional "(annotation)", then a delimiter or the end of the line
            source += R"([ \t]*(?:\([^)\n]*\)[ \t]*)?([:\-]|\r?\n|$))";
        }

        CompiledRule compiled{rule, std::regex(source, kFlags), std::nullopt};
        if (!rule.value_shape.empty()) {
            compiled.shape.emplace(std::string(rule.value_shape), std::regex::ECMAScript);
        }
        rules_.push_back(std::move(compiled));
    }
}

std::vector<FieldParser::Occurrence> FieldParser::find_occurrences(const std::string_view text) const {
    std::vector<Occurrence> found;
    const char* const base = text.data();
    for (std::size_t r = 0; r < rules_.size(); ++r) {
        const auto& cr = rules_[r];
        for (std::cregex_iterator it(base, base + text.size(), cr.pattern), end; it != end; ++it) {
            const auto& m = *it;
            const auto label_begin = static_cast<std::size_t>(m[1].first - base);
            const auto label_end = static_cast<std::size_t>(m[1].second - base);
            if (label_begin > 0 && is_word_byte(text[label_begin - 1])) continue;

            std::size_t value_begin = 0;
            if (cr.rule.placement == LabelPlacement::LeadIn) {
                if (!at_line_start(text, label_begin)) continue;
                if (label_end < text.size() && is_word_byte(text[label_end])) continue;
                value_begin = static_cast<std::size_t>(m[0].second - base);
            } else {
                value_begin = static_cast<std::size_t>(m[2].first - base);
                if (value_begin < text.size() && (text[value_begin] == ':' || text[value_begin] == '-')) {
                    ++value_begin;
                } else if (!at_line_start(text, label_begin)) {
                    // an undelimited label must stand alone on its line, not end a sentence
                    continue;
                }
            }
            found.push_back({r, label_begin, value_begin});
        }
    }
    std::ranges::sort(found, [](const Occurrence& a, const Occurrence& b) {
        return a.label_begin != b.label_begin ? a.label_begin < b.label_begin : a.rule < b.rule;
    });
    return found;
}

std::optional<std::string> FieldParser::capture(const std::string_view text, const Occurrence& occ,
                                                const std::vector<Occurrence>& all) const {
    const auto& cr = rules_[occ.rule];

    // first label occurrence starting at or after pos, or the end of the text
    const auto next_stop = [&](const std::size_t pos) {
        const auto it = std::ranges::lower_bound(all, pos, {}, &Occurrence::label_begin);
        return it == all.end() ? text.size() : it->label_begin;
    };

    std::string value;
    if (cr.rule.mode == CaptureMode::Block) {
        const auto stop = next_stop(occ.value_begin);
        value = normalize_block(text.substr(occ.value_begin, stop - occ.value_begin));
    } else {
        auto line_end = text.find('\n', occ.value_begin);
        if (line_end == std::string_view::npos) line_end = text.size();
        const auto stop = std::min(line_end, next_stop(occ.value_begin));
        value = normalize_line(text.substr(occ.value_begin, stop - occ.value_begin));

        if (value.empty() && stop == line_end && line_end < text.size()) {
            // label ends its line: the value may sit on the next one
            const auto next_begin = line_end + 1;
            auto first = next_begin;
            while (first < text.size() && (text[first] == ' ' || text[first] == '\t' || text[first] == '\r')) {
                ++first;
            }
            const auto label_ahead = next_stop(next_begin);
            if (label_ahead == first) return std::nullopt;

            auto next_end = text.find('\n', next_begin);
            if (next_end == std::string_view::npos) next_end = text.size();
            const auto next_line_stop = std::min(next_end, label_ahead);
            value = normalize_line(text.substr(next_begin, next_line_stop - next_begin));
        }
    }

    if (cr.shape) {
        std::smatch m;
        if (!std::regex_search(value, m, *cr.shape)) return std::nullopt;
        value = m.size() > 1 && m[1].matched ? m.str(1) : m.str();
    }
    if (value.empty() || value.size() < cr.rule.min_length) return std::nullopt;
    return value;
}

ReportInfo FieldParser::parse(const std::string_view text) const {
    ReportInfo info;
    const auto occurrences = find_occurrences(text);

    const auto first_value = [&](const ReportField field) -> std::optional<std::string> {
        for (std::size_t r = 0; r < rules_.size(); ++r) {
            if (rules_[r].rule.field != field) continue;
            for (const auto& occ : occurrences) {
                if (occ.rule != r) continue;
                if (auto value = capture(text, occ, occurrences)) return value;
            }
        }
        return std::nullopt;
    };

    for (const auto field : kAllReportFields) {
        info.set(field, first_value(field));
    }

    Logger::log(LogLevel::Debug,
                "Parsed " + std::to_string(info.found_count()) + " of " + std::to_string(kAllReportFields.size()) +
                " report fields from " + std::to_string(occurrences.size()) + " label occurrences",
                "field_parser");
    return info;
}

} // namespace vetscan
