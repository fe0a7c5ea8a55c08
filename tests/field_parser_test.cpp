#include "field_parser.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace vetscan;

namespace {

constexpr std::string_view kSampleReport =
    "Paciente: Luna\n"
    "Especie: Canino\n"
    "Raza: Golden Retriever\n"
    "Sexo: Hembra\n"
    "Edad: 5 años\n"
    "Tutor: María García\n"
    "Derivante: Dr. Juan Pérez M.V.\n"
    "Fecha: 15/01/2025\n"
    "\n"
    "DIAGNÓSTICO RADIOGRÁFICO:\n"
    "Se observa cardiomegalia con un índice VHS de 11.5v.\n"
    "Patrón alveolar leve en lóbulos caudales.\n"
    "No se observan signos de efusión pleural.\n"
    "\n"
    "Se recomienda ecocardiograma complementario para evaluar función cardíaca.\n";

bool contains(const std::optional<std::string>& value, const std::string_view needle) {
    return value.has_value() && value->find(needle) != std::string::npos;
}

} // namespace

class FieldParserTest : public ::testing::Test {
protected:
    const FieldParser parser_;
};

TEST_F(FieldParserTest, SampleReportHeaderFields) {
    const auto info = parser_.parse(kSampleReport);
    EXPECT_EQ(info.get(ReportField::PatientName), "Luna");
    EXPECT_EQ(info.get(ReportField::Species), "Canino");
    EXPECT_EQ(info.get(ReportField::Breed), "Golden Retriever");
    EXPECT_EQ(info.get(ReportField::Sex), "Hembra");
    EXPECT_EQ(info.get(ReportField::Age), "5 años");
    EXPECT_EQ(info.get(ReportField::OwnerName), "María García");
    EXPECT_EQ(info.get(ReportField::Veterinarian), "Dr. Juan Pérez M.V.");
    EXPECT_EQ(info.get(ReportField::Date), "15/01/2025");
    EXPECT_EQ(info.found_count(), kAllReportFields.size());
}

TEST_F(FieldParserTest, SampleReportBlocks) {
    const auto info = parser_.parse(kSampleReport);
    EXPECT_TRUE(contains(info.get(ReportField::Diagnosis), "cardiomegalia"));
    EXPECT_TRUE(contains(info.get(ReportField::Diagnosis), "VHS"));
    EXPECT_FALSE(contains(info.get(ReportField::Diagnosis), "ecocardiograma"));
    EXPECT_TRUE(contains(info.get(ReportField::Recommendations), "ecocardiograma"));
}

TEST_F(FieldParserTest, TextWithoutLabelsYieldsNothing) {
    const auto info = parser_.parse("Some random text without fields");
    EXPECT_EQ(info.found_count(), 0u);
    EXPECT_FALSE(info.get(ReportField::PatientName).has_value());
    EXPECT_FALSE(info.get(ReportField::Diagnosis).has_value());
}

TEST_F(FieldParserTest, EmptyTextYieldsNothing) {
    EXPECT_EQ(parser_.parse("").found_count(), 0u);
}

TEST_F(FieldParserTest, AlternativeOwnerLabel) {
    const auto info = parser_.parse("Propietario: Carlos López\nPaciente: Rex");
    EXPECT_EQ(info.get(ReportField::OwnerName), "Carlos López");
    EXPECT_EQ(info.get(ReportField::PatientName), "Rex");
}

TEST_F(FieldParserTest, AlternativeVeterinarianLabel) {
    const auto info = parser_.parse("Profesional: Dra. Ana Ruiz\nPaciente: Firulais");
    EXPECT_EQ(info.get(ReportField::Veterinarian), "Dra. Ana Ruiz");
}

TEST_F(FieldParserTest, UnaccentedConclusionCountsAsDiagnosis) {
    const auto info = parser_.parse(
        "CONCLUSION:\n"
        "Hallazgos compatibles con displasia de cadera bilateral grado III.\n"
        "Osteofitos marginales en ambos acetábulos.\n");
    EXPECT_TRUE(contains(info.get(ReportField::Diagnosis), "displasia"));
    EXPECT_TRUE(contains(info.get(ReportField::Diagnosis), "Osteofitos"));
}

TEST_F(FieldParserTest, NombreIsThePatient) {
    const auto info = parser_.parse("Nombre: Chester\nEspecie: Canino");
    EXPECT_EQ(info.get(ReportField::PatientName), "Chester");
    EXPECT_EQ(info.get(ReportField::Species), "Canino");
}

TEST_F(FieldParserTest, DateOnTheNextLine) {
    const auto info = parser_.parse("Fecha\n11/03/2022\nINFORME RADIOLÓGICO");
    EXPECT_EQ(info.get(ReportField::Date), "11/03/2022");
}

TEST_F(FieldParserTest, DateMustLookLikeADate) {
    const auto info = parser_.parse("Fecha: a confirmar\nPaciente: Toby");
    EXPECT_FALSE(info.get(ReportField::Date).has_value());
    EXPECT_EQ(info.get(ReportField::PatientName), "Toby");
}

TEST_F(FieldParserTest, IsoDateIsNotCutIntoADayMonthYear) {
    const auto info = parser_.parse("Fecha: 2024-05-02\nPaciente: Rex");
    EXPECT_FALSE(info.get(ReportField::Date).has_value());
    EXPECT_EQ(info.get(ReportField::PatientName), "Rex");
}

TEST_F(FieldParserTest, DateAfterAWeekday) {
    const auto info = parser_.parse("Fecha: lunes 15/01/2025\n");
    EXPECT_EQ(info.get(ReportField::Date), "15/01/2025");
}

TEST_F(FieldParserTest, EmptyLabelDoesNotBorrowTheNextHeading) {
    const auto info = parser_.parse("Edad:\nDATOS CLINICOS");
    EXPECT_FALSE(info.get(ReportField::Age).has_value());
}

TEST_F(FieldParserTest, UnaccentedLowercaseDiagnosisHeading) {
    const auto info = parser_.parse(
        "Diagnostico radiográfico:\n"
        "Imágenes sugerentes de osteosarcoma en húmero derecho.\n");
    EXPECT_TRUE(contains(info.get(ReportField::Diagnosis), "osteosarcoma"));
}

TEST_F(FieldParserTest, DiagnosisStopsAtRecommendations) {
    const auto info = parser_.parse(
        "DIAGNÓSTICO:\n"
        "Fractura de fémur izquierdo.\n"
        "RECOMENDACIONES:\n"
        "Reposo estricto.\n");
    EXPECT_EQ(info.get(ReportField::Diagnosis), "Fractura de fémur izquierdo.");
    EXPECT_EQ(info.get(ReportField::Recommendations), "Reposo estricto.");
}

TEST_F(FieldParserTest, LabelWordEndingAProseLineIsNotALabel) {
    const auto info = parser_.parse(
        "Paciente: Luna\n"
        "DIAGNÓSTICO:\n"
        "Cardiomegalia leve acorde a la edad\n"
        "del paciente, sin efusion pleural.\n"
        "RECOMENDACIONES: control anual");
    EXPECT_FALSE(info.get(ReportField::Age).has_value());
    EXPECT_EQ(info.get(ReportField::Diagnosis),
              "Cardiomegalia leve acorde a la edad\ndel paciente, sin efusion pleural.");
    EXPECT_EQ(info.get(ReportField::Recommendations), "control anual");
    EXPECT_EQ(info.get(ReportField::PatientName), "Luna");
}

TEST_F(FieldParserTest, LineValueEndsAtTheNextLabel) {
    const auto info = parser_.parse("Paciente: Luna   Especie: Felino\nRaza: Siamés");
    EXPECT_EQ(info.get(ReportField::PatientName), "Luna");
    EXPECT_EQ(info.get(ReportField::Species), "Felino");
    EXPECT_EQ(info.get(ReportField::Breed), "Siamés");
}

TEST_F(FieldParserTest, ParenthesizedAnnotationAfterLabel) {
    const auto info = parser_.parse("Edad (años): 7\n");
    EXPECT_EQ(info.get(ReportField::Age), "7");
}

TEST_F(FieldParserTest, ChesterReport) {
    const auto info = parser_.parse(
        "Fecha\n11/03/2022\n"
        "Nombre: Chester\nPropietario: Naveda\n"
        "Especie: Canino\nRaza: Dobermann\nSexo: M\nEdad:\n"
        "Referido por: Dra. Gerbeno\n"
        "Diagnostico radiográfico:\n"
        "Imágenes sugerentes de osteosarcoma en húmero derecho.\n"
        "Comentarios:\n"
        "Dr. Martin Vittaz\nMedico Veterinario\n");
    EXPECT_EQ(info.get(ReportField::PatientName), "Chester");
    EXPECT_EQ(info.get(ReportField::OwnerName), "Naveda");
    EXPECT_EQ(info.get(ReportField::Species), "Canino");
    EXPECT_EQ(info.get(ReportField::Breed), "Dobermann");
    EXPECT_EQ(info.get(ReportField::Sex), "M");
    EXPECT_FALSE(info.get(ReportField::Age).has_value());
    EXPECT_EQ(info.get(ReportField::Veterinarian), "Dra. Gerbeno");
    EXPECT_EQ(info.get(ReportField::Date), "11/03/2022");
    EXPECT_TRUE(contains(info.get(ReportField::Diagnosis), "osteosarcoma"));
    EXPECT_FALSE(contains(info.get(ReportField::Diagnosis), "Vittaz"));
}

TEST_F(FieldParserTest, ParsingIsDeterministic) {
    EXPECT_EQ(parser_.parse(kSampleReport), parser_.parse(kSampleReport));
}

TEST(FieldParserRulesTest, ExpandLabelFoldsAccentsAndBlanks) {
    EXPECT_EQ(expand_label("Diagnóstico clínico"), "Diagn(?:o|ó|Ó)stico[ \\t]+cl(?:i|í|Í)nico");
    EXPECT_EQ(expand_label("Dueño"), "Due(?:n|ñ|Ñ)o");
    EXPECT_EQ(expand_label("M.V."), "M\\.V\\.");
}

TEST(FieldParserRulesTest, CustomRuleTable) {
    const std::vector<FieldRule> rules = {
        {ReportField::PatientName, "Animal", CaptureMode::Line, LabelPlacement::Delimited, {}, 1},
        {ReportField::Diagnosis, "Resultado", CaptureMode::Block, LabelPlacement::Delimited, {}, 4},
    };
    const FieldParser parser(rules);
    const auto info = parser.parse("Animal: Kira\nPaciente: ignorado\nResultado:\nsin hallazgos");
    EXPECT_EQ(info.get(ReportField::PatientName), "Kira");
    EXPECT_EQ(info.get(ReportField::Diagnosis), "sin hallazgos");
    EXPECT_FALSE(info.get(ReportField::Species).has_value());
}
