#pragma once
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../core/CardStore.hpp"

// One recognized text line from the OCR provider. Coordinates are normalized
// to [0,1] with the origin at the bottom-left of the page.
struct OcrLine {
    struct BBox {
        double x = 0.0;
        double y = 0.0;
        double w = 0.0;
        double h = 0.0;
    };

    std::string text;
    BBox bbox;
    double confidence = 0.0;
};

struct ImportCandidate {
    std::string text;
    std::string group;
};

struct ImportResult {
    std::size_t inserted = 0;
    std::size_t skipped = 0;
};

// Looks up a translation for a batch of source texts; returns one entry per
// input (empty optional when unknown).
using Translator = std::function<std::vector<std::optional<std::string>>(const std::vector<std::string>&)>;

/*
  Turns a photographed vocabulary list into new Items.

  Lines are bucketed into columns by their x coordinate and read top-down.
  Chapter banners and page numbers are dropped; a short capitalized line that
  is at least as tall as the surrounding text starts a new group.
*/
class ImportAdapter {
public:
    static constexpr double COLUMN_THRESHOLD = 0.08;
    static constexpr std::size_t TRANSLATION_BATCH = 25;

    static std::vector<OcrLine> parseOcrJson(const std::string& json_text);

    static std::vector<ImportCandidate> groupLines(const std::vector<OcrLine>& lines,
        const std::optional<std::string>& initial_group);

    static ImportResult importCandidates(CardStore& store,
        const std::vector<ImportCandidate>& candidates,
        const std::string& chapter,
        Language language,
        const Translator& translator,
        std::time_t now);

    static std::string normalizeItemText(const std::string& text);
    static bool looksLikeChapterLine(const std::string& text);
    static bool looksLikePageNumber(const std::string& text);
};
