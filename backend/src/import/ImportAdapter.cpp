#include "ImportAdapter.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <memory>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include "../core/Errors.hpp"

namespace {

struct LineEntry {
    std::string text;
    double x = 0.0;
    double y_top = 0.0;
    double height = 0.0;
};

struct ColumnBucket {
    double center = 0.0;
    std::vector<LineEntry> lines;

    void add(const LineEntry& entry) {
        double count = static_cast<double>(lines.size());
        center = (center * count + entry.x) / (count + 1.0);
        lines.push_back(entry);
    }
};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace((unsigned char)s[start])) ++start;
    size_t end = s.size();
    while (end > start && std::isspace((unsigned char)s[end - 1])) --end;
    return s.substr(start, end - start);
}

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) return (values[mid - 1] + values[mid]) / 2.0;
    return values[mid];
}

// ASCII-only case test; non-ASCII letters count as neither case.
bool isHeading(const LineEntry& entry, double median_height) {
    const std::string text = trim(entry.text);
    if (text.empty()) return false;
    if (text.find_first_of(",-()") != std::string::npos) return false;

    if (!std::isupper((unsigned char)text[0])) return false;
    for (size_t i = 1; i < text.size(); ++i) {
        if (std::isupper((unsigned char)text[i])) return false;
    }

    if (median_height > 0.0) {
        if (text.find(' ') != std::string::npos) return entry.height >= median_height * 1.15;
        return entry.height >= median_height * 0.8;
    }
    return false;
}

std::string normalizeHeading(const std::string& text) {
    std::string out = text;
    while (!out.empty() && out.back() == ':') out.pop_back();
    return trim(out);
}

std::vector<std::vector<LineEntry>> splitIntoColumns(const std::vector<LineEntry>& entries) {
    std::vector<LineEntry> sorted = entries;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const LineEntry& a, const LineEntry& b) { return a.x < b.x; });

    std::vector<ColumnBucket> columns;
    for (const auto& entry : sorted) {
        int best = -1;
        double best_distance = std::numeric_limits<double>::max();
        for (size_t i = 0; i < columns.size(); ++i) {
            double distance = std::fabs(entry.x - columns[i].center);
            if (distance < best_distance) {
                best_distance = distance;
                best = static_cast<int>(i);
            }
        }
        if (best >= 0 && best_distance <= ImportAdapter::COLUMN_THRESHOLD) {
            columns[best].add(entry);
            continue;
        }
        ColumnBucket bucket;
        bucket.center = entry.x;
        bucket.lines.push_back(entry);
        columns.push_back(bucket);
    }

    std::stable_sort(columns.begin(), columns.end(),
        [](const ColumnBucket& a, const ColumnBucket& b) { return a.center < b.center; });

    std::vector<std::vector<LineEntry>> out;
    for (auto& column : columns) out.push_back(std::move(column.lines));
    return out;
}

double requireDouble(const Json::Value& obj, const char* key, const std::string& label) {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isNumeric()) {
        throw ValidationError(label + ": '" + key + "' must be a number");
    }
    return obj[key].asDouble();
}

} // namespace

std::vector<OcrLine> ImportAdapter::parseOcrJson(const std::string& json_text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errs)) {
        throw ValidationError("OCR output is not valid JSON: " + errs);
    }
    if (!root.isArray()) {
        throw ValidationError("OCR output must be a JSON array of lines");
    }

    std::vector<OcrLine> lines;
    lines.reserve(root.size());
    for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
        const Json::Value& row = root[i];
        const std::string label = "ocr[" + std::to_string(i) + "]";
        if (!row.isObject() || !row.isMember("text") || !row["text"].isString()) {
            throw ValidationError(label + ": 'text' must be a string");
        }
        if (!row.isMember("bbox") || !row["bbox"].isObject()) {
            throw ValidationError(label + ": 'bbox' must be an object");
        }

        OcrLine line;
        line.text = row["text"].asString();
        line.bbox.x = requireDouble(row["bbox"], "x", label);
        line.bbox.y = requireDouble(row["bbox"], "y", label);
        line.bbox.w = requireDouble(row["bbox"], "w", label);
        line.bbox.h = requireDouble(row["bbox"], "h", label);
        if (row.isMember("confidence") && row["confidence"].isNumeric()) {
            line.confidence = row["confidence"].asDouble();
        }
        lines.push_back(line);
    }

    spdlog::debug("Parsed {} OCR lines", lines.size());
    return lines;
}

std::string ImportAdapter::normalizeItemText(const std::string& text) {
    std::string out = trim(text);
    if (out.compare(0, 2, "- ") == 0) out = trim(out.substr(2));
    std::replace(out.begin(), out.end(), '.', ',');
    return out;
}

bool ImportAdapter::looksLikeChapterLine(const std::string& text) {
    const std::string lowered = toLower(text);
    if (lowered.find("hoofdstuk") != std::string::npos ||
        lowered.find("chapter") != std::string::npos ||
        lowered.find("hoolastuk") != std::string::npos)
        return true;

    // common OCR misreads of "hoofdstuk"
    return lowered.compare(0, 3, "hoo") == 0 && lowered.find("stuk") != std::string::npos;
}

bool ImportAdapter::looksLikePageNumber(const std::string& text) {
    const std::string trimmed = trim(text);
    if (trimmed.empty()) return false;
    return std::all_of(trimmed.begin(), trimmed.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<ImportCandidate> ImportAdapter::groupLines(const std::vector<OcrLine>& lines,
    const std::optional<std::string>& initial_group)
{
    std::vector<LineEntry> entries;
    for (const auto& line : lines) {
        std::string text = trim(line.text);
        if (text.empty()) continue;
        if (looksLikeChapterLine(text) || looksLikePageNumber(text)) continue;

        LineEntry entry;
        entry.text = text;
        entry.x = line.bbox.x;
        entry.y_top = 1.0 - (line.bbox.y + line.bbox.h);
        entry.height = line.bbox.h;
        entries.push_back(entry);
    }
    if (entries.empty()) return {};

    std::vector<double> heights;
    for (const auto& e : entries) heights.push_back(e.height);
    const double median_height = median(heights);

    std::optional<std::string> current_group = initial_group;
    std::vector<ImportCandidate> items;
    for (auto& column : splitIntoColumns(entries)) {
        std::stable_sort(column.begin(), column.end(),
            [](const LineEntry& a, const LineEntry& b) { return a.y_top < b.y_top; });

        for (const auto& entry : column) {
            std::string normalized = normalizeItemText(entry.text);
            if (normalized.empty()) continue;

            if (isHeading(entry, median_height)) {
                current_group = normalizeHeading(normalized);
                continue;
            }
            items.push_back(ImportCandidate{ normalized, current_group ? *current_group : "Ungrouped" });
        }
    }

    spdlog::info("Grouped {} OCR lines into {} import candidates", lines.size(), items.size());
    return items;
}

ImportResult ImportAdapter::importCandidates(CardStore& store,
    const std::vector<ImportCandidate>& candidates,
    const std::string& chapter,
    Language language,
    const Translator& translator,
    std::time_t now)
{
    // every batch is translated before the first create, so a failing
    // translator leaves the store untouched
    std::vector<std::optional<std::string>> translations(candidates.size());
    if (translator) {
        for (size_t start = 0; start < candidates.size(); start += TRANSLATION_BATCH) {
            size_t end = std::min(candidates.size(), start + TRANSLATION_BATCH);

            std::vector<std::string> texts;
            for (size_t i = start; i < end; ++i) texts.push_back(candidates[i].text);
            auto batch = translator(texts);
            if (batch.size() != texts.size()) {
                throw ValidationError("translator returned " + std::to_string(batch.size()) +
                    " results for " + std::to_string(texts.size()) + " texts");
            }
            std::move(batch.begin(), batch.end(), translations.begin() + start);
        }
        spdlog::debug("Translated {} import candidates", candidates.size());
    }

    ImportResult result;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const ImportCandidate& candidate = candidates[i];
        if (store.wordExists(candidate.text, language)) {
            ++result.skipped;
            continue;
        }

        NewItem fields;
        fields.text = candidate.text;
        fields.translation = translations[i];
        fields.language = language;
        if (!chapter.empty()) fields.chapter = chapter;
        fields.group = candidate.group;
        store.create(fields, now);
        ++result.inserted;
    }

    if (result.skipped > 0) {
        spdlog::info("Import skipped {} duplicate words", result.skipped);
    }
    spdlog::info("Imported {} words into chapter '{}'", result.inserted, chapter);
    return result;
}
