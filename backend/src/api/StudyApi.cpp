#include "StudyApi.hpp"
#include <utility>
#include "../core/Errors.hpp"

StudyApi::StudyApi(CardStore& s, Reconciler& r, std::size_t session_cap,
    std::string issue_log_path, Clock c)
    : store(s), reconciler(r), session(s, session_cap), issue_log(std::move(issue_log_path)), clock(std::move(c))
{
    if (!clock) clock = systemClock;
}

std::time_t StudyApi::systemClock() {
    return std::time(nullptr);
}

Correction StudyApi::makeCorrection(const std::optional<std::string>& text,
    const std::optional<std::string>& translation)
{
    Correction correction;
    correction.text = FieldUpdate<std::string>::fromOptional(text);
    correction.translation = FieldUpdate<std::string>::fromOptional(translation);
    return correction;
}

StoreCounts StudyApi::counts() const {
    return store.counts(clock());
}

/* -------------------------
   Session
   ------------------------- */

void StudyApi::startSession() {
    session.startSession(clock());
}

void StudyApi::continueSession() {
    session.continueSession(clock());
}

void StudyApi::endSession() {
    session.endSession();
}

SessionState StudyApi::sessionState() const {
    return session.state();
}

std::size_t StudyApi::reviewedInSession() const {
    return session.reviewedCount();
}

std::optional<CardView> StudyApi::nextDueCard() {
    return session.nextDueCard(clock());
}

RetentionRecord StudyApi::gradeCard(const std::string& record_id, ReviewQuality quality) {
    return session.gradeCard(record_id, quality, clock());
}

/* -------------------------
   Content
   ------------------------- */

Item StudyApi::applyCorrectionLocal(const std::string& item_id,
    const std::optional<std::string>& text,
    const std::optional<std::string>& translation)
{
    return store.correctContent(item_id, makeCorrection(text, translation));
}

Item StudyApi::applyCorrection(const AuthSession* auth,
    const std::string& item_id,
    const std::optional<std::string>& text,
    const std::optional<std::string>& translation)
{
    reconciler.pushCorrection(auth, item_id, makeCorrection(text, translation));

    auto item = store.getItem(item_id);
    if (!item) {
        throw NotFoundError("item not found: " + item_id);
    }
    return *item;
}

void StudyApi::reportIssue(const std::string& record_id, const std::optional<std::string>& note) {
    auto record = store.getRecord(record_id);
    if (!record) {
        throw NotFoundError("record not found: " + record_id);
    }
    auto item = store.getItem(record->item_id);
    if (!item) {
        throw NotFoundError("item not found: " + record->item_id);
    }

    IssueReport report;
    report.record_id = record->id;
    report.item_id = item->id;
    report.text = item->text;
    report.translation = item->translation;
    report.note = note;
    report.reported_at = clock();

    if (!Storage::appendIssue(report, issue_log)) {
        throw TransientError("could not write issue report to " + issue_log);
    }
}

CreatedCard StudyApi::addWord(const NewItem& fields) {
    return store.create(fields, clock());
}

ImportResult StudyApi::importOcr(const std::string& ocr_json,
    const std::string& chapter,
    Language language,
    const Translator& translator)
{
    auto lines = ImportAdapter::parseOcrJson(ocr_json);
    auto candidates = ImportAdapter::groupLines(lines, store.lastGroupForChapter(chapter));
    return ImportAdapter::importCandidates(store, candidates, chapter, language, translator, clock());
}

void StudyApi::deleteWord(const std::string& item_id) {
    store.deleteItem(item_id);
}

void StudyApi::deleteAllWords() {
    store.deleteAll();
    session.redrawQueue(clock());
}

std::vector<Item> StudyApi::listWords() const {
    return store.allItems();
}

std::vector<std::string> StudyApi::listChapters() const {
    return store.listChapters();
}

/* -------------------------
   Sync
   ------------------------- */

IngestSummary StudyApi::refreshFromDataApi(const AuthSession* auth, const Snapshot& snapshot) {
    IngestSummary summary = reconciler.ingestSnapshot(auth, snapshot);
    session.redrawQueue(clock());
    return summary;
}

IngestSummary StudyApi::refreshFromDataApi(const AuthSession* auth, const std::string& json_text) {
    IngestSummary summary = reconciler.ingestSnapshotJson(auth, json_text);
    session.redrawQueue(clock());
    return summary;
}

IngestSummary StudyApi::refreshFromRemote(const AuthSession* auth) {
    IngestSummary summary = reconciler.refreshFromRemote(auth);
    session.redrawQueue(clock());
    return summary;
}
