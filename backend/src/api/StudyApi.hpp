#pragma once
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../core/CardStore.hpp"
#include "../core/SessionManager.hpp"
#include "../import/ImportAdapter.hpp"
#include "../storage/Storage.hpp"
#include "../sync/Reconciler.hpp"

/*
  Front-end facade over the store, the session and the reconciler.

  The clock is injected so every due computation runs against the same
  caller-controlled "now". Failures surface as SrsError subclasses; turning
  them into messages is the front end's job.
*/
class StudyApi {
public:
    using Clock = std::function<std::time_t()>;

    StudyApi(CardStore& store, Reconciler& reconciler, std::size_t session_cap,
        std::string issue_log_path, Clock clock = systemClock);

    StoreCounts counts() const;

    void startSession();
    void continueSession();
    void endSession();
    SessionState sessionState() const;
    std::size_t reviewedInSession() const;

    std::optional<CardView> nextDueCard();
    RetentionRecord gradeCard(const std::string& record_id, ReviewQuality quality);

    Item applyCorrectionLocal(const std::string& item_id,
        const std::optional<std::string>& text,
        const std::optional<std::string>& translation);

    // Remote first, then local; needs a signed-in session.
    Item applyCorrection(const AuthSession* session,
        const std::string& item_id,
        const std::optional<std::string>& text,
        const std::optional<std::string>& translation);

    void reportIssue(const std::string& record_id, const std::optional<std::string>& note);

    IngestSummary refreshFromDataApi(const AuthSession* session, const Snapshot& snapshot);
    IngestSummary refreshFromDataApi(const AuthSession* session, const std::string& json_text);
    IngestSummary refreshFromRemote(const AuthSession* session);

    CreatedCard addWord(const NewItem& fields);
    ImportResult importOcr(const std::string& ocr_json,
        const std::string& chapter,
        Language language,
        const Translator& translator = Translator());
    void deleteWord(const std::string& item_id);
    void deleteAllWords();

    std::vector<Item> listWords() const;
    std::vector<std::string> listChapters() const;
    bool syncAvailable() const { return reconciler.hasRemote(); }

    static std::time_t systemClock();

private:
    CardStore& store;
    Reconciler& reconciler;
    SessionManager session;
    std::string issue_log;
    Clock clock;

    static Correction makeCorrection(const std::optional<std::string>& text,
        const std::optional<std::string>& translation);
};
