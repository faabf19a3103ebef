#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>

#include "../utils/logging.hpp"
#include "../utils/Config.hpp"
#include "../utils/TimeUtil.hpp"
#include "../auth/AuthManager.hpp"
#include "../storage/Storage.hpp"
#include "../core/Errors.hpp"
#include "../core/Scheduler.hpp"
#include "../core/CardStore.hpp"
#include "../sync/FileRemoteStore.hpp"
#include "../sync/Reconciler.hpp"
#include "../api/StudyApi.hpp"

// Turns a core error into something a learner can act on.
std::string describeError(const SrsError& e) {
    switch (e.kind()) {
    case ErrorKind::NOT_FOUND: return "That card no longer exists.";
    case ErrorKind::CONFLICT: return "That card is being changed elsewhere. Try again.";
    case ErrorKind::AUTH_REQUIRED: return "Please log in again to sync.";
    case ErrorKind::VALIDATION: return std::string("The data was rejected: ") + e.what();
    case ErrorKind::TRANSIENT: return "Could not reach storage. Your change was not saved; try again.";
    }
    return e.what();
}

int readChoice() {
    int choice;
    if (!(std::cin >> choice)) {
        if (std::cin.eof()) return -1;
        std::cin.clear();
        std::string dummy; std::getline(std::cin, dummy);
        return 0;
    }
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return choice;
}

std::string readLine(const std::string& prompt) {
    std::cout << prompt;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

// Empty input keeps the field unchanged; a single "-" clears it.
std::optional<std::string> readOptionalEdit(const std::string& prompt) {
    std::string line = readLine(prompt);
    if (line.empty()) return std::nullopt;
    if (line == "-") return std::string();
    return line;
}

bool confirm(const std::string& question) {
    std::string answer = readLine(question + " [y/N] ");
    return answer == "y" || answer == "Y" || answer == "yes";
}

bool readFile(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

int askQuality() {
    while (true) {
        std::cout << "\nHow well did you remember it?\n"
            " 1 = AGAIN\n"
            " 2 = HARD\n"
            " 3 = GOOD\n"
            " 4 = EASY\n> ";
        int q = readChoice();
        if (q < 0) return -1;
        if (q >= 1 && q <= 4) return q;
        std::cout << "Invalid input.\n";
    }
}

void listAllWords(const StudyApi& api, const CardStore& store) {
    auto items = api.listWords();
    std::cout << "\n===== ALL WORDS =====\n";
    if (items.empty()) {
        std::cout << "No words stored.\n";
        return;
    }

    for (size_t i = 0; i < items.size(); i++) {
        const Item& it = items[i];
        std::cout << i + 1 << ". " << it.text;
        if (it.translation) std::cout << " = " << *it.translation;
        std::cout << "\n";
        if (it.chapter) std::cout << "   Chapter: " << *it.chapter;
        if (it.group) std::cout << "   Group: " << *it.group;
        if (it.chapter || it.group) std::cout << "\n";

        auto record = store.recordForItem(it.id);
        if (record) {
            std::cout << "   Interval: " << record->interval_days << " days"
                << "   Ease: " << record->ease
                << "   Reps: " << record->reps
                << "   Lapses: " << record->lapses << "\n";
            std::cout << "   Next review: " << TimeUtil::formatTimestamp(record->due_at) << "\n";
        }
    }
}

int chooseWordIndex(const StudyApi& api, const CardStore& store, std::vector<Item>& items) {
    items = api.listWords();
    if (items.empty()) {
        std::cout << "No words available.\n";
        return -1;
    }
    listAllWords(api, store);
    std::cout << "Choose word number: ";
    int sel = readChoice();
    if (sel < 1 || (size_t)sel > items.size()) {
        std::cout << "Invalid selection.\n";
        return -1;
    }
    return sel - 1;
}

void runReview(StudyApi& api, const AppConfig& config) {
    api.startSession();

    while (true) {
        auto card = api.nextDueCard();
        if (!card) {
            if (api.sessionState() == SessionState::PROMPT) {
                std::cout << "\nYou reviewed " << api.reviewedInSession() << " cards.\n";
                if (confirm("Continue with another " + std::to_string(config.session_cap) + "?")) {
                    api.continueSession();
                    continue;
                }
            }
            else {
                std::cout << "No cards due.\n";
            }
            api.endSession();
            return;
        }

        std::cout << "\n" << card->text;
        if (card->group) std::cout << "   (" << *card->group << ")";
        std::cout << "\n";
        readLine("Press Enter to show the translation...");
        std::cout << "Translation: " << (card->translation ? *card->translation : "(none)") << "\n";

        int q = askQuality();
        if (q < 0) {
            api.endSession();
            return;
        }
        ReviewQuality quality;
        if (!qualityFromInt(q, quality)) continue;

        try {
            auto record = api.gradeCard(card->record_id, quality);
            std::cout << "Next review: " << TimeUtil::formatTimestamp(record.due_at) << "\n";
        }
        catch (const SrsError& e) {
            spdlog::warn("Grading card {} failed: {}", card->record_id, e.what());
            std::cout << describeError(e) << "\n";
        }

        if (confirm("Report a problem with this card?")) {
            std::string note = readLine("Describe the problem (optional): ");
            try {
                api.reportIssue(card->record_id, note.empty() ? std::nullopt : std::optional<std::string>(note));
                std::cout << "Thanks, reported.\n";
            }
            catch (const SrsError& e) {
                std::cout << describeError(e) << "\n";
            }
        }
    }
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    AppConfig config = AppConfig::fromEnvironment();
    Log::init(config);

    AuthManager auth(Storage::userFileIn(config.data_dir));
    const AuthSession* session = nullptr;

    // LOGIN / SIGNUP
    while (!session) {
        std::cout << "\n===== WORDWISE =====\n"
            "1. Login\n"
            "2. Signup\n"
            "3. Exit\n> ";
        int choice = readChoice();
        if (choice < 0 || choice == 3) return 0;

        if (choice == 1) {
            std::string username = readLine("Username: ");
            std::string password = readLine("Password: ");
            if (auth.login(username, password)) {
                session = auth.currentSession();
                std::cout << "Login successful.\n";
            }
            else {
                std::cout << "Invalid username/password.\n";
            }
        }
        else if (choice == 2) {
            std::string username = readLine("Choose username: ");
            std::string password = readLine("Choose password: ");
            if (username.empty() || password.empty()) { std::cout << "Empty fields.\n"; continue; }
            if (auth.signup(username, password)) std::cout << "Signup complete.\n";
            else std::cout << "Signup failed.\n";
        }
    }

    Scheduler scheduler;
    CardStore store(scheduler);

    const std::string store_file = Storage::storeFileFor(config.data_dir, session->username);
    StoreSnapshot saved;
    if (!Storage::loadStore(saved, store_file, session->key)) {
        std::cout << "Could not open your card store. See " << config.log_file << ".\n";
        return 1;
    }
    try {
        store.replaceAll(saved);
    }
    catch (const SrsError& e) {
        spdlog::error("Stored cards for '{}' are inconsistent: {}", session->username, e.what());
        std::cout << describeError(e) << "\n";
        return 1;
    }

    const std::vector<unsigned char> key = session->key;
    store.attachPersistence([store_file, key](const StoreSnapshot& snap) {
        return Storage::saveStore(snap, store_file, key);
    });

    std::unique_ptr<FileRemoteStore> remote;
    if (config.syncEnabled()) remote = std::make_unique<FileRemoteStore>(config.remote_dir);

    SyncPolicy policy;
    policy.timeout = config.sync_timeout;
    policy.attempts = config.sync_attempts;
    Reconciler reconciler(store, remote.get(), policy);

    StudyApi api(store, reconciler, config.session_cap, Storage::issueFileIn(config.data_dir));

    // MAIN LOOP
    while (true) {
        StoreCounts counts = api.counts();
        std::cout << "\n===== MAIN MENU =====\n"
            "User: " << session->username << "   Due: " << counts.due << " / " << counts.total << "\n"
            "1. Review\n"
            "2. Add word\n"
            "3. Import OCR file\n"
            "4. List words\n"
            "5. Correct a word\n"
            "6. Sync\n"
            "7. Delete a word\n"
            "8. Delete all words\n"
            "9. Save & Exit\n> ";

        int choice = readChoice();
        if (choice < 0) choice = 9;

        try {
            if (choice == 1) {
                runReview(api, config);
            }

            else if (choice == 2) {
                NewItem fields;
                fields.text = readLine("Dutch word or phrase: ");
                if (fields.text.empty()) { std::cout << "Text required.\n"; continue; }
                std::string translation = readLine("Translation (optional): ");
                if (!translation.empty()) fields.translation = translation;
                std::string chapter = readLine("Chapter (optional): ");
                if (!chapter.empty()) fields.chapter = chapter;
                std::string group = readLine("Group (optional): ");
                if (!group.empty()) fields.group = group;

                if (store.wordExists(fields.text, fields.language)) {
                    std::cout << "That word is already in your list.\n";
                    continue;
                }
                api.addWord(fields);
                std::cout << "Word added.\n";
            }

            else if (choice == 3) {
                std::string path = readLine("OCR JSON file: ");
                std::string text;
                if (!readFile(path, text)) { std::cout << "Cannot read " << path << ".\n"; continue; }

                auto chapters = api.listChapters();
                if (!chapters.empty()) {
                    std::cout << "Existing chapters:";
                    for (const auto& c : chapters) std::cout << " [" << c << "]";
                    std::cout << "\n";
                }
                std::string chapter = readLine("Chapter: ");
                ImportResult result = api.importOcr(text, chapter, Language::DUTCH);
                std::cout << "Imported " << result.inserted << " words";
                if (result.skipped) std::cout << " (" << result.skipped << " duplicates skipped)";
                std::cout << ".\n";
            }

            else if (choice == 4) {
                listAllWords(api, store);
            }

            else if (choice == 5) {
                std::vector<Item> items;
                int idx = chooseWordIndex(api, store, items);
                if (idx < 0) continue;

                auto text = readOptionalEdit("New text (Enter keeps it): ");
                auto translation = readOptionalEdit("New translation (Enter keeps it, - clears): ");
                if (text && text->empty()) { std::cout << "Text cannot be empty.\n"; continue; }

                if (api.syncAvailable()) api.applyCorrection(session, items[idx].id, text, translation);
                else api.applyCorrectionLocal(items[idx].id, text, translation);
                std::cout << "Word updated.\n";
            }

            else if (choice == 6) {
                if (!api.syncAvailable()) {
                    std::string path = readLine("Snapshot JSON file: ");
                    std::string text;
                    if (!readFile(path, text)) { std::cout << "Cannot read " << path << ".\n"; continue; }
                    IngestSummary s = api.refreshFromDataApi(session, text);
                    std::cout << "Synced " << s.words << " words, " << s.cards << " cards, "
                        << s.reviews << " reviews.\n";
                }
                else {
                    IngestSummary s = api.refreshFromRemote(session);
                    std::cout << "Synced " << s.words << " words, " << s.cards << " cards, "
                        << s.reviews << " reviews.\n";
                }
            }

            else if (choice == 7) {
                std::vector<Item> items;
                int idx = chooseWordIndex(api, store, items);
                if (idx < 0) continue;
                if (confirm("Delete '" + items[idx].text + "' and its review history?")) {
                    api.deleteWord(items[idx].id);
                    std::cout << "Deleted.\n";
                }
            }

            else if (choice == 8) {
                if (confirm("Delete ALL words and review history?")) {
                    api.deleteAllWords();
                    std::cout << "All words deleted.\n";
                }
            }

            else if (choice == 9) {
                if (!auth.save()) std::cout << "Error saving users.\n";
                auth.logout();
                std::cout << "Goodbye!\n";
                break;
            }

            else std::cout << "Invalid.\n";
        }
        catch (const SrsError& e) {
            spdlog::warn("Menu action {} failed: {}", choice, e.what());
            std::cout << describeError(e) << "\n";
        }
    }

    return 0;
}
