#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <limits>
#include <ctime>
#include <cstdio>
#include <stdexcept>

#include "../utils/logging.hpp"
#include "../storage/FileItemStore.hpp"
#include "../core/errors.hpp"
#include "../core/Clock.hpp"
#include "../core/Deck.hpp"
#include "../core/ReviewSession.hpp"
#include "../core/Scheduler.hpp"
#include "../core/Stats.hpp"
#include "../core/TaskTimer.hpp"

static std::string formatTime(std::time_t t) {
    if (t == 0) return "never";
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

static std::string describeInterval(const Item& it) {
    switch (it.intervalUnit()) {
    case IntervalUnit::MINUTES: return std::to_string(static_cast<int>(it.interval)) + " min";
    case IntervalUnit::DAYS: {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f days", it.interval);
        return buf;
    }
    default: return "-";
    }
}

static std::string describeState(const Item& it) {
    if (it.state == CardState::LEARNING)
        return "learning (step " + std::to_string(it.current_step + 1) + ")";
    return cardStateName(it.state);
}

void listAllItems(const std::vector<Item>& items) {
    std::cout << "\n===== ALL CARDS =====\n";

    if (items.empty()) {
        std::cout << "No cards stored.\n";
        return;
    }

    for (size_t i = 0; i < items.size(); i++) {
        const Item& it = items[i];
        std::cout << i + 1 << ". " << it.front << "  ->  " << it.back << "\n";
        std::cout << "   State: " << describeState(it) << "\n";
        std::cout << "   Interval: " << describeInterval(it) << "\n";
        std::cout << "   Ease: " << it.ease << "\n";
        std::cout << "   Lapses: " << it.lapses << "  Reviews: " << it.review_count << "\n";
        std::cout << "   Next review: " << formatTime(it.next_review) << "\n";
        std::cout << "-----------------------------\n";
    }
}

int readInt() {
    int v;
    if (std::cin >> v) {
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        return v;
    }
    if (std::cin.eof()) return -1;
    std::cin.clear();
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return -1;
}

// false ends the session. Accepts 1-4 or the grade names.
bool askQuality(ReviewQuality& out) {
    while (true) {
        std::cout << "\nHow well did you recall it?\n"
            " 1 = AGAIN (Failed)\n"
            " 2 = HARD\n"
            " 3 = GOOD\n"
            " 4 = EASY\n"
            " 0 = End session\n> ";
        std::string line;
        if (!std::getline(std::cin, line)) return false;
        if (line == "0") return false;
        if (parseQuality(line, out)) return true;
        std::cout << "Invalid input.\n";
    }
}

int chooseItemIndex(const std::vector<Item>& items) {
    if (items.empty()) {
        std::cout << "No cards available.\n";
        return -1;
    }
    listAllItems(items);
    std::cout << "Choose card number: ";

    int sel = readInt();
    if (sel < 1 || (size_t)sel > items.size()) {
        std::cout << "Invalid selection.\n";
        return -1;
    }
    return sel - 1;
}

void runReview(ReviewSession& session, TaskTimer& timer, const Clock& clock, SessionMode mode) {
    try {
        session.start(mode);
    }
    catch (const StorageError& e) {
        std::cout << "Could not start session: " << e.what() << "\n";
        return;
    }

    if (!session.current()) {
        std::cout << (mode == SessionMode::DUE_ONLY ? "No cards due.\n" : "No cards yet.\n");
        session.end();
        return;
    }

    while (true) {
        // Cooperative poll for items that became due while we were waiting
        timer.tick(clock.now());

        const Item* item = session.current();
        if (!item) break;

        std::cout << "\n[" << session.remaining() << " left] " << describeState(*item) << "\n"
            << "Front: " << item->front << "\n(press Enter to show the answer)";
        std::string dummy;
        if (!std::getline(std::cin, dummy)) break;
        std::cout << "Back: " << item->back << "\n";

        ReviewQuality q;
        if (!askQuality(q)) break;

        try {
            session.answer(q);
        }
        catch (const StorageError& e) {
            std::cout << "Failed to save review: " << e.what() << "\n";
            break;
        }
    }

    std::cout << "Session finished. Answered " << session.answeredCount() << " card(s).\n";
    session.end();
}

void showDashboard(ItemStore& store, const Clock& clock) {
    StudyStats s;
    try {
        s = computeStats(store, clock.now());
    }
    catch (const StorageError& e) {
        std::cout << "Could not compute stats: " << e.what() << "\n";
        return;
    }

    std::cout << "\n===== DASHBOARD =====\n"
        << "Total cards:    " << s.total_cards << "\n"
        << "Due now:        " << s.due_today << "\n"
        << "Reviewed today: " << s.reviewed_today << "\n"
        << "Mastery:        " << s.mastery_percentage << "%\n"
        << "  new=" << s.new_cards << " learning=" << s.learning_cards
        << " review=" << s.review_cards << " relearning=" << s.relearning_cards << "\n";
}

void editSettings(ItemStore& store, SessionOptions& options) {
    while (true) {
        LearningConfig cfg;
        if (!store.loadConfig(cfg)) {
            std::cout << "Could not load settings.\n";
            break;
        }

        std::cout << "\n=== LEARNING SETTINGS ===\n"
            "1. Learning steps (min):   " << stepsAsLine(cfg.learning_steps) << "\n"
            "2. Relearning steps (min): " << stepsAsLine(cfg.relearning_steps) << "\n"
            "3. Graduating interval:    " << cfg.graduating_interval << " days\n"
            "4. Easy interval:          " << cfg.easy_interval << " days\n"
            "5. New cards per day:      " << cfg.new_cards_per_day << "\n"
            "6. Limit new cards:        " << (options.limit_new_cards ? "on" : "off") << "\n"
            "7. Reset to defaults\n"
            "8. Back\n> ";

        int t = readInt();
        if (t == 8 || std::cin.eof()) break;

        std::string line;
        if (t == 1 || t == 2) {
            std::cout << "Enter steps (comma-separated minutes): ";
            std::getline(std::cin, line);
            std::vector<int> steps;
            if (!parseStepsLine(line, steps)) { std::cout << "Invalid steps.\n"; continue; }
            (t == 1 ? cfg.learning_steps : cfg.relearning_steps) = steps;
        }
        else if (t >= 3 && t <= 5) {
            std::cout << "Enter value: ";
            int v = readInt();
            if (t == 3) cfg.graduating_interval = v;
            else if (t == 4) cfg.easy_interval = v;
            else cfg.new_cards_per_day = v;
        }
        else if (t == 6) {
            options.limit_new_cards = !options.limit_new_cards;
            continue;
        }
        else if (t == 7) {
            cfg = LearningConfig::defaults();
        }
        else {
            std::cout << "Invalid.\n";
            continue;
        }

        if (!cfg.isValid()) {
            std::cout << "Rejected: steps must be non-empty and positive, intervals at least 1 day.\n";
            continue;
        }
        if (!store.saveConfig(cfg)) std::cout << "Error saving settings.\n";
    }
}

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    Log::init();

    std::string dataFile = argc > 1 ? argv[1] : "retenir.dat";
    FileItemStore store(dataFile);

    // UNLOCK
    for (int attempt = 0; attempt < 3 && !store.isOpen(); ++attempt) {
        std::string passphrase;
        std::cout << "Passphrase for '" << dataFile << "': ";
        if (!std::getline(std::cin, passphrase)) return 1;
        if (passphrase.empty()) { std::cout << "Empty passphrase.\n"; continue; }
        if (!store.open(passphrase)) std::cout << "Could not open data file (wrong passphrase?).\n";
    }
    if (!store.isOpen()) return 1;

    SystemClock clock;
    TaskTimer timer;
    Scheduler scheduler(clock, [&store]() {
        LearningConfig cfg;
        if (!store.loadConfig(cfg)) {
            spdlog::warn("Could not load learning config; using defaults");
            return LearningConfig::defaults();
        }
        return cfg;
    });
    SessionOptions options;
    Deck deck(store, clock);

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "1. Add Card\n"
            "2. Review Due Cards\n"
            "3. Review All Cards\n"
            "4. List All Cards\n"
            "5. Search Cards\n"
            "6. Edit Card\n"
            "7. Delete Card\n"
            "8. Dashboard\n"
            "9. Learning Settings\n"
            "10. Exit\n> ";

        int choice = readInt();
        if (std::cin.eof()) break;

        try {
            if (choice == 1) {
                std::string front, back;
                std::cout << "Front: "; std::getline(std::cin, front);
                std::cout << "Back: "; std::getline(std::cin, back);
                deck.addCard(front, back);
                std::cout << "Card added.\n";
            }

            else if (choice == 2 || choice == 3) {
                // Options may have changed in the settings menu
                ReviewSession run(store, scheduler, clock, timer, options);
                runReview(run, timer, clock, choice == 2 ? SessionMode::DUE_ONLY : SessionMode::ALL);
            }

            else if (choice == 4) {
                listAllItems(deck.all());
            }

            else if (choice == 5) {
                std::string query;
                std::cout << "Search: "; std::getline(std::cin, query);
                listAllItems(deck.search(query));
            }

            else if (choice == 6) {
                auto items = deck.all();
                int idx = chooseItemIndex(items); if (idx < 0) continue;
                std::string front, back;
                std::cout << "New front [" << items[idx].front << "]: "; std::getline(std::cin, front);
                std::cout << "New back [" << items[idx].back << "]: "; std::getline(std::cin, back);
                if (front.empty()) front = items[idx].front;
                if (back.empty()) back = items[idx].back;
                deck.editCard(items[idx].id, front, back);
                std::cout << "Card updated.\n";
            }

            else if (choice == 7) {
                auto items = deck.all();
                int idx = chooseItemIndex(items); if (idx < 0) continue;
                std::cout << "Delete '" << items[idx].front << "'? (y/n): ";
                std::string yn; std::getline(std::cin, yn);
                if (yn == "y" || yn == "Y") {
                    deck.deleteCard(items[idx].id);
                    std::cout << "Card deleted.\n";
                }
            }

            else if (choice == 8) {
                showDashboard(store, clock);
            }

            else if (choice == 9) {
                editSettings(store, options);
            }

            else if (choice == 10) {
                std::cout << "Goodbye!\n";
                break;
            }

            else std::cout << "Invalid.\n";
        }
        catch (const std::invalid_argument& e) {
            std::cout << "Invalid input: " << e.what() << "\n";
        }
        catch (const ItemNotFoundError& e) {
            std::cout << e.what() << "\n";
        }
        catch (const StorageError& e) {
            spdlog::error("Storage error: {}", e.what());
            std::cout << "Storage error: " << e.what() << "\n";
        }
    }

    store.close();
    return 0;
}
