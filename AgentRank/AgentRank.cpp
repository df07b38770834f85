/*
-------------------------------------------------------------------------------
 AgentRank.cpp
-------------------------------------------------------------------------------
 Purpose:
   Console front end for the agent ranking engine. This is the main entry
   point (contains main()), driving a menu workflow that loads agency data
   from SQLite and ranks the agent pool for a customer entered at the prompt.

 Data flow (very important):
   - Persistent store: SQLite (via db.hpp functions)
   - In-memory snapshot: MetricSnapshot (services.hpp), loaded at startup and
     on "Reload data". Rankings always run against the loaded snapshot.
   - Weight regime: loaded from the scoring_regimes/scoring_weights tables
     and validated before use. A regime that fails validation is never used.

 User input model:
   - Customer fields are picked from their closed value sets; the name is
     free text checked by is_valid_customer_name_entry (validation.hpp).
   - Prompts support special control responses from InputCtl:
       * Back  -> cancel current action and return to the menu
       * Exit  -> exit the app immediately (we set choice = 0 and break)

 Usage:
   AgentRank [database-file]      (default: agentrank.db)
-------------------------------------------------------------------------------
*/

#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>
#include "services.hpp"     // MetricSnapshot and printers
#include "db.hpp"           // SQLite bridge: open/init/load functions
#include "validation.hpp"   // Profile validators and prompt helpers
#include "helpers.hpp"      // show_history
#include "engine.hpp"       // rank_for_customer

// Prints the welcome banner once at startup.
static void showWelcome() {
    std::cout << "=====================================================\n";
    std::cout << "                        WELCOME                      \n";
    std::cout << "=====================================================\n";
    std::cout << "             AgentRank - Agent Assignment            \n";
    std::cout << "-----------------------------------------------------\n";
    std::cout << "      Ranks the agent pool for an incoming customer  \n";
    std::cout << "=====================================================\n\n";
}

// Walk the user through a CustomerProfile. Returns Ok only with every field set.
static InputCtl prompt_profile(CustomerProfile& p) {
    InputCtl r = prompt_until_valid_or_back(
        "Customer name", p.customer_name, is_valid_customer_name_entry,
        "Name required (max 80 chars).");
    if (r != InputCtl::Ok) return r;

    r = prompt_choice_or_back("Communication method", kCommunicationMethods, p.communication_method);
    if (r != InputCtl::Ok) return r;
    r = prompt_choice_or_back("Lead source", kLeadSources, p.lead_source);
    if (r != InputCtl::Ok) return r;
    r = prompt_choice_or_back("Destination", kDestinations, p.destination);
    if (r != InputCtl::Ok) return r;
    return prompt_choice_or_back("Launch location", kLaunchLocations, p.launch_location);
}

//-----------------------------------------
int main(int argc, char** argv) {
    showWelcome();

    const std::string path = (argc > 1) ? argv[1] : "agentrank.db";

    // --- Database bootstrap -------------------------------------------------
    sqlite3* db = nullptr;

    // Open or create the SQLite file. If this fails, we cannot continue.
    if (!db_open(db, path)) {
        std::cout << "Could not open database.\n";
        return 1;
    }

    // Initialize schema and seed sample data on first run.
    if (!db_init_and_seed(db)) {
        std::cout << "Could not initialize database.\n";
        db_close(db);
        return 1;
    }

    MetricSnapshot data;
    if (!db_load_snapshot(db, data)) {
        std::cout << "Could not load agency data.\n";
        db_close(db);
        return 1;
    }

    // A bad weight regime is a startup failure, never a mid-ranking one.
    ScoringConfig cfg;
    if (!db_load_scoring_config(db, "refined", cfg)) {
        std::cout << "Could not load the 'refined' weight regime.\n";
        db_close(db);
        return 1;
    }

    // --- Menu loop ----------------------------------------------------------
    int choice = -1;

    auto clear_input = [] {
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        };

    while (choice != 0) {
        DbCounts counts;
        if (!db_get_counts(db, counts)) std::cout << "(live counts unavailable)\n";

        std::cout
            << "=====================================================\n"
            << "                      MAIN MENU                      \n"
            << "=====================================================\n"
            << "    Agents: " << counts.agents
            << "   Assignments: " << counts.assignments
            << "   Bookings: " << counts.bookings << "\n"
            << "    Weights: " << cfg.name << "\n"
            << "-----------------------------------------------------\n"
            << "  [1]  Rank agents for a customer                    \n"
            << "  [2]  View agents       [3]  View assignment history\n"
            << "  [4]  Choose weights    [5]  Reload data            \n"
            << "-----------------------------------------------------\n"
            << "  [0]  EXIT                                          \n"
            << "=====================================================\n"
            << "  CHOICE: ";

        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            clear_input();
            continue;
        }
        clear_input();

        // ---- 1) Rank agents -----------------------------------------------
        if (choice == 1) {
            CustomerProfile p;
            auto r = prompt_profile(p);
            if (r == InputCtl::Back) continue;
            if (r == InputCtl::Exit) { choice = 0; break; }

            try {
                show_ranking(rank_for_customer(p, data, cfg));
            }
            catch (const ValidationError& e) {
                std::cout << "Customer rejected: " << e.what() << "\n";
            }
            catch (const AgentRankError& e) {
                std::cerr << "Ranking failed: " << e.what() << "\n";
            }
        }

        // ---- 2) View agents -----------------------------------------------
        else if (choice == 2) {
            show_agents(data);
        }

        // ---- 3) View history ----------------------------------------------
        else if (choice == 3) {
            show_history(data);
        }

        // ---- 4) Choose weight regime --------------------------------------
        else if (choice == 4) {
            std::vector<std::string> names;
            if (!db_list_regimes(db, names) || names.empty()) {
                std::cout << "No stored weight regimes.\n";
                continue;
            }
            std::vector<const char*> labels;
            for (const auto& n : names) labels.push_back(n.c_str());

            std::string pick;
            auto r = prompt_choice_or_back("Weight regime", labels, pick);
            if (r == InputCtl::Back) continue;
            if (r == InputCtl::Exit) { choice = 0; break; }

            // Keep the current regime unless the new one loads and validates.
            ScoringConfig next;
            if (db_load_scoring_config(db, pick, next)) {
                cfg = next;
                std::cout << "Using weight regime '" << cfg.name << "'.\n";
            }
            else {
                std::cout << "Regime not usable; still using '" << cfg.name << "'.\n";
            }
        }

        // ---- 5) Reload data -----------------------------------------------
        else if (choice == 5) {
            MetricSnapshot fresh;
            if (db_load_snapshot(db, fresh)) {
                data = std::move(fresh);
                std::cout << "Data reloaded.\n";
            }
            else {
                std::cout << "Reload failed; keeping previous data.\n";
            }
        }

        // ---- Unknown option guard -----------------------------------------
        else if (choice != 0) {
            std::cout << "Unknown option.\n";
        }
    }

    // --- Shutdown -----------------------------------------------------------
    db_close(db);   // Always close the DB before exiting the program.
    return 0;
}
