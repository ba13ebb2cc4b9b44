/*
-------------------------------------------------------------------------------
 SubjectPredictor.cpp
-------------------------------------------------------------------------------
 Purpose:
   Console front end for the Subject Pass/Fail Predictor. This is the main
   entry point (contains main()), driving a menu workflow on top of the
   PerformanceModel, which owns all state and the SQLite parameter store.

 Data flow (very important):
   - Persistent store: SQLite (via db.hpp, owned by PerformanceModel)
   - Edits go to the *pending* parameters only. Nothing is scored or saved
     until the user confirms; each confirmation adds exactly one chart point.
   - Bulk import replaces the whole history and the confirmed parameters.

 User input model:
   - Text input is validated with helpers in validation.hpp
   - Parameter values use prompt_number_or_back (0..100, 0 is a value)
   - Most prompts support special control responses from InputCtl:
       * Back  -> cancel current action and return to the menu
       * Exit  -> exit the app immediately (we set choice = 0 and break)

 Usage:
   subject_predictor [store.db]
   The store defaults to subject_parameters.db in the working directory.

 Build:
   - Requires SQLite3 and nlohmann_json dev headers and a C++17 compiler.
-------------------------------------------------------------------------------
*/

#include <filesystem>
#include <iostream>
#include <iomanip>
#include <limits>
#include <sstream>
#include "model.hpp"        // PerformanceModel: parameters, scoring, import
#include "report.hpp"       // show_parameters / show_prediction / show_chart
#include "validation.hpp"   // Input validation helpers and InputCtl enum
#include "helpers.hpp"      // parse_param_choice
using namespace std;         // OK for this small console app; avoid in headers

// Prints the welcome banner once at startup.
static void showWelcome() {
    cout << "=====================================================\n";
    cout << "                        WELCOME                      \n";
    cout << "=====================================================\n";
    cout << "              Subject Pass/Fail Predictor            \n";
    cout << "-----------------------------------------------------\n";
    cout << "   Tune, confirm, and track the pass probability     \n";
    cout << "=====================================================\n\n";
}

// Live status line under the menu title.
static string statusLine(const PerformanceModel& model) {
    ostringstream os;
    os << "    Points: " << setw(3) << setfill('0') << model.series().size() << setfill(' ');
    if (auto s = model.current_score())
        os << "   Score: " << fixed << setprecision(1) << *s << "%";
    else
        os << "   Score: -";
    os << "   Pending: " << model.pending_changes().size();
    return os.str();
}

//-----------------------------------------
int main(int argc, char** argv) {
    showWelcome();

    ModelConfig config;
    if (argc > 1) config.store_path = argv[1];

    // The model opens the store and loads the confirmed parameters. A missing
    // or unreadable store is not fatal: the model starts from defaults.
    PerformanceModel model(config);
    if (!model.store_available())
        cout << "Warning: parameter store unavailable, changes will not be saved.\n";

    int choice = -1;

    // Utility to reset the cin state and discard the rest of the current line.
    auto clear_input = [] {
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        };

    while (choice != 0) {
        std::cout
            << "=====================================================\n"
            << "                      MAIN MENU                      \n"
            << "=====================================================\n"
            << statusLine(model) << "\n"
            << "-----------------------------------------------------\n"
            << "  [1]  Set parameter     [2]  View parameters        \n"
            << "  [3]  Confirm           [4]  Prediction             \n"
            << "  [5]  Chart             [6]  Bulk import            \n"
            << "-----------------------------------------------------\n"
            << "  [0]  EXIT                                          \n"
            << "=====================================================\n"
            << "  CHOICE: ";

        // If reading the integer fails, flush and redisplay the menu.
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            clear_input();
            continue;
        }
        clear_input();

        // ---- 1) Set parameter (pending only) --------------------------------
        if (choice == 1) {
            std::string which;
            auto r1 = prompt_until_valid_or_back(
                "Parameter (1-5 or name)", which, is_param_choice,
                "Unknown parameter. Use 1-5 or a name such as teaching."
            );
            if (r1 == InputCtl::Back) continue;
            if (r1 == InputCtl::Exit) { choice = 0; break; }

            Param p = Param::Preparedness;
            if (!parse_param_choice(which, p)) continue;

            int value = model.get_pending(p);
            auto r2 = prompt_number_or_back(
                std::string(param_label(p)) + " (now " + std::to_string(value) + ")",
                value, PARAM_MIN, PARAM_MAX);
            if (r2 == InputCtl::Back) continue;
            if (r2 == InputCtl::Exit) { choice = 0; break; }

            model.set_pending(p, value);
            std::cout << pending_changes_line(model.pending_changes()) << "\n";
        }

        // ---- 2) View parameters ---------------------------------------------
        else if (choice == 2) {
            show_parameters(model);
        }

        // ---- 3) Confirm parameters -------------------------------------------
        else if (choice == 3) {
            show_change_log(model.confirm_parameters());
            std::cout << pending_changes_line(model.pending_changes()) << "\n";
        }

        // ---- 4) Prediction ---------------------------------------------------
        else if (choice == 4) {
            show_prediction(model);
        }

        // ---- 5) Chart --------------------------------------------------------
        else if (choice == 5) {
            show_chart(model.series());
        }

        // ---- 6) Bulk import --------------------------------------------------
        else if (choice == 6) {
            std::string path;
            auto r = prompt_until_valid_or_back(
                "File (.csv or .json)", path, is_import_path, "Please select a file first.");
            if (r == InputCtl::Back) continue;
            if (r == InputCtl::Exit) { choice = 0; break; }

            // The model clears the history before opening the file, so bad
            // paths are rejected here.
            if (!is_supported_import_file(path)) {
                std::cout << "Invalid file type. Please use .csv or .json\n"; continue;
            }
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) {
                std::cout << "File not found: " << path << "\n"; continue;
            }

            if (!model.series().empty()) {
                auto c = confirm_or_back("Import replaces the current history. Continue?");
                if (c == InputCtl::Back) continue;
                if (c == InputCtl::Exit) { choice = 0; break; }
            }

            std::cout << "Importing data..." << std::flush;
            ImportResult result = model.import_bulk_data(path);
            std::cout << "\n" << result.message << "\n";
            if (result.success) show_prediction(model);
        }

        // ---- Unknown option guard --------------------------------------------
        else if (choice != 0) {
            std::cout << "Unknown option.\n";
        }
    }

    // --- Shutdown -----------------------------------------------------------
    model.shutdown();   // flush confirmed parameters before exiting
    std::cout << "Goodbye.\n";
    return 0;
}
