#include "cli/menu_shell.hpp"

#include <sstream>
#include <utility>

#include "nlp/normalizer.hpp"

namespace minigpt::cli {
namespace {

constexpr const char* kFollowUpPrompt =
    "Is the answer profitable? Anything else you want from me? (Yes/No): ";
constexpr const char* kInvalidYesNo = "Invalid input. Please respond with 'Yes' or 'No'.";
constexpr const char* kGoodbye = "Exiting... Goodbye! See you again.";

std::string Trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

}  // namespace

MenuShell::MenuShell(Console& console,
                     minigpt::agent::Responder& responder,
                     minigpt::knowledge::KnowledgeStore& knowledge,
                     minigpt::session::ConversationLog& log,
                     minigpt::config::Config config)
    : console_(console)
    , responder_(responder)
    , knowledge_(knowledge)
    , log_(log)
    , config_(std::move(config)) {}

void MenuShell::ShowMenu() {
    console_.WriteLine("");
    console_.WriteLine("1. Start Chatbot");
    console_.WriteLine("2. Add Knowledge");
    console_.WriteLine("3. Load Knowledge");
    console_.WriteLine("4. Save Knowledge");
    console_.WriteLine("5. View Knowledge");
    console_.WriteLine("6. View Logs");
    console_.WriteLine("7. Save Logs");
    console_.WriteLine("8. Exit");
}

void MenuShell::Run() {
    while (true) {
        ShowMenu();
        const auto line = console_.ReadLine("Enter your choice: ");
        if (!line) {
            console_.WriteLine(kGoodbye);
            return;
        }
        const auto choice = Trim(*line);
        bool more_input = true;
        if (choice == "1") {
            more_input = RunChat();
        } else if (choice == "2") {
            more_input = AddKnowledge();
        } else if (choice == "3") {
            more_input = LoadKnowledge();
        } else if (choice == "4") {
            more_input = SaveKnowledge();
        } else if (choice == "5") {
            ViewKnowledge();
        } else if (choice == "6") {
            ViewLogs();
        } else if (choice == "7") {
            more_input = SaveLogs();
        } else if (choice == "8") {
            console_.WriteLine(kGoodbye);
            return;
        } else {
            console_.WriteLine("Invalid choice. Please try again.");
        }
        if (!more_input) {
            console_.WriteLine(kGoodbye);
            return;
        }
    }
}

bool MenuShell::RunChat() {
    const auto& name = config_.bot.name;
    console_.WriteLine("Hi! I'm " + name
        + ". If you want anything from me, you can ask. Or type 'exit' to quit the chat.");
    while (true) {
        const auto line = console_.ReadLine("You: ");
        if (!line) {
            return false;
        }
        const auto input = minigpt::nlp::Normalize(*line);
        if (input == "exit") {
            console_.WriteLine("Exiting chat... Anything else you want from me?");
            return true;
        }

        const auto response = responder_.Ask(input);
        console_.WriteLine(name + ": " + response);

        const auto follow_up = console_.ReadLine(kFollowUpPrompt);
        if (!follow_up) {
            return false;
        }
        const auto answer = minigpt::nlp::Normalize(*follow_up);
        if (answer == "yes") {
            console_.WriteLine("Thank you for being with us.");
            return true;
        }
        if (answer == "no") {
            console_.WriteLine("How can I help you?");
        } else {
            console_.WriteLine(kInvalidYesNo);
        }
    }
}

bool MenuShell::AddKnowledge() {
    while (true) {
        const auto key = console_.ReadLine("Enter the user input: ");
        if (!key) {
            return false;
        }
        const auto response = console_.ReadLine("Enter the chatbot's response: ");
        if (!response) {
            return false;
        }
        knowledge_.Add(minigpt::nlp::Normalize(*key), Trim(*response));
        const bool saved = knowledge_.Save();

        const auto follow_up = console_.ReadLine(saved
            ? "New knowledge added and saved successfully! Anything else you want to add & save? (Yes/No): "
            : "New knowledge added but could not be saved. Anything else you want to add? (Yes/No): ");
        if (!follow_up) {
            return false;
        }
        const auto answer = minigpt::nlp::Normalize(*follow_up);
        if (answer == "yes") {
            console_.WriteLine("Ok, you are free to add.");
        } else if (answer == "no") {
            console_.WriteLine("Thank you for being with us.");
            return true;
        } else {
            console_.WriteLine(kInvalidYesNo);
        }
    }
}

bool MenuShell::LoadKnowledge() {
    const auto line = console_.ReadLine("Enter the file path to load knowledge: ");
    if (!line) {
        return false;
    }
    const auto path = Trim(*line);
    const auto result = path.empty() ? knowledge_.Load() : knowledge_.Load(path);
    if (result != minigpt::knowledge::LoadResult::kLoaded) {
        console_.WriteLine("Knowledge was not loaded ("
            + std::string(minigpt::knowledge::ToString(result)) + ").");
    }
    return true;
}

bool MenuShell::SaveKnowledge() {
    const auto line = console_.ReadLine("Enter the file path to save knowledge: ");
    if (!line) {
        return false;
    }
    const auto path = Trim(*line);
    const bool saved = path.empty() ? knowledge_.Save() : knowledge_.Save(path);
    if (!saved) {
        console_.WriteLine("Knowledge was not saved.");
    }
    return true;
}

void MenuShell::ViewKnowledge() {
    const auto entries = knowledge_.All();
    console_.WriteLine("");
    console_.WriteLine("Current Knowledge Base:");
    if (entries.empty()) {
        console_.WriteLine("(empty)");
        return;
    }
    for (const auto& entry : entries) {
        console_.WriteLine("Input: " + entry.key + " | Response: " + entry.response);
    }
}

void MenuShell::ViewLogs() {
    std::ostringstream oss;
    log_.Display(oss);
    console_.Write(oss.str());
}

bool MenuShell::SaveLogs() {
    const auto line = console_.ReadLine(
        "Enter the file path to save logs (default: " + config_.logs.export_file + "): ");
    if (!line) {
        return false;
    }
    auto path = Trim(*line);
    if (path.empty()) {
        path = config_.logs.export_file;
    }
    if (!log_.Save(path)) {
        console_.WriteLine("Logs were not saved.");
    }
    return true;
}

}  // namespace minigpt::cli
