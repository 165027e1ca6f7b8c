#include "cli/cli_dispatcher.hpp"

#include "util/string_utils.hpp"

#include <cctype>
#include <iostream>
#include <map>
#include <string>
#include <vector>

CliDispatcher::CliDispatcher(const std::string& programName, const Version& version) : m_programName{ programName }, m_version{ version }, m_isRunning{ false } {
    // Register help and exit by default
    registerCommand("help", "Prints this help page.", [this]() { return handleHelp(); });
    registerCommand("exit", "Exits the program.", [this]() { return handleExit(); });
}

bool CliDispatcher::isCommandNameValid(const std::string& name) const {
    if (name.empty()) {
        return false;
    }

    // Command name should be visible characters only
    for (char c : name) {
        if (!std::isgraph(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    // Command should not already be registered
    if (m_commandDescriptions.find(name) != m_commandDescriptions.end()) {
        return false;
    }

    return true;
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler) {
    if (!isCommandNameValid(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commandDescriptions.insert({ name, description });
    m_handlersWithoutArguments.insert({ name, handler });
    return true;
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler) {
    if (!isCommandNameValid(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commandDescriptions.insert({ name, description });
    m_commandArguments.insert({ name, { argument } });
    m_handlersWithArgument.insert({ name, handler });
    return true;
}

bool CliDispatcher::registerCommand(const std::string& name, const std::vector<std::string>& arguments, const std::string& description, const HandlerWithArguments& handler) {
    if (!isCommandNameValid(name) || arguments.empty()) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commandDescriptions.insert({ name, description });
    m_commandArguments.insert({ name, arguments });
    m_handlersWithArguments.insert({ name, handler });
    return true;
}

void CliDispatcher::run(std::istream& input) {
    m_isRunning = true;

    std::cout << m_programName << " " << m_version.major << "." << m_version.minor << "." << m_version.patch << "\n";
    std::cout << "Type \"help\" for more information.\n";
    while (m_isRunning) {
        std::cout << "> ";
        std::string userInput;
        if (!std::getline(input, userInput)) {
            break;
        }
        dispatch(userInput);
    }
}

void CliDispatcher::run() {
    run(std::cin);
}

bool CliDispatcher::dispatch(const std::string& commandLine) {
    std::vector<std::string> tokens = parseTokens(commandLine, ' ');
    if (tokens.empty()) {
        return false;
    }

    const std::string& commandName = tokens[0];
    std::vector<std::string> arguments(tokens.begin() + 1, tokens.end());
    int numArguments = static_cast<int>(arguments.size());

    auto printArgumentCountError = [&commandName, numArguments](int expected) {
        std::cerr << "Error: Incorrect number of arguments provided for " << commandName << ": Expected " << expected << ", got " << numArguments << "\n";
    };

    if (m_handlersWithoutArguments.find(commandName) != m_handlersWithoutArguments.end()) {
        if (numArguments != 0) {
            printArgumentCountError(0);
            return false;
        }

        return m_handlersWithoutArguments[commandName]();
    }
    else if (m_handlersWithArgument.find(commandName) != m_handlersWithArgument.end()) {
        if (numArguments == 0) {
            printArgumentCountError(1);
            return false;
        }

        // Solver labels such as "BET 100" contain spaces
        return m_handlersWithArgument[commandName](join(arguments, " "));
    }
    else if (m_handlersWithArguments.find(commandName) != m_handlersWithArguments.end()) {
        int expected = static_cast<int>(m_commandArguments[commandName].size());
        if (numArguments != expected) {
            printArgumentCountError(expected);
            return false;
        }

        return m_handlersWithArguments[commandName](arguments);
    }
    else {
        std::cerr << "Error: Unknown command: " << commandName << "\n";
        return false;
    }
}

bool CliDispatcher::handleHelp() const {
    std::cout << m_programName << " options:\n";
    for (const std::string& name : m_commandOrder) {
        std::cout << name;

        if (m_commandArguments.find(name) != m_commandArguments.end()) {
            for (const std::string& argument : m_commandArguments.at(name)) {
                std::cout << " <" << argument << ">";
            }
        }

        std::cout << ": " << m_commandDescriptions.at(name) << "\n";
    }
    return true;
}

bool CliDispatcher::handleExit() {
    m_isRunning = false;
    return true;
}
