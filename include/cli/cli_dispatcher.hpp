#ifndef CLI_DISPATCHER_HPP
#define CLI_DISPATCHER_HPP

#include <functional>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <vector>

using HandlerWithoutArgument = std::function<bool()>;
using HandlerWithArgument = std::function<bool(const std::string&)>;
using HandlerWithArguments = std::function<bool(const std::vector<std::string>&)>;

struct Version {
    int major;
    int minor;
    int patch;
};

class CliDispatcher {
public:
    CliDispatcher(const std::string& programName, const Version& version);

    bool registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler);
    // The argument is the rest of the line, so it may contain single spaces
    bool registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler);
    bool registerCommand(const std::string& name, const std::vector<std::string>& arguments, const std::string& description, const HandlerWithArguments& handler);

    // Reads commands until "exit" or the end of the input
    void run(std::istream& input);
    void run();

    // Runs a single command line, returns whether the command succeeded
    bool dispatch(const std::string& commandLine);

private:
    bool isCommandNameValid(const std::string& name) const;
    bool handleHelp() const;
    bool handleExit();

    std::string m_programName;
    Version m_version;
    bool m_isRunning;
    std::vector<std::string> m_commandOrder;
    std::map<std::string, std::string> m_commandDescriptions;
    std::map<std::string, std::vector<std::string>> m_commandArguments;
    std::map<std::string, HandlerWithoutArgument> m_handlersWithoutArguments;
    std::map<std::string, HandlerWithArgument> m_handlersWithArgument;
    std::map<std::string, HandlerWithArguments> m_handlersWithArguments;
};

#endif // CLI_DISPATCHER_HPP
