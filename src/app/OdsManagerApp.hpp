/**
 * @file OdsManagerApp.hpp
 * @brief Command-line front end for the ODS engine.
 */

#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "application/OdsEngine.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace odsmanager::app {

/**
 * @struct CommandLine
 * @brief argv split into positionals, valued options and flags.
 */
struct CommandLine {
    std::vector<std::string> positionals;
    std::map<std::string, std::vector<std::string>> options; ///< Repeatable "--name value".
    std::set<std::string> flags;                              ///< Value-less "--name".

    /** @brief Last value given for name, or fallback. */
    std::string option(const std::string& name, const std::string& fallback = "") const;
    bool has(const std::string& name) const { return flags.count(name) > 0 || options.count(name) > 0; }

    /** @brief Parses argv[first..argc). Unknown flags are taken as valued options. */
    static CommandLine Parse(int argc, char** argv, int first);
};

/**
 * @class OdsManagerApp
 * @brief Loads settings, wires the engine to its collaborators and runs one command.
 */
class OdsManagerApp {
public:
    /**
     * @brief Runs the command named by argv.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Builds the engine from settings and global options.
     * @return True if the standard and defaults could be loaded.
     */
    bool Init(const CommandLine& cli);

    void PrintUsage() const;

    domain::FileReference Source(const std::string& location, const CommandLine& cli) const;

    int CmdShow(const CommandLine& cli);
    int CmdWrite(const CommandLine& cli);
    int CmdExport(const CommandLine& cli);
    int CmdCoverage(const CommandLine& cli);
    int CmdContinuity(const CommandLine& cli);
    int CmdElevation(const CommandLine& cli);
    int CmdActive(const CommandLine& cli);
    int CmdMonitor(const CommandLine& cli);
    int CmdDefaults(const CommandLine& cli);

    infrastructure::Settings m_settings;
    std::unique_ptr<application::OdsEngine> m_engine;
};

} // namespace odsmanager::app
