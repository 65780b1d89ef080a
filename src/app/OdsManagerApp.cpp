/**
 * @file OdsManagerApp.cpp
 * @brief Implementation of the ods_manager command-line front end.
 */

#include "app/OdsManagerApp.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

#include "infrastructure/EphemerisHorizonService.hpp"
#include "infrastructure/OdsFileRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "ui/InstanceTableView.hpp"

namespace odsmanager::app {

namespace fs = std::filesystem;

namespace {

const std::set<std::string> kFlags = {"verbose", "no-cull-time", "no-cull-duplicate", "help"};

std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

std::optional<double> ParseDouble(const std::string& text) {
    try {
        std::size_t used = 0;
        double value = std::stod(text, &used);
        if (used == text.size()) return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::string SeparatorArgument(const std::string& text) {
    if (text == "tab" || text == "\\t") return "\t";
    if (text == "space") return " ";
    return text;
}

} // namespace

std::string CommandLine::option(const std::string& name, const std::string& fallback) const {
    auto it = options.find(name);
    if (it == options.end() || it->second.empty()) return fallback;
    return it->second.back();
}

CommandLine CommandLine::Parse(int argc, char** argv, int first) {
    CommandLine cli;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 3 || arg.rfind("--", 0) != 0) {
            cli.positionals.push_back(arg);
            continue;
        }
        std::string name = arg.substr(2);
        const auto eq = name.find('=');
        if (eq != std::string::npos) {
            cli.options[name.substr(0, eq)].push_back(name.substr(eq + 1));
        } else if (kFlags.count(name) || i + 1 >= argc) {
            cli.flags.insert(name);
        } else {
            cli.options[name].push_back(argv[++i]);
        }
    }
    return cli;
}

int OdsManagerApp::Run(int argc, char** argv) {
    CommandLine cli = CommandLine::Parse(argc, argv, 1);
    if (cli.positionals.empty() || cli.has("help")) {
        PrintUsage();
        return cli.has("help") ? 0 : 1;
    }
    if (!Init(cli)) return 1;

    const std::string command = cli.positionals.front();
    cli.positionals.erase(cli.positionals.begin());

    if (command == "show") return CmdShow(cli);
    if (command == "write") return CmdWrite(cli);
    if (command == "export") return CmdExport(cli);
    if (command == "coverage") return CmdCoverage(cli);
    if (command == "continuity") return CmdContinuity(cli);
    if (command == "elevation") return CmdElevation(cli);
    if (command == "active") return CmdActive(cli);
    if (command == "monitor") return CmdMonitor(cli);
    if (command == "defaults") return CmdDefaults(cli);

    std::cerr << "[OdsManagerApp] Unknown command: " << command << std::endl;
    PrintUsage();
    return 1;
}

bool OdsManagerApp::Init(const CommandLine& cli) {
    const fs::path settingsPath = cli.option("settings", infrastructure::PathUtils::GetSettingsPath().string());
    m_settings = infrastructure::ConfigLoader::LoadSettings(settingsPath);
    if (cli.has("verbose")) m_settings.verbose = true;
    if (cli.has("standard")) m_settings.standardFile = cli.option("standard");

    auto standard = infrastructure::ConfigLoader::LoadStandard(m_settings.standardFile);
    if (!standard) {
        std::cerr << "[OdsManagerApp] Cannot load the ODS standard." << std::endl;
        return false;
    }

    auto repository = std::make_shared<infrastructure::OdsFileRepository>(standard->dataKey());
    auto horizon = std::make_shared<infrastructure::EphemerisHorizonService>();
    m_engine = std::make_unique<application::OdsEngine>(standard, repository, horizon, m_settings.workingInstance);
    m_engine->setVerbose(m_settings.verbose);

    nlohmann::json defaultsRef = m_settings.defaults;
    if (cli.options.count("defaults")) defaultsRef = cli.option("defaults");
    if (!defaultsRef.is_null()) {
        auto defaults = infrastructure::ConfigLoader::ResolveDefaults(defaultsRef);
        if (!defaults) {
            std::cerr << "[OdsManagerApp] Cannot resolve defaults " << defaultsRef.dump() << std::endl;
            return false;
        }
        m_engine->setDefaults(std::move(*defaults));
    }
    return true;
}

void OdsManagerApp::PrintUsage() const {
    std::cout
        << "Usage: ods_manager [--settings FILE] [--standard FILE] [--defaults REF] [--verbose] <command> ...\n"
        << "\n"
        << "Commands:\n"
        << "  show <source>... [--order f1,f2] [--block N]   Show records (several sources are merged)\n"
        << "  write <output> [--add SOURCE] [--original SOURCE] [--set field=value ...]\n"
        << "        [--no-cull-time] [--no-cull-duplicate]     Merge, cull and write an ODS file\n"
        << "  export <source> <output> [--cols f1,f2] [--sep ,] Write records as delimited text\n"
        << "  coverage <source>                               Fraction of the span covered by records\n"
        << "  continuity <source> <output> [--offset SEC] [--adjust start|stop]\n"
        << "  elevation <source> <output> [--el DEG] [--dt SEC]\n"
        << "  active [source] [--at TIME]                     Records active at TIME (default now)\n"
        << "  monitor <logfile> [--url URL] [--cols f1,f2] [--sep ,]\n"
        << "  defaults [REF]                                  Show resolved defaults\n"
        << "\n"
        << "Tabular sources accept --input-sep SEP, --replace-char FROM[:TO] and --header-map FILE.\n";
}

domain::FileReference OdsManagerApp::Source(const std::string& location, const CommandLine& cli) const {
    domain::FileReference source{location, {}};
    source.tabular.separator = SeparatorArgument(cli.option("input-sep", "auto"));
    const std::string replace = cli.option("replace-char");
    if (!replace.empty()) {
        const auto colon = replace.find(':');
        source.tabular.replaceFrom = replace.substr(0, colon);
        if (colon != std::string::npos) source.tabular.replaceTo = replace.substr(colon + 1);
    }
    source.tabular.headerMapFile = cli.option("header-map");
    return source;
}

int OdsManagerApp::CmdShow(const CommandLine& cli) {
    if (cli.positionals.empty()) {
        std::cerr << "[OdsManagerApp] show needs at least one source." << std::endl;
        return 1;
    }
    for (const auto& location : cli.positionals) {
        m_engine->add(Source(location, cli), "", false);
    }
    m_engine->instanceReport();

    const domain::OdsInstance* working = m_engine->instance();
    if (!working || working->empty()) {
        std::cout << "No records to print." << std::endl;
        return 0;
    }
    std::vector<std::string> order = SplitList(cli.option("order", "src_id,src_start_utc,src_end_utc"));
    auto block = ParseDouble(cli.option("block", "5"));
    std::cout << ui::InstanceTableView::Render(*working, order, block && *block >= 1.0 ? static_cast<std::size_t>(*block) : 5);
    return 0;
}

int OdsManagerApp::CmdWrite(const CommandLine& cli) {
    if (cli.positionals.empty()) {
        std::cerr << "[OdsManagerApp] write needs an output file." << std::endl;
        return 1;
    }

    application::PipelineInput adds;
    if (cli.options.count("add")) {
        adds = domain::RecordInput{Source(cli.option("add"), cli)};
    } else if (cli.options.count("set")) {
        domain::AttributeBag bag;
        for (const auto& assignment : cli.options.at("set")) {
            const auto eq = assignment.find('=');
            if (eq == std::string::npos) {
                std::cerr << "[OdsManagerApp] --set expects field=value, got " << assignment << std::endl;
                return 1;
            }
            bag.attributes.emplace_back(assignment.substr(0, eq), assignment.substr(eq + 1));
        }
        adds = domain::RecordInput{bag};
    }

    application::PipelineInput original;
    if (cli.options.count("original")) {
        original = domain::RecordInput{Source(cli.option("original"), cli)};
    }

    application::CullOptions cull;
    cull.stale = !cli.has("no-cull-time");
    cull.duplicates = !cli.has("no-cull-duplicate");
    return m_engine->writeOds(cli.positionals.front(), adds, original, cull) ? 0 : 1;
}

int OdsManagerApp::CmdExport(const CommandLine& cli) {
    if (cli.positionals.size() < 2) {
        std::cerr << "[OdsManagerApp] export needs a source and an output file." << std::endl;
        return 1;
    }
    if (!m_engine->readOds(Source(cli.positionals[0], cli))) return 1;
    const std::string cols = cli.option("cols", "all");
    const std::vector<std::string> columns = cols == "all" ? std::vector<std::string>{} : SplitList(cols);
    return m_engine->exportTabular(cli.positionals[1], columns, SeparatorArgument(cli.option("sep", ","))) ? 0 : 1;
}

int OdsManagerApp::CmdCoverage(const CommandLine& cli) {
    if (cli.positionals.empty()) {
        std::cerr << "[OdsManagerApp] coverage needs a source." << std::endl;
        return 1;
    }
    if (!m_engine->readOds(Source(cli.positionals[0], cli))) return 1;
    auto report = m_engine->coverage();
    if (!report) return 1;
    std::cout << "Covered " << report->coveredSeconds << " s of " << report->spanSeconds << " s ("
              << std::fixed << std::setprecision(1) << 100.0 * report->fraction << "%)" << std::defaultfloat << std::endl;
    for (const auto& window : report->merged) {
        std::cout << "  " << domain::TimeTools::FormatIso(window.start) << "  ->  " << domain::TimeTools::FormatIso(window.stop) << std::endl;
    }
    return 0;
}

int OdsManagerApp::CmdContinuity(const CommandLine& cli) {
    if (cli.positionals.size() < 2) {
        std::cerr << "[OdsManagerApp] continuity needs a source and an output file." << std::endl;
        return 1;
    }
    auto offset = ParseDouble(cli.option("offset", "1"));
    auto side = application::AdjustSideFromString(cli.option("adjust", "start"));
    if (!offset || !side) {
        std::cerr << "[OdsManagerApp] --offset must be a number and --adjust start or stop." << std::endl;
        return 1;
    }
    if (!m_engine->readOds(Source(cli.positionals[0], cli))) return 1;
    if (!m_engine->updateByContinuity(*offset, *side)) return 1;
    return m_engine->writeInstance(cli.positionals[1]) ? 0 : 1;
}

int OdsManagerApp::CmdElevation(const CommandLine& cli) {
    if (cli.positionals.size() < 2) {
        std::cerr << "[OdsManagerApp] elevation needs a source and an output file." << std::endl;
        return 1;
    }
    auto limit = ParseDouble(cli.option("el", std::to_string(m_settings.elevationLimitDeg)));
    auto step = ParseDouble(cli.option("dt", std::to_string(m_settings.timeStepSec)));
    if (!limit || !step) {
        std::cerr << "[OdsManagerApp] --el and --dt must be numbers." << std::endl;
        return 1;
    }
    if (!m_engine->readOds(Source(cli.positionals[0], cli))) return 1;
    if (!m_engine->updateByElevation(*limit, *step)) return 1;
    return m_engine->writeInstance(cli.positionals[1]) ? 0 : 1;
}

int OdsManagerApp::CmdActive(const CommandLine& cli) {
    const std::string when = cli.option("at", "now");
    auto at = domain::TimeTools::InterpretDate(when);
    if (!at) {
        std::cerr << "[OdsManagerApp] Cannot interpret time '" << when << "'." << std::endl;
        return 1;
    }
    const std::string location = cli.positionals.empty() ? m_settings.onlineUrl : cli.positionals.front();
    auto active = m_engine->checkActive(*at, Source(location, cli));

    const domain::OdsInstance* checked = m_engine->instance("check_active");
    if (active.empty() || !checked) {
        std::cout << "No active records at " << domain::TimeTools::FormatIso(*at) << std::endl;
        return 0;
    }
    const auto& standard = m_engine->standard();
    for (std::size_t index : active) {
        const auto& record = checked->records()[index];
        std::cout << index << ": " << domain::ToString(record.get(standard.source())) << "  "
                  << domain::ToString(record.get(standard.start())) << " - "
                  << domain::ToString(record.get(standard.stop())) << std::endl;
    }
    return 0;
}

int OdsManagerApp::CmdMonitor(const CommandLine& cli) {
    if (cli.positionals.empty()) {
        std::cerr << "[OdsManagerApp] monitor needs a log file." << std::endl;
        return 1;
    }
    const std::string cols = cli.option("cols", "all");
    const std::vector<std::string> columns = cols == "all" ? std::vector<std::string>{} : SplitList(cols);
    const bool ok = m_engine->onlineMonitor(cli.option("url", m_settings.onlineUrl),
                                            cli.positionals.front(),
                                            columns,
                                            SeparatorArgument(cli.option("sep", ",")));
    return ok ? 0 : 1;
}

int OdsManagerApp::CmdDefaults(const CommandLine& cli) {
    if (!cli.positionals.empty()) {
        auto defaults = infrastructure::ConfigLoader::ResolveDefaults(nlohmann::json(cli.positionals.front()));
        if (!defaults) return 1;
        m_engine->setDefaults(std::move(*defaults));
    } else if (m_engine->defaults().empty()) {
        const fs::path dir = infrastructure::PathUtils::GetDefaultsDir();
        std::cout << "Available system defaults files in " << dir.string() << ":" << std::endl;
        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->path().extension() == ".json") std::cout << "    $" << it->path().stem().string() << std::endl;
        }
        return 0;
    }
    std::cout << "Default values:" << std::endl << ui::InstanceTableView::RenderFieldMap(m_engine->defaults());
    return 0;
}

} // namespace odsmanager::app
