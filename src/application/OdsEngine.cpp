/**
 * @file OdsEngine.cpp
 * @brief Implementation of the OdsEngine registry and pipelines.
 */

#include "application/OdsEngine.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <utility>

#include "domain/RecordNormalizer.hpp"

namespace odsmanager::application {

using domain::FieldMap;
using domain::Instant;
using domain::OdsInstance;
using domain::OdsRecord;
using domain::RecordNormalizer;
using domain::TimeTools;

namespace {

constexpr const char* kCheckActiveInstance = "check_active";
constexpr const char* kInstanceToAdd = "instance_to_add";
constexpr const char* kInstanceToUpdate = "instance_to_update";
constexpr const char* kFromWebInstance = "from_web";
constexpr const char* kFromLogInstance = "from_log";

} // namespace

OdsEngine::OdsEngine(std::shared_ptr<const domain::Standard> standard,
                     std::shared_ptr<domain::OdsRepository> repository,
                     std::shared_ptr<domain::HorizonService> horizon,
                     const std::string& workingInstance)
    : m_standard(std::move(standard)),
      m_repository(std::move(repository)),
      m_horizon(std::move(horizon)),
      m_workingInstance(workingInstance.empty() ? kDefaultWorkingInstance : workingInstance) {
    createInstance(m_workingInstance, true, false);
}

// --- Registry ---

bool OdsEngine::createInstance(const std::string& name, bool overwrite, bool setAsWorking) {
    if (name.empty()) {
        std::cerr << "[OdsEngine] Instance name must not be empty." << std::endl;
        return false;
    }
    auto it = m_instances.find(name);
    if (it != m_instances.end()) {
        if (!overwrite) {
            std::cerr << "[OdsEngine] Instance " << name << " already exists." << std::endl;
            return false;
        }
        m_instances.erase(it);
    }
    m_instances.emplace(name, OdsInstance(name, m_standard));
    if (setAsWorking) setWorkingInstance(name);
    return true;
}

bool OdsEngine::setWorkingInstance(const std::string& name) {
    if (!hasInstance(name)) {
        std::cerr << "[OdsEngine] ODS instance " << name << " does not exist." << std::endl;
        return false;
    }
    m_workingInstance = name;
    if (m_verbose) std::cout << "[OdsEngine] The ODS working instance is " << name << std::endl;
    return true;
}

bool OdsEngine::dropInstance(const std::string& name) {
    if (name == m_workingInstance) {
        std::cerr << "[OdsEngine] Cannot drop the working instance " << name << "." << std::endl;
        return false;
    }
    if (m_instances.erase(name) == 0) {
        std::cerr << "[OdsEngine] ODS instance " << name << " does not exist." << std::endl;
        return false;
    }
    return true;
}

const OdsInstance* OdsEngine::instance(const std::string& name) const {
    return resolve(name);
}

std::vector<std::string> OdsEngine::instanceNames() const {
    std::vector<std::string> names;
    names.reserve(m_instances.size());
    for (const auto& entry : m_instances) {
        names.push_back(entry.first);
    }
    return names;
}

OdsInstance* OdsEngine::resolve(const std::string& name) {
    const std::string& key = name.empty() ? m_workingInstance : name;
    auto it = m_instances.find(key);
    if (it == m_instances.end()) {
        std::cerr << "[OdsEngine] " << key << " does not exist. Create it with createInstance or use another name." << std::endl;
        return nullptr;
    }
    return &it->second;
}

const OdsInstance* OdsEngine::resolve(const std::string& name) const {
    const std::string& key = name.empty() ? m_workingInstance : name;
    auto it = m_instances.find(key);
    if (it == m_instances.end()) {
        std::cerr << "[OdsEngine] " << key << " does not exist. Create it with createInstance or use another name." << std::endl;
        return nullptr;
    }
    return &it->second;
}

// --- Defaults ---

void OdsEngine::setDefaults(FieldMap defaults) {
    m_defaults = std::move(defaults);
    if (m_verbose) {
        std::cout << "[OdsEngine] Default values:" << std::endl;
        for (const auto& [key, value] : m_defaults) {
            std::cout << "    " << std::left << std::setw(26) << key << "  " << domain::ToString(value) << std::endl;
        }
    }
}

bool OdsEngine::defaultsFromInstance(const std::string& name) {
    const OdsInstance* source = resolve(name);
    if (!source) return false;
    setDefaults(source->singleValuedFields());
    return true;
}

// --- Adding ---

std::size_t OdsEngine::add(const domain::RecordInput& input, const std::string& instanceName, bool removeDuplicates) {
    OdsInstance* target = resolve(instanceName);
    if (!target) return 0;

    const std::size_t ingested = std::visit([this, target](const auto& value) {
        return ingest(*target, value);
    }, input);

    if (ingested) finishBatch(*target, removeDuplicates);
    return ingested;
}

std::size_t OdsEngine::ingest(OdsInstance& target, const FieldMap& input) {
    target.append(RecordNormalizer::Normalize(input, m_defaults, *m_standard));
    return 1;
}

std::size_t OdsEngine::ingest(OdsInstance& target, const domain::RecordList& input) {
    for (const auto& raw : input.records) {
        target.append(RecordNormalizer::Normalize(raw, m_defaults, *m_standard));
    }
    return input.records.size();
}

std::size_t OdsEngine::ingest(OdsInstance& target, const domain::FileReference& input) {
    if (!m_repository) {
        std::cerr << "[OdsEngine] No repository available to read " << input.location << std::endl;
        return 0;
    }
    auto loaded = m_repository->load(input);
    if (!loaded) {
        std::cerr << "[OdsEngine] Failed to read " << input.location << std::endl;
        return 0;
    }
    return ingest(target, domain::RecordList{std::move(*loaded)});
}

std::size_t OdsEngine::ingest(OdsInstance& target, const domain::AttributeBag& input) {
    target.append(RecordNormalizer::Normalize(input, m_defaults, *m_standard));
    return 1;
}

std::size_t OdsEngine::ingest(OdsInstance& target, const std::vector<OdsRecord>& input) {
    for (const auto& record : input) {
        target.append(RecordNormalizer::Normalize(record, m_defaults, *m_standard));
    }
    return input.size();
}

void OdsEngine::finishBatch(OdsInstance& target, bool removeDuplicates) {
    if (removeDuplicates) {
        target.sortAndDedup(m_standard->sortOrderTime(), true, false);
    } else {
        target.recomputeMetadata();
    }
}

bool OdsEngine::readOds(const domain::FileReference& source, const std::string& instanceName) {
    OdsInstance* target = resolve(instanceName);
    if (!target) return false;

    const std::size_t before = target->size();
    if (ingest(*target, source) == 0) {
        std::cerr << "[OdsEngine] Nothing read from " << source.location << ", keeping " << target->name() << " as is." << std::endl;
        return false;
    }
    target->recomputeMetadata();
    if (m_verbose) {
        std::cout << "[OdsEngine] Read " << target->size() - before << " records from " << source.location << std::endl;
    }
    instanceReport(target->name());
    return true;
}

bool OdsEngine::merge(const std::string& from, const std::string& to, bool removeDuplicates) {
    const OdsInstance* source = resolve(from);
    OdsInstance* target = resolve(to);
    if (!source || !target) return false;

    // Copy first: from and to may be the same instance.
    std::vector<OdsRecord> incoming = source->records();
    if (ingest(*target, incoming)) finishBatch(*target, removeDuplicates);
    if (m_verbose) {
        std::cout << "[OdsEngine] Merged " << incoming.size() << " records from " << source->name()
                  << " into " << target->name() << " (" << target->size() << " now)." << std::endl;
    }
    return true;
}

// --- Modifying ---

bool OdsEngine::cullByTime(Instant cullTime, CullMode mode, const std::string& instanceName) {
    OdsInstance* target = resolve(instanceName);
    if (!target) return false;

    const std::size_t before = target->size();
    std::vector<OdsRecord> kept;
    kept.reserve(before);
    for (const auto& record : target->records()) {
        auto stop = record.instant(m_standard->stop());
        if (stop && *stop < cullTime) continue;
        if (mode == CullMode::Inactive) {
            auto start = record.instant(m_standard->start());
            if (start && cullTime < *start) continue;
        }
        kept.push_back(record);
    }
    target->replaceRecords(std::move(kept));

    if (m_verbose) {
        std::cout << "[OdsEngine] Culled " << before - target->size() << " " << (mode == CullMode::Stale ? "stale" : "inactive")
                  << " records from " << target->name() << " at " << TimeTools::FormatIso(cullTime) << std::endl;
    }
    return true;
}

bool OdsEngine::cullByTime(const std::string& cullTime, CullMode mode, const std::string& instanceName) {
    auto instant = TimeTools::InterpretDate(cullTime);
    if (!instant) {
        std::cerr << "[OdsEngine] Cannot interpret cull time '" << cullTime << "'." << std::endl;
        return false;
    }
    return cullByTime(*instant, mode, instanceName);
}

bool OdsEngine::cullByInvalid(const std::string& instanceName) {
    OdsInstance* target = resolve(instanceName);
    if (!target) return false;

    const auto& valid = target->validIndices();
    if (valid.size() == target->size()) {
        if (m_verbose) std::cout << "[OdsEngine] All records in " << target->name() << " are valid." << std::endl;
        return true;
    }
    if (valid.empty()) {
        std::cerr << "[OdsEngine] No valid records in " << target->name() << "; the instance will be empty." << std::endl;
    }

    std::vector<OdsRecord> kept;
    kept.reserve(valid.size());
    for (std::size_t index : valid) {
        kept.push_back(target->records()[index]);
    }
    const std::size_t removed = target->size() - kept.size();
    target->replaceRecords(std::move(kept));
    if (m_verbose) std::cout << "[OdsEngine] Removed " << removed << " invalid records from " << target->name() << std::endl;
    return true;
}

bool OdsEngine::cullByDuplicate(const std::string& instanceName) {
    return sortAndDedup(m_standard->sortOrderTime(), true, false, instanceName);
}

bool OdsEngine::sortAndDedup(const std::vector<std::string>& sortKeyFields,
                             bool collapse,
                             bool reverse,
                             const std::string& instanceName) {
    OdsInstance* target = resolve(instanceName);
    if (!target) return false;

    const std::size_t before = target->size();
    target->sortAndDedup(sortKeyFields, collapse, reverse);
    if (m_verbose && before != target->size()) {
        std::cout << "[OdsEngine] Removed " << before - target->size() << " duplicates from " << target->name() << std::endl;
    }
    return true;
}

std::size_t OdsEngine::updateEntry(std::size_t index, const domain::EntryUpdate& update, const std::string& instanceName) {
    OdsInstance* target = resolve(instanceName);
    if (!target) return 0;
    return target->updateAt(index, update);
}

bool OdsEngine::updateByElevation(double elevationLimitDeg, double timeStepSec, const std::string& instanceName) {
    OdsInstance* target = resolve(instanceName);
    if (!target) return false;
    if (!m_horizon) {
        std::cerr << "[OdsEngine] No horizon service configured." << std::endl;
        return false;
    }
    if (m_verbose) std::cout << "[OdsEngine] Updating " << target->name() << " for elevation limit " << elevationLimitDeg << std::endl;

    std::vector<OdsRecord> updated;
    for (const auto& record : target->records()) {
        auto window = m_horizon->isAboveHorizon(record, *m_standard, elevationLimitDeg, timeStepSec);
        if (!window) continue;
        OdsRecord visible = record;
        visible.fields[m_standard->start()] = window->start;
        visible.fields[m_standard->stop()] = window->stop;
        updated.push_back(std::move(visible));
    }
    target->replaceRecords(std::move(updated));
    return true;
}

bool OdsEngine::updateByContinuity(double offsetSeconds, AdjustSide side, const std::string& instanceName) {
    OdsInstance* target = resolve(instanceName);
    if (!target) return false;
    target->replaceRecords(m_continuity.continuity(*target, offsetSeconds, side));
    return true;
}

bool OdsEngine::updateOdsTimes(const std::vector<domain::TimeWindow>& windows, const std::string& instanceName) {
    OdsInstance* target = resolve(instanceName);
    if (!target) return false;
    if (windows.size() != target->size()) {
        std::cerr << "[OdsEngine] Times list has " << windows.size() << " entries for " << target->size() << " records." << std::endl;
        return false;
    }

    std::vector<OdsRecord> records = target->records();
    for (std::size_t i = 0; i < records.size(); ++i) {
        records[i].fields[m_standard->start()] = windows[i].start;
        records[i].fields[m_standard->stop()] = windows[i].stop;
        records[i].parseFailures.erase(m_standard->start());
        records[i].parseFailures.erase(m_standard->stop());
    }
    target->replaceRecords(std::move(records));
    return true;
}

bool OdsEngine::updateOdsTimes(Instant start, const std::vector<double>& durationsSec, const std::string& instanceName) {
    const OdsInstance* target = resolve(instanceName);
    if (!target) return false;

    std::vector<double> durations = durationsSec;
    if (durations.size() == 1) {
        durations.assign(target->size(), durationsSec.front());
    } else if (durations.size() != target->size()) {
        std::cerr << "[OdsEngine] Observation lengths have " << durations.size() << " entries for "
                  << target->size() << " records." << std::endl;
        return false;
    }
    return updateOdsTimes(TimeTools::GenerateObservationTimes(start, durations), target->name());
}

// --- Analyses ---

std::optional<CoverageReport> OdsEngine::coverage(const std::string& instanceName) const {
    const OdsInstance* target = resolve(instanceName);
    if (!target) return std::nullopt;
    auto report = m_continuity.coverage(*target);
    if (report && m_verbose) {
        std::cout << "[OdsEngine] Time covered: " << report->coveredSeconds << " s of "
                  << report->spanSeconds << " s (" << std::fixed << std::setprecision(1)
                  << 100.0 * report->fraction << "%)" << std::defaultfloat << std::endl;
    }
    return report;
}

std::vector<std::size_t> OdsEngine::checkActive(Instant at, const std::optional<domain::FileReference>& source) {
    std::vector<std::size_t> active;
    if (source) {
        createInstance(kCheckActiveInstance, true, false);
        readOds(*source, kCheckActiveInstance);
    } else if (!hasInstance(kCheckActiveInstance)) {
        std::cerr << "[OdsEngine] No source given and no " << kCheckActiveInstance << " instance to check." << std::endl;
        return active;
    } else if (m_verbose) {
        std::cout << "[OdsEngine] Not reading a new ODS for " << kCheckActiveInstance << "." << std::endl;
    }

    const OdsInstance& checked = m_instances.at(kCheckActiveInstance);
    for (std::size_t i = 0; i < checked.size(); ++i) {
        const OdsRecord& record = checked.records()[i];
        auto start = record.instant(m_standard->start());
        auto stop = record.instant(m_standard->stop());
        if (!start || !stop) continue;
        if (!(at < *start) && !(*stop < at)) active.push_back(i);
    }
    return active;
}

void OdsEngine::instanceReport(const std::string& instanceName) const {
    const OdsInstance* target = resolve(instanceName);
    if (!target) return;

    const std::size_t invalid = target->invalidReasons().size();
    if (target->size() && invalid == target->size()) {
        std::cerr << "[OdsEngine] All records (" << target->size() << ") were invalid." << std::endl;
    } else if (invalid) {
        std::cerr << "[OdsEngine] " << invalid << " / " << target->size() << " were not valid." << std::endl;
    } else if (m_verbose) {
        std::cout << "[OdsEngine] " << target->size() << " are all valid." << std::endl;
        return;
    }

    for (const auto& [index, reasons] : target->invalidReasons()) {
        std::cerr << "[OdsEngine] Entry " << index << ":";
        for (std::size_t i = 0; i < reasons.size(); ++i) {
            std::cerr << (i ? ", " : "  ") << reasons[i];
        }
        std::cerr << std::endl;
    }
}

// --- Output ---

bool OdsEngine::writeInstance(const std::string& filename, const std::string& instanceName) {
    const OdsInstance* target = resolve(instanceName);
    if (!target) return false;
    if (!m_repository) {
        std::cerr << "[OdsEngine] No repository available to write " << filename << std::endl;
        return false;
    }
    if (target->empty()) {
        std::cerr << "[OdsEngine] Writing an empty ODS file: " << filename << std::endl;
    }
    if (!m_repository->save(filename, *target)) return false;
    if (m_verbose) std::cout << "[OdsEngine] Wrote " << target->size() << " records to " << filename << std::endl;
    return true;
}

bool OdsEngine::exportTabular(const std::string& filename,
                              const std::vector<std::string>& columns,
                              const std::string& separator,
                              const std::string& instanceName) {
    const OdsInstance* target = resolve(instanceName);
    if (!target) return false;
    if (!m_repository) {
        std::cerr << "[OdsEngine] No repository available to export " << filename << std::endl;
        return false;
    }
    const auto& chosen = columns.empty() ? m_standard->fieldNames() : columns;
    return m_repository->exportTabular(filename, *target, chosen, separator);
}

std::optional<std::string> OdsEngine::stagePipelineInput(const PipelineInput& input,
                                                         const std::string& temporaryName,
                                                         bool emptyMeansWorking,
                                                         std::vector<std::string>& temporaries) {
    if (std::holds_alternative<std::monostate>(input) && emptyMeansWorking) {
        return m_workingInstance;
    }
    if (const auto* named = std::get_if<InstanceName>(&input)) {
        if (!hasInstance(named->name)) {
            std::cerr << "[OdsEngine] Pipeline instance " << named->name << " does not exist." << std::endl;
            return std::nullopt;
        }
        return named->name;
    }

    createInstance(temporaryName, true, false);
    temporaries.push_back(temporaryName);
    if (const auto* records = std::get_if<domain::RecordInput>(&input)) {
        if (const auto* file = std::get_if<domain::FileReference>(records)) {
            readOds(*file, temporaryName);
        } else {
            add(*records, temporaryName, true);
        }
    }
    return temporaryName;
}

bool OdsEngine::writeOds(const std::string& filename,
                         const PipelineInput& adds,
                         const PipelineInput& original,
                         CullOptions cull) {
    std::vector<std::string> temporaries;
    auto dropTemporaries = [this, &temporaries]() {
        for (const auto& name : temporaries) {
            m_instances.erase(name);
        }
    };

    auto toAdd = stagePipelineInput(adds, kInstanceToAdd, true, temporaries);
    auto toUpdate = stagePipelineInput(original, kInstanceToUpdate, false, temporaries);
    if (!toAdd || !toUpdate) {
        dropTemporaries();
        return false;
    }

    merge(*toAdd, *toUpdate, true);

    const std::size_t preCull = m_instances.at(*toUpdate).size();
    if (cull.stale) cullByTime(std::chrono::system_clock::now(), CullMode::Stale, *toUpdate);
    if (cull.duplicates) cullByDuplicate(*toUpdate);
    if (m_instances.at(*toUpdate).empty()) {
        std::cerr << "[OdsEngine] Writing an empty ODS file! Pre-cull count was " << preCull << std::endl;
    }

    bool ok = false;
    if (m_repository) {
        ok = m_repository->save(filename, m_instances.at(*toUpdate));
        if (ok && m_verbose) {
            std::cout << "[OdsEngine] Wrote " << m_instances.at(*toUpdate).size() << " records to " << filename << std::endl;
        }
    } else {
        std::cerr << "[OdsEngine] No repository available to write " << filename << std::endl;
    }
    dropTemporaries();
    return ok;
}

bool OdsEngine::onlineMonitor(const std::string& url,
                              const std::string& logfile,
                              const std::vector<std::string>& columns,
                              const std::string& separator) {
    createInstance(kFromWebInstance, true, false);
    if (!readOds(domain::FileReference{url, {}}, kFromWebInstance)) {
        m_instances.erase(kFromWebInstance);
        return false;
    }
    cullByTime(std::chrono::system_clock::now(), CullMode::Inactive, kFromWebInstance);

    createInstance(kFromLogInstance, true, false);
    domain::FileReference log{logfile, {}};
    log.tabular.separator = separator;
    if (m_repository && m_repository->exists(logfile)) {
        add(log, kFromLogInstance, false);
    } else if (m_verbose) {
        std::cout << "[OdsEngine] Starting a new monitor log " << logfile << std::endl;
    }
    merge(kFromWebInstance, kFromLogInstance, true);

    const bool ok = exportTabular(logfile, columns, separator, kFromLogInstance);
    m_instances.erase(kFromWebInstance);
    m_instances.erase(kFromLogInstance);
    return ok;
}

} // namespace odsmanager::application
