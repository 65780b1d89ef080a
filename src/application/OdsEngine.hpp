/**
 * @file OdsEngine.hpp
 * @brief Application service reconciling several named ODS instances.
 */

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "application/ContinuityService.hpp"
#include "domain/HorizonService.hpp"
#include "domain/OdsInstance.hpp"
#include "domain/OdsRepository.hpp"
#include "domain/RecordInput.hpp"
#include "domain/Standard.hpp"

namespace odsmanager::application {

/**
 * @enum CullMode
 * @brief Temporal relevance criterion for cullByTime.
 */
enum class CullMode {
    Stale,   ///< Drop records that stopped before the cull instant.
    Inactive ///< Also drop records that start after the cull instant.
};

inline std::optional<CullMode> CullModeFromString(const std::string& mode) {
    if (mode == "stale") return CullMode::Stale;
    if (mode == "inactive") return CullMode::Inactive;
    return std::nullopt;
}

/**
 * @struct CullOptions
 * @brief Culling passes applied by the write pipeline.
 */
struct CullOptions {
    bool stale = true;      ///< Cull stale records relative to "now".
    bool duplicates = true; ///< Collapse duplicates on the standard's time sort order.
};

/** @brief Refers to an existing instance by name. */
struct InstanceName {
    std::string name;
};

/**
 * @brief Argument of the write pipeline: nothing, an existing instance, or new input.
 */
using PipelineInput = std::variant<std::monostate, InstanceName, domain::RecordInput>;

/**
 * @class OdsEngine
 * @brief Registry of instances with a working-instance pointer and shared defaults.
 *
 * Every operation takes an explicit instance name; an empty name means the working
 * instance. Unknown names are reported on stderr and the call returns false, 0 or an
 * empty result. Nothing here throws to the caller.
 */
class OdsEngine {
public:
    static constexpr const char* kDefaultWorkingInstance = "primary";

    /**
     * @param standard Schema shared by every instance.
     * @param repository I/O collaborator for file and URL sources.
     * @param horizon Ephemeris collaborator; may be null when elevation updates are unused.
     * @param workingInstance Name of the instance created at construction.
     */
    OdsEngine(std::shared_ptr<const domain::Standard> standard,
              std::shared_ptr<domain::OdsRepository> repository,
              std::shared_ptr<domain::HorizonService> horizon,
              const std::string& workingInstance = kDefaultWorkingInstance);

    /** @brief Enables informational console output. Warnings are always printed. */
    void setVerbose(bool verbose) { m_verbose = verbose; }

    const domain::Standard& standard() const { return *m_standard; }

    // --- Registry ---

    /**
     * @brief Creates an empty instance.
     * @return False (and no effect) if name exists and overwrite is false.
     */
    bool createInstance(const std::string& name, bool overwrite = false, bool setAsWorking = false);

    bool setWorkingInstance(const std::string& name);
    const std::string& workingInstance() const { return m_workingInstance; }

    bool hasInstance(const std::string& name) const { return m_instances.count(name) > 0; }

    /** @brief Discards an instance. The working instance cannot be dropped. */
    bool dropInstance(const std::string& name);

    /** @brief The named (or working) instance, or nullptr if it does not exist. */
    const domain::OdsInstance* instance(const std::string& name = "") const;

    std::vector<std::string> instanceNames() const;

    // --- Defaults ---

    void setDefaults(domain::FieldMap defaults);
    const domain::FieldMap& defaults() const { return m_defaults; }

    /** @brief Uses the single-valued fields of an instance as defaults. */
    bool defaultsFromInstance(const std::string& name = "");

    // --- Adding ---

    /**
     * @brief Normalizes input into an instance.
     *
     * Lists recompute metadata once at the end. When removeDuplicates is set the instance is
     * then collapsed on the standard's time sort order.
     * @return Number of records ingested.
     */
    std::size_t add(const domain::RecordInput& input, const std::string& instanceName = "", bool removeDuplicates = true);

    /** @brief Loads a source into an instance without collapsing duplicates. */
    bool readOds(const domain::FileReference& source, const std::string& instanceName = "");

    /**
     * @brief Adds every record of from into to.
     *
     * Associative but not commutative: when duplicates collapse, records already in to win.
     */
    bool merge(const std::string& from, const std::string& to, bool removeDuplicates = true);

    // --- Modifying ---

    /**
     * @brief Removes records by temporal relevance.
     *
     * Stale drops records with cullTime > stop; Inactive also drops cullTime < start.
     * Records without a usable instant are kept.
     */
    bool cullByTime(domain::Instant cullTime, CullMode mode, const std::string& instanceName = "");

    /** @brief cullByTime with a date expression ("now", ISO text, ...). */
    bool cullByTime(const std::string& cullTime, CullMode mode, const std::string& instanceName = "");

    /** @brief Keeps only records passing the standard's validity predicate. */
    bool cullByInvalid(const std::string& instanceName = "");

    /** @brief Collapses duplicates on the standard's time sort order. */
    bool cullByDuplicate(const std::string& instanceName = "");

    bool sortAndDedup(const std::vector<std::string>& sortKeyFields,
                      bool collapse,
                      bool reverse,
                      const std::string& instanceName = "");

    /** @return Fields applied / prior field count, or 0 for a missed entry or instance. */
    std::size_t updateEntry(std::size_t index, const domain::EntryUpdate& update, const std::string& instanceName = "");

    /**
     * @brief Restricts every record to the time its source is above elevationLimitDeg.
     *
     * Records never above the limit are dropped.
     */
    bool updateByElevation(double elevationLimitDeg, double timeStepSec, const std::string& instanceName = "");

    /** @brief Replaces records with ContinuityService::continuity() output. */
    bool updateByContinuity(double offsetSeconds, AdjustSide side, const std::string& instanceName = "");

    /** @brief Sets start/stop of each record from windows (one per record). */
    bool updateOdsTimes(const std::vector<domain::TimeWindow>& windows, const std::string& instanceName = "");

    /** @brief Sets back-to-back windows from start with one duration per record. */
    bool updateOdsTimes(domain::Instant start, const std::vector<double>& durationsSec, const std::string& instanceName = "");

    // --- Analyses ---

    std::optional<CoverageReport> coverage(const std::string& instanceName = "") const;

    /**
     * @brief Indices of records whose [start, stop] contains at.
     * @param source Loaded into a fresh "check_active" instance first; when nullopt the
     *        existing "check_active" instance is used as is.
     */
    std::vector<std::size_t> checkActive(domain::Instant at, const std::optional<domain::FileReference>& source);

    /** @brief Logs how many records are valid and why the others are not. */
    void instanceReport(const std::string& instanceName = "") const;

    // --- Output ---

    bool writeInstance(const std::string& filename, const std::string& instanceName = "");

    /** @param columns Column order; all schema fields when empty. */
    bool exportTabular(const std::string& filename,
                       const std::vector<std::string>& columns,
                       const std::string& separator = ",",
                       const std::string& instanceName = "");

    /**
     * @brief Standard pipeline: merge adds into original, cull, and write filename.
     *
     * adds defaults to the working instance; original defaults to an empty instance.
     * Temporary instances are discarded afterwards.
     */
    bool writeOds(const std::string& filename,
                  const PipelineInput& adds = std::monostate{},
                  const PipelineInput& original = std::monostate{},
                  CullOptions cull = CullOptions{});

    /**
     * @brief Keeps a local tabular log of records that were active on an online ODS.
     */
    bool onlineMonitor(const std::string& url,
                       const std::string& logfile,
                       const std::vector<std::string>& columns = {},
                       const std::string& separator = ",");

private:
    domain::OdsInstance* resolve(const std::string& name);
    const domain::OdsInstance* resolve(const std::string& name) const;

    std::size_t ingest(domain::OdsInstance& target, const domain::FieldMap& input);
    std::size_t ingest(domain::OdsInstance& target, const domain::RecordList& input);
    std::size_t ingest(domain::OdsInstance& target, const domain::FileReference& input);
    std::size_t ingest(domain::OdsInstance& target, const domain::AttributeBag& input);
    std::size_t ingest(domain::OdsInstance& target, const std::vector<domain::OdsRecord>& input);

    void finishBatch(domain::OdsInstance& target, bool removeDuplicates);

    /** @return Instance name for a pipeline input, or nullopt on failure. */
    std::optional<std::string> stagePipelineInput(const PipelineInput& input,
                                                  const std::string& temporaryName,
                                                  bool emptyMeansWorking,
                                                  std::vector<std::string>& temporaries);

    std::shared_ptr<const domain::Standard> m_standard;
    std::shared_ptr<domain::OdsRepository> m_repository;
    std::shared_ptr<domain::HorizonService> m_horizon;
    ContinuityService m_continuity;

    std::map<std::string, domain::OdsInstance> m_instances;
    std::string m_workingInstance;
    domain::FieldMap m_defaults;
    bool m_verbose = false;
};

} // namespace odsmanager::application
