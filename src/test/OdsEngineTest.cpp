#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <set>

#include "application/OdsEngine.hpp"
#include "test/TestSupport.hpp"

using namespace odsmanager::domain;
using odsmanager::application::CullMode;
using odsmanager::application::CullOptions;
using odsmanager::application::InstanceName;
using odsmanager::application::OdsEngine;
using odsmanager::test::FullRecord;
using odsmanager::test::LatestStandard;
using odsmanager::test::MockHorizon;
using odsmanager::test::MockRepository;

namespace {

std::set<std::string> KeySet(const OdsInstance& instance) {
    std::set<std::string> keys;
    for (const auto& record : instance.records()) {
        std::string key;
        for (const auto& field : instance.standard().sortOrderTime()) {
            key += ToString(record.get(field)) + "|";
        }
        keys.insert(key);
    }
    return keys;
}

std::string FromNow(double seconds) {
    return TimeTools::FormatIso(TimeTools::AddSeconds(std::chrono::system_clock::now(), seconds));
}

} // namespace

int main() {
    std::cout << "[Test] Starting OdsEngine Test..." << std::endl;
    auto repository = std::make_shared<MockRepository>();
    auto horizon = std::make_shared<MockHorizon>();
    OdsEngine engine(LatestStandard(), repository, horizon);

    // Registry.
    std::cout << "[Test] Registry..." << std::endl;
    assert(engine.workingInstance() == OdsEngine::kDefaultWorkingInstance);
    assert(engine.instance() != nullptr);
    assert(!engine.createInstance("primary"));
    assert(engine.createInstance("other", false, true));
    assert(engine.workingInstance() == "other");
    assert(!engine.dropInstance("other"));
    assert(engine.setWorkingInstance("primary"));
    assert(engine.dropInstance("other"));
    assert(!engine.setWorkingInstance("other"));

    // Unknown names are reported and harmless.
    std::cout << "[Test] Unknown instance..." << std::endl;
    assert(engine.instance("nope") == nullptr);
    assert(engine.add(FullRecord("a", "2024-01-01T00:00:00", "2024-01-01T01:00:00"), "nope") == 0);
    assert(!engine.cullByInvalid("nope"));
    assert(!engine.cullByTime("now", CullMode::Stale, "nope"));
    assert(!engine.coverage("nope"));
    assert(engine.updateEntry(0, DeleteEntry{}, "nope") == 0);
    assert(!engine.merge("nope", "primary"));
    assert(!engine.dropInstance("nope"));

    // Batched add with and without duplicate removal.
    std::cout << "[Test] Add..." << std::endl;
    RecordList batch;
    batch.records = {
        FullRecord("casa", "2024-01-01T01:00:00", "2024-01-01T02:00:00"),
        FullRecord("cyga", "2024-01-01T00:00:00", "2024-01-01T01:00:00"),
        FullRecord("casa", "2024-01-01T01:00:00", "2024-01-01T02:00:00")
    };
    assert(engine.add(batch) == 3);
    assert(engine.instance()->size() == 2);
    assert(ToString(engine.instance()->records()[0].get("src_id")) == "cyga");
    assert(engine.createInstance("raw"));
    assert(engine.add(batch, "raw", false) == 3);
    assert(engine.instance("raw")->size() == 3);
    assert(engine.cullByDuplicate("raw"));
    assert(engine.instance("raw")->size() == 2);

    AttributeBag bag;
    bag.attributes = {{"src_id", "3c84"}, {"src_start_utc", "2024-01-01T05:00:00"}, {"src_end_utc", "2024-01-01T06:00:00"}};
    assert(engine.add(bag, "raw") == 1);
    assert(engine.instance("raw")->size() == 3);
    assert(engine.instance("raw")->invalidReasons().size() == 1);

    // Defaults fill fields the input lacks.
    std::cout << "[Test] Defaults..." << std::endl;
    assert(engine.defaultsFromInstance());
    assert(ToString(engine.defaults().at("site_id")) == "hcro");
    assert(engine.defaults().count("src_id") == 0);
    assert(engine.createInstance("defaulted"));
    assert(engine.add(bag, "defaulted") == 1);
    assert(engine.instance("defaulted")->invalidReasons().empty());
    engine.setDefaults(FieldMap{});

    assert(engine.cullByInvalid("raw"));
    assert(engine.instance("raw")->size() == 2);
    assert(engine.instance("raw")->invalidReasons().empty());

    // Time culls: strict for stale, inclusive start for inactive, fail open when unknown.
    std::cout << "[Test] Cull by time..." << std::endl;
    const Instant cullAt = *TimeTools::InterpretDate("2024-01-01T12:00:00");
    assert(engine.createInstance("cull"));
    RecordList timed;
    timed.records = {
        FullRecord("ends-at-cull", "2024-01-01T11:00:00", "2024-01-01T12:00:00"),
        FullRecord("ended", "2024-01-01T10:00:00", "2024-01-01T11:00:00"),
        FullRecord("starts-at-cull", "2024-01-01T12:00:00", "2024-01-01T13:00:00"),
        FullRecord("future", "2024-01-01T13:00:00", "2024-01-01T14:00:00"),
        FullRecord("unknown", "sometime", "later")
    };
    assert(engine.add(timed, "cull", false) == 5);
    assert(engine.cullByTime(cullAt, CullMode::Stale, "cull"));
    assert(engine.instance("cull")->size() == 4);
    assert(engine.cullByTime(cullAt, CullMode::Inactive, "cull"));
    std::set<std::string> left;
    for (const auto& record : engine.instance("cull")->records()) left.insert(ToString(record.get("src_id")));
    assert((left == std::set<std::string>{"ends-at-cull", "starts-at-cull", "unknown"}));
    assert(!engine.cullByTime("not a date", CullMode::Stale, "cull"));

    // All-invalid instances become empty.
    assert(engine.createInstance("broken"));
    assert(engine.add(FieldMap{{"src_id", std::string("x")}}, "broken") == 1);
    assert(engine.cullByInvalid("broken"));
    assert(engine.instance("broken")->empty());

    // Merge content does not depend on order.
    std::cout << "[Test] Merge..." << std::endl;
    assert(engine.createInstance("a"));
    assert(engine.createInstance("b"));
    engine.add(RecordList{{FullRecord("s1", "2024-01-02T00:00:00", "2024-01-02T01:00:00"),
                           FullRecord("s2", "2024-01-02T01:00:00", "2024-01-02T02:00:00")}}, "a");
    engine.add(RecordList{{FullRecord("s2", "2024-01-02T01:00:00", "2024-01-02T02:00:00"),
                           FullRecord("s3", "2024-01-02T02:00:00", "2024-01-02T03:00:00")}}, "b");
    assert(engine.createInstance("ab"));
    assert(engine.createInstance("ba"));
    assert(engine.merge("a", "ab") && engine.merge("b", "ab"));
    assert(engine.merge("b", "ba") && engine.merge("a", "ba"));
    assert(engine.instance("ab")->size() == 3);
    assert(KeySet(*engine.instance("ab")) == KeySet(*engine.instance("ba")));
    assert(engine.merge("ab", "ab"));
    assert(engine.instance("ab")->size() == 3);

    // Entry updates go through the engine.
    assert(engine.updateEntry(0, FieldMap{{"notes", std::string("checked")}}, "ab") == 1);
    assert(ToString(engine.instance("ab")->records()[0].get("notes")) == "checked");
    assert(engine.updateEntry(7, DeleteEntry{}, "ab") == 0);

    // Elevation: invisible sources go, visible ones get the returned window.
    std::cout << "[Test] Update by elevation..." << std::endl;
    const Instant visibleStart = *TimeTools::InterpretDate("2024-01-02T00:10:00");
    const Instant visibleStop = *TimeTools::InterpretDate("2024-01-02T00:50:00");
    horizon->visible["s1"] = TimeWindow{visibleStart, visibleStop};
    assert(engine.updateByElevation(10.0, 60.0, "a"));
    assert(engine.instance("a")->size() == 1);
    assert(*engine.instance("a")->records()[0].instant("src_start_utc") == visibleStart);
    assert(*engine.instance("a")->records()[0].instant("src_end_utc") == visibleStop);

    // Observation times.
    std::cout << "[Test] Update times..." << std::endl;
    const Instant base = *TimeTools::InterpretDate("2024-02-01T00:00:00");
    assert(engine.updateOdsTimes(base, {600.0}, "ab"));
    const auto& retimed = engine.instance("ab")->records();
    assert(TimeTools::FormatIso(*retimed[0].instant("src_end_utc")) == "2024-02-01T00:10:00");
    assert(TimeTools::FormatIso(*retimed[1].instant("src_start_utc")) == "2024-02-01T00:10:01");
    assert(!engine.updateOdsTimes(base, {1.0, 2.0}, "ab"));
    assert(!engine.updateOdsTimes(std::vector<TimeWindow>{}, "ab"));

    // Continuity and coverage delegate to the checker.
    assert(engine.updateByContinuity(1.0, odsmanager::application::AdjustSide::Start, "ab"));
    auto report = engine.coverage("ab");
    assert(report && report->fraction < 1.0);

    // Active check reads a fresh instance and uses inclusive bounds.
    std::cout << "[Test] Check active..." << std::endl;
    repository->sources["ods.json"] = {
        FullRecord("before", "2024-03-01T00:00:00", "2024-03-01T01:00:00"),
        FullRecord("during", "2024-03-01T01:00:00", "2024-03-01T02:00:00"),
        FullRecord("broken", "never", "2024-03-01T03:00:00")
    };
    const Instant boundary = *TimeTools::InterpretDate("2024-03-01T01:00:00");
    auto active = engine.checkActive(boundary, FileReference{"ods.json", {}});
    assert((active == std::vector<std::size_t>{0, 1}));
    assert(engine.checkActive(*TimeTools::InterpretDate("2024-03-01T01:30:00"), std::nullopt).size() == 1);
    assert(engine.checkActive(boundary, FileReference{"missing.json", {}}).empty());

    // Standard pipeline.
    std::cout << "[Test] Write pipeline..." << std::endl;
    assert(engine.createInstance("pipeline", true, true));
    RecordList mixed;
    mixed.records = {
        FullRecord("stale", "2000-01-01T00:00:00", "2000-01-01T01:00:00"),
        FullRecord("upcoming", FromNow(3600.0), FromNow(7200.0))
    };
    engine.add(mixed);
    repository->sources["original.json"] = {FullRecord("kept", FromNow(-600.0), FromNow(600.0))};

    assert(engine.writeOds("out.json"));
    assert(repository->saved.at("out.json").size() == 1);
    assert(ToString(repository->saved.at("out.json")[0].get("src_id")) == "upcoming");

    assert(engine.writeOds("merged.json", std::monostate{}, RecordInput{FileReference{"original.json", {}}}));
    assert(repository->saved.at("merged.json").size() == 2);

    assert(engine.writeOds("named.json", InstanceName{"pipeline"}, std::monostate{}, CullOptions{false, false}));
    assert(repository->saved.at("named.json").size() == 2);

    assert(engine.writeOds("empty.json", RecordInput{mixed.records[0]}));
    assert(repository->saved.at("empty.json").empty());

    assert(!engine.writeOds("nothing.json", InstanceName{"nope"}));
    assert(repository->saved.count("nothing.json") == 0);
    for (const auto& name : engine.instanceNames()) {
        assert(name != "instance_to_add" && name != "instance_to_update");
    }
    assert(engine.instance("pipeline")->size() == 2);

    // Export column checks.
    std::cout << "[Test] Export..." << std::endl;
    assert(!engine.exportTabular("bad.csv", {"src_id", "not_a_field"}));
    assert(engine.exportTabular("all.csv", {}));
    assert(repository->exported.at("all.csv").size() == engine.standard().fieldNames().size());
    assert(engine.writeInstance("instance.json"));

    // Online monitor keeps the records active now.
    std::cout << "[Test] Online monitor..." << std::endl;
    repository->sources["https://example.org/ods.json"] = {
        FullRecord("live", FromNow(-600.0), FromNow(600.0)),
        FullRecord("later", FromNow(3600.0), FromNow(7200.0))
    };
    assert(engine.onlineMonitor("https://example.org/ods.json", "monitor.csv", {"src_id", "src_start_utc"}));
    assert(repository->saved.at("monitor.csv").size() == 1);
    assert(ToString(repository->saved.at("monitor.csv")[0].get("src_id")) == "live");
    assert(!engine.hasInstance("from_web") && !engine.hasInstance("from_log"));
    assert(!engine.onlineMonitor("https://example.org/missing.json", "monitor.csv"));

    assert(!engine.readOds(FileReference{"missing.json", {}}));

    std::cout << "[PASS] OdsEngine Test." << std::endl;
    return 0;
}
