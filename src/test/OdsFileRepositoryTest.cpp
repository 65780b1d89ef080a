#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "application/OdsEngine.hpp"
#include "infrastructure/OdsFileRepository.hpp"
#include "infrastructure/TabularFile.hpp"
#include "test/TestSupport.hpp"

using namespace odsmanager::domain;
using odsmanager::application::OdsEngine;
using odsmanager::infrastructure::OdsFileRepository;
using odsmanager::infrastructure::TabularFile;
using odsmanager::test::FullRecord;
using odsmanager::test::LatestStandard;

namespace {

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

} // namespace

int main() {
    std::cout << "[Test] Starting OdsFileRepository Test..." << std::endl;

    const std::filesystem::path testRoot = "test_ods_repository";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    auto standard = LatestStandard();
    auto repository = std::make_shared<OdsFileRepository>(standard->dataKey());
    OdsEngine engine(standard, repository, nullptr);

    // Persisted form round trip.
    std::cout << "[Test] JSON round trip..." << std::endl;
    FieldMap noted = FullRecord("casa", "2024-01-01T01:00:00.250", "2024-01-01T02:00:00");
    noted["notes"] = std::string("calibrator, \"bright\"");
    noted["src_is_pulsar_bool"] = true;
    engine.add(RecordList{{noted, FullRecord("cyga", "2024-01-01T00:00:00", "2024-01-01T01:00:00")}});
    const std::string persisted = (testRoot / "nested" / "ods.json").string();
    assert(engine.writeInstance(persisted));
    assert(std::filesystem::exists(persisted));

    assert(engine.createInstance("reloaded"));
    assert(engine.readOds(FileReference{persisted, {}}, "reloaded"));
    const OdsInstance& original = *engine.instance();
    const OdsInstance& reloaded = *engine.instance("reloaded");
    assert(reloaded.size() == original.size());
    assert(reloaded.invalidReasons().empty());
    for (std::size_t i = 0; i < original.size(); ++i) {
        for (const auto& field : standard->fieldNames()) {
            assert(ToString(original.records()[i].get(field)) == ToString(reloaded.records()[i].get(field)));
        }
    }

    // Tabular import with header cleanup and remapping.
    std::cout << "[Test] Tabular import..." << std::endl;
    const auto csvPath = testRoot / "schedule.csv";
    WriteFile(csvPath,
              "Source Name, Start Time, End Time, Lat\n"
              "casa, 2024-01-01T00:00:00, 2024-01-01T01:00:00, 40.8\n"
              "\n"
              "\"cyg, a\", 2024-01-01T01:00:00, 2024-01-01T02:00:00, nan\n");
    const auto mapPath = testRoot / "header_map.json";
    WriteFile(mapPath, R"({"Start_Time": "src_start_utc", "End_Time": "src_end_utc"})");

    TabularOptions options;
    options.replaceFrom = " ";
    options.replaceTo = "_";
    options.headerMap = {{"Source_Name", "src_id"}, {"Lat", "site_lat_deg"}};
    options.headerMapFile = mapPath.string();
    auto rows = TabularFile::Read(csvPath.string(), options);
    assert(rows && rows->size() == 2);
    assert(std::get<std::string>(rows->at(0).at("src_id")) == "casa");
    assert(std::get<std::string>(rows->at(0).at("site_lat_deg")) == "40.8");
    assert(std::get<std::string>(rows->at(1).at("src_id")) == "cyg, a");
    assert(IsAbsent(rows->at(1).at("site_lat_deg")));

    assert(engine.createInstance("tabular"));
    assert(engine.add(FileReference{csvPath.string(), options}, "tabular", false) == 2);
    const OdsRecord& first = engine.instance("tabular")->records()[0];
    assert(std::get<double>(first.get("site_lat_deg")) == 40.8);
    assert(TimeTools::FormatIso(*first.instant("src_end_utc")) == "2024-01-01T01:00:00");

    auto spaced = TabularFile::Parse("src_id  src_start_utc\n3c84   2024-05-01T00:00:00\n", TabularOptions{});
    assert(spaced && spaced->size() == 1);
    assert(std::get<std::string>(spaced->at(0).at("src_start_utc")) == "2024-05-01T00:00:00");
    assert(TabularFile::DetectSeparator("a\tb") == "\t");
    assert(!TabularFile::Parse("", TabularOptions{}));

    // Export refuses unknown columns and writes nothing.
    std::cout << "[Test] Tabular export..." << std::endl;
    const std::string badExport = (testRoot / "bad.csv").string();
    assert(!engine.exportTabular(badExport, {"src_id", "bogus"}));
    assert(!std::filesystem::exists(badExport));

    const std::string goodExport = (testRoot / "good.csv").string();
    assert(engine.exportTabular(goodExport, {"src_id", "notes", "src_start_utc"}));
    auto exported = TabularFile::Read(goodExport, TabularOptions{});
    assert(exported && exported->size() == 2);
    assert(std::get<std::string>(exported->at(1).at("notes")) == "calibrator, \"bright\"");
    assert(std::get<std::string>(exported->at(1).at("src_start_utc")) == "2024-01-01T01:00:00");
    assert(IsAbsent(exported->at(0).at("notes")));

    assert(!repository->exists("https://example.org/ods.json"));
    assert(repository->exists(goodExport));
    assert(!engine.readOds(FileReference{(testRoot / "missing.json").string(), {}}));

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] OdsFileRepository Test." << std::endl;
    return 0;
}
