#include <cassert>
#include <iostream>

#include "domain/OdsInstance.hpp"
#include "domain/RecordNormalizer.hpp"
#include "infrastructure/OdsJsonCodec.hpp"
#include "infrastructure/TabularFile.hpp"
#include "test/TestSupport.hpp"

using namespace odsmanager::domain;
using odsmanager::infrastructure::OdsJsonCodec;
using odsmanager::infrastructure::TabularFile;
using odsmanager::test::FullRecord;
using odsmanager::test::LatestStandard;

namespace {

OdsInstance Reload(const std::vector<FieldMap>& rows, std::shared_ptr<const Standard> standard) {
    OdsInstance reloaded("reloaded", standard);
    for (const auto& row : rows) {
        reloaded.append(RecordNormalizer::Normalize(row, FieldMap{}, *standard));
    }
    reloaded.recomputeMetadata();
    return reloaded;
}

void AssertSameFields(const OdsInstance& a, const OdsInstance& b, const std::vector<std::string>& fields) {
    assert(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        for (const auto& field : fields) {
            assert(ToString(a.records()[i].get(field)) == ToString(b.records()[i].get(field)));
        }
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting OdsJsonCodec Test..." << std::endl;
    auto standard = LatestStandard();

    OdsInstance original("original", standard);
    FieldMap noted = FullRecord("casa", "2024-01-01T01:00:00", "2024-01-01T02:00:00");
    noted["notes"] = std::string("calibrator, \"bright\"");
    noted["src_is_pulsar_bool"] = true;
    original.append(RecordNormalizer::Normalize(FullRecord("cyga", "2024-01-01T00:00:00", "2024-01-01T01:00:00"), FieldMap{}, *standard));
    original.append(RecordNormalizer::Normalize(noted, FieldMap{}, *standard));
    original.recomputeMetadata();

    // Persisted form: serialize, parse back, normalize.
    std::cout << "[Test] JSON round trip..." << std::endl;
    nlohmann::json doc = OdsJsonCodec::InstanceToJson(original);
    assert(doc.contains("ods_data"));
    assert(doc["ods_data"].size() == 2);
    assert(doc["ods_data"][0]["src_start_utc"] == "2024-01-01T00:00:00");
    assert(doc["ods_data"][0]["notes"].is_null());
    assert(doc["ods_data"][1]["src_is_pulsar_bool"] == true);

    auto rows = OdsJsonCodec::RecordsFromJson(nlohmann::json::parse(doc.dump(4)), standard->dataKey());
    assert(rows && rows->size() == 2);
    OdsInstance fromJson = Reload(*rows, standard);
    assert(fromJson.invalidReasons().empty());
    AssertSameFields(original, fromJson, standard->fieldNames());

    // Codec details.
    std::cout << "[Test] JSON values..." << std::endl;
    auto bare = OdsJsonCodec::RecordsFromJson(nlohmann::json::parse(R"([{"src_id": "a", "src_radius": 2}, 5, {"slew_sec": null}])"), "ods_data");
    assert(bare && bare->size() == 2);
    assert(std::get<std::int64_t>(bare->at(0).at("src_radius")) == 2);
    assert(IsAbsent(bare->at(1).at("slew_sec")));
    assert(!OdsJsonCodec::RecordsFromJson(nlohmann::json::parse(R"({"entries": []})"), "ods_data"));
    assert(OdsJsonCodec::ToJson(FieldValue{}).is_null());
    assert(std::get<double>(OdsJsonCodec::FromJson(nlohmann::json(1.5))) == 1.5);

    // Tabular form: format, parse back, normalize.
    std::cout << "[Test] Tabular round trip..." << std::endl;
    const std::vector<std::string> columns = {"src_id", "notes", "src_start_utc", "src_end_utc", "site_lat_deg"};
    const std::string text = TabularFile::Format(original, columns, ",");
    auto parsed = TabularFile::Parse(text, TabularOptions{});
    assert(parsed && parsed->size() == 2);
    assert(std::get<std::string>(parsed->at(1).at("notes")) == "calibrator, \"bright\"");
    assert(IsAbsent(parsed->at(0).at("notes")));
    AssertSameFields(original, Reload(*parsed, standard), columns);

    auto tabbed = TabularFile::Parse(TabularFile::Format(original, columns, "\t"), TabularOptions{});
    assert(tabbed && tabbed->size() == 2);
    assert(std::get<std::string>(tabbed->at(1).at("src_id")) == "casa");

    std::cout << "[PASS] OdsJsonCodec Test." << std::endl;
    return 0;
}
