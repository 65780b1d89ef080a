#include <algorithm>
#include <cassert>
#include <iostream>
#include <limits>

#include "domain/RecordNormalizer.hpp"
#include "test/TestSupport.hpp"

using namespace odsmanager::domain;
using odsmanager::test::FullRecord;
using odsmanager::test::LatestStandard;

namespace {

bool HasReasonContaining(const ValidationResult& result, const std::string& text) {
    return std::any_of(result.reasons.begin(), result.reasons.end(),
                       [&text](const std::string& reason) { return reason.find(text) != std::string::npos; });
}

} // namespace

int main() {
    std::cout << "[Test] Starting RecordNormalizer Test..." << std::endl;
    auto standard = LatestStandard();

    // Every schema field is a key, whatever the input holds.
    std::cout << "[Test] Totality..." << std::endl;
    OdsRecord empty = RecordNormalizer::Normalize(FieldMap{}, FieldMap{}, *standard);
    assert(empty.fields.size() == standard->fieldNames().size());
    for (const auto& field : standard->fieldNames()) {
        assert(empty.fields.count(field) == 1);
        assert(IsAbsent(empty.get(field)));
    }
    assert(!standard->validate(empty).valid);

    // Input wins over defaults, defaults fill the rest.
    FieldMap defaults{{"site_id", std::string("hcro")}, {"src_id", std::string("default-src")}};
    OdsRecord merged = RecordNormalizer::Normalize(FieldMap{{"src_id", std::string("casa")}}, defaults, *standard);
    assert(std::get<std::string>(merged.get("src_id")) == "casa");
    assert(std::get<std::string>(merged.get("site_id")) == "hcro");

    // Unknown keys are dropped but remembered.
    std::cout << "[Test] Dropped keys..." << std::endl;
    OdsRecord dropped = RecordNormalizer::Normalize(FieldMap{{"bogus", 1.0}}, FieldMap{}, *standard);
    assert(dropped.fields.count("bogus") == 0);
    assert(dropped.droppedKeys.size() == 1 && dropped.droppedKeys[0] == "bogus");

    // Time fields become instants; uninterpretable text is a parse failure.
    std::cout << "[Test] Time coercion..." << std::endl;
    OdsRecord valid = RecordNormalizer::Normalize(FullRecord("casa", "2024-01-01T00:00:00", "2024-01-01T01:00:00"), FieldMap{}, *standard);
    assert(std::holds_alternative<Instant>(valid.get("src_start_utc")));
    assert(TimeTools::FormatIso(*valid.instant("src_end_utc")) == "2024-01-01T01:00:00");
    assert(standard->validate(valid).valid);

    OdsRecord badTime = RecordNormalizer::Normalize(FullRecord("casa", "not a time", "2024-01-01T01:00:00"), FieldMap{}, *standard);
    assert(IsAbsent(badTime.get("src_start_utc")));
    assert(badTime.parseFailures.at("src_start_utc") == "not a time");
    ValidationResult badResult = standard->validate(badTime);
    assert(!badResult.valid);
    assert(HasReasonContaining(badResult, "cannot interpret 'not a time'"));

    OdsRecord backwards = RecordNormalizer::Normalize(FullRecord("casa", "2024-01-01T02:00:00", "2024-01-01T01:00:00"), FieldMap{}, *standard);
    assert(HasReasonContaining(standard->validate(backwards), "is not after"));

    // Text from tabular or attribute sources is coerced to the declared type.
    std::cout << "[Test] Typed coercion..." << std::endl;
    AttributeBag bag;
    bag.attributes = {{"site_lat_deg", "40.5"}, {"src_is_pulsar_bool", "true"}, {"site_lon_deg", "west"}, {"src_id", "3c84"}};
    OdsRecord fromBag = RecordNormalizer::Normalize(bag, FieldMap{}, *standard);
    assert(std::get<double>(fromBag.get("site_lat_deg")) == 40.5);
    assert(std::get<bool>(fromBag.get("src_is_pulsar_bool")) == true);
    assert(std::get<std::string>(fromBag.get("site_lon_deg")) == "west");
    assert(std::get<std::string>(fromBag.get("src_id")) == "3c84");
    assert(HasReasonContaining(standard->validate(fromBag), "site_lon_deg should be float"));

    FieldCoercion widened = RecordNormalizer::NormalizeField("slew_sec", FieldValue{std::int64_t{5}}, *standard);
    assert(std::get<double>(widened.value) == 5.0);
    assert(!widened.failedText);

    // "nan" and "inf" are not numbers; they stay text and fail the float check.
    std::cout << "[Test] Non-finite numbers..." << std::endl;
    FieldMap nanInput = FullRecord("casa", "2024-01-01T00:00:00", "2024-01-01T01:00:00");
    nanInput["site_lat_deg"] = std::string("nan");
    nanInput["site_lon_deg"] = std::string("inf");
    OdsRecord nanRecord = RecordNormalizer::Normalize(nanInput, FieldMap{}, *standard);
    assert(std::get<std::string>(nanRecord.get("site_lat_deg")) == "nan");
    assert(std::get<std::string>(nanRecord.get("site_lon_deg")) == "inf");
    ValidationResult nanResult = standard->validate(nanRecord);
    assert(!nanResult.valid);
    assert(HasReasonContaining(nanResult, "site_lat_deg should be float, got text 'nan'"));
    assert(!ToNumber(FieldValue{std::string("nan")}));
    assert(!ToNumber(FieldValue{std::numeric_limits<double>::quiet_NaN()}));

    FieldCoercion nanDouble = RecordNormalizer::NormalizeField(
        "site_el_m", FieldValue{std::numeric_limits<double>::quiet_NaN()}, *standard);
    assert(std::holds_alternative<std::string>(nanDouble.value));

    // Re-normalizing a record keeps what the metadata scan needs.
    OdsRecord copy = RecordNormalizer::Normalize(badTime, FieldMap{}, *standard);
    assert(copy.parseFailures.count("src_start_utc") == 1);
    OdsRecord copyDropped = RecordNormalizer::Normalize(dropped, FieldMap{}, *standard);
    assert(copyDropped.droppedKeys.size() == 1);

    std::cout << "[PASS] RecordNormalizer Test." << std::endl;
    return 0;
}
