#include "geoinsight/storage/dataset_loader.h"

#include <fstream>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "geoinsight/common/logger.h"

namespace geoinsight {
namespace storage {

namespace {

using rapidjson::Value;

core::Error Malformed(const std::string& where, const std::string& what) {
    return core::InvalidArgumentError("Dataset " + where + ": " + what);
}

bool ReadString(const Value& obj, const char* key, std::string& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) return false;
    out.assign(it->value.GetString(), it->value.GetStringLength());
    return true;
}

// Absent key and null both mean "no value"; anything else must be a number.
bool ReadOptional(const Value& obj, const char* key, core::OptionalValue& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        out.reset();
        return true;
    }
    if (!it->value.IsNumber()) return false;
    out = it->value.GetDouble();
    return true;
}

const Value* Array(const Value& root, const char* key) {
    auto it = root.FindMember(key);
    if (it == root.MemberEnd() || !it->value.IsArray()) return nullptr;
    return &it->value;
}

core::Result<void> ReadFactKey(const Value& item, const std::string& where,
                               std::string& spatial_key, core::Date& date,
                               std::string& granularity, std::string& source) {
    std::string date_text;
    if (!ReadString(item, "spatial_key", spatial_key) || spatial_key.empty()) {
        return core::Result<void>(Malformed(where, "missing spatial_key"));
    }
    if (!ReadString(item, "date", date_text)) {
        return core::Result<void>(Malformed(where, "missing date"));
    }
    auto parsed = core::Date::Parse(date_text);
    if (!parsed.ok()) return core::Result<void>(Malformed(where, parsed.error()));
    date = parsed.value();
    ReadString(item, "granularity", granularity);
    if (!ReadString(item, "source", source) || source.empty()) {
        return core::Result<void>(Malformed(where, "missing source"));
    }
    return core::Result<void>();
}

core::Result<void> ReadDirectory(const Value& root, spatial::SpatialDirectory& directory) {
    auto it = root.FindMember("directory");
    if (it == root.MemberEnd()) return core::Result<void>();
    if (!it->value.IsObject()) {
        return core::Result<void>(Malformed("directory", "must be an object"));
    }
    const Value& section = it->value;

    if (const Value* units = Array(section, "coarsest")) {
        for (rapidjson::SizeType i = 0; i < units->Size(); ++i) {
            const Value& item = (*units)[i];
            spatial::CoarsestUnit unit;
            if (!item.IsObject() || !ReadString(item, "code", unit.code) ||
                !ReadString(item, "name", unit.name)) {
                return core::Result<void>(Malformed("coarsest[" + std::to_string(i) + "]",
                                                    "code and name are required"));
            }
            auto added = directory.add_coarsest(unit);
            if (!added.ok()) return added;
        }
    }
    if (const Value* units = Array(section, "intermediate")) {
        for (rapidjson::SizeType i = 0; i < units->Size(); ++i) {
            const Value& item = (*units)[i];
            spatial::IntermediateUnit unit;
            if (!item.IsObject() || !ReadString(item, "code", unit.code) ||
                !ReadString(item, "name", unit.name)) {
                return core::Result<void>(Malformed("intermediate[" + std::to_string(i) + "]",
                                                    "code and name are required"));
            }
            ReadString(item, "parent_code", unit.parent_code);
            auto added = directory.add_intermediate(unit);
            if (!added.ok()) return added;
        }
    }
    if (const Value* units = Array(section, "finest")) {
        for (rapidjson::SizeType i = 0; i < units->Size(); ++i) {
            const Value& item = (*units)[i];
            spatial::FinestUnit unit;
            if (!item.IsObject() || !ReadString(item, "raw_key", unit.raw_key) ||
                !ReadString(item, "label", unit.label)) {
                return core::Result<void>(Malformed("finest[" + std::to_string(i) + "]",
                                                    "raw_key and label are required"));
            }
            ReadString(item, "code", unit.code);
            auto added = directory.add_finest(unit);
            if (!added.ok()) return added;
        }
    }
    return core::Result<void>();
}

} // namespace

core::Result<Dataset> ParseDataset(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        std::ostringstream oss;
        oss << "Dataset parse error at offset " << doc.GetErrorOffset() << ": "
            << rapidjson::GetParseError_En(doc.GetParseError());
        return core::Result<Dataset>::error(oss.str(), core::Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return core::Result<Dataset>::error("Dataset root must be a JSON object",
                                            core::Error::Code::INVALID_ARGUMENT);
    }

    Dataset dataset;
    dataset.directory = std::make_shared<spatial::SpatialDirectory>();
    auto directory = ReadDirectory(doc, *dataset.directory);
    if (!directory.ok()) return core::Result<Dataset>(directory.error_detail());

    if (const Value* facts = Array(doc, "activity")) {
        dataset.activity.reserve(facts->Size());
        for (rapidjson::SizeType i = 0; i < facts->Size(); ++i) {
            const Value& item = (*facts)[i];
            const std::string where = "activity[" + std::to_string(i) + "]";
            if (!item.IsObject()) {
                return core::Result<Dataset>(Malformed(where, "must be an object"));
            }
            ActivityFact fact;
            auto key = ReadFactKey(item, where, fact.spatial_key, fact.date, fact.granularity,
                                   fact.source);
            if (!key.ok()) return core::Result<Dataset>(key.error_detail());
            if (!ReadOptional(item, "foot_traffic", fact.foot_traffic) ||
                !ReadOptional(item, "sales", fact.sales) ||
                !ReadOptional(item, "sales_count", fact.sales_count)) {
                return core::Result<Dataset>(Malformed(where, "metric values must be numbers or null"));
            }
            dataset.activity.push_back(std::move(fact));
        }
    }

    if (const Value* facts = Array(doc, "demographics")) {
        dataset.demographics.reserve(facts->Size());
        for (rapidjson::SizeType i = 0; i < facts->Size(); ++i) {
            const Value& item = (*facts)[i];
            const std::string where = "demographics[" + std::to_string(i) + "]";
            if (!item.IsObject()) {
                return core::Result<Dataset>(Malformed(where, "must be an object"));
            }
            DemographicFact fact;
            auto key = ReadFactKey(item, where, fact.spatial_key, fact.date, fact.granularity,
                                   fact.source);
            if (!key.ok()) return core::Result<Dataset>(key.error_detail());
            if (!ReadString(item, "sex", fact.sex) || !ReadString(item, "age_group", fact.age_group)) {
                return core::Result<Dataset>(Malformed(where, "sex and age_group are required"));
            }
            if (!ReadOptional(item, "value", fact.value)) {
                return core::Result<Dataset>(Malformed(where, "value must be a number or null"));
            }
            dataset.demographics.push_back(std::move(fact));
        }
    }

    GEOINSIGHT_INFO("Dataset parsed: {} activity facts, {} demographic facts",
                    dataset.activity.size(), dataset.demographics.size());
    return dataset;
}

core::Result<Dataset> LoadDataset(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return core::Result<Dataset>::error("Cannot open dataset file: " + path,
                                            core::Error::Code::NOT_FOUND);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return ParseDataset(buffer.str());
}

} // namespace storage
} // namespace geoinsight
