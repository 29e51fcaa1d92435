#include "usagedb/query/field_path.h"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace usagedb {
namespace query {

namespace {

double AsDouble(const rapidjson::Value& v) {
    if (v.IsInt64()) {
        return static_cast<double>(v.GetInt64());
    }
    if (v.IsUint64()) {
        return static_cast<double>(v.GetUint64());
    }
    return v.GetDouble();
}

std::string NumberString(const rapidjson::Value& v) {
    if (v.IsInt64()) {
        return std::to_string(v.GetInt64());
    }
    if (v.IsUint64()) {
        return std::to_string(v.GetUint64());
    }
    double d = v.GetDouble();
    if (std::isnan(d)) {
        return "NaN";
    }
    if (std::isinf(d)) {
        return d > 0 ? "Infinity" : "-Infinity";
    }
    if (d == std::floor(d) && std::fabs(d) < 1e15) {
        return std::to_string(static_cast<int64_t>(d));
    }
    // Shortest representation that round-trips
    char buf[32];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
        if (std::strtod(buf, nullptr) == d) {
            break;
        }
    }
    return buf;
}

} // namespace

std::vector<std::string> SplitFieldPath(const std::string& path) {
    std::vector<std::string> segments;
    std::string segment;
    std::istringstream stream(path);
    while (std::getline(stream, segment, '.')) {
        segments.push_back(segment);
    }
    if (!path.empty() && path.back() == '.') {
        segments.emplace_back();
    }
    return segments;
}

const rapidjson::Value* ResolveField(const rapidjson::Value& root, const std::string& path) {
    const rapidjson::Value* current = &root;
    for (const auto& segment : SplitFieldPath(path)) {
        if (!current->IsObject()) {
            return nullptr;
        }
        auto it = current->FindMember(segment.c_str());
        if (it == current->MemberEnd()) {
            return nullptr;
        }
        current = &it->value;
    }
    return current;
}

void SetField(rapidjson::Value& root, const std::string& path, const rapidjson::Value* value,
              rapidjson::Document::AllocatorType& allocator) {
    if (!root.IsObject()) {
        root.SetObject();
    }
    auto segments = SplitFieldPath(path);
    if (segments.empty()) {
        return;
    }

    rapidjson::Value* current = &root;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        auto it = current->FindMember(segments[i].c_str());
        if (it == current->MemberEnd()) {
            current->AddMember(rapidjson::Value(segments[i].c_str(), allocator).Move(),
                               rapidjson::Value(rapidjson::kObjectType).Move(), allocator);
            current = &(*current)[segments[i].c_str()];
        } else {
            if (!it->value.IsObject()) {
                it->value.SetObject();
            }
            current = &it->value;
        }
    }

    const auto& leaf = segments.back();
    current->RemoveMember(leaf.c_str());
    if (value) {
        rapidjson::Value copy(*value, allocator);
        current->AddMember(rapidjson::Value(leaf.c_str(), allocator).Move(), copy, allocator);
    }
}

bool StrictEquals(const rapidjson::Value* a, const rapidjson::Value* b) {
    if (!a || !b) {
        return a == b;
    }
    if (a->IsNumber() && b->IsNumber()) {
        if (a->IsInt64() && b->IsInt64()) {
            return a->GetInt64() == b->GetInt64();
        }
        return AsDouble(*a) == AsDouble(*b);
    }
    if (a->IsString() && b->IsString()) {
        return a->GetStringLength() == b->GetStringLength() &&
               std::string(a->GetString(), a->GetStringLength()) == std::string(b->GetString(), b->GetStringLength());
    }
    if (a->IsBool() && b->IsBool()) {
        return a->GetBool() == b->GetBool();
    }
    if (a->IsNull() && b->IsNull()) {
        return true;
    }
    return false;
}

std::string DisplayString(const rapidjson::Value* value) {
    if (!value) {
        return "undefined";
    }
    switch (value->GetType()) {
        case rapidjson::kNullType:
            return "null";
        case rapidjson::kFalseType:
            return "false";
        case rapidjson::kTrueType:
            return "true";
        case rapidjson::kStringType:
            return std::string(value->GetString(), value->GetStringLength());
        case rapidjson::kNumberType:
            return NumberString(*value);
        case rapidjson::kArrayType: {
            std::string joined;
            bool first = true;
            for (const auto& element : value->GetArray()) {
                if (!first) {
                    joined += ",";
                }
                first = false;
                // null entries render as empty strings inside a joined array
                if (!element.IsNull()) {
                    joined += DisplayString(&element);
                }
            }
            return joined;
        }
        case rapidjson::kObjectType:
            return "[object Object]";
    }
    return "undefined";
}

int CompareValues(const rapidjson::Value* a, const rapidjson::Value* b) {
    if (a && b && a->IsNumber() && b->IsNumber()) {
        double da = AsDouble(*a);
        double db = AsDouble(*b);
        return da < db ? -1 : (da > db ? 1 : 0);
    }
    if (a && b && a->IsString() && b->IsString()) {
        int c = std::string(a->GetString(), a->GetStringLength())
                    .compare(std::string(b->GetString(), b->GetStringLength()));
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (StrictEquals(a, b)) {
        return 0;
    }
    int c = DisplayString(a).compare(DisplayString(b));
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace query
} // namespace usagedb
