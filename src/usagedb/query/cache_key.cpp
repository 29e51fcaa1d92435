#include "usagedb/query/cache_key.h"

#include <algorithm>
#include <cstdint>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "usagedb/query/query_codec.h"

namespace usagedb {
namespace query {

namespace {

// Next code point of a UTF-8 string; malformed or truncated sequences yield
// U+FFFD and consume one byte.
uint32_t NextCodePoint(const std::string& text, size_t& pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t length = 1;
    uint32_t codepoint = lead;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        codepoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        codepoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        codepoint = lead & 0x07;
    } else if (lead >= 0x80) {
        ++pos;
        return 0xFFFD;
    }

    size_t used = 1;
    while (used < length && pos + used < text.size() &&
           (static_cast<unsigned char>(text[pos + used]) & 0xC0) == 0x80) {
        codepoint = (codepoint << 6) | (static_cast<unsigned char>(text[pos + used]) & 0x3F);
        ++used;
    }
    if (used < length) {
        ++pos;
        return 0xFFFD;
    }
    pos += used;
    return codepoint;
}

} // namespace

std::string QuerySignature(const std::vector<QueryFilter>& filters, const QueryOptions& options) {
    std::vector<const QueryFilter*> ordered;
    ordered.reserve(filters.size());
    for (const auto& filter : filters) {
        ordered.push_back(&filter);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const QueryFilter* a, const QueryFilter* b) { return a->field < b->field; });

    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    rapidjson::Value filter_array(rapidjson::kArrayType);
    for (const auto* filter : ordered) {
        rapidjson::Value entry;
        QueryCodec::filter_to_json(*filter, entry, allocator);
        filter_array.PushBack(entry, allocator);
    }
    doc.AddMember("filters", filter_array, allocator);

    rapidjson::Value options_json;
    QueryCodec::options_to_json(options, options_json, allocator);
    doc.AddMember("options", options_json, allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string HashSignature(const std::string& signature) {
    uint32_t hash = 0;
    auto mix = [&hash](uint32_t unit) { hash = (hash << 5) - hash + unit; };

    // Hash UTF-16 code units
    size_t pos = 0;
    while (pos < signature.size()) {
        uint32_t codepoint = NextCodePoint(signature, pos);
        if (codepoint >= 0x10000) {
            codepoint -= 0x10000;
            mix(0xD800 + (codepoint >> 10));
            mix(0xDC00 + (codepoint & 0x3FF));
        } else {
            mix(codepoint);
        }
    }

    int64_t value = static_cast<int32_t>(hash);
    const bool negative = value < 0;
    if (negative) {
        value = -value;
    }

    static const char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out;
    do {
        out.push_back(kDigits[value % 36]);
        value /= 36;
    } while (value > 0);
    if (negative) {
        out.push_back('-');
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string CacheKeyFor(const std::vector<QueryFilter>& filters, const QueryOptions& options) {
    return HashSignature(QuerySignature(filters, options));
}

} // namespace query
} // namespace usagedb
