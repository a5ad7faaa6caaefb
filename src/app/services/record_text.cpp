#include <simcache/app/services/record_text.h>

#include <algorithm>
#include <cctype>

namespace simcache::app::services {

namespace {

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty())
        return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string trimmed(const std::string& s) {
    auto b = std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
    auto e = std::find_if(s.rbegin(), s.rend(), [](unsigned char c) {
                 return !std::isspace(c);
             }).base();
    return b < e ? std::string(b, e) : std::string{};
}

// Largest prefix length <= limit that does not split a UTF-8 sequence
size_t utf8Boundary(const std::string& s, size_t limit) {
    if (limit >= s.size())
        return s.size();
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut;
}

} // namespace

std::string stripHtml(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '<') {
            size_t close = s.find('>', i);
            if (close == std::string::npos) {
                // Unterminated tag is kept verbatim
                out.append(s, i, std::string::npos);
                break;
            }
            out.push_back(' ');
            i = close + 1;
            continue;
        }
        out.push_back(s[i]);
        ++i;
    }

    std::string collapsed;
    collapsed.reserve(out.size());
    for (char c : out) {
        if (c == ' ' && !collapsed.empty() && collapsed.back() == ' ')
            continue;
        collapsed.push_back(c);
    }
    return trimmed(collapsed);
}

std::string fieldText(const metadata::RecordData& record, const metadata::FieldInfo& field) {
    auto value = record.getString(field.name);
    if (field.type == metadata::FieldType::Editor)
        value = stripHtml(value);
    return value;
}

std::string generateRecordText(const metadata::RecordData& record,
                               const metadata::DatasetInfo& dataset, const std::string& tmpl,
                               size_t truncateChars) {
    using metadata::FieldType;

    if (!tmpl.empty()) {
        std::string result = tmpl;
        for (const auto& field : dataset.fields) {
            replaceAll(result, "{" + field.name + "}", fieldText(record, field));
        }
        return trimmed(result);
    }

    std::string out;
    for (const auto& field : dataset.fields) {
        if (field.type != FieldType::Text && field.type != FieldType::Editor &&
            field.type != FieldType::Email && field.type != FieldType::Url) {
            continue;
        }
        auto value = fieldText(record, field);
        if (value.empty())
            continue;
        if (value.size() > truncateChars) {
            value = value.substr(0, utf8Boundary(value, truncateChars)) + "...";
        }
        if (!out.empty())
            out.push_back('\n');
        out += field.name;
        out += ": ";
        out += value;
    }
    return out;
}

} // namespace simcache::app::services
