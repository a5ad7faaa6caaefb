#pragma once

#include <simcache/metadata/dataset_catalog.h>

#include <algorithm>
#include <string>
#include <vector>

namespace simcache::app::services {

/// Replace every `<...>` tag with a space, collapse repeated spaces and trim
std::string stripHtml(const std::string& s);

/// Text representation of a whole record for record-mode embedding.
/// With a template, `{fieldName}` placeholders are substituted for every field. Without one,
/// non-empty text/editor/email/url fields become `name: value` lines, each value truncated to
/// `truncateChars` characters followed by "...".
std::string generateRecordText(const metadata::RecordData& record,
                               const metadata::DatasetInfo& dataset, const std::string& tmpl = "",
                               size_t truncateChars = 2000);

/// Text for one field; editor markup is stripped
std::string fieldText(const metadata::RecordData& record, const metadata::FieldInfo& field);

/// Contiguous batches of at most maxPerBatch items
template <typename T>
std::vector<std::vector<T>> batchItems(const std::vector<T>& items, size_t maxPerBatch) {
    std::vector<std::vector<T>> batches;
    if (items.empty())
        return batches;
    const size_t batchSize = std::max<size_t>(1, std::min(maxPerBatch, items.size()));
    for (size_t i = 0; i < items.size(); i += batchSize) {
        const size_t end = std::min(items.size(), i + batchSize);
        batches.emplace_back(items.begin() + static_cast<std::ptrdiff_t>(i),
                             items.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return batches;
}

} // namespace simcache::app::services
