#pragma once

#include <kingraph/ingest/raw_record.hpp>

namespace kingraph {

// ---------------------------------------------------------------------------
// IRecordClassifier: decides which kind of note a record is. Only Person
// records become graph nodes.
// ---------------------------------------------------------------------------
class IRecordClassifier {
public:
    virtual ~IRecordClassifier() = default;

    IRecordClassifier(const IRecordClassifier&) = delete;
    IRecordClassifier& operator=(const IRecordClassifier&) = delete;
    IRecordClassifier(IRecordClassifier&&) = delete;
    IRecordClassifier& operator=(IRecordClassifier&&) = delete;

    [[nodiscard]] virtual RecordKind Classify(const RawRecord& record) const = 0;

protected:
    IRecordClassifier() = default;
};

} // namespace kingraph
