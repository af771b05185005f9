#pragma once

#include <kingraph/core/result.hpp>
#include <kingraph/ingest/raw_record.hpp>

#include <vector>

namespace kingraph {

// ---------------------------------------------------------------------------
// IRecordStore: source of candidate records for a graph build.
//
// The store is asked for the full record set on every rebuild and must
// tolerate repeated calls. Storage, caching and retries are its own business.
// ---------------------------------------------------------------------------
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    // Non-copyable, non-movable (polymorphic base).
    IRecordStore(const IRecordStore&) = delete;
    IRecordStore& operator=(const IRecordStore&) = delete;
    IRecordStore(IRecordStore&&) = delete;
    IRecordStore& operator=(IRecordStore&&) = delete;

    [[nodiscard]] virtual Result<std::vector<RawRecord>, Error> ListRecords() const = 0;

protected:
    IRecordStore() = default;
};

} // namespace kingraph
