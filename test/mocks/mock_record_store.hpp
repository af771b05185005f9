#pragma once

#include <kingraph/ingest/i_record_store.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace kingraph::testing {

// ---------------------------------------------------------------------------
// MockRecordStore: hand-written mock implementing IRecordStore.
//
// Returns the configured records, or the configured error once SetError()
// has been called. Counts calls for verification.
// ---------------------------------------------------------------------------
class MockRecordStore : public IRecordStore {
public:
    MockRecordStore() = default;
    explicit MockRecordStore(std::vector<RawRecord> records)
        : response_(Result<std::vector<RawRecord>, Error>::Ok(std::move(records))) {}

    [[nodiscard]] Result<std::vector<RawRecord>, Error> ListRecords() const override {
        ++calls_;
        return response_;
    }

    void SetRecords(std::vector<RawRecord> records) {
        response_ = Result<std::vector<RawRecord>, Error>::Ok(std::move(records));
    }

    void SetError(Error error) {
        response_ = Result<std::vector<RawRecord>, Error>::Err(std::move(error));
    }

    [[nodiscard]] int CallCount() const noexcept { return calls_; }

private:
    Result<std::vector<RawRecord>, Error> response_ =
        Result<std::vector<RawRecord>, Error>::Ok(std::vector<RawRecord>{});
    mutable int calls_ = 0;
};

// A person note at "People/<name>.md" with `cr_id` and `name` set.
inline RawRecord PersonRecord(const std::string& id, const std::string& name,
                              nlohmann::json extra = nlohmann::json::object()) {
    RawRecord record;
    record.path = "People/" + name + ".md";
    record.fields = std::move(extra);
    record.fields["cr_id"] = id;
    record.fields["name"] = name;
    if (!record.fields.contains("cr_type")) {
        record.fields["cr_type"] = "person";
    }
    return record;
}

} // namespace kingraph::testing
