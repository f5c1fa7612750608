#pragma once
#include "store/iaggregate_store.h"
#include <gmock/gmock.h>
#include <memory>
#include <optional>
#include <string>

class MockAggregateStore : public claimscan::store::IAggregateStore {
public:
    std::shared_ptr<claimscan::DbConnectionManager> GetConnectionManager() override {
        return std::make_shared<claimscan::SimpleDbConnectionManager>("dummy");
    }

    MOCK_METHOD(BuildSummary, BuildAggregates, (), (override));
    MOCK_METHOD(claimscan::AggregateTables, LoadTables, (), (override));
    MOCK_METHOD(void, SaveScanReport, (const claimscan::anomaly::ScanReport& report), (override));
    MOCK_METHOD(std::optional<claimscan::anomaly::ScanReport>, GetScanReport, (const std::string& run_id), (override));
    MOCK_METHOD(std::optional<claimscan::anomaly::ScanResult>, GetLatestScanResult, (const std::string& entity_id), (override));
};
