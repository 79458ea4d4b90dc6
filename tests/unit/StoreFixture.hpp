#pragma once

#include <gtest/gtest.h>

#include "config/ConfigRegistry.hpp"
#include "db/MemoryStore.hpp"
#include "db/Transactions.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tfs::test {

// Fresh in-memory store wired into db::Transactions for every test.
class StoreFixture : public ::testing::Test {
protected:
    std::shared_ptr<db::MemoryStore> store;

    void SetUp() override {
        store = std::make_shared<db::MemoryStore>();
        db::Transactions::init(store, config::ConfigRegistry::get().retry);
    }

    static std::vector<uint8_t> bytes(const std::string& s) { return {s.begin(), s.end()}; }

    static std::vector<uint8_t> pattern(const std::size_t size, const uint32_t seed = 7) {
        std::vector<uint8_t> out(size);
        uint32_t x = seed;
        for (auto& b : out) {
            x = x * 1103515245u + 12345u;
            b = static_cast<uint8_t>(x >> 16);
        }
        return out;
    }
};

}
