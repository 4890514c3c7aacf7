#include <gtest/gtest.h>
#include "../src/crypto/crypto_random.hpp"
#include "../src/crypto/random.hpp"
#include "../src/utils/logger.hpp"
#include "mock_entropy_source.hpp"
#include <algorithm>
#include <limits>
#include <numeric>
#include <random>
#include <set>

using namespace cryptorand;
using namespace cryptorand::crypto;
using cryptorand::test_support::CountingEntropySource;
using cryptorand::test_support::counter_words;
using cryptorand::utils::Logger;

class CryptoRandomTestFixture : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        Logger::init("error", false);
    }

    // Single slot so every cached request lands in the same cache
    static RandomOptions single_slot() {
        RandomOptions options;
        options.slot_count = 1;
        return options;
    }

    std::shared_ptr<CountingEntropySource> source_ = std::make_shared<CountingEntropySource>();
};

TEST_F(CryptoRandomTestFixture, RangeResultsStayInBounds) {
    CryptoRandom rng;
    const std::pair<int32_t, int32_t> ranges[] = {
        {0, 1},
        {0, 2},
        {-5, 5},
        {100, 1000},
        {-1000, -999},
        {std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max()},
        {std::numeric_limits<int32_t>::min(), 0},
        {0, std::numeric_limits<int32_t>::max()},
    };

    for (const auto& [lo, hi] : ranges) {
        for (int i = 0; i < 10000; ++i) {
            int32_t v = rng.next_int(lo, hi);
            ASSERT_GE(v, lo);
            ASSERT_LT(v, hi);
        }
    }
}

TEST_F(CryptoRandomTestFixture, InvertedRangeThrowsWithoutEntropy) {
    CryptoRandom rng(source_, single_slot());

    try {
        rng.next_int(10, 5);
        FAIL() << "expected ArgumentException";
    } catch (const ArgumentException& e) {
        EXPECT_EQ(e.code(), ErrorCode::OutOfRange);
    }
    EXPECT_THROW(rng.next_int(-1), ArgumentException);
    EXPECT_THROW(rng.next_int64(3, 2), ArgumentException);
    EXPECT_THROW(rng.next_int64(-1), ArgumentException);

    EXPECT_EQ(source_->calls(), 0u);
    EXPECT_FALSE(rng.cache_position(0).has_value());
}

TEST_F(CryptoRandomTestFixture, DegenerateRangesDrawNothing) {
    CryptoRandom rng(source_, single_slot());

    EXPECT_EQ(rng.next_int(5, 5), 5);
    EXPECT_EQ(rng.next_int(0), 0);
    EXPECT_EQ(rng.next_int(7, 8), 7);
    EXPECT_EQ(rng.next_int(1), 0);
    EXPECT_EQ(rng.next_int64(0), 0);
    EXPECT_EQ(rng.next_int64(-9, -9), -9);

    EXPECT_EQ(source_->calls(), 0u);
}

TEST_F(CryptoRandomTestFixture, NonNegativeIntBelowIntMax) {
    CryptoRandom rng;
    for (int i = 0; i < 1000000; ++i) {
        int32_t v = rng.next_non_negative_int();
        ASSERT_GE(v, 0);
        ASSERT_LT(v, std::numeric_limits<int32_t>::max());
    }
    for (int i = 0; i < 100000; ++i) {
        int64_t v = rng.next_int64();
        ASSERT_GE(v, 0);
        ASSERT_LT(v, std::numeric_limits<int64_t>::max());
    }
}

TEST_F(CryptoRandomTestFixture, FloatsInUnitInterval) {
    CryptoRandom rng;
    double double_sum = 0.0;
    for (int i = 0; i < 1000000; ++i) {
        double d = rng.next_double();
        ASSERT_GE(d, 0.0);
        ASSERT_LT(d, 1.0);
        double_sum += d;

        float f = rng.next_single();
        ASSERT_GE(f, 0.0f);
        ASSERT_LT(f, 1.0f);
    }
    // Mean of 10^6 uniforms has standard deviation ~0.00029
    EXPECT_NEAR(double_sum / 1000000.0, 0.5, 0.005);

    double s = rng.sample();
    EXPECT_GE(s, 0.0);
    EXPECT_LT(s, 1.0);
}

TEST_F(CryptoRandomTestFixture, SmallRangesPassChiSquared) {
    CryptoRandom rng;
    constexpr int draws = 100000;

    // Critical values for k - 1 degrees of freedom at significance 1e-4
    const std::pair<int32_t, double> cases[] = {
        {3, 18.42},
        {7, 27.86},
        {16, 44.26},
        {17, 45.92},
    };

    for (const auto& [k, critical] : cases) {
        std::vector<int> counts(static_cast<size_t>(k), 0);
        for (int i = 0; i < draws; ++i) {
            counts[static_cast<size_t>(rng.next_int(0, k))]++;
        }

        double expected = static_cast<double>(draws) / k;
        double chi_squared = 0.0;
        for (int c : counts) {
            double diff = c - expected;
            chi_squared += diff * diff / expected;
        }
        EXPECT_LT(chi_squared, critical) << "k=" << k;
    }
}

TEST_F(CryptoRandomTestFixture, ConsecutiveFillsNeverOverlap) {
    CryptoRandom rng(source_, single_slot());

    // 16 bytes a call across several refills of the 4096 byte cache
    std::vector<uint64_t> served;
    for (int i = 0; i < 1000; ++i) {
        bytes out(16);
        rng.next_bytes(out);
        for (uint64_t word : counter_words(out)) {
            served.push_back(word);
        }
    }

    EXPECT_TRUE(std::is_sorted(served.begin(), served.end()));
    EXPECT_EQ(std::adjacent_find(served.begin(), served.end()), served.end());
    EXPECT_EQ(source_->calls(), 4u);  // 16000 bytes over 4096 byte refills
}

TEST_F(CryptoRandomTestFixture, LargeRequestBypassesCache) {
    CryptoRandom rng(source_, single_slot());

    bytes small(16);
    rng.next_bytes(small);
    EXPECT_EQ(counter_words(small), (std::vector<uint64_t>{1, 2}));
    EXPECT_EQ(source_->calls(), 1u);
    ASSERT_EQ(rng.cache_position(0), std::optional<size_t>(16));

    bytes large(constants::REQUEST_CACHE_LIMIT + 1024);
    rng.next_bytes(large);
    EXPECT_EQ(source_->calls(), 2u);
    EXPECT_EQ(rng.cache_position(0), std::optional<size_t>(16));
    EXPECT_EQ(counter_words(large).front(), 513u);  // after the 512 words of the first refill

    // The cache resumes where it left off
    rng.next_bytes(small);
    EXPECT_EQ(source_->calls(), 2u);
    EXPECT_EQ(counter_words(small), (std::vector<uint64_t>{3, 4}));
}

TEST_F(CryptoRandomTestFixture, RequestAtLimitUsesCache) {
    CryptoRandom rng(source_, single_slot());

    bytes out(constants::REQUEST_CACHE_LIMIT);
    rng.next_bytes(out);
    rng.next_bytes(out);
    EXPECT_EQ(source_->calls(), 1u);
    EXPECT_EQ(rng.cache_position(0), std::optional<size_t>(2 * constants::REQUEST_CACHE_LIMIT));
}

TEST_F(CryptoRandomTestFixture, FixedSizeBuffers) {
    CryptoRandom rng(source_, single_slot());

    fixed_bytes<8> key;
    rng.next_bytes(key);
    EXPECT_EQ(distribution::load_le64(key.data()), 1u);

    bytes empty;
    rng.next_bytes(empty);
    EXPECT_EQ(source_->calls(), 1u);
}

TEST_F(CryptoRandomTestFixture, NullBufferRejected) {
    CryptoRandom rng(source_, single_slot());

    try {
        rng.next_bytes(nullptr, 4);
        FAIL() << "expected ArgumentException";
    } catch (const ArgumentException& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
    EXPECT_NO_THROW(rng.next_bytes(nullptr, 0));
    EXPECT_EQ(source_->calls(), 0u);
}

TEST_F(CryptoRandomTestFixture, UncachedModeGoesToSource) {
    RandomOptions options = single_slot();
    options.use_cache = false;
    CryptoRandom rng(source_, options);

    bytes out(16);
    rng.next_bytes(out);
    rng.next_bytes(out);
    EXPECT_EQ(source_->calls(), 2u);
    EXPECT_EQ(counter_words(out), (std::vector<uint64_t>{3, 4}));
    EXPECT_FALSE(rng.cache_position(0).has_value());

    for (int i = 0; i < 1000; ++i) {
        int32_t v = rng.next_int(-3, 3);
        ASSERT_GE(v, -3);
        ASSERT_LT(v, 3);
    }
}

TEST_F(CryptoRandomTestFixture, EntropyFailurePropagates) {
    CryptoRandom rng(source_, single_slot());
    source_->set_failing(true);

    try {
        rng.next_int(0, 10);
        FAIL() << "expected CryptoException";
    } catch (const CryptoException& e) {
        EXPECT_EQ(e.code(), ErrorCode::EntropySourceFailed);
    }

    bytes large(constants::REQUEST_CACHE_LIMIT * 2);
    EXPECT_THROW(rng.next_bytes(large), CryptoException);
    EXPECT_THROW(rng.next_double(), CryptoException);

    source_->set_failing(false);
    EXPECT_GE(rng.next_double(), 0.0);
}

TEST_F(CryptoRandomTestFixture, RejectsInvalidConstruction) {
    EXPECT_THROW(CryptoRandom(nullptr), ArgumentException);

    RandomOptions options;
    options.request_cache_limit = options.cache_size;
    try {
        CryptoRandom rng(source_, options);
        FAIL() << "expected ConfigException";
    } catch (const ConfigException& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConfigInvalidValue);
    }

    options = RandomOptions();
    options.cache_size = 0;
    options.request_cache_limit = 0;
    EXPECT_THROW(CryptoRandom(source_, options), ConfigException);
}

TEST_F(CryptoRandomTestFixture, SlotCountDefaultsToProcessors) {
    CryptoRandom rng(source_);
    EXPECT_GE(rng.slot_count(), 1u);
    EXPECT_THROW(rng.cache_position(rng.slot_count()), ArgumentException);

    RandomOptions options;
    options.slot_count = 3;
    CryptoRandom sharded(source_, options);
    EXPECT_EQ(sharded.slot_count(), 3u);
}

TEST_F(CryptoRandomTestFixture, WorksWithStandardLibrary) {
    CryptoRandom rng;

    std::vector<int> values(100);
    std::iota(values.begin(), values.end(), 0);
    std::vector<int> shuffled = values;
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    std::sort(shuffled.begin(), shuffled.end());
    EXPECT_EQ(shuffled, values);

    std::uniform_int_distribution<int> dist(1, 6);
    for (int i = 0; i < 1000; ++i) {
        int roll = dist(rng);
        ASSERT_GE(roll, 1);
        ASSERT_LE(roll, 6);
    }
}

TEST_F(CryptoRandomTestFixture, SharedInstance) {
    EXPECT_EQ(&Random::instance(), &Random::instance());

    auto data = Random::generate(32);
    EXPECT_EQ(data.size(), 32u);

    // 40 random bytes all zero has probability 2^-320
    bytes buffer(40, 0);
    Random::generate_into(buffer.data(), buffer.size());
    EXPECT_NE(buffer, bytes(40, 0));

    EXPECT_EQ(Random::uniform(0), 0u);
    EXPECT_EQ(Random::uniform(1), 0u);
    std::set<uint32_t> seen;
    for (int i = 0; i < 1000; ++i) {
        uint32_t v = Random::uniform(10);
        ASSERT_LT(v, 10u);
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 10u);

    uint32_t big = Random::uniform(std::numeric_limits<uint32_t>::max());
    EXPECT_LT(big, std::numeric_limits<uint32_t>::max());

    EXPECT_NE(Random::generate_uint64(), Random::generate_uint64());
    (void)Random::generate_uint32();
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
