#include <gtest/gtest.h>
#include "token_generator.hpp"
#include "logger.hpp"
#include "metrics.hpp"
#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

using namespace obscure;

namespace {

// Returns the same seed every round so outputs are known digest vectors.
class FixedSeeder : public SeedSource {
public:
    explicit FixedSeeder(std::string seed) : seed_(std::move(seed)) {}

    std::string next_seed() override {
        ++calls;
        return seed_;
    }

    int calls = 0;

private:
    std::string seed_;
};

const std::string kSha1Abc = "a9993e364706816aba3e25717850c26c9cd0d89d";

GeneratorConfig sha1_config() {
    GeneratorConfig config;
    config.digest_preferences = {"SHA-1"};
    config.log_selection = false;
    return config;
}

}

class TokenGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_min_level(Logger::Level::CRITICAL);
        MetricsRegistry::instance().reset();
    }
    void TearDown() override {
        Logger::set_min_level(Logger::Level::INFO);
    }
};

TEST_F(TokenGeneratorTest, NaturalSizeOutputs) {
    TokenGenerator gen(sha1_config());
    EXPECT_EQ(gen.algorithm_name(), "SHA-1");
    EXPECT_EQ(gen.hex().size(), 40u);
    EXPECT_EQ(gen.binary().size(), 20u);
    EXPECT_EQ(gen.base64().size(), 27u);
    EXPECT_EQ(gen.create().size(), 40u);
}

TEST_F(TokenGeneratorTest, FixedSeedGivesDigestVector) {
    auto seeder = std::make_shared<FixedSeeder>("abc");
    TokenGenerator gen(sha1_config(), seeder);

    EXPECT_EQ(gen.hex(), kSha1Abc);
    EXPECT_EQ(gen.base64(), "qZk+NkcGgWq6PiVxeFDCbJzQ2J0");
    EXPECT_EQ(gen.binary().size(), 20u);
    EXPECT_EQ(seeder->calls, 3);
}

TEST_F(TokenGeneratorTest, LengthConcatenatesRoundsThenTruncates) {
    auto seeder = std::make_shared<FixedSeeder>("abc");
    TokenGenerator gen(sha1_config(), seeder);

    std::string value = gen.hex(103);
    ASSERT_EQ(value.size(), 103u);
    EXPECT_EQ(value, kSha1Abc + kSha1Abc + kSha1Abc.substr(0, 23));
    EXPECT_EQ(seeder->calls, 3);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("obscure_digest_rounds"), 3.0);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("obscure_tokens_generated"), 1.0);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("obscure_tokens_generated", {{"encoding", "hex"}}), 1.0);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("obscure_digest_rounds", {{"algorithm", "SHA-1"}}), 3.0);
}

TEST_F(TokenGeneratorTest, ShortLengthUsesSingleRound) {
    auto seeder = std::make_shared<FixedSeeder>("abc");
    TokenGenerator gen(sha1_config(), seeder);

    EXPECT_EQ(gen.hex(7), "a9993e3");
    EXPECT_EQ(gen.base64(5), "qZk+N");
    EXPECT_EQ(seeder->calls, 2);
}

TEST_F(TokenGeneratorTest, ExactMultipleOfChunkSize) {
    auto seeder = std::make_shared<FixedSeeder>("abc");
    TokenGenerator gen(sha1_config(), seeder);

    EXPECT_EQ(gen.hex(80), kSha1Abc + kSha1Abc);
    EXPECT_EQ(seeder->calls, 2);
}

TEST_F(TokenGeneratorTest, OversizedLengthRejectedWithoutWork) {
    auto seeder = std::make_shared<FixedSeeder>("abc");
    TokenGenerator gen(sha1_config(), seeder);

    const long long huge = std::numeric_limits<long long>::max();
    EXPECT_THROW(gen.hex(huge), std::invalid_argument);
    EXPECT_THROW(gen.binary(huge), std::invalid_argument);
    EXPECT_EQ(seeder->calls, 0);
}

TEST_F(TokenGeneratorTest, LengthIsExactForEveryEncoding) {
    TokenGenerator gen(sha1_config());
    for (long long length = 8; length <= 256; ++length) {
        EXPECT_EQ(gen.hex(length).size(), static_cast<std::size_t>(length));
        EXPECT_EQ(gen.binary(length).size(), static_cast<std::size_t>(length));
        EXPECT_EQ(gen.base64(length).size(), static_cast<std::size_t>(length));
    }
}

TEST_F(TokenGeneratorTest, NonPositiveLengthRejectedWithoutWork) {
    auto seeder = std::make_shared<FixedSeeder>("abc");
    TokenGenerator gen(sha1_config(), seeder);

    EXPECT_THROW(gen.hex(0), std::invalid_argument);
    EXPECT_THROW(gen.binary(-1), std::invalid_argument);
    EXPECT_THROW(gen.base64(0), std::invalid_argument);
    EXPECT_THROW(gen.generate(Encoding::Base64, Length{-100}), std::invalid_argument);
    EXPECT_EQ(seeder->calls, 0);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("obscure_invalid_requests"), 4.0);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("obscure_tokens_generated"), 0.0);
}

TEST_F(TokenGeneratorTest, HexCharacterSet) {
    TokenGenerator gen(sha1_config());
    for (int i = 0; i < 20; ++i) {
        std::string value = gen.hex();
        EXPECT_TRUE(std::all_of(value.begin(), value.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        })) << value;
    }
}

TEST_F(TokenGeneratorTest, ConsecutiveValuesDiffer) {
    TokenGenerator gen(sha1_config());
    std::string previous = gen.hex();
    for (int i = 0; i < 20; ++i) {
        std::string next = gen.hex();
        EXPECT_NE(previous, next);
        previous = next;
    }
}

TEST_F(TokenGeneratorTest, SelectionIsStable) {
    TokenGenerator gen;
    const std::string name = gen.algorithm_name();
    const std::size_t size = gen.binary().size();
    EXPECT_EQ(size, gen.digest_size());
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(gen.binary().size(), size);
        EXPECT_EQ(gen.algorithm_name(), name);
    }
}

TEST_F(TokenGeneratorTest, FallsBackAlongPreferences) {
    GeneratorConfig config;
    config.digest_preferences = {"NOT-A-DIGEST", "SHA-256", "MD5"};
    config.log_selection = false;
    TokenGenerator gen(config);

    EXPECT_EQ(gen.algorithm_name(), "SHA-256");
    EXPECT_EQ(gen.hex().size(), 64u);
    EXPECT_EQ(gen.base64().size(), 43u);
    EXPECT_EQ(gen.chunk_size(Encoding::Binary), 32u);
    EXPECT_EQ(MetricsRegistry::instance().get_gauge("obscure_digest_size_bytes"), 32.0);
}

TEST_F(TokenGeneratorTest, NoDigestAvailable) {
    GeneratorConfig config;
    config.digest_preferences = {"NOT-A-DIGEST"};
    EXPECT_THROW(TokenGenerator{config}, DigestUnavailableError);
}

TEST_F(TokenGeneratorTest, DefaultEncodingFromConfig) {
    GeneratorConfig config = sha1_config();
    config.default_encoding = Encoding::Base64;
    auto seeder = std::make_shared<FixedSeeder>("abc");
    TokenGenerator gen(config, seeder);

    EXPECT_EQ(gen.create(), "qZk+NkcGgWq6PiVxeFDCbJzQ2J0");
    EXPECT_EQ(gen.create(30).size(), 30u);
}

TEST_F(TokenGeneratorTest, OptionsObject) {
    auto seeder = std::make_shared<FixedSeeder>("abc");
    TokenGenerator gen(sha1_config(), seeder);

    EXPECT_EQ(gen.generate_from_options(Encoding::Hexadecimal, boost::json::object{}), kSha1Abc);

    boost::json::object with_length;
    with_length["length"] = 50;
    EXPECT_EQ(gen.generate_from_options(Encoding::Hexadecimal, with_length), kSha1Abc + kSha1Abc.substr(0, 10));
    EXPECT_EQ(gen.generate_from_options(Encoding::Binary, with_length).size(), 50u);

    boost::json::object with_extra;
    with_extra["length"] = 5;
    with_extra["x"] = 1;
    EXPECT_EQ(gen.generate_from_options(Encoding::Hexadecimal, with_extra), "a9993");
}

TEST_F(TokenGeneratorTest, OptionsObjectRejectsUnknownKeys) {
    auto seeder = std::make_shared<FixedSeeder>("abc");
    TokenGenerator gen(sha1_config(), seeder);

    boost::json::object unknown;
    unknown["size"] = 10;
    EXPECT_THROW(gen.generate_from_options(Encoding::Hexadecimal, unknown), std::invalid_argument);

    boost::json::object not_integer;
    not_integer["length"] = "ten";
    EXPECT_THROW(gen.generate_from_options(Encoding::Hexadecimal, not_integer), std::invalid_argument);

    boost::json::object zero;
    zero["length"] = 0;
    EXPECT_THROW(gen.generate_from_options(Encoding::Base64, zero), std::invalid_argument);

    EXPECT_EQ(seeder->calls, 0);
}

TEST_F(TokenGeneratorTest, UnknownKeyMessageDiffersFromBadLength) {
    TokenGenerator gen(sha1_config());

    boost::json::object unknown;
    unknown["size"] = 10;
    boost::json::object zero;
    zero["length"] = 0;

    std::string unknown_msg;
    std::string zero_msg;
    try {
        gen.generate_from_options(Encoding::Hexadecimal, unknown);
    } catch (const std::invalid_argument& e) {
        unknown_msg = e.what();
    }
    try {
        gen.generate_from_options(Encoding::Hexadecimal, zero);
    } catch (const std::invalid_argument& e) {
        zero_msg = e.what();
    }

    EXPECT_NE(unknown_msg.find("length wasn't specified"), std::string::npos);
    EXPECT_NE(zero_msg.find("greater than 0"), std::string::npos);
}
