#include <gtest/gtest.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_map>

#include "dai/foundation/config_manager.hpp"
#include "dai/foundation/error_code.hpp"
#include "dai/foundation/game_error.hpp"
#include "dai/foundation/game_result.hpp"
#include "dai/foundation/types.hpp"

using namespace dai::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidCell), "Navigation");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidLink), "Navigation");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidAlertCap), "AI");
    EXPECT_EQ(errorSubsystem(ErrorCode::ControllerNotFound), "AI");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

// --- GameError tests ---

TEST(GameErrorTest, DefaultConstruction) {
    GameError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(GameErrorTest, CodeAndMessage) {
    GameError err(ErrorCode::NotFound, "entity missing");
    EXPECT_EQ(err.code(), ErrorCode::NotFound);
    EXPECT_EQ(err.message(), "entity missing");
    EXPECT_EQ(err.subsystem(), "General");
    EXPECT_EQ(err.describe(), "General: entity missing");
}

TEST(GameErrorTest, WithIndexContext) {
    GameError err(ErrorCode::InvalidCell, "cell 3 dropped", std::size_t{3});
    EXPECT_TRUE(err.hasContext());
    const auto* index = err.context<std::size_t>();
    ASSERT_NE(index, nullptr);
    EXPECT_EQ(*index, 3u);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<int>(), nullptr);
    EXPECT_EQ(err.recordIndex().value_or(99), 3u);
    EXPECT_FALSE(err.entity().has_value());
}

TEST(GameErrorTest, WithEntityContext) {
    GameError err(ErrorCode::ControllerNotFound, "no controller", EntityId{12});
    ASSERT_TRUE(err.entity().has_value());
    EXPECT_EQ(err.entity()->value(), 12u);
    EXPECT_FALSE(err.recordIndex().has_value());
    EXPECT_EQ(err.describe(), "AI: no controller");
}

// --- GameResult tests ---

TEST(GameResultTest, OkValue) {
    auto result = GameResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);
}

TEST(GameResultTest, ErrorValue) {
    auto result = GameResult<int>::err(
        GameError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(GameResultTest, VoidOk) {
    auto result = GameResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}

TEST(GameResultTest, VoidError) {
    auto result = GameResult<void>::err(GameError(ErrorCode::ControllerNotFound, "gone"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ControllerNotFound);
}

// --- StrongId / Types tests ---

TEST(StrongIdTest, DefaultInvalid) {
    EntityId id;
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.value(), 0u);
    EXPECT_EQ(id, kNoEntity);
}

TEST(StrongIdTest, ExplicitConstruction) {
    EntityId id(100);
    EXPECT_TRUE(id.isValid());
    EXPECT_EQ(id.value(), 100u);
}

TEST(StrongIdTest, Equality) {
    EntityId a(1), b(1), c(2);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(StrongIdTest, Ordering) {
    EntityId a(1), b(2);
    EXPECT_LT(a, b);
    EXPECT_GT(b, a);
}

TEST(StrongIdTest, StreamsWithMarker) {
    std::ostringstream oss;
    oss << EntityId(42);
    EXPECT_EQ(oss.str(), "#42");
}

TEST(StrongIdTest, HashWorks) {
    std::unordered_map<EntityId, std::string> map;
    map[EntityId(1)] = "turret";
    EXPECT_EQ(map[EntityId(1)], "turret");
    EXPECT_EQ(map.count(EntityId(2)), 0u);
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("dai_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("test.yaml", R"(
ai:
  sight_distance: 40.5
  turret:
    open_time: 3
  camera:
    model: "camgrn"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto sight = config.get<float>("ai.sight_distance");
    ASSERT_TRUE(sight.hasValue());
    EXPECT_FLOAT_EQ(sight.value(), 40.5f);

    auto openTime = config.get<int>("ai.turret.open_time");
    ASSERT_TRUE(openTime.hasValue());
    EXPECT_EQ(openTime.value(), 3);

    auto model = config.get<std::string>("ai.camera.model");
    ASSERT_TRUE(model.hasValue());
    EXPECT_EQ(model.value(), "camgrn");
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    auto path = writeYaml("empty.yaml", "{}");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    auto path = writeYaml("types.yaml", "value: hello");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, LoadFromString) {
    ConfigManager config;
    auto result = config.loadFromString("ai:\n  monster:\n    walk_speed: 3.5\n");
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(config.hasKey("ai.monster.walk_speed"));
    EXPECT_EQ(config.size(), 1u);
}

TEST_F(ConfigManagerTest, LoadFromMalformedString) {
    ConfigManager config;
    auto result = config.loadFromString("ai: [unterminated");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, ScalarRootRejected) {
    ConfigManager config;
    auto result = config.loadFromString("42");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<float>("ai.turret.fire_interval", 0.5f);

    auto result = config.get<float>("ai.turret.fire_interval");
    ASSERT_TRUE(result.hasValue());
    EXPECT_FLOAT_EQ(result.value(), 0.5f);
}

TEST_F(ConfigManagerTest, HasKey) {
    auto path = writeYaml("check.yaml", "key: value");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    bool notified = false;
    std::string notifiedKey;

    config.watch("ai.debug", [&](std::string_view key) {
        notified = true;
        notifiedKey = std::string(key);
    });

    config.set<bool>("ai.debug", true);
    EXPECT_TRUE(notified);
    EXPECT_EQ(notifiedKey, "ai.debug");
}
