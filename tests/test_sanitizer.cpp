#include <gtest/gtest.h>
#include "sanitizer.hpp"
#include "restorer.hpp"
#include "security_logger.hpp"
#include "temp_dir.hpp"
#include <memory>

using namespace confshield;

namespace {

const std::string kConfig =
    "homeassistant:\n"
    "  latitude: 52.3731\n"
    "  longitude: 4.8922\n"
    "mqtt:\n"
    "  broker: mqtt.home.lan\n"
    "  username: mqtt_user\n"
    "  password: \"S3cr3t-Pa55\"\n"
    "http:\n"
    "  server_host: 192.168.1.10\n"
    "notify:\n"
    "  - platform: smtp\n"
    "    sender: alice@mailhost.net\n"
    "wifi:\n"
    "  password: !secret wifi_password\n";

}

class SanitizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        SecurityLogger::set_min_level(SecurityLogger::Level::CRITICAL);
        StoreOptions options;
        options.store_path = dir_ / "secrets_vault.enc";
        store_ = std::make_unique<MappingStore>(options, KeyMaterial::from_secret(std::string(64, 'a')));
        store_->open();
    }

    void TearDown() override {
        SecurityLogger::set_min_level(SecurityLogger::Level::INFO);
    }

    TempDir dir_;
    PatternCatalog catalog_ = PatternCatalog::with_defaults();
    std::unique_ptr<MappingStore> store_;
};

TEST_F(SanitizerTest, PasswordLine) {
    Sanitizer sanitizer(catalog_, *store_);
    std::string input = "password: \"Sup3rSecret!\"";
    std::string output = sanitizer.sanitize(input, "configuration.yaml");
    EXPECT_EQ(output, "password: \"<<SECRET_PASSWORD_0001>>\"");

    Restorer restorer(*store_);
    auto restored = restorer.restore(output);
    EXPECT_EQ(restored.text, input);
    EXPECT_TRUE(restored.unresolved.empty());
}

TEST_F(SanitizerTest, SanitizingTwiceChangesNothing) {
    Sanitizer sanitizer(catalog_, *store_);
    std::string once = sanitizer.sanitize(kConfig, "configuration.yaml");
    size_t records = store_->size();
    EXPECT_EQ(records, 7u);

    std::string twice = sanitizer.sanitize(once, "configuration.yaml");
    EXPECT_EQ(twice, once);
    EXPECT_EQ(store_->size(), records);
    EXPECT_NE(once.find("password: !secret wifi_password"), std::string::npos);
}

TEST_F(SanitizerTest, RestoreInvertsSanitize) {
    Sanitizer sanitizer(catalog_, *store_);
    std::string sanitized = sanitizer.sanitize(kConfig, "configuration.yaml");

    EXPECT_EQ(sanitized.find("S3cr3t-Pa55"), std::string::npos);
    EXPECT_EQ(sanitized.find("192.168.1.10"), std::string::npos);
    EXPECT_EQ(sanitized.find("alice@mailhost.net"), std::string::npos);
    EXPECT_NE(sanitized.find("broker: <<SECRET_HOSTNAME_0001>>"), std::string::npos);

    auto restored = Restorer(*store_).restore(sanitized, "configuration.yaml");
    EXPECT_EQ(restored.text, kConfig);
    EXPECT_EQ(restored.restored_count, 7u);
    EXPECT_TRUE(restored.unresolved.empty());
}

TEST_F(SanitizerTest, SameSecretInTwoFilesSharesPlaceholder) {
    Sanitizer sanitizer(catalog_, *store_);
    std::string a = sanitizer.sanitize("password: \"Sup3rSecret!\"\n", "configuration.yaml");
    std::string b = sanitizer.sanitize("mqtt:\n  password: Sup3rSecret!\n", "mqtt.yaml");

    EXPECT_NE(a.find("<<SECRET_PASSWORD_0001>>"), std::string::npos);
    EXPECT_EQ(b, "mqtt:\n  password: <<SECRET_PASSWORD_0001>>\n");
    EXPECT_EQ(store_->size(), 1u);

    const SecretRecord* rec = store_->lookup_by_value("Sup3rSecret!");
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->first_seen_in, "configuration.yaml");
    EXPECT_EQ(rec->seen_in, (std::vector<std::string>{"configuration.yaml", "mqtt.yaml"}));
}

TEST_F(SanitizerTest, DistinctAddressesGetDistinctPlaceholders) {
    Sanitizer sanitizer(catalog_, *store_);
    std::string out = sanitizer.sanitize("a: 10.0.0.5\nb: 10.0.0.6\nc: 10.0.0.5\n", "hosts.yaml");
    EXPECT_EQ(out, "a: <<SECRET_IPV4_0001>>\nb: <<SECRET_IPV4_0002>>\nc: <<SECRET_IPV4_0001>>\n");
}

TEST_F(SanitizerTest, Report) {
    Sanitizer sanitizer(catalog_, *store_);
    sanitizer.sanitize("ip: 10.0.0.5\n", "a.yaml");

    auto report = sanitizer.sanitize_with_report("ip: 10.0.0.5\nother: 10.0.0.9\n", "b.yaml");
    EXPECT_EQ(report.matches.size(), 2u);
    EXPECT_EQ(report.reused, 1u);
    EXPECT_EQ(report.new_records, 1u);
    EXPECT_EQ(report.text, "ip: <<SECRET_IPV4_0001>>\nother: <<SECRET_IPV4_0002>>\n");
}

TEST_F(SanitizerTest, NothingToSanitize) {
    Sanitizer sanitizer(catalog_, *store_);
    std::string text = "automation:\n  - alias: Lights on\n    trigger: sun\n";
    EXPECT_EQ(sanitizer.sanitize(text, "automations.yaml"), text);
    EXPECT_EQ(store_->size(), 0u);
    EXPECT_FALSE(store_->dirty());
}

TEST_F(SanitizerTest, PersistEachFile) {
    Sanitizer sanitizer(catalog_, *store_, true);
    sanitizer.sanitize("password: hunter2-secret\n", "a.yaml");
    EXPECT_FALSE(store_->dirty());
    EXPECT_TRUE(std::filesystem::exists(store_->path()));
}

TEST_F(SanitizerTest, BatchModeLeavesPersistToCaller) {
    Sanitizer sanitizer(catalog_, *store_);
    sanitizer.sanitize("password: hunter2-secret\n", "a.yaml");
    EXPECT_TRUE(store_->dirty());
    EXPECT_FALSE(std::filesystem::exists(store_->path()));
}

TEST_F(SanitizerTest, SanitizedOutputSurvivesReopen) {
    std::string sanitized;
    {
        Sanitizer sanitizer(catalog_, *store_);
        sanitized = sanitizer.sanitize(kConfig, "configuration.yaml");
        store_->persist();
        store_->close();
    }

    StoreOptions options;
    options.store_path = dir_ / "secrets_vault.enc";
    MappingStore reopened(options, KeyMaterial::from_secret(std::string(64, 'a')));
    reopened.open();
    auto restored = Restorer(reopened).restore(sanitized);
    EXPECT_EQ(restored.text, kConfig);
}
