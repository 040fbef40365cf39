#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "awsrender_config_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        auto p = test_dir / name;
        std::ofstream(p) << content;
        return p;
    }

    Settings valid_settings() {
        Settings s;
        s.instance_id = "i-0abc";
        s.values.username = "ec2-user";
        s.values.keyfile = write_file("key.pem", "-----BEGIN-----").string();
        s.values.output = "s3://bucket";
        return s;
    }
};

TEST_F(ConfigTest, MissingFileLoadsEmpty) {
    auto r = DefaultsStore::load(test_dir / "absent.yaml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.size(), 0u);
    EXPECT_EQ(r.value.default_instance(), "");
}

TEST_F(ConfigTest, LoadsStoredInstances) {
    auto path = write_file("defaults.yaml",
        "default_instance: i-0abc\n"
        "instances:\n"
        "  i-0abc:\n"
        "    keyfile: /keys/render.pem\n"
        "    username: ec2-user\n"
        "    output: s3://bucket\n"
        "    shutdown: true\n"
        "    region: eu-west-1\n");
    auto r = DefaultsStore::load(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.default_instance(), "i-0abc");

    const InstanceDefaults* d = r.value.find("i-0abc");
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->keyfile, "/keys/render.pem");
    EXPECT_EQ(d->username, "ec2-user");
    EXPECT_TRUE(d->shutdown);
    EXPECT_EQ(d->region, "eu-west-1");
    EXPECT_EQ(d->email, "");
    EXPECT_EQ(r.value.find("i-other"), nullptr);
}

TEST_F(ConfigTest, MalformedFileIsConfigInvalid) {
    auto path = write_file("defaults.yaml", "instances: [unclosed\n");
    auto r = DefaultsStore::load(path);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConfigInvalid);
}

TEST_F(ConfigTest, SaveThenLoad) {
    DefaultsStore store(test_dir / "nested" / "defaults.yaml");
    InstanceDefaults d;
    d.keyfile = "/keys/a.pem";
    d.username = "ubuntu";
    d.hostkey = "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5";
    d.output = "s3://out";
    d.email = "me@example.com";
    d.shutdown = true;
    store.store("i-0abc", d, true);
    store.store("i-0def", InstanceDefaults{}, false);
    ASSERT_TRUE(store.save().is_ok());

    auto r = DefaultsStore::load(test_dir / "nested" / "defaults.yaml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.default_instance(), "i-0abc");
    EXPECT_EQ(r.value.size(), 2u);
    const InstanceDefaults* loaded = r.value.find("i-0abc");
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->hostkey, d.hostkey);
    EXPECT_EQ(loaded->email, d.email);
    EXPECT_TRUE(loaded->shutdown);
}

TEST_F(ConfigTest, StoreWithoutPrimaryKeepsDefault) {
    DefaultsStore store(test_dir / "defaults.yaml");
    store.store("i-first", InstanceDefaults{}, true);
    store.store("i-second", InstanceDefaults{}, false);
    EXPECT_EQ(store.default_instance(), "i-first");
}

TEST_F(ConfigTest, MergeUsesPrimaryInstanceWhenNoneGiven) {
    DefaultsStore store;
    InstanceDefaults d;
    d.username = "ec2-user";
    store.store("i-0abc", d, true);

    auto r = merge_settings(store, SettingOverrides{});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.instance_id, "i-0abc");
    EXPECT_EQ(r.value.values.username, "ec2-user");
}

TEST_F(ConfigTest, MergeWithoutAnyInstanceFails) {
    auto r = merge_settings(DefaultsStore{}, SettingOverrides{});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConfigInvalid);
}

TEST_F(ConfigTest, CommandLineOverridesStoredValues) {
    DefaultsStore store;
    InstanceDefaults d;
    d.username = "ec2-user";
    d.output = "s3://stored";
    d.shutdown = true;
    store.store("i-0abc", d, false);

    SettingOverrides o;
    o.instance_id = "i-0abc";
    o.output = "s3://given";
    o.shutdown = false;

    auto r = merge_settings(store, o);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.values.username, "ec2-user");
    EXPECT_EQ(r.value.values.output, "s3://given");
    EXPECT_FALSE(r.value.values.shutdown);
}

TEST_F(ConfigTest, OtherInstanceDefaultsAreNotApplied) {
    DefaultsStore store;
    InstanceDefaults d;
    d.username = "ec2-user";
    store.store("i-primary", d, true);

    SettingOverrides o;
    o.instance_id = "i-other";
    auto r = merge_settings(store, o);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.instance_id, "i-other");
    EXPECT_EQ(r.value.values.username, "");
}

TEST_F(ConfigTest, KnownHostsLookupByInstanceId) {
    auto path = write_file("known_hosts",
        "# comment\n"
        "10.0.0.1 ssh-rsa AAAAB3NzaC1yc2E\n"
        "i-0abcdef ssh-ed25519 AAAAC3NzaC1lZDI1NTE5 render\n");
    EXPECT_EQ(lookup_known_host("i-0abcdef", path), "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5 render");
    EXPECT_EQ(lookup_known_host("i-0abc", path), "");
    EXPECT_EQ(lookup_known_host("i-0abcdef", test_dir / "absent"), "");
}

TEST_F(ConfigTest, ValidSettingsPass) {
    EXPECT_TRUE(validate_settings(valid_settings()).is_ok());
}

TEST_F(ConfigTest, MissingRequiredSettings) {
    auto s = valid_settings();
    s.values.username.clear();
    EXPECT_EQ(validate_settings(s).kind, ErrorKind::ConfigInvalid);

    s = valid_settings();
    s.values.keyfile = (test_dir / "absent.pem").string();
    EXPECT_TRUE(validate_settings(s).is_err());

    s = valid_settings();
    s.values.output.clear();
    EXPECT_TRUE(validate_settings(s).is_err());
    EXPECT_TRUE(validate_settings(s, false).is_ok());
}

TEST_F(ConfigTest, EmailAddressChecked) {
    auto s = valid_settings();
    s.values.email = "not-an-address";
    EXPECT_TRUE(validate_settings(s).is_err());

    s.values.email = "me@example.com";
    EXPECT_TRUE(validate_settings(s).is_ok());

    EXPECT_FALSE(valid_email_address("@example.com"));
    EXPECT_FALSE(valid_email_address("me@"));
    EXPECT_FALSE(valid_email_address("a@b@c"));
    EXPECT_FALSE(valid_email_address("me @example.com"));
}

TEST_F(ConfigTest, SettingsCarryCredentials) {
    auto s = valid_settings();
    s.values.hostkey = "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5";
    auto c = s.credentials();
    EXPECT_EQ(c.username, "ec2-user");
    EXPECT_EQ(c.host_key, s.values.hostkey);
    EXPECT_TRUE(c.validate().is_ok());
}
