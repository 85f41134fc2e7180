#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <vector>

#include "kernel/record_store.hpp"
#include "temp_dir.hpp"

using pps::ProfileErrc;
using pps::ProfileError;
using pps::Record;
using pps::RecordStore;

namespace {

ProfileErrc CodeOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const ProfileError& e) {
    return e.code();
  }
  return ProfileErrc::Unknown;
}

const char* kTwoProfiles = R"([
  {"name": "dev", "backend": "s3://a"},
  {"name": "prod", "backend": "s3://b"}
])";

}  // namespace

TEST(RecordStoreTest, MissingFileLoadsEmpty) {
  TempDir dir;
  RecordStore store(dir / "profiles.json");
  EXPECT_TRUE(store.load().empty());
  EXPECT_FALSE(std::filesystem::exists(dir / "profiles.json"));
}

TEST(RecordStoreTest, WhitespaceOnlyFileLoadsEmpty) {
  TempDir dir;
  WriteFile(dir / "profiles.json", " \n\t\n");
  RecordStore store(dir / "profiles.json");
  EXPECT_TRUE(store.load().empty());
}

TEST(RecordStoreTest, LoadsInFileOrder) {
  TempDir dir;
  WriteFile(dir / "profiles.json", kTwoProfiles);
  RecordStore store(dir / "profiles.json");
  const auto& records = store.load();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0], (Record{"dev", "s3://a"}));
  EXPECT_EQ(records[1], (Record{"prod", "s3://b"}));
  ASSERT_NE(store.find("prod"), nullptr);
  EXPECT_EQ(store.find("prod")->backend, "s3://b");
  EXPECT_EQ(store.find("Prod"), nullptr);
}

TEST(RecordStoreTest, RejectsMalformedContent) {
  TempDir dir;
  const std::vector<std::string> bad = {
      "{not json",
      R"({"name": "dev", "backend": "s3://a"})",
      R"(["dev"])",
      R"([{"name": "dev"}])",
      R"([{"name": "dev", "backend": 3}])",
      R"([{"name": "", "backend": "s3://a"}])",
      R"([{"name": "dev", "backend": "s3://a", "extra": "x"}])",
      R"([{"name": "dev", "backend": "s3://a"}, {"name": "dev", "backend": "s3://b"}])",
  };
  for (const auto& content : bad) {
    WriteFile(dir / "profiles.json", content);
    RecordStore store(dir / "profiles.json");
    EXPECT_EQ(CodeOf([&] { store.load(); }), ProfileErrc::MalformedStore) << content;
  }
}

TEST(RecordStoreTest, MalformedErrorNamesTheFile) {
  TempDir dir;
  WriteFile(dir / "profiles.json", "[1]");
  RecordStore store(dir / "profiles.json");
  try {
    store.load();
    FAIL() << "expected MalformedStore";
  } catch (const ProfileError& e) {
    EXPECT_NE(std::string(e.what()).find((dir / "profiles.json").string()), std::string::npos);
  }
}

TEST(RecordStoreTest, NamesAreCaseSensitive) {
  TempDir dir;
  WriteFile(dir / "profiles.json",
            R"([{"name": "dev", "backend": "a"}, {"name": "DEV", "backend": "b"}])");
  RecordStore store(dir / "profiles.json");
  EXPECT_EQ(store.load().size(), 2u);
}

TEST(RecordStoreTest, PersistRoundTripPreservesOrderAndUtf8) {
  TempDir dir;
  std::vector<Record> records = {
      {"zeta", "file://./state"},
      {"alpha", "s3://bücket/stätë?q=\"x\"&y=\\z"},
      {"日本", "https://api.pulumi.com"}};
  WriteFile(dir / "profiles.json", pps::serialize_records(records));

  RecordStore store(dir / "profiles.json");
  EXPECT_EQ(store.load(), records);

  // Writing what was loaded gives back the same bytes.
  const std::string before = ReadFile(dir / "profiles.json");
  EXPECT_EQ(pps::serialize_records(store.list()), before);
}

TEST(RecordStoreTest, SerializesNameBeforeBackend) {
  auto text = pps::serialize_records({{"dev", "s3://a"}});
  EXPECT_LT(text.find("\"name\""), text.find("\"backend\""));
  EXPECT_EQ(text.back(), '\n');
}

TEST(RecordStoreTest, AddAppendsAndPersists) {
  TempDir dir;
  WriteFile(dir / "profiles.json", kTwoProfiles);
  RecordStore store(dir / "profiles.json");
  store.load();
  store.add("stage", "s3://c");

  RecordStore reloaded(dir / "profiles.json");
  const auto& records = reloaded.load();
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[2], (Record{"stage", "s3://c"}));
}

TEST(RecordStoreTest, AddCreatesMissingDirectories) {
  TempDir dir;
  RecordStore store(dir / "nested" / ".pulumi" / "profiles.json");
  store.load();
  store.add("dev", "s3://a");
  EXPECT_TRUE(std::filesystem::exists(dir / "nested" / ".pulumi" / "profiles.json"));
}

TEST(RecordStoreTest, DuplicateAddLeavesFileUntouched) {
  TempDir dir;
  WriteFile(dir / "profiles.json", kTwoProfiles);
  RecordStore store(dir / "profiles.json");
  store.load();

  EXPECT_EQ(CodeOf([&] { store.add("dev", "s3://other"); }), ProfileErrc::Duplicate);
  EXPECT_EQ(ReadFile(dir / "profiles.json"), kTwoProfiles);
  EXPECT_EQ(store.list().size(), 2u);
}

TEST(RecordStoreTest, AddRejectsEmptyFields) {
  TempDir dir;
  RecordStore store(dir / "profiles.json");
  store.load();
  EXPECT_EQ(CodeOf([&] { store.add("", "s3://a"); }), ProfileErrc::InvalidArgument);
  EXPECT_EQ(CodeOf([&] { store.add("dev", ""); }), ProfileErrc::InvalidArgument);
  EXPECT_FALSE(std::filesystem::exists(dir / "profiles.json"));
}

TEST(RecordStoreTest, AddThenDeleteRestoresContent) {
  TempDir dir;
  RecordStore store(dir / "profiles.json");
  store.load();
  store.add("a", "1");
  store.add("b", "2");
  store.add("c", "3");
  const std::string before = ReadFile(dir / "profiles.json");
  const auto records_before = store.list();

  store.add("tmp", "x");
  store.remove("tmp");

  EXPECT_EQ(store.list(), records_before);
  EXPECT_EQ(ReadFile(dir / "profiles.json"), before);
}

TEST(RecordStoreTest, EditChangesOnlyThatBackend) {
  TempDir dir;
  RecordStore store(dir / "profiles.json");
  store.load();
  store.add("a", "1");
  store.add("b", "2");
  store.add("c", "3");

  store.edit("b", "s3://new");

  RecordStore reloaded(dir / "profiles.json");
  EXPECT_EQ(reloaded.load(),
            (std::vector<Record>{{"a", "1"}, {"b", "s3://new"}, {"c", "3"}}));
}

TEST(RecordStoreTest, EditAndDeleteOfUnknownNameFail) {
  TempDir dir;
  WriteFile(dir / "profiles.json", kTwoProfiles);
  RecordStore store(dir / "profiles.json");
  store.load();
  EXPECT_EQ(CodeOf([&] { store.edit("stage", "x"); }), ProfileErrc::NotFound);
  EXPECT_EQ(CodeOf([&] { store.remove("stage"); }), ProfileErrc::NotFound);
  EXPECT_EQ(ReadFile(dir / "profiles.json"), kTwoProfiles);
}

TEST(RecordStoreTest, LeavesNoTempFilesBehind) {
  TempDir dir;
  RecordStore store(dir / "profiles.json");
  store.load();
  store.add("dev", "s3://a");
  store.edit("dev", "s3://b");
  int entries = 0;
  for (const auto& e : std::filesystem::directory_iterator(dir.path())) {
    (void)e;
    ++entries;
  }
  EXPECT_EQ(entries, 1);
}
