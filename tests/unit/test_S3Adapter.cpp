#include <gtest/gtest.h>
#include "FakeObjectClient.hpp"
#include "storage/S3Adapter.hpp"
#include "storage/StorageException.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace cairn::storage;
using cairn::test::FakeObjectClient;

class S3AdapterTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeObjectClient> client;
    std::unique_ptr<S3Adapter> adapter;

    void SetUp() override {
        client = std::make_shared<FakeObjectClient>();
        adapter = std::make_unique<S3Adapter>("test-bucket", client);
    }

    void seed(const std::string& key, const std::string& body) {
        client->objects[key] = FakeObjectClient::Object{body, {}};
    }
};

TEST_F(S3AdapterTest, RequiresClient) {
    EXPECT_THROW(S3Adapter("bucket", nullptr), std::invalid_argument);
}

TEST_F(S3AdapterTest, MissingObjectsAreNotCached) {
    EXPECT_FALSE(adapter->exists("missing.txt"));
    EXPECT_FALSE(adapter->exists("missing.txt"));
    EXPECT_EQ(client->headCalls, 2);
    EXPECT_EQ(adapter->cachedEntries(), 0u);
    EXPECT_EQ(client->lastBucket, "test-bucket");
}

TEST_F(S3AdapterTest, MetadataIsCachedPerKey) {
    seed("photo.jpg", "0123456789");

    EXPECT_TRUE(adapter->exists("photo.jpg"));
    EXPECT_TRUE(adapter->exists("photo.jpg"));
    EXPECT_EQ(adapter->size("photo.jpg"), 10u);
    EXPECT_EQ(adapter->lastModified("photo.jpg"), 784111777);
    EXPECT_EQ(adapter->path("photo.jpg"), "photo.jpg");

    EXPECT_EQ(client->headCalls, 1);
    EXPECT_EQ(adapter->cachedEntries(), 1u);
}

TEST_F(S3AdapterTest, LastModifiedAcceptsObsoleteDateForms) {
    seed("rfc850.txt", "a");
    seed("asctime.txt", "b");

    client->lastModified = "Sunday, 06-Nov-94 08:49:37 GMT";
    EXPECT_EQ(adapter->lastModified("rfc850.txt"), 784111777);

    client->lastModified = "Sun Nov  6 08:49:37 1994";
    EXPECT_EQ(adapter->lastModified("asctime.txt"), 784111777);
}

TEST_F(S3AdapterTest, SizeAndLastModifiedDegradeToZero) {
    EXPECT_EQ(adapter->size("missing"), 0u);
    EXPECT_EQ(adapter->lastModified("missing"), 0);

    client->lastModified = "not a date";
    client->objects["odd"] = FakeObjectClient::Object{"abc", {{"content-length", "lots"}}};
    EXPECT_EQ(adapter->size("odd"), 0u);
    EXPECT_EQ(adapter->lastModified("odd"), 0);
}

TEST_F(S3AdapterTest, WriteThenRead) {
    EXPECT_TRUE(adapter->write("notes/today.txt", "remember the milk"));
    EXPECT_EQ(client->putCalls, 1);
    EXPECT_TRUE(adapter->exists("notes/today.txt"));
    EXPECT_EQ(adapter->read("notes/today.txt"), "remember the milk");
}

TEST_F(S3AdapterTest, ReadOfMissingObjectIsEmpty) {
    EXPECT_EQ(adapter->read("nothing-here"), "");
    EXPECT_EQ(client->getCalls, 1);
}

TEST_F(S3AdapterTest, OverwriteConflictKeepsObject) {
    seed("report.csv", "a,b,c");

    try {
        adapter->write("report.csv", "x,y,z");
        FAIL() << "expected AlreadyExists";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), StorageErrc::AlreadyExists);
        EXPECT_EQ(e.adapterType(), AdapterType::S3);
        EXPECT_EQ(&e.adapter(), adapter.get());
    }

    EXPECT_EQ(client->putCalls, 0);
    EXPECT_EQ(adapter->read("report.csv"), "a,b,c");
}

TEST_F(S3AdapterTest, MetadataIsForwardedAsHeaders) {
    const auto cfg = WriteConfig::fromOptions({
        {"overwrite", "false"},
        {"Content-Type", "text/plain"},
        {"x-amz-meta-owner", "alice"},
    });

    EXPECT_TRUE(adapter->write("tagged.txt", "hi", cfg));
    EXPECT_EQ(client->lastPutHeaders.size(), 2u);
    EXPECT_EQ(client->lastPutHeaders.at("Content-Type"), "text/plain");
    EXPECT_EQ(client->lastPutHeaders.at("x-amz-meta-owner"), "alice");
    EXPECT_FALSE(client->lastPutHeaders.contains("overwrite"));
}

TEST_F(S3AdapterTest, WriteInvalidatesCachedMetadata) {
    ASSERT_TRUE(adapter->write("grow.txt", "one"));
    EXPECT_EQ(adapter->size("grow.txt"), 3u);

    ASSERT_TRUE(adapter->write("grow.txt", "three", WriteConfig::overwriting()));
    EXPECT_EQ(adapter->size("grow.txt"), 5u);
}

TEST_F(S3AdapterTest, FailedWriteReportsFalse) {
    client->failPuts = true;
    EXPECT_FALSE(adapter->write("nope.txt", "data"));
    EXPECT_FALSE(adapter->exists("nope.txt"));
}

TEST_F(S3AdapterTest, RemoveInvalidatesCachedMetadata) {
    seed("temp.bin", "xyz");
    ASSERT_TRUE(adapter->exists("temp.bin"));

    EXPECT_TRUE(adapter->remove("temp.bin"));
    EXPECT_EQ(adapter->cachedEntries(), 0u);
    EXPECT_FALSE(adapter->exists("temp.bin"));
}

TEST_F(S3AdapterTest, PathOfMissingObjectThrows) {
    try {
        (void) adapter->path("ghost");
        FAIL() << "expected DoesNotExist";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), StorageErrc::DoesNotExist);
        EXPECT_STREQ(e.what(), "File does not exist: ghost");
    }
}

TEST_F(S3AdapterTest, CopyAndMoveOfMissingSourceFail) {
    EXPECT_FALSE(adapter->copy("missing", "dest"));
    EXPECT_FALSE(adapter->move("missing", "dest"));
    EXPECT_EQ(client->putCalls, 0);
    EXPECT_EQ(client->deleteCalls, 0);
}

TEST_F(S3AdapterTest, CopyDuplicatesObject) {
    seed("a.txt", "alpha");

    EXPECT_TRUE(adapter->copy("a.txt", "b.txt"));
    EXPECT_EQ(client->objects.at("b.txt").body, "alpha");
    EXPECT_EQ(client->objects.at("a.txt").body, "alpha");
}

TEST_F(S3AdapterTest, CopyDoesNotOverwrite) {
    seed("a.txt", "alpha");
    seed("b.txt", "beta");

    EXPECT_THROW(adapter->copy("a.txt", "b.txt"), StorageException);
    EXPECT_EQ(client->objects.at("b.txt").body, "beta");
}

TEST_F(S3AdapterTest, MoveCopiesThenDeletes) {
    seed("old.txt", "content");

    EXPECT_TRUE(adapter->move("old.txt", "new.txt"));
    EXPECT_FALSE(client->objects.contains("old.txt"));
    EXPECT_EQ(client->objects.at("new.txt").body, "content");
    EXPECT_EQ(client->deleteCalls, 1);
}

TEST_F(S3AdapterTest, FailedMoveKeepsSource) {
    seed("keep.txt", "precious");
    client->failPuts = true;

    EXPECT_FALSE(adapter->move("keep.txt", "elsewhere.txt"));
    EXPECT_EQ(client->deleteCalls, 0);
    EXPECT_EQ(client->objects.at("keep.txt").body, "precious");
}

TEST_F(S3AdapterTest, DirectoryOperationsAreUnsupported) {
    seed("dir/file.txt", "x");

    EXPECT_TRUE(adapter->files("dir").empty());
    EXPECT_TRUE(adapter->files("dir", true).empty());
    EXPECT_TRUE(adapter->directories("").empty());
    EXPECT_FALSE(adapter->createDirectory("dir2"));
    EXPECT_FALSE(adapter->deleteDirectory("dir"));
    EXPECT_EQ(client->headCalls + client->getCalls + client->putCalls + client->deleteCalls, 0);
}

TEST_F(S3AdapterTest, KeysArePassedVerbatim) {
    EXPECT_TRUE(adapter->write("../odd/../key", "v"));
    EXPECT_TRUE(client->objects.contains("../odd/../key"));
}
