#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <thread>
#include "handlers/archive_handlers.hpp"
#include "handlers/upload_handler.hpp"
#include "test_utils.hpp"

using namespace archiver::handlers;
using archiver::store::ArchiveError;
using archiver::store::ChunkSink;
using archiver::store::Store;
using archiver::store::StoreError;
using ::testing::_;
using ::testing::InSequence;
using ::testing::StrictMock;

namespace {

class MockChunkSink : public ChunkSink {
public:
  MOCK_METHOD(void, write, (const char* data, std::size_t size), (override));
  MOCK_METHOD(void, close, (), (override));
};

} // namespace

class ArchiveHandlersTest : public ::testing::Test {
protected:
  const std::string boundary = "archiver-test-boundary";
  std::unique_ptr<TempDirectory> temp_dir;
  std::unique_ptr<Store> store;

  void SetUp() override {
    init_test_logging();
    temp_dir = std::make_unique<TempDirectory>("handlers_test");
    store = std::make_unique<Store>(temp_dir->path() / "archive", 1024);
  }

  // Feeds the body in pieces the way the transport would
  Result<std::string> upload(const std::vector<TestField>& fields, std::size_t piece = 4096) {
    const std::string body = build_multipart_body(boundary, fields);
    UploadRequest request(*store, multipart_content_type(boundary));
    for (std::size_t offset = 0; offset < body.size(); offset += piece) {
      if (!request.feed(body.data() + offset, std::min(piece, body.size() - offset))) {
        break;
      }
    }
    return request.finish();
  }

  std::string stream_all(const std::string& name) {
    auto result = stream_file(*store, name);
    EXPECT_TRUE(result.ok());
    if (!result.ok()) {
      return "";
    }
    auto& reader = *result.value();
    std::string content;
    std::vector<char> buffer(4096);
    std::size_t got = 0;
    while ((got = reader.read_chunk(buffer.data(), buffer.size())) > 0) {
      content.append(buffer.data(), got);
    }
    return content;
  }

  std::vector<std::string> sorted_listing() {
    auto result = list_archive(*store);
    EXPECT_TRUE(result.ok());
    auto files = result.ok() ? result.value().files : std::vector<std::string>{};
    std::sort(files.begin(), files.end());
    return files;
  }
};

//==============================================
// UPLOAD, LIST, STREAM, DELETE
//==============================================

TEST_F(ArchiveHandlersTest, UploadThenStreamReturnsSameBytes) {
  const std::string payload = make_binary_payload(50 * 1024 + 3);
  auto result = upload({{"video", std::string("movie.mp4"), payload}}, 777);

  ASSERT_TRUE(result.ok()) << result.error().message;
  EXPECT_EQ(result.value(), UPLOAD_SUCCESS_MESSAGE);
  EXPECT_EQ(stream_all("movie.mp4"), payload);
}

TEST_F(ArchiveHandlersTest, UploadOverwritesExistingFile) {
  ASSERT_TRUE(upload({{"video", std::string("clip.mp4"), "original content"}}).ok());
  ASSERT_TRUE(upload({{"video", std::string("clip.mp4"), "new"}}).ok());

  EXPECT_EQ(stream_all("clip.mp4"), "new");
  EXPECT_EQ(sorted_listing(), std::vector<std::string>{"clip.mp4"});
}

TEST_F(ArchiveHandlersTest, MultipleFieldsStoredInOneRequest) {
  auto result = upload({
    {"a", std::string("one.mp4"), "first"},
    {"b", std::string("two.mp4"), "second"}
  });

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(sorted_listing(), (std::vector<std::string>{"one.mp4", "two.mp4"}));
  EXPECT_EQ(stream_all("one.mp4"), "first");
  EXPECT_EQ(stream_all("two.mp4"), "second");
}

TEST_F(ArchiveHandlersTest, EmptyFieldCreatesZeroByteFile) {
  ASSERT_TRUE(upload({{"video", std::string("empty.mp4"), ""}}).ok());

  EXPECT_TRUE(store->has("empty.mp4"));
  EXPECT_EQ(store->get_file_size("empty.mp4"), 0u);
  EXPECT_EQ(stream_all("empty.mp4"), "");
}

TEST_F(ArchiveHandlersTest, ListingIsIdempotent) {
  // Listing an absent directory creates it
  EXPECT_TRUE(sorted_listing().empty());
  EXPECT_TRUE(std::filesystem::is_directory(store->base_path()));

  ASSERT_TRUE(upload({{"video", std::string("x.mp4"), "x"}}).ok());
  auto first = sorted_listing();
  auto second = sorted_listing();
  EXPECT_EQ(first, second);
  EXPECT_EQ(first, std::vector<std::string>{"x.mp4"});
}

TEST_F(ArchiveHandlersTest, DeleteTwice) {
  ASSERT_TRUE(upload({{"video", std::string("gone.mp4"), "bye"}}).ok());

  auto first = delete_file(*store, "gone.mp4");
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first.value(), DELETE_SUCCESS_MESSAGE);
  EXPECT_TRUE(sorted_listing().empty());

  auto second = delete_file(*store, "gone.mp4");
  ASSERT_FALSE(second.ok());
  EXPECT_EQ(second.error().kind, ArchiveError::NOT_FOUND);
}

TEST_F(ArchiveHandlersTest, DeleteFailureIsIoError) {
  store->ensure_directory();
  std::filesystem::create_directories(store->base_path() / "emptydir");
  std::filesystem::create_directories(store->base_path() / "fulldir");
  write_file(store->base_path() / "fulldir" / "x", "x");

  auto empty_dir = delete_file(*store, "emptydir");
  ASSERT_FALSE(empty_dir.ok());
  EXPECT_EQ(empty_dir.error().kind, ArchiveError::IO_ERROR);
  EXPECT_TRUE(std::filesystem::is_directory(store->base_path() / "emptydir"));

  auto full_dir = delete_file(*store, "fulldir");
  ASSERT_FALSE(full_dir.ok());
  EXPECT_EQ(full_dir.error().kind, ArchiveError::IO_ERROR);
  EXPECT_TRUE(std::filesystem::exists(store->base_path() / "fulldir" / "x"));
}

TEST_F(ArchiveHandlersTest, StreamMissingFileIsNotFound) {
  auto result = stream_file(*store, "missing.mp4");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ArchiveError::NOT_FOUND);

  // Names that can never be stored are simply absent
  auto traversal = stream_file(*store, "../secret");
  ASSERT_FALSE(traversal.ok());
  EXPECT_EQ(traversal.error().kind, ArchiveError::NOT_FOUND);
}

TEST_F(ArchiveHandlersTest, ListingFailsWhenDirectoryUnusable) {
  std::filesystem::create_directories(temp_dir->path());
  write_file(temp_dir->path() / "blocked", "file in the way");
  Store broken(temp_dir->path() / "blocked");

  auto result = list_archive(broken);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ArchiveError::IO_ERROR);
}

//==============================================
// UPLOAD FAILURES
//==============================================

TEST_F(ArchiveHandlersTest, MissingFilenameFailsUpload) {
  auto result = upload({{"video", std::nullopt, "orphan"}});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ArchiveError::BAD_REQUEST);
  EXPECT_TRUE(sorted_listing().empty());
}

TEST_F(ArchiveHandlersTest, EarlierFieldsSurviveLaterFailure) {
  auto result = upload({
    {"a", std::string("kept.mp4"), "kept content"},
    {"b", std::nullopt, "never written"},
    {"c", std::string("skipped.mp4"), "never reached"}
  });

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ArchiveError::BAD_REQUEST);
  EXPECT_EQ(sorted_listing(), std::vector<std::string>{"kept.mp4"});
  EXPECT_EQ(stream_all("kept.mp4"), "kept content");
}

TEST_F(ArchiveHandlersTest, InvalidFilenameFailsUpload) {
  auto result = upload({{"video", std::string("../escape.mp4"), "bad"}});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ArchiveError::BAD_REQUEST);
  EXPECT_FALSE(std::filesystem::exists(temp_dir->path() / "escape.mp4"));
}

TEST_F(ArchiveHandlersTest, NonMultipartContentTypeFails) {
  UploadRequest request(*store, "application/json");
  EXPECT_TRUE(request.failed());
  EXPECT_FALSE(request.feed("{}", 2));

  auto result = request.finish();
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ArchiveError::BAD_REQUEST);
}

TEST_F(ArchiveHandlersTest, TruncatedBodyFailsUpload) {
  const std::string body = build_multipart_body(boundary, {{"video", std::string("cut.mp4"), "abcdef"}});
  UploadRequest request(*store, multipart_content_type(boundary));
  ASSERT_TRUE(request.feed(body.data(), body.size() - 10));

  auto result = request.finish();
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ArchiveError::BAD_REQUEST);
}

TEST_F(ArchiveHandlersTest, FormWithoutFieldsSucceeds) {
  const std::string body = "--" + boundary + "--\r\n";
  UploadRequest request(*store, multipart_content_type(boundary));
  ASSERT_TRUE(request.feed(body.data(), body.size()));

  auto result = request.finish();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(request.fields_completed(), 0u);
}

//==============================================
// CHUNKED WRITES
//==============================================

TEST_F(ArchiveHandlersTest, EveryChunkReachesTheSinkInOrder) {
  std::string received;
  std::size_t writes = 0;
  std::size_t sinks_created = 0;

  UploadRequest request(multipart_content_type(boundary), [&](const std::string& name) {
    EXPECT_EQ(name, "chunks.mp4");
    ++sinks_created;
    auto sink = std::make_unique<StrictMock<MockChunkSink>>();
    EXPECT_CALL(*sink, write(_, _)).WillRepeatedly([&](const char* data, std::size_t size) {
      received.append(data, size);
      ++writes;
    });
    EXPECT_CALL(*sink, close()).Times(1);
    return sink;
  });

  const std::string payload = make_binary_payload(20000);
  const std::string body = build_multipart_body(boundary, {{"video", std::string("chunks.mp4"), payload}});
  for (std::size_t offset = 0; offset < body.size(); offset += 1000) {
    ASSERT_TRUE(request.feed(body.data() + offset, std::min<std::size_t>(1000, body.size() - offset)));
  }

  auto result = request.finish();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(sinks_created, 1u);
  EXPECT_EQ(received, payload);
  // Content is written as it arrives, never as a single buffered block
  EXPECT_GE(writes, 19u);
}

TEST_F(ArchiveHandlersTest, SinkFailureAbortsUpload) {
  UploadRequest request(multipart_content_type(boundary), [](const std::string&) {
    auto sink = std::make_unique<StrictMock<MockChunkSink>>();
    EXPECT_CALL(*sink, write(_, _))
      .WillOnce(::testing::Throw(StoreError(ArchiveError::IO_ERROR, "disk full")));
    return sink;
  });

  const std::string body = build_multipart_body(boundary, {
    {"video", std::string("full.mp4"), make_binary_payload(5000)},
    {"video", std::string("never.mp4"), "unused"}
  });

  EXPECT_FALSE(request.feed(body.data(), body.size()));
  EXPECT_TRUE(request.failed());
  // Input after the failure is ignored
  EXPECT_FALSE(request.feed("more", 4));

  auto result = request.finish();
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ArchiveError::IO_ERROR);
  EXPECT_EQ(request.fields_completed(), 0u);
}

TEST_F(ArchiveHandlersTest, UploadOperationFieldSequence) {
  std::vector<std::string> opened;
  UploadOperation operation([&](const std::string& name) {
    opened.push_back(name);
    auto sink = std::make_unique<StrictMock<MockChunkSink>>();
    InSequence sequence;
    EXPECT_CALL(*sink, write(_, 3));
    EXPECT_CALL(*sink, close());
    return sink;
  });

  EXPECT_THROW(operation.append("abc", 3), StoreError);

  operation.begin_field(std::string("first.mp4"));
  EXPECT_THROW(operation.begin_field(std::string("overlap.mp4")), StoreError);
  operation.append("abc", 3);
  operation.end_field();

  try {
    operation.begin_field(std::string(""));
    FAIL() << "Empty file name should be refused";
  } catch (const StoreError& e) {
    EXPECT_EQ(e.kind(), ArchiveError::BAD_REQUEST);
  }

  EXPECT_EQ(operation.finish(), UPLOAD_SUCCESS_MESSAGE);
  EXPECT_EQ(operation.fields_completed(), 1u);
  EXPECT_EQ(opened, std::vector<std::string>{"first.mp4"});
}

//==============================================
// CONCURRENCY
//==============================================

TEST_F(ArchiveHandlersTest, ConcurrentDistinctUploads) {
  const std::size_t num_threads = 8;
  std::atomic<std::size_t> successes{0};
  std::vector<std::thread> threads;
  store->ensure_directory();

  for (std::size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, &successes]() {
      const std::string name = "upload_" + std::to_string(i) + ".mp4";
      const std::string payload = make_binary_payload(8000 + i * 100);
      auto result = upload({{"video", name, payload}}, 512);
      if (result.ok() && read_file(store->base_path() / name) == payload) {
        ++successes;
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successes, num_threads);
  EXPECT_EQ(sorted_listing().size(), num_threads);
}
