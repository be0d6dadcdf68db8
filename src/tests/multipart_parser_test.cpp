#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "http/multipart_parser.hpp"
#include "test_utils.hpp"

using namespace archiver::http;

namespace {

struct CollectedPart {
  MultipartPart headers;
  std::string content;
  std::size_t data_calls{0};
  bool ended{false};
};

// Records every callback the parser makes
class PartCollector {
public:
  std::vector<CollectedPart> parts;

  std::unique_ptr<MultipartParser> make_parser(const std::string& boundary) {
    return std::make_unique<MultipartParser>(
      boundary,
      [this](const MultipartPart& part) { parts.push_back(CollectedPart{part, "", 0, false}); },
      [this](const char* data, std::size_t size) {
        parts.back().content.append(data, size);
        ++parts.back().data_calls;
      },
      [this]() { parts.back().ended = true; });
  }
};

void feed_in_pieces(MultipartParser& parser, const std::string& body, std::size_t piece) {
  for (std::size_t offset = 0; offset < body.size(); offset += piece) {
    const std::size_t size = std::min(piece, body.size() - offset);
    parser.feed(body.data() + offset, size);
  }
}

} // namespace

class MultipartParserTest : public ::testing::Test {
protected:
  const std::string boundary = "----ArchiverBoundary7MA4YWxkTrZu0gW";

  void SetUp() override {
    init_test_logging();
  }
};

TEST_F(MultipartParserTest, SingleField) {
  const std::string body = build_multipart_body(boundary, {{"file", std::string("clip.mp4"), "hello video"}});

  PartCollector collector;
  auto parser = collector.make_parser(boundary);
  parser->feed(body.data(), body.size());
  ASSERT_NO_THROW(parser->finish());

  ASSERT_EQ(collector.parts.size(), 1u);
  EXPECT_EQ(collector.parts[0].headers.name, "file");
  ASSERT_TRUE(collector.parts[0].headers.filename.has_value());
  EXPECT_EQ(*collector.parts[0].headers.filename, "clip.mp4");
  EXPECT_EQ(collector.parts[0].headers.content_type, "application/octet-stream");
  EXPECT_EQ(collector.parts[0].content, "hello video");
  EXPECT_TRUE(collector.parts[0].ended);
  EXPECT_TRUE(parser->done());
  EXPECT_EQ(parser->parts_seen(), 1u);
}

TEST_F(MultipartParserTest, MultipleFieldsInOrder) {
  const std::string body = build_multipart_body(boundary, {
    {"first", std::string("a.mp4"), "AAAA"},
    {"second", std::string("b.mp4"), make_binary_payload(5000)},
    {"third", std::string("c.mp4"), ""}
  });

  PartCollector collector;
  auto parser = collector.make_parser(boundary);
  parser->feed(body.data(), body.size());
  parser->finish();

  ASSERT_EQ(collector.parts.size(), 3u);
  EXPECT_EQ(*collector.parts[0].headers.filename, "a.mp4");
  EXPECT_EQ(collector.parts[0].content, "AAAA");
  EXPECT_EQ(*collector.parts[1].headers.filename, "b.mp4");
  EXPECT_EQ(collector.parts[1].content, make_binary_payload(5000));
  EXPECT_EQ(*collector.parts[2].headers.filename, "c.mp4");
  EXPECT_EQ(collector.parts[2].content, "");
  EXPECT_EQ(collector.parts[2].data_calls, 0u);
  for (const auto& part : collector.parts) {
    EXPECT_TRUE(part.ended);
  }
}

TEST_F(MultipartParserTest, ResultIndependentOfFragmentation) {
  const std::vector<TestField> fields = {
    {"video", std::string("movie.mp4"), make_binary_payload(3000)},
    {"video", std::string("trailer.mp4"), "\r\n--not-the-boundary\r\n"}
  };
  const std::string body = "preamble text\r\n" + build_multipart_body(boundary, fields) + "epilogue";

  for (std::size_t piece : {std::size_t{1}, std::size_t{2}, std::size_t{7}, std::size_t{64},
                            std::size_t{1000}, body.size()}) {
    PartCollector collector;
    auto parser = collector.make_parser(boundary);
    feed_in_pieces(*parser, body, piece);
    ASSERT_NO_THROW(parser->finish()) << "piece size " << piece;

    ASSERT_EQ(collector.parts.size(), 2u) << "piece size " << piece;
    EXPECT_EQ(collector.parts[0].content, fields[0].content) << "piece size " << piece;
    EXPECT_EQ(collector.parts[1].content, fields[1].content) << "piece size " << piece;
    EXPECT_EQ(*collector.parts[1].headers.filename, "trailer.mp4");
  }
}

TEST_F(MultipartParserTest, ContentIsStreamedBeforeDelimiter) {
  const std::string content = make_binary_payload(10000);
  const std::string body = build_multipart_body(boundary, {{"file", std::string("big.mp4"), content}});

  PartCollector collector;
  auto parser = collector.make_parser(boundary);
  // Stop before the closing delimiter arrives
  const std::size_t cut = body.size() - boundary.size() - 10;
  parser->feed(body.data(), cut);

  ASSERT_EQ(collector.parts.size(), 1u);
  EXPECT_FALSE(collector.parts[0].ended);
  EXPECT_GE(collector.parts[0].content.size(), content.size() - (boundary.size() + 8));
  EXPECT_EQ(collector.parts[0].content, content.substr(0, collector.parts[0].content.size()));

  parser->feed(body.data() + cut, body.size() - cut);
  parser->finish();
  EXPECT_EQ(collector.parts[0].content, content);
}

TEST_F(MultipartParserTest, MissingFilenameIsReported) {
  const std::string body = build_multipart_body(boundary, {{"comment", std::nullopt, "just text"}});

  PartCollector collector;
  auto parser = collector.make_parser(boundary);
  parser->feed(body.data(), body.size());

  ASSERT_EQ(collector.parts.size(), 1u);
  EXPECT_EQ(collector.parts[0].headers.name, "comment");
  EXPECT_FALSE(collector.parts[0].headers.filename.has_value());
}

TEST_F(MultipartParserTest, QuotedAndEscapedParameters) {
  const std::string body =
    "--" + boundary + "\r\n"
    "content-disposition: form-data; NAME=\"file\"; filename=\"my \\\"best\\\"; clip.mp4\"\r\n"
    "\r\n"
    "data\r\n"
    "--" + boundary + "--\r\n";

  PartCollector collector;
  auto parser = collector.make_parser(boundary);
  parser->feed(body.data(), body.size());
  parser->finish();

  ASSERT_EQ(collector.parts.size(), 1u);
  EXPECT_EQ(collector.parts[0].headers.name, "file");
  EXPECT_EQ(*collector.parts[0].headers.filename, "my \"best\"; clip.mp4");
  EXPECT_EQ(collector.parts[0].content, "data");
}

TEST_F(MultipartParserTest, PartWithoutHeaders) {
  const std::string body = "--" + boundary + "\r\n\r\nraw\r\n--" + boundary + "--";

  PartCollector collector;
  auto parser = collector.make_parser(boundary);
  parser->feed(body.data(), body.size());
  parser->finish();

  ASSERT_EQ(collector.parts.size(), 1u);
  EXPECT_FALSE(collector.parts[0].headers.filename.has_value());
  EXPECT_EQ(collector.parts[0].content, "raw");
}

TEST_F(MultipartParserTest, EmptyFormHasNoParts) {
  const std::string body = "--" + boundary + "--\r\n";

  PartCollector collector;
  auto parser = collector.make_parser(boundary);
  parser->feed(body.data(), body.size());
  EXPECT_NO_THROW(parser->finish());
  EXPECT_TRUE(collector.parts.empty());
}

TEST_F(MultipartParserTest, TruncatedBodyFailsOnFinish) {
  const std::string body = build_multipart_body(boundary, {{"file", std::string("clip.mp4"), "content"}});

  PartCollector collector;
  auto parser = collector.make_parser(boundary);
  parser->feed(body.data(), body.size() / 2);
  EXPECT_FALSE(parser->done());
  EXPECT_THROW(parser->finish(), MultipartError);
}

TEST_F(MultipartParserTest, MalformedInput) {
  PartCollector collector;

  // Garbage directly after a delimiter
  {
    auto parser = collector.make_parser(boundary);
    const std::string body = "--" + boundary + "XX\r\n";
    EXPECT_THROW(parser->feed(body.data(), body.size()), MultipartError);
  }

  // Header line without a colon
  {
    auto parser = collector.make_parser(boundary);
    const std::string body = "--" + boundary + "\r\nbroken header\r\n\r\ndata";
    EXPECT_THROW(parser->feed(body.data(), body.size()), MultipartError);
  }

  // Headers that never end
  {
    auto parser = collector.make_parser(boundary);
    const std::string body = "--" + boundary + "\r\nX-Long: " +
                             std::string(MultipartParser::MAX_HEADER_BYTES + 10, 'h');
    EXPECT_THROW(parser->feed(body.data(), body.size()), MultipartError);
  }

  EXPECT_THROW(collector.make_parser(""), MultipartError);
  EXPECT_THROW(collector.make_parser(std::string(71, 'b')), MultipartError);
}

TEST_F(MultipartParserTest, CallbackExceptionsPropagate) {
  const std::string body = build_multipart_body(boundary, {{"file", std::string("clip.mp4"), "data"}});

  MultipartParser parser(
    boundary,
    [](const MultipartPart&) { throw std::runtime_error("rejected"); },
    [](const char*, std::size_t) {},
    []() {});
  EXPECT_THROW(parser.feed(body.data(), body.size()), std::runtime_error);
}

TEST_F(MultipartParserTest, ExtractBoundary) {
  EXPECT_EQ(MultipartParser::extract_boundary("multipart/form-data; boundary=abc123"),
            std::optional<std::string>("abc123"));
  EXPECT_EQ(MultipartParser::extract_boundary("Multipart/Form-Data; charset=utf-8; BOUNDARY=\"a b;c\""),
            std::optional<std::string>("a b;c"));
  EXPECT_EQ(MultipartParser::extract_boundary("multipart/form-data;boundary=x"),
            std::optional<std::string>("x"));

  EXPECT_FALSE(MultipartParser::extract_boundary("application/json").has_value());
  EXPECT_FALSE(MultipartParser::extract_boundary("multipart/form-data").has_value());
  EXPECT_FALSE(MultipartParser::extract_boundary("multipart/form-data; boundary=").has_value());
  EXPECT_FALSE(MultipartParser::extract_boundary("multipart/mixed; boundary=abc").has_value());
  EXPECT_FALSE(MultipartParser::extract_boundary("").has_value());
}
