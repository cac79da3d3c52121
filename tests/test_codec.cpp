#include <chunkingest/codec.hpp>
#include <chunkingest/errors.hpp>
#include <gtest/gtest.h>

using namespace chunkingest;
using json = RecordJson;

TEST(Md5, KnownDigests) {
  EXPECT_EQ(md5_hex(""), "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(md5_hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(Gzip, RoundTripAndHeader) {
  const std::string raw = "{\"a\":1}\n{\"b\":2}\n";
  const auto gz = gzip_compress(raw);
  ASSERT_GE(gz.size(), 10u);
  EXPECT_EQ(static_cast<unsigned char>(gz[0]), 0x1f);
  EXPECT_EQ(static_cast<unsigned char>(gz[1]), 0x8b);
  EXPECT_EQ(gzip_decompress(gz, 1 << 20), raw);
}

TEST(Gzip, SameInputSameBytes) {
  const std::string raw(5000, 'x');
  EXPECT_EQ(gzip_compress(raw), gzip_compress(raw));
}

TEST(Gzip, DecompressLimit) {
  const std::string raw(10000, 'y');
  EXPECT_THROW(gzip_decompress(gzip_compress(raw), 100), SizeLimitExceeded);
}

TEST(Gzip, GarbageIsParseError) {
  EXPECT_THROW(gzip_decompress("definitely not gzip", 1 << 20), ParseError);
}

TEST(Ndjson, EncodeKeepsKeyOrderOneLineEach) {
  std::vector<json> recs{json{{"value", 0.1}, {"metric", "cpu"}},
                         json{{"metric", "mem"}, {"value", 2}}};
  EXPECT_EQ(encode_ndjson(recs),
            "{\"value\":0.1,\"metric\":\"cpu\"}\n{\"metric\":\"mem\",\"value\":2}\n");
  EXPECT_EQ(encode_ndjson({}), "");
}

TEST(Ndjson, DecodeSkipsBlankLines) {
  const auto recs = decode_ndjson("{\"a\":1}\n\n  \r\n{\"a\":2}", false, 1 << 20);
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[1]["a"], 2);
}

TEST(Ndjson, DecodeGzipStream) {
  const auto body = gzip_compress("{\"a\":1}\n{\"a\":2}\n{\"a\":3}\n");
  const auto recs = decode_ndjson(body, true, 1 << 20);
  ASSERT_EQ(recs.size(), 3u);
  EXPECT_EQ(recs[2]["a"], 3);
}

TEST(Ndjson, BadLineNamesLineNumber) {
  try {
    decode_ndjson("{\"a\":1}\n{\"a\":\n{\"a\":3}\n", false, 1 << 20);
    FAIL() << "expected ParseError";
  } catch (const ParseError &e) {
    EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos) << e.what();
  }
}

TEST(Ndjson, NonObjectLineRejected) {
  EXPECT_THROW(decode_ndjson("{\"a\":1}\n[1,2]\n", false, 1 << 20), ParseError);
  EXPECT_THROW(decode_ndjson("42\n", false, 1 << 20), ParseError);
}

TEST(Ndjson, DecodedSizeLimit) {
  std::string body;
  for (int i = 0; i < 100; ++i)
    body += "{\"i\":" + std::to_string(i) + "}\n";
  EXPECT_THROW(decode_ndjson(body, false, 64), SizeLimitExceeded);
  EXPECT_THROW(decode_ndjson(gzip_compress(body), true, 64), SizeLimitExceeded);
}

TEST(Ndjson, DecodeKeepsKeyOrder) {
  const auto recs = decode_ndjson("{\"z\":1,\"a\":2,\"m\":3}\n", false, 1 << 20);
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].dump(), "{\"z\":1,\"a\":2,\"m\":3}");
}

TEST(Ndjson, GzipLongLineStopsAtLimit) {
  // 8 МиБ без единого '\n' сжимаются в несколько КиБ
  const auto bomb = gzip_compress(std::string(8u << 20, 'a'));
  ASSERT_LT(bomb.size(), 64u * 1024);
  EXPECT_THROW(decode_ndjson(bomb, true, 1024), SizeLimitExceeded);
  // лимит срабатывает и без сжатия, если строка не закончена
  EXPECT_THROW(decode_ndjson(std::string(200 * 1024, 'a'), false, 1024),
               SizeLimitExceeded);
}

TEST(Ndjson, LastLineWithoutNewline) {
  const auto recs = decode_ndjson(gzip_compress("{\"a\":1}\n{\"a\":2}"), true, 1 << 20);
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[1]["a"], 2);
}

TEST(Ndjson, NotGzipWhenFlaggedIsParseError) {
  EXPECT_THROW(decode_ndjson("{\"a\":1}\n", true, 1 << 20), ParseError);
}
