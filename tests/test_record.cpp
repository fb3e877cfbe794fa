#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ipc_error.hpp"
#include "protocol/record.hpp"
#include "protocol/utf8.hpp"
#include "scripted_stream.hpp"

using namespace ipc_protocol;
using neutral_ipc::ErrorCode;
using neutral_ipc::IpcError;

TEST(RecordCodecTest, EncodesHeaderFieldsInWireOrder) {
  const HeaderBytes hdr = encode_header(kCtrlParseTemplate, kContentJson,
                                        0x01020304u, kContentText, 5);

  const HeaderBytes expected = {0x00, 10,   10,   0x01, 0x02, 0x03,
                                0x04, 30,   0x00, 0x00, 0x00, 0x05};
  EXPECT_EQ(hdr, expected);
}

TEST(RecordCodecTest, HeaderRoundTripKeepsAllFields) {
  struct Case {
    uint8_t control;
    uint8_t format1;
    uint32_t length1;
    uint8_t format2;
    uint32_t length2;
  };
  const std::vector<Case> cases = {
      {0, 0, 0, 0, 0},
      {kCtrlStatusOk, kContentJson, 2, kContentText, 5},
      {kCtrlStatusKo, kContentPath, 0xFFFFFFFFu, kContentBin, 0},
      {0xFF, 0xFE, 0x80000000u, 0xFD, 0x00FF00FFu},
  };

  for (const auto &c : cases) {
    const HeaderBytes bytes =
        encode_header(c.control, c.format1, c.length1, c.format2, c.length2);
    const Header h = decode_header(bytes.data(), bytes.size());

    EXPECT_EQ(h.reserved, kReserved);
    EXPECT_EQ(h.control, c.control);
    EXPECT_EQ(h.format1, c.format1);
    EXPECT_EQ(h.length1, c.length1);
    EXPECT_EQ(h.format2, c.format2);
    EXPECT_EQ(h.length2, c.length2);
  }
}

TEST(RecordCodecTest, EncodeRecordLengthsMatchContent) {
  const std::string c1 = "{\"data\":{\"text\":\"Hello!\"}}";
  const std::string c2 = std::string("bin\0ary", 7);

  const Bytes record = encode_record(kCtrlParseTemplate, kContentJson, c1,
                                     kContentBin, c2);

  ASSERT_EQ(record.size(), kHeaderLen + c1.size() + c2.size());

  const Header h = decode_header(record.data(), kHeaderLen);
  EXPECT_EQ(h.length1, c1.size());
  EXPECT_EQ(h.length2, c2.size());

  const std::string body = to_string(record).substr(kHeaderLen);
  EXPECT_EQ(body, c1 + c2);
}

TEST(RecordCodecTest, EncodeRecordWithEmptyBlocks) {
  const Bytes record = encode_record(kCtrlParseTemplate, kContentJson, "",
                                     kContentText, "");

  ASSERT_EQ(record.size(), kHeaderLen);
  const Header h = decode_header(record);
  EXPECT_EQ(h.length1, 0u);
  EXPECT_EQ(h.length2, 0u);
}

TEST(RecordCodecTest, DecodeHeaderRejectsWrongLength) {
  const std::vector<uint8_t> big(64, 0);

  for (size_t len = 0; len <= big.size(); ++len) {
    if (len == kHeaderLen) {
      EXPECT_NO_THROW(decode_header(big.data(), len));
      continue;
    }
    try {
      decode_header(big.data(), len);
      ADD_FAILURE() << "no error for header length " << len;
    } catch (const IpcError &e) {
      EXPECT_EQ(e.code(), ErrorCode::InvalidHeaderLength) << "length " << len;
    }
  }
}

TEST(RecordCodecTest, DecodeHeaderPassesUnknownCodesThrough) {
  HeaderBytes bytes = encode_header(77, 99, 1, 123, 2);
  bytes[0] = 0x5A; // reserved is recorded, not validated

  const Header h = decode_header(bytes.data(), bytes.size());
  EXPECT_EQ(h.reserved, 0x5A);
  EXPECT_EQ(h.control, 77);
  EXPECT_EQ(h.format1, 99);
  EXPECT_EQ(h.format2, 123);
}

TEST(RecordCodecTest, DecodeRecordNormalizesReserved) {
  HeaderBytes bytes = encode_header(kCtrlStatusOk, kContentJson, 2,
                                    kContentText, 5);
  bytes[0] = 0x07;

  const Record r = decode_record(bytes.data(), bytes.size(), "{}", "hello");
  EXPECT_EQ(r.reserved, kReserved);
  EXPECT_EQ(r.control, kCtrlStatusOk);
  EXPECT_EQ(r.format1, kContentJson);
  EXPECT_EQ(r.content1, "{}");
  EXPECT_EQ(r.format2, kContentText);
  EXPECT_EQ(r.content2, "hello");
}

TEST(RecordCodecTest, DecodeRecordValidatesHeaderLength) {
  const uint8_t short_header[5] = {0, 0, 10, 0, 0};
  try {
    decode_record(short_header, sizeof(short_header), "", "");
    FAIL() << "expected InvalidHeaderLength";
  } catch (const IpcError &e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidHeaderLength);
  }
}

TEST(Utf8Test, AcceptsValidText) {
  EXPECT_TRUE(is_valid_utf8(""));
  EXPECT_TRUE(is_valid_utf8("plain ascii"));
  EXPECT_TRUE(is_valid_utf8("caf\xC3\xA9"));               // é
  EXPECT_TRUE(is_valid_utf8("\xE2\x82\xAC"));              // €
  EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x98\x80"));          // U+1F600
  EXPECT_TRUE(is_valid_utf8("\xF4\x8F\xBF\xBF"));          // U+10FFFF
  EXPECT_TRUE(is_valid_utf8(std::string("nul\0inside", 10)));
}

TEST(Utf8Test, RejectsMalformedSequences) {
  EXPECT_FALSE(is_valid_utf8("\xC3\x28"));         // bad continuation
  EXPECT_FALSE(is_valid_utf8("\x80"));             // lone continuation
  EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));         // overlong '/'
  EXPECT_FALSE(is_valid_utf8("\xE0\x80\xAF"));     // overlong 3-byte
  EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));     // surrogate U+D800
  EXPECT_FALSE(is_valid_utf8("\xF4\x90\x80\x80")); // above U+10FFFF
  EXPECT_FALSE(is_valid_utf8("\xF8\x88\x80\x80\x80"));
  EXPECT_FALSE(is_valid_utf8("abc\xE2\x82"));      // truncated at end
}
