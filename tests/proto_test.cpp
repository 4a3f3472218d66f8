#include "test_config.h"

#include <cerrno>

#include "ipc/proto.hpp"

namespace vitrine::test {

TEST(ProtoTest, ReadRequestLayout)
{
  ipc::Request req;
  req.op = ipc::Op::read;
  req.seq = 7;
  req.target = "abc";
  req.offset = 0x0102030405060708ull;
  req.length = 16;

  std::vector<uint8_t> wire;
  ipc::encode_request(req, wire);
  ASSERT_EQ(wire.size(), ipc::REQUEST_HEAD + 1 + 3 + 8 + 4);
  EXPECT_EQ(wire[0], 2);
  EXPECT_EQ(wire[1], 7);
  EXPECT_EQ(wire[5], 3);
  EXPECT_EQ(wire[6], 'a');
  EXPECT_EQ(wire[9], 0x08);

  ipc::Request back;
  ASSERT_EQ(ipc::decode_request(wire.data(), wire.size(), back), 0);
  EXPECT_EQ(back.op, ipc::Op::read);
  EXPECT_EQ(back.seq, 7u);
  EXPECT_EQ(back.target, "abc");
  EXPECT_EQ(back.offset, req.offset);
  EXPECT_EQ(back.length, 16u);
}

TEST(ProtoTest, MalformedRequestsAreRejected)
{
  ipc::Request out;
  const uint8_t too_short[] = {1, 0, 0};
  EXPECT_EQ(ipc::decode_request(too_short, sizeof(too_short), out), -EBADMSG);

  const uint8_t bad_op[] = {9, 4, 0, 0, 0, 'x'};
  EXPECT_EQ(ipc::decode_request(bad_op, sizeof(bad_op), out), -EBADMSG);
  EXPECT_EQ(out.seq, 4u);

  const uint8_t empty_path[] = {1, 1, 0, 0, 0};
  EXPECT_EQ(ipc::decode_request(empty_path, sizeof(empty_path), out), -EBADMSG);

  const uint8_t nul_path[] = {1, 1, 0, 0, 0, 'a', 0, 'b'};
  EXPECT_EQ(ipc::decode_request(nul_path, sizeof(nul_path), out), -EBADMSG);

  // id_len says 5 but only 2 id bytes plus the integers follow
  const uint8_t bad_read[] = {2, 1, 0, 0, 0, 5, 'a', 'b', 0, 0, 0, 0, 0, 0, 0, 0, 1, 0, 0, 0};
  EXPECT_EQ(ipc::decode_request(bad_read, sizeof(bad_read), out), -EBADMSG);
}

TEST(ProtoTest, OpenResponseCarriesSizeAndId)
{
  ipc::Response r;
  r.op = ipc::Op::open;
  r.seq = 3;
  r.size = 10;
  r.text = "id-1";

  std::vector<uint8_t> head;
  ipc::encode_response_head(r, head);
  ASSERT_EQ(head.size(), ipc::RESPONSE_HEAD + 8 + 4);

  ipc::Response back;
  ASSERT_EQ(ipc::decode_response(head.data(), head.size(), ipc::Op::open, back), 0);
  EXPECT_EQ(back.status, ipc::Status::ok);
  EXPECT_EQ(back.seq, 3u);
  EXPECT_EQ(back.size, 10u);
  EXPECT_EQ(back.text, "id-1");
}

TEST(ProtoTest, ErrorResponseCarriesErrnoAndMessage)
{
  ipc::Response r;
  r.op = ipc::Op::read;
  r.status = ipc::Status::invalid_handle;
  r.err = EBADF;
  r.text = "Invalid file handle: x";
  r.data = bytes_of("ignored");

  std::vector<uint8_t> head;
  ipc::encode_response_head(r, head);

  ipc::Response back;
  ASSERT_EQ(ipc::decode_response(head.data(), head.size(), ipc::Op::read, back), 0);
  EXPECT_EQ(back.status, ipc::Status::invalid_handle);
  EXPECT_EQ(back.err, EBADF);
  EXPECT_EQ(back.text, "Invalid file handle: x");
  EXPECT_TRUE(back.data.empty());
}

TEST(ProtoTest, ClassifyDistinguishesFailureKinds)
{
  EXPECT_EQ(ipc::classify(ipc::Op::open, -ENOENT), ipc::Status::open_error);
  EXPECT_EQ(ipc::classify(ipc::Op::open, -EACCES), ipc::Status::open_error);
  EXPECT_EQ(ipc::classify(ipc::Op::read, -EBADF), ipc::Status::invalid_handle);
  EXPECT_EQ(ipc::classify(ipc::Op::read, -EOVERFLOW), ipc::Status::seek_error);
  EXPECT_EQ(ipc::classify(ipc::Op::read, -ENODATA), ipc::Status::read_error);
  EXPECT_EQ(ipc::classify(ipc::Op::read, -EIO), ipc::Status::read_error);
  EXPECT_EQ(ipc::classify(ipc::Op::read, 0), ipc::Status::ok);
  EXPECT_EQ(ipc::classify(ipc::Op::close, 0), ipc::Status::ok);
  EXPECT_STREQ(ipc::status_name(ipc::Status::seek_error), "seek_error");
}

TEST(ProtoTest, OutOfMemoryMapsPerOperation)
{
  EXPECT_EQ(ipc::classify(ipc::Op::open, -ENOMEM), ipc::Status::open_error);
  EXPECT_EQ(ipc::classify(ipc::Op::read, -ENOMEM), ipc::Status::read_error);
  EXPECT_EQ(ipc::classify(ipc::Op::close, -ENOMEM), ipc::Status::ok);

  // an error response with no message text still decodes
  ipc::Response r;
  r.op = ipc::Op::read;
  r.seq = 9;
  r.status = ipc::Status::read_error;
  r.err = ENOMEM;
  std::vector<uint8_t> head;
  ipc::encode_response_head(r, head);
  ipc::Response back;
  ASSERT_EQ(ipc::decode_response(head.data(), head.size(), ipc::Op::read, back), 0);
  EXPECT_EQ(back.err, ENOMEM);
  EXPECT_TRUE(back.text.empty());
}

}
