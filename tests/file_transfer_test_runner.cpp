#include "file_transfer.hpp"
#include "test_runner_utils.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <vector>

namespace {

using libreconnect::test::TestCase;
using libreconnect::test::TestContext;
using libreconnect::test::expect;
using libreconnect::test::expect_eq;

const DeviceId kSender = "127.0.0.1:50001";

std::vector<uint8_t> bytes_of(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

std::string patterned(std::size_t size) {
  std::string out(size, '\0');
  for(std::size_t i = 0; i < size; ++i) out[i] = static_cast<char>((i * 31 + 7) % 251);
  return out;
}

bool no_reply(const std::optional<Message>& reply) {
  return !reply.has_value();
}

bool test_sanitize_file_name(TestContext&) {
  if(!expect(FileTransferHandler::sanitize_file_name("../../etc/passwd") == std::string("passwd"), "directories stripped")) return false;
  if(!expect(FileTransferHandler::sanitize_file_name("/abs/report.pdf") == std::string("report.pdf"), "absolute path stripped")) return false;
  if(!expect(!FileTransferHandler::sanitize_file_name(""), "empty name")) return false;
  if(!expect(!FileTransferHandler::sanitize_file_name(".."), "parent directory")) return false;
  return expect(!FileTransferHandler::sanitize_file_name("dir/"), "trailing separator leaves no name");
}

bool test_sequential_transfer(TestContext& ctx) {
  auto dir = libreconnect::test::prepare_workspace("ft_sequential");
  FileTransferHandler handler(dir, ctx.logger);
  const std::string content = patterned(20000);

  if(!expect(no_reply(handler.handle(FileTransferRequest{"data.bin", content.size()}, kSender)), "request accepted silently")) return false;
  if(!expect(handler.has_session("data.bin"), "session open")) return false;
  for(std::size_t offset = 0; offset < content.size(); offset += kMaxChunkSize) {
    auto piece = content.substr(offset, kMaxChunkSize);
    if(!expect(no_reply(handler.handle(FileTransferChunk{"data.bin", bytes_of(piece), offset}, kSender)), "chunk written")) return false;
  }
  handler.handle(FileTransferEnd{"data.bin"}, kSender);
  if(!expect(!handler.has_session("data.bin"), "session closed")) return false;
  return expect(libreconnect::test::read_file(dir / "data.bin") == content, "file content matches");
}

bool test_permuted_chunks(TestContext& ctx) {
  auto dir = libreconnect::test::prepare_workspace("ft_permuted");
  FileTransferHandler handler(dir, ctx.logger);
  const std::size_t chunk = 1000;
  const std::string content = patterned(chunk * 9 + 123);

  std::vector<std::size_t> offsets;
  for(std::size_t offset = 0; offset < content.size(); offset += chunk) offsets.push_back(offset);
  std::mt19937 rng(1234);
  std::shuffle(offsets.begin(), offsets.end(), rng);

  handler.handle(FileTransferRequest{"shuffled.bin", content.size()}, kSender);
  for(auto offset : offsets) {
    handler.handle(FileTransferChunk{"shuffled.bin", bytes_of(content.substr(offset, chunk)), offset}, kSender);
  }
  handler.handle(FileTransferEnd{"shuffled.bin"}, kSender);
  if(!expect(libreconnect::test::read_file(dir / "shuffled.bin") == content, "out-of-order chunks land at their offsets")) return false;
  return expect(!ctx.logs.contains("were announced"), "no size mismatch reported");
}

bool test_overlapping_chunk_last_write_wins(TestContext& ctx) {
  auto dir = libreconnect::test::prepare_workspace("ft_overlap");
  FileTransferHandler handler(dir, ctx.logger);
  handler.handle(FileTransferRequest{"overlap.txt", 6}, kSender);
  handler.handle(FileTransferChunk{"overlap.txt", bytes_of("aaaaaa"), 0}, kSender);
  handler.handle(FileTransferChunk{"overlap.txt", bytes_of("bb"), 2}, kSender);
  handler.handle(FileTransferEnd{"overlap.txt"}, kSender);
  return expect_eq(libreconnect::test::read_file(dir / "overlap.txt"), std::string("aabbaa"), "later chunk overwrites");
}

bool test_size_mismatch_keeps_file(TestContext& ctx) {
  auto dir = libreconnect::test::prepare_workspace("ft_mismatch");
  FileTransferHandler handler(dir, ctx.logger);
  handler.handle(FileTransferRequest{"short.txt", 100}, kSender);
  handler.handle(FileTransferChunk{"short.txt", bytes_of("only ten b"), 0}, kSender);
  auto reply = handler.handle(FileTransferEnd{"short.txt"}, kSender);
  if(!expect(no_reply(reply), "end never replies")) return false;
  if(!expect(ctx.logs.contains("10 bytes, 100 were announced"), "mismatch logged")) return false;
  return expect_eq(libreconnect::test::read_file(dir / "short.txt"), std::string("only ten b"), "partial file kept");
}

bool test_error_removes_partial_file(TestContext& ctx) {
  auto dir = libreconnect::test::prepare_workspace("ft_error");
  FileTransferHandler handler(dir, ctx.logger);
  handler.handle(FileTransferRequest{"broken.bin", 4096}, kSender);
  handler.handle(FileTransferChunk{"broken.bin", bytes_of("partial"), 0}, kSender);
  if(!expect(std::filesystem::exists(dir / "broken.bin"), "partial file exists")) return false;

  auto reply = handler.handle(FileTransferError{"broken.bin", "sender cancelled"}, kSender);
  if(!expect(no_reply(reply), "error never replies")) return false;
  if(!expect(!handler.has_session("broken.bin"), "session dropped")) return false;
  if(!expect(!std::filesystem::exists(dir / "broken.bin"), "partial file removed")) return false;

  handler.handle(FileTransferChunk{"broken.bin", bytes_of("late"), 0}, kSender);
  return expect(!std::filesystem::exists(dir / "broken.bin"), "late chunk does not recreate the file");
}

bool test_invalid_name_rejected(TestContext& ctx) {
  auto dir = libreconnect::test::prepare_workspace("ft_invalid");
  FileTransferHandler handler(dir, ctx.logger);
  auto reply = handler.handle(FileTransferRequest{"..", 10}, kSender);
  auto* error = reply ? std::get_if<FileTransferError>(&*reply) : nullptr;
  if(!expect(error != nullptr, "invalid name answered with an error")) return false;
  if(!expect_eq(error->error, std::string(FileTransferHandler::kInvalidNameError), "error text")) return false;
  return expect_eq(handler.active_sessions(), std::size_t(0), "no session opened");
}

bool test_traversal_stays_in_download_dir(TestContext& ctx) {
  auto dir = libreconnect::test::prepare_workspace("ft_traversal");
  FileTransferHandler handler(dir / "downloads", ctx.logger);
  handler.handle(FileTransferRequest{"../escape.txt", 2}, kSender);
  handler.handle(FileTransferChunk{"../escape.txt", bytes_of("hi"), 0}, kSender);
  handler.handle(FileTransferEnd{"../escape.txt"}, kSender);
  if(!expect(!std::filesystem::exists(dir / "escape.txt"), "nothing written outside")) return false;
  return expect_eq(libreconnect::test::read_file(dir / "downloads" / "escape.txt"), std::string("hi"), "written inside");
}

bool test_unwritable_directory_reports_error(TestContext& ctx) {
  auto dir = libreconnect::test::prepare_workspace("ft_unwritable");
  // A regular file where the download directory should be.
  libreconnect::test::write_file(dir / "blocked", "x");
  FileTransferHandler handler(dir / "blocked", ctx.logger);
  auto reply = handler.handle(FileTransferRequest{"a.txt", 1}, kSender);
  auto* error = reply ? std::get_if<FileTransferError>(&*reply) : nullptr;
  if(!expect(error != nullptr, "creation failure answered")) return false;
  return expect(error->error.rfind("Failed to create file: ", 0) == 0, "error names the failure");
}

bool test_restart_replaces_session(TestContext& ctx) {
  auto dir = libreconnect::test::prepare_workspace("ft_restart");
  FileTransferHandler handler(dir, ctx.logger);
  handler.handle(FileTransferRequest{"again.txt", 5}, kSender);
  handler.handle(FileTransferChunk{"again.txt", bytes_of("first"), 0}, kSender);
  handler.handle(FileTransferRequest{"again.txt", 3}, kSender);
  handler.handle(FileTransferChunk{"again.txt", bytes_of("two"), 0}, kSender);
  handler.handle(FileTransferEnd{"again.txt"}, kSender);
  if(!expect_eq(handler.active_sessions(), std::size_t(0), "single session per name")) return false;
  return expect_eq(libreconnect::test::read_file(dir / "again.txt"), std::string("two"), "second request truncated the file");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"sanitize_file_name", test_sanitize_file_name},
    {"sequential_transfer", test_sequential_transfer},
    {"permuted_chunks", test_permuted_chunks},
    {"overlapping_chunk_last_write_wins", test_overlapping_chunk_last_write_wins},
    {"size_mismatch_keeps_file", test_size_mismatch_keeps_file},
    {"error_removes_partial_file", test_error_removes_partial_file},
    {"invalid_name_rejected", test_invalid_name_rejected},
    {"traversal_stays_in_download_dir", test_traversal_stays_in_download_dir},
    {"unwritable_directory_reports_error", test_unwritable_directory_reports_error},
    {"restart_replaces_session", test_restart_replaces_session}
  };
  return libreconnect::test::run_suite("file_transfer", tests, argc, argv);
}
