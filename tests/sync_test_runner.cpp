#include "chain.hpp"
#include "chain_writer.hpp"
#include "errors.hpp"
#include "increment_file.hpp"
#include "protocol.hpp"
#include "remote_process.hpp"
#include "restore.hpp"
#include "source_stream.hpp"
#include "sync_driver.hpp"
#include "test_runner_utils.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

using namespace blocksync::test;

namespace {

SyncOptions options_with_block_size(uint64_t block_size) {
  SyncOptions options;
  options.block_size = block_size;
  options.comment = "test session";
  return options;
}

std::vector<std::pair<uint64_t, BlockHash>> records_of(const std::filesystem::path& increment, uint64_t block_size,
                                                      uint64_t device_size) {
  std::vector<std::pair<uint64_t, BlockHash>> out;
  ChainCursor cursor(increment, 0);
  while(!cursor.exhausted()) {
    Block block;
    const auto offset = cursor.peek_offset();
    cursor.take_record(block_length_at(offset, device_size, block_size), block);
    out.emplace_back(block.offset, block.hash);
  }
  return out;
}

std::string restored(const std::filesystem::path& increment) {
  std::ostringstream out;
  restore_chain(increment, out);
  return out.str();
}

bool test_single_changed_block(TestContext& ctx) {
  TempWorkspace ws("single_change");
  auto source = ws / "source";
  auto base = ws / "img";
  write_file(source, "AAAABBBBCCCC");
  write_file(base, "AAAAXXXXCCCC");

  auto logger = std::make_shared<Logger>("session");
  ctx.logs.attach(logger);
  auto outcome = run_local_session(source, base, options_with_block_size(4), logger);
  bool ok = expect(outcome.ok(), outcome.errors());
  ok &= expect(outcome.result.same_blocks == 2 && outcome.result.diff_blocks == 1, "2 same, 1 different");
  ok &= expect(outcome.source_stats.sent_blocks == 1, "one payload sent");
  ok &= expect(outcome.writer_stats.increment == increment_path(base, 0), "first increment created");

  auto records = records_of(increment_path(base, 0), 4, 12);
  ok &= expect(records.size() == 1, "one record");
  ok &= expect(!records.empty() && records[0].first == 4 && records[0].second == hash_of("BBBB"),
               "record for offset 4 with the source hash");
  ok &= expect(read_file(base) == "AAAAXXXXCCCC", "base image never written");
  ok &= expect(restored(increment_path(base, 0)) == "AAAABBBBCCCC", "restore yields the source");

  auto header = read_increment_header(increment_path(base, 0));
  ok &= expect(header.comment == "test session", "comment stored");
  ok &= expect(header.source_identifier == "test-id", "identifier stored");
  ok &= expect(header.source_path == source.string(), "source path stored");
  ok &= expect(header.source_size_bytes == 12, "source size stored");
  return ok;
}

bool test_unchanged_source_adds_empty_increment(TestContext&) {
  TempWorkspace ws("unchanged");
  auto source = ws / "source";
  auto base = ws / "img";
  write_file(source, "AAAABBBBCCCC");
  write_file(base, "AAAAXXXXCCCC");

  auto first = run_local_session(source, base, options_with_block_size(4));
  auto second = run_local_session(source, base, options_with_block_size(4));
  bool ok = expect(first.ok() && second.ok(), first.errors() + " / " + second.errors());
  ok &= expect(second.result.diff_blocks == 0 && second.result.same_blocks == 3, "nothing differs");
  ok &= expect(std::filesystem::exists(increment_path(base, 1)), "second increment exists");
  ok &= expect(records_of(increment_path(base, 1), 4, 12).empty(), "header-only increment");
  ok &= expect(restored(increment_path(base, 1)) == "AAAABBBBCCCC", "still restores the source");
  return ok;
}

bool test_sessions_build_restorable_history(TestContext&) {
  TempWorkspace ws("history");
  auto source = ws / "source";
  auto base = ws / "img";
  // 23 bytes at block size 5: the last block is 3 bytes
  const std::vector<std::string> versions = {
    "abcdefghijklmnopqrstuvw",
    "abcdeFGHIJklmnopqrstuvw",
    "abcdeFGHIJklmnopqrstuXY",
    "0bcdeFGHIJklmnopqrstuXY"
  };
  write_file(base, versions[0]);
  bool ok = true;
  for(std::size_t i = 1; i < versions.size(); ++i) {
    write_file(source, versions[i]);
    auto outcome = run_local_session(source, base, options_with_block_size(5));
    ok &= expect(outcome.ok(), outcome.errors());
    ok &= expect(outcome.result.diff_blocks == 1, "exactly one block per session");
  }
  for(std::size_t i = 1; i < versions.size(); ++i) {
    ok &= expect(restored(increment_path(base, static_cast<unsigned>(i - 1))) == versions[i],
                 "restore as of session " + std::to_string(i));
  }
  auto tail = records_of(increment_path(base, 1), 5, 23);
  ok &= expect(tail.size() == 1 && tail[0].first == 20 && tail[0].second == hash_of("uXY"),
               "short final block hashed over its own length");
  ok &= expect(read_file(base) == versions[0], "base image untouched");
  return ok;
}

bool test_source_stream_wire_format(TestContext&) {
  TempWorkspace ws("source_wire");
  auto device = ws / "device";
  write_file(device, "AAAABB");

  MemoryChannel peer(make_source_request(SourceRequest{4}).dump() + "\n", "driver");
  peer.append_input(hash_of("AAAA"));
  peer.append_input(hash_of("zz"));
  SourceStream stream(device, peer, nullptr, [](const std::filesystem::path&){ return std::string("UUID=1"); });
  auto stats = stream.run();

  SourceReply reply;
  reply.identifier = "UUID=1";
  reply.size = 6;
  std::string expected = make_source_reply(reply).dump() + "\n" +
                         hash_bytes(hash_of("AAAA")) + hash_bytes(hash_of("BB")) + "BB";
  bool ok = expect(peer.output() == expected, "reply, both hashes, only the changed payload");
  ok &= expect(stats.blocks == 2 && stats.sent_blocks == 1 && stats.bytes_read == 6, "stats");
  ok &= expect(peer.unread() == 0, "all peer input consumed");
  return ok;
}

bool test_driver_rejects_source_version(TestContext&) {
  SourceReply reply;
  reply.size = 8;
  reply.protocol_version = "0.9";
  MemoryChannel source(make_source_reply(reply).dump() + "\n", "source");
  MemoryChannel destination("", "destination");
  SyncDriver driver(source, destination, options_with_block_size(4));
  bool ok = expect_throws<VersionMismatch>([&]{ driver.run(); }, "old source");
  ok &= expect(destination.output().empty(), "destination never contacted");
  return ok;
}

bool test_driver_rejects_destination_version(TestContext&) {
  SourceReply source_reply;
  source_reply.size = 8;
  MemoryChannel source(make_source_reply(source_reply).dump() + "\n", "source");
  WriterReply writer_reply;
  writer_reply.protocol_version = "2.0";
  MemoryChannel destination(make_writer_reply(writer_reply).dump() + "\n", "destination");
  SyncDriver driver(source, destination, options_with_block_size(4));
  return expect_throws<VersionMismatch>([&]{ driver.run(); }, "newer destination");
}

bool test_full_chain_is_refused(TestContext&) {
  TempWorkspace ws("full_chain");
  auto source = ws / "source";
  auto base = ws / "img";
  write_file(source, "AAAABBBB");
  write_file(base, "AAAABBBB");
  IncrementHeader header;
  header.block_size = 4;
  const auto line = encode_header_line(header);
  for(unsigned i = 0; i < kMaxIncrements; ++i) {
    write_file(increment_path(base, i), line);
  }

  MemoryChannel silent("", "driver");
  bool ok = expect_throws<ChainIntegrityError>([&]{ ChainWriter writer(base, silent); }, "constructor refuses");
  ok &= expect(silent.output().empty(), "nothing exchanged with the peer");

  auto outcome = run_local_session(source, base, options_with_block_size(4));
  ok &= expect(holds_error<ChainIntegrityError>(outcome.driver_error), "driver reports chain error: " + outcome.errors());
  ok &= expect(holds_error<ChainIntegrityError>(outcome.writer_error), "writer failed the same way");
  ok &= expect(!std::filesystem::exists(base.string() + ".iimg1000"), "no increment beyond the cap");
  return ok;
}

bool test_size_mismatch_is_refused(TestContext&) {
  TempWorkspace ws("size_mismatch");
  auto source = ws / "source";
  auto base = ws / "img";
  write_file(source, "AAAABBBBCC");
  write_file(base, "AAAABBBB");
  auto outcome = run_local_session(source, base, options_with_block_size(4));
  bool ok = expect(holds_error<ChainIntegrityError>(outcome.driver_error), "driver: " + outcome.errors());
  ok &= expect(!std::filesystem::exists(increment_path(base, 0)), "no increment created");
  return ok;
}

bool test_block_size_mismatch_is_refused(TestContext&) {
  TempWorkspace ws("block_size_mismatch");
  auto source = ws / "source";
  auto base = ws / "img";
  write_file(source, "AAAABBBB");
  write_file(base, "AAAABBBB");
  write_increment(increment_path(base, 0), 2, {});
  auto outcome = run_local_session(source, base, options_with_block_size(4));
  bool ok = expect(holds_error<ChainIntegrityError>(outcome.driver_error), "driver: " + outcome.errors());
  ok &= expect(!std::filesystem::exists(increment_path(base, 1)), "chain left as it was");
  return ok;
}

bool test_writer_detects_peer_death(TestContext&) {
  TempWorkspace ws("writer_peer_death");
  auto base = ws / "img";
  write_file(base, "AAAABBBB");
  WriterRequest request;
  request.block_size = 4;
  request.source_size_bytes = 8;
  MemoryChannel peer(make_writer_request(request).dump() + "\n", "driver");
  peer.append_input(hash_of("AAAA"));
  ChainWriter writer(base, peer);
  bool ok = expect_throws<PeerDied>([&]{ writer.run(); }, "stream stops mid-session");
  ok &= expect(peer.output().find("\"protocol_version\"") != std::string::npos, "accepted before dying");
  return ok;
}

bool test_driver_detects_peer_death(TestContext&) {
  SourceReply source_reply;
  source_reply.size = 8;
  MemoryChannel source(make_source_reply(source_reply).dump() + "\n", "source");
  source.append_input(hash_of("AAAA"));
  MemoryChannel destination(make_writer_reply(WriterReply{}).dump() + "\n", "destination");
  destination.append_input(hash_of("AAAA"));
  SyncDriver driver(source, destination, options_with_block_size(4));
  try {
    driver.run();
  } catch(const PeerDied& e) {
    return expect(std::string(e.what()).find("destination") != std::string::npos, "names the dead peer");
  }
  return expect(false, "PeerDied thrown");
}

bool test_writer_stores_sender_hash_as_received(TestContext&) {
  TempWorkspace ws("trusted_hash");
  auto base = ws / "img";
  write_file(base, "AAAA");
  WriterRequest request;
  request.block_size = 4;
  request.source_size_bytes = 4;
  MemoryChannel peer(make_writer_request(request).dump() + "\n", "driver");
  peer.append_input(hash_of("ZZZZ"));
  peer.append_input(std::string("QQQQ"));
  ChainWriter writer(base, peer);
  auto stats = writer.run();

  auto records = records_of(increment_path(base, 0), 4, 4);
  bool ok = expect(stats.changed_blocks == 1, "one block rewritten");
  ok &= expect(records.size() == 1 && records[0].second == hash_of("ZZZZ"), "claimed hash kept");
  ok &= expect(restored(increment_path(base, 0)) == "QQQQ", "payload kept verbatim");
  return ok;
}

bool test_progress_reports_final_block(TestContext&) {
  TempWorkspace ws("progress");
  auto source = ws / "source";
  auto base = ws / "img";
  write_file(source, std::string(64, 'a'));
  write_file(base, std::string(32, 'a') + std::string(32, 'b'));

  std::vector<SyncProgress> reports;
  auto options = options_with_block_size(8);
  options.progress_interval = std::chrono::hours(1);
  options.progress = [&](const SyncProgress& progress){ reports.push_back(progress); };
  auto outcome = run_local_session(source, base, options);
  bool ok = expect(outcome.ok(), outcome.errors());
  ok &= expect(reports.size() == 1, "only the final report within the interval");
  if(!reports.empty()) {
    ok &= expect(reports.back().finished, "final report flagged");
    ok &= expect(reports.back().same_blocks == 4 && reports.back().diff_blocks == 4, "counts");
    ok &= expect(reports.back().processed_bytes == 64 && reports.back().total_bytes == 64, "bytes");
  }
  return ok;
}

bool test_remote_argv(TestContext&) {
  RemoteCommand local;
  local.mode = "send";
  local.path = "/dev/sda";
  bool ok = expect(build_remote_argv(local) == std::vector<std::string>({"blocksync-remote", "send", "/dev/sda"}),
                   "localhost runs directly");

  RemoteCommand remote;
  remote.host = "root@backup";
  remote.ssh_identity = "/home/me/.ssh/id_backup";
  remote.use_sudo = true;
  remote.mode = "receive";
  remote.path = "/srv/sda.img";
  remote.verbose = true;
  ok &= expect(build_remote_argv(remote) == std::vector<std::string>({
                 "ssh", "-i", "/home/me/.ssh/id_backup", "root@backup", "sudo",
                 "blocksync-remote", "receive", "/srv/sda.img", "--verbose"}),
               "ssh with identity and sudo");
  return ok;
}

bool test_run_capture(TestContext&) {
  bool ok = expect(run_capture({"echo", "  UUID=abc  "}) == "UUID=abc", "trimmed stdout");
  ok &= expect(run_capture({"/nonexistent/blocksync-missing"}).empty(), "missing program");
  ok &= expect(run_capture({"false"}).empty(), "failing program");
  return ok;
}

bool test_remote_process_exit(TestContext&) {
  RemoteProcess child({"true"}, "child");
  child.wait();
  return expect(child.exit_description() == "exited with status 0", child.exit_description());
}

} // namespace

int main(int argc, char** argv) {
  ignore_sigpipe();
  std::vector<TestCase> tests = {
    {"single_changed_block", test_single_changed_block},
    {"unchanged_source_adds_empty_increment", test_unchanged_source_adds_empty_increment},
    {"sessions_build_restorable_history", test_sessions_build_restorable_history},
    {"source_stream_wire_format", test_source_stream_wire_format},
    {"driver_rejects_source_version", test_driver_rejects_source_version},
    {"driver_rejects_destination_version", test_driver_rejects_destination_version},
    {"full_chain_is_refused", test_full_chain_is_refused},
    {"size_mismatch_is_refused", test_size_mismatch_is_refused},
    {"block_size_mismatch_is_refused", test_block_size_mismatch_is_refused},
    {"writer_detects_peer_death", test_writer_detects_peer_death},
    {"driver_detects_peer_death", test_driver_detects_peer_death},
    {"writer_stores_sender_hash_as_received", test_writer_stores_sender_hash_as_received},
    {"progress_reports_final_block", test_progress_reports_final_block},
    {"remote_argv", test_remote_argv},
    {"run_capture", test_run_capture},
    {"remote_process_exit", test_remote_process_exit}
  };
  return run_test_cases("sync", tests, argc, argv);
}
