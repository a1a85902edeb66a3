#include "command_line_parser.hpp"
#include "content_directory.hpp"
#include "errors.hpp"
#include "indexer.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "share_service.hpp"
#include "swarm_node.hpp"
#include "test_runner_utils.hpp"
#include "tracker_service.hpp"
#include "tree_store.hpp"
#include "utils.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

using namespace treeswarm::test;
using namespace std::chrono_literals;

std::shared_ptr<SettingsManager> node_settings(const nlohmann::json& values) {
  auto settings = std::make_shared<SettingsManager>();
  for(const auto& item : values.items()) {
    std::string error;
    if(!settings->set_from_json(item.key(), item.value(), error)) {
      throw std::invalid_argument("bad test setting " + item.key() + ": " + error);
    }
  }
  return settings;
}

SwarmNode::Options node_options(const std::filesystem::path& workspace) {
  SwarmNode::Options options;
  options.workspace_root = workspace;
  options.expiry_sweep = 1s;
  options.configure_logging = false;
  return options;
}

bool test_command_line(TestContext&) {
  CommandLineParser parser;
  SettingsManager settings;
  std::string error;
  bool ok = expect(parser.try_parse({"get", "abc", "--grl", "4M", "-mat", "3", "--verbose"}, settings, error),
                   "valid command line parses: " + error);
  ok = expect(settings.get<std::string>("command") == "get", "first positional is the command") && ok;
  ok = expect(settings.get<std::string>("target") == "abc", "second positional is the target") && ok;
  ok = expect(settings.get<uint64_t>("global_rate_limit") == 4ull * 1024 * 1024, "size suffix") && ok;
  ok = expect(settings.get<int>("max_active_transfers") == 3, "short alias") && ok;
  ok = expect(settings.get<bool>("verbose"), "bare bool flag") && ok;

  SettingsManager fresh;
  ok = expect(!parser.try_parse({"--role", "leecher"}, fresh, error) && error.find("peer|tracker") != std::string::npos,
              "enum outside its choices") && ok;
  ok = expect(!parser.try_parse({"--chunk_size", "12Q"}, fresh, error), "malformed size") && ok;
  ok = expect(!parser.try_parse({"--no-such-option", "1"}, fresh, error), "unknown option") && ok;
  ok = expect(!parser.try_parse({"--listen_port"}, fresh, error), "missing value") && ok;
  ok = expect(!parser.try_parse({"serve", "x", "y", "z"}, fresh, error), "too many positionals") && ok;
  ok = expect(!parser.try_parse({"explode"}, fresh, error), "unknown command") && ok;
  SettingsManager inline_form;
  ok = expect(parser.try_parse({"search", "--tb=recent", "--cs=64K"}, inline_form, error), "key=value options") && ok;
  ok = expect(inline_form.get<std::string>("tie_break_policy") == "recent" &&
              inline_form.get<uint64_t>("chunk_size") == 64u * 1024, "inline values applied") && ok;
  auto help = parser.usage_text();
  ok = expect(help.find("get <hash> [context]") != std::string::npos && help.find("--global_rate_limit") != std::string::npos,
              "usage lists commands and options") && ok;
  ok = expect(SettingsManager::parse_size("256k") == 256u * 1024 && !SettingsManager::parse_size("k"),
              "size parsing") && ok;
  return ok;
}

bool test_settings_file(TestContext&) {
  ScratchDir dir("settings_file");
  write_config_before_start(dir.path(), "settings.json", {
    {"listen_port", 9123},
    {"tie_break_policy", "recent"},
    {"chunk_size", "64K"},
    {"max_chunks_per_peer", "lots"},
  });
  SettingsManager settings;
  settings.set_settings_path(dir / ".config/settings.json");
  bool ok = expect(settings.load(), "settings file loads");
  ok = expect(settings.get<int>("listen_port") == 9123, "int from file") && ok;
  ok = expect(settings.get<std::string>("tie_break_policy") == "recent", "enum from file") && ok;
  ok = expect(settings.get<uint64_t>("chunk_size") == 64u * 1024, "size from file") && ok;
  ok = expect(settings.get<int>("max_chunks_per_peer") == 2, "invalid entry keeps its default") && ok;

  std::string error;
  ok = expect(settings.set_from_string("command", "search", error), "non-persistent setting set") && ok;
  ok = expect(settings.save(), "settings saved") && ok;
  SettingsManager reloaded;
  reloaded.set_settings_path(settings.settings_path());
  ok = expect(reloaded.load() && reloaded.get<int>("listen_port") == 9123, "saved settings reload") && ok;
  ok = expect(reloaded.get<std::string>("command") == "serve", "one-shot settings are not persisted") && ok;
  return ok;
}

bool test_settings_bounds_and_environment(TestContext&) {
  SettingsManager settings;
  std::string error;
  bool ok = expect(!settings.set_from_string("listen_port", "70000", error), "port above range");
  ok = expect(error == "must be at most 65535", "bound named in the error") && ok;
  ok = expect(!settings.set_from_string("chunk_size", "0", error), "zero chunk size") && ok;
  ok = expect(!settings.set_from_string("verify_threads", "2x", error), "trailing junk in an int") && ok;
  ok = expect(settings.set_from_string("max_chunks_per_peer", "0", error), "zero means unlimited") && ok;

  setenv("TREESWARM_MAX_ACTIVE_TRANSFERS", "5", 1);
  setenv("TREESWARM_TIE_BREAK_POLICY", "recent", 1);
  setenv("TREESWARM_LISTEN_PORT", "99999", 1);
  auto applied = settings.apply_environment();
  unsetenv("TREESWARM_MAX_ACTIVE_TRANSFERS");
  unsetenv("TREESWARM_TIE_BREAK_POLICY");
  unsetenv("TREESWARM_LISTEN_PORT");
  ok = expect(applied == 2, "valid environment overrides applied") && ok;
  ok = expect(settings.get<int>("max_active_transfers") == 5, "int from environment") && ok;
  ok = expect(settings.get<std::string>("tie_break_policy") == "recent", "enum from environment") && ok;
  ok = expect(settings.get<int>("listen_port") == 9000, "invalid override skipped") && ok;
  return ok;
}

bool test_log_file_records_quiet_lines(TestContext&) {
  ScratchDir dir("log_file");
  LogOptions options;
  options.file = dir / "logs/node.log";
  init(options);
  Logger logger("quiet-node");
  logger.info("Declared {} files", 3);
  logger.debug("below the file level");
  log_warn(nullptr, "process-wide warning");
  init(false);

  auto text = read_file(dir / "logs/node.log");
  bool ok = expect(text.find("[quiet-node] Declared 3 files") != std::string::npos, "component line in file");
  ok = expect(text.find("process-wide warning") != std::string::npos, "free helper line in file") && ok;
  ok = expect(text.find("below the file level") == std::string::npos, "debug dropped when not verbose") && ok;
  return ok;
}

bool test_protocol_helpers(TestContext&) {
  auto request = make_request("lookup", "req-7");
  auto response = make_response(request);
  bool ok = expect(response["type"] == "lookup_response" && response["request_id"] == "req-7", "response echoes");
  ok = expect(!is_error_response(response), "plain response is not an error") && ok;
  ok = expect(is_error_response(make_error_response(request, "nope")), "error response") && ok;

  bool threw = false;
  try {
    required_string(nlohmann::json{{"peer_id", 5}}, "peer_id");
  } catch(const ProtocolError&) {
    threw = true;
  }
  ok = expect(threw, "wrongly typed field rejected") && ok;
  ok = expect(required_string(nlohmann::json{{"peer_id", "bob"}}, "peer_id") == "bob", "string field read") && ok;

  PeerRecord peer;
  peer.owner = "carol";
  peer.address = "10.0.0.3:9001";
  peer.status = PeerStatus::Offline;
  auto back = peer_record_from_json(peer_record_to_json(peer));
  ok = expect(back.owner == "carol" && back.address == peer.address && back.status == PeerStatus::Offline,
              "peer record survives the wire") && ok;
  return ok;
}

bool test_share_service_requests(TestContext& ctx) {
  ScratchDir dir("share_service");
  const std::string bytes = patterned_bytes(2500, 21);
  write_file(dir / "share/clip.bin", bytes);
  IndexOptions options;
  options.chunk_size = 1000;
  auto result = Indexer(options).index(dir / "share");
  auto file = ContentHash::of(bytes);

  auto logger = std::make_shared<Logger>("share");
  ctx.logs.attach(logger);
  ShareService service(logger);
  service.publish(result);
  bool ok = expect(service.file_count() == 1, "one file served");

  auto offer = service.handle_request(make_offer_request("1", file));
  ok = expect(!is_error_response(offer) && offer["chunks"].size() == 3, "offer lists every chunk") && ok;

  auto chunk = service.handle_request(make_chunk_request("2", file, 2, 2000, 500));
  std::vector<char> data;
  ok = expect(!is_error_response(chunk) && base64_decode(chunk.value("data", ""), data), "chunk served") && ok;
  ok = expect(std::string(data.begin(), data.end()) == bytes.substr(2000), "chunk bytes") && ok;
  ok = expect(chunk.value("chunk_sha", "") == sha256_hex(bytes.substr(2000)), "in-transit digest") && ok;

  auto unknown = service.handle_request(make_offer_request("3", ContentHash::of("elsewhere")));
  ok = expect(unknown.value("error", "").rfind(kUnavailable, 0) == 0, "unknown file is unavailable") && ok;
  auto past_end = service.handle_request(make_chunk_request("4", file, 3, 2400, 500));
  ok = expect(past_end.value("error", "").rfind(kUnavailable, 0) == 0, "range past the end is unavailable") && ok;
  auto malformed = service.handle_request(nlohmann::json{{"type", "chunk"}, {"request_id", "5"}});
  ok = expect(is_error_response(malformed), "request without a file rejected") && ok;

  std::filesystem::remove(dir / "share/clip.bin");
  auto gone = service.handle_request(make_chunk_request("6", file, 0, 0, 1000));
  ok = expect(gone.value("error", "").rfind(kUnavailable, 0) == 0, "deleted file is unavailable") && ok;
  return ok;
}

bool test_tracker_service_requests(TestContext& ctx) {
  ScratchDir dir("tracker_service");
  write_file(dir / "photos/cat.jpg", "cat");
  write_file(dir / "photos/dog.jpg", "dog");
  auto share = Indexer().index(dir / "photos");

  asio::io_context io;
  auto logger = std::make_shared<Logger>("tracker");
  ctx.logs.attach(logger);
  auto store = std::make_shared<TreeStore>(TreeStoreOptions{}, logger);
  auto tracker = std::make_shared<TrackerService>(io, store, SearchOptions{}, logger);

  auto declare = make_request("declare", "1");
  declare["declaration"] = declaration_to_json(share.declaration);
  bool ok = expect(is_error_response(tracker->handle_request("", declare)), "anonymous declare refused");
  auto declared = tracker->handle_request("alice", declare);
  ok = expect(!is_error_response(declared) && declared["root"] == share.declaration.root.to_hex(), "declare accepted") && ok;

  auto tampered = declare;
  tampered["declaration"]["root"] = ContentHash::of("forged").to_hex();
  auto rejected = tracker->handle_request("alice", tampered);
  ok = expect(rejected.value("error_kind", "") == "protocol", "invalid declaration is a protocol error") && ok;

  auto search = make_request("search", "2");
  search["query"] = "*.jpg";
  auto found = tracker->handle_request("bob", search);
  ok = expect(found["results"].size() == 2, "search over the declared tree") && ok;

  search["query"] = "hash:beef";
  ok = expect(tracker->handle_request("bob", search).value("error_kind", "") == "query", "malformed query kind") && ok;

  auto lookup = make_request("lookup", "3");
  lookup["hash"] = ContentHash::of(std::string("cat")).to_hex();
  auto entry = tracker->handle_request("bob", lookup);
  ok = expect(!is_error_response(entry) && index_entry_from_json(entry["entry"]).owner_count() == 1, "lookup") && ok;

  auto all = tracker->handle_request("bob", make_request("all", "4"));
  ok = expect(all["declarations"].size() == 1, "declarations listed") && ok;

  auto withdraw = tracker->handle_request("alice", make_request("withdraw", "5"));
  ok = expect(withdraw.value("withdrawn", false) && !store->lookup(share.declaration.root), "withdraw") && ok;
  ok = expect(is_error_response(tracker->handle_request("bob", make_request("teleport", "6"))), "unknown type") && ok;
  return ok;
}

bool test_wrongly_typed_fields_get_error_responses(TestContext& ctx) {
  ScratchDir dir("wrong_types");
  write_file(dir / "share/clip.bin", patterned_bytes(1500, 5));
  auto result = Indexer().index(dir / "share");
  auto file = ContentHash::of(patterned_bytes(1500, 5));

  auto logger = std::make_shared<Logger>("share");
  ctx.logs.attach(logger);
  ShareService share(logger);
  share.publish(result);

  auto chunk = make_chunk_request("1", file, 0, 0, 500);
  chunk["offset"] = "zero";
  nlohmann::json reply;
  bool threw = false;
  try {
    reply = share.handle_request(chunk);
  } catch(const std::exception&) {
    threw = true;
  }
  bool ok = expect(!threw && is_error_response(reply), "string offset answered with an error");
  ok = expect(reply.value("request_id", "") == "1", "error keeps the request id") && ok;

  auto numeric_id = make_offer_request("2", file);
  numeric_id["request_id"] = 42;
  threw = false;
  try {
    reply = share.handle_request(numeric_id);
  } catch(const std::exception&) {
    threw = true;
  }
  ok = expect(!threw && reply.value("request_id", "x").empty(), "numeric request id tolerated") && ok;

  asio::io_context io;
  auto store = std::make_shared<TreeStore>(TreeStoreOptions{}, logger);
  auto tracker = std::make_shared<TrackerService>(io, store, SearchOptions{}, logger);
  auto search = make_request("search", "3");
  search["kind"] = 1;
  threw = false;
  try {
    reply = tracker->handle_request("bob", search);
  } catch(const std::exception&) {
    threw = true;
  }
  ok = expect(!threw && reply.value("error_kind", "") == "protocol", "numeric search kind is a protocol error") && ok;

  auto lookup = make_request("lookup", "4");
  lookup["hash"] = nlohmann::json::array({1, 2});
  threw = false;
  try {
    reply = tracker->handle_request("bob", lookup);
  } catch(const std::exception&) {
    threw = true;
  }
  ok = expect(!threw && is_error_response(reply), "array hash rejected") && ok;
  return ok;
}

bool test_node_survives_malformed_lines(TestContext& ctx) {
  ScratchDir dir("malformed_lines");
  SwarmNode tracker(node_settings({{"role", "tracker"}, {"peer_id", "tracker"}, {"listen_port", 0},
                                   {"listen_ip", "127.0.0.1"}}),
                    node_options(dir / "tracker"));
  tracker.start_background();
  ctx.logs.attach(tracker, "tracker");

  asio::io_context io;
  asio::ip::tcp::socket socket(io);
  socket.connect({asio::ip::make_address("127.0.0.1"), tracker.listen_port()});
  asio::streambuf buffer;
  auto exchange = [&](const std::string& line) {
    asio::write(socket, asio::buffer(line + "\n"));
    asio::read_until(socket, buffer, '\n');
    std::istream in(&buffer);
    std::string reply;
    std::getline(in, reply);
    return nlohmann::json::parse(reply);
  };

  auto hello = exchange(R"({"type":"hello","request_id":"1","peer_id":7})");
  bool ok = expect(is_error_response(hello), "numeric peer id refused");

  asio::write(socket, asio::buffer(std::string(R"({"type":5,"request_id":"2"})") + "\n"));
  auto search = exchange(R"({"type":"search","request_id":"3","kind":1,"query":"x"})");
  ok = expect(search.value("request_id", "") == "3" && search.value("error_kind", "") == "protocol",
              "numeric kind answered on the same connection") && ok;

  auto peers = exchange(R"({"type":"peers","request_id":"4"})");
  ok = expect(!is_error_response(peers) && peers.value("request_id", "") == "4", "tracker still serving") && ok;
  ok = expect(ctx.logs.contains("without type"), "untyped line logged") && ok;

  socket.close();
  tracker.stop();
  return ok;
}

bool test_end_to_end_over_loopback(TestContext& ctx) {
  ScratchDir dir("loopback");
  const std::string song = patterned_bytes(40 * 1024 + 123, 31);
  write_file(dir / "alice/share/music/song.mp3", song);
  write_file(dir / "alice/share/music/notes.txt", "liner notes");

  SwarmNode tracker(node_settings({{"role", "tracker"}, {"peer_id", "tracker"}, {"listen_port", 0},
                                   {"listen_ip", "127.0.0.1"}}),
                    node_options(dir / "tracker"));
  tracker.start_background();
  ctx.logs.attach(tracker, "tracker");
  const std::string tracker_address = tracker.address();

  auto peer_settings = [&](const std::string& id) {
    return node_settings({{"peer_id", id}, {"listen_port", 0}, {"listen_ip", "127.0.0.1"},
                          {"tracker", tracker_address}, {"chunk_size", "4K"}, {"request_timeout_ms", 5000}});
  };
  auto alice = std::make_unique<SwarmNode>(peer_settings("alice"), node_options(dir / "alice"));
  SwarmNode bob(peer_settings("bob"), node_options(dir / "bob"));
  alice->start_background();
  bob.start_background();
  ctx.logs.attach(*alice, "alice");
  ctx.logs.attach(bob, "bob");

  auto published = alice->publish(dir / "alice/share/music");
  bool ok = expect(published.file_count == 2, "alice indexed her share");

  auto results = bob.search("song.mp3");
  ok = expect(results.size() == 1, "bob finds the song through the tracker") && ok;
  if(results.empty()) return false;
  const auto* match = std::get_if<FileMatch>(&results[0]);
  ok = expect(match && match->hash == ContentHash::of(song) && match->seeders == 1, "file match with one seeder") && ok;
  if(!match) return false;

  auto entry = bob.lookup(match->hash);
  ok = expect(entry && entry->owner_count() == 1, "lookup names the owner") && ok;

  auto id = bob.download(match->hash, match->contexts.front().context);
  auto done = bob.transfers().wait(id, 30s);
  ok = expect(done && done->state == TransferState::Complete,
              std::string("download completes: ") + (done ? done->message : "no progress")) && ok;
  ok = expect(read_file(dir / "bob/downloads/song.mp3") == song, "downloaded bytes match") && ok;
  ok = expect(done && done->chunks_total == 11, "fetched in 4K chunks") && ok;

  auto folder = bob.download(published.declaration.root);
  auto folder_done = bob.transfers().wait(folder, 30s);
  ok = expect(folder_done && folder_done->state == TransferState::Complete, "whole folder downloads") && ok;
  ok = expect(read_file(dir / "bob/downloads/music/notes.txt") == "liner notes", "folder layout recreated") && ok;

  ctx.logs.detach_all();
  alice.reset();
  auto alice_offline = [&]{
    for(const auto& peer : tracker.tree_store()->peers()) {
      if(peer.owner == "alice") return peer.status == PeerStatus::Offline;
    }
    return false;
  };
  ok = expect(wait_for_condition(alice_offline, 10s), "tracker marks a disconnected owner offline") && ok;
  auto after = bob.search("song.mp3");
  ok = expect(after.size() == 1 && std::get<FileMatch>(after[0]).seeders == 0,
              "content stays searchable without seeders") && ok;

  bob.stop();
  tracker.stop();
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"command_line", test_command_line},
    {"settings_file", test_settings_file},
    {"settings_bounds_and_environment", test_settings_bounds_and_environment},
    {"log_file_records_quiet_lines", test_log_file_records_quiet_lines},
    {"protocol_helpers", test_protocol_helpers},
    {"share_service_requests", test_share_service_requests},
    {"tracker_service_requests", test_tracker_service_requests},
    {"wrongly_typed_fields_get_error_responses", test_wrongly_typed_fields_get_error_responses},
    {"node_survives_malformed_lines", test_node_survives_malformed_lines},
    {"end_to_end_over_loopback", test_end_to_end_over_loopback},
  };
  return run_suite("network", tests, argc, argv);
}
