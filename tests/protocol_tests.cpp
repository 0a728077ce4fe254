#include "command_line_parser.hpp"
#include "device_info.hpp"
#include "http_message.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "share_types.hpp"
#include "test_runner_utils.hpp"
#include "tls_identity.hpp"
#include "utils.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace {

DeviceDescriptor sample_device() {
  DeviceDescriptor d;
  d.alias = "Kitchen Laptop";
  d.device_model = "ThinkPad";
  d.device_type = DeviceType::Desktop;
  d.fingerprint = "abc123";
  d.port = 53320;
  return d;
}

bool test_request_head_parsing(share::test::TestContext&) {
  const std::string head =
    "POST /api/localsend/v2/upload?sessionId=s%201&fileId=f1&token=t+2 HTTP/1.1\r\n"
    "Host: 192.168.1.5:53317\r\n"
    "content-length: 42\r\n"
    "Content-Type: image/png\r\n\r\n";
  HttpRequest request;
  std::string error;
  SHARE_CHECK(parse_request_head(head, request, error));
  SHARE_CHECK(request.method == "POST");
  SHARE_CHECK(request.path() == kUploadPath);
  SHARE_CHECK(request.content_length() == 42);
  SHARE_CHECK(request.header("CONTENT-TYPE") == std::string("image/png"));
  auto query = request.query();
  SHARE_CHECK(query["sessionId"] == "s 1");
  SHARE_CHECK(query["fileId"] == "f1");
  SHARE_CHECK(query["token"] == "t 2");
  SHARE_CHECK(!request.header("Authorization"));
  return true;
}

bool test_malformed_heads_rejected(share::test::TestContext&) {
  HttpRequest request;
  HttpResponse response;
  std::string error;
  SHARE_CHECK(!parse_request_head("GARBAGE\r\n\r\n", request, error));
  SHARE_CHECK(!error.empty());
  SHARE_CHECK(!parse_request_head("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n", request, error));
  SHARE_CHECK(!parse_response_head("HTTP/1.1 2x0 OK\r\n\r\n", response, error));
  SHARE_CHECK(!parse_response_head("SPDY 200\r\n\r\n", response, error));

  SHARE_CHECK(parse_request_head("GET / HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n", request, error));
  SHARE_CHECK(request.content_length() == -1);
  return true;
}

bool test_binary_head_errors_are_printable(share::test::TestContext&) {
  HttpRequest request;
  std::string error;
  SHARE_CHECK(!parse_request_head("\xff\xfe\r\n\r\n", request, error));
  SHARE_CHECK(error == "malformed request line '??'");
  SHARE_CHECK(!parse_request_head("GET / HTTP/1.1\r\n\x01\xc3\x28\r\n\r\n", request, error));
  SHARE_CHECK(error == "malformed header line '??('");

  // The message must survive being sent back as JSON.
  SHARE_CHECK(json{{"message", error}}.dump().find("??(") != std::string::npos);

  std::string long_line(500, 'A');
  SHARE_CHECK(!parse_request_head(long_line + "\r\n\r\n", request, error));
  SHARE_CHECK(error.size() < 100);
  return true;
}

bool test_response_serialize_and_parse(share::test::TestContext&) {
  auto response = make_response(409, R"({"message":"blocked"})");
  const auto wire = response.serialize();
  SHARE_CHECK(wire.rfind("HTTP/1.1 409 Conflict\r\n", 0) == 0);
  SHARE_CHECK(wire.find("Connection: close\r\n") != std::string::npos);

  auto split = wire.find(kHeaderTerminator);
  SHARE_CHECK(split != std::string::npos);
  HttpResponse parsed;
  std::string error;
  SHARE_CHECK(parse_response_head(wire.substr(0, split + 4), parsed, error));
  SHARE_CHECK(parsed.status == 409);
  SHARE_CHECK(parsed.reason == "Conflict");
  SHARE_CHECK(parsed.content_length() == static_cast<long long>(response.body.size()));
  SHARE_CHECK(wire.substr(split + 4) == response.body);
  return true;
}

bool test_url_encoding(share::test::TestContext&) {
  SHARE_CHECK(url_encode("a b/c?d") == "a%20b%2Fc%3Fd");
  SHARE_CHECK(url_decode("a%20b%2Fc%3Fd") == "a b/c?d");
  SHARE_CHECK(url_decode("100%") == "100%");
  auto target = upload_target("s&1", "f=2", "t 3");
  auto query = parse_query(target);
  SHARE_CHECK(query["sessionId"] == "s&1");
  SHARE_CHECK(query["fileId"] == "f=2");
  SHARE_CHECK(query["token"] == "t 3");
  SHARE_CHECK(cancel_target("xyz") == std::string(kCancelPath) + "?sessionId=xyz");
  return true;
}

bool test_descriptor_wire_names(share::test::TestContext&) {
  json j = sample_device();
  SHARE_CHECK(j.at("alias") == "Kitchen Laptop");
  SHARE_CHECK(j.at("deviceModel") == "ThinkPad");
  SHARE_CHECK(j.at("deviceType") == "desktop");
  SHARE_CHECK(j.at("fingerprint") == "abc123");
  SHARE_CHECK(j.at("port") == 53320);
  SHARE_CHECK(j.at("protocol") == "https");
  SHARE_CHECK(j.at("version") == "2.0");

  DeviceDescriptor back;
  std::string error;
  SHARE_CHECK(parse_device_descriptor(j, back, error));
  SHARE_CHECK(back == sample_device());
  return true;
}

bool test_descriptor_tolerates_nulls_and_rejects_garbage(share::test::TestContext&) {
  auto j = json::parse(R"({"alias":"phone","fingerprint":"f1","deviceModel":null,"deviceType":null})");
  DeviceDescriptor d;
  std::string error;
  SHARE_CHECK(parse_device_descriptor(j, d, error));
  SHARE_CHECK(d.device_model.empty());
  SHARE_CHECK(d.device_type == DeviceType::Desktop);
  SHARE_CHECK(d.port == kDefaultPort);

  SHARE_CHECK(!parse_device_descriptor(json::parse(R"({"alias":"x"})"), d, error));
  SHARE_CHECK(!parse_device_descriptor(json::parse(R"({"alias":"x","fingerprint":""})"), d, error));
  SHARE_CHECK(!parse_device_descriptor(json::array(), d, error));
  SHARE_CHECK(parse_device_type("MOBILE") == DeviceType::Mobile);
  SHARE_CHECK(parse_device_type("toaster") == DeviceType::Desktop);
  return true;
}

bool test_announcement_flag(share::test::TestContext&) {
  DeviceDescriptor d;
  bool announce = false;
  std::string error;
  SHARE_CHECK(parse_announcement(make_announcement(sample_device(), true), d, announce, error));
  SHARE_CHECK(announce);
  SHARE_CHECK(d == sample_device());

  auto legacy = json(sample_device());
  legacy["announcement"] = true;
  SHARE_CHECK(parse_announcement(legacy, d, announce, error));
  SHARE_CHECK(announce);

  SHARE_CHECK(parse_announcement(make_announcement(sample_device(), false), d, announce, error));
  SHARE_CHECK(!announce);
  return true;
}

bool test_announcement_flag_must_be_boolean(share::test::TestContext&) {
  DeviceDescriptor d;
  bool announce = true;
  std::string error;
  auto bad = json::parse(R"({"alias":"x","fingerprint":"evil","announce":"yes"})");
  SHARE_CHECK(!parse_announcement(bad, d, announce, error));
  SHARE_CHECK(error == "'announce' must be a boolean");

  auto legacy = json::parse(R"({"alias":"x","fingerprint":"evil","announcement":1})");
  SHARE_CHECK(!parse_announcement(legacy, d, announce, error));
  SHARE_CHECK(error == "'announcement' must be a boolean");

  auto missing = json::parse(R"({"alias":"x","fingerprint":"quiet","announce":null})");
  SHARE_CHECK(parse_announcement(missing, d, announce, error));
  SHARE_CHECK(!announce);
  return true;
}

bool test_prepare_upload_messages(share::test::TestContext&) {
  UploadFile file{"file-1", "photo.png", 1234, "image/png"};
  auto request = make_prepare_upload(sample_device(), {file});
  SHARE_CHECK(request.at("files").at("file-1").at("fileName") == "photo.png");

  DeviceDescriptor sender;
  std::vector<UploadFile> files;
  std::string error;
  SHARE_CHECK(parse_prepare_upload(request, sender, files, error));
  SHARE_CHECK(sender.alias == "Kitchen Laptop");
  SHARE_CHECK(files.size() == 1);
  SHARE_CHECK(files[0].id == "file-1" && files[0].size == 1234 && files[0].file_type == "image/png");

  SHARE_CHECK(!parse_prepare_upload(json::parse(R"({"files":{}})"), sender, files, error));
  SHARE_CHECK(!parse_prepare_upload(
    json::parse(R"({"info":{"alias":"a","fingerprint":"f"},"files":{"x":{"size":1}}})"),
    sender, files, error));

  auto response = make_prepare_upload_response("session-9", FileTokens{{"file-1", "tok"}});
  std::string session_id;
  FileTokens tokens;
  SHARE_CHECK(parse_prepare_upload_response(response, session_id, tokens, error));
  SHARE_CHECK(session_id == "session-9");
  SHARE_CHECK(tokens.at("file-1") == "tok");
  SHARE_CHECK(!parse_prepare_upload_response(json::parse(R"({"files":{}})"), session_id, tokens, error));
  return true;
}

bool test_mime_types(share::test::TestContext&) {
  SHARE_CHECK(mime_type_for("holiday.JPG") == "image/jpeg");
  SHARE_CHECK(mime_type_for("notes.txt") == "text/plain");
  SHARE_CHECK(mime_type_for("archive.tar.xz") == "application/octet-stream");
  SHARE_CHECK(mime_type_for("Makefile") == "application/octet-stream");
  return true;
}

bool test_file_name_helpers(share::test::TestContext&) {
  SHARE_CHECK(sanitize_file_name("../../etc/passwd") == "passwd");
  SHARE_CHECK(sanitize_file_name("C:\\Users\\me\\a:b?.txt") == "a_b_.txt");
  SHARE_CHECK(sanitize_file_name("...") == "file");
  SHARE_CHECK(sanitize_file_name(".hidden") == "hidden");

  auto dir = share::test::fresh_directory("localshare_unique_destination");
  SHARE_CHECK(unique_destination(dir, "a.txt") == dir / "a.txt");
  share::test::write_file(dir / "a.txt", "1");
  SHARE_CHECK(unique_destination(dir, "a.txt") == dir / "a (1).txt");
  share::test::write_file(dir / "a (1).txt", "2");
  SHARE_CHECK(unique_destination(dir, "a.txt") == dir / "a (2).txt");
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return true;
}

bool test_host_port_and_hashing(share::test::TestContext&) {
  std::string host;
  unsigned short port = 0;
  SHARE_CHECK(split_host_port("192.168.0.2:53317", host, port));
  SHARE_CHECK(host == "192.168.0.2" && port == 53317);
  SHARE_CHECK(!split_host_port("192.168.0.2", host, port));
  SHARE_CHECK(!split_host_port("host:99999", host, port));
  SHARE_CHECK(!split_host_port(":80", host, port));

  SHARE_CHECK(sha256_hex("abc") ==
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  auto token = random_hex(16);
  SHARE_CHECK(token.size() == 32);
  SHARE_CHECK(token != random_hex(16));
  return true;
}

bool test_settings_validation(share::test::TestContext&) {
  SettingsManager settings;
  SHARE_CHECK(settings.get<int>("sync_interval_ms") == 2000);
  SHARE_CHECK(settings.get<int>("port") == kDefaultPort);
  SHARE_CHECK(settings.get<std::string>("multicast_group") == kDefaultMulticastGroup);

  std::string error;
  SHARE_CHECK(settings.set_from_string("port", "0", error));
  SHARE_CHECK(!settings.set_from_string("port", "70000", error));
  SHARE_CHECK(!error.empty());
  SHARE_CHECK(!settings.set_from_string("sync_interval_ms", "fast", error));
  SHARE_CHECK(settings.set_from_string("accept", "off", error));
  SHARE_CHECK(!settings.get<bool>("accept_incoming"));
  SHARE_CHECK(!settings.set_from_string("no_such_key", "1", error));
  SHARE_CHECK(settings.resolve_key("ttl") == std::string("peer_ttl_ms"));
  return true;
}

bool test_settings_persist_round_trip(share::test::TestContext&) {
  auto dir = share::test::fresh_directory("localshare_settings");
  SettingsManager settings;
  settings.set_settings_path(dir / ".config" / "settings.json");
  std::string error;
  SHARE_CHECK(settings.set_from_string("alias", "Den PC", error));
  SHARE_CHECK(settings.set_from_string("save", "true", error));
  SHARE_CHECK(settings.save());

  SettingsManager loaded;
  loaded.set_settings_path(dir / ".config" / "settings.json");
  SHARE_CHECK(loaded.load());
  SHARE_CHECK(loaded.get<std::string>("alias") == "Den PC");
  // Non-persistent switches never come back from disk.
  SHARE_CHECK(!loaded.get<bool>("save"));
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return true;
}

bool test_command_line_mapping(share::test::TestContext&) {
  SettingsManager settings;
  CommandLineParser parser("localshare");
  std::vector<std::string> args = {
    "localshare", "Attic", "53400", "--receive_dir", "/tmp/in", "-d", "off", "--verbose"
  };
  std::vector<char*> argv;
  for(auto& a : args) argv.push_back(a.data());
  std::string error;
  SHARE_CHECK(parser.parse(static_cast<int>(argv.size()), argv.data(), settings, error));

  SHARE_CHECK(settings.get<std::string>("alias") == "Attic");
  SHARE_CHECK(settings.get<int>("port") == 53400);
  SHARE_CHECK(settings.get<std::string>("receive_dir") == "/tmp/in");
  SHARE_CHECK(!settings.get<bool>("discovery"));
  SHARE_CHECK(settings.get<bool>("verbose"));
  return true;
}

bool test_command_line_forms_and_errors(share::test::TestContext&) {
  CommandLineParser parser("localshare");
  auto run = [&](std::vector<std::string> args, SettingsManager& settings, std::string& error){
    args.insert(args.begin(), "localshare");
    std::vector<char*> argv;
    for(auto& a : args) argv.push_back(a.data());
    return parser.parse(static_cast<int>(argv.size()), argv.data(), settings, error);
  };

  SettingsManager settings;
  std::string error;
  SHARE_CHECK(run({"--ttl=2500", "--no-discovery", "--", "-dash-alias"}, settings, error));
  SHARE_CHECK(settings.get<int>("peer_ttl_ms") == 2500);
  SHARE_CHECK(!settings.get<bool>("discovery"));
  SHARE_CHECK(settings.get<std::string>("alias") == "-dash-alias");

  SettingsManager rejected;
  SHARE_CHECK(!run({"--bogus", "1"}, rejected, error));
  SHARE_CHECK(error == "unknown option --bogus");
  SHARE_CHECK(!run({"--port"}, rejected, error));
  SHARE_CHECK(error == "missing value for --port");
  SHARE_CHECK(!run({"--port", "70000"}, rejected, error));
  SHARE_CHECK(error.find("invalid value for --port") == 0);
  SHARE_CHECK(!run({"a", "1", "b:2", "extra"}, rejected, error));
  SHARE_CHECK(error == "unexpected argument 'extra'");
  return true;
}

bool test_event_descriptions(share::test::TestContext&) {
  SHARE_CHECK(describe(TransferFailed{"fp", "upload failed: HTTP 500"}) ==
              "transfer to fp failed: upload failed: HTTP 500");
  SHARE_CHECK(describe(PeerLost{"fp"}) == "peer lost: fp");
  SHARE_CHECK(std::string(worker_state_name(WorkerState::Draining)) == "draining");
  return true;
}

bool test_tls_identity_persistence(share::test::TestContext&) {
  auto dir = share::test::fresh_directory("localshare_identity");
  auto first = TlsIdentity::load_or_create(dir, "unit-test");
  SHARE_CHECK(first.fingerprint().size() == 64);
  SHARE_CHECK(std::filesystem::exists(dir / "cert.pem"));
  SHARE_CHECK(std::filesystem::exists(dir / "key.pem"));

  auto second = TlsIdentity::load_or_create(dir, "unit-test");
  SHARE_CHECK(second.fingerprint() == first.fingerprint());

  auto other = TlsIdentity::generate("unit-test");
  SHARE_CHECK(other.fingerprint() != first.fingerprint());
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<share::test::TestCase> tests = {
    {"request_head_parsing", test_request_head_parsing},
    {"malformed_heads_rejected", test_malformed_heads_rejected},
    {"binary_head_errors_are_printable", test_binary_head_errors_are_printable},
    {"response_serialize_and_parse", test_response_serialize_and_parse},
    {"url_encoding", test_url_encoding},
    {"descriptor_wire_names", test_descriptor_wire_names},
    {"descriptor_tolerates_nulls_and_rejects_garbage", test_descriptor_tolerates_nulls_and_rejects_garbage},
    {"announcement_flag", test_announcement_flag},
    {"announcement_flag_must_be_boolean", test_announcement_flag_must_be_boolean},
    {"prepare_upload_messages", test_prepare_upload_messages},
    {"mime_types", test_mime_types},
    {"file_name_helpers", test_file_name_helpers},
    {"host_port_and_hashing", test_host_port_and_hashing},
    {"settings_validation", test_settings_validation},
    {"settings_persist_round_trip", test_settings_persist_round_trip},
    {"command_line_mapping", test_command_line_mapping},
    {"command_line_forms_and_errors", test_command_line_forms_and_errors},
    {"event_descriptions", test_event_descriptions},
    {"tls_identity_persistence", test_tls_identity_persistence}
  };
  return share::test::run_suite("protocol", tests, argc, argv);
}
