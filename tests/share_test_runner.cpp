#include "fake_share_client.hpp"
#include "settings_manager.hpp"
#include "share_manager.hpp"
#include "test_runner_utils.hpp"
#include "log.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using share::test::FakeNetwork;

namespace {

struct Harness {
  std::shared_ptr<FakeNetwork> network = std::make_shared<FakeNetwork>();
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("share-test");
  std::unique_ptr<ShareManager> manager;
  std::vector<ShareEvent> events;

  bool start(share::test::TestContext& ctx, int sync_interval_ms = 20) {
    auto settings = std::make_shared<SettingsManager>();
    std::string error;
    if(!settings->set_from_json("sync_interval_ms", sync_interval_ms, error)) {
      throw std::runtime_error("sync_interval_ms: " + error);
    }
    ctx.logs.attach(logger, "worker");

    ShareManager::Options options;
    options.settings = settings;
    options.client_factory = share::test::fake_client_factory(network);
    options.logger = logger;
    manager = ShareManager::create(std::move(options), error);
    return manager != nullptr && error.empty();
  }

  void poll() {
    for(auto& event : manager->poll_events()) events.push_back(std::move(event));
  }

  template<typename T>
  std::vector<T> of_type() const {
    std::vector<T> out;
    for(const auto& event : events) {
      if(auto e = std::get_if<T>(&event)) out.push_back(*e);
    }
    return out;
  }

  template<typename T>
  bool wait_for_count(std::size_t count, std::chrono::milliseconds timeout = 3s) {
    return share::test::wait_for_condition([&]{
      poll();
      return of_type<T>().size() >= count;
    }, timeout);
  }

  bool wait_for_state(WorkerState state, std::chrono::milliseconds timeout = 3s) {
    return share::test::wait_for_condition([&]{ return manager->state() == state; }, timeout);
  }
};

PeerMap peers_of(std::initializer_list<PeerEntry> entries) {
  PeerMap map;
  for(const auto& entry : entries) map[entry.descriptor.fingerprint] = entry;
  return map;
}

bool test_discovery_events_follow_peer_set(share::test::TestContext& ctx) {
  Harness h;
  auto a = share::test::make_peer("fp-a", "alpha");
  auto b = share::test::make_peer("fp-b", "bravo");
  h.network->set_peers(peers_of({a}));
  SHARE_CHECK(h.start(ctx));

  SHARE_CHECK(h.wait_for_count<PeerDiscovered>(1));
  SHARE_CHECK(h.of_type<PeerDiscovered>()[0].fingerprint == "fp-a");
  SHARE_CHECK(h.manager->get_peers().count("fp-a") == 1);

  h.network->set_peers(peers_of({a, b}));
  SHARE_CHECK(h.wait_for_count<PeerDiscovered>(2));
  SHARE_CHECK(h.of_type<PeerDiscovered>()[1].fingerprint == "fp-b");
  SHARE_CHECK(h.of_type<PeerLost>().empty());

  h.network->set_peers(peers_of({b}));
  SHARE_CHECK(h.wait_for_count<PeerLost>(1));
  SHARE_CHECK(h.of_type<PeerLost>()[0].fingerprint == "fp-a");
  auto peers = h.manager->get_peers();
  SHARE_CHECK(peers.size() == 1 && peers.count("fp-b") == 1);

  // Steady state: more cycles, no more events.
  const auto queries = h.network->queries();
  SHARE_CHECK(share::test::wait_for_condition([&]{ return h.network->queries() >= queries + 3; }, 2s));
  h.poll();
  SHARE_CHECK(h.of_type<PeerDiscovered>().size() == 2);
  SHARE_CHECK(h.of_type<PeerLost>().size() == 1);
  return true;
}

bool test_unknown_peer_fails_without_network(share::test::TestContext& ctx) {
  Harness h;
  SHARE_CHECK(h.start(ctx));
  SHARE_CHECK(h.wait_for_state(WorkerState::Running));

  std::string error;
  SHARE_CHECK(h.manager->send_file("nobody", "/tmp/whatever.txt", error));
  SHARE_CHECK(h.wait_for_count<TransferFailed>(1));

  auto started = h.of_type<TransferStarted>();
  SHARE_CHECK(started.size() == 1 && started[0].peer_fingerprint == "nobody");
  auto failed = h.of_type<TransferFailed>()[0];
  SHARE_CHECK(failed.peer_fingerprint == "nobody");
  SHARE_CHECK(failed.error.find("not in the peer directory") != std::string::npos);
  SHARE_CHECK(h.network->sends().empty());
  return true;
}

bool test_transfers_run_one_at_a_time(share::test::TestContext& ctx) {
  Harness h;
  h.network->set_peers(peers_of({share::test::make_peer("fp-a", "alpha")}));
  h.network->set_transfer_delay(40ms);
  SHARE_CHECK(h.start(ctx));
  SHARE_CHECK(h.wait_for_count<PeerDiscovered>(1));

  std::string error;
  for(int i = 0; i < 3; ++i) {
    SHARE_CHECK(h.manager->send_file("fp-a", "/tmp/file" + std::to_string(i), error));
  }
  SHARE_CHECK(h.wait_for_count<TransferComplete>(3));
  SHARE_CHECK(h.network->max_in_flight() == 1);

  auto sends = h.network->sends();
  SHARE_CHECK(sends.size() == 3);
  for(int i = 0; i < 3; ++i) {
    SHARE_CHECK(sends[i].path == "/tmp/file" + std::to_string(i));
  }

  // Each Started is followed by its own outcome before the next Started.
  std::vector<char> order;
  for(const auto& event : h.events) {
    if(std::holds_alternative<TransferStarted>(event)) order.push_back('S');
    if(std::holds_alternative<TransferComplete>(event)) order.push_back('C');
  }
  SHARE_CHECK((order == std::vector<char>{'S', 'C', 'S', 'C', 'S', 'C'}));
  return true;
}

bool test_failed_transfer_is_reported(share::test::TestContext& ctx) {
  Harness h;
  h.network->set_peers(peers_of({share::test::make_peer("fp-a", "alpha")}));
  h.network->fail_transfers_to("fp-a", "transfer rejected by alpha");
  SHARE_CHECK(h.start(ctx));
  SHARE_CHECK(h.wait_for_count<PeerDiscovered>(1));

  std::string error;
  SHARE_CHECK(h.manager->send_file("fp-a", "/tmp/report.pdf", error));
  SHARE_CHECK(h.wait_for_count<TransferFailed>(1));
  auto failed = h.of_type<TransferFailed>()[0];
  SHARE_CHECK(failed.peer_fingerprint == "fp-a");
  SHARE_CHECK(failed.error == "transfer rejected by alpha");
  SHARE_CHECK(h.of_type<TransferComplete>().empty());

  // The worker keeps serving after a failure.
  SHARE_CHECK(h.manager->state() == WorkerState::Running);
  return true;
}

bool test_shutdown_is_idempotent(share::test::TestContext& ctx) {
  Harness h;
  SHARE_CHECK(h.start(ctx));
  SHARE_CHECK(h.wait_for_state(WorkerState::Running));

  h.manager->shutdown();
  h.manager->shutdown();
  SHARE_CHECK(h.wait_for_state(WorkerState::Stopped));
  h.manager->shutdown();
  SHARE_CHECK(h.network->stops() == 1);

  std::string error;
  SHARE_CHECK(!h.manager->send_file("fp-a", "/tmp/late.txt", error));
  SHARE_CHECK(error == "share worker is not running");
  return true;
}

bool test_poll_events_never_blocks(share::test::TestContext& ctx) {
  Harness h;
  SHARE_CHECK(h.start(ctx, 5000));
  SHARE_CHECK(h.wait_for_state(WorkerState::Running));

  const auto begin = std::chrono::steady_clock::now();
  auto first = h.manager->poll_events();
  auto second = h.manager->poll_events();
  const auto elapsed = std::chrono::steady_clock::now() - begin;
  SHARE_CHECK(first.empty() && second.empty());
  SHARE_CHECK(elapsed < 100ms);
  SHARE_CHECK(h.manager->get_peers().empty());
  return true;
}

bool test_start_failure_reports_error_event(share::test::TestContext& ctx) {
  Harness h;
  h.network->fail_start_with("address already in use");
  SHARE_CHECK(h.start(ctx));

  SHARE_CHECK(h.wait_for_count<ErrorEvent>(1));
  auto error_event = h.of_type<ErrorEvent>()[0];
  SHARE_CHECK(error_event.message == "failed to start client: address already in use");
  SHARE_CHECK(h.wait_for_state(WorkerState::Stopped));
  SHARE_CHECK(!h.manager->local_device());

  std::string error;
  SHARE_CHECK(!h.manager->send_file("fp-a", "/tmp/x", error));
  h.manager->shutdown();
  return true;
}

bool test_destructor_waits_for_running_transfer(share::test::TestContext& ctx) {
  Harness h;
  h.network->set_peers(peers_of({share::test::make_peer("fp-a", "alpha")}));
  h.network->set_transfer_delay(150ms);
  SHARE_CHECK(h.start(ctx));
  SHARE_CHECK(h.wait_for_count<PeerDiscovered>(1));

  std::string error;
  SHARE_CHECK(h.manager->send_file("fp-a", "/tmp/slow.bin", error));
  SHARE_CHECK(share::test::wait_for_condition([&]{ return h.network->in_flight() == 1; }, 2s));
  h.manager.reset();

  SHARE_CHECK(h.network->sends().size() == 1);
  SHARE_CHECK(h.network->in_flight() == 0);
  SHARE_CHECK(h.network->stops() == 1);
  return true;
}

bool test_commands_after_shutdown_are_dropped(share::test::TestContext& ctx) {
  Harness h;
  h.network->set_peers(peers_of({share::test::make_peer("fp-a", "alpha")}));
  SHARE_CHECK(h.start(ctx));
  SHARE_CHECK(h.wait_for_count<PeerDiscovered>(1));

  h.manager->shutdown();
  std::string error;
  // Rejected outright or dropped while draining; never dispatched either way.
  const bool accepted = h.manager->send_file("fp-a", "/tmp/too-late.txt", error);
  SHARE_CHECK(accepted || !error.empty());
  SHARE_CHECK(h.wait_for_state(WorkerState::Stopped));
  h.poll();
  SHARE_CHECK(h.of_type<TransferStarted>().empty());
  SHARE_CHECK(h.network->sends().empty());
  return true;
}

bool test_background_failure_lets_transfer_finish(share::test::TestContext& ctx) {
  Harness h;
  h.network->set_peers(peers_of({share::test::make_peer("fp-a", "alpha")}));
  h.network->set_transfer_delay(150ms);
  h.network->throw_during_transfers("malformed datagram");
  SHARE_CHECK(h.start(ctx));
  SHARE_CHECK(h.wait_for_count<PeerDiscovered>(1));

  std::string error;
  SHARE_CHECK(h.manager->send_file("fp-a", "/tmp/big.iso", error));
  SHARE_CHECK(h.wait_for_state(WorkerState::Stopped));
  h.poll();

  auto errors = h.of_type<ErrorEvent>();
  SHARE_CHECK(errors.size() == 1);
  SHARE_CHECK(errors[0].message == "background task failed: malformed datagram");
  SHARE_CHECK(h.of_type<TransferComplete>().size() == 1);

  // The failure is reported first; the running transfer still finishes
  // before the client is stopped.
  std::size_t error_at = 0, complete_at = 0;
  for(std::size_t i = 0; i < h.events.size(); ++i) {
    if(std::holds_alternative<ErrorEvent>(h.events[i])) error_at = i;
    if(std::holds_alternative<TransferComplete>(h.events[i])) complete_at = i;
  }
  SHARE_CHECK(error_at < complete_at);
  SHARE_CHECK(h.network->stops() == 1);
  SHARE_CHECK(h.network->in_flight_at_stop() == 0);

  SHARE_CHECK(!h.manager->send_file("fp-a", "/tmp/after.iso", error));
  return true;
}

bool test_local_device_known_once_running(share::test::TestContext& ctx) {
  Harness h;
  SHARE_CHECK(h.start(ctx));
  SHARE_CHECK(h.wait_for_state(WorkerState::Running));
  auto self = h.manager->local_device();
  SHARE_CHECK(self && self->fingerprint == "fake-self-fingerprint");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<share::test::TestCase> tests = {
    {"discovery_events_follow_peer_set", test_discovery_events_follow_peer_set},
    {"unknown_peer_fails_without_network", test_unknown_peer_fails_without_network},
    {"transfers_run_one_at_a_time", test_transfers_run_one_at_a_time},
    {"failed_transfer_is_reported", test_failed_transfer_is_reported},
    {"shutdown_is_idempotent", test_shutdown_is_idempotent},
    {"poll_events_never_blocks", test_poll_events_never_blocks},
    {"start_failure_reports_error_event", test_start_failure_reports_error_event},
    {"destructor_waits_for_running_transfer", test_destructor_waits_for_running_transfer},
    {"commands_after_shutdown_are_dropped", test_commands_after_shutdown_are_dropped},
    {"local_device_known_once_running", test_local_device_known_once_running},
    {"background_failure_lets_transfer_finish", test_background_failure_lets_transfer_finish}
  };
  return share::test::run_suite("share", tests, argc, argv);
}
