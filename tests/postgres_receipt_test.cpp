#include <catch2/catch.hpp>
#include <cstdlib>
#include <thread>
#include "test_support.hpp"
#include "database/db_manager.hpp"
#include "messaging/conversation_directory.hpp"
#include "messaging/message_relay.hpp"

using namespace sealgate;
using namespace sealgate::testing;

// Needs a disposable database; enabled with SEALGATE_TEST_POSTGRES=1 and the usual SEALGATE_DB_* variables.
TEST_CASE("Concurrent reads of one receipt keep the first timestamp", "[postgres][receipts]") {
    const char* enabled = std::getenv("SEALGATE_TEST_POSTGRES");
    if (enabled == nullptr || std::string(enabled) != "1") {
        WARN("SEALGATE_TEST_POSTGRES is not set; skipping");
        return;
    }
    Config config = Config::fromEnvironment();
    DatabaseManager storage(config.db_host, config.db_port, config.db_name, config.db_user,
                            config.db_password, 4);
    REQUIRE(storage.initialize());

    const std::string suffix = std::to_string(SystemClock().nowMillis());
    const std::string alice = "alice" + suffix;
    const std::string bob = "bob" + suffix;
    addUser(storage, alice);
    addUser(storage, bob);

    ManualClock clock;
    KeyService keys(storage, clock, KeyPolicy());
    registerDevice(keys, alice);
    ConversationDirectory conversations(storage, clock);
    MessageRelay relay(storage, clock, MessagingPolicy());

    ServiceError error;
    ConversationView view;
    bool created = false;
    REQUIRE(conversations.findOrCreate(alice, bob, view, created, error));
    SendMessageRequest request;
    request.ciphertext = base64("hello");
    request.proto = 1;
    SendResult sent;
    REQUIRE(relay.sendDirect(alice, view.conversation.id, request, sent, error));

    constexpr int kReaders = 4;
    std::vector<int64_t> seen(kReaders, 0);
    std::vector<int> ok(kReaders, 0);
    std::vector<std::thread> readers;
    for (int i = 0; i < kReaders; ++i) {
        readers.emplace_back([&, i] {
            ManualClock own(kStartMillis + 1000 * (i + 1));
            MessageRelay reader(storage, own, MessagingPolicy());
            DeliveryReceipt receipt;
            ServiceError failure;
            ok[i] = reader.markRead(bob, MessageKind::Direct, sent.message.id, receipt, failure) ? 1 : 0;
            seen[i] = receipt.read_at;
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }

    clock.advanceSeconds(60);
    DeliveryReceipt stored;
    REQUIRE(relay.markRead(bob, MessageKind::Direct, sent.message.id, stored, error));
    REQUIRE(stored.read_at != 0);
    for (int i = 0; i < kReaders; ++i) {
        CHECK(ok[i] == 1);
        CHECK(seen[i] == stored.read_at);
    }
    CHECK(stored.delivered_at == 0);
}
